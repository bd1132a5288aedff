#include "OperationEngine.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fmt/format.h>

namespace fs = std::filesystem;
using ErrorCodes::Code;

namespace {

bool is_valid_entry_name(const std::string& name)
{
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
#ifdef _WIN32
    return name.find_first_of("/\\") == std::string::npos && name.find('\0') == std::string::npos;
#else
    return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
#endif
}

bool is_directory_entry(const fs::path& path)
{
    std::error_code ec;
    return fs::is_directory(fs::symlink_status(path, ec));
}

void preserve_write_time(const fs::path& from, const fs::path& to)
{
    std::error_code ec;
    const auto stamp = fs::last_write_time(from, ec);
    if (!ec) {
        fs::last_write_time(to, stamp, ec);
    }
    if (ec) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Could not preserve modification time on '{}': {}",
                          Utils::path_to_utf8(to), ec.message());
        }
    }
}

// Removes what a failed step left at the destination, unless the failure was
// caused by an entry that was already there.
void discard_partial(const fs::path& destination, const std::error_code& cause)
{
    if (cause == std::errc::file_exists) {
        return;
    }
    std::error_code ec;
    fs::remove_all(destination, ec);
    if (ec) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Could not clean up partial '{}': {}", Utils::path_to_utf8(destination), ec.message());
        }
    }
}

bool create_empty_file(const fs::path& path, std::error_code& ec)
{
    ec.clear();
    const std::string native = Utils::path_to_utf8(path);
    std::FILE* file = std::fopen(native.c_str(), "wx");
    if (!file) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    if (std::fclose(file) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    return true;
}

bool create_link(const fs::path& source, const fs::path& link_path, std::error_code& ec)
{
    if (is_directory_entry(source)) {
        fs::create_directory_symlink(source, link_path, ec);
    } else {
        fs::create_symlink(source, link_path, ec);
    }
    return !ec;
}

bool removes_on_undo(OperationKind kind)
{
    switch (kind) {
        case OperationKind::Copy:
        case OperationKind::Duplicate:
        case OperationKind::Link:
        case OperationKind::CreateFile:
        case OperationKind::CreateDirectory:
            return true;
        default:
            return false;
    }
}

OperationError diverged(const std::string& path, const std::string& message)
{
    return OperationError{Code::HISTORY_DIVERGED, path, message};
}

} // namespace


OperationEngine::BusyScope::BusyScope(OperationEngine& engine)
    : engine_(engine)
{
    if (engine_.busy_depth_.fetch_add(1) == 0 && !engine_.task_open_.load()) {
        engine_.cancel_requested_.store(false);
    }
}


OperationEngine::BusyScope::~BusyScope()
{
    engine_.busy_depth_.fetch_sub(1);
}


OperationEngine::OperationEngine(EngineConfig config)
    : config_(std::move(config)),
      numbering_(config_.numbering),
      history_(config_.history),
      trash_(config_.trash_dir)
{
    config_.trash_dir = trash_.directory();
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Operation engine ready (history max {}, trash '{}')",
                      config_.history.max_size, config_.trash_dir);
    }
}


OperationResult OperationEngine::run_operation(OperationKind kind,
                                               const std::vector<std::string>& sources,
                                               const std::string& target,
                                               const Body& body)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    BusyScope busy(*this);
    auto logger = Logger::get_logger("core_logger");

    notifier_.operation_started(kind, sources);

    OperationResult result;
    try {
        result = body();
    } catch (const fs::filesystem_error& ex) {
        const auto error = ErrorCodes::AppException::from_filesystem_error(ex);
        result.add_error(error.get_error_code(), error.context(), error.what());
    } catch (const ErrorCodes::AppException& ex) {
        result.add_error(ex.get_error_code(), ex.context().empty() ? target : ex.context(), ex.what());
    }

    if (result.operation && result.operation->undoable()) {
        history_.record(*result.operation);
    }

    if (result.errors.empty()) {
        if (logger) {
            logger->info("{} succeeded ({} result path(s))", to_string(kind), result.result_paths.size());
        }
        notifier_.operation_completed(kind, sources, target);
    } else {
        if (logger) {
            const auto& first = result.errors.front();
            logger->warn("{} finished with {} error(s); first: {} on '{}' ({})",
                         to_string(kind), result.errors.size(),
                         ErrorCodes::ErrorCatalog::code_name(first.code), first.path, first.message);
        }
        notifier_.operation_failed(kind, sources, result.errors.front());
    }
    return result;
}


bool OperationEngine::validate_target_dir(const std::string& target_dir, OperationResult& result) const
{
    if (target_dir.empty()) {
        result.add_error(Code::PATH_INVALID, target_dir, "Target directory is empty");
        return false;
    }
    std::error_code ec;
    const auto status = fs::status(Utils::utf8_to_path(target_dir), ec);
    if (!fs::exists(status)) {
        result.add_error(Code::FILE_NOT_FOUND, target_dir, "Target directory does not exist");
        return false;
    }
    if (!fs::is_directory(status)) {
        result.add_error(Code::NOT_A_DIRECTORY, target_dir, "Target is not a directory");
        return false;
    }
    return true;
}


fs::path OperationEngine::destination_for(const fs::path& source, const fs::path& target_dir)
{
    const fs::path candidate = target_dir / source.filename();
    if (!Utils::entry_exists(candidate)) {
        return candidate;
    }
    return Utils::utf8_to_path(numbering_.generate_numbered_name(Utils::path_to_utf8(candidate)));
}


void OperationEngine::report_progress(std::size_t done, std::size_t total, const std::string& current) const
{
    notifier_.progress(done, total, current);
}


OperationEngine::StepStatus OperationEngine::copy_entry(const fs::path& from, const fs::path& to,
                                                        std::error_code& ec)
{
    if (cancelled()) {
        return StepStatus::Cancelled;
    }
    const auto status = fs::symlink_status(from, ec);
    if (ec) {
        return StepStatus::Failed;
    }

    if (fs::is_symlink(status)) {
        fs::copy_symlink(from, to, ec);
        return ec ? StepStatus::Failed : StepStatus::Done;
    }

    if (fs::is_directory(status)) {
        if (!fs::create_directory(to, from, ec)) {
            if (!ec) {
                ec = std::make_error_code(std::errc::file_exists);
            }
            return StepStatus::Failed;
        }
        std::vector<FileEntry> children;
        try {
            children = scanner_.get_directory_entries(Utils::path_to_utf8(from), kAllEntries);
        } catch (const fs::filesystem_error& ex) {
            ec = ex.code();
            return StepStatus::Failed;
        }
        for (const auto& child : children) {
            const StepStatus child_status = copy_entry(Utils::utf8_to_path(child.full_path),
                                                       to / Utils::utf8_to_path(child.file_name), ec);
            if (child_status != StepStatus::Done) {
                return child_status;
            }
        }
        preserve_write_time(from, to);
        return StepStatus::Done;
    }

    fs::copy_file(from, to, fs::copy_options::none, ec);
    if (ec) {
        return StepStatus::Failed;
    }
    preserve_write_time(from, to);
    return StepStatus::Done;
}


OperationEngine::StepStatus OperationEngine::transfer_entry(const fs::path& from, const fs::path& to,
                                                            std::error_code& ec)
{
    if (cancelled()) {
        return StepStatus::Cancelled;
    }
    ec.clear();
    fs::rename(from, to, ec);
    if (!ec) {
        return StepStatus::Done;
    }
    if (ec != std::errc::cross_device_link) {
        return StepStatus::Failed;
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("'{}' is on another device; copying then removing", Utils::path_to_utf8(from));
    }
    ec.clear();
    const StepStatus status = copy_entry(from, to, ec);
    if (status != StepStatus::Done) {
        discard_partial(to, ec);
        return status;
    }
    fs::remove_all(from, ec);
    if (ec) {
        // Keep the source intact rather than leave two copies behind.
        const std::error_code cause = ec;
        discard_partial(to, std::error_code());
        ec = cause;
        return StepStatus::Failed;
    }
    return StepStatus::Done;
}


void OperationEngine::roll_back_created(const std::vector<PathPair>& entries, OperationResult& result)
{
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        std::error_code ec;
        fs::remove_all(Utils::utf8_to_path(it->to), ec);
        if (ec) {
            result.add_error(ErrorCodes::from_error_code(ec), it->to,
                             fmt::format("Rollback failed: {}", ec.message()));
        }
    }
}


void OperationEngine::restore_from_trash(const std::vector<PathPair>& entries, OperationResult& result)
{
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        std::error_code ec;
        if (!trash_.restore(it->to, it->from, ec)) {
            result.add_error(ErrorCodes::from_error_code(ec), it->from,
                             fmt::format("Failed to restore: {}", ec.message()));
            continue;
        }
        result.result_paths.push_back(it->from);
    }
}


void OperationEngine::roll_back_moved(const std::vector<PathPair>& entries, OperationResult& result)
{
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        std::error_code ec;
        if (!TrashStore::relocate(Utils::utf8_to_path(it->to), Utils::utf8_to_path(it->from), ec)) {
            result.add_error(ErrorCodes::from_error_code(ec), it->from,
                             fmt::format("Rollback failed: {}", ec.message()));
        }
    }
}


OperationResult OperationEngine::copy_items(OperationKind kind,
                                            const std::vector<std::string>& paths,
                                            const std::string& target_dir)
{
    OperationResult result;
    if (!validate_target_dir(target_dir, result)) {
        return result;
    }
    const fs::path target = Utils::normalize_path(Utils::utf8_to_path(target_dir));
    const std::string verb = kind == OperationKind::Link ? "link" : "copy";

    UndoPayload payload;
    std::vector<std::string> done_sources;
    for (std::size_t index = 0; index < paths.size(); ++index) {
        const std::string& path = paths[index];
        report_progress(index, paths.size(), path);

        if (cancelled()) {
            roll_back_created(payload.entries, result);
            result.result_paths.clear();
            result.add_error(Code::CANCELLED, path, fmt::format("Cancelled before '{}'", path));
            return result;
        }

        const fs::path source = Utils::normalize_path(Utils::utf8_to_path(path));
        if (!Utils::entry_exists(source)) {
            result.add_error(Code::FILE_NOT_FOUND, path, "Source does not exist");
            continue;
        }
        if (kind == OperationKind::Copy && is_directory_entry(source) &&
            Utils::is_same_or_descendant(target, source)) {
            result.add_error(Code::SELF_NESTING, path, "Cannot copy a directory into itself");
            continue;
        }

        const fs::path destination = destination_for(source, target);
        std::error_code ec;
        StepStatus status = StepStatus::Done;
        if (kind == OperationKind::Link) {
            status = create_link(source, destination, ec) ? StepStatus::Done : StepStatus::Failed;
        } else {
            status = copy_entry(source, destination, ec);
        }

        if (status == StepStatus::Cancelled) {
            discard_partial(destination, ec);
            roll_back_created(payload.entries, result);
            result.result_paths.clear();
            result.add_error(Code::CANCELLED, path, fmt::format("Cancelled while copying '{}'", path));
            return result;
        }
        if (status == StepStatus::Failed) {
            discard_partial(destination, ec);
            result.add_error(ErrorCodes::from_error_code(ec), path,
                             fmt::format("Failed to {}: {}", verb, ec.message()));
            continue;
        }

        const std::string created = Utils::path_to_utf8(destination);
        payload.entries.push_back(PathPair{Utils::path_to_utf8(source), created});
        done_sources.push_back(path);
        result.result_paths.push_back(created);
    }
    report_progress(paths.size(), paths.size(), std::string());

    if (!payload.empty()) {
        result.operation.emplace(kind, std::move(done_sources), Utils::path_to_utf8(target), true,
                                 std::move(payload));
    }
    result.success = result.errors.empty();
    return result;
}


OperationResult OperationEngine::move_items(const std::vector<std::string>& paths,
                                            const std::string& target_dir)
{
    OperationResult result;
    if (!validate_target_dir(target_dir, result)) {
        return result;
    }
    const fs::path target = Utils::normalize_path(Utils::utf8_to_path(target_dir));

    UndoPayload payload;
    std::vector<std::string> done_sources;
    for (std::size_t index = 0; index < paths.size(); ++index) {
        const std::string& path = paths[index];
        report_progress(index, paths.size(), path);

        if (cancelled()) {
            roll_back_moved(payload.entries, result);
            result.result_paths.clear();
            result.add_error(Code::CANCELLED, path, fmt::format("Cancelled before '{}'", path));
            return result;
        }

        const fs::path source = Utils::normalize_path(Utils::utf8_to_path(path));
        if (!Utils::entry_exists(source)) {
            result.add_error(Code::FILE_NOT_FOUND, path, "Source does not exist");
            continue;
        }
        if (Utils::is_same_or_descendant(target, source)) {
            result.add_error(Code::SELF_NESTING, path, "Cannot move an item into itself");
            continue;
        }
        if (source.parent_path() == target) {
            result.warnings.push_back(fmt::format("'{}' is already in '{}'", path, target_dir));
            continue;
        }

        const fs::path destination = destination_for(source, target);
        std::error_code ec;
        const StepStatus status = transfer_entry(source, destination, ec);
        if (status == StepStatus::Cancelled) {
            roll_back_moved(payload.entries, result);
            result.result_paths.clear();
            result.add_error(Code::CANCELLED, path, fmt::format("Cancelled while moving '{}'", path));
            return result;
        }
        if (status == StepStatus::Failed) {
            result.add_error(ErrorCodes::from_error_code(ec), path,
                             fmt::format("Failed to move: {}", ec.message()));
            continue;
        }

        const std::string moved = Utils::path_to_utf8(destination);
        payload.entries.push_back(PathPair{Utils::path_to_utf8(source), moved});
        done_sources.push_back(path);
        result.result_paths.push_back(moved);
    }
    report_progress(paths.size(), paths.size(), std::string());

    if (!payload.empty()) {
        result.operation.emplace(OperationKind::Move, std::move(done_sources), Utils::path_to_utf8(target),
                                 true, std::move(payload));
    }
    result.success = result.errors.empty();
    return result;
}


OperationResult OperationEngine::copy(const std::vector<std::string>& paths, const std::string& target_dir)
{
    return run_operation(OperationKind::Copy, paths, target_dir,
                         [&] { return copy_items(OperationKind::Copy, paths, target_dir); });
}


OperationResult OperationEngine::move(const std::vector<std::string>& paths, const std::string& target_dir)
{
    return run_operation(OperationKind::Move, paths, target_dir,
                         [&] { return move_items(paths, target_dir); });
}


OperationResult OperationEngine::link(const std::vector<std::string>& paths, const std::string& target_dir)
{
    return run_operation(OperationKind::Link, paths, target_dir,
                         [&] { return copy_items(OperationKind::Link, paths, target_dir); });
}


OperationResult OperationEngine::delete_items(const std::vector<std::string>& paths, bool permanent,
                                              bool confirmed)
{
    return run_operation(OperationKind::Delete, paths, std::string(), [&] {
        if (permanent && !confirmed) {
            const bool needs_confirmation = paths.size() > 1 ||
                std::any_of(paths.begin(), paths.end(), [](const std::string& path) {
                    return is_directory_entry(Utils::utf8_to_path(path));
                });
            if (needs_confirmation) {
                return OperationResult::failure(Code::CONFIRMATION_REQUIRED,
                                                paths.empty() ? std::string() : paths.front(),
                                                "Permanent delete of directories or several items must be confirmed");
            }
        }

        OperationResult result;
        UndoPayload payload;
        std::vector<std::string> done_sources;
        for (std::size_t index = 0; index < paths.size(); ++index) {
            const std::string& path = paths[index];
            report_progress(index, paths.size(), path);

            if (cancelled()) {
                if (!permanent) {
                    restore_from_trash(payload.entries, result);
                    result.result_paths.clear();
                    done_sources.clear();
                    payload.entries.clear();
                }
                result.add_error(Code::CANCELLED, path, fmt::format("Cancelled before '{}'", path));
                break;
            }

            const fs::path source = Utils::normalize_path(Utils::utf8_to_path(path));
            if (!Utils::entry_exists(source)) {
                result.add_error(Code::FILE_NOT_FOUND, path, "Item does not exist");
                continue;
            }

            std::error_code ec;
            if (permanent) {
                fs::remove_all(source, ec);
                if (ec) {
                    result.add_error(ErrorCodes::from_error_code(ec), path,
                                     fmt::format("Failed to delete: {}", ec.message()));
                    continue;
                }
            } else {
                const auto trash_path = trash_.move_to_trash(Utils::path_to_utf8(source), ec);
                if (!trash_path) {
                    result.add_error(ErrorCodes::from_error_code(ec), path,
                                     fmt::format("Failed to move to trash: {}", ec.message()));
                    continue;
                }
                payload.entries.push_back(PathPair{Utils::path_to_utf8(source), *trash_path});
            }
            done_sources.push_back(path);
            result.result_paths.push_back(path);
        }
        report_progress(paths.size(), paths.size(), std::string());

        if (!done_sources.empty()) {
            if (permanent) {
                result.operation.emplace(OperationKind::Delete, std::move(done_sources), std::nullopt,
                                         false, UndoPayload{});
            } else {
                result.operation.emplace(OperationKind::Delete, std::move(done_sources), std::nullopt,
                                         true, std::move(payload));
            }
        }
        result.success = result.errors.empty();
        return result;
    });
}


OperationResult OperationEngine::rename(const std::string& path, const std::string& new_name)
{
    return run_operation(OperationKind::Rename, {path}, new_name, [&] {
        if (!is_valid_entry_name(new_name)) {
            return OperationResult::failure(Code::PATH_INVALID, path,
                                            fmt::format("'{}' is not a valid name", new_name));
        }
        const fs::path source = Utils::normalize_path(Utils::utf8_to_path(path));
        if (!Utils::entry_exists(source)) {
            return OperationResult::failure(Code::FILE_NOT_FOUND, path, "Item does not exist");
        }

        const fs::path destination = source.parent_path() / Utils::utf8_to_path(new_name);
        OperationResult result;
        if (destination == source) {
            result.success = true;
            result.result_paths.push_back(Utils::path_to_utf8(source));
            result.warnings.push_back("Name unchanged");
            return result;
        }

        std::error_code ec;
        // A case-only rename on a case-insensitive volume resolves to the same entry.
        if (Utils::entry_exists(destination) && !fs::equivalent(source, destination, ec)) {
            return OperationResult::failure(Code::NAME_CONFLICT, Utils::path_to_utf8(destination),
                                            fmt::format("'{}' already exists", new_name));
        }

        ec.clear();
        fs::rename(source, destination, ec);
        if (ec) {
            return OperationResult::failure(ErrorCodes::from_error_code(ec), path,
                                            fmt::format("Failed to rename: {}", ec.message()));
        }

        UndoPayload payload;
        payload.original_name = Utils::path_to_utf8(source.filename());
        payload.entries.push_back(PathPair{Utils::path_to_utf8(source), Utils::path_to_utf8(destination)});
        result.success = true;
        result.result_paths.push_back(Utils::path_to_utf8(destination));
        result.operation.emplace(OperationKind::Rename, std::vector<std::string>{Utils::path_to_utf8(source)},
                                 Utils::path_to_utf8(destination), true, std::move(payload));
        return result;
    });
}


OperationResult OperationEngine::duplicate(const std::string& path)
{
    return run_operation(OperationKind::Duplicate, {path}, std::string(), [&] {
        const fs::path source = Utils::normalize_path(Utils::utf8_to_path(path));
        if (!Utils::entry_exists(source)) {
            return OperationResult::failure(Code::FILE_NOT_FOUND, path, "Item does not exist");
        }

        const fs::path destination = Utils::utf8_to_path(
            numbering_.generate_numbered_name(Utils::path_to_utf8(source)));
        std::error_code ec;
        const StepStatus status = copy_entry(source, destination, ec);
        if (status == StepStatus::Cancelled) {
            discard_partial(destination, ec);
            return OperationResult::failure(Code::CANCELLED, path, "Duplicate cancelled");
        }
        if (status == StepStatus::Failed) {
            discard_partial(destination, ec);
            return OperationResult::failure(ErrorCodes::from_error_code(ec), path,
                                            fmt::format("Failed to duplicate: {}", ec.message()));
        }

        const std::string created = Utils::path_to_utf8(destination);
        UndoPayload payload;
        payload.entries.push_back(PathPair{Utils::path_to_utf8(source), created});
        OperationResult result;
        result.success = true;
        result.result_paths.push_back(created);
        result.operation.emplace(OperationKind::Duplicate, std::vector<std::string>{Utils::path_to_utf8(source)},
                                 created, true, std::move(payload));
        return result;
    });
}


OperationResult OperationEngine::create_entry(OperationKind kind, const std::string& parent_dir,
                                              const std::string& name)
{
    OperationResult result;
    if (!is_valid_entry_name(name)) {
        result.add_error(Code::PATH_INVALID, name, fmt::format("'{}' is not a valid name", name));
        return result;
    }
    if (!validate_target_dir(parent_dir, result)) {
        return result;
    }

    const fs::path destination = Utils::normalize_path(Utils::utf8_to_path(parent_dir)) / Utils::utf8_to_path(name);
    const std::string created = Utils::path_to_utf8(destination);
    if (Utils::entry_exists(destination)) {
        result.add_error(Code::NAME_CONFLICT, created, fmt::format("'{}' already exists", name));
        return result;
    }

    std::error_code ec;
    const bool ok = kind == OperationKind::CreateDirectory
        ? fs::create_directory(destination, ec)
        : create_empty_file(destination, ec);
    if (!ok) {
        if (!ec) {
            ec = std::make_error_code(std::errc::file_exists);
        }
        result.add_error(ErrorCodes::from_error_code(ec), created,
                         fmt::format("Failed to create: {}", ec.message()));
        return result;
    }

    UndoPayload payload;
    payload.entries.push_back(PathPair{std::string(), created});
    result.success = true;
    result.result_paths.push_back(created);
    result.operation.emplace(kind, std::vector<std::string>{}, created, true, std::move(payload));
    return result;
}


OperationResult OperationEngine::create_file(const std::string& parent_dir, const std::string& name)
{
    return run_operation(OperationKind::CreateFile, {}, parent_dir,
                         [&] { return create_entry(OperationKind::CreateFile, parent_dir, name); });
}


OperationResult OperationEngine::create_directory(const std::string& parent_dir, const std::string& name)
{
    return run_operation(OperationKind::CreateDirectory, {}, parent_dir,
                         [&] { return create_entry(OperationKind::CreateDirectory, parent_dir, name); });
}


OperationResult OperationEngine::paste(const std::string& target_dir)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const ClipboardContents contents = clipboard_.contents();
    if (contents.mode == ClipboardMode::Empty) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("Paste into '{}' ignored: clipboard is empty", target_dir);
        }
        return OperationResult::failure(Code::EMPTY_CLIPBOARD, target_dir, "Nothing to paste");
    }

    if (contents.mode == ClipboardMode::Copy) {
        return copy(contents.paths, target_dir);
    }

    OperationResult result = move(contents.paths, target_dir);
    if (result.has_error(Code::CANCELLED)) {
        return result;
    }
    // A failure not tied to one of the cut items (bad target) leaves the selection intact.
    const bool per_item_outcome = std::all_of(
        result.errors.begin(), result.errors.end(), [&contents](const OperationError& error) {
            return std::find(contents.paths.begin(), contents.paths.end(), error.path) != contents.paths.end();
        });
    if (!per_item_outcome) {
        return result;
    }

    std::vector<std::string> remaining;
    for (const auto& path : contents.paths) {
        const bool failed = std::any_of(result.errors.begin(), result.errors.end(),
                                        [&path](const OperationError& error) { return error.path == path; });
        if (failed) {
            remaining.push_back(path);
        }
    }
    if (remaining.empty()) {
        clipboard_.clear();
    } else {
        clipboard_.set(remaining, true);
    }
    notifier_.clipboard_changed(clipboard_.mode(), clipboard_.contents().paths);
    return result;
}


OperationResult OperationEngine::set_clipboard(const std::vector<std::string>& paths, bool cut)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    OperationResult result;
    std::vector<std::string> existing;
    for (const auto& path : paths) {
        if (Utils::entry_exists(Utils::utf8_to_path(path))) {
            existing.push_back(path);
        } else {
            result.warnings.push_back(fmt::format("'{}' does not exist and was skipped", path));
        }
    }
    if (existing.empty()) {
        result.add_error(Code::FILE_NOT_FOUND, paths.empty() ? std::string() : paths.front(),
                         "None of the selected items exist");
        return result;
    }

    clipboard_.set(existing, cut);
    const ClipboardContents contents = clipboard_.contents();
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Clipboard holds {} item(s) in {} mode", contents.paths.size(), to_string(contents.mode));
    }
    notifier_.clipboard_changed(contents.mode, contents.paths);
    result.success = true;
    result.result_paths = contents.paths;
    return result;
}


OperationResult OperationEngine::copy_to_clipboard(const std::vector<std::string>& paths)
{
    return set_clipboard(paths, false);
}


OperationResult OperationEngine::cut_to_clipboard(const std::vector<std::string>& paths)
{
    return set_clipboard(paths, true);
}


void OperationEngine::clear_clipboard()
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    clipboard_.clear();
    notifier_.clipboard_changed(ClipboardMode::Empty, {});
}


ClipboardContents OperationEngine::clipboard() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return clipboard_.contents();
}


bool OperationEngine::can_paste(const std::string& target_dir) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!clipboard_.has_content() || target_dir.empty()) {
        return false;
    }
    std::error_code ec;
    const auto status = fs::status(Utils::utf8_to_path(target_dir), ec);
    if (ec || !fs::is_directory(status)) {
        return false;
    }
    const auto writable = fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write;
    return (status.permissions() & writable) != fs::perms::none;
}


std::optional<OperationError> OperationEngine::check_undoable(const Operation& operation) const
{
    for (const auto& entry : operation.undo_payload().entries) {
        const fs::path to = Utils::utf8_to_path(entry.to);
        if (!Utils::entry_exists(to)) {
            return diverged(entry.to, fmt::format("'{}' no longer exists", entry.to));
        }
        if (operation.kind() == OperationKind::CreateDirectory) {
            std::error_code ec;
            if (!fs::is_empty(to, ec) || ec) {
                return diverged(entry.to, fmt::format("'{}' is no longer empty", entry.to));
            }
        }
        if (!removes_on_undo(operation.kind()) && Utils::entry_exists(Utils::utf8_to_path(entry.from))) {
            return diverged(entry.from, fmt::format("'{}' is occupied again", entry.from));
        }
    }
    return std::nullopt;
}


std::optional<OperationError> OperationEngine::check_redoable(const Operation& operation) const
{
    for (const auto& entry : operation.undo_payload().entries) {
        if (Utils::entry_exists(Utils::utf8_to_path(entry.to))) {
            return diverged(entry.to, fmt::format("'{}' already exists", entry.to));
        }
        const bool needs_source = operation.kind() != OperationKind::CreateFile &&
                                  operation.kind() != OperationKind::CreateDirectory &&
                                  operation.kind() != OperationKind::Link;
        if (needs_source && !Utils::entry_exists(Utils::utf8_to_path(entry.from))) {
            return diverged(entry.from, fmt::format("'{}' no longer exists", entry.from));
        }
    }
    return std::nullopt;
}


void OperationEngine::reverse(const Operation& operation, OperationResult& result)
{
    const auto& entries = operation.undo_payload().entries;
    if (operation.kind() == OperationKind::Delete) {
        restore_from_trash(entries, result);
        return;
    }
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        std::error_code ec;
        if (removes_on_undo(operation.kind())) {
            fs::remove_all(Utils::utf8_to_path(it->to), ec);
            if (ec) {
                result.add_error(ErrorCodes::from_error_code(ec), it->to,
                                 fmt::format("Failed to remove: {}", ec.message()));
            }
            continue;
        }

        const fs::path from = Utils::utf8_to_path(it->from);
        if (from.has_parent_path()) {
            fs::create_directories(from.parent_path(), ec);
        }
        if (ec || !TrashStore::relocate(Utils::utf8_to_path(it->to), from, ec)) {
            result.add_error(ErrorCodes::from_error_code(ec), it->from,
                             fmt::format("Failed to restore: {}", ec.message()));
            continue;
        }
        result.result_paths.push_back(it->from);
    }
}


void OperationEngine::replay(const Operation& operation, OperationResult& result)
{
    for (const auto& entry : operation.undo_payload().entries) {
        const fs::path from = Utils::utf8_to_path(entry.from);
        const fs::path to = Utils::utf8_to_path(entry.to);
        std::error_code ec;
        bool ok = true;

        switch (operation.kind()) {
            case OperationKind::Copy:
            case OperationKind::Duplicate: {
                const StepStatus status = copy_entry(from, to, ec);
                if (status == StepStatus::Cancelled) {
                    discard_partial(to, ec);
                    result.add_error(Code::CANCELLED, entry.to, "Redo cancelled");
                    return;
                }
                ok = status == StepStatus::Done;
                if (!ok) {
                    discard_partial(to, ec);
                }
                break;
            }
            case OperationKind::Link:
                ok = create_link(from, to, ec);
                break;
            case OperationKind::CreateFile:
                ok = create_empty_file(to, ec);
                break;
            case OperationKind::CreateDirectory:
                ok = fs::create_directory(to, ec);
                break;
            case OperationKind::Move:
            case OperationKind::Rename:
            case OperationKind::Delete:
                if (to.has_parent_path()) {
                    fs::create_directories(to.parent_path(), ec);
                }
                ok = !ec && TrashStore::relocate(from, to, ec);
                break;
        }

        if (!ok) {
            if (!ec) {
                ec = std::make_error_code(std::errc::io_error);
            }
            result.add_error(ErrorCodes::from_error_code(ec), entry.to,
                             fmt::format("Failed to redo: {}", ec.message()));
            continue;
        }
        result.result_paths.push_back(entry.to);
    }
}


OperationResult OperationEngine::undo()
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    BusyScope busy(*this);

    const auto next = history_.peek_undo();
    if (!next) {
        return OperationResult::failure(Code::NOTHING_TO_UNDO, std::string(), "Nothing to undo");
    }

    notifier_.operation_started(next->kind(), next->source_paths());
    OperationResult result;
    if (auto divergence = check_undoable(*next)) {
        result.errors.push_back(*divergence);
        history_.discard_next_undo();
    } else {
        reverse(*next, result);
        if (result.errors.empty()) {
            history_.undo();
        } else {
            history_.discard_next_undo();
        }
    }
    result.operation = *next;
    result.success = result.errors.empty();

    const std::string target = next->target_path().value_or(std::string());
    if (result.success) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("Undone: {}", next->description());
        }
        notifier_.operation_completed(next->kind(), next->source_paths(), target);
    } else {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Undo of '{}' failed: {}", next->description(), result.errors.front().message);
        }
        notifier_.operation_failed(next->kind(), next->source_paths(), result.errors.front());
    }
    return result;
}


OperationResult OperationEngine::redo()
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    BusyScope busy(*this);

    const auto next = history_.peek_redo();
    if (!next) {
        return OperationResult::failure(Code::NOTHING_TO_REDO, std::string(), "Nothing to redo");
    }

    notifier_.operation_started(next->kind(), next->source_paths());
    OperationResult result;
    if (auto divergence = check_redoable(*next)) {
        result.errors.push_back(*divergence);
        history_.discard_next_redo();
    } else {
        replay(*next, result);
        if (result.errors.empty()) {
            history_.redo();
        } else {
            history_.discard_next_redo();
        }
    }
    result.operation = *next;
    result.success = result.errors.empty();

    const std::string target = next->target_path().value_or(std::string());
    if (result.success) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("Redone: {}", next->description());
        }
        notifier_.operation_completed(next->kind(), next->source_paths(), target);
    } else {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Redo of '{}' failed: {}", next->description(), result.errors.front().message);
        }
        notifier_.operation_failed(next->kind(), next->source_paths(), result.errors.front());
    }
    return result;
}


bool OperationEngine::can_undo() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return history_.can_undo();
}


bool OperationEngine::can_redo() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return history_.can_redo();
}


std::optional<std::string> OperationEngine::undo_description() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (auto next = history_.peek_undo()) {
        return next->description();
    }
    return std::nullopt;
}


std::optional<std::string> OperationEngine::redo_description() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (auto next = history_.peek_redo()) {
        return next->description();
    }
    return std::nullopt;
}


std::vector<Operation> OperationEngine::undo_history() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return history_.undo_history();
}


void OperationEngine::clear_history()
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    history_.clear();
}


std::vector<std::string> OperationEngine::history_snapshot(std::size_t limit) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<std::string> combined = persisted_history_;
    for (const auto& description : history_.recent_descriptions(history_.undo_size())) {
        combined.push_back(description);
    }
    if (combined.size() > limit) {
        combined.erase(combined.begin(), combined.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return combined;
}


void OperationEngine::restore_history_snapshot(std::vector<std::string> descriptions)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    persisted_history_ = std::move(descriptions);
}


std::vector<NumberingRecord> OperationEngine::numbering_records() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return numbering_.records();
}


void OperationEngine::seed_numbering(const std::vector<NumberingRecord>& records)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& record : records) {
        numbering_.seed(record);
    }
}


OperationNotifier::SubscriptionId OperationEngine::subscribe(OperationObserver observer)
{
    return notifier_.subscribe(std::move(observer));
}


bool OperationEngine::unsubscribe(OperationNotifier::SubscriptionId id)
{
    return notifier_.unsubscribe(id);
}


void OperationEngine::begin_task()
{
    cancel_requested_.store(false);
    task_open_.store(true);
}


void OperationEngine::end_task()
{
    task_open_.store(false);
    cancel_requested_.store(false);
}


void OperationEngine::request_cancel()
{
    if (busy_depth_.load() > 0 || task_open_.load()) {
        cancel_requested_.store(true);
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("Cancellation requested");
        }
    }
}


bool OperationEngine::is_busy() const
{
    return busy_depth_.load() > 0;
}
