#include "TrashStore.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <chrono>
#include <fmt/format.h>

namespace fs = std::filesystem;


TrashStore::TrashStore(std::string trash_dir)
    : trash_dir_(std::move(trash_dir))
{
    if (trash_dir_.empty()) {
        trash_dir_ = Utils::path_to_utf8(Utils::utf8_to_path(Utils::default_config_dir()) / "trash");
    }
}


fs::path TrashStore::unique_slot(const fs::path& source)
{
    const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const fs::path root = Utils::utf8_to_path(trash_dir_);
    const std::string name = Utils::path_to_utf8(source.filename());

    fs::path slot;
    do {
        slot = root / fmt::format("{}-{}_{}", stamp, ++sequence_, name);
    } while (Utils::entry_exists(slot));
    return slot;
}


std::optional<std::string> TrashStore::move_to_trash(const std::string& path, std::error_code& ec)
{
    ec.clear();
    const fs::path source = Utils::normalize_path(Utils::utf8_to_path(path));
    if (!Utils::entry_exists(source)) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return std::nullopt;
    }
    if (Utils::is_same_or_descendant(Utils::utf8_to_path(trash_dir_), source)) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return std::nullopt;
    }

    fs::create_directories(Utils::utf8_to_path(trash_dir_), ec);
    if (ec) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Cannot create trash directory '{}': {}", trash_dir_, ec.message());
        }
        return std::nullopt;
    }

    const fs::path slot = unique_slot(source);
    if (!relocate(source, slot, ec)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Failed to move '{}' to trash: {}", path, ec.message());
        }
        return std::nullopt;
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Trashed '{}' as '{}'", path, Utils::path_to_utf8(slot));
    }
    return Utils::path_to_utf8(slot);
}


bool TrashStore::restore(const std::string& trash_path, const std::string& original_path,
                         std::error_code& ec)
{
    ec.clear();
    const fs::path from = Utils::utf8_to_path(trash_path);
    const fs::path to = Utils::utf8_to_path(original_path);
    if (!Utils::entry_exists(from)) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return false;
    }
    if (Utils::entry_exists(to)) {
        ec = std::make_error_code(std::errc::file_exists);
        return false;
    }
    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
        if (ec) {
            return false;
        }
    }
    if (!relocate(from, to, ec)) {
        return false;
    }
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Restored '{}' from trash", original_path);
    }
    return true;
}


bool TrashStore::relocate(const fs::path& from, const fs::path& to, std::error_code& ec)
{
    ec.clear();
    fs::rename(from, to, ec);
    if (!ec) {
        return true;
    }
    if (ec != std::errc::cross_device_link) {
        return false;
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Cross-device relocation of '{}', copying instead", Utils::path_to_utf8(from));
    }
    ec.clear();
    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove_all(to, cleanup_ec);
        return false;
    }
    fs::remove_all(from, ec);
    return !ec;
}
