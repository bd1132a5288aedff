#include "Operation.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace {

std::string display_name(const std::string& path)
{
    const auto name = Utils::utf8_to_path(path).filename();
    return name.empty() ? path : Utils::path_to_utf8(name);
}

std::string items_phrase(const std::vector<std::string>& paths)
{
    if (paths.size() == 1) {
        return fmt::format("'{}'", display_name(paths.front()));
    }
    return fmt::format("{} items", paths.size());
}

} // namespace


Operation::Operation(OperationKind kind,
                     std::vector<std::string> source_paths,
                     std::optional<std::string> target_path,
                     bool undoable,
                     UndoPayload undo_payload,
                     Clock::time_point timestamp)
    : kind_(kind),
      source_paths_(std::move(source_paths)),
      target_path_(std::move(target_path)),
      timestamp_(timestamp),
      undoable_(undoable),
      undo_payload_(std::move(undo_payload))
{
    if (undoable_ && undo_payload_.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::UNKNOWN_ERROR,
                            "Undoable operation without undo payload",
                            to_string(kind_));
    }
    description_ = describe(kind_, source_paths_, target_path_);
}


Operation Operation::merge_renames(const Operation& first, const Operation& second)
{
    UndoPayload payload;
    payload.original_name = first.undo_payload().original_name;
    payload.entries.push_back(PathPair{first.undo_payload().entries.front().from,
                                       second.undo_payload().entries.front().to});
    return Operation(OperationKind::Rename,
                     first.source_paths(),
                     second.target_path(),
                     true,
                     std::move(payload),
                     second.timestamp());
}


std::string describe(OperationKind kind,
                     const std::vector<std::string>& source_paths,
                     const std::optional<std::string>& target_path)
{
    const std::string target = target_path ? *target_path : std::string();
    switch (kind) {
        case OperationKind::Copy:
            return fmt::format("Copy {} to '{}'", items_phrase(source_paths), target);
        case OperationKind::Move:
            return fmt::format("Move {} to '{}'", items_phrase(source_paths), target);
        case OperationKind::Delete:
            return fmt::format("Delete {}", items_phrase(source_paths));
        case OperationKind::Rename:
            return fmt::format("Rename {} to '{}'", items_phrase(source_paths), display_name(target));
        case OperationKind::CreateFile:
            return fmt::format("Create file '{}'", display_name(target));
        case OperationKind::CreateDirectory:
            return fmt::format("Create folder '{}'", display_name(target));
        case OperationKind::Duplicate:
            return fmt::format("Duplicate {} as '{}'", items_phrase(source_paths), display_name(target));
        case OperationKind::Link:
            return fmt::format("Link {} into '{}'", items_phrase(source_paths), target);
    }
    return to_string(kind);
}


bool OperationResult::has_error(ErrorCodes::Code code) const
{
    return std::any_of(errors.begin(), errors.end(),
                       [code](const OperationError& error) { return error.code == code; });
}


void OperationResult::add_error(ErrorCodes::Code code, const std::string& path, const std::string& message)
{
    std::string text = message.empty() ? ErrorCodes::ErrorCatalog::get_error_info(code).message : message;
    errors.push_back(OperationError{code, path, std::move(text)});
    success = false;
}


OperationResult OperationResult::failure(ErrorCodes::Code code, const std::string& path, const std::string& message)
{
    OperationResult result;
    result.add_error(code, path, message);
    return result;
}
