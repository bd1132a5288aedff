#include "ErrorCode.hpp"

#include <cerrno>
#include <sstream>
#include <unordered_map>

namespace ErrorCodes {

namespace {

struct CatalogEntry {
    const char* name;
    const char* message;
    const char* resolution;
};

const std::unordered_map<Code, CatalogEntry>& catalog()
{
    static const std::unordered_map<Code, CatalogEntry> entries = {
        {Code::SUCCESS, {"SUCCESS", "Operation completed successfully.", ""}},
        {Code::UNKNOWN_ERROR, {"UNKNOWN_ERROR", "An unexpected error occurred.",
            "Check the log file for details."}},

        {Code::CONFIG_LOAD_FAILED, {"CONFIG_LOAD_FAILED", "The configuration file could not be read.",
            "Check that the configuration directory exists and is readable."}},
        {Code::CONFIG_SAVE_FAILED, {"CONFIG_SAVE_FAILED", "The configuration file could not be written.",
            "Check free disk space and permissions of the configuration directory."}},
        {Code::CONFIG_INVALID_VALUE, {"CONFIG_INVALID_VALUE", "A configuration value is invalid.",
            "Correct the value in config.ini or remove it to restore the default."}},
        {Code::STATE_PARSE_ERROR, {"STATE_PARSE_ERROR", "The saved engine state is corrupted.",
            "Delete the state file; numbering will be rebuilt from the directories."}},
        {Code::STATE_SAVE_FAILED, {"STATE_SAVE_FAILED", "The engine state could not be saved.",
            "Check free disk space and permissions of the state file location."}},

        {Code::FILE_NOT_FOUND, {"FILE_NOT_FOUND", "The file or directory does not exist.",
            "Refresh the view; the item may have been moved or deleted."}},
        {Code::PERMISSION_DENIED, {"PERMISSION_DENIED", "Permission denied.",
            "Check the ownership and permissions of the item and its parent directory."}},
        {Code::NAME_CONFLICT, {"NAME_CONFLICT", "An item with this name already exists.",
            "Choose a different name."}},
        {Code::IN_USE, {"IN_USE", "The item is in use by another process.",
            "Close the application using the item and try again."}},
        {Code::CROSS_DEVICE, {"CROSS_DEVICE", "The item cannot be moved across devices.",
            "Copy the item instead, then delete the original."}},
        {Code::IO_ERROR, {"IO_ERROR", "An input/output error occurred.",
            "Check the device and try again."}},
        {Code::PATH_INVALID, {"PATH_INVALID", "The path or name is invalid.",
            "Names must not be empty, '.', '..' or contain a path separator."}},
        {Code::NOT_A_DIRECTORY, {"NOT_A_DIRECTORY", "The target is not a directory.",
            "Select a directory as the destination."}},
        {Code::SELF_NESTING, {"SELF_NESTING", "An item cannot be placed inside itself.",
            "Choose a destination outside the selected folder."}},
        {Code::DISK_FULL, {"DISK_FULL", "There is not enough space on the device.",
            "Free some space and try again."}},

        {Code::EMPTY_CLIPBOARD, {"EMPTY_CLIPBOARD", "There is nothing to paste.",
            "Copy or cut items first."}},
        {Code::CANCELLED, {"CANCELLED", "The operation was cancelled.", ""}},
        {Code::NOTHING_TO_UNDO, {"NOTHING_TO_UNDO", "There is nothing to undo.", ""}},
        {Code::NOTHING_TO_REDO, {"NOTHING_TO_REDO", "There is nothing to redo.", ""}},
        {Code::HISTORY_DIVERGED, {"HISTORY_DIVERGED",
            "The items changed outside of the application and the step cannot be reversed.",
            "The step was removed from the history; the remaining steps are still available."}},
        {Code::CONFIRMATION_REQUIRED, {"CONFIRMATION_REQUIRED",
            "Permanent deletion of folders or multiple items requires confirmation.",
            "Confirm the deletion explicitly."}},
        {Code::DISPATCHER_STOPPED, {"DISPATCHER_STOPPED", "The operation queue is shutting down.",
            "Restart the application."}},
    };
    return entries;
}

} // namespace

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + "\n\n" + resolution;
}

std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error " << static_cast<int>(code) << " (" << ErrorCatalog::code_name(code) << "): "
        << message;
    if (!context.empty()) {
        oss << "\nContext: " << context;
    }
    if (!resolution.empty()) {
        oss << "\nResolution: " << resolution;
    }
    return oss.str();
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const auto& entries = catalog();
    if (auto it = entries.find(code); it != entries.end()) {
        return ErrorInfo(code, it->second.message, it->second.resolution, context);
    }
    const auto& unknown = entries.at(Code::UNKNOWN_ERROR);
    return ErrorInfo(code, unknown.message, unknown.resolution, context);
}

std::string ErrorCatalog::code_name(Code code)
{
    const auto& entries = catalog();
    if (auto it = entries.find(code); it != entries.end()) {
        return it->second.name;
    }
    return "UNKNOWN_ERROR";
}

Code from_error_code(const std::error_code& ec)
{
    if (!ec) {
        return Code::SUCCESS;
    }
    if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
        return Code::IO_ERROR;
    }
    switch (ec.value()) {
        case ENOENT:
            return Code::FILE_NOT_FOUND;
        case EACCES:
        case EPERM:
        case EROFS:
            return Code::PERMISSION_DENIED;
        case EEXIST:
        case ENOTEMPTY:
            return Code::NAME_CONFLICT;
        case EBUSY:
        case ETXTBSY:
            return Code::IN_USE;
        case EXDEV:
            return Code::CROSS_DEVICE;
        case ENOTDIR:
            return Code::NOT_A_DIRECTORY;
        case ENAMETOOLONG:
        case EINVAL:
            return Code::PATH_INVALID;
        case ENOSPC:
            return Code::DISK_FULL;
        default:
            return Code::IO_ERROR;
    }
}

} // namespace ErrorCodes
