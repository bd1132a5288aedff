#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <system_error>
#include <utility>

namespace ErrorCodes {

// Error codes grouped by category, one hundred codes per range.
enum class Code {
    SUCCESS = 0,
    UNKNOWN_ERROR = 1,

    // Configuration (1500-1599)
    CONFIG_LOAD_FAILED = 1500,
    CONFIG_SAVE_FAILED = 1501,
    CONFIG_INVALID_VALUE = 1502,
    STATE_PARSE_ERROR = 1503,
    STATE_SAVE_FAILED = 1504,

    // File System (1200-1299)
    FILE_NOT_FOUND = 1200,
    PERMISSION_DENIED = 1201,
    NAME_CONFLICT = 1202,
    IN_USE = 1203,
    CROSS_DEVICE = 1204,
    IO_ERROR = 1205,
    PATH_INVALID = 1206,
    NOT_A_DIRECTORY = 1207,
    SELF_NESTING = 1208,
    DISK_FULL = 1209,

    // Operations (1800-1899)
    EMPTY_CLIPBOARD = 1800,
    CANCELLED = 1801,
    NOTHING_TO_UNDO = 1802,
    NOTHING_TO_REDO = 1803,
    HISTORY_DIVERGED = 1804,
    CONFIRMATION_REQUIRED = 1805,
    DISPATCHER_STOPPED = 1806
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message plus resolution steps
    std::string get_user_message() const;

    // Everything including the numeric code and technical context
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
    static std::string code_name(Code code);
};

// Maps an OS-level error (errno category) onto the file system range.
Code from_error_code(const std::error_code& ec);

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
