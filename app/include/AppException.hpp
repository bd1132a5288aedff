#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace ErrorCodes {

// Raised for configuration problems and misuse of the engine API.
// Per-item file system failures are reported through OperationResult instead.
// The context names what failed: usually a path, sometimes a bad value.
class AppException : public std::runtime_error {
public:
    explicit AppException(Code code, const std::string& context = "")
        : std::runtime_error(ErrorCatalog::get_error_info(code, context).get_full_details()),
          error_code_(code),
          error_info_(ErrorCatalog::get_error_info(code, context)) {}

    // Custom message overrides the catalog text but keeps its resolution
    AppException(Code code, const std::string& custom_message, const std::string& context)
        : std::runtime_error(custom_message),
          error_code_(code),
          error_info_(code, custom_message, ErrorCatalog::get_error_info(code).resolution, context) {}

    // Classifies the OS error behind a std::filesystem failure
    static AppException from_filesystem_error(const std::filesystem::filesystem_error& ex)
    {
        const auto& first = ex.path1();
        return AppException(from_error_code(ex.code()), ex.what(), first.empty() ? std::string() : first.string());
    }

    Code get_error_code() const noexcept { return error_code_; }
    const ErrorInfo& get_error_info() const noexcept { return error_info_; }
    const std::string& context() const noexcept { return error_info_.context; }

    std::string get_user_message() const { return error_info_.get_user_message(); }
    std::string get_full_details() const { return error_info_.get_full_details(); }

private:
    Code error_code_;
    ErrorInfo error_info_;
};

} // namespace ErrorCodes

#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

#define THROW_APP_ERROR_MSG(code, message, context) \
    throw ErrorCodes::AppException(code, message, context)

#endif // APPEXCEPTION_HPP
