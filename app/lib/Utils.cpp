#include "Utils.hpp"

#include <cctype>
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/stat.h>
#endif

namespace fs = std::filesystem;

namespace Utils {

fs::path utf8_to_path(const std::string& value)
{
#ifdef _WIN32
    std::u8string u8(value.begin(), value.end());
    return fs::path(u8);
#else
    return fs::path(value);
#endif
}


std::string path_to_utf8(const fs::path& path)
{
#ifdef _WIN32
    const auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
#else
    return path.string();
#endif
}


fs::path normalize_path(const fs::path& path)
{
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    fs::path normal = absolute.lexically_normal();
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}


bool is_same_or_descendant(const fs::path& candidate, const fs::path& ancestor)
{
    const fs::path child = normalize_path(candidate);
    const fs::path parent = normalize_path(ancestor);

    auto child_it = child.begin();
    for (auto parent_it = parent.begin(); parent_it != parent.end(); ++parent_it, ++child_it) {
        if (parent_it->empty()) {
            continue;
        }
        if (child_it == child.end() || *child_it != *parent_it) {
            return false;
        }
    }
    return true;
}


std::optional<std::uint64_t> device_id(const fs::path& path)
{
    fs::path probe = normalize_path(path);
    while (true) {
#ifdef _WIN32
        std::error_code ec;
        if (fs::exists(probe, ec)) {
            const std::string root = path_to_utf8(probe.root_name());
            std::uint64_t hash = 0;
            for (unsigned char ch : root) {
                hash = hash * 131 + static_cast<std::uint64_t>(std::toupper(ch));
            }
            return hash;
        }
#else
        struct stat info{};
        if (::stat(probe.c_str(), &info) == 0) {
            return static_cast<std::uint64_t>(info.st_dev);
        }
#endif
        if (!probe.has_parent_path() || probe.parent_path() == probe) {
            return std::nullopt;
        }
        probe = probe.parent_path();
    }
}


bool entry_exists(const fs::path& path)
{
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}


std::string default_config_dir()
{
    if (const char* env = std::getenv("FILEOPS_CONFIG_DIR"); env && *env) {
        return env;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return path_to_utf8(utf8_to_path(xdg) / "fileops");
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return path_to_utf8(utf8_to_path(home) / ".config" / "fileops");
    }
    std::error_code ec;
    return path_to_utf8(fs::current_path(ec) / ".fileops");
}


std::string abbreviate_user_path(const std::string& path)
{
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return path;
    }
    const fs::path home_path = normalize_path(utf8_to_path(home));
    const fs::path target = normalize_path(utf8_to_path(path));
    if (target == home_path || !is_same_or_descendant(target, home_path)) {
        return path;
    }
    return path_to_utf8(target.lexically_relative(home_path));
}

} // namespace Utils
