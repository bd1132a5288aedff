#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace Utils {

std::filesystem::path utf8_to_path(const std::string& value);
std::string path_to_utf8(const std::filesystem::path& path);

// Absolute, lexically normalized form without a trailing separator.
std::filesystem::path normalize_path(const std::filesystem::path& path);

// True when candidate is ancestor itself or lies below it (lexical check on normalized paths).
bool is_same_or_descendant(const std::filesystem::path& candidate,
                           const std::filesystem::path& ancestor);

// Device id of the nearest existing ancestor, or nullopt when none can be stat'ed.
std::optional<std::uint64_t> device_id(const std::filesystem::path& path);

bool entry_exists(const std::filesystem::path& path);

std::string default_config_dir();

std::string abbreviate_user_path(const std::string& path);

} // namespace Utils

#endif
