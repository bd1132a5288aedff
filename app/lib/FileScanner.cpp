#include "FileScanner.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <filesystem>
#include <optional>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

struct FileScanner::ScanContext {
    bool include_files{false};
    bool include_directories{false};
    bool include_hidden{false};
    bool include_symlinks{false};
    std::shared_ptr<spdlog::logger> logger;
};

std::vector<FileEntry>
FileScanner::get_directory_entries(const std::string &directory_path,
                                   FileScanOptions options) const
{
    std::vector<FileEntry> entries;
    auto logger = Logger::get_logger("core_logger");

    if (logger) {
        logger->trace("Scanning directory '{}' with options mask {}", directory_path, static_cast<int>(options));
    }

    ScanContext context;
    context.include_files = has_flag(options, FileScanOptions::Files);
    context.include_directories = has_flag(options, FileScanOptions::Directories);
    context.include_hidden = has_flag(options, FileScanOptions::HiddenFiles);
    context.include_symlinks = has_flag(options, FileScanOptions::Symlinks);
    context.logger = logger;

    try {
        const fs::path scan_path = Utils::utf8_to_path(directory_path);
        for (const auto &entry : fs::directory_iterator(scan_path)) {
            if (auto entry_info = build_entry(entry, context)) {
                entries.push_back(std::move(*entry_info));
            }
        }
    } catch (const fs::filesystem_error& ex) {
        if (logger) {
            logger->warn("Error while scanning '{}': {}", directory_path, ex.what());
        }
        throw;
    }

    std::sort(entries.begin(), entries.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.file_name < b.file_name; });
    return entries;
}


std::vector<std::string> FileScanner::list_names(const std::string& directory_path) const
{
    std::vector<std::string> names;
    for (auto& entry : get_directory_entries(directory_path, kAllEntries)) {
        names.push_back(std::move(entry.file_name));
    }
    return names;
}


bool FileScanner::is_file_hidden(const fs::path &path) const {
#ifdef _WIN32
    DWORD attrs = GetFileAttributesW(path.c_str());
    return (attrs != INVALID_FILE_ATTRIBUTES) &&
           (attrs & FILE_ATTRIBUTE_HIDDEN);
#else
    return path.filename().string().starts_with(".");
#endif
}


std::optional<FileEntry> FileScanner::build_entry(const fs::directory_entry& entry,
                                                  const ScanContext& context) const
{
    const fs::path& entry_path = entry.path();
    std::string full_path = Utils::path_to_utf8(entry_path);
    std::string file_name = Utils::path_to_utf8(entry_path.filename());

    if (is_file_hidden(entry_path) && !context.include_hidden) {
        if (context.logger) {
            context.logger->trace("Skipping hidden entry '{}'", full_path);
        }
        return std::nullopt;
    }

    if (auto type = classify_entry(entry, context)) {
        return FileEntry{std::move(full_path), std::move(file_name), *type};
    }
    return std::nullopt;
}


std::optional<FileType> FileScanner::classify_entry(const fs::directory_entry& entry,
                                                    const ScanContext& context) const
{
    std::error_code ec;
    if (entry.is_symlink(ec)) {
        if (context.include_symlinks) {
            return FileType::Symlink;
        }
        return std::nullopt;
    }

    if (context.include_directories && entry.is_directory(ec)) {
        return FileType::Directory;
    }

    // Sockets, fifos and devices are treated as files so that they are never silently skipped.
    if (context.include_files && !entry.is_directory(ec)) {
        return FileType::File;
    }

    return std::nullopt;
}
