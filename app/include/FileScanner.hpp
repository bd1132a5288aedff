#ifndef FILE_SCANNER_HPP
#define FILE_SCANNER_HPP

#include <filesystem>
#include <string>
#include <vector>
#include <optional>
#include "Types.hpp"

namespace fs = std::filesystem;

class FileScanner {
public:
    FileScanner() = default;

    // Lists the direct children of directory_path. Throws fs::filesystem_error
    // when the directory cannot be opened.
    std::vector<FileEntry>
        get_directory_entries(const std::string &directory_path,
                              FileScanOptions options) const;

    // Names of the direct children, hidden entries included.
    std::vector<std::string> list_names(const std::string& directory_path) const;

private:
    struct ScanContext;
    std::optional<FileEntry> build_entry(const fs::directory_entry& entry,
                                         const ScanContext& context) const;
    std::optional<FileType> classify_entry(const fs::directory_entry& entry,
                                           const ScanContext& context) const;
    bool is_file_hidden(const fs::path &path) const;
};

#endif
