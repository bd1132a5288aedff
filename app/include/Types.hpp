#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

enum class FileType {File, Directory, Symlink};

inline std::string to_string(FileType type) {
    switch (type) {
        case FileType::File: return "File";
        case FileType::Directory: return "Directory";
        case FileType::Symlink: return "Symlink";
        default: return "Unknown";
    }
}

struct FileEntry {
    std::string full_path;
    std::string file_name;
    FileType type;
};

enum class FileScanOptions {
    None        = 0,
    Files       = 1 << 0,   // 0001
    Directories = 1 << 1,   // 0010
    HiddenFiles = 1 << 2,   // 0100
    Symlinks    = 1 << 3    // 1000
};

constexpr bool has_flag(FileScanOptions value, FileScanOptions flag) {
    return (static_cast<int>(value) & static_cast<int>(flag)) != 0;
}

constexpr FileScanOptions operator|(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) | static_cast<int>(b));
}

constexpr FileScanOptions operator&(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) & static_cast<int>(b));
}

constexpr FileScanOptions kAllEntries =
    FileScanOptions::Files | FileScanOptions::Directories |
    FileScanOptions::HiddenFiles | FileScanOptions::Symlinks;

enum class OperationKind {
    Copy,
    Move,
    Delete,
    Rename,
    CreateFile,
    CreateDirectory,
    Duplicate,
    Link ///< Symbolic links created by a link drop.
};

inline std::string to_string(OperationKind kind) {
    switch (kind) {
        case OperationKind::Copy: return "copy";
        case OperationKind::Move: return "move";
        case OperationKind::Delete: return "delete";
        case OperationKind::Rename: return "rename";
        case OperationKind::CreateFile: return "create_file";
        case OperationKind::CreateDirectory: return "create_directory";
        case OperationKind::Duplicate: return "duplicate";
        case OperationKind::Link: return "link";
        default: return "unknown";
    }
}

enum class ClipboardMode {Empty, Copy, Cut};

inline std::string to_string(ClipboardMode mode) {
    switch (mode) {
        case ClipboardMode::Copy: return "copy";
        case ClipboardMode::Cut: return "cut";
        default: return "empty";
    }
}

/**
 * @brief Drag-and-drop intent. Auto lets the resolver infer copy or move.
 */
enum class DropAction {None, Auto, Copy, Move, Link};

inline std::string to_string(DropAction action) {
    switch (action) {
        case DropAction::None: return "none";
        case DropAction::Auto: return "auto";
        case DropAction::Copy: return "copy";
        case DropAction::Move: return "move";
        case DropAction::Link: return "link";
        default: return "unknown";
    }
}

struct NumberingConfig {
    std::string name_template{"{name}_{number:05d}{ext}"};
    int digit_width{5};
    std::uint64_t rollover_threshold{99999};
    std::uint64_t start_number{1};
};

struct HistoryConfig {
    std::size_t max_size{100};
    bool merge_enabled{false};
    std::chrono::milliseconds merge_window{1000};
};

struct EngineConfig {
    NumberingConfig numbering;
    HistoryConfig history;
    std::string trash_dir;
    std::string state_file;
    std::size_t history_snapshot_size{20};
};

#endif
