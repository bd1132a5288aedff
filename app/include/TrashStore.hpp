#ifndef TRASH_STORE_HPP
#define TRASH_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

/**
 * @brief Recoverable-delete area backing non-permanent deletes.
 *
 * Items are relocated into one flat directory under a unique name. The store
 * keeps no index of its own; the caller holds (original, trash) pairs in the
 * operation's undo payload.
 */
class TrashStore {
public:
    explicit TrashStore(std::string trash_dir);

    /**
     * @brief Moves @p path into the trash directory.
     * @return The trash location, or nullopt with @p ec set on failure.
     */
    std::optional<std::string> move_to_trash(const std::string& path, std::error_code& ec);

    /**
     * @brief Moves a trashed item back to @p original_path, recreating missing parents.
     * Fails with EEXIST when something already occupies the original location.
     */
    bool restore(const std::string& trash_path, const std::string& original_path,
                 std::error_code& ec);

    /**
     * @brief Renames @p from to @p to; falls back to copy and remove across devices.
     */
    static bool relocate(const std::filesystem::path& from, const std::filesystem::path& to,
                         std::error_code& ec);

    const std::string& directory() const { return trash_dir_; }

private:
    std::filesystem::path unique_slot(const std::filesystem::path& source);

    std::string trash_dir_;
    std::uint64_t sequence_{0};
};

#endif
