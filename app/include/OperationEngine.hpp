#ifndef OPERATION_ENGINE_HPP
#define OPERATION_ENGINE_HPP

#include "ClipboardState.hpp"
#include "FileScanner.hpp"
#include "HistoryManager.hpp"
#include "NumberingService.hpp"
#include "Operation.hpp"
#include "OperationNotifier.hpp"
#include "TrashStore.hpp"
#include "Types.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

/**
 * @brief Validates, executes and records every mutating file operation.
 *
 * Each public operation runs under one engine-wide lock, emits a start
 * notification, executes per item without aborting on the first failure,
 * records the succeeded part in history and emits completed or failed.
 * Per-item failures are reported in the OperationResult; nothing here throws
 * for file system errors.
 */
class OperationEngine {
public:
    explicit OperationEngine(EngineConfig config = {});

    OperationEngine(const OperationEngine&) = delete;
    OperationEngine& operator=(const OperationEngine&) = delete;

    /**
     * @brief Copies each source into @p target_dir.
     *
     * A name collision is resolved with a numbered name; the existing entry is
     * never overwritten. Modification times are preserved where possible.
     */
    OperationResult copy(const std::vector<std::string>& paths, const std::string& target_dir);

    /**
     * @brief Moves each source into @p target_dir with the same collision policy as copy.
     *
     * Sources already inside @p target_dir are skipped with a warning. Moving a
     * directory into itself or its own subtree fails with SELF_NESTING.
     */
    OperationResult move(const std::vector<std::string>& paths, const std::string& target_dir);

    /**
     * @brief Deletes the given entries.
     *
     * A non-permanent delete relocates into the trash and is undoable. A
     * permanent delete is irreversible and, for directories or multi-item
     * selections, requires @p confirmed; otherwise it fails with
     * CONFIRMATION_REQUIRED without touching anything.
     */
    OperationResult delete_items(const std::vector<std::string>& paths, bool permanent,
                                 bool confirmed = false);

    // Collisions fail with NAME_CONFLICT; the chosen name is never adjusted.
    OperationResult rename(const std::string& path, const std::string& new_name);

    // Copies @p path next to itself under the next numbered name.
    OperationResult duplicate(const std::string& path);

    OperationResult create_file(const std::string& parent_dir, const std::string& name);
    OperationResult create_directory(const std::string& parent_dir, const std::string& name);

    // Creates symbolic links to each source inside @p target_dir.
    OperationResult link(const std::vector<std::string>& paths, const std::string& target_dir);

    /**
     * @brief Applies the clipboard to @p target_dir.
     *
     * Copy mode leaves the clipboard intact. Cut mode clears it once every
     * source has moved; after a partial move only the unmoved sources remain.
     */
    OperationResult paste(const std::string& target_dir);

    // Fill the clipboard with the existing subset of paths (FILE_NOT_FOUND when none exist).
    OperationResult copy_to_clipboard(const std::vector<std::string>& paths);
    OperationResult cut_to_clipboard(const std::vector<std::string>& paths);
    void clear_clipboard();
    ClipboardContents clipboard() const;
    bool can_paste(const std::string& target_dir) const;

    /**
     * @brief Reverses the newest history entry on disk.
     *
     * When the file system no longer matches the recorded outcome the entry is
     * dropped and HISTORY_DIVERGED is returned; the rest of the history stays.
     */
    OperationResult undo();
    OperationResult redo();

    bool can_undo() const;
    bool can_redo() const;
    std::optional<std::string> undo_description() const;
    std::optional<std::string> redo_description() const;
    std::vector<Operation> undo_history() const;
    void clear_history();

    // Persisted descriptions from earlier sessions followed by this session's, newest last.
    std::vector<std::string> history_snapshot(std::size_t limit) const;
    void restore_history_snapshot(std::vector<std::string> descriptions);

    std::vector<NumberingRecord> numbering_records() const;
    void seed_numbering(const std::vector<NumberingRecord>& records);

    OperationNotifier::SubscriptionId subscribe(OperationObserver observer);
    bool unsubscribe(OperationNotifier::SubscriptionId id);

    // Cooperative: checked before each file; the running operation rolls back.
    // Ignored while idle, unless a task window is open.
    void request_cancel();
    bool is_busy() const;

    /**
     * @brief Opens a window for one queued task.
     *
     * A cancel requested between begin_task() and end_task() stays pending
     * until the operation inside the window picks it up, even when it arrives
     * before that operation has started.
     */
    void begin_task();
    void end_task();

    const EngineConfig& config() const { return config_; }

private:
    enum class StepStatus {Done, Failed, Cancelled};

    class BusyScope {
    public:
        explicit BusyScope(OperationEngine& engine);
        ~BusyScope();
        BusyScope(const BusyScope&) = delete;
        BusyScope& operator=(const BusyScope&) = delete;
    private:
        OperationEngine& engine_;
    };

    using Body = std::function<OperationResult()>;
    OperationResult run_operation(OperationKind kind,
                                  const std::vector<std::string>& sources,
                                  const std::string& target,
                                  const Body& body);

    OperationResult copy_items(OperationKind kind,
                               const std::vector<std::string>& paths,
                               const std::string& target_dir);
    OperationResult move_items(const std::vector<std::string>& paths, const std::string& target_dir);
    OperationResult create_entry(OperationKind kind, const std::string& parent_dir,
                                 const std::string& name);
    OperationResult set_clipboard(const std::vector<std::string>& paths, bool cut);

    StepStatus copy_entry(const std::filesystem::path& from, const std::filesystem::path& to,
                          std::error_code& ec);
    StepStatus transfer_entry(const std::filesystem::path& from, const std::filesystem::path& to,
                              std::error_code& ec);
    std::filesystem::path destination_for(const std::filesystem::path& source,
                                          const std::filesystem::path& target_dir);
    bool validate_target_dir(const std::string& target_dir, OperationResult& result) const;

    void roll_back_created(const std::vector<PathPair>& entries, OperationResult& result);
    void roll_back_moved(const std::vector<PathPair>& entries, OperationResult& result);
    void restore_from_trash(const std::vector<PathPair>& entries, OperationResult& result);

    std::optional<OperationError> check_undoable(const Operation& operation) const;
    std::optional<OperationError> check_redoable(const Operation& operation) const;
    void reverse(const Operation& operation, OperationResult& result);
    void replay(const Operation& operation, OperationResult& result);

    bool cancelled() const { return cancel_requested_.load(); }
    void report_progress(std::size_t done, std::size_t total, const std::string& current) const;

    EngineConfig config_;
    NumberingService numbering_;
    HistoryManager history_;
    ClipboardState clipboard_;
    TrashStore trash_;
    FileScanner scanner_;
    OperationNotifier notifier_;
    std::vector<std::string> persisted_history_;

    mutable std::recursive_mutex mutex_;
    std::atomic<bool> cancel_requested_{false};
    std::atomic<int> busy_depth_{0};
    std::atomic<bool> task_open_{false};
};

#endif
