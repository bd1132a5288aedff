#ifndef HISTORY_MANAGER_HPP
#define HISTORY_MANAGER_HPP

#include "Operation.hpp"
#include "Types.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Bounded undo/redo stacks over recorded operations.
 *
 * The manager only moves records between the stacks; the caller reverses or
 * replays the file system effect from the undo payload.
 */
class HistoryManager {
public:
    explicit HistoryManager(HistoryConfig config = {});

    /**
     * @brief Pushes a succeeded operation and clears the redo stack.
     *
     * Non-undoable operations are ignored. The oldest entry is evicted when the
     * undo stack exceeds max_size.
     * @return False when the operation was not recorded.
     */
    bool record(const Operation& operation);

    std::optional<Operation> undo();
    std::optional<Operation> redo();

    std::optional<Operation> peek_undo() const;
    std::optional<Operation> peek_redo() const;

    // Drops the next entry without moving it; used when it can no longer be applied.
    std::optional<Operation> discard_next_undo();
    std::optional<Operation> discard_next_redo();

    bool can_undo() const { return !undo_stack_.empty(); }
    bool can_redo() const { return !redo_stack_.empty(); }
    std::size_t undo_size() const { return undo_stack_.size(); }
    std::size_t redo_size() const { return redo_stack_.size(); }

    // Oldest first.
    std::vector<Operation> undo_history() const;
    std::vector<Operation> redo_history() const;

    // Descriptions of the newest `limit` undo entries, oldest first.
    std::vector<std::string> recent_descriptions(std::size_t limit) const;

    void clear();

    const HistoryConfig& config() const { return config_; }

private:
    bool try_merge(const Operation& operation);

    HistoryConfig config_;
    std::deque<Operation> undo_stack_;
    std::deque<Operation> redo_stack_;
};

#endif
