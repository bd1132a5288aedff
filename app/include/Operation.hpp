#ifndef OPERATION_HPP
#define OPERATION_HPP

#include "ErrorCode.hpp"
#include "Types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One reversible step: `from` is the pre-operation location, `to` the post-operation one.
 *
 * Copy, duplicate and link record (source, created). Move and rename record
 * (original, new). Delete records (original, trash location). Create records
 * ("", created).
 */
struct PathPair {
    std::string from;
    std::string to;

    bool operator==(const PathPair&) const = default;
};

struct UndoPayload {
    std::vector<PathPair> entries;
    std::string original_name; ///< Rename only.

    bool empty() const { return entries.empty(); }
};

/**
 * @brief Immutable record of one executed mutation.
 *
 * The description is derived from the other fields at construction time.
 */
class Operation {
public:
    using Clock = std::chrono::steady_clock;

    Operation(OperationKind kind,
              std::vector<std::string> source_paths,
              std::optional<std::string> target_path,
              bool undoable,
              UndoPayload undo_payload,
              Clock::time_point timestamp = Clock::now());

    OperationKind kind() const { return kind_; }
    const std::vector<std::string>& source_paths() const { return source_paths_; }
    const std::optional<std::string>& target_path() const { return target_path_; }
    Clock::time_point timestamp() const { return timestamp_; }
    bool undoable() const { return undoable_; }
    const UndoPayload& undo_payload() const { return undo_payload_; }
    const std::string& description() const { return description_; }

    // Net effect of two consecutive renames of the same item.
    static Operation merge_renames(const Operation& first, const Operation& second);

private:
    OperationKind kind_;
    std::vector<std::string> source_paths_;
    std::optional<std::string> target_path_;
    Clock::time_point timestamp_;
    bool undoable_;
    UndoPayload undo_payload_;
    std::string description_;
};

std::string describe(OperationKind kind,
                     const std::vector<std::string>& source_paths,
                     const std::optional<std::string>& target_path);

struct OperationError {
    ErrorCodes::Code code{ErrorCodes::Code::UNKNOWN_ERROR};
    std::string path;
    std::string message;
};

struct OperationResult {
    bool success{false};
    std::vector<std::string> result_paths;
    std::vector<OperationError> errors;
    std::vector<std::string> warnings;
    std::optional<Operation> operation; ///< The recorded or executed step, when one was produced.

    bool has_error(ErrorCodes::Code code) const;
    void add_error(ErrorCodes::Code code, const std::string& path, const std::string& message = "");

    static OperationResult failure(ErrorCodes::Code code, const std::string& path,
                                   const std::string& message = "");
};

#endif
