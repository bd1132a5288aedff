#ifndef DROP_RESOLVER_HPP
#define DROP_RESOLVER_HPP

#include "Operation.hpp"
#include "Types.hpp"

#include <functional>
#include <string>
#include <vector>

class OperationEngine;

struct DropDecision {
    DropAction action{DropAction::None};
    std::vector<std::string> sources;   ///< Dragged paths that will actually be dispatched.
    std::string target_dir;
    std::string reason;
    bool redirected{false};             ///< Target moved out of a dragged subtree.
    std::function<OperationResult()> engine_call; ///< Empty when action is None.
};

/**
 * @brief Turns a drag-and-drop gesture into one engine operation.
 *
 * An explicit copy, move or link request is honored. Auto picks move when
 * every source lives on the target's volume and copy otherwise. A drop onto a
 * dragged item or into its subtree never moves: the item is left out, and a
 * copy or link is redirected to the dragged item's parent instead.
 */
class DropResolver {
public:
    explicit DropResolver(OperationEngine& engine);

    DropDecision resolve(const std::vector<std::string>& dragged_paths,
                         const std::string& target_path,
                         DropAction requested_action) const;

    // Runs the decision's engine call; a None decision succeeds without touching anything.
    OperationResult execute(const DropDecision& decision) const;

    OperationResult drop(const std::vector<std::string>& dragged_paths,
                         const std::string& target_path,
                         DropAction requested_action) const;

private:
    DropAction infer_action(const std::vector<std::string>& sources, const std::string& target_dir) const;
    void bind_engine_call(DropDecision& decision) const;

    OperationEngine& engine_;
};

#endif
