#ifndef OPERATION_NOTIFIER_HPP
#define OPERATION_NOTIFIER_HPP

#include "Operation.hpp"
#include "Types.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Callbacks a host registers to follow engine activity.
 *
 * Every member is optional. Callbacks run on the thread executing the
 * operation, which is the dispatcher worker for queued operations, while
 * that thread holds the engine lock. A callback may call back into the
 * engine on the same thread, but must not wait for another thread that
 * calls the engine.
 */
struct OperationObserver {
    std::function<void(OperationKind, const std::vector<std::string>&)> on_started;
    std::function<void(OperationKind, const std::vector<std::string>&, const std::string&)> on_completed;
    std::function<void(OperationKind, const std::vector<std::string>&, const OperationError&)> on_failed;
    std::function<void(ClipboardMode, const std::vector<std::string>&)> on_clipboard_changed;
    /// Called per processed item: (done, total, current path).
    std::function<void(std::size_t, std::size_t, const std::string&)> on_progress;
};

class OperationNotifier {
public:
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(OperationObserver observer);
    bool unsubscribe(SubscriptionId id);

    void operation_started(OperationKind kind, const std::vector<std::string>& sources) const;
    void operation_completed(OperationKind kind, const std::vector<std::string>& sources,
                             const std::string& target) const;
    void operation_failed(OperationKind kind, const std::vector<std::string>& sources,
                          const OperationError& error) const;
    void clipboard_changed(ClipboardMode mode, const std::vector<std::string>& paths) const;
    void progress(std::size_t done, std::size_t total, const std::string& current) const;

private:
    std::vector<std::pair<SubscriptionId, OperationObserver>> snapshot() const;

    mutable std::mutex mutex_;
    std::vector<std::pair<SubscriptionId, OperationObserver>> observers_;
    SubscriptionId next_id_{1};
};

#endif
