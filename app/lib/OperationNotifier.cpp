#include "OperationNotifier.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <exception>

namespace {

// A throwing observer must not abort the file operation that notified it.
template <typename Callback, typename... Args>
void invoke_guarded(const Callback& callback, const char* event, Args&&... args)
{
    if (!callback) {
        return;
    }
    try {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Observer threw during '{}': {}", event, ex.what());
        }
    }
}

} // namespace


OperationNotifier::SubscriptionId OperationNotifier::subscribe(OperationObserver observer)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const SubscriptionId id = next_id_++;
    observers_.emplace_back(id, std::move(observer));
    return id;
}


bool OperationNotifier::unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::find_if(observers_.begin(), observers_.end(),
                                 [id](const auto& entry) { return entry.first == id; });
    if (it == observers_.end()) {
        return false;
    }
    observers_.erase(it);
    return true;
}


std::vector<std::pair<OperationNotifier::SubscriptionId, OperationObserver>> OperationNotifier::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_;
}


void OperationNotifier::operation_started(OperationKind kind, const std::vector<std::string>& sources) const
{
    for (const auto& [id, observer] : snapshot()) {
        invoke_guarded(observer.on_started, "operation_started", kind, sources);
    }
}


void OperationNotifier::operation_completed(OperationKind kind, const std::vector<std::string>& sources,
                                            const std::string& target) const
{
    for (const auto& [id, observer] : snapshot()) {
        invoke_guarded(observer.on_completed, "operation_completed", kind, sources, target);
    }
}


void OperationNotifier::operation_failed(OperationKind kind, const std::vector<std::string>& sources,
                                         const OperationError& error) const
{
    for (const auto& [id, observer] : snapshot()) {
        invoke_guarded(observer.on_failed, "operation_failed", kind, sources, error);
    }
}


void OperationNotifier::clipboard_changed(ClipboardMode mode, const std::vector<std::string>& paths) const
{
    for (const auto& [id, observer] : snapshot()) {
        invoke_guarded(observer.on_clipboard_changed, "clipboard_changed", mode, paths);
    }
}


void OperationNotifier::progress(std::size_t done, std::size_t total, const std::string& current) const
{
    for (const auto& [id, observer] : snapshot()) {
        invoke_guarded(observer.on_progress, "progress", done, total, current);
    }
}
