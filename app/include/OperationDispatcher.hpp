#ifndef OPERATION_DISPATCHER_HPP
#define OPERATION_DISPATCHER_HPP

#include "Operation.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

class OperationEngine;

/**
 * @brief Runs engine calls one at a time on a single worker thread.
 *
 * Tasks execute in submission order, so two mutations never interleave.
 * Results and exceptions are delivered through the returned future.
 */
class OperationDispatcher {
public:
    using Task = std::function<OperationResult(OperationEngine&)>;

    explicit OperationDispatcher(OperationEngine& engine);
    ~OperationDispatcher();

    OperationDispatcher(const OperationDispatcher&) = delete;
    OperationDispatcher& operator=(const OperationDispatcher&) = delete;

    // Throws AppException(DISPATCHER_STOPPED) after shutdown().
    std::future<OperationResult> submit(Task task);

    /**
     * @brief Completes every queued task with CANCELLED and asks the running one to stop.
     * @return Number of queued tasks that were dropped.
     */
    std::size_t cancel_all();

    // Drops queued tasks with DISPATCHER_STOPPED, lets the running one finish and joins.
    void shutdown();

    std::size_t pending() const;
    bool is_idle() const;

private:
    struct PendingTask {
        Task task;
        std::promise<OperationResult> promise;
    };

    void run();
    std::size_t drain(ErrorCodes::Code code, const std::string& message);
    static std::size_t complete_all(std::deque<PendingTask>& tasks, ErrorCodes::Code code,
                                    const std::string& message);

    OperationEngine& engine_;
    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::deque<PendingTask> queue_;
    bool stopping_{false};
    bool running_task_{false};
    std::thread worker_;
};

#endif
