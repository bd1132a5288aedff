#include "OperationDispatcher.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "OperationEngine.hpp"

#include <exception>


OperationDispatcher::OperationDispatcher(OperationEngine& engine)
    : engine_(engine),
      worker_([this] { run(); })
{
}


OperationDispatcher::~OperationDispatcher()
{
    shutdown();
}


std::future<OperationResult> OperationDispatcher::submit(Task task)
{
    std::future<OperationResult> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            THROW_APP_ERROR(ErrorCodes::Code::DISPATCHER_STOPPED, "");
        }
        PendingTask pending{std::move(task), std::promise<OperationResult>()};
        future = pending.promise.get_future();
        queue_.push_back(std::move(pending));
    }
    queue_cv_.notify_one();
    return future;
}


std::size_t OperationDispatcher::drain(ErrorCodes::Code code, const std::string& message)
{
    std::deque<PendingTask> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(queue_);
    }
    return complete_all(dropped, code, message);
}


std::size_t OperationDispatcher::complete_all(std::deque<PendingTask>& tasks, ErrorCodes::Code code,
                                              const std::string& message)
{
    for (auto& pending : tasks) {
        pending.promise.set_value(OperationResult::failure(code, std::string(), message));
    }
    return tasks.size();
}


std::size_t OperationDispatcher::cancel_all()
{
    std::deque<PendingTask> dropped_tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped_tasks.swap(queue_);
        if (running_task_) {
            engine_.request_cancel();
        }
    }
    const std::size_t dropped = complete_all(dropped_tasks, ErrorCodes::Code::CANCELLED,
                                             "Cancelled before it started");
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Cancelled {} queued operation(s)", dropped);
    }
    return dropped;
}


void OperationDispatcher::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    drain(ErrorCodes::Code::DISPATCHER_STOPPED, "Dispatcher stopped");
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}


std::size_t OperationDispatcher::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}


bool OperationDispatcher::is_idle() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty() && !running_task_;
}


void OperationDispatcher::run()
{
    while (true) {
        PendingTask pending;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            pending = std::move(queue_.front());
            queue_.pop_front();
            running_task_ = true;
            // Opened under the queue lock so cancel_all() cannot slip between dequeue and start.
            engine_.begin_task();
        }

        try {
            pending.promise.set_value(pending.task(engine_));
        } catch (const std::exception& ex) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->error("Queued operation threw: {}", ex.what());
            }
            pending.promise.set_exception(std::current_exception());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        engine_.end_task();
        running_task_ = false;
    }
}
