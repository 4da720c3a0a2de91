#include "services/notifier.hpp"
#include "runtime/worker/process.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace warden::services {

void LogNotifier::notify(const std::string& task_id, runtime::TaskStatus status,
                         const std::string& text) {
    spdlog::info("[notify] task {} {}: {}", task_id, runtime::task_status_to_string(status), text);
}

CommandNotifier::CommandNotifier(std::vector<std::string> command)
    : command_(std::move(command)) {
}

void CommandNotifier::notify(const std::string& task_id, runtime::TaskStatus status,
                             const std::string& text) {
    std::vector<std::string> argv = command_;
    argv.push_back(task_id);
    argv.push_back(runtime::task_status_to_string(status));
    argv.push_back(text);

    auto process = runtime::ProcessWorker::start(argv, "", {}, {});
    auto exit_info = process->wait();
    if (!exit_info.success()) {
        throw std::runtime_error("notifier " + command_.front() + " exited with " +
                                 std::to_string(exit_info.exit_code));
    }
}

AsyncNotifier::AsyncNotifier(std::shared_ptr<Notifier> sink, size_t max_queue)
    : sink_(std::move(sink)), max_queue_(max_queue == 0 ? 1 : max_queue) {
    worker_ = std::thread([this]() { worker_loop(); });
}

AsyncNotifier::~AsyncNotifier() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AsyncNotifier::notify(const std::string& task_id, runtime::TaskStatus status,
                           const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return;
        }
        if (queue_.size() >= max_queue_) {
            // Oldest news is the least useful
            queue_.pop_front();
            dropped_++;
            spdlog::warn("Notification queue full, dropped oldest message");
        }
        queue_.push_back(Message{task_id, status, text});
    }
    queue_cv_.notify_one();
}

void AsyncNotifier::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]() { return queue_.empty() && !busy_; });
}

void AsyncNotifier::worker_loop() {
    while (true) {
        Message message;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) {
                return;
            }
            message = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        try {
            sink_->notify(message.task_id, message.status, message.text);
            delivered_++;
        } catch (const std::exception& e) {
            failed_++;
            spdlog::warn("Notification for task {} not delivered: {}", message.task_id, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

} // namespace warden::services
