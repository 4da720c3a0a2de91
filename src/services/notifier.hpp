#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "runtime/task/types.hpp"

namespace warden::services {

// Delivers human-readable task status to an operator channel
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& task_id, runtime::TaskStatus status,
                        const std::string& text) = 0;
};

// Writes notifications to the log
class LogNotifier : public Notifier {
public:
    void notify(const std::string& task_id, runtime::TaskStatus status,
                const std::string& text) override;
};

// Runs <command...> <task_id> <status> <text>; throws on non-zero exit.
// The channel script owns the wire format.
class CommandNotifier : public Notifier {
public:
    explicit CommandNotifier(std::vector<std::string> command);

    void notify(const std::string& task_id, runtime::TaskStatus status,
                const std::string& text) override;

private:
    std::vector<std::string> command_;
};

// Fire-and-forget wrapper: notify() only enqueues; a background thread
// delivers. Delivery failures are logged and counted, never propagated.
class AsyncNotifier : public Notifier {
public:
    explicit AsyncNotifier(std::shared_ptr<Notifier> sink, size_t max_queue = 256);
    ~AsyncNotifier() override;

    AsyncNotifier(const AsyncNotifier&) = delete;
    AsyncNotifier& operator=(const AsyncNotifier&) = delete;

    void notify(const std::string& task_id, runtime::TaskStatus status,
                const std::string& text) override;

    // Block until everything queued so far was attempted
    void flush();

    uint64_t delivered() const { return delivered_; }
    uint64_t failed() const { return failed_; }
    uint64_t dropped() const { return dropped_; }

private:
    struct Message {
        std::string task_id;
        runtime::TaskStatus status;
        std::string text;
    };

    void worker_loop();

    std::shared_ptr<Notifier> sink_;
    size_t max_queue_;

    std::deque<Message> queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    bool busy_ = false;
    std::atomic<bool> stopping_{false};
    std::thread worker_;

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace warden::services
