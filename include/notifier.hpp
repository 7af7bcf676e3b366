#pragma once

#include "secret_finding.hpp"
#include <string>
#include <chrono>
#include <expected>
#include <stop_token>
#include <memory>
#include <deque>
#include <mutex>
#include <condition_variable>

namespace leakscan {

struct NotificationContext {
    std::chrono::steady_clock::time_point deadline;
    std::stop_token stop;

    bool expired() const {
        return stop.stop_requested() || std::chrono::steady_clock::now() >= deadline;
    }
};

enum class NotifyError {
    DeliveryFailed,
    DeadlineExceeded
};

struct NotifyErrorInfo {
    NotifyError error;
    std::string message;
};

// Notification collaborator. Called from a NotificationQueue worker thread,
// never from the scanning thread.
class SecretNotifier {
public:
    virtual ~SecretNotifier() = default;

    virtual std::expected<void, NotifyErrorInfo> send_high_severity_secret_notification(
        const NotificationContext& ctx,
        const SecretFinding& finding,
        const std::string& channel
    ) = 0;
};

// Writes the alert to the log
class ConsoleNotifier : public SecretNotifier {
public:
    std::expected<void, NotifyErrorInfo> send_high_severity_secret_notification(
        const NotificationContext& ctx,
        const SecretFinding& finding,
        const std::string& channel
    ) override;
};

// Pending alerts for one notifier, delivered in order by a single worker
// thread. Beyond `capacity` queued alerts, new ones are dropped and logged.
// The worker is started on the first alert; after the queue is destroyed it
// finishes what is already queued and exits on its own.
class NotificationQueue {
public:
    static constexpr size_t kDefaultCapacity = 256;

    NotificationQueue(std::shared_ptr<SecretNotifier> notifier, std::string channel,
                      std::chrono::seconds timeout, size_t capacity = kDefaultCapacity);
    ~NotificationQueue();

    NotificationQueue(const NotificationQueue&) = delete;
    NotificationQueue& operator=(const NotificationQueue&) = delete;

    // False when the alert was dropped (queue full or no worker available)
    bool enqueue(SecretFinding finding);

private:
    struct State {
        std::shared_ptr<SecretNotifier> notifier;
        std::string channel;
        std::chrono::seconds timeout;
        size_t capacity;

        std::mutex mutex;
        std::condition_variable cv;
        std::deque<SecretFinding> pending;
        bool closed = false;
        bool worker_running = false;
    };

    std::shared_ptr<State> state_;

    static void worker(std::shared_ptr<State> state);
    static void deliver(State& state, const SecretFinding& finding);
};

} // namespace leakscan
