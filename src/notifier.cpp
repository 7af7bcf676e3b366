#include "notifier.hpp"
#include "compact_log.hpp"
#include <thread>
#include <system_error>

namespace leakscan {

namespace {

constexpr std::string_view kTag = "Notify";

} // namespace

std::expected<void, NotifyErrorInfo> ConsoleNotifier::send_high_severity_secret_notification(
    const NotificationContext& ctx,
    const SecretFinding& finding,
    const std::string& channel)
{
    if (ctx.expired()) {
        return std::unexpected(NotifyErrorInfo{NotifyError::DeadlineExceeded, "notification deadline passed"});
    }

    std::string msg = "#" + channel + " " + std::string(to_string(finding.severity)) + " secret '" +
                      finding.rule_id + "' (" + std::string(to_string(finding.verification)) + ") in " +
                      finding.source_url + " line " + std::to_string(finding.line_number) + ": " +
                      mask_secret(finding.secret_text);
    compact::Log::warn(kTag, msg);
    return {};
}

NotificationQueue::NotificationQueue(std::shared_ptr<SecretNotifier> notifier, std::string channel,
                                     std::chrono::seconds timeout, size_t capacity)
    : state_(std::make_shared<State>())
{
    state_->notifier = std::move(notifier);
    state_->channel = std::move(channel);
    state_->timeout = timeout;
    state_->capacity = capacity;
}

NotificationQueue::~NotificationQueue() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
    }
    state_->cv.notify_all();
}

bool NotificationQueue::enqueue(SecretFinding finding) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->pending.size() >= state_->capacity) {
        lock.unlock();
        compact::Log::warn(kTag, "alert queue full, dropping alert for '" + finding.rule_id + "' in " +
                                 finding.source_url);
        return false;
    }
    state_->pending.push_back(std::move(finding));

    if (!state_->worker_running) {
        try {
            std::thread(worker, state_).detach();
            state_->worker_running = true;
        } catch (const std::system_error& e) {
            auto dropped = std::move(state_->pending.back());
            state_->pending.pop_back();
            lock.unlock();
            compact::Log::warn(kTag, std::string("cannot start notification worker, dropping alert for '") +
                                     dropped.rule_id + "': " + e.what());
            return false;
        }
    }
    lock.unlock();
    state_->cv.notify_one();
    return true;
}

void NotificationQueue::worker(std::shared_ptr<State> state) {
    for (;;) {
        SecretFinding finding;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&] { return state->closed || !state->pending.empty(); });
            if (state->pending.empty()) {
                state->worker_running = false;
                return;
            }
            finding = std::move(state->pending.front());
            state->pending.pop_front();
        }
        deliver(*state, finding);
    }
}

void NotificationQueue::deliver(State& state, const SecretFinding& finding) {
    NotificationContext ctx{std::chrono::steady_clock::now() + state.timeout, {}};
    try {
        auto sent = state.notifier->send_high_severity_secret_notification(ctx, finding, state.channel);
        if (!sent) {
            compact::Log::warn(kTag, "notification for '" + finding.rule_id + "' in " + finding.source_url +
                                     " failed: " + sent.error().message);
        } else if (std::chrono::steady_clock::now() > ctx.deadline) {
            compact::Log::warn(kTag, "notification for '" + finding.rule_id + "' overran its deadline");
        }
    } catch (const std::exception& e) {
        compact::Log::warn(kTag, "notifier threw for '" + finding.rule_id + "' in " + finding.source_url +
                                 ": " + e.what());
    }
}

} // namespace leakscan
