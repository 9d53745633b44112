#include "dock/event_channel.h"

namespace dock {

std::string Event::to_sse() const {
    return "event: " + name + "\ndata: " + data.dump() + "\n\n";
}

bool EventChannel::on_install_progress(const InstallProgress& progress) {
    if (progress.is_terminal()) {
        std::lock_guard<std::mutex> lock(mutex_);
        terminal_sent_ = true;
    }
    return push(EVENT_INSTALL_PROGRESS, progress);
}

bool EventChannel::on_chat_token(const ChatToken& token) {
    return push(EVENT_CHAT_TOKEN, token);
}

void EventChannel::on_chat_finished(const ChatFinished& finished) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        terminal_sent_ = true;
    }
    push(EVENT_CHAT_FINISHED, finished);
}

bool EventChannel::push(const std::string& name, const json& data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || closed_) {
            return false;
        }
        queue_.push_back(Event{name, data});
    }
    cv_.notify_one();
    return true;
}

void EventChannel::push_error(const json& error) {
    push("error", error);
}

bool EventChannel::terminal_sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_sent_;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventChannel::pop(Event& event) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void EventChannel::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        queue_.clear();
    }
    cv_.notify_all();
}

bool EventChannel::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

} // namespace dock
