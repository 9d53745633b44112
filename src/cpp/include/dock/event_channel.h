#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "events.h"

namespace dock {

using json = nlohmann::json;

struct Event {
    std::string name;
    json data;

    // "event: <name>\ndata: <json>\n\n"
    std::string to_sse() const;
};

// Hands events from a worker thread to the thread that delivers them.
// The producer writes through the IEventSink interface and calls close()
// when the operation is over; the consumer drains with pop().
class EventChannel : public IEventSink {
public:
    bool on_install_progress(const InstallProgress& progress) override;
    bool on_chat_token(const ChatToken& token) override;
    void on_chat_finished(const ChatFinished& finished) override;

    // Producer side
    bool push(const std::string& name, const json& data);
    void push_error(const json& error);
    void close();

    // True once a terminal install-progress or a chat-finished has been pushed
    bool terminal_sent() const;

    // Consumer side. Blocks until an event is available; false once the
    // channel is closed and drained.
    bool pop(Event& event);

    // The consumer went away; further pushes are refused so the producer stops
    void cancel();
    bool is_cancelled() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool closed_ = false;
    bool cancelled_ = false;
    bool terminal_sent_ = false;
};

} // namespace dock
