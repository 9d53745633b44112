#pragma once

#include <atomic>
#include <iostream>
#include "events.h"

namespace dock {

// Renders events on a terminal: an in-place progress line for installs and the
// raw token stream for generations. Once *interrupted turns true the sink
// refuses further events so the running install or generation stops.
class ConsoleEventSink : public IEventSink {
public:
    explicit ConsoleEventSink(std::ostream& out = std::cout, bool verbose = false,
                              const std::atomic<bool>* interrupted = nullptr)
        : out_(out), verbose_(verbose), interrupted_(interrupted) {}

    bool on_install_progress(const InstallProgress& progress) override;
    bool on_chat_token(const ChatToken& token) override;
    void on_chat_finished(const ChatFinished& finished) override;

private:
    bool is_interrupted() const { return interrupted_ && interrupted_->load(); }

    std::ostream& out_;
    bool verbose_;
    const std::atomic<bool>* interrupted_;
    bool line_open_ = false;
    InstallStatus last_status_ = InstallStatus::DOWNLOADING;
};

} // namespace dock
