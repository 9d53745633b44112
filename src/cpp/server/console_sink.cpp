#include "dock/console_sink.h"
#include <iomanip>

namespace dock {

bool ConsoleEventSink::on_install_progress(const InstallProgress& progress) {
    if (line_open_ && progress.status != last_status_) {
        out_ << "\n";
        line_open_ = false;
    }
    last_status_ = progress.status;

    if (progress.is_terminal()) {
        if (line_open_) {
            out_ << "\n";
            line_open_ = false;
        }
        out_ << "[" << progress.model_id << "] " << install_status_to_string(progress.status)
             << ": " << progress.message << std::endl;
        return true;
    }

    out_ << "\r[" << progress.model_id << "] " << std::left << std::setw(16)
         << install_status_to_string(progress.status);
    if (!progress.indeterminate) {
        out_ << std::right << std::setw(3) << progress.progress << "% ";
    }
    // Trailing spaces clear what a longer previous line left behind
    out_ << progress.message << "          " << std::flush;
    line_open_ = true;
    return !is_interrupted();
}

bool ConsoleEventSink::on_chat_token(const ChatToken& token) {
    out_ << token.token << std::flush;
    return !is_interrupted();
}

void ConsoleEventSink::on_chat_finished(const ChatFinished& finished) {
    out_ << std::endl;
    if (verbose_) {
        out_ << "[finished: " << finish_reason_to_string(finished.reason) << ", "
             << finished.tokens << " tokens]" << std::endl;
    }
}

} // namespace dock
