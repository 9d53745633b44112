#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace dock {

using json = nlohmann::json;

// Event names as seen by the host
constexpr const char* EVENT_INSTALL_PROGRESS = "install-progress";
constexpr const char* EVENT_CHAT_TOKEN = "chat-token";
constexpr const char* EVENT_CHAT_FINISHED = "chat-finished";

enum class InstallStatus {
    DOWNLOADING,
    INSTALLING_DEPS,
    COMPLETED,
    ERROR
};

std::string install_status_to_string(InstallStatus status);

struct InstallProgress {
    std::string model_id;
    InstallStatus status = InstallStatus::DOWNLOADING;
    int progress = 0;            // 0-100
    std::string message;
    bool indeterminate = false;  // total size unknown, progress carries no meaning
    std::string error_code;      // set on ERROR, alongside message

    bool is_terminal() const {
        return status == InstallStatus::COMPLETED || status == InstallStatus::ERROR;
    }
};

struct ChatToken {
    std::string token;
};

enum class FinishReason {
    END_OF_SEQUENCE,
    MAX_TOKENS,
    CANCELLED,
    ERROR
};

std::string finish_reason_to_string(FinishReason reason);

struct ChatFinished {
    FinishReason reason = FinishReason::END_OF_SEQUENCE;
    int tokens = 0;

    // Set when reason is ERROR
    std::string error_code;
    std::string error_message;
};

void to_json(json& j, const InstallProgress& p);
void to_json(json& j, const ChatToken& t);
void to_json(json& j, const ChatFinished& f);

// Typed consumer of core events. Producers call these from worker threads;
// each operation's events arrive in order and end with exactly one terminal event.
class IEventSink {
public:
    virtual ~IEventSink() = default;

    // Returning false asks the producer to stop (client went away)
    virtual bool on_install_progress(const InstallProgress& progress) = 0;
    virtual bool on_chat_token(const ChatToken& token) = 0;

    virtual void on_chat_finished(const ChatFinished& finished) = 0;
};

} // namespace dock
