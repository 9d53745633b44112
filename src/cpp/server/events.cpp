#include "dock/events.h"

namespace dock {

std::string install_status_to_string(InstallStatus status) {
    switch (status) {
        case InstallStatus::DOWNLOADING:     return "downloading";
        case InstallStatus::INSTALLING_DEPS: return "installing_deps";
        case InstallStatus::COMPLETED:       return "completed";
        case InstallStatus::ERROR:           return "error";
    }
    return "error";
}

std::string finish_reason_to_string(FinishReason reason) {
    switch (reason) {
        case FinishReason::END_OF_SEQUENCE: return "eos";
        case FinishReason::MAX_TOKENS:      return "max_tokens";
        case FinishReason::CANCELLED:       return "cancelled";
        case FinishReason::ERROR:           return "error";
    }
    return "error";
}

void to_json(json& j, const InstallProgress& p) {
    j = json{
        {"model_id", p.model_id},
        {"status", install_status_to_string(p.status)},
        {"progress", p.progress},
        {"message", p.message},
        {"indeterminate", p.indeterminate}
    };
    if (p.status == InstallStatus::ERROR && !p.error_code.empty()) {
        j["error"] = {{"code", p.error_code}, {"message", p.message}};
    }
}

void to_json(json& j, const ChatToken& t) {
    j = json{{"token", t.token}};
}

void to_json(json& j, const ChatFinished& f) {
    j = json{
        {"reason", finish_reason_to_string(f.reason)},
        {"tokens", f.tokens}
    };
    if (f.reason == FinishReason::ERROR && !f.error_code.empty()) {
        j["error"] = {{"code", f.error_code}, {"message", f.error_message}};
    }
}

} // namespace dock
