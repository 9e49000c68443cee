#include "bus/events.hpp"

namespace codebox::bus {

const char* ToString(EventKind kind) {
    switch (kind) {
        case EventKind::kOutput: return "output";
        case EventKind::kAwaitingInput: return "awaiting_input";
        case EventKind::kFinished: return "finished";
    }
    return "unknown";
}

ExecutionEvent MakeOutput(const std::string& job_id, const std::string& client_id,
                          const std::string& stream, std::string text) {
    ExecutionEvent event{};
    event.job_id = job_id;
    event.client_id = client_id;
    event.kind = EventKind::kOutput;
    event.stream = stream;
    event.text = std::move(text);
    return event;
}

ExecutionEvent MakeAwaitingInput(const std::string& job_id, const std::string& client_id) {
    ExecutionEvent event{};
    event.job_id = job_id;
    event.client_id = client_id;
    event.kind = EventKind::kAwaitingInput;
    return event;
}

ExecutionEvent MakeFinished(const std::string& job_id, const std::string& client_id,
                            int exit_code, std::optional<std::string> error,
                            std::optional<Artifact> artifact) {
    ExecutionEvent event{};
    event.job_id = job_id;
    event.client_id = client_id;
    event.kind = EventKind::kFinished;
    event.exit_code = exit_code;
    event.error = std::move(error);
    event.artifact = std::move(artifact);
    return event;
}

nlohmann::json ToJson(const ExecutionEvent& event) {
    nlohmann::json payload = {{"code_block_id", event.job_id}};
    std::string type;
    switch (event.kind) {
        case EventKind::kOutput:
            type = "code_output";
            payload["stream"] = event.stream;
            payload["data"] = event.text;
            break;
        case EventKind::kAwaitingInput:
            type = "code_waiting_input";
            break;
        case EventKind::kFinished:
            type = "code_finished";
            payload["exit_code"] = event.exit_code;
            payload["error"] = event.error.has_value() ? nlohmann::json(*event.error)
                                                       : nlohmann::json(nullptr);
            if (event.artifact.has_value()) {
                payload["artifact"] = {
                    {"name", event.artifact->name},
                    {"mime_type", event.artifact->mime_type},
                    {"data", event.artifact->data_base64},
                    {"sha256", event.artifact->sha256},
                    {"size", event.artifact->size}
                };
            }
            break;
    }
    return {{"type", type}, {"payload", payload}};
}

}  // namespace codebox::bus
