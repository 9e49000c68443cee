#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace codebox::bus {

enum class EventKind {
    kOutput,
    kAwaitingInput,
    kFinished
};

const char* ToString(EventKind kind);

struct Artifact {
    std::string name;
    std::string mime_type;
    std::string data_base64;
    std::string sha256;
    std::size_t size = 0;
};

struct ExecutionEvent {
    std::string job_id;
    std::string client_id;
    EventKind kind = EventKind::kOutput;
    std::string stream;
    std::string text;
    int exit_code = 0;
    std::optional<std::string> error;
    std::optional<Artifact> artifact;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    bool IsTerminal() const { return kind == EventKind::kFinished; }
};

ExecutionEvent MakeOutput(const std::string& job_id, const std::string& client_id,
                          const std::string& stream, std::string text);
ExecutionEvent MakeAwaitingInput(const std::string& job_id, const std::string& client_id);
ExecutionEvent MakeFinished(const std::string& job_id, const std::string& client_id,
                            int exit_code, std::optional<std::string> error,
                            std::optional<Artifact> artifact = std::nullopt);

// {"type": "code_output" | "code_waiting_input" | "code_finished", "payload": {...}}
nlohmann::json ToJson(const ExecutionEvent& event);

}  // namespace codebox::bus
