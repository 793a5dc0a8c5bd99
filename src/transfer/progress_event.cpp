#include "ginseng/transfer/progress_event.hpp"

namespace ginseng::transfer {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

template<typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

}

const char* event_name(const ProgressEvent& event) {
    return std::visit(overloaded{
        [](const TransferStartedEvent&) { return "transferStarted"; },
        [](const TransferProgressEvent&) { return "transferProgress"; },
        [](const FileProgressEvent&) { return "fileProgress"; },
        [](const StageChangedEvent&) { return "stageChanged"; },
        [](const TransferCompletedEvent&) { return "transferCompleted"; },
        [](const TransferFailedEvent&) { return "transferFailed"; },
    }, event);
}

bool is_terminal_event(const ProgressEvent& event) {
    return std::holds_alternative<TransferCompletedEvent>(event) ||
           std::holds_alternative<TransferFailedEvent>(event);
}

void to_json(nlohmann::json& j, const FileEntry& entry) {
    j = nlohmann::json{
        {"fileId", entry.file_id},
        {"name", entry.name},
        {"relativePath", entry.relative_path},
        {"totalBytes", entry.total_bytes},
        {"transferredBytes", entry.transferred_bytes},
        {"status", to_string(entry.status)},
    };
    put_optional(j, "transferRate", entry.transfer_rate);
    put_optional(j, "error", entry.error);
}

void to_json(nlohmann::json& j, const Session& session) {
    j = nlohmann::json{
        {"transferId", session.transfer_id},
        {"transferType", to_string(session.transfer_type)},
        {"stage", to_string(session.stage)},
        {"totalFiles", session.total_files},
        {"completedFiles", session.completed_files},
        {"failedFiles", session.failed_files},
        {"totalBytes", session.total_bytes},
        {"transferredBytes", session.transferred_bytes},
        {"startTime", session.start_time},
        {"files", session.files},
    };
    put_optional(j, "transferRate", session.transfer_rate);
    put_optional(j, "etaSeconds", session.eta_seconds);
    put_optional(j, "error", session.error);
}

nlohmann::json to_json(const ProgressEvent& event) {
    nlohmann::json data = std::visit(overloaded{
        [](const TransferStartedEvent& e) { return nlohmann::json{{"transfer", e.transfer}}; },
        [](const TransferProgressEvent& e) { return nlohmann::json{{"transfer", e.transfer}}; },
        [](const FileProgressEvent& e) {
            return nlohmann::json{{"transferId", e.transfer_id}, {"file", e.file}};
        },
        [](const StageChangedEvent& e) {
            nlohmann::json j{{"transferId", e.transfer_id}, {"stage", to_string(e.stage)}};
            put_optional(j, "message", e.message);
            return j;
        },
        [](const TransferCompletedEvent& e) { return nlohmann::json{{"transfer", e.transfer}}; },
        [](const TransferFailedEvent& e) {
            return nlohmann::json{{"transfer", e.transfer}, {"error", e.error}};
        },
    }, event);
    
    return nlohmann::json{{"event", event_name(event)}, {"data", std::move(data)}};
}

}
