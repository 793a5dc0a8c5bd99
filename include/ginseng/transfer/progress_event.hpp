#pragma once

#include "progress_types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace ginseng::transfer {

struct TransferStartedEvent {
    Session transfer;
};

struct TransferProgressEvent {
    Session transfer;
};

struct FileProgressEvent {
    TransferId transfer_id;
    FileEntry file;
};

struct StageChangedEvent {
    TransferId transfer_id;
    TransferStage stage;
    std::optional<std::string> message;
};

struct TransferCompletedEvent {
    Session transfer;
};

struct TransferFailedEvent {
    Session transfer;
    std::string error;
};

using ProgressEvent = std::variant<TransferStartedEvent,
                                   TransferProgressEvent,
                                   FileProgressEvent,
                                   StageChangedEvent,
                                   TransferCompletedEvent,
                                   TransferFailedEvent>;

// Wire discriminator: "transferStarted", "fileProgress", ...
const char* event_name(const ProgressEvent& event);

bool is_terminal_event(const ProgressEvent& event);

void to_json(nlohmann::json& j, const FileEntry& entry);
void to_json(nlohmann::json& j, const Session& session);

// { "event": <name>, "data": { ... } }
nlohmann::json to_json(const ProgressEvent& event);

}
