#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "browser/errors.hpp"
#include "browser/server_record.hpp"

namespace scout {

using Generation = uint64_t;

enum class UpdateEventType {
    ServerUpdated,
    PartialReady,
    Complete,
    Failed
};

inline const char *UpdateEventTypeName(UpdateEventType type) {
    switch (type) {
        case UpdateEventType::ServerUpdated:
            return "server_updated";
        case UpdateEventType::PartialReady:
            return "partial_ready";
        case UpdateEventType::Complete:
            return "complete";
        case UpdateEventType::Failed:
            return "failed";
    }
    return "unknown";
}

struct UpdateEvent {
    UpdateEventType type = UpdateEventType::ServerUpdated;
    Generation generation = 0;
    // Set for ServerUpdated.
    std::optional<ServerRecord> record;
    // Set for Failed.
    std::optional<ErrorKind> failure;
    std::string message;

    static UpdateEvent ServerUpdated(Generation generation, ServerRecord record) {
        UpdateEvent event;
        event.type = UpdateEventType::ServerUpdated;
        event.generation = generation;
        event.record = std::move(record);
        return event;
    }

    static UpdateEvent PartialReady(Generation generation) {
        UpdateEvent event;
        event.type = UpdateEventType::PartialReady;
        event.generation = generation;
        return event;
    }

    static UpdateEvent Complete(Generation generation) {
        UpdateEvent event;
        event.type = UpdateEventType::Complete;
        event.generation = generation;
        return event;
    }

    static UpdateEvent Failed(Generation generation, ErrorKind kind, std::string message) {
        UpdateEvent event;
        event.type = UpdateEventType::Failed;
        event.generation = generation;
        event.failure = kind;
        event.message = std::move(message);
        return event;
    }
};

} // namespace scout
