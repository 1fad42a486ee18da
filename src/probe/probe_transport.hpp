#pragma once

#include <chrono>
#include <string>

#include "browser/server_record.hpp"

namespace scout::probe {

struct ProbeOutcome {
    bool reachable = false;
    int pingMs = 0;
    int playerCount = 0;
    int maxPlayers = 0;
    std::string name;
    std::string map;
    Perspective perspective = Perspective::Unknown;
    // Reason for an unreachable outcome, for logging only.
    std::string error;

    static ProbeOutcome Unreachable(std::string reason) {
        ProbeOutcome outcome;
        outcome.error = std::move(reason);
        return outcome;
    }
};

// One best-effort request/response exchange with a query endpoint.
class ProbeTransport {
public:
    virtual ~ProbeTransport() = default;
    virtual ProbeOutcome query(const ServerAddress &endpoint, std::chrono::milliseconds timeout) = 0;
};

} // namespace scout::probe
