#pragma once

#include <chrono>

#include "probe/probe_transport.hpp"

namespace scout::probe {

// A2S_INFO exchange over a non-blocking UDP socket. A challenge reply is answered
// once inside the same deadline.
class A2sProbeTransport final : public ProbeTransport {
public:
    explicit A2sProbeTransport(std::chrono::milliseconds maxRoundTrip = std::chrono::milliseconds(2000));

    ProbeOutcome query(const ServerAddress &endpoint, std::chrono::milliseconds timeout) override;

private:
    std::chrono::milliseconds maxRoundTrip;
};

} // namespace scout::probe
