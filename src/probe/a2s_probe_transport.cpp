#include "probe/a2s_probe_transport.hpp"

#include "probe/a2s_protocol.hpp"
#include "spdlog/spdlog.h"

#include <array>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        flags = 0;
    }
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

class SocketHandle {
public:
    SocketHandle() : fd(socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP)) {}
    ~SocketHandle() {
        if (fd >= 0) {
            close(fd);
        }
    }

    SocketHandle(const SocketHandle &) = delete;
    SocketHandle &operator=(const SocketHandle &) = delete;

    int get() const { return fd; }
    bool valid() const { return fd >= 0; }

private:
    int fd;
};

bool resolveEndpoint(const scout::ServerAddress &endpoint, sockaddr_in &out, std::string *error) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(endpoint.port);
    if (inet_pton(AF_INET, endpoint.host.c_str(), &out.sin_addr) == 1) {
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo *results = nullptr;
    const int rc = getaddrinfo(endpoint.host.c_str(), nullptr, &hints, &results);
    if (rc != 0 || !results) {
        if (error) {
            *error = std::string("resolve failed: ") + gai_strerror(rc);
        }
        return false;
    }

    out.sin_addr = reinterpret_cast<sockaddr_in *>(results->ai_addr)->sin_addr;
    freeaddrinfo(results);
    return true;
}

bool sendPacket(int fd, const sockaddr_in &target, const std::vector<uint8_t> &packet) {
    const auto sent = sendto(fd, packet.data(), packet.size(), 0,
                             reinterpret_cast<const sockaddr *>(&target), sizeof(target));
    return sent == static_cast<ssize_t>(packet.size());
}

} // namespace

namespace scout::probe {

A2sProbeTransport::A2sProbeTransport(std::chrono::milliseconds maxRoundTrip)
    : maxRoundTrip(maxRoundTrip) {}

ProbeOutcome A2sProbeTransport::query(const ServerAddress &endpoint, std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;

    sockaddr_in target{};
    std::string error;
    if (!resolveEndpoint(endpoint, target, &error)) {
        return ProbeOutcome::Unreachable(error);
    }

    SocketHandle socketHandle;
    if (!socketHandle.valid()) {
        spdlog::warn("A2sProbeTransport: Unable to create UDP socket: {}", std::strerror(errno));
        return ProbeOutcome::Unreachable("socket failed");
    }
    setNonBlocking(socketHandle.get());

    const auto deadline = Clock::now() + timeout;
    auto sentAt = Clock::now();
    if (!sendPacket(socketHandle.get(), target, a2s::BuildInfoRequest())) {
        return ProbeOutcome::Unreachable(std::string("sendto failed: ") + std::strerror(errno));
    }

    bool challengeAnswered = false;
    std::array<uint8_t, a2s::MAX_PACKET_SIZE> buffer{};

    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            return ProbeOutcome::Unreachable("timeout");
        }

        pollfd pfd{};
        pfd.fd = socketHandle.get();
        pfd.events = POLLIN;
        const int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ProbeOutcome::Unreachable(std::string("poll failed: ") + std::strerror(errno));
        }
        if (ready == 0) {
            return ProbeOutcome::Unreachable("timeout");
        }

        sockaddr_in from{};
        socklen_t fromLen = sizeof(from);
        const auto received = recvfrom(socketHandle.get(), buffer.data(), buffer.size(), 0,
                                       reinterpret_cast<sockaddr *>(&from), &fromLen);
        const auto receivedAt = Clock::now();
        if (received < 0) {
            if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) {
                continue;
            }
            return ProbeOutcome::Unreachable(std::string("recvfrom failed: ") + std::strerror(errno));
        }

        if (from.sin_addr.s_addr != target.sin_addr.s_addr || from.sin_port != target.sin_port) {
            continue;
        }

        const a2s::Reply reply = a2s::ParseReply(buffer.data(), static_cast<std::size_t>(received));
        if (reply.type == a2s::ReplyType::Challenge) {
            if (challengeAnswered) {
                return ProbeOutcome::Unreachable("repeated challenge");
            }
            challengeAnswered = true;
            sentAt = Clock::now();
            if (!sendPacket(socketHandle.get(), target, a2s::BuildInfoRequest(reply.challenge))) {
                return ProbeOutcome::Unreachable(std::string("sendto failed: ") + std::strerror(errno));
            }
            continue;
        }

        if (reply.type != a2s::ReplyType::Info) {
            continue;
        }

        const auto rtt = std::chrono::duration_cast<std::chrono::milliseconds>(receivedAt - sentAt);
        if (rtt > maxRoundTrip) {
            return ProbeOutcome::Unreachable("round trip above limit");
        }

        ProbeOutcome outcome;
        outcome.reachable = true;
        outcome.pingMs = static_cast<int>(rtt.count());
        outcome.playerCount = reply.info.players;
        outcome.maxPlayers = reply.info.maxPlayers;
        outcome.name = reply.info.name;
        outcome.map = reply.info.map;
        outcome.perspective = PerspectiveFromKeywords(reply.info.keywords);
        return outcome;
    }
}

} // namespace scout::probe
