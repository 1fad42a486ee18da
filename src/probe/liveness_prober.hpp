#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "browser/server_record.hpp"
#include "probe/probe_transport.hpp"

namespace scout::probe {

struct ProbeTarget {
    // Identity reported back with the result.
    ServerAddress address;
    // Where the query is sent.
    ServerAddress endpoint;
};

struct ProbeResult {
    ServerAddress address;
    ProbeOutcome outcome;
};

// Starts one worker thread running body. Throws std::system_error when the
// thread cannot be created.
using WorkerLauncher = std::function<std::thread(std::function<void()>)>;
std::thread LaunchWorkerThread(std::function<void()> body);

// One fan-out of probes. Results come out of next() in completion order; the
// round cannot be restarted. Destroying it drops queued targets, lets in-flight
// probes finish and joins the workers. If only some workers can be started
// the round runs with those; if none can, the constructor throws.
class ProbeRound {
public:
    ProbeRound(ProbeTransport &transport,
               std::vector<ProbeTarget> targets,
               std::chrono::milliseconds timeout,
               std::size_t concurrencyLimit,
               const WorkerLauncher &launch = LaunchWorkerThread);
    ~ProbeRound();

    ProbeRound(const ProbeRound &) = delete;
    ProbeRound &operator=(const ProbeRound &) = delete;

    // Blocks for the next completed probe. Returns nothing once every result has
    // been handed out.
    std::optional<ProbeResult> next();
    // As next(), but also returns nothing when the deadline passes first.
    std::optional<ProbeResult> next(std::chrono::steady_clock::time_point deadline);

    // Stops dispatching queued targets. Probes already in flight still complete.
    void cancel();

    // True once every dispatched probe has been handed out and nothing is queued.
    bool exhausted() const;

    std::size_t size() const;
    std::size_t workerCount() const;
    std::size_t inFlightPeak() const;

private:
    void workerProc();
    bool exhaustedLocked() const;

    ProbeTransport &transport;
    const std::chrono::milliseconds timeout;
    const std::size_t total;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<ProbeTarget> pending;
    std::deque<ProbeResult> completed;
    std::size_t inFlight = 0;
    std::size_t peak = 0;
    std::vector<std::thread> workers;
};

class LivenessProber {
public:
    explicit LivenessProber(ProbeTransport &transport, WorkerLauncher launch = LaunchWorkerThread);

    // At most concurrencyLimit probes run at once; excess targets queue.
    std::unique_ptr<ProbeRound> probeAll(std::vector<ProbeTarget> targets,
                                         std::chrono::milliseconds perProbeTimeout,
                                         std::size_t concurrencyLimit);
    std::unique_ptr<ProbeRound> probeAll(const std::vector<ServerAddress> &addresses,
                                         std::chrono::milliseconds perProbeTimeout,
                                         std::size_t concurrencyLimit);

private:
    ProbeTransport &transport;
    WorkerLauncher launch;
};

} // namespace scout::probe
