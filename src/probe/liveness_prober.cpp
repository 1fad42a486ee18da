#include "probe/liveness_prober.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <system_error>
#include <utility>

namespace scout::probe {

std::thread LaunchWorkerThread(std::function<void()> body) {
    return std::thread(std::move(body));
}

ProbeRound::ProbeRound(ProbeTransport &transport,
                       std::vector<ProbeTarget> targets,
                       std::chrono::milliseconds timeout,
                       std::size_t concurrencyLimit,
                       const WorkerLauncher &launch)
    : transport(transport),
      timeout(timeout),
      total(targets.size()),
      pending(std::make_move_iterator(targets.begin()), std::make_move_iterator(targets.end())) {
    const std::size_t workerTotal = std::min(std::max<std::size_t>(concurrencyLimit, 1), total);
    workers.reserve(workerTotal);
    for (std::size_t i = 0; i < workerTotal; ++i) {
        try {
            workers.push_back(launch([this]() { workerProc(); }));
        } catch (const std::system_error &ex) {
            if (workers.empty()) {
                spdlog::error("LivenessProber: Unable to start any probe worker: {}", ex.what());
                throw;
            }
            spdlog::warn("LivenessProber: Started {} of {} worker(s): {}", workers.size(), workerTotal, ex.what());
            break;
        }
    }
    spdlog::debug("LivenessProber: Probing {} endpoint(s) with {} worker(s)", total, workers.size());
}

ProbeRound::~ProbeRound() {
    cancel();
    for (auto &worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ProbeRound::workerProc() {
    while (true) {
        ProbeTarget target;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (pending.empty()) {
                return;
            }
            target = std::move(pending.front());
            pending.pop_front();
            ++inFlight;
            peak = std::max(peak, inFlight);
        }

        ProbeOutcome outcome;
        try {
            outcome = transport.query(target.endpoint, timeout);
        } catch (const std::exception &ex) {
            spdlog::error("LivenessProber: Probe of {} threw: {}", target.endpoint.key(), ex.what());
            outcome = ProbeOutcome::Unreachable(ex.what());
        }

        if (outcome.reachable) {
            spdlog::trace("LivenessProber: {} answered in {} ms ({}/{})",
                          target.address.key(), outcome.pingMs, outcome.playerCount, outcome.maxPlayers);
        } else {
            spdlog::trace("LivenessProber: {} unreachable: {}", target.address.key(), outcome.error);
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            --inFlight;
            completed.push_back(ProbeResult{std::move(target.address), std::move(outcome)});
        }
        cv.notify_all();
    }
}

bool ProbeRound::exhaustedLocked() const {
    return completed.empty() && pending.empty() && inFlight == 0;
}

std::optional<ProbeResult> ProbeRound::next() {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&]() { return !completed.empty() || exhaustedLocked(); });
    if (completed.empty()) {
        return std::nullopt;
    }
    ProbeResult result = std::move(completed.front());
    completed.pop_front();
    return result;
}

std::optional<ProbeResult> ProbeRound::next(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_until(lock, deadline, [&]() { return !completed.empty() || exhaustedLocked(); });
    if (completed.empty()) {
        return std::nullopt;
    }
    ProbeResult result = std::move(completed.front());
    completed.pop_front();
    return result;
}

void ProbeRound::cancel() {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        dropped = pending.size();
        pending.clear();
    }
    cv.notify_all();
    if (dropped > 0) {
        spdlog::debug("LivenessProber: Dropped {} queued probe(s)", dropped);
    }
}

bool ProbeRound::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex);
    return exhaustedLocked();
}

std::size_t ProbeRound::size() const {
    return total;
}

std::size_t ProbeRound::workerCount() const {
    return workers.size();
}

std::size_t ProbeRound::inFlightPeak() const {
    std::lock_guard<std::mutex> lock(mutex);
    return peak;
}

LivenessProber::LivenessProber(ProbeTransport &transport, WorkerLauncher launch)
    : transport(transport),
      launch(std::move(launch)) {}

std::unique_ptr<ProbeRound> LivenessProber::probeAll(std::vector<ProbeTarget> targets,
                                                     std::chrono::milliseconds perProbeTimeout,
                                                     std::size_t concurrencyLimit) {
    return std::make_unique<ProbeRound>(transport, std::move(targets), perProbeTimeout, concurrencyLimit, launch);
}

std::unique_ptr<ProbeRound> LivenessProber::probeAll(const std::vector<ServerAddress> &addresses,
                                                     std::chrono::milliseconds perProbeTimeout,
                                                     std::size_t concurrencyLimit) {
    std::vector<ProbeTarget> targets;
    targets.reserve(addresses.size());
    for (const auto &address : addresses) {
        targets.push_back(ProbeTarget{address, address});
    }
    return probeAll(std::move(targets), perProbeTimeout, concurrencyLimit);
}

} // namespace scout::probe
