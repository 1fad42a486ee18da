#include "refresh/update_stream.hpp"

#include "spdlog/spdlog.h"

#include <utility>

namespace scout {

void UpdateStream::subscribe(Listener newListener) {
    std::lock_guard<std::mutex> lock(mutex);
    listener = std::move(newListener);
    clearPendingLocked();
}

void UpdateStream::unsubscribe() {
    std::lock_guard<std::mutex> lock(mutex);
    listener = nullptr;
    clearPendingLocked();
}

bool UpdateStream::beginGeneration(Generation generation) {
    std::lock_guard<std::mutex> lock(mutex);
    if (generation < open) {
        return false;
    }
    advanceLocked(generation);
    return true;
}

bool UpdateStream::publish(UpdateEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (event.generation < open) {
            spdlog::trace("UpdateStream: Refusing {} event from generation {} (open {})",
                          UpdateEventTypeName(event.type), event.generation, open);
            return false;
        }
        advanceLocked(event.generation);

        if (event.type == UpdateEventType::ServerUpdated && event.record) {
            const std::string key = event.record->address.key();
            auto found = pendingUpdates.find(key);
            if (found != pendingUpdates.end() && found->second->generation == event.generation) {
                *found->second = std::move(event);
                return true;
            }
            pending.push_back(std::move(event));
            pendingUpdates[key] = std::prev(pending.end());
        } else {
            pending.push_back(std::move(event));
        }
    }
    cv.notify_all();
    return true;
}

std::size_t UpdateStream::dispatch() {
    Listener target;
    std::vector<UpdateEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!listener) {
            return 0;
        }
        target = listener;
        events = takePendingLocked();
    }

    for (const auto &event : events) {
        target(event);
    }
    return events.size();
}

std::vector<UpdateEvent> UpdateStream::consume() {
    std::lock_guard<std::mutex> lock(mutex);
    return takePendingLocked();
}

bool UpdateStream::waitForEvents(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_until(lock, deadline, [&]() { return !pending.empty(); });
}

Generation UpdateStream::openGeneration() const {
    std::lock_guard<std::mutex> lock(mutex);
    return open;
}

std::size_t UpdateStream::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending.size();
}

void UpdateStream::advanceLocked(Generation generation) {
    if (generation == open) {
        return;
    }
    open = generation;

    for (auto it = pending.begin(); it != pending.end();) {
        if (it->generation < open) {
            if (it->type == UpdateEventType::ServerUpdated && it->record) {
                pendingUpdates.erase(it->record->address.key());
            }
            it = pending.erase(it);
        } else {
            ++it;
        }
    }
}

void UpdateStream::clearPendingLocked() {
    pending.clear();
    pendingUpdates.clear();
}

std::vector<UpdateEvent> UpdateStream::takePendingLocked() {
    std::vector<UpdateEvent> events;
    events.reserve(pending.size());
    for (auto &event : pending) {
        events.push_back(std::move(event));
    }
    clearPendingLocked();
    return events;
}

} // namespace scout
