#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "refresh/update_event.hpp"

namespace scout {

// Single-subscriber event channel. Pending ServerUpdated events for the same
// server collapse into the latest value, and events tagged with a generation
// older than the open one are refused.
class UpdateStream {
public:
    using Listener = std::function<void(const UpdateEvent &)>;

    // Replaces the current subscriber and discards whatever it had not received.
    void subscribe(Listener listener);
    void unsubscribe();

    // Opens a generation and purges pending events of older ones. Returns false
    // when generation is older than the one already open.
    bool beginGeneration(Generation generation);

    // Returns false when the event was refused.
    bool publish(UpdateEvent event);

    // Delivers pending events to the subscriber on the calling thread. Returns
    // the number delivered.
    std::size_t dispatch();

    // Pull-style alternative to dispatch().
    std::vector<UpdateEvent> consume();

    // Blocks until an event is pending or the deadline passes.
    bool waitForEvents(std::chrono::steady_clock::time_point deadline);

    Generation openGeneration() const;
    std::size_t pendingCount() const;

private:
    using PendingList = std::list<UpdateEvent>;

    // Opens generation and drops pending events of older ones.
    void advanceLocked(Generation generation);
    void clearPendingLocked();
    std::vector<UpdateEvent> takePendingLocked();

    mutable std::mutex mutex;
    std::condition_variable cv;
    Listener listener;
    Generation open = 0;
    PendingList pending;
    std::unordered_map<std::string, PendingList::iterator> pendingUpdates;
};

} // namespace scout
