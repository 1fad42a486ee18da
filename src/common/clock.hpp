#pragma once

#include <chrono>
#include <cstdint>

namespace scout {

using Timestamp = std::chrono::system_clock::time_point;

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

namespace time {

inline int64_t ToUnixMillis(Timestamp value) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
}

inline Timestamp FromUnixMillis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
}

} // namespace time

} // namespace scout
