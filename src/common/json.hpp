#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace scout::json {

using Value = nlohmann::json;

// Throws nlohmann::json::parse_error on malformed text.
inline Value Parse(std::string_view text) {
    return Value::parse(text);
}

inline Value Object() {
    return Value::object();
}

// Numeric value as int. Nothing for non-numbers and for values outside int
// range; floats are truncated toward zero.
inline std::optional<int> ToInt(const Value &value) {
    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        const auto raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(kMax)) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }
    if (value.is_number_integer()) {
        const auto raw = value.get<int64_t>();
        if (raw < kMin || raw > kMax) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }
    if (value.is_number_float()) {
        const double raw = value.get<double>();
        // Also rejects NaN.
        if (!(raw >= static_cast<double>(kMin) && raw <= static_cast<double>(kMax))) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }
    return std::nullopt;
}

} // namespace scout::json
