#pragma once

#include <string>

namespace scout {

enum class ErrorKind {
    Network,
    RateLimit,
    ProbeUnreachable,
    Cache,
    Config
};

inline const char *ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network:
            return "network";
        case ErrorKind::RateLimit:
            return "rate_limit";
        case ErrorKind::ProbeUnreachable:
            return "probe_unreachable";
        case ErrorKind::Cache:
            return "cache";
        case ErrorKind::Config:
            return "config";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Network;
    std::string message;
};

} // namespace scout
