#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace scout::catalog {

// Upper bound on any server-supplied Retry-After.
inline constexpr std::chrono::seconds kMaxRetryAfter{24 * 60 * 60};

struct HttpResponse {
    // False when no HTTP exchange completed (DNS, connect, timeout, ...).
    bool transportOk = false;
    long status = 0;
    std::string body;
    std::optional<std::chrono::seconds> retryAfter;
    std::string error;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const std::string &url) = 0;
};

} // namespace scout::catalog
