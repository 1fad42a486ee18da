#pragma once

#include <chrono>
#include <string>

#include "catalog/http_transport.hpp"

namespace scout::catalog {

class CurlHttpTransport final : public HttpTransport {
public:
    explicit CurlHttpTransport(std::chrono::seconds timeout, std::string userAgent = "serverscout/1.0");

    HttpResponse get(const std::string &url) override;

private:
    std::chrono::seconds timeout;
    std::string userAgent;
    bool curlInitialized = false;
};

} // namespace scout::catalog
