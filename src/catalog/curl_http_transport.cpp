#include "catalog/curl_http_transport.hpp"

#include <curl/curl.h>
#include "common/curl_global.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace {
size_t CurlWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    size_t total = size * nmemb;
    auto *buffer = static_cast<std::string *>(userdata);
    buffer->append(ptr, total);
    return total;
}

size_t CurlHeaderCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    size_t total = size * nmemb;
    auto *retryAfter = static_cast<std::optional<std::chrono::seconds> *>(userdata);

    std::string line(ptr, total);
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (name != "retry-after") {
        return total;
    }

    std::string value = line.substr(colon + 1);
    value.erase(std::remove_if(value.begin(), value.end(),
                               [](unsigned char ch) { return std::isspace(ch) != 0; }),
                value.end());
    // Only the delta-seconds form is honored; HTTP dates are ignored.
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return total;
    }
    if (value.size() > 9) {
        *retryAfter = scout::catalog::kMaxRetryAfter;
    } else {
        *retryAfter = std::min(std::chrono::seconds(std::stol(value)), scout::catalog::kMaxRetryAfter);
    }
    return total;
}
}

namespace scout::catalog {

CurlHttpTransport::CurlHttpTransport(std::chrono::seconds timeout, std::string userAgent)
    : timeout(timeout),
      userAgent(std::move(userAgent)) {
    if (scout::net::EnsureCurlGlobalInit()) {
        curlInitialized = true;
    } else {
        spdlog::warn("CurlHttpTransport: Failed to initialize cURL");
    }
}

HttpResponse CurlHttpTransport::get(const std::string &url) {
    HttpResponse response;
    if (!curlInitialized) {
        response.error = "curl_not_initialized";
        return response;
    }

    CURL *curlHandle = curl_easy_init();
    if (!curlHandle) {
        spdlog::warn("CurlHttpTransport: curl_easy_init failed");
        response.error = "curl_easy_init failed";
        return response;
    }

    curl_slist *headers = curl_slist_append(nullptr, "Accept: application/json");

    curl_easy_setopt(curlHandle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curlHandle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curlHandle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curlHandle, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curlHandle, CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(curlHandle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, CurlWriteCallback);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curlHandle, CURLOPT_HEADERFUNCTION, CurlHeaderCallback);
    curl_easy_setopt(curlHandle, CURLOPT_HEADERDATA, &response.retryAfter);

    CURLcode result = curl_easy_perform(curlHandle);
    if (result != CURLE_OK) {
        response.error = curl_easy_strerror(result);
        spdlog::warn("CurlHttpTransport: Request to {} failed: {}", url, response.error);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curlHandle);
        return response;
    }

    curl_easy_getinfo(curlHandle, CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curlHandle);

    response.transportOk = true;
    return response;
}

} // namespace scout::catalog
