#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "providers/provider.hpp"

namespace helm::providers {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::uint32_t timeout_ms = 120000;
    CancelToken cancel_token;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    bool network_error = false;
    bool timeout = false;
    bool cancelled = false;
    std::string error_message;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const HttpRequest& request) = 0;
};

// libcurl-backed client. The transfer is interrupted from the progress
// callback once the request's cancel token fires.
class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse post(const HttpRequest& request) override;
};

// Maps a failed exchange to the provider error taxonomy; nullopt for a 2xx
// response. Cancellation maps to task_aborted.
std::optional<core::errors::AgentError> http_failure(const HttpResponse& response,
                                                     const std::string& provider);

}  // namespace helm::providers
