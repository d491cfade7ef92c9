#include "providers/http_client.hpp"

#include <curl/curl.h>

namespace helm::providers {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto total = size * nmemb;
    auto* output = static_cast<std::string*>(userdata);
    output->append(ptr, total);
    return total;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancelToken*>(clientp);
    if (token != nullptr && *token && (*token)->load()) {
        return 1;
    }
    return 0;
}

}  // namespace

std::optional<core::errors::AgentError> http_failure(const HttpResponse& response,
                                                     const std::string& provider) {
    using core::errors::AgentError;
    using core::errors::ErrorCategory;

    if (response.cancelled) {
        return core::errors::task_aborted(provider + " request");
    }
    if (response.timeout) {
        return AgentError{ErrorCategory::Provider, provider + " request timed out.",
                          "provider_timeout", "Raise the request timeout or retry."};
    }
    if (response.network_error) {
        return AgentError{ErrorCategory::Provider,
                          provider + " request failed: " + response.error_message,
                          "provider_unreachable", "Check --base-url and network access."};
    }
    if (response.status < 200 || response.status >= 300) {
        std::string body = response.body;
        if (body.size() > 500) {
            body = body.substr(0, 500) + "...";
        }
        const std::string hint = response.status == 401 || response.status == 403
                                     ? "Check HELM_API_KEY."
                                     : "";
        return AgentError{ErrorCategory::Provider,
                          provider + " returned HTTP " + std::to_string(response.status) +
                              (body.empty() ? "" : ": " + body),
                          "provider_http_error", hint};
    }
    return std::nullopt;
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post(const HttpRequest& request) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        response.network_error = true;
        response.error_message = "curl_easy_init failed";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "helm/0.1");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &request.cancel_token);

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
        const std::string line = key + ": " + value;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    if (header_list != nullptr) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    const CURLcode code = curl_easy_perform(curl);
    if (code == CURLE_ABORTED_BY_CALLBACK) {
        response.cancelled = true;
        response.error_message = "request cancelled";
    } else if (code != CURLE_OK) {
        response.network_error = true;
        response.error_message = curl_easy_strerror(code);
        response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    } else {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status = status;
    }

    if (header_list != nullptr) {
        curl_slist_free_all(header_list);
    }
    curl_easy_cleanup(curl);
    return response;
}

}  // namespace helm::providers
