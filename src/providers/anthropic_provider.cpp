#include "providers/anthropic_provider.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace helm::providers {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kApiVersion = "2023-06-01";
constexpr int kMaxTokens = 4096;

std::string trim_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

}  // namespace

AnthropicProvider::AnthropicProvider(core::config::ProviderSettings settings,
                                     const bool native_tools,
                                     std::shared_ptr<HttpClient> http_client)
    : settings_(std::move(settings)),
      native_tools_(native_tools),
      http_client_(std::move(http_client)) {
    settings_.base_url = trim_trailing_slashes(settings_.base_url);
}

json AnthropicProvider::build_body(const CompletionRequest& request) const {
    json body;
    body["model"] = settings_.model;
    body["max_tokens"] = kMaxTokens;

    std::string system = request.system_prompt;
    json messages = json::array();
    if (request.messages.has_value()) {
        for (const auto& message : request.messages.value()) {
            if (message.is_object() && message.value("role", "") == "system") {
                if (system.empty() && message.contains("content") &&
                    message["content"].is_string()) {
                    system = message["content"].get<std::string>();
                }
                continue;
            }
            messages.push_back(message);
        }
    } else {
        messages.push_back({{"role", "user"}, {"content", request.prompt}});
    }
    if (!system.empty()) {
        body["system"] = system;
    }
    body["messages"] = messages;
    if (request.tools.has_value() && !request.tools->empty()) {
        body["tools"] = request.tools.value();
    }
    return body;
}

core::errors::Result<ProviderReply> AnthropicProvider::complete(const CompletionRequest& request) {
    if (request.cancel_token && request.cancel_token->load()) {
        return core::errors::task_aborted("model request");
    }

    HttpRequest http;
    http.url = settings_.base_url + "/messages";
    http.headers.emplace_back("Content-Type", "application/json");
    http.headers.emplace_back("x-api-key", settings_.api_key);
    http.headers.emplace_back("anthropic-version", kApiVersion);
    http.body = build_body(request).dump(-1, ' ', false, json::error_handler_t::replace);
    http.timeout_ms = settings_.timeout_ms;
    http.cancel_token = request.cancel_token;

    HELM_LOG_DEBUG("AnthropicProvider: POST " + http.url);
    const HttpResponse response = http_client_->post(http);
    if (request.cancel_token && request.cancel_token->load()) {
        return core::errors::task_aborted("model request");
    }
    if (auto failure = http_failure(response, "Anthropic endpoint")) {
        return failure.value();
    }

    const json parsed = json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("content") ||
        !parsed["content"].is_array()) {
        return AgentError{ErrorCategory::Provider,
                          "Unexpected messages response: missing content blocks",
                          "provider_invalid_response"};
    }

    if (request.messages.has_value()) {
        return ProviderReply::from_native(parsed);
    }
    std::string text;
    for (const auto& block : parsed["content"]) {
        if (block.is_object() && block.value("type", "") == "text" && block.contains("text") &&
            block["text"].is_string()) {
            text += block["text"].get<std::string>();
        }
    }
    return ProviderReply::from_text(text);
}

}  // namespace helm::providers
