#include "providers/openai_compatible_provider.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace helm::providers {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string trim_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

AgentError invalid_response(const std::string& detail) {
    return AgentError{ErrorCategory::Provider, "Unexpected completion response: " + detail,
                      "provider_invalid_response"};
}

}  // namespace

OpenAiCompatibleProvider::OpenAiCompatibleProvider(core::config::ProviderSettings settings,
                                                   const bool native_tools,
                                                   std::shared_ptr<HttpClient> http_client)
    : settings_(std::move(settings)),
      native_tools_(native_tools),
      http_client_(std::move(http_client)) {
    settings_.base_url = trim_trailing_slashes(settings_.base_url);
}

json OpenAiCompatibleProvider::build_body(const CompletionRequest& request) const {
    json body;
    body["model"] = settings_.model;
    if (request.messages.has_value()) {
        body["messages"] = request.messages.value();
    } else {
        json messages = json::array();
        if (!request.system_prompt.empty()) {
            messages.push_back({{"role", "system"}, {"content", request.system_prompt}});
        }
        messages.push_back({{"role", "user"}, {"content", request.prompt}});
        body["messages"] = messages;
    }
    if (request.tools.has_value() && !request.tools->empty()) {
        body["tools"] = request.tools.value();
    }
    return body;
}

core::errors::Result<ProviderReply> OpenAiCompatibleProvider::complete(
    const CompletionRequest& request) {
    if (request.cancel_token && request.cancel_token->load()) {
        return core::errors::task_aborted("model request");
    }

    HttpRequest http;
    http.url = settings_.base_url + "/chat/completions";
    http.headers.emplace_back("Content-Type", "application/json");
    if (!settings_.api_key.empty()) {
        http.headers.emplace_back("Authorization", "Bearer " + settings_.api_key);
    }
    http.body = build_body(request).dump(-1, ' ', false, json::error_handler_t::replace);
    http.timeout_ms = settings_.timeout_ms;
    http.cancel_token = request.cancel_token;

    HELM_LOG_DEBUG("OpenAiCompatibleProvider: POST " + http.url + " (" +
                   std::to_string(http.body.size()) + " bytes)");
    const HttpResponse response = http_client_->post(http);
    if (request.cancel_token && request.cancel_token->load()) {
        return core::errors::task_aborted("model request");
    }
    if (auto failure = http_failure(response, "Model endpoint")) {
        return failure.value();
    }

    const json parsed = json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return invalid_response("body is not a JSON object");
    }
    const auto choices = parsed.find("choices");
    if (choices == parsed.end() || !choices->is_array() || choices->empty()) {
        return invalid_response("missing choices");
    }
    const json& first = choices->front();
    if (!first.is_object() || !first.contains("message") || !first["message"].is_object()) {
        return invalid_response("missing choices[0].message");
    }
    const json& message = first["message"];

    if (request.messages.has_value()) {
        return ProviderReply::from_native(message);
    }
    const auto content = message.find("content");
    if (content == message.end() || !content->is_string()) {
        return ProviderReply::from_text("");
    }
    return ProviderReply::from_text(content->get<std::string>());
}

}  // namespace helm::providers
