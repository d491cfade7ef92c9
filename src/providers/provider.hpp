#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/agent_settings.hpp"
#include "core/errors/agent_errors.hpp"

namespace helm::providers {

using CancelToken = std::shared_ptr<std::atomic_bool>;

struct CompletionRequest {
    std::string system_prompt;
    // Legacy text mode sends a flattened transcript as the prompt.
    std::string prompt;
    // Native mode sends the provider's message array instead.
    std::optional<nlohmann::json> messages;
    std::optional<nlohmann::json> tools;
    CancelToken cancel_token;
};

// Either free text (legacy mode) or the provider-native structured reply.
struct ProviderReply {
    std::string text;
    std::optional<nlohmann::json> native;

    bool is_native() const { return native.has_value(); }

    static ProviderReply from_text(std::string value) {
        ProviderReply reply;
        reply.text = std::move(value);
        return reply;
    }

    static ProviderReply from_native(nlohmann::json value) {
        ProviderReply reply;
        reply.native = std::move(value);
        return reply;
    }
};

using DeltaCallback = std::function<void(const std::string&)>;

class IProvider {
public:
    virtual ~IProvider() = default;

    virtual std::string kind() const = 0;
    virtual std::string model() const = 0;
    virtual bool supports_native_tools() const { return false; }
    virtual core::config::NativeFormat native_format() const {
        return core::config::NativeFormat::OpenAI;
    }

    // Must return task_aborted once the request's cancel token fires.
    virtual core::errors::Result<ProviderReply> complete(const CompletionRequest& request) = 0;

    virtual core::errors::Result<ProviderReply> complete_stream(
        const CompletionRequest& request, const DeltaCallback& on_delta) {
        auto reply = complete(request);
        if (!core::errors::is_error(reply) && on_delta) {
            const auto& value = core::errors::get_value(reply);
            if (!value.is_native()) {
                on_delta(value.text);
            }
        }
        return reply;
    }
};

}  // namespace helm::providers
