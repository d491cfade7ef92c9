#pragma once

#include <memory>
#include <string>
#include "core/config/agent_settings.hpp"
#include "providers/http_client.hpp"
#include "providers/provider.hpp"

namespace helm::providers {

// Anthropic Messages API. The system prompt travels in the top-level
// "system" field, never as a message.
class AnthropicProvider final : public IProvider {
public:
    AnthropicProvider(core::config::ProviderSettings settings, bool native_tools,
                      std::shared_ptr<HttpClient> http_client);

    std::string kind() const override { return "anthropic"; }
    std::string model() const override { return settings_.model; }
    bool supports_native_tools() const override { return native_tools_; }
    core::config::NativeFormat native_format() const override {
        return core::config::NativeFormat::Anthropic;
    }

    core::errors::Result<ProviderReply> complete(const CompletionRequest& request) override;

    nlohmann::json build_body(const CompletionRequest& request) const;

private:
    core::config::ProviderSettings settings_;
    bool native_tools_ = false;
    std::shared_ptr<HttpClient> http_client_;
};

}  // namespace helm::providers
