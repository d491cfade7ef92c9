#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "providers/provider.hpp"

namespace helm::testing {

// Replays a fixed script of replies and records every request it receives.
class FakeProvider : public providers::IProvider {
public:
    using Hook = std::function<void(const providers::CompletionRequest&, std::size_t index)>;

    explicit FakeProvider(bool native_tools = false,
                          core::config::NativeFormat format = core::config::NativeFormat::OpenAI)
        : native_tools_(native_tools), format_(format) {}

    FakeProvider& reply_text(std::string text) {
        script_.emplace_back(providers::ProviderReply::from_text(std::move(text)));
        return *this;
    }

    FakeProvider& reply_native(nlohmann::json native) {
        script_.emplace_back(providers::ProviderReply::from_native(std::move(native)));
        return *this;
    }

    FakeProvider& reply_error(core::errors::AgentError error) {
        script_.emplace_back(std::move(error));
        return *this;
    }

    void set_hook(Hook hook) { hook_ = std::move(hook); }

    std::string kind() const override { return "fake"; }
    std::string model() const override { return "fake-model"; }
    bool supports_native_tools() const override { return native_tools_; }
    core::config::NativeFormat native_format() const override { return format_; }

    core::errors::Result<providers::ProviderReply> complete(
        const providers::CompletionRequest& request) override {
        const std::size_t index = requests_.size();
        requests_.push_back(request);
        if (hook_) {
            hook_(request, index);
        }
        if (index >= script_.size()) {
            return core::errors::AgentError{core::errors::ErrorCategory::Provider,
                                            "Fake provider script exhausted",
                                            "script_exhausted"};
        }
        return script_[index];
    }

    std::size_t call_count() const { return requests_.size(); }
    const std::vector<providers::CompletionRequest>& requests() const { return requests_; }

private:
    bool native_tools_ = false;
    core::config::NativeFormat format_;
    std::vector<core::errors::Result<providers::ProviderReply>> script_;
    std::vector<providers::CompletionRequest> requests_;
    Hook hook_;
};

inline std::string final_json(const std::string& message) {
    return nlohmann::json{{"type", "final"}, {"message", message}}.dump();
}

inline std::string tool_use_json(const std::string& tool, const nlohmann::json& input) {
    return nlohmann::json{{"type", "tool_use"}, {"tool", tool}, {"input", input}}.dump();
}

}  // namespace helm::testing
