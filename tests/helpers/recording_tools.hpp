#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/tool_registry.hpp"

namespace helm::testing {

struct RecordedCall {
    tools::ToolId id;
    nlohmann::json input;
};

// Registry whose handlers record their inputs and answer from a responder.
class RecordingTools {
public:
    using Responder = std::function<core::errors::Result<tools::ToolOutput>(
        const nlohmann::json& input, const tools::ToolInvocation& invocation)>;

    RecordingTools& add(tools::ToolId id, Responder responder) {
        auto calls = calls_;
        registry_->register_tool(
            id, tools::ToolDefinition{"test tool " + tools::to_string(id), nlohmann::json::object()},
            [calls, id, responder](const nlohmann::json& input,
                                   const tools::ToolInvocation& invocation) {
                calls->push_back(RecordedCall{id, input});
                return responder(input, invocation);
            });
        return *this;
    }

    RecordingTools& add_fixed(tools::ToolId id, const std::string& text) {
        return add(id, [text](const nlohmann::json&, const tools::ToolInvocation&)
                           -> core::errors::Result<tools::ToolOutput> {
            return tools::ToolOutput{text, false};
        });
    }

    std::shared_ptr<const tools::ToolRegistry> registry() const { return registry_; }
    const std::vector<RecordedCall>& calls() const { return *calls_; }

private:
    std::shared_ptr<tools::ToolRegistry> registry_ = std::make_shared<tools::ToolRegistry>();
    std::shared_ptr<std::vector<RecordedCall>> calls_ =
        std::make_shared<std::vector<RecordedCall>>();
};

}  // namespace helm::testing
