#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "providers/anthropic_provider.hpp"
#include "providers/http_client.hpp"
#include "providers/openai_compatible_provider.hpp"

namespace {

using helm::core::config::ProviderSettings;
using helm::core::errors::ErrorCategory;
using helm::core::errors::get_error;
using helm::core::errors::get_value;
using helm::core::errors::is_error;
using helm::providers::AnthropicProvider;
using helm::providers::CompletionRequest;
using helm::providers::HttpRequest;
using helm::providers::HttpResponse;
using helm::providers::OpenAiCompatibleProvider;
using nlohmann::json;

// Records requests and answers with a canned response.
class FakeHttpClient : public helm::providers::HttpClient {
public:
    explicit FakeHttpClient(HttpResponse response) : response_(std::move(response)) {}

    HttpResponse post(const HttpRequest& request) override {
        requests.push_back(request);
        return response_;
    }

    std::string header(const std::string& name) const {
        for (const auto& [key, value] : requests.back().headers) {
            if (key == name) {
                return value;
            }
        }
        return "";
    }

    std::vector<HttpRequest> requests;

private:
    HttpResponse response_;
};

HttpResponse ok(const json& body) {
    HttpResponse response;
    response.status = 200;
    response.body = body.dump();
    return response;
}

ProviderSettings settings(const std::string& base_url) {
    ProviderSettings value;
    value.base_url = base_url;
    value.model = "test-model";
    value.api_key = "sk-test";
    value.timeout_ms = 1234;
    return value;
}

json openai_reply(const json& message) {
    return {{"choices", json::array({{{"index", 0}, {"message", message}}})}};
}

TEST(OpenAiCompatibleProviderTest, TextModeSendsSystemAndPrompt) {
    auto http = std::make_shared<FakeHttpClient>(
        ok(openai_reply({{"role", "assistant"}, {"content", "{\"type\":\"final\",\"message\":\"hi\"}"}})));
    OpenAiCompatibleProvider provider(settings("http://localhost:8080/v1/"), false, http);

    CompletionRequest request;
    request.system_prompt = "be brief";
    request.prompt = "USER: hello";
    auto result = provider.complete(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).is_native());
    EXPECT_EQ(get_value(result).text, "{\"type\":\"final\",\"message\":\"hi\"}");

    ASSERT_EQ(http->requests.size(), 1u);
    const auto& sent = http->requests[0];
    EXPECT_EQ(sent.url, "http://localhost:8080/v1/chat/completions");
    EXPECT_EQ(sent.timeout_ms, 1234u);
    EXPECT_EQ(http->header("Authorization"), "Bearer sk-test");

    const json body = json::parse(sent.body);
    EXPECT_EQ(body["model"], "test-model");
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "system");
    EXPECT_EQ(body["messages"][1]["content"], "USER: hello");
    EXPECT_FALSE(body.contains("tools"));
}

TEST(OpenAiCompatibleProviderTest, NativeModeReturnsTheMessage) {
    const json message = {
        {"role", "assistant"},
        {"content", nullptr},
        {"tool_calls",
         json::array({{{"id", "call_1"},
                       {"type", "function"},
                       {"function", {{"name", "read_file"}, {"arguments", "{\"path\":\"a\"}"}}}}})}};
    auto http = std::make_shared<FakeHttpClient>(ok(openai_reply(message)));
    OpenAiCompatibleProvider provider(settings("http://localhost:8080/v1"), true, http);
    EXPECT_TRUE(provider.supports_native_tools());

    CompletionRequest request;
    request.messages = json::array({{{"role", "user"}, {"content", "read a"}}});
    request.tools = json::array({{{"type", "function"}, {"function", {{"name", "read_file"}}}}});
    auto result = provider.complete(request);
    ASSERT_FALSE(is_error(result));
    ASSERT_TRUE(get_value(result).is_native());
    EXPECT_EQ(get_value(result).native.value(), message);

    const json body = json::parse(http->requests[0].body);
    EXPECT_EQ(body["messages"], request.messages.value());
    EXPECT_EQ(body["tools"].size(), 1u);
}

TEST(OpenAiCompatibleProviderTest, OmitsAuthorizationWithoutKey) {
    auto http = std::make_shared<FakeHttpClient>(ok(openai_reply({{"content", "x"}})));
    auto no_key = settings("http://localhost:8080/v1");
    no_key.api_key.clear();
    OpenAiCompatibleProvider provider(no_key, false, http);

    ASSERT_FALSE(is_error(provider.complete(CompletionRequest{})));
    EXPECT_EQ(http->header("Authorization"), "");
}

TEST(OpenAiCompatibleProviderTest, MalformedBodiesAreInvalidResponses) {
    for (const std::string body : {"not json", "{}", R"({"choices":[]})", R"({"choices":[{}]})"}) {
        HttpResponse response;
        response.status = 200;
        response.body = body;
        OpenAiCompatibleProvider provider(settings("http://h/v1"), false,
                                          std::make_shared<FakeHttpClient>(response));
        auto result = provider.complete(CompletionRequest{});
        ASSERT_TRUE(is_error(result)) << body;
        EXPECT_EQ(get_error(result).code, "provider_invalid_response");
    }
}

TEST(OpenAiCompatibleProviderTest, CancelledTokenSkipsTheRequest) {
    auto http = std::make_shared<FakeHttpClient>(ok(openai_reply({{"content", "x"}})));
    OpenAiCompatibleProvider provider(settings("http://h/v1"), false, http);

    CompletionRequest request;
    request.cancel_token = std::make_shared<std::atomic_bool>(true);
    auto result = provider.complete(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "task_aborted");
    EXPECT_TRUE(http->requests.empty());
}

TEST(AnthropicProviderTest, MovesSystemMessagesToTheSystemField) {
    const json reply = {{"content", json::array({{{"type", "text"}, {"text", "done"}}})}};
    auto http = std::make_shared<FakeHttpClient>(ok(reply));
    AnthropicProvider provider(settings("https://api.anthropic.com/v1"), true, http);

    CompletionRequest request;
    request.messages = json::array({{{"role", "system"}, {"content", "rules"}},
                                    {{"role", "user"}, {"content", "hi"}}});
    auto result = provider.complete(request);
    ASSERT_FALSE(is_error(result));
    ASSERT_TRUE(get_value(result).is_native());
    EXPECT_EQ(get_value(result).native.value(), reply);

    const auto& sent = http->requests[0];
    EXPECT_EQ(sent.url, "https://api.anthropic.com/v1/messages");
    EXPECT_EQ(http->header("x-api-key"), "sk-test");
    EXPECT_EQ(http->header("anthropic-version"), "2023-06-01");

    const json body = json::parse(sent.body);
    EXPECT_EQ(body["system"], "rules");
    EXPECT_EQ(body["max_tokens"], 4096);
    ASSERT_EQ(body["messages"].size(), 1u);
    EXPECT_EQ(body["messages"][0]["role"], "user");
}

TEST(AnthropicProviderTest, TextModeJoinsTextBlocks) {
    const json reply = {{"content", json::array({{{"type", "text"}, {"text", "part one, "}},
                                                 {{"type", "tool_use"}, {"id", "x"}},
                                                 {{"type", "text"}, {"text", "part two"}}})}};
    auto http = std::make_shared<FakeHttpClient>(ok(reply));
    AnthropicProvider provider(settings("https://api.anthropic.com/v1"), false, http);

    CompletionRequest request;
    request.system_prompt = "rules";
    request.prompt = "hi";
    auto result = provider.complete(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).text, "part one, part two");

    const json body = json::parse(http->requests[0].body);
    EXPECT_EQ(body["system"], "rules");
    EXPECT_EQ(body["messages"][0]["content"], "hi");
}

TEST(HttpFailureTest, MapsTransportOutcomes) {
    HttpResponse success;
    success.status = 204;
    EXPECT_FALSE(helm::providers::http_failure(success, "Model endpoint").has_value());

    HttpResponse cancelled;
    cancelled.cancelled = true;
    const auto abort = helm::providers::http_failure(cancelled, "Model endpoint");
    ASSERT_TRUE(abort.has_value());
    EXPECT_EQ(abort->category, ErrorCategory::Cancelled);

    HttpResponse timeout;
    timeout.timeout = true;
    EXPECT_EQ(helm::providers::http_failure(timeout, "Model endpoint")->code, "provider_timeout");

    HttpResponse unreachable;
    unreachable.network_error = true;
    unreachable.error_message = "Couldn't connect to server";
    const auto network = helm::providers::http_failure(unreachable, "Model endpoint");
    ASSERT_TRUE(network.has_value());
    EXPECT_EQ(network->code, "provider_unreachable");
    EXPECT_NE(network->message.find("Couldn't connect"), std::string::npos);
}

TEST(HttpFailureTest, HttpErrorsCarryATruncatedBody) {
    HttpResponse denied;
    denied.status = 401;
    denied.body = R"({"error":"bad key"})";
    const auto auth = helm::providers::http_failure(denied, "Model endpoint");
    ASSERT_TRUE(auth.has_value());
    EXPECT_EQ(auth->code, "provider_http_error");
    EXPECT_EQ(auth->hint, "Check HELM_API_KEY.");
    EXPECT_NE(auth->message.find("HTTP 401"), std::string::npos);

    HttpResponse server;
    server.status = 500;
    server.body = std::string(2000, 'e');
    const auto failure = helm::providers::http_failure(server, "Model endpoint");
    ASSERT_TRUE(failure.has_value());
    EXPECT_TRUE(failure->hint.empty());
    EXPECT_LT(failure->message.size(), 600u);
}

TEST(ProviderTest, StreamingFallbackDeliversTextOnce) {
    auto http = std::make_shared<FakeHttpClient>(ok(openai_reply({{"content", "streamed"}})));
    OpenAiCompatibleProvider provider(settings("http://h/v1"), false, http);

    std::vector<std::string> deltas;
    auto result = provider.complete_stream(
        CompletionRequest{}, [&deltas](const std::string& delta) { deltas.push_back(delta); });
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(deltas.size(), 1u);
    EXPECT_EQ(deltas[0], "streamed");
}

}  // namespace
