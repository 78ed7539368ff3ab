#include <catch2/catch_test_macros.hpp>

#include <mcp_relay/chat/chat_forwarder.hpp>

#include "../../test/mocks/mock_http_client.hpp"
#include "../../test/mocks/mock_tool_client.hpp"

#include <memory>

using namespace mcp_relay;
using namespace mcp_relay::testing;
using json = nlohmann::json;

namespace {

std::vector<ToolDescriptor> WeatherTools() {
    return {ToolDescriptorBuilder("weather", "weather", "Current weather")
                .Property("city", "string", "City name")
                .Build()};
}

json UserRequest() {
    return json{{"model", "local"},
                {"stream", true},
                {"messages", json::array({{{"role", "user"}, {"content", "Weather in Bonn?"}}})}};
}

std::string FinalAnswer(const std::string& text) {
    return json{{"choices", json::array({{{"index", 0},
        {"message", {{"role", "assistant"}, {"content", text}}},
        {"finish_reason", "stop"}}})}}.dump();
}

std::string ToolCallAnswer(const std::string& id, const std::string& arguments) {
    json call = {{"id", id}, {"type", "function"},
                 {"function", {{"name", "weather"}, {"arguments", arguments}}}};
    return json{{"choices", json::array({{{"index", 0},
        {"message", {{"role", "assistant"}, {"content", nullptr},
                     {"tool_calls", json::array({call})}}},
        {"finish_reason", "tool_calls"}}})}}.dump();
}

struct Fixture {
    std::shared_ptr<MockHttpClient> llm = std::make_shared<MockHttpClient>("http://127.0.0.1:8080");
    MockToolClient tools{WeatherTools()};
    ChatForwarder forwarder{llm, ChatOptions{2, "/v1/chat/completions"}};
};

} // anonymous namespace

// ===========================================================================
// Forward
// ===========================================================================

TEST_CASE("ChatForwarder: direct answer is returned as is", "[chat]") {
    Fixture f;
    f.llm->EnqueuePostOk(200, FinalAnswer("Sunny."));

    auto result = f.forwarder.Forward(UserRequest(), f.tools);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["choices"][0]["message"]["content"] == "Sunny.");

    REQUIRE(f.llm->PostCallCount() == 1);
    const auto& call = f.llm->PostCalls()[0];
    CHECK(call.path == "/v1/chat/completions");
    auto sent = json::parse(call.body);
    CHECK(sent["stream"] == false);
    CHECK(sent["model"] == "local");
    REQUIRE(sent["tools"].size() == 1);
    CHECK(sent["tools"][0]["function"]["name"] == "weather");
    CHECK(f.tools.Calls().empty());
}

TEST_CASE("ChatForwarder: tool calls run through the session client", "[chat]") {
    Fixture f;
    f.tools.SetResult("weather", Result<ToolResult, Error>::Ok(TextResult("rain")));
    f.llm->EnqueuePostOk(200, ToolCallAnswer("call_1", R"({"city":"Bonn"})"));
    f.llm->EnqueuePostOk(200, FinalAnswer("It rains in Bonn."));

    auto result = f.forwarder.Forward(UserRequest(), f.tools);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["choices"][0]["message"]["content"] == "It rains in Bonn.");

    REQUIRE(f.tools.Calls().size() == 1);
    CHECK(f.tools.Calls()[0].name == "weather");
    CHECK(f.tools.Calls()[0].arguments["city"] == "Bonn");

    REQUIRE(f.llm->PostCallCount() == 2);
    auto second = json::parse(f.llm->PostCalls()[1].body);
    auto& messages = second["messages"];
    REQUIRE(messages.size() == 3);
    CHECK(messages[1]["role"] == "assistant");
    CHECK(messages[2]["role"] == "tool");
    CHECK(messages[2]["tool_call_id"] == "call_1");
    CHECK(messages[2]["name"] == "weather");
    CHECK(messages[2]["content"] == "rain");
}

TEST_CASE("ChatForwarder: invalid tool arguments become a tool message", "[chat]") {
    Fixture f;
    f.llm->EnqueuePostOk(200, ToolCallAnswer("call_1", "{not json"));
    f.llm->EnqueuePostOk(200, FinalAnswer("done"));

    REQUIRE(f.forwarder.Forward(UserRequest(), f.tools).IsOk());
    auto messages = json::parse(f.llm->PostCalls()[1].body)["messages"];
    CHECK(messages[2]["content"] == "Tool error: arguments are not valid JSON");
    CHECK(f.tools.Calls().empty());
}

TEST_CASE("ChatForwarder: unknown tool result is reported to the model", "[chat]") {
    Fixture f;
    f.llm->EnqueuePostOk(200, ToolCallAnswer("call_1", "{}"));
    f.llm->EnqueuePostOk(200, FinalAnswer("done"));

    REQUIRE(f.forwarder.Forward(UserRequest(), f.tools).IsOk());
    auto messages = json::parse(f.llm->PostCalls()[1].body)["messages"];
    CHECK(messages[2]["content"] == "Tool error: Tool not registered: weather");
}

TEST_CASE("ChatForwarder: round limit returns the last response", "[chat]") {
    Fixture f;
    f.tools.SetResult("weather", Result<ToolResult, Error>::Ok(TextResult("rain")));
    for (int i = 0; i < 3; ++i) {
        f.llm->EnqueuePostOk(200, ToolCallAnswer("call_" + std::to_string(i), "{}"));
    }

    auto result = f.forwarder.Forward(UserRequest(), f.tools);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["choices"][0]["finish_reason"] == "tool_calls");
    CHECK(f.llm->PostCallCount() == 3);
    CHECK(f.tools.Calls().size() == 2);
}

// ===========================================================================
// Errors
// ===========================================================================

TEST_CASE("ChatForwarder: not configured", "[chat]") {
    ChatForwarder forwarder(nullptr);
    MockToolClient tools;
    CHECK_FALSE(forwarder.IsConfigured());
    auto result = forwarder.Forward(UserRequest(), tools);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("ChatForwarder: request without messages", "[chat]") {
    Fixture f;
    auto result = f.forwarder.Forward(json{{"model", "x"}}, f.tools);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::MalformedMessage);
    CHECK(f.llm->PostCallCount() == 0);
}

TEST_CASE("ChatForwarder: upstream failures", "[chat]") {
    Fixture f;

    SECTION("error status") {
        f.llm->EnqueuePostOk(503, "overloaded");
        auto result = f.forwarder.Forward(UserRequest(), f.tools);
        REQUIRE(result.IsErr());
        CHECK(result.Error().http_status == 503);
        CHECK(result.Error().endpoint == "http://127.0.0.1:8080/v1/chat/completions");
    }
    SECTION("transport error") {
        f.llm->EnqueuePost(Result<HttpResponse, Error>::Err(
            Error::Make(ErrorCategory::Internal, "HttpPost", "connection refused")));
        auto result = f.forwarder.Forward(UserRequest(), f.tools);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Upstream);
        CHECK(result.Error().HttpStatus() == 502);
    }
    SECTION("invalid JSON") {
        f.llm->EnqueuePostOk(200, "<html>");
        auto result = f.forwarder.Forward(UserRequest(), f.tools);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Upstream);
    }
}

TEST_CASE("ChatForwarder: tools are omitted when the session has none", "[chat]") {
    auto llm = std::make_shared<MockHttpClient>();
    ChatForwarder forwarder(llm);
    MockToolClient tools;
    llm->EnqueuePostOk(200, FinalAnswer("hi"));

    REQUIRE(forwarder.Forward(UserRequest(), tools).IsOk());
    CHECK_FALSE(json::parse(llm->PostCalls()[0].body).contains("tools"));
}

// ===========================================================================
// Static endpoints and helpers
// ===========================================================================

TEST_CASE("ChatForwarder: props and slots", "[chat]") {
    auto props = ChatForwarder::Props();
    CHECK(props["default_generation_settings"]["n_ctx"] == 32768);
    CHECK(props["total_slots"] == 1);

    auto slots = ChatForwarder::Slots();
    REQUIRE(slots.size() == 1);
    CHECK(slots[0]["id"] == 0);
    CHECK(slots[0]["is_processing"] == false);
}

TEST_CASE("ContentToText", "[chat]") {
    CHECK(ContentToText(json::array({{{"type", "text"}, {"text", "a"}},
                                     {{"type", "image"}, {"data", "x"}},
                                     {{"type", "text"}, {"text", "b"}}})) == "a\nb");
    CHECK(ContentToText(json::array()) == "[]");
    CHECK(ContentToText(json::array({{{"type", "image"}}})) == R"([{"type":"image"}])");
}
