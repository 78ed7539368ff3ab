#include <catch2/catch_test_macros.hpp>

#include <mcp_relay/mcp/mcp_http_client.hpp>

#include "../../test/mocks/mock_http_client.hpp"

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

struct Fixture {
    std::shared_ptr<MockHttpClient> http = std::make_shared<MockHttpClient>();
    McpHttpClient client{http, "/mcp/", "MCP_RELAY_USER_ID=user_9", WeatherTools()};
};

} // anonymous namespace

// ===========================================================================
// Tool set
// ===========================================================================

TEST_CASE("McpHttpClient: OpenAI tool entries", "[mcp][client]") {
    Fixture f;
    auto tools = f.client.OpenAiTools();
    REQUIRE(tools.size() == 1);
    CHECK(tools[0]["type"] == "function");
    CHECK(tools[0]["function"]["name"] == "weather");
    CHECK(tools[0]["function"]["description"] == "Current weather");
    CHECK(tools[0]["function"]["parameters"]["properties"]["city"]["type"] == "string");
}

TEST_CASE("McpHttpClient: HasTool and EndpointUrl", "[mcp][client]") {
    Fixture f;
    CHECK(f.client.HasTool("weather"));
    CHECK_FALSE(f.client.HasTool("stocks"));
    CHECK(f.client.EndpointUrl() == "http://127.0.0.1:8090/mcp/");
    CHECK(f.client.Tools().size() == 1);
}

// ===========================================================================
// CallTool
// ===========================================================================

TEST_CASE("McpHttpClient: CallTool posts tools/call with the cookie", "[mcp][client]") {
    Fixture f;
    f.http->EnqueuePostOk(200, R"({"jsonrpc":"2.0","id":1,"result":{
        "content":[{"type":"text","text":"sunny"}]}})");

    auto result = f.client.CallTool("weather", json{{"city", "Bonn"}});
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().is_error);
    CHECK(result.Value().content[0]["text"] == "sunny");

    REQUIRE(f.http->PostCallCount() == 1);
    const auto& call = f.http->PostCalls()[0];
    CHECK(call.path == "/mcp/");
    CHECK(call.content_type == "application/json");
    CHECK(call.headers.at("Cookie") == "MCP_RELAY_USER_ID=user_9");
    auto body = json::parse(call.body);
    CHECK(body["method"] == "tools/call");
    CHECK(body["params"]["name"] == "weather");
    CHECK(body["params"]["arguments"]["city"] == "Bonn");
}

TEST_CASE("McpHttpClient: request ids increase", "[mcp][client]") {
    Fixture f;
    f.http->EnqueuePostOk(200, R"({"jsonrpc":"2.0","id":1,"result":{"content":[]}})");
    f.http->EnqueuePostOk(200, R"({"jsonrpc":"2.0","id":2,"result":{"content":[]}})");
    REQUIRE(f.client.CallTool("weather", json::object()).IsOk());
    REQUIRE(f.client.CallTool("weather", json::object()).IsOk());

    auto first = json::parse(f.http->PostCalls()[0].body)["id"].get<int64_t>();
    auto second = json::parse(f.http->PostCalls()[1].body)["id"].get<int64_t>();
    CHECK(second > first);
}

TEST_CASE("McpHttpClient: isError is carried through", "[mcp][client]") {
    Fixture f;
    f.http->EnqueuePostOk(200, R"({"jsonrpc":"2.0","id":1,"result":{
        "content":[{"type":"text","text":"bad"}],"isError":true}})");
    auto result = f.client.CallTool("weather", json::object());
    REQUIRE(result.IsOk());
    CHECK(result.Value().is_error);
}

TEST_CASE("McpHttpClient: unregistered tool is not sent", "[mcp][client]") {
    Fixture f;
    auto result = f.client.CallTool("stocks", json::object());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UnknownTool);
    CHECK(f.http->PostCallCount() == 0);
}

TEST_CASE("McpHttpClient: failures", "[mcp][client]") {
    Fixture f;

    SECTION("HTTP error status") {
        f.http->EnqueuePostOk(400, "unknown user-id");
        auto result = f.client.CallTool("weather", json::object());
        REQUIRE(result.IsErr());
        CHECK(result.Error().http_status == 400);
    }
    SECTION("JSON-RPC error") {
        f.http->EnqueuePostOk(200,
            R"({"jsonrpc":"2.0","id":1,"error":{"code":-32602,"message":"Unknown tool: weather"}})");
        auto result = f.client.CallTool("weather", json::object());
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Upstream);
        CHECK(result.Error().message == "Unknown tool: weather");
    }
    SECTION("invalid JSON") {
        f.http->EnqueuePostOk(200, "<html>");
        auto result = f.client.CallTool("weather", json::object());
        REQUIRE(result.IsErr());
        CHECK(result.Error().endpoint == "http://127.0.0.1:8090/mcp/");
    }
    SECTION("transport error") {
        f.http->EnqueuePost(Result<HttpResponse, Error>::Err(
            Error::Make(ErrorCategory::Upstream, "HttpPost", "refused")));
        auto result = f.client.CallTool("weather", json::object());
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "refused");
    }
}
