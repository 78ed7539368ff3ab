#include <catch2/catch_test_macros.hpp>

#include <mcp_relay/mcp/mcp_server.hpp>

#include <stdexcept>

using namespace mcp_relay;

namespace {

ToolRegistry& MakeTestRegistry(ToolRegistry& registry) {
    registry.ReplaceAll({
        MakeDirectTool(
            ToolDescriptorBuilder("echo", "echo", "Echo the input")
                .Property("message", "string", "Text to echo")
                .Build(),
            [](const nlohmann::json& params) -> ToolResult {
                return TextResult(params.value("message", ""));
            }),
        MakeDirectTool(
            ToolDescriptorBuilder("fail", "fail", "Always fails").Build(),
            [](const nlohmann::json&) -> ToolResult {
                return TextResult("nope", true);
            }),
        MakeDirectTool(
            ToolDescriptorBuilder("throw", "throw", "Throws").Build(),
            [](const nlohmann::json&) -> ToolResult {
                throw std::runtime_error("exploded");
            }),
    });
    return registry;
}

nlohmann::json Request(int id, const std::string& method,
                       nlohmann::json params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

} // anonymous namespace

// ===========================================================================
// HandleMessage
// ===========================================================================

TEST_CASE("McpServer: initialize returns capabilities", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;

    auto response = server.HandleMessage(
        Request(1, "initialize", {{"protocolVersion", "2024-11-05"}}),
        MakeTestRegistry(registry));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "mcp-relay");
    CHECK(r["result"]["capabilities"].contains("tools"));
}

TEST_CASE("McpServer: server name is configurable", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server("playground");
    auto response = server.HandleMessage(Request(1, "initialize"), registry);
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["serverInfo"]["name"] == "playground");
}

TEST_CASE("McpServer: tools/list returns registered tools", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;

    auto response = server.HandleMessage(Request(2, "tools/list"),
                                         MakeTestRegistry(registry));
    REQUIRE(response.has_value());

    auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.is_array());
    REQUIRE(tools.size() == 3);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[0]["description"] == "Echo the input");
    CHECK(tools[0]["inputSchema"]["required"][0] == "message");
}

TEST_CASE("McpServer: tools/list on an empty registry", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;
    auto response = server.HandleMessage(Request(3, "tools/list"), registry);
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["tools"].empty());
}

TEST_CASE("McpServer: tools/call executes tool", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;

    auto response = server.HandleMessage(
        Request(4, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "hello"}}}}),
        MakeTestRegistry(registry));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["id"] == 4);
    CHECK(r["result"]["content"][0]["text"] == "hello");
    CHECK_FALSE(r["result"].contains("isError"));
}

TEST_CASE("McpServer: tools/call marks error results", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;

    auto response = server.HandleMessage(Request(5, "tools/call", {{"name", "fail"}}),
                                         MakeTestRegistry(registry));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["isError"] == true);
}

TEST_CASE("McpServer: tools/call with throwing handler", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;

    auto response = server.HandleMessage(Request(6, "tools/call", {{"name", "throw"}}),
                                         MakeTestRegistry(registry));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["isError"] == true);
    CHECK((*response)["result"]["content"][0]["text"] == "Tool error: exploded");
}

TEST_CASE("McpServer: tools/call unknown tool", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;

    auto response = server.HandleMessage(
        Request(7, "tools/call", {{"name", "nonexistent"}}), MakeTestRegistry(registry));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
    CHECK((*response)["error"]["message"] == "Unknown tool: nonexistent");
}

TEST_CASE("McpServer: tools/call without name", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;
    auto response = server.HandleMessage(Request(8, "tools/call"), registry);
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
}

TEST_CASE("McpServer: ping and unknown method", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;

    auto ping = server.HandleMessage(Request(9, "ping"), registry);
    REQUIRE(ping.has_value());
    CHECK((*ping)["result"].empty());

    auto unknown = server.HandleMessage(Request(10, "resources/list"), registry);
    REQUIRE(unknown.has_value());
    CHECK((*unknown)["error"]["code"] == -32601);
}

TEST_CASE("McpServer: notifications get no response", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;
    nlohmann::json msg = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    CHECK_FALSE(server.HandleMessage(msg, registry).has_value());
}

TEST_CASE("McpServer: wrong jsonrpc version", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;
    nlohmann::json msg = {{"jsonrpc", "1.0"}, {"id", 11}, {"method", "ping"}};
    auto response = server.HandleMessage(msg, registry);
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32600);
}

TEST_CASE("McpServer: mistyped method or params is an invalid request", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;

    auto numeric = server.HandleBody(R"({"jsonrpc":"2.0","id":1,"method":5})", registry);
    REQUIRE(numeric.has_value());
    CHECK(nlohmann::json::parse(*numeric)["error"]["code"] == -32600);

    auto missing = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 2}}, registry);
    REQUIRE(missing.has_value());
    CHECK((*missing)["error"]["code"] == -32600);
    CHECK((*missing)["id"] == 2);

    auto params = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"}, {"params", "echo"}}, registry);
    REQUIRE(params.has_value());
    CHECK((*params)["error"]["code"] == -32600);

    CHECK_FALSE(server.HandleBody(R"({"jsonrpc":"2.0","method":[]})", registry).has_value());
}

// ===========================================================================
// HandleBody
// ===========================================================================

TEST_CASE("McpServer::HandleBody: parse error", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;
    auto body = server.HandleBody("{not json", registry);
    REQUIRE(body.has_value());
    auto j = nlohmann::json::parse(*body);
    CHECK(j["error"]["code"] == -32700);
    CHECK(j["id"].is_null());
}

TEST_CASE("McpServer::HandleBody: request and notification", "[mcp][server]") {
    ToolRegistry registry;
    McpServer server;

    auto body = server.HandleBody(R"({"jsonrpc":"2.0","id":"a","method":"ping"})", registry);
    REQUIRE(body.has_value());
    CHECK(nlohmann::json::parse(*body)["id"] == "a");

    CHECK_FALSE(server.HandleBody(
        R"({"jsonrpc":"2.0","method":"notifications/cancelled"})", registry).has_value());
}

TEST_CASE("McpServer: MakeError and MakeResult shapes", "[mcp][server]") {
    auto err = McpServer::MakeError(1, -32601, "x");
    CHECK(err["jsonrpc"] == "2.0");
    CHECK(err["error"]["message"] == "x");

    auto res = McpServer::MakeResult("id", {{"k", "v"}});
    CHECK(res["id"] == "id");
    CHECK(res["result"]["k"] == "v");
}
