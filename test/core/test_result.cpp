#include <catch2/catch_test_macros.hpp>

#include <mcp_relay/core/result.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace mcp_relay;

// ===========================================================================
// Result<T, E>
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: ValueOr falls back on Err", "[result]") {
    CHECK(Result<int, std::string>::Ok(42).ValueOr(0) == 42);
    CHECK(Result<int, std::string>::Err("fail").ValueOr(99) == 99);
}

TEST_CASE("Result: Map transforms value and passes Err through", "[result]") {
    auto ok = Result<int, std::string>::Ok(7).Map([](int v) { return std::to_string(v * 3); });
    REQUIRE(ok.IsOk());
    CHECK(ok.Value() == "21");

    bool called = false;
    auto err = Result<int, std::string>::Err("nope").Map([&called](int v) {
        called = true;
        return v;
    });
    CHECK_FALSE(called);
    CHECK(err.Error() == "nope");
}

TEST_CASE("Result: move-only value can be moved out", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(5));
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 5);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, std::string>::Err("broken");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "broken");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: Make sets category, operation and message", "[result][error]") {
    auto e = Error::Make(ErrorCategory::UnknownSession, "FindSession", "unknown user-id");
    CHECK(e.category == ErrorCategory::UnknownSession);
    CHECK(e.operation == "FindSession");
    CHECK(e.message == "unknown user-id");
    CHECK_FALSE(e.http_status.has_value());
    CHECK(e.CategoryName() == "unknown_session");
}

TEST_CASE("Error: HttpStatus maps caller errors to 400", "[result][error]") {
    CHECK(Error::Make(ErrorCategory::UnknownSession, "op", "m").HttpStatus() == 400);
    CHECK(Error::Make(ErrorCategory::MalformedMessage, "op", "m").HttpStatus() == 400);
    CHECK(Error::Make(ErrorCategory::InvalidToolDefinition, "op", "m").HttpStatus() == 400);
    CHECK(Error::Make(ErrorCategory::UnknownTool, "op", "m").HttpStatus() == 400);
    CHECK(Error::Make(ErrorCategory::Upstream, "op", "m").HttpStatus() == 502);
    CHECK(Error::Make(ErrorCategory::TimedOut, "op", "m").HttpStatus() == 500);
    CHECK(Error::Make(ErrorCategory::Internal, "op", "m").HttpStatus() == 500);
}

TEST_CASE("Error: ExitCode distinguishes config and io", "[result][error]") {
    CHECK(Error::Make(ErrorCategory::Config, "op", "m").ExitCode() == 2);
    CHECK(Error::Make(ErrorCategory::Io, "op", "m").ExitCode() == 3);
    CHECK(Error::Make(ErrorCategory::Internal, "op", "m").ExitCode() == 99);
}

TEST_CASE("Error: FromUpstreamStatus extracts OpenAI error message", "[result][error]") {
    auto e = Error::FromUpstreamStatus("ChatCompletion", "http://llm/v1/chat/completions",
                                       500, R"({"error":{"message":"model not loaded"}})");
    CHECK(e.category == ErrorCategory::Upstream);
    CHECK(e.http_status == 500);
    CHECK(e.message == "Upstream server error");
    REQUIRE(e.detail.has_value());
    CHECK(*e.detail == "model not loaded");
}

TEST_CASE("Error: FromUpstreamStatus keeps plain text body as detail", "[result][error]") {
    auto e = Error::FromUpstreamStatus("McpRpc", "", 404, "no such path");
    CHECK(e.message == "Upstream endpoint not found");
    CHECK(e.detail == std::optional<std::string>("no such path"));
}

TEST_CASE("Error: ToString includes endpoint, status and detail", "[result][error]") {
    auto e = Error::FromUpstreamStatus("McpRpc", "http://127.0.0.1:8090/mcp/", 429, "slow down");
    auto s = e.ToString();
    CHECK(s.find("McpRpc") != std::string::npos);
    CHECK(s.find("[http://127.0.0.1:8090/mcp/]") != std::string::npos);
    CHECK(s.find("(HTTP 429)") != std::string::npos);
    CHECK(s.find("slow down") != std::string::npos);
}

TEST_CASE("Error: ToJson produces an error object", "[result][error]") {
    auto e = Error::Make(ErrorCategory::InvalidToolDefinition, "DefineTools", "no title");
    auto j = nlohmann::json::parse(e.ToJson());
    REQUIRE(j.contains("error"));
    CHECK(j["error"]["category"] == "invalid_tool_definition");
    CHECK(j["error"]["operation"] == "DefineTools");
    CHECK(j["error"]["message"] == "no title");
    CHECK_FALSE(j["error"].contains("http_status"));
}

TEST_CASE("Error: equality compares all fields", "[result][error]") {
    auto a = Error::Make(ErrorCategory::Io, "Read", "gone");
    auto b = a;
    CHECK(a == b);
    b.detail = "more";
    CHECK(a != b);
}
