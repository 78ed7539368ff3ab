#include <catch2/catch_test_macros.hpp>

#include <mcp_relay/builtin/glossary_tool.hpp>

#include <memory>
#include <sstream>

using namespace mcp_relay;
using json = nlohmann::json;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));
    return test_root + "/testdata/" + filename;
}

Glossary LoadTestGlossary() {
    auto result = Glossary::Load(TestDataPath("glossary.md"));
    REQUIRE(result.IsOk());
    return std::move(result).Value();
}

} // anonymous namespace

// ===========================================================================
// Glossary
// ===========================================================================

TEST_CASE("Glossary: Load parses terms and references", "[builtin][glossary]") {
    auto glossary = LoadTestGlossary();
    CHECK(glossary.Size() == 3);

    const auto* mcp = glossary.Find("MCP");
    REQUIRE(mcp != nullptr);
    CHECK(mcp->term == "MCP");
    CHECK(mcp->description == "Model Context Protocol.\nConnects language models to tools.");

    const auto* alias = glossary.Find("large language model");
    REQUIRE(alias != nullptr);
    CHECK(alias->term == "LLM");
}

TEST_CASE("Glossary: lookup ignores case, spaces, dashes and underscores", "[builtin][glossary]") {
    auto glossary = LoadTestGlossary();
    CHECK(glossary.Find("tool_call") != nullptr);
    CHECK(glossary.Find("Tool-Call") != nullptr);
    CHECK(glossary.Find("toolcall") != nullptr);
    CHECK(glossary.Find("unknown") == nullptr);
    CHECK(Glossary::Key("Tool Call_x-y") == "toolcallxy");
}

TEST_CASE("Glossary: duplicate key keeps the first entry", "[builtin][glossary]") {
    auto glossary = LoadTestGlossary();
    const auto* mcp = glossary.Find("mcp");
    REQUIRE(mcp != nullptr);
    CHECK(mcp->term == "MCP");
}

TEST_CASE("Glossary: Explain orders and deduplicates", "[builtin][glossary]") {
    auto glossary = LoadTestGlossary();
    auto text = glossary.Explain("llm, MCP, large language model, nothing");
    CHECK(text == "# LLM\nLarge language model.\n\n"
                  "# MCP\nModel Context Protocol.\nConnects language models to tools.");
}

TEST_CASE("Glossary: Explain with no known word", "[builtin][glossary]") {
    auto glossary = LoadTestGlossary();
    CHECK(glossary.Explain("foo, bar") == kGlossaryUnknownText);
    CHECK(glossary.Explain("") == kGlossaryUnknownText);
}

TEST_CASE("Glossary: Parse skips terms without description", "[builtin][glossary]") {
    std::istringstream in("preamble\n# Empty\n\n# Term\r\nText\r\n");
    auto glossary = Glossary::Parse(in);
    CHECK(glossary.Size() == 1);
    REQUIRE(glossary.Find("term") != nullptr);
    CHECK(glossary.Find("term")->description == "Text");
}

TEST_CASE("Glossary: Load of a missing file", "[builtin][glossary]") {
    auto result = Glossary::Load("/nonexistent/glossary.md");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Io);
}

// ===========================================================================
// glossary-tool
// ===========================================================================

TEST_CASE("MakeGlossaryTool: answers a word list", "[builtin][glossary]") {
    auto glossary = std::make_shared<const Glossary>(LoadTestGlossary());
    auto tool = MakeGlossaryTool(glossary, "Explains words");

    CHECK(tool.Name() == kGlossaryToolName);
    CHECK(tool.descriptor.description == "Explains words");
    CHECK(tool.descriptor.input_schema.IsRequired("words"));

    auto result = tool.handler(json{{"words", "LLM"}});
    CHECK_FALSE(result.is_error);
    CHECK(result.content[0]["text"] == "# LLM\nLarge language model.");

    auto from_array = tool.handler(json{{"words", json::array({"llm", "mcp"})}});
    CHECK(from_array.content[0]["text"].get<std::string>().find("# MCP") != std::string::npos);
}

TEST_CASE("MakeGlossaryTool: missing words argument throws", "[builtin][glossary]") {
    auto glossary = std::make_shared<const Glossary>(LoadTestGlossary());
    auto tool = MakeGlossaryTool(glossary, "Explains words");
    CHECK_THROWS_AS(tool.handler(json::object()), std::invalid_argument);
}
