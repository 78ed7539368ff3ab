#pragma once

#include <mcp_relay/core/result.hpp>
#include <mcp_relay/registry/tool_registry.hpp>

#include <istream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// Glossary — terms read from a markdown file:
//
//   # TERM
//   description lines...
//
//   # ALIAS
//   -> TERM
//
// Lookup keys are the lowercase term without spaces, '_' and '-'.
// ---------------------------------------------------------------------------
class Glossary {
public:
    struct Entry {
        std::string term;
        std::string description;
    };

    static Result<Glossary, Error> Load(const std::string& path);
    static Glossary Parse(std::istream& in);

    static std::string Key(const std::string& term);

    // Explain a comma-separated word list. Each entry appears once, in the
    // order first requested; unknown words are skipped.
    [[nodiscard]] std::string Explain(const std::string& words) const;
    [[nodiscard]] std::string Explain(const std::vector<std::string>& words) const;

    [[nodiscard]] const Entry* Find(const std::string& word) const;
    [[nodiscard]] size_t Size() const noexcept { return entries_.size(); }

private:
    void Add(const std::string& term, const std::string& description);

    std::map<std::string, Entry> entries_;
    std::map<std::string, std::string> references_;  // key -> referenced key
};

inline constexpr const char* kGlossaryToolName = "glossary-tool";
inline constexpr const char* kGlossaryUnknownText =
    "Unfortunately none of the words is known to the glossary tool";

// glossary-tool(words)
Tool MakeGlossaryTool(std::shared_ptr<const Glossary> glossary,
                      const std::string& description);

} // namespace mcp_relay
