#include <mcp_relay/builtin/glossary_tool.hpp>

#include <mcp_relay/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <stdexcept>

namespace mcp_relay {

namespace {

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitWords(const std::string& words) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= words.size()) {
        auto comma = words.find(',', start);
        auto word = Trim(words.substr(start, comma == std::string::npos
                                                 ? std::string::npos
                                                 : comma - start));
        if (!word.empty()) {
            out.push_back(std::move(word));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

} // anonymous namespace

std::string Glossary::Key(const std::string& term) {
    std::string key;
    key.reserve(term.size());
    for (unsigned char c : term) {
        if (c == ' ' || c == '_' || c == '-') {
            continue;
        }
        key.push_back(static_cast<char>(std::tolower(c)));
    }
    return key;
}

Result<Glossary, Error> Glossary::Load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        auto error = Error::Make(ErrorCategory::Io, "LoadGlossary",
                                 "Glossary file not found: " + path);
        return Result<Glossary, Error>::Err(std::move(error));
    }
    auto glossary = Parse(in);
    LogInfo("builtin", "Glossary " + path + ": " + std::to_string(glossary.Size()) + " entries");
    return Result<Glossary, Error>::Ok(std::move(glossary));
}

Glossary Glossary::Parse(std::istream& in) {
    Glossary glossary;
    std::string current_term;
    bool in_term = false;
    std::string description;
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.rfind("# ", 0) == 0) {
            if (in_term) {
                glossary.Add(current_term, Trim(description));
            }
            current_term = Trim(line.substr(2));
            in_term = true;
            description.clear();
        } else if (in_term) {
            if (!description.empty()) {
                description += '\n';
            }
            description += line;
        }
    }
    if (in_term) {
        glossary.Add(current_term, Trim(description));
    }
    return glossary;
}

void Glossary::Add(const std::string& term, const std::string& description) {
    if (term.empty() || description.empty()) {
        return;
    }
    auto key = Key(term);
    if (description.rfind("-> ", 0) == 0) {
        references_[key] = Key(description.substr(3));
        return;
    }
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        LogWarn("builtin", "Duplicate key (" + key + ") of terms (" + it->second.term +
                ") and (" + term + ") in glossary");
        return;
    }
    entries_.emplace(std::move(key), Entry{term, description});
}

const Glossary::Entry* Glossary::Find(const std::string& word) const {
    auto key = Key(word);
    auto ref = references_.find(key);
    if (ref != references_.end()) {
        key = ref->second;
    }
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

std::string Glossary::Explain(const std::string& words) const {
    return Explain(SplitWords(words));
}

std::string Glossary::Explain(const std::vector<std::string>& words) const {
    std::set<const Entry*> seen;
    std::string out;
    for (const auto& word : words) {
        const auto* entry = Find(word);
        if (entry == nullptr || !seen.insert(entry).second) {
            continue;
        }
        if (!out.empty()) {
            out += "\n\n";
        }
        out += "# " + entry->term + "\n" + entry->description;
    }
    return out.empty() ? kGlossaryUnknownText : out;
}

Tool MakeGlossaryTool(std::shared_ptr<const Glossary> glossary,
                      const std::string& description) {
    auto descriptor = ToolDescriptorBuilder(kGlossaryToolName, "Glossary Tool", description)
        .Property("words", "string", "list of words or concepts to be explained.")
        .Build();
    return MakeDirectTool(std::move(descriptor),
        [glossary = std::move(glossary)](const nlohmann::json& args) {
            auto it = args.find("words");
            if (it == args.end() || it->is_null()) {
                throw std::invalid_argument("words-entry is missing in request");
            }
            std::string text;
            if (it->is_array()) {
                std::vector<std::string> words;
                for (const auto& w : *it) {
                    words.push_back(w.is_string() ? w.get<std::string>() : w.dump());
                }
                text = glossary->Explain(words);
            } else {
                text = glossary->Explain(it->is_string() ? it->get<std::string>() : it->dump());
            }
            LogDebug("builtin", "glossary answer: " + std::to_string(text.size()) + " bytes");
            return TextResult(text);
        });
}

} // namespace mcp_relay
