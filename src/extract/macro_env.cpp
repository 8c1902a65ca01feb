#include "lineage/extract/macro_env.hpp"
#include "lineage/util/text.hpp"

#include <regex>

namespace lineage {

namespace {

const std::regex& let_re() {
    static const std::regex re(R"(%let\s+([A-Za-z_][A-Za-z0-9_]*)\s*=\s*([^;]*);)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& wrapper_re() {
    static const std::regex re(R"(^%(?:str|nrstr|upcase|quote|nrquote)\(([\s\S]*)\)$)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

std::string strip_quotes(std::string s) {
    s = util::trim(s);
    while (!s.empty() && (s.front() == '\'' || s.front() == '"')) s.erase(s.begin());
    while (!s.empty() && (s.back() == '\'' || s.back() == '"')) s.pop_back();
    return util::trim(s);
}

// One substitution pass; sets changed when anything was replaced
std::string expand_once(const std::string& text, const MacroEnv::Bindings& bindings, bool& changed) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            size_t j = i + 1;
            while (j < text.size() && util::is_word_char(text[j])) ++j;
            if (j > i + 1) {
                auto it = bindings.find(util::to_lower(text.substr(i + 1, j - i - 1)));
                if (it != bindings.end()) {
                    out += it->second;
                    // "&name." consumes the terminating dot
                    if (j < text.size() && text[j] == '.') ++j;
                    i = j;
                    changed = true;
                    continue;
                }
            }
        }
        out += text[i];
        ++i;
    }

    std::string collapsed;
    collapsed.reserve(out.size());
    for (size_t k = 0; k < out.size(); ++k) {
        if (out[k] == '.' && k + 1 < out.size() && out[k + 1] == '.') {
            collapsed += '.';
            ++k;
            changed = true;
        } else {
            collapsed += out[k];
        }
    }
    return collapsed;
}

} // namespace

MacroEnv::MacroEnv() : values_(std::make_shared<const Bindings>()) {}

MacroEnv::MacroEnv(std::shared_ptr<const Bindings> values) : values_(std::move(values)) {}

std::optional<std::string> MacroEnv::lookup(const std::string& name) const {
    auto it = values_->find(util::to_lower(name));
    if (it == values_->end()) return std::nullopt;
    return it->second;
}

MacroEnv MacroEnv::with(const std::string& name, const std::string& value) const {
    auto next = std::make_shared<Bindings>(*values_);
    (*next)[util::to_lower(name)] = value;
    return MacroEnv(std::move(next));
}

MacroEnv MacroEnv::merged(const Bindings& updates) const {
    if (updates.empty()) return *this;

    auto next = std::make_shared<Bindings>(*values_);
    for (const auto& [name, value] : updates) {
        (*next)[util::to_lower(name)] = value;
    }
    return MacroEnv(std::move(next));
}

std::string MacroEnv::expand(const std::string& text, int max_passes) const {
    std::string current = text;
    for (int pass = 0; pass < max_passes; ++pass) {
        bool changed = false;
        current = expand_once(current, *values_, changed);
        if (!changed) break;
    }
    return current;
}

MacroEnv::Bindings MacroEnv::evaluate_assignments(const std::string& text) const {
    Bindings updates;
    MacroEnv current = *this;

    for (std::sregex_iterator it(text.begin(), text.end(), let_re()), end; it != end; ++it) {
        std::string name = util::to_lower((*it)[1].str());
        std::string value = sanitize_macro_value(current.expand(util::trim((*it)[2].str())));

        updates[name] = value;
        current = current.with(name, value);
    }
    return updates;
}

std::string sanitize_macro_value(const std::string& value) {
    std::string cleaned = strip_quotes(value);

    std::smatch match;
    if (std::regex_match(cleaned, match, wrapper_re())) {
        cleaned = strip_quotes(match[1].str());
    }
    return cleaned;
}

} // namespace lineage
