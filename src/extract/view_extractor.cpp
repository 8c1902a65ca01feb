#include "lineage/extract/view_extractor.hpp"
#include "lineage/table_name.hpp"
#include "lineage/util/text.hpp"

#include <regex>

namespace lineage {

namespace {

const std::regex& create_view_re() {
    static const std::regex re(R"(\bcreate\s+(?:or\s+replace\s+)?view\s+([a-z0-9_]+(?:\.[a-z0-9_]+)?)\b)");
    return re;
}

const std::regex& from_join_re() {
    static const std::regex re(R"(\b(?:from|join)\s+([a-z0-9_]+)\.([a-z0-9_]+)\b)");
    return re;
}

} // namespace

TableSet ViewExtractor::written_tables(const std::string& text) const {
    std::string lower = util::to_lower(text);
    std::smatch match;
    if (!std::regex_search(lower, match, create_view_re())) return {};

    std::string view = match[1].str();
    if (!is_qualified(view)) return {};
    return {view};
}

TableSet ViewExtractor::read_tables(const std::string& text) const {
    std::string lower = util::to_lower(text);
    TableSet tables;
    for (std::sregex_iterator it(lower.begin(), lower.end(), from_join_re()), end; it != end; ++it) {
        tables.insert(to_fqtn((*it)[1].str(), (*it)[2].str()));
    }
    return tables;
}

TableSet ViewExtractor::declared_targets(const std::string& text) const {
    std::string lower = util::to_lower(text);
    TableSet views;
    for (std::sregex_iterator it(lower.begin(), lower.end(), create_view_re()), end; it != end; ++it) {
        views.insert((*it)[1].str());
    }
    return views;
}

} // namespace lineage
