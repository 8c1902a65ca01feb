// =============================================================================
// macro_env.hpp - SAS %LET environments
// =============================================================================
// A MacroEnv is an immutable snapshot of macro variable bindings. Applying a
// block's %LET statements produces a new snapshot; the old one is untouched,
// so a block-local view and the running program-wide view never alias.
// Names are case-insensitive and stored lower-cased.
// =============================================================================

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace lineage {

class MacroEnv {
public:
    using Bindings = std::map<std::string, std::string>;

    static constexpr int kMaxExpansionPasses = 5;

    MacroEnv();

    std::optional<std::string> lookup(const std::string& name) const;

    MacroEnv with(const std::string& name, const std::string& value) const;
    MacroEnv merged(const Bindings& updates) const;

    // Substitute &name. and &name for bound names, then collapse "..",
    // repeating until nothing changes or the pass limit is reached.
    // Unbound references are left in place.
    std::string expand(const std::string& text, int max_passes = kMaxExpansionPasses) const;

    // Sequentially evaluate every %LET in text against this snapshot. Each
    // right-hand side sees the assignments before it. Returns only the new
    // bindings.
    Bindings evaluate_assignments(const std::string& text) const;

    const Bindings& bindings() const { return *values_; }
    size_t size() const { return values_->size(); }
    bool empty() const { return values_->empty(); }

private:
    explicit MacroEnv(std::shared_ptr<const Bindings> values);

    std::shared_ptr<const Bindings> values_;
};

// Strip surrounding quotes and a %STR / %NRSTR / %UPCASE / %QUOTE / %NRQUOTE
// wrapper from a %LET value
std::string sanitize_macro_value(const std::string& value);

} // namespace lineage
