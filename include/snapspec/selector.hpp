#pragma once

#include "snapspec/export.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace snapspec {

// ============================================================================
// Selector Context
// ============================================================================

// The environment grammar statements are evaluated against.
struct SelectorContext {
    std::string build_arch;   // matched by "on"
    std::string target_arch;  // matched by "to"
    std::unordered_map<std::string, std::string> environment;

    // Build for the architecture we build on.
    static SelectorContext for_host(const std::string& arch) {
        SelectorContext ctx;
        ctx.build_arch = arch;
        ctx.target_arch = arch;
        return ctx;
    }

    static SelectorContext cross(const std::string& build, const std::string& target) {
        SelectorContext ctx;
        ctx.build_arch = build;
        ctx.target_arch = target.empty() ? build : target;
        return ctx;
    }
};

// ============================================================================
// Selector Sets
// ============================================================================

// Comma-separated selectors of one statement key. Membership is exact and
// case-sensitive; several selectors form a logical OR.
struct SelectorSet {
    std::vector<std::string> selectors;  // declared order

    bool empty() const { return selectors.empty(); }
    bool contains(const std::string& selector) const;
    std::string to_string() const;  // "amd64,arm64"
};

// Parse "amd64, arm64" into a set. Returns nullopt when a selector is empty
// or contains whitespace.
SNAPSPEC_API std::optional<SelectorSet> parse_selector_list(const std::string& text);

enum class StatementKind {
    On,       // "on <selectors>" or "on <selectors> to <selectors>"
    To,       // "to <selectors>"
    Try,      // "try"
    Else,     // "else"
    ElseFail  // "else fail"
};

struct StatementKey {
    StatementKind kind = StatementKind::On;
    SelectorSet on;
    SelectorSet to;
};

// Classify a grammar object key. Returns nullopt for keys that are not
// grammar statements or carry malformed selector lists.
SNAPSPEC_API std::optional<StatementKey> parse_statement_key(const std::string& key);

// Evaluate the selector half of a statement.
SNAPSPEC_API bool statement_matches(const StatementKey& key, const SelectorContext& ctx);

} // namespace snapspec
