#pragma once

#include "snapspec/selector.hpp"
#include "snapspec/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace snapspec {

// ============================================================================
// Grammar Tree
// ============================================================================
//
// A grammar field holds a plain value or a conditional expression:
//
//   build-packages:
//     - gcc
//     - on amd64: [libfoo-dev]
//     - on arm64,armhf: [libfoo-arm-dev]
//     - else fail
//     - try: [optional-pkg]
//       else: [fallback-pkg]
//
// parse_grammar() turns the decoded value into a GrammarNode tree and
// resolve_grammar() collapses that tree against a SelectorContext.

enum class GrammarKind {
    Scalar,      // value
    Sequence,    // items, concatenated in order
    OnClause,    // branches matched against the build architecture
    ToClause,    // branches matched against the target architecture
    TryClause,   // items[0] is the body
    ElseClause,  // items[0] is the body; only reachable as a fallback
    ElseFail
};

inline const char* grammar_kind_to_string(GrammarKind k) {
    switch (k) {
        case GrammarKind::Scalar: return "scalar";
        case GrammarKind::Sequence: return "sequence";
        case GrammarKind::OnClause: return "on";
        case GrammarKind::ToClause: return "to";
        case GrammarKind::TryClause: return "try";
        case GrammarKind::ElseClause: return "else";
        case GrammarKind::ElseFail: return "else fail";
        default: return "unknown";
    }
}

// Shape the field expects once resolved.
enum class GrammarShape {
    String,  // zero or one value
    Array    // ordered list of values
};

struct GrammarBranch;

struct GrammarNode {
    GrammarKind kind = GrammarKind::Sequence;
    std::string value;
    std::vector<GrammarNode> items;
    std::vector<GrammarBranch> branches;
    std::vector<GrammarNode> fallbacks;  // ElseClause / ElseFail, in declared order

    static GrammarNode scalar(const std::string& v);
    static GrammarNode else_fail();

    bool is_statement() const {
        return kind == GrammarKind::OnClause || kind == GrammarKind::ToClause ||
               kind == GrammarKind::TryClause;
    }

    // Statement text for diagnostics, e.g. "on amd64" or "try".
    std::string describe() const;
};

struct GrammarBranch {
    std::string key;  // source key, e.g. "on amd64,arm64"
    StatementKey statement;
    GrammarNode body;
};

inline GrammarNode GrammarNode::scalar(const std::string& v) {
    GrammarNode n;
    n.kind = GrammarKind::Scalar;
    n.value = v;
    return n;
}

inline GrammarNode GrammarNode::else_fail() {
    GrammarNode n;
    n.kind = GrammarKind::ElseFail;
    return n;
}

// ============================================================================
// Parsing
// ============================================================================

struct GrammarError {
    std::string path;
    std::string message;
};

struct GrammarParseResult {
    bool ok = false;
    GrammarNode node;
    std::vector<GrammarError> errors;
};

// Build a grammar tree from a decoded field value. All structural errors are
// collected; node is only meaningful when ok is true.
SNAPSPEC_API GrammarParseResult parse_grammar(const json& value,
                                              GrammarShape shape,
                                              const std::string& path);

// Every Scalar reachable from node, in document order.
SNAPSPEC_API std::vector<std::string> collect_scalars(const GrammarNode& node);

// ============================================================================
// Resolution
// ============================================================================

struct ResolveResult {
    bool ok = true;
    std::vector<std::string> values;  // order preserved, duplicates kept
    std::optional<ResolutionFailure> failure;
};

// Pure function of (node, ctx). path labels failures.
SNAPSPEC_API ResolveResult resolve_grammar(const GrammarNode& node,
                                           const SelectorContext& ctx,
                                           const std::string& path);

struct ResolveStringResult {
    bool ok = true;
    std::optional<std::string> value;
    std::optional<ResolutionFailure> failure;
};

// Resolve a grammar-string: zero or one value.
SNAPSPEC_API ResolveStringResult resolve_grammar_string(const GrammarNode& node,
                                                        const SelectorContext& ctx,
                                                        const std::string& path);

// Parse and resolve in one step. Parse errors become "grammar-type" failures.
struct FieldResolution {
    bool ok = true;
    std::vector<std::string> values;
    std::vector<ResolutionFailure> failures;
};

SNAPSPEC_API FieldResolution resolve_field(const json& value,
                                           GrammarShape shape,
                                           const SelectorContext& ctx,
                                           const std::string& path);

} // namespace snapspec
