#include "snapspec/grammar.hpp"
#include "snapspec/message.hpp"

#include <iterator>

#include <spdlog/spdlog.h>

namespace snapspec {

namespace {

class Resolver {
public:
    Resolver(const SelectorContext& ctx, const std::string& path) : ctx_(ctx), path_(path) {}

    ResolveResult resolve(const GrammarNode& node) {
        switch (node.kind) {
            case GrammarKind::Scalar: {
                ResolveResult result;
                result.values.push_back(node.value);
                return result;
            }

            case GrammarKind::Sequence: {
                ResolveResult result;
                for (const auto& item : node.items) {
                    auto sub = resolve(item);
                    if (!sub.ok) return sub;
                    result.values.insert(result.values.end(),
                                         std::make_move_iterator(sub.values.begin()),
                                         std::make_move_iterator(sub.values.end()));
                }
                return result;
            }

            case GrammarKind::OnClause:
            case GrammarKind::ToClause:
                for (const auto& branch : node.branches) {
                    if (!statement_matches(branch.statement, ctx_)) {
                        continue;
                    }
                    if (branch.body.kind == GrammarKind::ElseFail) {
                        return unsatisfied(branch.key);
                    }
                    return resolve(branch.body);
                }
                return resolve_fallbacks(node);

            case GrammarKind::TryClause: {
                if (!node.items.empty()) {
                    auto body = resolve(node.items.front());
                    if (body.ok && !body.values.empty()) {
                        return body;
                    }
                    if (!body.ok && body.failure) {
                        spdlog::debug("{}: 'try' body failed: {}", path_, body.failure->message);
                    }
                }
                return resolve_fallbacks(node);
            }

            case GrammarKind::ElseClause:
                return fail("grammar-type", "else",
                            "'else' is only valid after an 'on', 'to' or 'try' statement");

            case GrammarKind::ElseFail:
                return unsatisfied("else fail");
        }

        return fail("grammar-type", "", "unknown grammar node");
    }

private:
    const SelectorContext& ctx_;
    const std::string& path_;

    // Fallbacks are tried in order until one yields values.
    ResolveResult resolve_fallbacks(const GrammarNode& statement) {
        ResolveResult last;
        for (const auto& fallback : statement.fallbacks) {
            if (fallback.kind == GrammarKind::ElseFail) {
                return unsatisfied(statement.describe());
            }
            if (fallback.items.empty()) {
                continue;
            }
            auto result = resolve(fallback.items.front());
            if (!result.ok || !result.values.empty()) {
                return result;
            }
            last = std::move(result);
        }
        return last;
    }

    ResolveResult unsatisfied(const std::string& statement) {
        return fail("else-fail", statement,
                    "Unable to satisfy " + repr(statement) + ", failure forced (build-on " +
                        repr(ctx_.build_arch) + ", target " + repr(ctx_.target_arch) + ")");
    }

    ResolveResult fail(const std::string& rule, const std::string& statement,
                       const std::string& message) {
        ResolveResult result;
        result.ok = false;

        ResolutionFailure failure;
        failure.path = path_;
        failure.rule = rule;
        failure.statement = statement;
        failure.build_arch = ctx_.build_arch;
        failure.target_arch = ctx_.target_arch;
        failure.message = path_ + ": " + message;
        result.failure = std::move(failure);
        return result;
    }
};

ResolutionFailure failure_from_error(const GrammarError& error, const SelectorContext& ctx) {
    ResolutionFailure failure;
    failure.path = error.path;
    failure.rule = "grammar-type";
    failure.build_arch = ctx.build_arch;
    failure.target_arch = ctx.target_arch;
    failure.message = error.path + ": " + error.message;
    return failure;
}

} // namespace

ResolveResult resolve_grammar(const GrammarNode& node,
                              const SelectorContext& ctx,
                              const std::string& path) {
    Resolver resolver(ctx, path);
    return resolver.resolve(node);
}

ResolveStringResult resolve_grammar_string(const GrammarNode& node,
                                           const SelectorContext& ctx,
                                           const std::string& path) {
    ResolveStringResult result;

    auto resolved = resolve_grammar(node, ctx, path);
    if (!resolved.ok) {
        result.ok = false;
        result.failure = std::move(resolved.failure);
        return result;
    }

    if (resolved.values.size() > 1) {
        result.ok = false;
        ResolutionFailure failure;
        failure.path = path;
        failure.rule = "single-value";
        failure.build_arch = ctx.build_arch;
        failure.target_arch = ctx.target_arch;
        failure.message = path + ": expected a single value, got " + repr_list(resolved.values);
        result.failure = std::move(failure);
        return result;
    }

    if (!resolved.values.empty()) {
        result.value = std::move(resolved.values.front());
    }
    return result;
}

FieldResolution resolve_field(const json& value,
                              GrammarShape shape,
                              const SelectorContext& ctx,
                              const std::string& path) {
    FieldResolution result;

    auto parsed = parse_grammar(value, shape, path);
    if (!parsed.ok) {
        result.ok = false;
        for (const auto& error : parsed.errors) {
            result.failures.push_back(failure_from_error(error, ctx));
        }
        return result;
    }

    if (shape == GrammarShape::String) {
        auto resolved = resolve_grammar_string(parsed.node, ctx, path);
        if (!resolved.ok) {
            result.ok = false;
            result.failures.push_back(std::move(*resolved.failure));
            return result;
        }
        if (resolved.value) {
            result.values.push_back(std::move(*resolved.value));
        }
    } else {
        auto resolved = resolve_grammar(parsed.node, ctx, path);
        if (!resolved.ok) {
            result.ok = false;
            result.failures.push_back(std::move(*resolved.failure));
            return result;
        }
        result.values = std::move(resolved.values);
    }

    spdlog::debug("{}: resolved {} value(s) for build-on {} target {}",
                  path, result.values.size(), ctx.build_arch, ctx.target_arch);
    return result;
}

} // namespace snapspec
