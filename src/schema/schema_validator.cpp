#include "snapspec/schema_validator.hpp"
#include "snapspec/grammar.hpp"
#include "snapspec/message.hpp"

#include <algorithm>
#include <mutex>
#include <regex>
#include <set>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace snapspec {

namespace {

std::string join_path(const std::string& base, const std::string& key) {
    if (base.empty()) return key;
    return base + "." + key;
}

std::string index_path(const std::string& base, size_t index) {
    return base + "[" + std::to_string(index) + "]";
}

std::string join_scope(const std::string& scope, const std::string& key) {
    if (scope.empty()) return key;
    return scope + "." + key;
}

// Compiled patterns, shared by every validation run.
const std::regex& rule_regex(const ConstraintRule& rule) {
    static std::mutex mutex;
    static std::unordered_map<std::string, std::regex> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(rule.pattern);
    if (it == cache.end()) {
        it = cache.emplace(rule.pattern, std::regex(rule.pattern, std::regex::ECMAScript)).first;
    }
    return it->second;
}

// std::regex_match recursion depth grows with the input; longer text never
// matches a rule pattern.
constexpr size_t MAX_PATTERN_INPUT = 4096;

bool pattern_matches(const std::string& text, const ConstraintRule& rule) {
    return text.size() <= MAX_PATTERN_INPUT && std::regex_match(text, rule_regex(rule));
}

bool contains_value(const std::vector<std::string>& values, const std::string& v) {
    return std::find(values.begin(), values.end(), v) != values.end();
}

bool has_duplicates(const json& array) {
    for (size_t i = 0; i < array.size(); ++i) {
        for (size_t j = i + 1; j < array.size(); ++j) {
            if (array[i] == array[j]) return true;
        }
    }
    return false;
}

std::optional<GrammarShape> grammar_shape(ValueType t) {
    if (t == ValueType::GrammarString) return GrammarShape::String;
    if (t == ValueType::GrammarArray) return GrammarShape::Array;
    return std::nullopt;
}

// Object-level rules run in phases: required fields first, then key and
// entry checks, then (after field rules) dependencies and cross-field groups.
int object_rule_phase(RuleKind kind) {
    switch (kind) {
        case RuleKind::Required: return 0;
        case RuleKind::KeyPattern:
        case RuleKind::EntryType:
        case RuleKind::Closed:
        case RuleKind::MinProperties: return 1;
        case RuleKind::Dependency: return 2;
        default: return 3;
    }
}

class SchemaValidator {
public:
    explicit SchemaValidator(const RuleTable& rules) : rules_(rules) {}

    // name is the key the object sits under, empty for the document root.
    void validate_object(const json& object, const std::string& scope, const std::string& path,
                         const std::string& name) {
        const ScopeRules* sr = rules_.scope(scope);
        if (!sr) return;

        std::set<std::string> skip;  // keys not descended into

        run_object_phase(*sr, object, path, name, 0, skip);
        run_object_phase(*sr, object, path, name, 1, skip);

        for (const auto& field : sr->declared_fields) {
            auto value = object.find(field);
            if (value == object.end()) continue;
            auto rules = sr->field_rules.find(field);
            if (rules == sr->field_rules.end()) continue;
            if (!check_field(rules->second, *value, join_path(path, field))) {
                skip.insert(field);
            }
        }

        run_object_phase(*sr, object, path, name, 2, skip);
        run_object_phase(*sr, object, path, name, 3, skip);

        for (const auto& [key, value] : object.items()) {
            if (skip.count(key)) continue;
            descend(scope, key, value, join_path(path, key));
        }
    }

    std::vector<Violation> take_violations() { return std::move(violations_); }

private:
    const RuleTable& rules_;
    std::vector<Violation> violations_;

    void report(const ConstraintRule& rule, const std::string& path, MessageFields fields) {
        violations_.push_back({path, rule.id, render_message(rule.message, fields)});
    }

    void descend(const std::string& scope, const std::string& key, const json& value,
                 const std::string& path) {
        auto known = [this](const std::string& s) {
            return rules_.has_scope(s) || rules_.has_scope(join_scope(s, "*"));
        };

        // A literal field scope wins over the mapping wildcard
        std::string child = join_scope(scope, key);
        if (!known(child)) {
            if (scope.empty()) return;
            child = join_scope(scope, "*");
            if (!known(child)) return;
        }

        if (value.is_object()) {
            validate_object(value, child, path, key);
            return;
        }

        std::string item_scope = join_scope(child, "*");
        if (value.is_array() && rules_.has_scope(item_scope)) {
            for (size_t i = 0; i < value.size(); ++i) {
                if (value[i].is_object()) {
                    validate_object(value[i], item_scope, index_path(path, i), key);
                }
            }
        }
    }

    void run_object_phase(const ScopeRules& sr, const json& object, const std::string& path,
                          const std::string& name, int phase, std::set<std::string>& skip) {
        for (const ConstraintRule* rule : sr.object_rules) {
            if (object_rule_phase(rule->kind) == phase) {
                check_object(*rule, object, path, name, sr, skip);
            }
        }
    }

    void check_object(const ConstraintRule& rule, const json& object, const std::string& path,
                      const std::string& name, const ScopeRules& sr,
                      std::set<std::string>& skip) {
        switch (rule.kind) {
            case RuleKind::Required:
                if (!object.contains(rule.field)) {
                    report(rule, join_path(path, rule.field),
                           {{"field", rule.field}, {"key", repr(name)}});
                }
                break;

            case RuleKind::KeyPattern:
                for (const auto& [key, _] : object.items()) {
                    if (!pattern_matches(key, rule)) {
                        report(rule, join_path(path, key), {{"key", repr(key)}});
                        skip.insert(key);
                    }
                }
                break;

            case RuleKind::EntryType:
                for (const auto& [key, value] : object.items()) {
                    if (skip.count(key)) continue;
                    if (!value_has_type(value, rule.type)) {
                        report(rule, join_path(path, key),
                               {{"instance", repr(value)},
                                {"expected", value_type_to_string(rule.type)}});
                        skip.insert(key);
                    }
                }
                break;

            case RuleKind::Closed:
                for (const auto& [key, _] : object.items()) {
                    if (!contains_value(sr.declared_fields, key)) {
                        report(rule, join_path(path, key), {{"key", repr(key)}});
                        skip.insert(key);
                    }
                }
                break;

            case RuleKind::MinProperties:
                if (static_cast<std::int64_t>(object.size()) < rule.limit) {
                    report(rule, path,
                           {{"instance", repr(object)}, {"limit", std::to_string(rule.limit)}});
                }
                break;

            case RuleKind::Dependency:
                if (!object.contains(rule.field)) break;
                for (const auto& dependency : rule.values) {
                    if (!object.contains(dependency)) {
                        report(rule, join_path(path, rule.field),
                               {{"field", rule.field}, {"dependency", dependency}});
                    }
                }
                break;

            case RuleKind::RequiredAnyOf: {
                bool satisfied = false;
                for (const auto& group : rule.groups) {
                    satisfied = std::all_of(group.begin(), group.end(), [&](const std::string& f) {
                        return object.contains(f);
                    });
                    if (satisfied) break;
                }
                if (!satisfied && !rule.groups.empty()) {
                    std::vector<std::string> missing;
                    for (const auto& f : rule.groups.front()) {
                        if (!object.contains(f)) missing.push_back(f);
                    }
                    std::string text;
                    for (size_t i = 0; i < missing.size(); ++i) {
                        if (i > 0) text += i + 1 == missing.size() ? " and " : ", ";
                        text += repr(missing[i]);
                    }
                    report(rule, path, {{"missing", text}});
                }
                break;
            }

            case RuleKind::Predicate: {
                MessageFields fields;
                if (rule.predicate && !rule.predicate(object, fields)) {
                    fields["instance"] = repr(object);
                    fields.emplace("key", repr(name));
                    report(rule, path, std::move(fields));
                }
                break;
            }

            default:
                break;
        }
    }

    // Runs every rule of one field. Returns false when the value does not
    // have its declared type; the remaining rules are skipped in that case.
    bool check_field(const std::vector<const ConstraintRule*>& rules, const json& value,
                     const std::string& path) {
        std::optional<GrammarNode> grammar;
        bool too_long = false;  // patterns are not checked past max-length

        for (const ConstraintRule* rule : rules) {
            switch (rule->kind) {
                case RuleKind::Type: {
                    if (!value_has_type(value, rule->type)) {
                        report(*rule, path,
                               {{"instance", repr(value)},
                                {"expected", value_type_to_string(rule->type)}});
                        return false;
                    }
                    auto shape = grammar_shape(rule->type);
                    if (!shape) break;

                    auto parsed = parse_grammar(value, *shape, path);
                    if (!parsed.ok) {
                        for (const auto& error : parsed.errors) {
                            violations_.push_back({error.path, "grammar", error.message});
                        }
                        return false;
                    }
                    grammar = std::move(parsed.node);
                    break;
                }

                case RuleKind::Pattern:
                    if (value.is_string() && !too_long &&
                        !pattern_matches(value.get_ref<const std::string&>(), *rule)) {
                        report(*rule, path, {{"instance", repr(value)}});
                    }
                    break;

                case RuleKind::NotPattern:
                    if (value.is_string() && !too_long &&
                        pattern_matches(value.get_ref<const std::string&>(), *rule)) {
                        report(*rule, path, {{"instance", repr(value)}});
                    }
                    break;

                case RuleKind::Enum:
                    if (grammar) {
                        for (const auto& scalar : collect_scalars(*grammar)) {
                            if (!contains_value(rule->values, scalar)) {
                                report(*rule, path,
                                       {{"instance", repr(scalar)},
                                        {"allowed", repr_list(rule->values)}});
                            }
                        }
                    } else if (value.is_string() &&
                               !contains_value(rule->values, value.get<std::string>())) {
                        report(*rule, path,
                               {{"instance", repr(value)}, {"allowed", repr_list(rule->values)}});
                    }
                    break;

                case RuleKind::MinLength:
                case RuleKind::MaxLength: {
                    if (!value.is_string()) break;
                    auto length = static_cast<std::int64_t>(value.get_ref<const std::string&>().size());
                    bool bad = rule->kind == RuleKind::MinLength ? length < rule->limit
                                                                 : length > rule->limit;
                    if (bad) {
                        report(*rule, path,
                               {{"instance", repr(value)}, {"limit", std::to_string(rule->limit)}});
                        if (rule->kind == RuleKind::MaxLength) too_long = true;
                    }
                    break;
                }

                case RuleKind::Minimum:
                case RuleKind::Maximum: {
                    if (!value.is_number_integer()) break;
                    auto n = value.get<std::int64_t>();
                    bool bad = rule->kind == RuleKind::Minimum ? n < rule->limit : n > rule->limit;
                    if (bad) {
                        report(*rule, path,
                               {{"instance", repr(value)}, {"limit", std::to_string(rule->limit)}});
                    }
                    break;
                }

                case RuleKind::UniqueItems:
                    if (value.is_array() && has_duplicates(value)) {
                        report(*rule, path, {{"instance", repr(value)}});
                    }
                    break;

                case RuleKind::ItemType:
                    if (!value.is_array()) break;
                    for (size_t i = 0; i < value.size(); ++i) {
                        if (!value_has_type(value[i], rule->type)) {
                            report(*rule, index_path(path, i),
                                   {{"instance", repr(value[i])},
                                    {"expected", value_type_to_string(rule->type)}});
                        }
                    }
                    break;

                case RuleKind::ItemPattern:
                    if (!value.is_array()) break;
                    for (size_t i = 0; i < value.size(); ++i) {
                        if (value[i].is_string() &&
                            !pattern_matches(value[i].get_ref<const std::string&>(), *rule)) {
                            report(*rule, index_path(path, i), {{"instance", repr(value[i])}});
                        }
                    }
                    break;

                case RuleKind::ItemEnum:
                    if (!value.is_array()) break;
                    for (size_t i = 0; i < value.size(); ++i) {
                        if (value[i].is_string() &&
                            !contains_value(rule->values, value[i].get<std::string>())) {
                            report(*rule, index_path(path, i),
                                   {{"instance", repr(value[i])},
                                    {"allowed", repr_list(rule->values)}});
                        }
                    }
                    break;

                case RuleKind::Predicate: {
                    MessageFields fields;
                    if (rule->predicate && !rule->predicate(value, fields)) {
                        fields["instance"] = repr(value);
                        report(*rule, path, std::move(fields));
                    }
                    break;
                }

                default:
                    break;
            }
        }

        return true;
    }
};

} // namespace

ValidationResult validate_document(const json& document) {
    return validate_document(document, manifest_rules());
}

ValidationResult validate_document(const json& document, const RuleTable& rules) {
    ValidationResult result;

    if (!document.is_object()) {
        result.critical_error = CriticalError::DOCUMENT_SHAPE;
        result.critical_error_context =
            std::string("document must be a mapping, got ") + document.type_name();
        spdlog::error("{}", result.critical_error_context);
        return result;
    }

    SchemaValidator validator(rules);
    validator.validate_object(document, "", "", "");

    result.violations = validator.take_violations();
    sort_violations(result.violations);
    result.ok = result.violations.empty();

    spdlog::debug("schema validation finished with {} violation(s)", result.violations.size());
    return result;
}

} // namespace snapspec
