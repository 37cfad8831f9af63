#pragma once

#include "snapspec/message.hpp"
#include "snapspec/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace snapspec {

// ============================================================================
// Constraint Rules
// ============================================================================
//
// The manifest schema is a flat table of ConstraintRule records. Each rule
// applies to one scope, a dotted path with "*" standing for any mapping key:
//
//   ""                   the document root
//   "apps"               the apps mapping itself (its keys)
//   "apps.*"             one app object
//   "apps.*.sockets.*"   one socket object
//
// Field rules name a field of the scope object; object rules leave field
// empty. A field is "declared" in a scope when the scope has a Type rule for
// it; closed scopes reject undeclared fields.

enum class ValueType {
    Any,
    String,
    Integer,
    Number,
    Boolean,
    Array,
    Object,
    ObjectOrNull,
    StringOrNumber,
    StringOrObject,
    StringOrStringArray,
    PlugValue,      // null, string or object
    GrammarString,  // string, or grammar statements resolving to one string
    GrammarArray,   // grammar statements resolving to a list of strings
};

SNAPSPEC_API const char* value_type_to_string(ValueType t);

// True when value has type t. Grammar types only check the outer shape.
SNAPSPEC_API bool value_has_type(const json& value, ValueType t);

enum class RuleKind {
    Type,           // field value has type
    Pattern,        // string field matches pattern
    NotPattern,     // string field does not match pattern
    Enum,           // string field (or every grammar scalar) is one of values
    MinLength,
    MaxLength,
    Minimum,        // integer field >= limit
    Maximum,        // integer field <= limit
    UniqueItems,    // array field has no duplicate items
    ItemType,       // every item of an array field has type
    ItemPattern,    // every string item of an array field matches pattern
    ItemEnum,       // every string item of an array field is one of values
    EntryType,      // every value of the scope mapping has type
    Required,       // scope object contains field
    KeyPattern,     // every key of the scope mapping matches pattern
    Closed,         // scope object has no undeclared fields
    MinProperties,  // scope object has at least limit entries
    Dependency,     // field present => all values present
    RequiredAnyOf,  // at least one of groups fully present
    Predicate,      // custom check on a field value, or on the object when field is empty
};

// Custom check. Returns true when the rule holds; may add message fields.
using RulePredicate = bool (*)(const json& value, MessageFields& fields);

struct ConstraintRule {
    std::string id;        // rule identifier reported with violations
    RuleKind kind = RuleKind::Type;
    std::string scope;
    std::string field;
    ValueType type = ValueType::Any;
    std::string pattern;   // ECMAScript regex, whole-string match
    std::vector<std::string> values;
    std::vector<std::vector<std::string>> groups;
    std::int64_t limit = 0;
    RulePredicate predicate = nullptr;
    std::string message;   // template, see render_message()
};

// Rules of one scope in table order.
struct ScopeRules {
    std::vector<const ConstraintRule*> object_rules;
    std::unordered_map<std::string, std::vector<const ConstraintRule*>> field_rules;
    std::vector<std::string> declared_fields;  // in table order
};

class SNAPSPEC_API RuleTable {
public:
    explicit RuleTable(std::vector<ConstraintRule> rules);

    // The index points into rules_
    RuleTable(const RuleTable&) = delete;
    RuleTable& operator=(const RuleTable&) = delete;

    const std::vector<ConstraintRule>& rules() const { return rules_; }

    // nullptr when the table has nothing for scope.
    const ScopeRules* scope(const std::string& scope) const;

    bool has_scope(const std::string& scope) const { return index_.count(scope) != 0; }

private:
    std::vector<ConstraintRule> rules_;
    std::unordered_map<std::string, ScopeRules> index_;
};

// The manifest schema.
SNAPSPEC_API const RuleTable& manifest_rules();

// Grammar-typed part fields, in declaration order.
struct GrammarField {
    const char* name;
    ValueType type;  // GrammarString or GrammarArray
};

SNAPSPEC_API const std::vector<GrammarField>& part_grammar_fields();

} // namespace snapspec
