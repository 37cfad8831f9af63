#include <doctest/doctest.h>
#include <snapspec/constraint.hpp>
#include <snapspec/schema_validator.hpp>

#include <algorithm>

using namespace snapspec;

TEST_CASE("value_has_type checks composite types") {
    CHECK(value_has_type(json("x"), ValueType::String));
    CHECK_FALSE(value_has_type(json(1), ValueType::String));
    CHECK(value_has_type(json(1), ValueType::Integer));
    CHECK_FALSE(value_has_type(json(1.5), ValueType::Integer));
    CHECK(value_has_type(json(1.5), ValueType::StringOrNumber));
    CHECK(value_has_type(json(nullptr), ValueType::ObjectOrNull));
    CHECK(value_has_type(json(nullptr), ValueType::PlugValue));
    CHECK_FALSE(value_has_type(json::array(), ValueType::PlugValue));
    CHECK(value_has_type(json::parse(R"(["a", "b"])"), ValueType::StringOrStringArray));
    CHECK_FALSE(value_has_type(json::parse(R"(["a", 1])"), ValueType::StringOrStringArray));
    CHECK(value_has_type(json("src"), ValueType::GrammarString));
    CHECK_FALSE(value_has_type(json("pkg"), ValueType::GrammarArray));
    CHECK(value_has_type(json::object(), ValueType::Any));
}

TEST_CASE("value_type_to_string names types the way messages expect") {
    CHECK(std::string(value_type_to_string(ValueType::String)) == "'string'");
    CHECK(std::string(value_type_to_string(ValueType::ObjectOrNull)) == "'object' or 'null'");
}

TEST_CASE("manifest_rules covers every sub-document") {
    const auto& rules = manifest_rules();
    for (const char* scope : {"", "apps", "apps.*", "apps.*.sockets", "apps.*.sockets.*", "hooks",
                              "hooks.*", "parts", "parts.*", "plugs.*", "slots.*",
                              "architectures.*"}) {
        CAPTURE(scope);
        CHECK(rules.has_scope(scope));
    }
    CHECK(rules.scope("no.such.scope") == nullptr);
}

TEST_CASE("manifest_rules declares fields through type rules") {
    const auto* root = manifest_rules().scope("");
    REQUIRE(root != nullptr);
    auto declared = [&](const std::string& field) {
        return std::find(root->declared_fields.begin(), root->declared_fields.end(), field) !=
               root->declared_fields.end();
    };
    CHECK(declared("name"));
    CHECK(declared("build-packages"));
    CHECK(declared("passthrough"));
    CHECK_FALSE(declared("plugin"));
}

TEST_CASE("part grammar fields are declared with grammar types") {
    const auto* part = manifest_rules().scope("parts.*");
    REQUIRE(part != nullptr);
    CHECK(part_grammar_fields().size() == 11);

    for (const auto& field : part_grammar_fields()) {
        CAPTURE(field.name);
        auto rules = part->field_rules.find(field.name);
        REQUIRE(rules != part->field_rules.end());
        REQUIRE_FALSE(rules->second.empty());
        CHECK(rules->second.front()->kind == RuleKind::Type);
        CHECK(rules->second.front()->type == field.type);
    }
}

TEST_CASE("RuleTable drives validation of custom tables") {
    std::vector<ConstraintRule> table;

    ConstraintRule id_required;
    id_required.id = "required";
    id_required.kind = RuleKind::Required;
    id_required.field = "id";
    id_required.message = "'{field}' is a required property";
    table.push_back(id_required);

    ConstraintRule id_type;
    id_type.id = "type";
    id_type.kind = RuleKind::Type;
    id_type.field = "id";
    id_type.type = ValueType::Integer;
    id_type.message = "{instance} is not of type {expected}";
    table.push_back(id_type);

    ConstraintRule closed;
    closed.id = "additional-properties";
    closed.kind = RuleKind::Closed;
    closed.message = "Additional properties are not allowed ({key} was unexpected)";
    table.push_back(closed);

    RuleTable rules(table);

    auto missing = validate_document(json::parse(R"({"extra": 1})"), rules);
    REQUIRE(missing.violations.size() == 2);
    CHECK(missing.violations[0].path == "extra");
    CHECK(missing.violations[0].message == "Additional properties are not allowed ('extra' was unexpected)");
    CHECK(missing.violations[1].path == "id");
    CHECK(missing.violations[1].message == "'id' is a required property");

    auto mistyped = validate_document(json::parse(R"({"id": "seven"})"), rules);
    REQUIRE(mistyped.violations.size() == 1);
    CHECK(mistyped.violations[0].message == "'seven' is not of type 'integer'");

    CHECK(validate_document(json::parse(R"({"id": 7})"), rules).ok);
}
