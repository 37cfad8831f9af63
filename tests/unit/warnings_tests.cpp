#include <doctest/doctest.h>
#include <snapspec/warnings.hpp>
#include <snapspec/types.hpp>

using namespace snapspec;

TEST_CASE("warning_to_string returns correct warning key") {
    CHECK(std::string(warning_to_string(Warning::default_applied)) == "default_applied");
    CHECK(std::string(warning_to_string(Warning::version_script_deprecated)) == "version_script_deprecated");
    CHECK(std::string(warning_to_string(Warning::command_chain_assumed)) == "command_chain_assumed");
    CHECK(std::string(warning_to_string(Warning::passthrough_enabled)) == "passthrough_enabled");
}

TEST_CASE("parse_warning_key parses known warning keys") {
    CHECK(parse_warning_key("default_applied") == Warning::default_applied);
    CHECK(parse_warning_key("Version_Script_Deprecated") == Warning::version_script_deprecated);
    CHECK(parse_warning_key("command_chain_assumed") == Warning::command_chain_assumed);
    CHECK(parse_warning_key("passthrough_enabled") == Warning::passthrough_enabled);
}

TEST_CASE("parse_warning_key returns nullopt for unknown keys") {
    CHECK_FALSE(parse_warning_key("unknown_warning").has_value());
    CHECK_FALSE(parse_warning_key("").has_value());
    CHECK_FALSE(parse_warning_key("default-applied").has_value());
}

TEST_CASE("parse_warning_action is case-insensitive") {
    CHECK(parse_warning_action("warn") == WarningAction::Warn);
    CHECK(parse_warning_action("IGNORE") == WarningAction::Ignore);
    CHECK(parse_warning_action("Error") == WarningAction::Error);
    CHECK_FALSE(parse_warning_action("fatal").has_value());
}

TEST_CASE("WarningCollector default policy is warn") {
    WarningCollector collector;

    collector.emit(Warning::default_applied, warnings::default_applied("grade", "stable"));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "warn");
    CHECK(warnings[0].key == "default_applied");
    CHECK(warnings[0].fields.at("path") == "grade");
    CHECK(warnings[0].fields.at("value") == "stable");
}

TEST_CASE("WarningCollector applies error policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["version_script_deprecated"] = WarningAction::Error;

    WarningCollector collector(policy);
    collector.emit(Warning::version_script_deprecated,
                   warnings::version_script_deprecated("git describe"));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "error");
    CHECK(warnings[0].fields.at("script") == "git describe");
}

TEST_CASE("WarningCollector applies ignore policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["default_applied"] = WarningAction::Ignore;

    WarningCollector collector(policy);
    collector.emit(Warning::default_applied, warnings::default_applied("type", "app"));

    auto warnings = collector.get_warnings();
    CHECK(warnings.empty());
}

TEST_CASE("WarningCollector override takes precedence over policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["passthrough_enabled"] = WarningAction::Ignore;

    WarningCollector collector(policy);
    collector.apply_override("PASSTHROUGH_ENABLED", WarningAction::Error);
    collector.emit(Warning::passthrough_enabled,
                   warnings::passthrough_enabled("passthrough", "['foo']"));

    CHECK(collector.has_errors());
}

TEST_CASE("WarningCollector has_errors detects error-level warnings") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["command_chain_assumed"] = WarningAction::Error;

    WarningCollector collector(policy);

    CHECK_FALSE(collector.has_errors());

    collector.emit(Warning::default_applied);  // warn
    CHECK_FALSE(collector.has_errors());

    collector.emit(Warning::command_chain_assumed, warnings::command_chain_assumed("app"));  // error
    CHECK(collector.has_errors());
}

TEST_CASE("WarningCollector has_effective_warnings detects warn-level warnings") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["default_applied"] = WarningAction::Ignore;

    WarningCollector collector(policy);

    CHECK_FALSE(collector.has_effective_warnings());

    collector.emit(Warning::default_applied);  // ignored
    CHECK_FALSE(collector.has_effective_warnings());

    collector.emit(Warning::passthrough_enabled);  // default = warn
    CHECK(collector.has_effective_warnings());
}

TEST_CASE("WarningCollector accumulates multiple warnings") {
    WarningCollector collector;

    collector.emit(Warning::default_applied);
    collector.emit(Warning::version_script_deprecated);
    collector.emit("command_chain_assumed");

    auto warnings = collector.get_warnings();
    CHECK(warnings.size() == 3);

    collector.clear();
    CHECK(collector.get_warnings().empty());
}
