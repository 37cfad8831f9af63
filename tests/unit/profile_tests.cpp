#include <doctest/doctest.h>
#include <snapspec/profile.hpp>

#include <algorithm>

using namespace snapspec;

TEST_CASE("builtin profile builds for amd64 sequentially") {
    auto profile = get_builtin_profile();
    CHECK(profile.schema == "snapspec.profile.v1");
    CHECK(profile.selectors.build_on == "amd64");
    CHECK(profile.selectors.target_arch == "amd64");
    CHECK_FALSE(profile.parallel);
    CHECK(get_warning_action(profile, Warning::default_applied) == WarningAction::Warn);
}

TEST_CASE("parse_profile reads every section") {
    auto result = parse_profile(R"({
        "$schema": "snapspec.profile.v1",
        "selectors": {
            "build_on": "arm64",
            "target_arch": "armhf",
            "environment": { "SNAPCRAFT_BUILD_INFO": "1" }
        },
        "warnings": { "Default_Applied": "ignore", "passthrough_enabled": "error" },
        "parallel": true,
        "workers": 4
    })", "/etc/snapspec/profile.json");

    REQUIRE(result.ok);
    CHECK(result.warnings.empty());

    const auto& profile = result.profile;
    CHECK(profile.source_path == "/etc/snapspec/profile.json");
    CHECK(profile.selectors.build_on == "arm64");
    CHECK(profile.selectors.target_arch == "armhf");
    CHECK(profile.selectors.environment.at("SNAPCRAFT_BUILD_INFO") == "1");
    CHECK(get_warning_action(profile, "default_applied") == WarningAction::Ignore);
    CHECK(get_warning_action(profile, Warning::passthrough_enabled) == WarningAction::Error);
    CHECK(get_warning_action(profile, Warning::version_script_deprecated) == WarningAction::Warn);
    CHECK(profile.parallel);
    CHECK(profile.workers == 4);
}

TEST_CASE("parse_profile requires a matching schema") {
    auto missing = parse_profile(R"({"selectors": {}})");
    CHECK_FALSE(missing.ok);
    CHECK(missing.error == "$schema missing");

    auto mismatch = parse_profile(R"({"$schema": "snapspec.profile.v0"})");
    CHECK_FALSE(mismatch.ok);
    CHECK(mismatch.error.find("mismatch") != std::string::npos);
}

TEST_CASE("parse_profile rejects malformed JSON") {
    auto result = parse_profile("{ not json");
    CHECK_FALSE(result.ok);
    CHECK(result.error.rfind("parse error", 0) == 0);

    auto array = parse_profile("[]");
    CHECK_FALSE(array.ok);
    CHECK(array.error == "JSON must be an object");
}

TEST_CASE("parse_profile reports invalid settings as warnings") {
    auto result = parse_profile(R"({
        "$schema": "snapspec.profile.v1",
        "warnings": { "default_applied": "explode" },
        "parallel": "yes",
        "workers": -2
    })");

    REQUIRE(result.ok);
    auto has = [&](const std::string& w) {
        return std::find(result.warnings.begin(), result.warnings.end(), w) != result.warnings.end();
    };
    CHECK(has("invalid_configuration:invalid_warning_action:default_applied"));
    CHECK(has("invalid_configuration:invalid_parallel"));
    CHECK(has("invalid_configuration:invalid_workers"));
    CHECK(get_warning_action(result.profile, "default_applied") == WarningAction::Warn);
}

TEST_CASE("parse_profile rejects worker counts out of range") {
    auto result = parse_profile(R"({
        "$schema": "snapspec.profile.v1",
        "workers": 4294967296
    })");

    REQUIRE(result.ok);
    CHECK(result.profile.workers == 0);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0] == "invalid_configuration:invalid_workers");
}

TEST_CASE("to_selector_context defaults the target to the build architecture") {
    auto result = parse_profile(R"({
        "$schema": "snapspec.profile.v1",
        "selectors": { "build_on": "ppc64el" }
    })");
    REQUIRE(result.ok);

    auto ctx = to_selector_context(result.profile);
    CHECK(ctx.build_arch == "ppc64el");
    CHECK(ctx.target_arch == "ppc64el");
}

TEST_CASE("assemble_manifest honours the profile") {
    auto doc = json::parse(R"({
        "name": "demo",
        "adopt-info": "demo",
        "base": "core22",
        "parts": {
            "demo": {
                "plugin": "nil",
                "stage-packages": [{ "on arm64": ["arm-lib"] }, { "else": ["generic-lib"] }]
            }
        }
    })");

    auto parsed = parse_profile(R"({
        "$schema": "snapspec.profile.v1",
        "selectors": { "build_on": "arm64" },
        "warnings": { "default_applied": "ignore" },
        "parallel": true,
        "workers": 2
    })");
    REQUIRE(parsed.ok);

    auto result = assemble_manifest(doc, parsed.profile);
    REQUIRE(result.ok);
    CHECK(result.manifest.parts[0].stage_packages == std::vector<std::string>{"arm-lib"});
    CHECK(result.warnings.empty());

    auto options = to_assembly_options(parsed.profile);
    CHECK(options.parallel);
    CHECK(options.workers == 2);
}
