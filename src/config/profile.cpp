#include "snapspec/profile.hpp"
#include "snapspec/warnings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace snapspec {

namespace {

constexpr const char* PROFILE_SCHEMA = "snapspec.profile.v1";

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

Profile get_builtin_profile() {
    Profile profile;
    profile.schema = PROFILE_SCHEMA;
    profile.selectors.build_on = "amd64";
    profile.selectors.target_arch = "amd64";
    profile.warnings["default_applied"] = WarningAction::Warn;
    profile.warnings["version_script_deprecated"] = WarningAction::Warn;
    profile.warnings["command_chain_assumed"] = WarningAction::Warn;
    profile.warnings["passthrough_enabled"] = WarningAction::Warn;
    return profile;
}

ProfileParseResult parse_profile(const std::string& json_str, const std::string& source_path) {
    ProfileParseResult result;
    result.profile.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.profile.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.profile.schema != PROFILE_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + PROFILE_SCHEMA;
            return result;
        }

        // "selectors" section
        if (j.contains("selectors") && j["selectors"].is_object()) {
            const auto& selectors = j["selectors"];

            if (auto build_on = get_string(selectors, "build_on")) {
                std::string arch = trim(*build_on);
                if (!arch.empty()) {
                    result.profile.selectors.build_on = arch;
                } else {
                    result.warnings.push_back("invalid_configuration:empty_build_on");
                }
            }

            if (auto target = get_string(selectors, "target_arch")) {
                result.profile.selectors.target_arch = trim(*target);
            }

            if (selectors.contains("environment") && selectors["environment"].is_object()) {
                for (auto& [key, val] : selectors["environment"].items()) {
                    if (val.is_string()) {
                        result.profile.selectors.environment[key] = val.get<std::string>();
                    }
                }
            }
        }

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                if (val.is_string()) {
                    std::string key_str = to_lower(key);
                    auto action = parse_warning_action(val.get<std::string>());
                    if (action) {
                        result.profile.warnings[key_str] = *action;
                    } else {
                        result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                    }
                }
            }
        }

        if (j.contains("parallel")) {
            if (j["parallel"].is_boolean()) {
                result.profile.parallel = j["parallel"].get<bool>();
            } else {
                result.warnings.push_back("invalid_configuration:invalid_parallel");
            }
        }

        if (j.contains("workers")) {
            if (j["workers"].is_number_unsigned() &&
                j["workers"].get<std::uint64_t>() <= std::numeric_limits<unsigned>::max()) {
                result.profile.workers = static_cast<unsigned>(j["workers"].get<std::uint64_t>());
            } else {
                result.warnings.push_back("invalid_configuration:invalid_workers");
            }
        }

        for (const auto& w : result.warnings) {
            spdlog::warn("{}: {}", source_path.empty() ? "<profile>" : source_path, w);
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

WarningAction get_warning_action(const Profile& profile, Warning warning) {
    return get_warning_action(profile, warning_to_string(warning));
}

WarningAction get_warning_action(const Profile& profile, const std::string& warning_key) {
    std::string key = to_lower(warning_key);
    auto it = profile.warnings.find(key);
    if (it != profile.warnings.end()) {
        return it->second;
    }
    return WarningAction::Warn;
}

SelectorContext to_selector_context(const Profile& profile) {
    SelectorContext ctx = SelectorContext::cross(profile.selectors.build_on,
                                                 profile.selectors.target_arch);
    ctx.environment = profile.selectors.environment;
    return ctx;
}

AssemblyOptions to_assembly_options(const Profile& profile) {
    AssemblyOptions options;
    options.parallel = profile.parallel;
    options.workers = profile.workers;
    return options;
}

AssemblyResult assemble_manifest(const json& document, const Profile& profile) {
    WarningCollector warnings(profile.warnings);
    return assemble_manifest(document, to_selector_context(profile), to_assembly_options(profile),
                             warnings);
}

} // namespace snapspec
