#pragma once

#include "snapspec/manifest.hpp"
#include "snapspec/selector.hpp"
#include "snapspec/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace snapspec {

// ============================================================================
// Validation Profile
// ============================================================================
//
// {
//   "$schema": "snapspec.profile.v1",
//   "selectors": { "build_on": "amd64", "target_arch": "arm64",
//                  "environment": { "key": "value" } },
//   "warnings": { "default_applied": "ignore" },
//   "parallel": true,
//   "workers": 4
// }

struct Profile {
    std::string schema;  // MUST be "snapspec.profile.v1"

    // [selectors] section
    struct {
        std::string build_on = "amd64";
        std::string target_arch;  // empty = build_on
        std::unordered_map<std::string, std::string> environment;
    } selectors;

    // [warnings] section - maps warning key to action
    std::unordered_map<std::string, WarningAction> warnings;

    bool parallel = false;
    unsigned workers = 0;

    // Source path for diagnostics
    std::string source_path;
};

// Built-in profile used when none is configured
SNAPSPEC_API Profile get_builtin_profile();

struct ProfileParseResult {
    bool ok = false;
    std::string error;
    Profile profile;
    std::vector<std::string> warnings;
};

SNAPSPEC_API ProfileParseResult parse_profile(const std::string& json_str,
                                              const std::string& source_path = "");

// Returns "warn" if the key is not present
SNAPSPEC_API WarningAction get_warning_action(const Profile& profile, Warning warning);
SNAPSPEC_API WarningAction get_warning_action(const Profile& profile, const std::string& warning_key);

SNAPSPEC_API SelectorContext to_selector_context(const Profile& profile);

SNAPSPEC_API AssemblyOptions to_assembly_options(const Profile& profile);

// Assemble with the profile's selectors, warning policy and worker settings.
SNAPSPEC_API AssemblyResult assemble_manifest(const json& document, const Profile& profile);

} // namespace snapspec
