#include "snapspec/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace snapspec {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "default_applied") return Warning::default_applied;
    if (lower == "version_script_deprecated") return Warning::version_script_deprecated;
    if (lower == "command_chain_assumed") return Warning::command_chain_assumed;
    if (lower == "passthrough_enabled") return Warning::passthrough_enabled;
    if (lower == "invalid_configuration") return Warning::invalid_configuration;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

// Manifest enumerations are case-sensitive, like the document keys.

std::optional<SnapType> parse_snap_type(const std::string& s) {
    if (s == "app") return SnapType::App;
    if (s == "base") return SnapType::Base;
    if (s == "gadget") return SnapType::Gadget;
    if (s == "kernel") return SnapType::Kernel;
    if (s == "snapd") return SnapType::Snapd;
    return std::nullopt;
}

std::optional<Confinement> parse_confinement(const std::string& s) {
    if (s == "strict") return Confinement::Strict;
    if (s == "devmode") return Confinement::Devmode;
    if (s == "classic") return Confinement::Classic;
    return std::nullopt;
}

std::optional<Grade> parse_grade(const std::string& s) {
    if (s == "stable") return Grade::Stable;
    if (s == "devel") return Grade::Devel;
    return std::nullopt;
}

void sort_violations(std::vector<Violation>& violations) {
    std::stable_sort(violations.begin(), violations.end(),
                     [](const Violation& a, const Violation& b) {
                         if (a.path != b.path) return a.path < b.path;
                         return a.rule < b.rule;
                     });
}

void sort_failures(std::vector<ResolutionFailure>& failures) {
    std::stable_sort(failures.begin(), failures.end(),
                     [](const ResolutionFailure& a, const ResolutionFailure& b) {
                         if (a.path != b.path) return a.path < b.path;
                         return a.rule < b.rule;
                     });
}

} // namespace snapspec
