#pragma once

#include "snapspec/export.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace snapspec {

// Decoded manifest tree. Objects keep document order.
using json = nlohmann::ordered_json;

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    default_applied,
    version_script_deprecated,
    command_chain_assumed,
    passthrough_enabled,
    invalid_configuration,
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::default_applied: return "default_applied";
        case Warning::version_script_deprecated: return "version_script_deprecated";
        case Warning::command_chain_assumed: return "command_chain_assumed";
        case Warning::passthrough_enabled: return "passthrough_enabled";
        case Warning::invalid_configuration: return "invalid_configuration";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
SNAPSPEC_API std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

SNAPSPEC_API std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

// ============================================================================
// Critical Errors
// ============================================================================

// Abort processing before any field-level rule runs.
enum class CriticalError {
    DOCUMENT_SHAPE,
};

inline const char* critical_error_to_string(CriticalError e) {
    switch (e) {
        case CriticalError::DOCUMENT_SHAPE: return "DOCUMENT_SHAPE";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Diagnostics
// ============================================================================

// One breach of a structural or cross-field rule.
struct Violation {
    std::string path;     // dotted path, e.g. "parts.mypart.source-type"
    std::string rule;     // rule identifier, e.g. "enum"
    std::string message;  // rendered validation-failure text

    bool operator==(const Violation& other) const {
        return path == other.path && rule == other.rule && message == other.message;
    }
};

// A grammar field that could not be collapsed to a flat value.
struct ResolutionFailure {
    std::string path;
    std::string rule;        // "else-fail" | "grammar-type" | "single-value"
    std::string statement;   // grammar statement text that failed, if any
    std::string build_arch;
    std::string target_arch;
    std::string message;
};

// Stable sort by (path, rule). Insertion order breaks ties.
SNAPSPEC_API void sort_violations(std::vector<Violation>& violations);
SNAPSPEC_API void sort_failures(std::vector<ResolutionFailure>& failures);

// ============================================================================
// Manifest enumerations
// ============================================================================

enum class SnapType {
    App,
    Base,
    Gadget,
    Kernel,
    Snapd
};

inline const char* snap_type_to_string(SnapType t) {
    switch (t) {
        case SnapType::App: return "app";
        case SnapType::Base: return "base";
        case SnapType::Gadget: return "gadget";
        case SnapType::Kernel: return "kernel";
        case SnapType::Snapd: return "snapd";
        default: return "app";
    }
}

SNAPSPEC_API std::optional<SnapType> parse_snap_type(const std::string& s);

enum class Confinement {
    Strict,
    Devmode,
    Classic
};

inline const char* confinement_to_string(Confinement c) {
    switch (c) {
        case Confinement::Strict: return "strict";
        case Confinement::Devmode: return "devmode";
        case Confinement::Classic: return "classic";
        default: return "strict";
    }
}

SNAPSPEC_API std::optional<Confinement> parse_confinement(const std::string& s);

enum class Grade {
    Stable,
    Devel
};

inline const char* grade_to_string(Grade g) {
    switch (g) {
        case Grade::Stable: return "stable";
        case Grade::Devel: return "devel";
        default: return "stable";
    }
}

SNAPSPEC_API std::optional<Grade> parse_grade(const std::string& s);

} // namespace snapspec
