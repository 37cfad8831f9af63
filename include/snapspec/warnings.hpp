#pragma once

#include "snapspec/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace snapspec {

// ============================================================================
// Warning Collector
// ============================================================================

class SNAPSPEC_API WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    // Emit a warning with fields
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Emit a warning with no fields
    void emit(Warning warning);

    // Emit a warning by key string (for dynamic warning keys)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Override the policy for one key. Takes precedence over the policy map.
    void apply_override(const std::string& warning_key, WarningAction action);

    // Warnings with action "ignore" are excluded
    std::vector<WarningObject> get_warnings() const;

    bool has_errors() const;

    bool has_effective_warnings() const;

    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;
    std::unordered_map<std::string, WarningAction> overrides_;

    WarningAction get_effective_action(const std::string& key) const;
};

// ============================================================================
// Convenience functions for building warning fields
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> default_applied(
    const std::string& path,
    const std::string& value) {
    return {{"path", path}, {"value", value}};
}

inline std::unordered_map<std::string, std::string> version_script_deprecated(
    const std::string& script) {
    return {{"script", script}};
}

inline std::unordered_map<std::string, std::string> command_chain_assumed(
    const std::string& app) {
    return {{"app", app}};
}

inline std::unordered_map<std::string, std::string> passthrough_enabled(
    const std::string& path,
    const std::string& keys) {
    return {{"path", path}, {"keys", keys}};
}

inline std::unordered_map<std::string, std::string> invalid_configuration(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

} // namespace warnings

} // namespace snapspec
