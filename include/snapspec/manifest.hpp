#pragma once

#include "snapspec/selector.hpp"
#include "snapspec/types.hpp"
#include "snapspec/warnings.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snapspec {

// ============================================================================
// Resolved Manifest
// ============================================================================
//
// The validated, grammar-resolved document handed to a build orchestrator.
// Apps, hooks and parts keep document order. Fields the core does not
// interpret are carried through as json.

struct Socket {
    std::string name;
    json listen_stream;  // port number or socket path
    std::optional<std::int64_t> socket_mode;
};

struct App {
    std::string name;
    std::string command;
    std::string adapter;  // "none" | "full" | "legacy"
    std::optional<std::string> daemon;
    std::vector<std::string> command_chain;
    std::vector<std::string> plugs;
    std::vector<std::string> slots;
    std::vector<std::string> extensions;
    std::vector<std::string> before;
    std::vector<std::string> after;
    std::vector<Socket> sockets;
    json environment = json::object();
    json passthrough = json::object();
    json properties = json::object();  // remaining scalar fields, e.g. stop-mode
};

struct Hook {
    std::string name;
    std::vector<std::string> plugs;
    json passthrough = json::object();
};

struct Part {
    std::string name;
    std::string plugin;

    // grammar-string fields, absent when unset or resolved to nothing
    std::optional<std::string> source;
    std::optional<std::string> source_checksum;
    std::optional<std::string> source_branch;
    std::optional<std::string> source_commit;
    std::optional<std::string> source_subdir;
    std::optional<std::string> source_tag;
    std::optional<std::string> source_type;

    // grammar-array fields, empty when unset
    std::vector<std::string> stage_snaps;
    std::vector<std::string> stage_packages;
    std::vector<std::string> build_snaps;
    std::vector<std::string> build_packages;

    std::optional<std::int64_t> source_depth;
    bool disable_parallel = false;
    std::vector<std::string> after;
    std::vector<std::string> build_attributes;
    std::vector<std::string> stage;
    std::vector<std::string> prime;
    std::vector<std::string> parse_info;
    json build_environment = json::array();
    json organize = json::object();
    json filesets = json::object();

    std::string override_pull;
    std::string override_build;
    std::string override_stage;
    std::string override_prime;

    json plugin_properties = json::object();  // keys the plugin interprets
};

struct Manifest {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> version;
    std::optional<std::string> version_script;
    std::optional<std::string> summary;
    std::optional<std::string> description;
    std::optional<std::string> icon;
    std::optional<std::string> adopt_info;
    std::optional<std::string> base;
    std::optional<std::string> build_base;
    std::optional<std::string> license;
    std::optional<std::string> license_agreement;
    std::optional<std::string> license_version;
    std::optional<json> epoch;

    SnapType type = SnapType::App;
    Confinement confinement = Confinement::Strict;
    Grade grade = Grade::Stable;

    std::vector<std::string> assumes;
    std::vector<std::string> build_packages;
    json architectures = json::array();
    json environment = json::object();
    json layout = json::object();
    json plugs = json::object();
    json slots = json::object();
    json passthrough = json::object();
    json system_usernames = json::object();

    std::vector<App> apps;
    std::vector<Hook> hooks;
    std::vector<Part> parts;

    const App* find_app(const std::string& name) const;
    const Part* find_part(const std::string& name) const;
};

// ============================================================================
// Assembly
// ============================================================================

struct AssemblyOptions {
    bool parallel = false;
    unsigned workers = 0;  // 0 = hardware concurrency
};

struct AssemblyResult {
    bool ok = false;
    std::optional<CriticalError> critical_error;
    std::string critical_error_context;
    std::vector<Violation> violations;        // schema pass, sorted
    std::vector<ResolutionFailure> failures;  // grammar pass, sorted
    Manifest manifest;                        // meaningful only when ok
    std::vector<WarningObject> warnings;
};

// Validate, resolve every grammar field against ctx and apply defaults.
// Resolution is skipped when validation reports violations. A warning whose
// policy action is "error" fails assembly.
SNAPSPEC_API AssemblyResult assemble_manifest(const json& document,
                                              const SelectorContext& ctx,
                                              const AssemblyOptions& options,
                                              WarningCollector& warnings);

SNAPSPEC_API AssemblyResult assemble_manifest(const json& document,
                                              const SelectorContext& ctx,
                                              const AssemblyOptions& options = {});

// Deterministic JSON for a resolved manifest.
SNAPSPEC_API std::string serialize_manifest_json(const Manifest& manifest);

} // namespace snapspec
