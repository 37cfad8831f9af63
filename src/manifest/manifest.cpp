#include "snapspec/manifest.hpp"
#include "snapspec/constraint.hpp"
#include "snapspec/grammar.hpp"
#include "snapspec/message.hpp"
#include "snapspec/schema_validator.hpp"

#include <algorithm>
#include <atomic>
#include <iterator>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace snapspec {

namespace {

std::optional<std::string> optional_string(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::vector<std::string> string_list(const json& object, const char* key) {
    std::vector<std::string> out;
    auto it = object.find(key);
    if (it == object.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

json object_or_empty(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_object()) return json::object();
    return *it;
}

bool is_declared(const std::string& scope, const std::string& field) {
    const ScopeRules* rules = manifest_rules().scope(scope);
    if (!rules) return false;
    return std::find(rules->declared_fields.begin(), rules->declared_fields.end(), field) !=
           rules->declared_fields.end();
}

// ============================================================================
// Parts
// ============================================================================

struct StringField {
    const char* name;
    std::optional<std::string> Part::*member;
};

struct ListField {
    const char* name;
    std::vector<std::string> Part::*member;
};

const StringField PART_STRING_FIELDS[] = {
    {"source", &Part::source},
    {"source-checksum", &Part::source_checksum},
    {"source-branch", &Part::source_branch},
    {"source-commit", &Part::source_commit},
    {"source-subdir", &Part::source_subdir},
    {"source-tag", &Part::source_tag},
    {"source-type", &Part::source_type},
};

const ListField PART_LIST_FIELDS[] = {
    {"stage-snaps", &Part::stage_snaps},
    {"stage-packages", &Part::stage_packages},
    {"build-snaps", &Part::build_snaps},
    {"build-packages", &Part::build_packages},
};

struct PartResolution {
    Part part;
    std::vector<ResolutionFailure> failures;
};

// Pure: touches nothing but its own result.
PartResolution resolve_part(const std::string& name, const json& spec, const SelectorContext& ctx) {
    PartResolution result;
    Part& part = result.part;
    const std::string path = "parts." + name;

    part.name = name;
    part.plugin = optional_string(spec, "plugin").value_or("");

    for (const auto& field : PART_STRING_FIELDS) {
        auto it = spec.find(field.name);
        if (it == spec.end()) continue;
        auto resolved = resolve_field(*it, GrammarShape::String, ctx, path + "." + field.name);
        if (!resolved.ok) {
            std::move(resolved.failures.begin(), resolved.failures.end(),
                      std::back_inserter(result.failures));
            continue;
        }
        if (!resolved.values.empty()) {
            part.*field.member = std::move(resolved.values.front());
        }
    }

    for (const auto& field : PART_LIST_FIELDS) {
        auto it = spec.find(field.name);
        if (it == spec.end()) continue;
        auto resolved = resolve_field(*it, GrammarShape::Array, ctx, path + "." + field.name);
        if (!resolved.ok) {
            std::move(resolved.failures.begin(), resolved.failures.end(),
                      std::back_inserter(result.failures));
            continue;
        }
        part.*field.member = std::move(resolved.values);
    }

    if (spec.contains("source-depth") && spec["source-depth"].is_number_integer()) {
        part.source_depth = spec["source-depth"].get<std::int64_t>();
    }
    if (spec.contains("disable-parallel") && spec["disable-parallel"].is_boolean()) {
        part.disable_parallel = spec["disable-parallel"].get<bool>();
    }
    part.after = string_list(spec, "after");
    part.build_attributes = string_list(spec, "build-attributes");
    part.stage = string_list(spec, "stage");
    part.prime = string_list(spec, "prime");
    part.parse_info = string_list(spec, "parse-info");
    if (spec.contains("build-environment") && spec["build-environment"].is_array()) {
        part.build_environment = spec["build-environment"];
    }
    part.organize = object_or_empty(spec, "organize");
    part.filesets = object_or_empty(spec, "filesets");

    part.override_pull = optional_string(spec, "override-pull").value_or("");
    part.override_build = optional_string(spec, "override-build").value_or("");
    part.override_stage = optional_string(spec, "override-stage").value_or("");
    part.override_prime = optional_string(spec, "override-prime").value_or("");

    for (const auto& [key, value] : spec.items()) {
        if (!is_declared("parts.*", key)) {
            part.plugin_properties[key] = value;
        }
    }

    return result;
}

std::vector<PartResolution> resolve_parts(const json& parts,
                                          const SelectorContext& ctx,
                                          const AssemblyOptions& options) {
    std::vector<std::pair<std::string, const json*>> work;
    for (const auto& [name, spec] : parts.items()) {
        work.emplace_back(name, &spec);
    }

    std::vector<PartResolution> results(work.size());

    unsigned num_threads = options.workers;
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }
    if (work.size() < num_threads) {
        num_threads = static_cast<unsigned>(work.size());
    }

    if (!options.parallel || num_threads <= 1) {
        for (size_t i = 0; i < work.size(); ++i) {
            results[i] = resolve_part(work[i].first, *work[i].second, ctx);
        }
        return results;
    }

    spdlog::debug("resolving {} part(s) on {} worker(s)", work.size(), num_threads);

    std::atomic<size_t> current_index{0};

    // Each worker owns the result slots it claims
    auto worker = [&]() {
        while (true) {
            size_t index = current_index.fetch_add(1);
            if (index >= work.size()) break;
            results[index] = resolve_part(work[index].first, *work[index].second, ctx);
        }
    };

    // The calling thread is one of the workers and drains whatever the
    // others leave, so a failed spawn only reduces parallelism.
    std::vector<std::thread> workers;
    try {
        for (unsigned i = 1; i < num_threads; ++i) {
            workers.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        spdlog::warn("started {} of {} part worker(s): {}", workers.size() + 1, num_threads,
                     e.what());
    }
    worker();
    for (auto& thread : workers) {
        thread.join();
    }

    return results;
}

void apply_part_defaults(Part& part, WarningCollector& warnings) {
    const std::pair<const char*, std::string Part::*> overrides[] = {
        {"pull", &Part::override_pull},
        {"build", &Part::override_build},
        {"stage", &Part::override_stage},
        {"prime", &Part::override_prime},
    };
    for (const auto& [step, member] : overrides) {
        if (!(part.*member).empty()) continue;
        part.*member = std::string("snapcraftctl ") + step;
        warnings.emit(Warning::default_applied,
                      warnings::default_applied("parts." + part.name + ".override-" + step,
                                                part.*member));
    }
}

// ============================================================================
// Apps and hooks
// ============================================================================

const char* const APP_TYPED_FIELDS[] = {
    "command", "adapter", "daemon", "command-chain", "plugs", "slots", "extensions",
    "before", "after", "sockets", "environment", "passthrough",
};

App build_app(const std::string& name, const json& spec, WarningCollector& warnings) {
    App app;
    app.name = name;
    app.command = optional_string(spec, "command").value_or("");
    app.daemon = optional_string(spec, "daemon");
    app.command_chain = string_list(spec, "command-chain");
    app.plugs = string_list(spec, "plugs");
    app.slots = string_list(spec, "slots");
    app.extensions = string_list(spec, "extensions");
    app.before = string_list(spec, "before");
    app.after = string_list(spec, "after");
    app.environment = object_or_empty(spec, "environment");
    app.passthrough = object_or_empty(spec, "passthrough");

    if (auto adapter = optional_string(spec, "adapter")) {
        app.adapter = *adapter;
    } else {
        app.adapter = app.command_chain.empty() ? "legacy" : "full";
        warnings.emit(Warning::default_applied,
                      warnings::default_applied("apps." + name + ".adapter", app.adapter));
    }

    for (const auto& [socket_name, socket_spec] : object_or_empty(spec, "sockets").items()) {
        Socket socket;
        socket.name = socket_name;
        if (socket_spec.contains("listen-stream")) {
            socket.listen_stream = socket_spec["listen-stream"];
        }
        if (socket_spec.contains("socket-mode") && socket_spec["socket-mode"].is_number_integer()) {
            socket.socket_mode = socket_spec["socket-mode"].get<std::int64_t>();
        }
        app.sockets.push_back(std::move(socket));
    }

    for (const auto& [key, value] : spec.items()) {
        bool typed = std::any_of(std::begin(APP_TYPED_FIELDS), std::end(APP_TYPED_FIELDS),
                                 [&key = key](const char* f) { return key == f; });
        if (!typed) {
            app.properties[key] = value;
        }
    }

    return app;
}

Hook build_hook(const std::string& name, const json& spec) {
    Hook hook;
    hook.name = name;
    if (spec.is_object()) {
        hook.plugs = string_list(spec, "plugs");
        hook.passthrough = object_or_empty(spec, "passthrough");
    }
    return hook;
}

void note_passthrough(const json& passthrough, const std::string& path,
                      WarningCollector& warnings) {
    if (passthrough.empty()) return;
    std::vector<std::string> keys;
    for (const auto& [key, _] : passthrough.items()) {
        keys.push_back(key);
    }
    warnings.emit(Warning::passthrough_enabled,
                  warnings::passthrough_enabled(path, repr_list(keys)));
}

// ============================================================================
// Top level
// ============================================================================

// Content plugs name their default provider as "<snap>:<slot>"; the model
// keeps the snap name only.
json normalize_plugs(json plugs) {
    for (auto& plug : plugs) {
        if (!plug.is_object()) continue;
        auto interface = plug.find("interface");
        if (interface == plug.end() || *interface != "content") continue;
        auto provider = plug.find("default-provider");
        if (provider == plug.end() || !provider->is_string()) continue;
        const auto& text = provider->get_ref<const std::string&>();
        auto colon = text.find(':');
        if (colon != std::string::npos) {
            *provider = text.substr(0, colon);
        }
    }
    return plugs;
}

template <typename Enum>
Enum enum_or_default(const json& document, const char* key, Enum fallback,
                     std::optional<Enum> (*parse)(const std::string&),
                     const char* (*to_string)(Enum), WarningCollector& warnings) {
    if (auto text = optional_string(document, key)) {
        return parse(*text).value_or(fallback);
    }
    warnings.emit(Warning::default_applied, warnings::default_applied(key, to_string(fallback)));
    return fallback;
}

void build_top_level(const json& document, Manifest& manifest, WarningCollector& warnings) {
    manifest.name = optional_string(document, "name").value_or("");
    manifest.title = optional_string(document, "title");
    manifest.version = optional_string(document, "version");
    manifest.version_script = optional_string(document, "version-script");
    manifest.summary = optional_string(document, "summary");
    manifest.description = optional_string(document, "description");
    manifest.icon = optional_string(document, "icon");
    manifest.adopt_info = optional_string(document, "adopt-info");
    manifest.base = optional_string(document, "base");
    manifest.build_base = optional_string(document, "build-base");
    manifest.license = optional_string(document, "license");
    manifest.license_agreement = optional_string(document, "license-agreement");
    manifest.license_version = optional_string(document, "license-version");
    if (document.contains("epoch")) {
        manifest.epoch = document["epoch"];
    }

    manifest.type = enum_or_default(document, "type", SnapType::App, &parse_snap_type,
                                    &snap_type_to_string, warnings);
    manifest.confinement = enum_or_default(document, "confinement", Confinement::Strict,
                                           &parse_confinement, &confinement_to_string, warnings);
    manifest.grade = enum_or_default(document, "grade", Grade::Stable, &parse_grade,
                                     &grade_to_string, warnings);

    manifest.assumes = string_list(document, "assumes");
    if (document.contains("architectures") && document["architectures"].is_array()) {
        manifest.architectures = document["architectures"];
    }
    manifest.environment = object_or_empty(document, "environment");
    manifest.layout = object_or_empty(document, "layout");
    manifest.plugs = normalize_plugs(object_or_empty(document, "plugs"));
    manifest.slots = object_or_empty(document, "slots");
    manifest.passthrough = object_or_empty(document, "passthrough");
    manifest.system_usernames = object_or_empty(document, "system-usernames");

    if (manifest.version_script) {
        warnings.emit(Warning::version_script_deprecated,
                      warnings::version_script_deprecated(*manifest.version_script));
    }
    note_passthrough(manifest.passthrough, "passthrough", warnings);
}

} // namespace

const App* Manifest::find_app(const std::string& app_name) const {
    for (const auto& app : apps) {
        if (app.name == app_name) return &app;
    }
    return nullptr;
}

const Part* Manifest::find_part(const std::string& part_name) const {
    for (const auto& part : parts) {
        if (part.name == part_name) return &part;
    }
    return nullptr;
}

AssemblyResult assemble_manifest(const json& document,
                                 const SelectorContext& ctx,
                                 const AssemblyOptions& options,
                                 WarningCollector& warnings) {
    AssemblyResult result;

    auto validation = validate_document(document);
    if (validation.critical_error) {
        result.critical_error = validation.critical_error;
        result.critical_error_context = validation.critical_error_context;
        return result;
    }
    if (!validation.ok) {
        result.violations = std::move(validation.violations);
        spdlog::debug("assembly stopped: {} violation(s)", result.violations.size());
        return result;
    }

    // Grammar pass
    auto parts = resolve_parts(document["parts"], ctx, options);
    for (auto& resolved : parts) {
        std::move(resolved.failures.begin(), resolved.failures.end(),
                  std::back_inserter(result.failures));
    }

    std::vector<std::string> build_packages;
    if (document.contains("build-packages")) {
        auto resolved = resolve_field(document["build-packages"], GrammarShape::Array, ctx,
                                      "build-packages");
        if (resolved.ok) {
            build_packages = std::move(resolved.values);
        } else {
            std::move(resolved.failures.begin(), resolved.failures.end(),
                      std::back_inserter(result.failures));
        }
    }

    if (!result.failures.empty()) {
        sort_failures(result.failures);
        spdlog::debug("assembly stopped: {} resolution failure(s)", result.failures.size());
        return result;
    }

    // Model
    Manifest& manifest = result.manifest;
    build_top_level(document, manifest, warnings);
    manifest.build_packages = std::move(build_packages);

    std::optional<std::string> chained_app;
    for (const auto& [name, spec] : object_or_empty(document, "apps").items()) {
        App app = build_app(name, spec, warnings);
        note_passthrough(app.passthrough, "apps." + name + ".passthrough", warnings);
        if (!app.command_chain.empty() && !chained_app) {
            chained_app = name;
        }
        manifest.apps.push_back(std::move(app));
    }

    if (chained_app &&
        std::find(manifest.assumes.begin(), manifest.assumes.end(), "command-chain") ==
            manifest.assumes.end()) {
        manifest.assumes.push_back("command-chain");
        warnings.emit(Warning::command_chain_assumed, warnings::command_chain_assumed(*chained_app));
    }

    for (const auto& [name, spec] : object_or_empty(document, "hooks").items()) {
        Hook hook = build_hook(name, spec);
        note_passthrough(hook.passthrough, "hooks." + name + ".passthrough", warnings);
        manifest.hooks.push_back(std::move(hook));
    }

    for (auto& resolved : parts) {
        apply_part_defaults(resolved.part, warnings);
        manifest.parts.push_back(std::move(resolved.part));
    }

    result.warnings = warnings.get_warnings();
    if (warnings.has_errors()) {
        spdlog::error("assembly of '{}' failed: a warning is configured as an error", manifest.name);
        return result;
    }

    spdlog::debug("assembled '{}': {} app(s), {} hook(s), {} part(s)", manifest.name,
                  manifest.apps.size(), manifest.hooks.size(), manifest.parts.size());
    result.ok = true;
    return result;
}

AssemblyResult assemble_manifest(const json& document,
                                 const SelectorContext& ctx,
                                 const AssemblyOptions& options) {
    WarningCollector warnings;
    return assemble_manifest(document, ctx, options, warnings);
}

} // namespace snapspec
