#include "snapspec/manifest.hpp"

namespace snapspec {

namespace {

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

void put_list(json& j, const char* key, const std::vector<std::string>& values) {
    if (!values.empty()) {
        j[key] = values;
    }
}

void put_object(json& j, const char* key, const json& value) {
    if (!value.empty()) {
        j[key] = value;
    }
}

json app_to_json(const App& app) {
    json j;
    j["command"] = app.command;
    j["adapter"] = app.adapter;
    put_optional(j, "daemon", app.daemon);
    put_list(j, "command-chain", app.command_chain);
    put_list(j, "plugs", app.plugs);
    put_list(j, "slots", app.slots);
    put_list(j, "extensions", app.extensions);
    put_list(j, "before", app.before);
    put_list(j, "after", app.after);

    if (!app.sockets.empty()) {
        json sockets = json::object();
        for (const auto& socket : app.sockets) {
            json s;
            s["listen-stream"] = socket.listen_stream;
            put_optional(s, "socket-mode", socket.socket_mode);
            sockets[socket.name] = s;
        }
        j["sockets"] = sockets;
    }

    put_object(j, "environment", app.environment);
    put_object(j, "passthrough", app.passthrough);
    for (const auto& [key, value] : app.properties.items()) {
        j[key] = value;
    }
    return j;
}

json hook_to_json(const Hook& hook) {
    json j = json::object();
    put_list(j, "plugs", hook.plugs);
    put_object(j, "passthrough", hook.passthrough);
    return j;
}

json part_to_json(const Part& part) {
    json j;
    j["plugin"] = part.plugin;

    put_optional(j, "source", part.source);
    put_optional(j, "source-type", part.source_type);
    put_optional(j, "source-checksum", part.source_checksum);
    put_optional(j, "source-branch", part.source_branch);
    put_optional(j, "source-commit", part.source_commit);
    put_optional(j, "source-tag", part.source_tag);
    put_optional(j, "source-subdir", part.source_subdir);
    put_optional(j, "source-depth", part.source_depth);

    // Resolved grammar lists are always written, even when empty
    j["stage-snaps"] = part.stage_snaps;
    j["stage-packages"] = part.stage_packages;
    j["build-snaps"] = part.build_snaps;
    j["build-packages"] = part.build_packages;

    if (part.disable_parallel) {
        j["disable-parallel"] = true;
    }
    put_list(j, "after", part.after);
    put_list(j, "build-attributes", part.build_attributes);
    if (!part.build_environment.empty()) {
        j["build-environment"] = part.build_environment;
    }
    put_object(j, "organize", part.organize);
    put_object(j, "filesets", part.filesets);
    put_list(j, "stage", part.stage);
    put_list(j, "prime", part.prime);
    put_list(j, "parse-info", part.parse_info);

    j["override-pull"] = part.override_pull;
    j["override-build"] = part.override_build;
    j["override-stage"] = part.override_stage;
    j["override-prime"] = part.override_prime;

    for (const auto& [key, value] : part.plugin_properties.items()) {
        j[key] = value;
    }
    return j;
}

} // namespace

std::string serialize_manifest_json(const Manifest& manifest) {
    json j;

    j["name"] = manifest.name;
    put_optional(j, "title", manifest.title);
    put_optional(j, "version", manifest.version);
    put_optional(j, "version-script", manifest.version_script);
    put_optional(j, "summary", manifest.summary);
    put_optional(j, "description", manifest.description);
    put_optional(j, "icon", manifest.icon);
    put_optional(j, "adopt-info", manifest.adopt_info);

    j["type"] = snap_type_to_string(manifest.type);
    put_optional(j, "base", manifest.base);
    put_optional(j, "build-base", manifest.build_base);
    j["confinement"] = confinement_to_string(manifest.confinement);
    j["grade"] = grade_to_string(manifest.grade);
    put_optional(j, "epoch", manifest.epoch);

    put_optional(j, "license", manifest.license);
    put_optional(j, "license-agreement", manifest.license_agreement);
    put_optional(j, "license-version", manifest.license_version);

    put_list(j, "assumes", manifest.assumes);
    if (!manifest.architectures.empty()) {
        j["architectures"] = manifest.architectures;
    }
    put_object(j, "environment", manifest.environment);
    put_object(j, "layout", manifest.layout);
    put_object(j, "plugs", manifest.plugs);
    put_object(j, "slots", manifest.slots);
    put_object(j, "system-usernames", manifest.system_usernames);
    put_object(j, "passthrough", manifest.passthrough);
    put_list(j, "build-packages", manifest.build_packages);

    // apps, hooks and parts in document order
    if (!manifest.apps.empty()) {
        json apps = json::object();
        for (const auto& app : manifest.apps) {
            apps[app.name] = app_to_json(app);
        }
        j["apps"] = apps;
    }

    if (!manifest.hooks.empty()) {
        json hooks = json::object();
        for (const auto& hook : manifest.hooks) {
            hooks[hook.name] = hook_to_json(hook);
        }
        j["hooks"] = hooks;
    }

    json parts = json::object();
    for (const auto& part : manifest.parts) {
        parts[part.name] = part_to_json(part);
    }
    j["parts"] = parts;

    return j.dump(2);
}

} // namespace snapspec
