#include "snapspec/constraint.hpp"

#include <algorithm>
#include <regex>
#include <set>

namespace snapspec {

namespace {

// ============================================================================
// Message templates
// ============================================================================

const char* const MSG_TYPE = "{instance} is not of type {expected}";
const char* const MSG_REQUIRED = "'{field}' is a required property";
const char* const MSG_ENUM = "{instance} is not one of {allowed}";
const char* const MSG_MIN_LENGTH = "{instance} is too short (minimum length is {limit})";
const char* const MSG_MAX_LENGTH = "{instance} is too long (maximum length is {limit})";
const char* const MSG_MINIMUM = "{instance} is less than the minimum of {limit}";
const char* const MSG_UNIQUE = "{instance} has non-unique elements";
const char* const MSG_CLOSED = "Additional properties are not allowed ({key} was unexpected)";
const char* const MSG_MIN_PROPERTIES = "{instance} does not have enough properties";
const char* const MSG_DEPENDENCY = "'{dependency}' is a dependency of '{field}'";

const char* const MSG_NAME =
    "{instance} is not a valid snap name. Snap names can only use ASCII lowercase letters, "
    "numbers, and hyphens, and must have at least one letter.";
const char* const MSG_VERSION =
    "{instance} is not a valid snap version string. Snap versions consist of upper- and "
    "lower-case alphanumeric characters, as well as periods, colons, plus signs, tildes, and "
    "hyphens. They cannot begin with a period, colon, plus sign, tilde, or hyphen. They cannot "
    "end with a period, colon, or hyphen.";
const char* const MSG_EPOCH =
    "{instance} is not a valid epoch value. Epochs are non-negative integers, optionally "
    "followed by an asterisk.";
const char* const MSG_COMMAND =
    "{instance} is not a valid command. App commands can only use ASCII alphanumeric "
    "characters, spaces, and the following special characters: / . _ # : $ -";
const char* const MSG_COMMAND_CHAIN =
    "{instance} is not a valid command-chain entry. Command chain entries must be strings, and "
    "can only use ASCII alphanumeric characters and the following special characters: / . _ # : $ -";
const char* const MSG_TIMEOUT =
    "{instance} is not a valid timeout value. Timeouts are a number followed by an optional "
    "unit (ns, us, ms, s or m).";
const char* const MSG_BUS_NAME = "{instance} is not a valid bus name.";
const char* const MSG_AUTOSTART = "{instance} is not a valid desktop file name (e.g. myapp.desktop)";
const char* const MSG_LISTEN_STREAM =
    "{instance} is not a valid listen-stream. Use a port number between 1 and 65535 or a "
    "socket path.";
const char* const MSG_APP_NAME =
    "{key} is not a valid app name. App names consist of upper- and lower-case alphanumeric "
    "characters and hyphens. They cannot start or end with a hyphen.";
const char* const MSG_HOOK_NAME =
    "{key} is not a valid hook name. Hook names consist of lower-case alphanumeric characters "
    "and hyphens. They cannot start or end with a hyphen.";
const char* const MSG_PART_NAME =
    "{key} is not a valid part name. Part names consist of lower-case alphanumeric characters, "
    "hyphens and plus signs. As a special case, 'plugins' is also not a valid part name.";
const char* const MSG_SOCKET_NAME =
    "{key} is not a valid socket name. Socket names consist of lower-case alphanumeric "
    "characters, hyphens and underscores, and must start with a letter.";
const char* const MSG_BASE_TYPE =
    "Invalid combination of 'type', 'base' and 'build-base': snaps of type 'base', 'kernel' "
    "or 'snapd' cannot set 'base', other snaps must set 'base', and 'build-base' is only "
    "allowed together with 'base: bare'.";
const char* const MSG_METADATA =
    "Snap metadata is incomplete: {missing} must be set, unless metadata is adopted from a "
    "part with 'adopt-info'.";
const char* const MSG_PASSTHROUGH =
    "The following keys are specified in their regular location as well as in passthrough: {keys}";
const char* const MSG_PLUG_INTERFACE = "Plug {key} is invalid: 'interface' is a required property";
const char* const MSG_SLOT_INTERFACE = "Slot {key} is invalid: 'interface' is a required property";
const char* const MSG_CONTENT_TARGET =
    "Plug {key} is invalid: content plugs require a non-empty 'target'";
const char* const MSG_CONTENT_PATHS =
    "Slot {key} is invalid: content slots require 'read' or 'write' paths";
const char* const MSG_DBUS_SLOT =
    "Slot {key} is invalid: dbus slots require a non-empty 'bus' and 'name'";

// ============================================================================
// Patterns
// ============================================================================

const char* const NAME_PATTERN = "^[a-z0-9-]*[a-z][a-z0-9-]*$";
const char* const NAME_HYPHENS = "^-.*|.*-$|.*--.*";
const char* const VERSION_PATTERN = "^[a-zA-Z0-9](?:[a-zA-Z0-9:.+~-]{0,30}[a-zA-Z0-9+~])?$";
const char* const EPOCH_PATTERN = "^(?:0|[1-9][0-9]*[*]?)$";
const char* const COMMAND_PATTERN = "^[A-Za-z0-9. _#:$-][A-Za-z0-9/. _#:$-]*$";
const char* const COMMAND_CHAIN_PATTERN = "^[A-Za-z0-9/._#:$-]*$";
const char* const BUS_NAME_PATTERN = "^[A-Za-z0-9/. _#:$-]*$";
const char* const TIMEOUT_PATTERN = "^[0-9]+(ns|us|ms|s|m)*$";
const char* const AUTOSTART_PATTERN = "^[A-Za-z0-9. _#:$-]+\\.desktop$";
const char* const APP_NAME_PATTERN = "^[a-zA-Z0-9](?:-?[a-zA-Z0-9])*$";
const char* const HOOK_NAME_PATTERN = "^[a-z](?:-?[a-z0-9])*$";
const char* const PART_NAME_PATTERN = "^(?!plugins$)[a-z0-9][a-z0-9+-]*$";
const char* const SOCKET_NAME_PATTERN = "^[a-z][a-z0-9_-]*$";

constexpr size_t MAX_EPOCH_LENGTH = 32;

// ============================================================================
// Predicates
// ============================================================================

bool epoch_is_valid(const json& value, MessageFields& /*fields*/) {
    if (value.is_number_integer()) {
        return value.get<std::int64_t>() >= 0;
    }
    if (value.is_string()) {
        static const std::regex re(EPOCH_PATTERN);
        const auto& text = value.get_ref<const std::string&>();
        return text.size() <= MAX_EPOCH_LENGTH && std::regex_match(text, re);
    }
    return false;
}

bool listen_stream_is_valid(const json& value, MessageFields& /*fields*/) {
    if (value.is_number_integer()) {
        auto port = value.get<std::int64_t>();
        return port >= 1 && port <= 65535;
    }
    // Socket paths, abstract "@" sockets and "[address]:port" forms.
    if (value.is_string()) {
        return !value.get_ref<const std::string&>().empty();
    }
    return false;
}

// Exactly one of:
//   type in {base, kernel, snapd} and no base
//   type in {app, gadget} (default app), base set and no build-base
//   base == "bare" and build-base set
bool base_type_exclusive(const json& doc, MessageFields& /*fields*/) {
    std::string type = "app";
    if (doc.contains("type") && doc["type"].is_string()) {
        type = doc["type"].get<std::string>();
    }
    bool has_base = doc.contains("base");
    bool has_build_base = doc.contains("build-base");
    bool bare = has_base && doc["base"].is_string() && doc["base"].get<std::string>() == "bare";

    int matched = 0;
    if ((type == "base" || type == "kernel" || type == "snapd") && !has_base) ++matched;
    if ((type == "app" || type == "gadget") && has_base && !has_build_base) ++matched;
    if (bare && has_build_base) ++matched;
    return matched == 1;
}

bool passthrough_unambiguous(const json& object, MessageFields& fields) {
    if (!object.contains("passthrough") || !object["passthrough"].is_object()) {
        return true;
    }
    std::vector<std::string> duplicates;
    for (const auto& [key, _] : object["passthrough"].items()) {
        if (object.contains(key)) {
            duplicates.push_back(key);
        }
    }
    if (duplicates.empty()) {
        return true;
    }
    std::sort(duplicates.begin(), duplicates.end());
    fields["keys"] = repr_list(duplicates);
    return false;
}

bool has_interface(const json& object, const char* interface) {
    return object.contains("interface") && object["interface"].is_string() &&
           object["interface"].get_ref<const std::string&>() == interface;
}

bool non_empty_string(const json& object, const char* key) {
    return object.contains(key) && object[key].is_string() &&
           !object[key].get_ref<const std::string&>().empty();
}

bool content_plug_has_target(const json& plug, MessageFields& /*fields*/) {
    if (!has_interface(plug, "content")) {
        return true;
    }
    return non_empty_string(plug, "target");
}

bool content_slot_has_paths(const json& slot, MessageFields& /*fields*/) {
    if (!has_interface(slot, "content")) {
        return true;
    }
    // Paths sit at the top level or under "source".
    auto has_paths = [](const json& object) {
        for (const char* key : {"read", "write"}) {
            if (object.contains(key) && object[key].is_array() && !object[key].empty()) {
                return true;
            }
        }
        return false;
    };
    if (has_paths(slot)) {
        return true;
    }
    return slot.contains("source") && slot["source"].is_object() && has_paths(slot["source"]);
}

bool dbus_slot_has_target(const json& slot, MessageFields& /*fields*/) {
    if (!has_interface(slot, "dbus")) {
        return true;
    }
    return non_empty_string(slot, "bus") && non_empty_string(slot, "name");
}

// ============================================================================
// Rule builders
// ============================================================================

ConstraintRule type(const std::string& scope, const std::string& field, ValueType t) {
    ConstraintRule r;
    r.id = "type";
    r.kind = RuleKind::Type;
    r.scope = scope;
    r.field = field;
    r.type = t;
    r.message = MSG_TYPE;
    return r;
}

ConstraintRule pattern(const std::string& scope, const std::string& field,
                       const std::string& re, const std::string& message) {
    ConstraintRule r;
    r.id = "pattern";
    r.kind = RuleKind::Pattern;
    r.scope = scope;
    r.field = field;
    r.pattern = re;
    r.message = message;
    return r;
}

ConstraintRule not_pattern(const std::string& scope, const std::string& field,
                           const std::string& re, const std::string& message) {
    ConstraintRule r = pattern(scope, field, re, message);
    r.kind = RuleKind::NotPattern;
    return r;
}

ConstraintRule one_of(const std::string& scope, const std::string& field,
                      std::vector<std::string> values) {
    ConstraintRule r;
    r.id = "enum";
    r.kind = RuleKind::Enum;
    r.scope = scope;
    r.field = field;
    r.values = std::move(values);
    r.message = MSG_ENUM;
    return r;
}

ConstraintRule min_length(const std::string& scope, const std::string& field, std::int64_t n) {
    ConstraintRule r;
    r.id = "min-length";
    r.kind = RuleKind::MinLength;
    r.scope = scope;
    r.field = field;
    r.limit = n;
    r.message = MSG_MIN_LENGTH;
    return r;
}

ConstraintRule max_length(const std::string& scope, const std::string& field, std::int64_t n) {
    ConstraintRule r;
    r.id = "max-length";
    r.kind = RuleKind::MaxLength;
    r.scope = scope;
    r.field = field;
    r.limit = n;
    r.message = MSG_MAX_LENGTH;
    return r;
}

ConstraintRule minimum(const std::string& scope, const std::string& field, std::int64_t n) {
    ConstraintRule r;
    r.id = "minimum";
    r.kind = RuleKind::Minimum;
    r.scope = scope;
    r.field = field;
    r.limit = n;
    r.message = MSG_MINIMUM;
    return r;
}

ConstraintRule unique(const std::string& scope, const std::string& field) {
    ConstraintRule r;
    r.id = "unique-items";
    r.kind = RuleKind::UniqueItems;
    r.scope = scope;
    r.field = field;
    r.message = MSG_UNIQUE;
    return r;
}

ConstraintRule item_type(const std::string& scope, const std::string& field, ValueType t) {
    ConstraintRule r = type(scope, field, t);
    r.kind = RuleKind::ItemType;
    return r;
}

ConstraintRule item_pattern(const std::string& scope, const std::string& field,
                            const std::string& re, const std::string& message) {
    ConstraintRule r = pattern(scope, field, re, message);
    r.kind = RuleKind::ItemPattern;
    return r;
}

ConstraintRule item_enum(const std::string& scope, const std::string& field,
                         std::vector<std::string> values) {
    ConstraintRule r = one_of(scope, field, std::move(values));
    r.kind = RuleKind::ItemEnum;
    return r;
}

ConstraintRule entry_type(const std::string& scope, ValueType t) {
    ConstraintRule r = type(scope, "", t);
    r.kind = RuleKind::EntryType;
    return r;
}

ConstraintRule required(const std::string& scope, const std::string& field,
                        const std::string& id = "required",
                        const std::string& message = MSG_REQUIRED) {
    ConstraintRule r;
    r.id = id;
    r.kind = RuleKind::Required;
    r.scope = scope;
    r.field = field;
    r.message = message;
    return r;
}

ConstraintRule key_pattern(const std::string& scope, const std::string& re,
                           const std::string& message) {
    ConstraintRule r;
    r.id = "invalid-key";
    r.kind = RuleKind::KeyPattern;
    r.scope = scope;
    r.pattern = re;
    r.message = message;
    return r;
}

ConstraintRule closed(const std::string& scope) {
    ConstraintRule r;
    r.id = "additional-properties";
    r.kind = RuleKind::Closed;
    r.scope = scope;
    r.message = MSG_CLOSED;
    return r;
}

ConstraintRule min_properties(const std::string& scope, std::int64_t n) {
    ConstraintRule r;
    r.id = "min-properties";
    r.kind = RuleKind::MinProperties;
    r.scope = scope;
    r.limit = n;
    r.message = MSG_MIN_PROPERTIES;
    return r;
}

ConstraintRule depends(const std::string& scope, const std::string& field,
                       std::vector<std::string> on) {
    ConstraintRule r;
    r.id = "dependencies";
    r.kind = RuleKind::Dependency;
    r.scope = scope;
    r.field = field;
    r.values = std::move(on);
    r.message = MSG_DEPENDENCY;
    return r;
}

ConstraintRule any_of(const std::string& scope, const std::string& id,
                      std::vector<std::vector<std::string>> groups, const std::string& message) {
    ConstraintRule r;
    r.id = id;
    r.kind = RuleKind::RequiredAnyOf;
    r.scope = scope;
    r.groups = std::move(groups);
    r.message = message;
    return r;
}

ConstraintRule check(const std::string& scope, const std::string& field, const std::string& id,
                     RulePredicate predicate, const std::string& message) {
    ConstraintRule r;
    r.id = id;
    r.kind = RuleKind::Predicate;
    r.scope = scope;
    r.field = field;
    r.predicate = predicate;
    r.message = message;
    return r;
}

void add_string_list(std::vector<ConstraintRule>& rules, const std::string& scope,
                     const std::string& field) {
    rules.push_back(type(scope, field, ValueType::Array));
    rules.push_back(item_type(scope, field, ValueType::String));
    rules.push_back(unique(scope, field));
}

std::vector<ConstraintRule> build_manifest_rules() {
    std::vector<ConstraintRule> rules;

    // ------------------------------------------------------------------------
    // Document root
    // ------------------------------------------------------------------------
    const std::string root;

    rules.push_back(required(root, "name"));
    rules.push_back(required(root, "parts"));
    rules.push_back(closed(root));

    rules.push_back(type(root, "name", ValueType::String));
    rules.push_back(max_length(root, "name", 40));
    rules.push_back(pattern(root, "name", NAME_PATTERN, MSG_NAME));
    rules.push_back(not_pattern(root, "name", NAME_HYPHENS, MSG_NAME));

    rules.push_back(type(root, "title", ValueType::String));
    rules.push_back(max_length(root, "title", 40));

    rules.push_back(type(root, "version", ValueType::String));
    rules.push_back(max_length(root, "version", 32));
    rules.push_back(pattern(root, "version", VERSION_PATTERN, MSG_VERSION));

    rules.push_back(type(root, "version-script", ValueType::String));
    rules.push_back(type(root, "icon", ValueType::String));

    rules.push_back(type(root, "summary", ValueType::String));
    rules.push_back(max_length(root, "summary", 78));

    rules.push_back(type(root, "description", ValueType::String));
    rules.push_back(min_length(root, "description", 1));

    rules.push_back(type(root, "type", ValueType::String));
    rules.push_back(one_of(root, "type", {"app", "base", "gadget", "kernel", "snapd"}));

    rules.push_back(type(root, "base", ValueType::String));
    rules.push_back(type(root, "build-base", ValueType::String));

    rules.push_back(type(root, "confinement", ValueType::String));
    rules.push_back(one_of(root, "confinement", {"classic", "devmode", "strict"}));

    rules.push_back(type(root, "grade", ValueType::String));
    rules.push_back(one_of(root, "grade", {"stable", "devel"}));

    rules.push_back(type(root, "adopt-info", ValueType::String));
    add_string_list(rules, root, "assumes");

    rules.push_back(type(root, "architectures", ValueType::Array));
    rules.push_back(item_type(root, "architectures", ValueType::StringOrObject));

    rules.push_back(type(root, "environment", ValueType::Object));
    rules.push_back(type(root, "epoch", ValueType::Any));
    rules.push_back(check(root, "epoch", "pattern", epoch_is_valid, MSG_EPOCH));

    rules.push_back(type(root, "license", ValueType::String));
    rules.push_back(type(root, "license-agreement", ValueType::String));
    rules.push_back(type(root, "license-version", ValueType::String));

    rules.push_back(type(root, "layout", ValueType::Object));
    rules.push_back(type(root, "passthrough", ValueType::Object));
    rules.push_back(type(root, "system-usernames", ValueType::Object));
    rules.push_back(type(root, "plugs", ValueType::Object));
    rules.push_back(type(root, "slots", ValueType::Object));
    rules.push_back(type(root, "apps", ValueType::Object));
    rules.push_back(type(root, "hooks", ValueType::Object));
    rules.push_back(type(root, "parts", ValueType::Object));

    rules.push_back(type(root, "build-packages", ValueType::GrammarArray));
    rules.push_back(unique(root, "build-packages"));

    rules.push_back(depends(root, "license-agreement", {"license"}));
    rules.push_back(depends(root, "license-version", {"license"}));
    rules.push_back(any_of(root, "metadata-alternative",
                           {{"summary", "description", "version"}, {"adopt-info"}},
                           MSG_METADATA));
    rules.push_back(check(root, "", "base-type-exclusivity", base_type_exclusive, MSG_BASE_TYPE));
    rules.push_back(check(root, "", "passthrough-duplicate", passthrough_unambiguous,
                          MSG_PASSTHROUGH));

    rules.push_back(entry_type("environment", ValueType::StringOrNumber));
    rules.push_back(entry_type("layout", ValueType::Object));

    rules.push_back(type("architectures.*", "build-on", ValueType::StringOrStringArray));
    rules.push_back(type("architectures.*", "run-on", ValueType::StringOrStringArray));
    rules.push_back(required("architectures.*", "build-on"));
    rules.push_back(closed("architectures.*"));

    // ------------------------------------------------------------------------
    // Plugs and slots
    // ------------------------------------------------------------------------
    rules.push_back(entry_type("plugs", ValueType::PlugValue));
    rules.push_back(required("plugs.*", "interface", "plug-interface", MSG_PLUG_INTERFACE));
    rules.push_back(check("plugs.*", "", "content-plug-target", content_plug_has_target,
                          MSG_CONTENT_TARGET));

    rules.push_back(entry_type("slots", ValueType::PlugValue));
    rules.push_back(required("slots.*", "interface", "slot-interface", MSG_SLOT_INTERFACE));
    rules.push_back(check("slots.*", "", "content-slot-paths", content_slot_has_paths,
                          MSG_CONTENT_PATHS));
    rules.push_back(check("slots.*", "", "dbus-slot", dbus_slot_has_target, MSG_DBUS_SLOT));

    // ------------------------------------------------------------------------
    // Apps
    // ------------------------------------------------------------------------
    rules.push_back(key_pattern("apps", APP_NAME_PATTERN, MSG_APP_NAME));
    rules.push_back(entry_type("apps", ValueType::Object));

    const std::string app = "apps.*";
    rules.push_back(required(app, "command"));
    rules.push_back(closed(app));

    for (const char* field : {"command", "stop-command", "post-stop-command", "reload-command"}) {
        rules.push_back(type(app, field, ValueType::String));
        rules.push_back(min_length(app, field, 1));
        rules.push_back(pattern(app, field, COMMAND_PATTERN, MSG_COMMAND));
    }

    rules.push_back(type(app, "daemon", ValueType::String));
    rules.push_back(one_of(app, "daemon", {"simple", "oneshot", "forking", "notify", "dbus"}));

    rules.push_back(type(app, "bus-name", ValueType::String));
    rules.push_back(pattern(app, "bus-name", BUS_NAME_PATTERN, MSG_BUS_NAME));

    rules.push_back(type(app, "stop-mode", ValueType::String));
    rules.push_back(one_of(app, "stop-mode",
                           {"sigterm", "sigterm-all", "sighup", "sighup-all", "sigusr1",
                            "sigusr1-all", "sigusr2", "sigusr2-all"}));

    rules.push_back(type(app, "refresh-mode", ValueType::String));
    rules.push_back(one_of(app, "refresh-mode", {"endure", "restart"}));

    for (const char* field : {"start-timeout", "stop-timeout", "watchdog-timeout", "restart-delay"}) {
        rules.push_back(type(app, field, ValueType::String));
        rules.push_back(pattern(app, field, TIMEOUT_PATTERN, MSG_TIMEOUT));
    }

    rules.push_back(type(app, "restart-condition", ValueType::String));
    rules.push_back(one_of(app, "restart-condition",
                           {"on-success", "on-failure", "on-abnormal", "on-abort", "on-watchdog",
                            "always", "never"}));

    add_string_list(rules, app, "before");
    add_string_list(rules, app, "after");
    rules.push_back(type(app, "timer", ValueType::String));

    rules.push_back(type(app, "install-mode", ValueType::String));
    rules.push_back(one_of(app, "install-mode", {"enable", "disable"}));

    rules.push_back(type(app, "autostart", ValueType::String));
    rules.push_back(pattern(app, "autostart", AUTOSTART_PATTERN, MSG_AUTOSTART));

    rules.push_back(type(app, "common-id", ValueType::String));
    rules.push_back(type(app, "desktop", ValueType::String));
    rules.push_back(type(app, "completer", ValueType::String));

    rules.push_back(type(app, "adapter", ValueType::String));
    rules.push_back(one_of(app, "adapter", {"none", "full", "legacy"}));

    rules.push_back(type(app, "command-chain", ValueType::Array));
    rules.push_back(item_type(app, "command-chain", ValueType::String));
    rules.push_back(item_pattern(app, "command-chain", COMMAND_CHAIN_PATTERN, MSG_COMMAND_CHAIN));

    rules.push_back(type(app, "sockets", ValueType::Object));
    add_string_list(rules, app, "plugs");
    add_string_list(rules, app, "slots");
    add_string_list(rules, app, "extensions");
    rules.push_back(type(app, "environment", ValueType::Object));
    rules.push_back(type(app, "passthrough", ValueType::Object));

    for (const char* field : {"bus-name", "stop-mode", "refresh-mode", "stop-command",
                              "post-stop-command", "reload-command", "start-timeout",
                              "stop-timeout", "watchdog-timeout", "restart-delay",
                              "restart-condition", "before", "after", "timer", "install-mode"}) {
        rules.push_back(depends(app, field, {"daemon"}));
    }
    rules.push_back(check(app, "", "passthrough-duplicate", passthrough_unambiguous,
                          MSG_PASSTHROUGH));

    rules.push_back(entry_type("apps.*.environment", ValueType::StringOrNumber));

    rules.push_back(key_pattern("apps.*.sockets", SOCKET_NAME_PATTERN, MSG_SOCKET_NAME));
    rules.push_back(entry_type("apps.*.sockets", ValueType::Object));

    const std::string socket = "apps.*.sockets.*";
    rules.push_back(required(socket, "listen-stream"));
    rules.push_back(closed(socket));
    rules.push_back(type(socket, "listen-stream", ValueType::Any));
    rules.push_back(check(socket, "listen-stream", "listen-stream", listen_stream_is_valid,
                          MSG_LISTEN_STREAM));
    rules.push_back(type(socket, "socket-mode", ValueType::Integer));

    // ------------------------------------------------------------------------
    // Hooks
    // ------------------------------------------------------------------------
    rules.push_back(key_pattern("hooks", HOOK_NAME_PATTERN, MSG_HOOK_NAME));
    rules.push_back(entry_type("hooks", ValueType::ObjectOrNull));

    const std::string hook = "hooks.*";
    rules.push_back(closed(hook));
    add_string_list(rules, hook, "plugs");
    rules.push_back(type(hook, "passthrough", ValueType::Object));
    rules.push_back(check(hook, "", "passthrough-duplicate", passthrough_unambiguous,
                          MSG_PASSTHROUGH));

    // ------------------------------------------------------------------------
    // Parts (open objects: unknown keys are plugin properties)
    // ------------------------------------------------------------------------
    rules.push_back(key_pattern("parts", PART_NAME_PATTERN, MSG_PART_NAME));
    rules.push_back(entry_type("parts", ValueType::Object));
    rules.push_back(min_properties("parts", 1));

    const std::string part = "parts.*";
    rules.push_back(required(part, "plugin"));
    rules.push_back(type(part, "plugin", ValueType::String));

    for (const auto& field : part_grammar_fields()) {
        rules.push_back(type(part, field.name, field.type));
        if (field.type == ValueType::GrammarArray) {
            rules.push_back(unique(part, field.name));
        }
    }
    rules.push_back(one_of(part, "source-type",
                           {"bzr", "git", "hg", "mercurial", "subversion", "svn", "tar", "zip",
                            "deb", "rpm", "7z", "local", "snap"}));

    rules.push_back(type(part, "source-depth", ValueType::Integer));
    rules.push_back(minimum(part, "source-depth", 0));
    rules.push_back(type(part, "disable-parallel", ValueType::Boolean));
    add_string_list(rules, part, "after");

    rules.push_back(type(part, "build-environment", ValueType::Array));
    rules.push_back(item_type(part, "build-environment", ValueType::Object));

    rules.push_back(type(part, "build-attributes", ValueType::Array));
    rules.push_back(item_enum(part, "build-attributes",
                              {"no-patchelf", "no-install", "debug", "keep-execstack"}));
    rules.push_back(unique(part, "build-attributes"));

    rules.push_back(type(part, "organize", ValueType::Object));
    rules.push_back(type(part, "filesets", ValueType::Object));
    add_string_list(rules, part, "stage");
    add_string_list(rules, part, "prime");
    rules.push_back(type(part, "parse-info", ValueType::Array));
    rules.push_back(item_type(part, "parse-info", ValueType::String));

    for (const char* field : {"override-pull", "override-build", "override-stage", "override-prime"}) {
        rules.push_back(type(part, field, ValueType::String));
    }

    rules.push_back(entry_type("parts.*.organize", ValueType::String));
    rules.push_back(entry_type("parts.*.filesets", ValueType::Array));

    return rules;
}

bool is_object_rule(const ConstraintRule& rule) {
    switch (rule.kind) {
        case RuleKind::Required:
        case RuleKind::KeyPattern:
        case RuleKind::Closed:
        case RuleKind::MinProperties:
        case RuleKind::Dependency:
        case RuleKind::RequiredAnyOf:
        case RuleKind::EntryType:
            return true;
        case RuleKind::Predicate:
            return rule.field.empty();
        default:
            return false;
    }
}

} // namespace

const char* value_type_to_string(ValueType t) {
    switch (t) {
        case ValueType::Any: return "'any'";
        case ValueType::String: return "'string'";
        case ValueType::Integer: return "'integer'";
        case ValueType::Number: return "'number'";
        case ValueType::Boolean: return "'boolean'";
        case ValueType::Array: return "'array'";
        case ValueType::Object: return "'object'";
        case ValueType::ObjectOrNull: return "'object' or 'null'";
        case ValueType::StringOrNumber: return "'string' or 'number'";
        case ValueType::StringOrObject: return "'string' or 'object'";
        case ValueType::StringOrStringArray: return "'string' or 'array'";
        case ValueType::PlugValue: return "'null', 'string' or 'object'";
        case ValueType::GrammarString: return "'string' or 'array'";
        case ValueType::GrammarArray: return "'array'";
        default: return "'any'";
    }
}

bool value_has_type(const json& value, ValueType t) {
    switch (t) {
        case ValueType::Any: return true;
        case ValueType::String: return value.is_string();
        case ValueType::Integer: return value.is_number_integer();
        case ValueType::Number: return value.is_number();
        case ValueType::Boolean: return value.is_boolean();
        case ValueType::Array: return value.is_array();
        case ValueType::Object: return value.is_object();
        case ValueType::ObjectOrNull: return value.is_object() || value.is_null();
        case ValueType::StringOrNumber: return value.is_string() || value.is_number();
        case ValueType::StringOrObject: return value.is_string() || value.is_object();
        case ValueType::StringOrStringArray:
            if (value.is_string()) return true;
            if (!value.is_array()) return false;
            return std::all_of(value.begin(), value.end(),
                               [](const json& item) { return item.is_string(); });
        case ValueType::PlugValue:
            return value.is_null() || value.is_string() || value.is_object();
        case ValueType::GrammarString: return value.is_string() || value.is_array();
        case ValueType::GrammarArray: return value.is_array();
    }
    return false;
}

RuleTable::RuleTable(std::vector<ConstraintRule> rules) : rules_(std::move(rules)) {
    for (const auto& rule : rules_) {
        auto& scope = index_[rule.scope];
        if (is_object_rule(rule)) {
            scope.object_rules.push_back(&rule);
            continue;
        }
        if (rule.kind == RuleKind::Type &&
            std::find(scope.declared_fields.begin(), scope.declared_fields.end(), rule.field) ==
                scope.declared_fields.end()) {
            scope.declared_fields.push_back(rule.field);
        }
        scope.field_rules[rule.field].push_back(&rule);
    }
}

const ScopeRules* RuleTable::scope(const std::string& scope) const {
    auto it = index_.find(scope);
    if (it == index_.end()) {
        return nullptr;
    }
    return &it->second;
}

const RuleTable& manifest_rules() {
    static const RuleTable table(build_manifest_rules());
    return table;
}

const std::vector<GrammarField>& part_grammar_fields() {
    static const std::vector<GrammarField> fields = {
        {"source", ValueType::GrammarString},
        {"source-checksum", ValueType::GrammarString},
        {"source-branch", ValueType::GrammarString},
        {"source-commit", ValueType::GrammarString},
        {"source-subdir", ValueType::GrammarString},
        {"source-tag", ValueType::GrammarString},
        {"source-type", ValueType::GrammarString},
        {"stage-snaps", ValueType::GrammarArray},
        {"stage-packages", ValueType::GrammarArray},
        {"build-snaps", ValueType::GrammarArray},
        {"build-packages", ValueType::GrammarArray},
    };
    return fields;
}

} // namespace snapspec
