#include "snapspec/message.hpp"

namespace snapspec {

std::string render_message(const std::string& message_template, const MessageFields& fields) {
    std::string output;
    output.reserve(message_template.size());

    size_t i = 0;
    while (i < message_template.size()) {
        if (message_template[i] == '{') {
            size_t close = message_template.find('}', i + 1);
            if (close == std::string::npos) {
                // No closing brace, copy literally
                output += message_template[i];
                ++i;
                continue;
            }

            std::string name = message_template.substr(i + 1, close - i - 1);
            if (name.find('{') != std::string::npos) {
                output += message_template[i];
                ++i;
                continue;
            }

            auto it = fields.find(name);
            if (it != fields.end()) {
                output += it->second;
            }
            i = close + 1;
        } else {
            output += message_template[i];
            ++i;
        }

        if (output.size() > MAX_MESSAGE_SIZE) {
            output.resize(MAX_MESSAGE_SIZE);
            output += "...";
            break;
        }
    }

    return output;
}

std::string repr(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += "'";
    return out;
}

std::string repr_list(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += repr(values[i]);
    }
    out += "]";
    return out;
}

std::string repr(const json& value) {
    switch (value.type()) {
        case json::value_t::string:
            return repr(value.get<std::string>());
        case json::value_t::boolean:
            return value.get<bool>() ? "True" : "False";
        case json::value_t::null:
            return "None";
        case json::value_t::array: {
            std::string out = "[";
            bool first = true;
            for (const auto& item : value) {
                if (!first) out += ", ";
                out += repr(item);
                first = false;
            }
            out += "]";
            return out;
        }
        case json::value_t::object: {
            std::string out = "{";
            bool first = true;
            for (const auto& [key, item] : value.items()) {
                if (!first) out += ", ";
                out += repr(key) + ": " + repr(item);
                first = false;
            }
            out += "}";
            return out;
        }
        default:
            return value.dump();
    }
}

} // namespace snapspec
