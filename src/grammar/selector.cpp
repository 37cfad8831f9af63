#include "snapspec/selector.hpp"

#include <algorithm>
#include <cctype>

namespace snapspec {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool has_space(const std::string& s) {
    return std::any_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool is_space_at(const std::string& s, size_t pos) {
    return pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos])) != 0;
}

// Position after "<keyword><whitespace>" starting at pos, or nullopt when
// the keyword is absent or nothing follows it.
std::optional<size_t> skip_keyword(const std::string& s, size_t pos, const std::string& keyword) {
    if (s.compare(pos, keyword.size(), keyword) != 0) return std::nullopt;
    size_t i = pos + keyword.size();
    if (!is_space_at(s, i)) return std::nullopt;
    while (is_space_at(s, i)) ++i;
    if (i == s.size()) return std::nullopt;
    return i;
}

// Split "<on selectors> to <to selectors>" at the first " to " separator.
bool split_on_to(const std::string& text, std::string& on, std::string& to) {
    size_t i = 1;
    while (i < text.size()) {
        if (!is_space_at(text, i)) {
            ++i;
            continue;
        }
        size_t j = i;
        while (is_space_at(text, j)) ++j;
        if (auto rest = skip_keyword(text, j, "to")) {
            on = text.substr(0, i);
            to = text.substr(*rest);
            return true;
        }
        i = j;
    }
    return false;
}

} // namespace

bool SelectorSet::contains(const std::string& selector) const {
    return std::find(selectors.begin(), selectors.end(), selector) != selectors.end();
}

std::string SelectorSet::to_string() const {
    std::string out;
    for (const auto& s : selectors) {
        if (!out.empty()) out += ",";
        out += s;
    }
    return out;
}

std::optional<SelectorSet> parse_selector_list(const std::string& text) {
    SelectorSet set;
    size_t start = 0;
    while (true) {
        size_t comma = text.find(',', start);
        std::string token = trim(text.substr(start, comma == std::string::npos
                                                        ? std::string::npos
                                                        : comma - start));
        if (token.empty() || has_space(token)) {
            return std::nullopt;
        }
        if (!set.contains(token)) {
            set.selectors.push_back(token);
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return set;
}

std::optional<StatementKey> parse_statement_key(const std::string& key) {
    StatementKey result;

    if (key == "try") {
        result.kind = StatementKind::Try;
        return result;
    }
    if (key == "else") {
        result.kind = StatementKind::Else;
        return result;
    }
    if (key == "else fail") {
        result.kind = StatementKind::ElseFail;
        return result;
    }

    if (auto start = skip_keyword(key, 0, "on")) {
        std::string on_text = key.substr(*start);
        std::string to_text;
        bool compound = split_on_to(key.substr(*start), on_text, to_text);

        auto on = parse_selector_list(on_text);
        if (!on) return std::nullopt;
        result.kind = StatementKind::On;
        result.on = std::move(*on);
        if (compound) {
            auto to = parse_selector_list(to_text);
            if (!to) return std::nullopt;
            result.to = std::move(*to);
        }
        return result;
    }

    if (auto start = skip_keyword(key, 0, "to")) {
        auto to = parse_selector_list(key.substr(*start));
        if (!to) return std::nullopt;
        result.kind = StatementKind::To;
        result.to = std::move(*to);
        return result;
    }

    return std::nullopt;
}

bool statement_matches(const StatementKey& key, const SelectorContext& ctx) {
    switch (key.kind) {
        case StatementKind::On:
            if (!key.on.contains(ctx.build_arch)) return false;
            return key.to.empty() || key.to.contains(ctx.target_arch);
        case StatementKind::To:
            return key.to.contains(ctx.target_arch);
        default:
            return false;
    }
}

} // namespace snapspec
