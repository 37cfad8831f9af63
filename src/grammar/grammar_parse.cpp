#include "snapspec/grammar.hpp"
#include "snapspec/message.hpp"

namespace snapspec {

namespace {

constexpr const char* ELSE_FAIL = "else fail";

class GrammarParser {
public:
    explicit GrammarParser(GrammarShape shape) : shape_(shape) {}

    GrammarNode parse_value(const json& value, const std::string& path) {
        if (value.is_string()) {
            const auto& text = value.get_ref<const std::string&>();
            if (text == ELSE_FAIL) {
                return GrammarNode::else_fail();
            }
            if (shape_ == GrammarShape::String) {
                return GrammarNode::scalar(text);
            }
            error(path, repr(value) + " is not of type 'array'");
            return GrammarNode{};
        }

        if (value.is_array()) {
            return parse_sequence(value, path);
        }

        error(path, repr(value) + (shape_ == GrammarShape::String
                                       ? " is not of type 'string' or 'array'"
                                       : " is not of type 'array'"));
        return GrammarNode{};
    }

    std::vector<GrammarError> take_errors() { return std::move(errors_); }

private:
    GrammarShape shape_;
    std::vector<GrammarError> errors_;

    void error(const std::string& path, const std::string& message) {
        errors_.push_back({path, message});
    }

    GrammarNode parse_sequence(const json& items, const std::string& path) {
        GrammarNode seq;
        seq.kind = GrammarKind::Sequence;

        for (size_t i = 0; i < items.size(); ++i) {
            const auto& item = items[i];
            std::string item_path = path + "[" + std::to_string(i) + "]";

            if (item.is_string()) {
                const auto& text = item.get_ref<const std::string&>();
                if (text == ELSE_FAIL) {
                    if (!seq.items.empty() && seq.items.back().is_statement()) {
                        seq.items.back().fallbacks.push_back(GrammarNode::else_fail());
                    } else {
                        error(item_path, "'else fail' must follow an 'on', 'to' or 'try' statement");
                    }
                } else if (shape_ == GrammarShape::Array) {
                    seq.items.push_back(GrammarNode::scalar(text));
                } else {
                    error(item_path, repr(item) + " is not a valid grammar statement: "
                                     "a single string is expected, not a list of strings");
                }
            } else if (item.is_object()) {
                parse_object(item, item_path, seq);
            } else {
                error(item_path, repr(item) + " is not of type 'string' or 'object'");
            }
        }

        return seq;
    }

    // Statements of one object are appended to seq. Consecutive "on" keys
    // (and consecutive "to" keys) share one clause; "else" attaches to the
    // closest preceding statement.
    void parse_object(const json& object, const std::string& path, GrammarNode& seq) {
        if (object.empty()) {
            error(path, "empty grammar statement");
            return;
        }

        std::optional<size_t> current;

        for (const auto& [key, value] : object.items()) {
            std::string key_path = path + "." + key;

            auto statement = parse_statement_key(key);
            if (!statement) {
                error(key_path, repr(key) + " is not a valid grammar statement");
                continue;
            }

            switch (statement->kind) {
                case StatementKind::Else:
                case StatementKind::ElseFail: {
                    GrammarNode* target = nullptr;
                    if (current) {
                        target = &seq.items[*current];
                    } else if (!seq.items.empty() && seq.items.back().is_statement()) {
                        target = &seq.items.back();
                    }
                    if (!target) {
                        error(key_path, "'" + key + "' must follow an 'on', 'to' or 'try' statement");
                        break;
                    }

                    if (statement->kind == StatementKind::ElseFail) {
                        if (!value.is_null()) {
                            error(key_path, "'else fail' does not take a body");
                            break;
                        }
                        target->fallbacks.push_back(GrammarNode::else_fail());
                        break;
                    }

                    GrammarNode fallback;
                    fallback.kind = GrammarKind::ElseClause;
                    fallback.items.push_back(parse_value(value, key_path));
                    // parse_value may not touch seq, target stays valid
                    target->fallbacks.push_back(std::move(fallback));
                    break;
                }

                case StatementKind::Try: {
                    GrammarNode clause;
                    clause.kind = GrammarKind::TryClause;
                    clause.items.push_back(parse_value(value, key_path));
                    seq.items.push_back(std::move(clause));
                    current = seq.items.size() - 1;
                    break;
                }

                case StatementKind::On:
                case StatementKind::To: {
                    GrammarKind kind = statement->kind == StatementKind::On
                                           ? GrammarKind::OnClause
                                           : GrammarKind::ToClause;

                    GrammarBranch branch;
                    branch.key = key;
                    branch.statement = *statement;
                    branch.body = parse_value(value, key_path);

                    if (current && seq.items[*current].kind == kind &&
                        seq.items[*current].fallbacks.empty()) {
                        seq.items[*current].branches.push_back(std::move(branch));
                    } else {
                        GrammarNode clause;
                        clause.kind = kind;
                        clause.branches.push_back(std::move(branch));
                        seq.items.push_back(std::move(clause));
                        current = seq.items.size() - 1;
                    }
                    break;
                }
            }
        }
    }
};

void collect_into(const GrammarNode& node, std::vector<std::string>& out) {
    if (node.kind == GrammarKind::Scalar) {
        out.push_back(node.value);
    }
    for (const auto& item : node.items) {
        collect_into(item, out);
    }
    for (const auto& branch : node.branches) {
        collect_into(branch.body, out);
    }
    for (const auto& fallback : node.fallbacks) {
        collect_into(fallback, out);
    }
}

} // namespace

std::string GrammarNode::describe() const {
    switch (kind) {
        case GrammarKind::Scalar:
            return value;
        case GrammarKind::OnClause:
        case GrammarKind::ToClause: {
            std::string out;
            for (const auto& branch : branches) {
                if (!out.empty()) out += ", ";
                out += branch.key;
            }
            return out;
        }
        case GrammarKind::TryClause:
            return "try";
        case GrammarKind::ElseClause:
            return "else";
        case GrammarKind::ElseFail:
            return ELSE_FAIL;
        default:
            return "";
    }
}

GrammarParseResult parse_grammar(const json& value, GrammarShape shape, const std::string& path) {
    GrammarParseResult result;
    GrammarParser parser(shape);

    result.node = parser.parse_value(value, path);
    result.errors = parser.take_errors();

    // A bare "else fail" is not a field value
    if (result.errors.empty() && result.node.kind == GrammarKind::ElseFail) {
        result.errors.push_back({path, "'else fail' must follow an 'on', 'to' or 'try' statement"});
    }

    result.ok = result.errors.empty();
    return result;
}

std::vector<std::string> collect_scalars(const GrammarNode& node) {
    std::vector<std::string> out;
    collect_into(node, out);
    return out;
}

} // namespace snapspec
