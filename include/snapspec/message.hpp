#pragma once

#include "snapspec/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace snapspec {

// ============================================================================
// Message Templates
// ============================================================================

// Rendered messages longer than this are truncated.
constexpr size_t MAX_MESSAGE_SIZE = 4 * 1024;

using MessageFields = std::unordered_map<std::string, std::string>;

// Substitute {name} placeholders from fields.
// - Single pass, substituted text is not rescanned
// - Unknown placeholders render as empty
// - A '{' without a closing brace, or with a nested '{', is copied literally
SNAPSPEC_API std::string render_message(const std::string& message_template,
                                        const MessageFields& fields);

// Python-repr style rendering of a document value: 'text', 42, true,
// ['a', 'b'], {'k': 'v'}. Used for the {instance} placeholder.
SNAPSPEC_API std::string repr(const json& value);

SNAPSPEC_API std::string repr(const std::string& value);

// ['a', 'b']
SNAPSPEC_API std::string repr_list(const std::vector<std::string>& values);

} // namespace snapspec
