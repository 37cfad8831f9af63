#pragma once

#include "snapspec/constraint.hpp"
#include "snapspec/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace snapspec {

// ============================================================================
// Schema Validation
// ============================================================================

struct ValidationResult {
    bool ok = false;
    std::optional<CriticalError> critical_error;
    std::string critical_error_context;
    std::vector<Violation> violations;  // sorted by (path, rule)
};

// Validate a decoded document against the manifest schema.
//
// A document that is not a mapping is a DOCUMENT_SHAPE critical error and no
// rule runs. Otherwise every rule is evaluated and all violations are
// collected; ok is true when there are none.
SNAPSPEC_API ValidationResult validate_document(const json& document);

// Same, against an arbitrary rule table.
SNAPSPEC_API ValidationResult validate_document(const json& document, const RuleTable& rules);

} // namespace snapspec
