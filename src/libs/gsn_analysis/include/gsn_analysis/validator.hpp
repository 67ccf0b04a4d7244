#pragma once

#include <gsn_model/types.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace gsn_analysis {

enum class Severity { Error, Warning };

enum class DiagnosticCode {
    NoRootGoal,
    MultipleRootGoals,
    CyclicReference,
    OrphanNodes,
    UndevelopedGoals,
    NoEvidencePath,
    SingleChildStrategy
};

struct Diagnostic {
    Severity severity = Severity::Warning;
    DiagnosticCode code = DiagnosticCode::OrphanNodes;
    std::string message;
    std::vector<std::string> element_ids;
};

struct ValidationResult {
    bool is_valid = true;
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;
};

// Fixed vocabulary spelling, e.g. "NO_ROOT_GOAL".
std::string_view code_name(DiagnosticCode code);
std::string_view severity_name(Severity severity);

// Runs every structural check on the snapshot. Never throws; dangling relations are ignored.
ValidationResult validate(const std::vector<gsn_model::Element>& elements,
    const std::vector<gsn_model::Relation>& relations);

ValidationResult validate(const gsn_model::Diagram& diagram);

} // namespace gsn_analysis
