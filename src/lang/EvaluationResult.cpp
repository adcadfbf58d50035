// File: src/lang/EvaluationResult.cpp
// Purpose: Implements failure report rendering.
// Key invariants: failureMessage() contains every failure report line verbatim.
// Ownership/Lifetime: See EvaluationResult.hpp.
// Links: docs/codemap.md

#include "lang/EvaluationResult.hpp"

#include <sstream>
#include <utility>

namespace archcheck::lang
{

FailureReport::FailureReport(std::vector<std::string> details) : details_(std::move(details)) {}

EvaluationResult::EvaluationResult(std::string ruleDescription, ConditionEvents events, size_t checkedElements)
    : ruleDescription_(std::move(ruleDescription)), events_(std::move(events)),
      checkedElements_(checkedElements)
{
}

bool EvaluationResult::hasViolation() const
{
    return events_.containViolation();
}

FailureReport EvaluationResult::failureReport() const
{
    return FailureReport(events_.violationMessages());
}

std::string EvaluationResult::failureMessage() const
{
    const FailureReport report = failureReport();
    std::ostringstream os;
    os << "Rule '" << ruleDescription_ << "' was violated (" << report.details().size() << " times):";
    for (const auto &line : report.details())
        os << '\n' << line;
    return os.str();
}

} // namespace archcheck::lang
