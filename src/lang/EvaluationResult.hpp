// File: src/lang/EvaluationResult.hpp
// Purpose: Declares the outcome of evaluating one rule against one model.
// Key invariants: Events appear in selection order; the failure report lists
//                 the violated events only, in the same order.
// Ownership/Lifetime: Events may reference model elements; keep the model alive
//                     while inspecting correlated elements.
// Links: docs/codemap.md
#pragma once

#include "lang/ConditionEvent.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace archcheck::lang
{

/// @brief Rendered violation messages of one evaluation.
class FailureReport
{
  public:
    FailureReport() = default;
    explicit FailureReport(std::vector<std::string> details);

    [[nodiscard]] const std::vector<std::string> &details() const
    {
        return details_;
    }

    [[nodiscard]] bool isEmpty() const
    {
        return details_.empty();
    }

  private:
    std::vector<std::string> details_;
};

class EvaluationResult
{
  public:
    EvaluationResult(std::string ruleDescription, ConditionEvents events, size_t checkedElements);

    [[nodiscard]] const std::string &ruleDescription() const
    {
        return ruleDescription_;
    }

    /// @brief Every event emitted, satisfied ones included.
    [[nodiscard]] const ConditionEvents &events() const
    {
        return events_;
    }

    /// @brief Number of selected elements the condition tree was applied to.
    [[nodiscard]] size_t checkedElements() const
    {
        return checkedElements_;
    }

    [[nodiscard]] bool hasViolation() const;

    [[nodiscard]] FailureReport failureReport() const;

    /// @brief "Rule '<description>' was violated (<n> times):\n<line>..."
    [[nodiscard]] std::string failureMessage() const;

  private:
    std::string ruleDescription_;
    ConditionEvents events_;
    size_t checkedElements_;
};

} // namespace archcheck::lang
