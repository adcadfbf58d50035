//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares Rule, the immutable and reusable result of the fluent
// rule syntax, and ArchitectureViolation, the exception check() throws.
//
// A Rule erases the element type of the selection it was built from: it holds
// a shared, immutable Impl that knows how to select and check elements of one
// kind.  Copies share the Impl, and because(), as() and allowEmptyShould()
// return new rules that differ only in presentation and empty handling.  Any
// number of threads may evaluate the same rule against an unchanging model.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lang/EvaluationResult.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace archcheck::core
{
class CodeModel;
} // namespace archcheck::core

namespace archcheck::lang
{

/// @brief Thrown by Rule::check when a rule is violated or checked nothing.
class ArchitectureViolation : public std::runtime_error
{
  public:
    ArchitectureViolation(const std::string &message, FailureReport report);

    /// @brief Violations behind the exception; empty for an empty selection.
    [[nodiscard]] const FailureReport &report() const
    {
        return report_;
    }

  private:
    FailureReport report_;
};

class Rule
{
  public:
    /// @brief Selection plus condition tree for one element kind.
    class Impl
    {
      public:
        virtual ~Impl() = default;

        /// @brief "<kind>[ that <filter>] should <condition tree>".
        [[nodiscard]] virtual std::string description() const = 0;

        /// @brief Plural element kind name, e.g. "code units".
        [[nodiscard]] virtual std::string_view elementKind() const = 0;

        /// @brief Check every selected element of @p model into @p events.
        /// @return Number of elements checked.
        virtual size_t evaluateInto(const core::CodeModel &model, ConditionEvents &events) const = 0;
    };

    explicit Rule(std::shared_ptr<const Impl> impl);

    /// @brief Description including any `as` override and `because` reason.
    [[nodiscard]] std::string description() const;

    /// @brief Copy of the rule whose description ends with ", because <reason>".
    [[nodiscard]] Rule because(std::string reason) const;

    /// @brief Copy of the rule with a replaced description.
    [[nodiscard]] Rule as(std::string description) const;

    /// @brief Copy of the rule that ignores (true) or rejects (false) an empty
    ///        selection regardless of Options::failOnEmptyShould.
    [[nodiscard]] Rule allowEmptyShould(bool allow) const;

    [[nodiscard]] EvaluationResult evaluate(const core::CodeModel &model) const;

    /// @brief Evaluate, recording trace notes in @p diags when options.trace is set.
    /// @param diags Optional sink; may be null.
    [[nodiscard]] EvaluationResult evaluate(const core::CodeModel &model,
                                            const support::Options &options,
                                            support::DiagnosticEngine *diags) const;

    /// @brief Evaluate and throw ArchitectureViolation on failure.
    void check(const core::CodeModel &model) const;
    void check(const core::CodeModel &model, const support::Options &options) const;

    /// @brief Non-throwing check; the error carries the check() message.
    [[nodiscard]] support::Expected<void> verify(const core::CodeModel &model,
                                                 const support::Options &options = {}) const;

  private:
    /// @brief Failure text for @p result, or nothing when it passes.
    std::optional<std::string> failureOf(const EvaluationResult &result, const support::Options &options) const;

    std::shared_ptr<const Impl> impl_;
    std::optional<std::string> overrideDescription_;
    std::optional<std::string> reason_;
    std::optional<bool> allowEmpty_;
};

} // namespace archcheck::lang
