//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements rule evaluation and the check/verify entry points.  Trace notes
// go to the caller's DiagnosticEngine; evaluation itself never prints.
//
//===----------------------------------------------------------------------===//

#include "lang/Rule.hpp"

#include "core/CodeModel.hpp"

#include <string>
#include <utility>

namespace archcheck::lang
{

ArchitectureViolation::ArchitectureViolation(const std::string &message, FailureReport report)
    : std::runtime_error(message), report_(std::move(report))
{
}

Rule::Rule(std::shared_ptr<const Impl> impl) : impl_(std::move(impl))
{
    if (!impl_)
        throw std::invalid_argument("Rule: null implementation");
}

std::string Rule::description() const
{
    std::string out = overrideDescription_ ? *overrideDescription_ : impl_->description();
    if (reason_)
        out += ", because " + *reason_;
    return out;
}

Rule Rule::because(std::string reason) const
{
    Rule copy = *this;
    copy.reason_ = std::move(reason);
    return copy;
}

Rule Rule::as(std::string description) const
{
    Rule copy = *this;
    copy.overrideDescription_ = std::move(description);
    return copy;
}

Rule Rule::allowEmptyShould(bool allow) const
{
    Rule copy = *this;
    copy.allowEmpty_ = allow;
    return copy;
}

EvaluationResult Rule::evaluate(const core::CodeModel &model) const
{
    return evaluate(model, support::Options{}, nullptr);
}

EvaluationResult Rule::evaluate(const core::CodeModel &model,
                                const support::Options &options,
                                support::DiagnosticEngine *diags) const
{
    ConditionEvents events;
    const size_t checked = impl_->evaluateInto(model, events);
    EvaluationResult result(description(), std::move(events), checked);

    if (options.trace && diags)
    {
        const std::string prefix = "rule '" + result.ruleDescription() + "': ";
        diags->report({support::Severity::Note,
                       prefix + "checked " + std::to_string(checked) + " " + std::string(impl_->elementKind()),
                       {}});
        diags->report({support::Severity::Note,
                       prefix + std::to_string(result.failureReport().details().size()) + " violation(s)",
                       {}});
        for (const core::Dependency &dep : model.dependencies())
        {
            if (!dep.target->owner().isAnalyzed())
                diags->report({support::Severity::Note,
                               prefix + "edge into external class: " + dep.description(),
                               dep.location});
        }
    }
    return result;
}

std::optional<std::string> Rule::failureOf(const EvaluationResult &result, const support::Options &options) const
{
    if (result.hasViolation())
        return result.failureMessage();

    const bool allowEmpty = allowEmpty_ ? *allowEmpty_ : !options.failOnEmptyShould;
    if (result.checkedElements() == 0 && !allowEmpty)
    {
        const std::string kind(impl_->elementKind());
        return "Rule '" + result.ruleDescription() + "' failed to check any " + kind +
               ". This means either that no " + kind + " have been passed to the rule at all, or that no " +
               kind + " passed to the rule matched the `that()` clause.";
    }
    return std::nullopt;
}

void Rule::check(const core::CodeModel &model) const
{
    check(model, support::Options{});
}

void Rule::check(const core::CodeModel &model, const support::Options &options) const
{
    const EvaluationResult result = evaluate(model, options, nullptr);
    if (auto failure = failureOf(result, options))
        throw ArchitectureViolation(*failure, result.failureReport());
}

support::Expected<void> Rule::verify(const core::CodeModel &model, const support::Options &options) const
{
    const EvaluationResult result = evaluate(model, options, nullptr);
    if (auto failure = failureOf(result, options))
        return support::makeError({}, std::move(*failure));
    return {};
}

} // namespace archcheck::lang
