//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares Condition, the open per-element check that rules are made
// of, and JoinedCondition, the AND/OR node of the combinator tree.
//
// A JoinedCondition evaluates both children for every element, whatever the
// first child reported.  Its verdict follows the AND/OR truth table over the
// children, where a child is violated when it emitted at least one violated
// event.  When the verdict is violated it emits one merged event holding the
// violation messages of its violated children joined by " and ", left child
// first.  When the verdict is satisfied it emits nothing, so informational
// events of the children never reach the report.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Element.hpp"
#include "lang/ConditionEvent.hpp"
#include "lang/Predicate.hpp"

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace archcheck::core
{
class CodeModel;
} // namespace archcheck::core

namespace archcheck::lang
{

/// @brief Check applied to each selected element of type @p T.
template <class T> class Condition
{
  public:
    /// @brief Element type this condition is typed for.
    using subject_type = T;

    explicit Condition(std::string description) : description_(std::move(description)) {}

    virtual ~Condition() = default;

    /// @brief Append zero or more events describing @p item to @p events.
    /// @param model Snapshot @p item belongs to; read-only.
    virtual void check(const T &item, const core::CodeModel &model, ConditionEvents &events) const = 0;

    [[nodiscard]] const std::string &description() const
    {
        return description_;
    }

  private:
    std::string description_;
};

template <class T> using ConditionPtr = std::shared_ptr<const Condition<T>>;

enum class JoinKind
{
    And,
    Or
};

/// @brief Non-short-circuiting AND/OR node of the combinator tree.
template <class T> class JoinedCondition final : public Condition<T>
{
  public:
    JoinedCondition(JoinKind kind, ConditionPtr<T> lhs, ConditionPtr<T> rhs, std::string description)
        : Condition<T>(std::move(description)), kind_(kind), lhs_(std::move(lhs)), rhs_(std::move(rhs))
    {
    }

    void check(const T &item, const core::CodeModel &model, ConditionEvents &events) const override
    {
        ConditionEvents left;
        ConditionEvents right;
        lhs_->check(item, model, left);
        rhs_->check(item, model, right);

        const bool leftViolated = left.containViolation();
        const bool rightViolated = right.containViolation();
        const bool violated =
            kind_ == JoinKind::And ? (leftViolated || rightViolated) : (leftViolated && rightViolated);
        if (!violated)
            return;

        std::string message;
        for (const ConditionEvents *side : {&left, &right})
        {
            for (const auto &text : side->violationMessages())
            {
                if (!message.empty())
                    message += " and ";
                message += text;
            }
        }
        events.add(ConditionEvent::violated(static_cast<const core::Element &>(item), std::move(message)));
    }

  private:
    JoinKind kind_;
    ConditionPtr<T> lhs_;
    ConditionPtr<T> rhs_;
};

namespace detail
{

template <class T, class U> class SubtypeCondition final : public Condition<T>
{
  public:
    explicit SubtypeCondition(ConditionPtr<U> inner)
        : Condition<T>(inner->description()), inner_(std::move(inner))
    {
    }

    void check(const T &item, const core::CodeModel &model, ConditionEvents &events) const override
    {
        inner_->check(static_cast<const U &>(item), model, events);
    }

  private:
    ConditionPtr<U> inner_;
};

template <class T> class RenamedCondition final : public Condition<T>
{
  public:
    RenamedCondition(ConditionPtr<T> inner, std::string description)
        : Condition<T>(std::move(description)), inner_(std::move(inner))
    {
    }

    void check(const T &item, const core::CodeModel &model, ConditionEvents &events) const override
    {
        inner_->check(item, model, events);
    }

  private:
    ConditionPtr<T> inner_;
};

} // namespace detail

namespace conditions
{

/// @brief View a condition over supertype @p U as one over subtype @p T.
template <class T, class U> ConditionPtr<T> forSubtype(ConditionPtr<U> inner)
{
    static_assert(std::is_base_of_v<U, T>,
                  "condition element type must be the selected type or one of its supertypes");
    detail::requireNonNull(inner, "forSubtype");
    if constexpr (std::is_same_v<T, U>)
        return inner;
    else
        return std::make_shared<detail::SubtypeCondition<T, U>>(std::move(inner));
}

/// @brief AND of two conditions, described "<a> and <b>".
template <class T> ConditionPtr<T> and_(ConditionPtr<T> lhs, ConditionPtr<T> rhs)
{
    detail::requireNonNull(lhs, "and_");
    detail::requireNonNull(rhs, "and_");
    std::string description = lhs->description() + " and " + rhs->description();
    return std::make_shared<JoinedCondition<T>>(JoinKind::And, std::move(lhs), std::move(rhs), std::move(description));
}

/// @brief OR of two conditions, described "<a> or <b>".
template <class T> ConditionPtr<T> or_(ConditionPtr<T> lhs, ConditionPtr<T> rhs)
{
    detail::requireNonNull(lhs, "or_");
    detail::requireNonNull(rhs, "or_");
    std::string description = lhs->description() + " or " + rhs->description();
    return std::make_shared<JoinedCondition<T>>(JoinKind::Or, std::move(lhs), std::move(rhs), std::move(description));
}

template <class T> ConditionPtr<T> as(ConditionPtr<T> inner, std::string description)
{
    detail::requireNonNull(inner, "as");
    return std::make_shared<detail::RenamedCondition<T>>(std::move(inner), std::move(description));
}

} // namespace conditions

} // namespace archcheck::lang
