//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Built-in conditions.  Most of them test a predicate on the element and emit
// exactly one event: satisfied or violated, rendered as
//   "<element description> <text> in (<File>:<line>)"
// e.g. "Constructor <a.W.<init>()> does not have modifier PROTECTED in (W.java:0)".
//
// The call-graph conditions live in CallRestriction.hpp.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Class.hpp"
#include "core/Member.hpp"
#include "core/Modifier.hpp"
#include "core/Type.hpp"
#include "lang/Condition.hpp"
#include "lang/Predicate.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace archcheck::lang
{

namespace detail
{

/// @brief One event per element, derived from a predicate.
template <class T> class PredicateCondition final : public Condition<T>
{
  public:
    /// @param failText Rendered when @p predicate rejects the element.
    /// @param passText Rendered when it accepts the element.
    PredicateCondition(std::string description,
                       PredicatePtr<T> predicate,
                       std::string failText,
                       std::string passText)
        : Condition<T>(std::move(description)), predicate_(std::move(predicate)),
          failText_(std::move(failText)), passText_(std::move(passText))
    {
    }

    void check(const T &item, const core::CodeModel &, ConditionEvents &events) const override
    {
        const core::Element &element = item;
        if (predicate_->test(item))
            events.add(ConditionEvent::satisfied(element, elementMessage(element, passText_)));
        else
            events.add(ConditionEvent::violated(element, elementMessage(element, failText_)));
    }

  private:
    PredicatePtr<T> predicate_;
    std::string failText_;
    std::string passText_;
};

template <class T>
ConditionPtr<T> fromPredicate(std::string description,
                              PredicatePtr<T> predicate,
                              std::string failText,
                              std::string passText)
{
    requireNonNull(predicate, "condition");
    return std::make_shared<PredicateCondition<T>>(
        std::move(description), std::move(predicate), std::move(failText), std::move(passText));
}

} // namespace detail

namespace conditions
{

/// @brief "have <p>"; violated with "does not have <p>".
template <class T> ConditionPtr<T> have(PredicatePtr<T> predicate)
{
    detail::requireNonNull(predicate, "have");
    const std::string &d = predicate->description();
    return detail::fromPredicate<T>("have " + d, predicate, "does not have " + d, "has " + d);
}

// Elements -------------------------------------------------------------------

ConditionPtr<core::Element> beAnnotatedWith(const core::Type &annotation);
ConditionPtr<core::Element> beAnnotatedWith(const std::string &annotationName);
ConditionPtr<core::Element> beAnnotatedWith(PredicatePtr<core::Type> annotation);

ConditionPtr<core::Element> notBeAnnotatedWith(const core::Type &annotation);
ConditionPtr<core::Element> notBeAnnotatedWith(const std::string &annotationName);
ConditionPtr<core::Element> notBeAnnotatedWith(PredicatePtr<core::Type> annotation);

ConditionPtr<core::Element> haveModifier(core::Modifier modifier);
ConditionPtr<core::Element> notHaveModifier(core::Modifier modifier);

ConditionPtr<core::Element> bePublic();
ConditionPtr<core::Element> beProtected();
ConditionPtr<core::Element> bePrivate();
ConditionPtr<core::Element> bePackagePrivate();

ConditionPtr<core::Element> haveName(const std::string &name);
ConditionPtr<core::Element> haveNameMatching(const std::string &regex);

// Classes --------------------------------------------------------------------

ConditionPtr<core::Class> resideInAPackage(const std::string &packageIdentifier);
ConditionPtr<core::Class> haveSimpleNameEndingWith(const std::string &suffix);

// Members --------------------------------------------------------------------

ConditionPtr<core::Member> beDeclaredIn(const core::Type &owner);
ConditionPtr<core::Member> beDeclaredIn(const std::string &ownerName);
ConditionPtr<core::Member> beDeclaredIn(PredicatePtr<core::Class> owner);

ConditionPtr<core::Field> haveRawType(const core::Type &type);
ConditionPtr<core::Field> haveRawType(const std::string &typeName);
ConditionPtr<core::Field> haveRawType(PredicatePtr<core::Type> type);

// Code units -----------------------------------------------------------------

ConditionPtr<core::CodeUnit> haveRawParameterTypes(const std::vector<core::Type> &types);
ConditionPtr<core::CodeUnit> haveRawParameterTypes(const std::vector<std::string> &typeNames);
ConditionPtr<core::CodeUnit> haveRawParameterTypes(PredicatePtr<std::vector<core::Type>> types);

ConditionPtr<core::CodeUnit> notHaveRawParameterTypes(const std::vector<core::Type> &types);
ConditionPtr<core::CodeUnit> notHaveRawParameterTypes(const std::vector<std::string> &typeNames);
ConditionPtr<core::CodeUnit> notHaveRawParameterTypes(PredicatePtr<std::vector<core::Type>> types);

ConditionPtr<core::CodeUnit> haveRawReturnType(const core::Type &type);
ConditionPtr<core::CodeUnit> haveRawReturnType(const std::string &typeName);
ConditionPtr<core::CodeUnit> haveRawReturnType(PredicatePtr<core::Type> type);

ConditionPtr<core::CodeUnit> notHaveRawReturnType(const core::Type &type);
ConditionPtr<core::CodeUnit> notHaveRawReturnType(const std::string &typeName);
ConditionPtr<core::CodeUnit> notHaveRawReturnType(PredicatePtr<core::Type> type);

ConditionPtr<core::CodeUnit> declareThrowableOfType(const core::Type &type);
ConditionPtr<core::CodeUnit> declareThrowableOfType(const std::string &typeName);
ConditionPtr<core::CodeUnit> declareThrowableOfType(PredicatePtr<core::Type> type);

ConditionPtr<core::CodeUnit> notDeclareThrowableOfType(const core::Type &type);
ConditionPtr<core::CodeUnit> notDeclareThrowableOfType(const std::string &typeName);
ConditionPtr<core::CodeUnit> notDeclareThrowableOfType(PredicatePtr<core::Type> type);

} // namespace conditions

} // namespace archcheck::lang
