//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Conditions over the dependency edges of the model.
//
// "only be called by <callers> that P" inspects every CALL edge targeting the
// checked code unit.  The caller kind comes first: a "methods" restriction
// rejects calls from constructors and vice versa, whatever P says.  Only when
// the caller kind fits is P tested, against the caller's owning class for the
// "classes" variant and against the calling code unit otherwise.  Each
// rejected edge yields one violation rendered as the edge itself:
//   "Method <a.B.run()> calls constructor <a.W.<init>()> in (B.java:7)"
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Class.hpp"
#include "core/Member.hpp"
#include "lang/Condition.hpp"
#include "lang/Predicate.hpp"

#include <memory>
#include <string_view>
#include <utility>

namespace archcheck::lang
{

/// @brief Which callers a call restriction admits before P is consulted.
enum class CallerKind
{
    Classes,
    Methods,
    Constructors,
    CodeUnits
};

/// @brief Plural label used in descriptions, e.g. "code units".
std::string_view callerKindLabel(CallerKind kind);

/// @brief True when a call originating in @p origin has a kind @p kind admits.
bool admitsCaller(CallerKind kind, const core::CodeUnit &origin);

namespace conditions
{

ConditionPtr<core::CodeUnit> onlyBeCalledByClassesThat(PredicatePtr<core::Class> predicate);
ConditionPtr<core::CodeUnit> onlyBeCalledByMethodsThat(PredicatePtr<core::Method> predicate);
ConditionPtr<core::CodeUnit> onlyBeCalledByConstructorsThat(PredicatePtr<core::Constructor> predicate);
ConditionPtr<core::CodeUnit> onlyBeCalledByCodeUnitsThat(PredicatePtr<core::CodeUnit> predicate);

/// @brief Every call, field read and field write made by the code units of
///        the class must target a member whose owner satisfies @p predicate.
ConditionPtr<core::Class> onlyDependOnClassesThat(PredicatePtr<core::Class> predicate);

// Accept predicates typed for a supertype of the caller, or user subclasses.

template <class P> ConditionPtr<core::CodeUnit> onlyBeCalledByClassesThat(std::shared_ptr<P> predicate)
{
    using U = typename P::subject_type;
    return onlyBeCalledByClassesThat(predicates::forSubtype<core::Class, U>(PredicatePtr<U>(std::move(predicate))));
}

template <class P> ConditionPtr<core::CodeUnit> onlyBeCalledByMethodsThat(std::shared_ptr<P> predicate)
{
    using U = typename P::subject_type;
    return onlyBeCalledByMethodsThat(predicates::forSubtype<core::Method, U>(PredicatePtr<U>(std::move(predicate))));
}

template <class P> ConditionPtr<core::CodeUnit> onlyBeCalledByConstructorsThat(std::shared_ptr<P> predicate)
{
    using U = typename P::subject_type;
    return onlyBeCalledByConstructorsThat(
        predicates::forSubtype<core::Constructor, U>(PredicatePtr<U>(std::move(predicate))));
}

template <class P> ConditionPtr<core::CodeUnit> onlyBeCalledByCodeUnitsThat(std::shared_ptr<P> predicate)
{
    using U = typename P::subject_type;
    return onlyBeCalledByCodeUnitsThat(
        predicates::forSubtype<core::CodeUnit, U>(PredicatePtr<U>(std::move(predicate))));
}

template <class P> ConditionPtr<core::Class> onlyDependOnClassesThat(std::shared_ptr<P> predicate)
{
    using U = typename P::subject_type;
    return onlyDependOnClassesThat(predicates::forSubtype<core::Class, U>(PredicatePtr<U>(std::move(predicate))));
}

} // namespace conditions

} // namespace archcheck::lang
