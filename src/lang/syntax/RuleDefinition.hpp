//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the fluent rule syntax:
//
//   codeUnits()
//       .that(predicates::declaredIn("com.acme.Widget"))
//       .should(conditions::beAnnotatedWith("com.acme.A"))
//       .orShould(conditions::beProtected())
//       .check(model);
//
// Every step is parameterised by the selected element type T.  that(),
// should(), andShould() and orShould() accept predicates and conditions typed
// for T or any supertype of T and always return a handle for the same T, so
// a condition on Member can be attached to methods without losing access to
// Method-only conditions later in the chain.  A predicate or condition typed
// for an unrelated element type is rejected at compile time.
//
// The syntax objects are cheap immutable values.  Rule (see Rule.hpp) erases T
// once the chain is complete.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/CodeModel.hpp"
#include "lang/CallRestriction.hpp"
#include "lang/Condition.hpp"
#include "lang/Elements.hpp"
#include "lang/Predicate.hpp"
#include "lang/Rule.hpp"

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace archcheck::lang::syntax
{

template <class T> class ElementsShould;
template <class T> class OnlyBeCalledSpecification;

namespace detail
{

template <class T, class P> PredicatePtr<T> retypePredicate(std::shared_ptr<P> predicate, const char *what)
{
    using U = typename P::subject_type;
    static_assert(std::is_base_of_v<U, T>,
                  "predicate element type must be the selected type or one of its supertypes");
    lang::detail::requireNonNull(predicate, what);
    return predicates::forSubtype<T, U>(PredicatePtr<U>(std::move(predicate)));
}

template <class T, class P> ConditionPtr<T> retypeCondition(std::shared_ptr<P> condition, const char *what)
{
    using U = typename P::subject_type;
    static_assert(std::is_base_of_v<U, T>,
                  "condition element type must be the selected type or one of its supertypes");
    lang::detail::requireNonNull(condition, what);
    return conditions::forSubtype<T, U>(ConditionPtr<U>(std::move(condition)));
}

/// @brief Rule implementation over the elements of kind @p T.
template <class T> class SelectionRule final : public Rule::Impl
{
  public:
    SelectionRule(PredicatePtr<T> filter, ConditionPtr<T> root, std::string description)
        : filter_(std::move(filter)), root_(std::move(root)), description_(std::move(description))
    {
    }

    std::string description() const override
    {
        return description_;
    }

    std::string_view elementKind() const override
    {
        return ElementKind<T>::name;
    }

    size_t evaluateInto(const core::CodeModel &model, ConditionEvents &events) const override
    {
        size_t checked = 0;
        for (const T *item : ElementKind<T>::collect(model))
        {
            if (filter_ && !filter_->test(*item))
                continue;
            root_->check(*item, model, events);
            ++checked;
        }
        return checked;
    }

  private:
    PredicatePtr<T> filter_;
    ConditionPtr<T> root_;
    std::string description_;
};

} // namespace detail

/// @brief Selected elements of type @p T, optionally narrowed by a filter.
template <class T> class GivenElements
{
  public:
    GivenElements() = default;

    /// @brief Narrow the selection; repeated calls combine with AND.
    template <class P> [[nodiscard]] GivenElements that(std::shared_ptr<P> predicate) const
    {
        return combine(detail::retypePredicate<T>(std::move(predicate), "that"), false);
    }

    template <class P> [[nodiscard]] GivenElements andThat(std::shared_ptr<P> predicate) const
    {
        return combine(detail::retypePredicate<T>(std::move(predicate), "andThat"), false);
    }

    template <class P> [[nodiscard]] GivenElements orThat(std::shared_ptr<P> predicate) const
    {
        return combine(detail::retypePredicate<T>(std::move(predicate), "orThat"), true);
    }

    /// @brief Attach the first condition of the tree.
    template <class P> [[nodiscard]] ElementsShould<T> should(std::shared_ptr<P> condition) const;

    /// @brief Start a call restriction: shouldOnlyBeCalled().byClassesThat(...).
    [[nodiscard]] OnlyBeCalledSpecification<T> shouldOnlyBeCalled() const;

    /// @brief "<kind>[ that <filter>]".
    [[nodiscard]] std::string description() const
    {
        std::string out(ElementKind<T>::name);
        if (filter_)
            out += " that " + filter_->description();
        return out;
    }

    /// @brief Selection filter; null when every element of the kind is selected.
    [[nodiscard]] const PredicatePtr<T> &filter() const
    {
        return filter_;
    }

  private:
    GivenElements combine(PredicatePtr<T> predicate, bool disjunction) const
    {
        GivenElements copy = *this;
        if (!filter_)
            copy.filter_ = std::move(predicate);
        else if (disjunction)
            copy.filter_ = predicates::or_(filter_, std::move(predicate));
        else
            copy.filter_ = predicates::and_(filter_, std::move(predicate));
        return copy;
    }

    PredicatePtr<T> filter_;
};

/// @brief Selection with a condition tree attached; convertible to Rule.
template <class T> class ElementsShould
{
  public:
    ElementsShould(GivenElements<T> given, ConditionPtr<T> root)
        : given_(std::move(given)), root_(std::move(root))
    {
    }

    template <class P> [[nodiscard]] ElementsShould andShould(std::shared_ptr<P> condition) const
    {
        return join(JoinKind::And, detail::retypeCondition<T>(std::move(condition), "andShould"));
    }

    template <class P> [[nodiscard]] ElementsShould orShould(std::shared_ptr<P> condition) const
    {
        return join(JoinKind::Or, detail::retypeCondition<T>(std::move(condition), "orShould"));
    }

    /// @brief "<selection> should <condition tree>".
    [[nodiscard]] std::string description() const
    {
        return given_.description() + " should " + root_->description();
    }

    [[nodiscard]] const ConditionPtr<T> &condition() const
    {
        return root_;
    }

    [[nodiscard]] Rule rule() const
    {
        return Rule(std::make_shared<detail::SelectionRule<T>>(given_.filter(), root_, description()));
    }

    operator Rule() const
    {
        return rule();
    }

    [[nodiscard]] Rule because(std::string reason) const
    {
        return rule().because(std::move(reason));
    }

    [[nodiscard]] Rule as(std::string description) const
    {
        return rule().as(std::move(description));
    }

    [[nodiscard]] Rule allowEmptyShould(bool allow) const
    {
        return rule().allowEmptyShould(allow);
    }

    [[nodiscard]] EvaluationResult evaluate(const core::CodeModel &model) const
    {
        return rule().evaluate(model);
    }

    void check(const core::CodeModel &model) const
    {
        rule().check(model);
    }

    [[nodiscard]] support::Expected<void> verify(const core::CodeModel &model) const
    {
        return rule().verify(model);
    }

  private:
    ElementsShould join(JoinKind kind, ConditionPtr<T> next) const
    {
        std::string text = root_->description() + (kind == JoinKind::And ? " and should " : " or should ") +
                           next->description();
        return ElementsShould(given_,
                              std::make_shared<JoinedCondition<T>>(kind, root_, std::move(next), std::move(text)));
    }

    GivenElements<T> given_;
    ConditionPtr<T> root_;
};

/// @brief Caller side of "should only be called by <callers> that P".
template <class T> class OnlyBeCalledSpecification
{
    static_assert(std::is_base_of_v<core::CodeUnit, T>, "only code units can be the target of calls");

  public:
    explicit OnlyBeCalledSpecification(GivenElements<T> given) : given_(std::move(given)) {}

    template <class P> [[nodiscard]] ElementsShould<T> byClassesThat(std::shared_ptr<P> predicate) const
    {
        return given_.should(conditions::onlyBeCalledByClassesThat(std::move(predicate)));
    }

    template <class P> [[nodiscard]] ElementsShould<T> byMethodsThat(std::shared_ptr<P> predicate) const
    {
        return given_.should(conditions::onlyBeCalledByMethodsThat(std::move(predicate)));
    }

    template <class P> [[nodiscard]] ElementsShould<T> byConstructorsThat(std::shared_ptr<P> predicate) const
    {
        return given_.should(conditions::onlyBeCalledByConstructorsThat(std::move(predicate)));
    }

    template <class P> [[nodiscard]] ElementsShould<T> byCodeUnitsThat(std::shared_ptr<P> predicate) const
    {
        return given_.should(conditions::onlyBeCalledByCodeUnitsThat(std::move(predicate)));
    }

  private:
    GivenElements<T> given_;
};

template <class T>
template <class P>
ElementsShould<T> GivenElements<T>::should(std::shared_ptr<P> condition) const
{
    return ElementsShould<T>(*this, detail::retypeCondition<T>(std::move(condition), "should"));
}

template <class T> OnlyBeCalledSpecification<T> GivenElements<T>::shouldOnlyBeCalled() const
{
    return OnlyBeCalledSpecification<T>(*this);
}

// Entry points ---------------------------------------------------------------

inline GivenElements<core::Class> classes()
{
    return {};
}

inline GivenElements<core::Field> fields()
{
    return {};
}

inline GivenElements<core::Method> methods()
{
    return {};
}

inline GivenElements<core::Constructor> constructors()
{
    return {};
}

inline GivenElements<core::CodeUnit> codeUnits()
{
    return {};
}

inline GivenElements<core::Member> members()
{
    return {};
}

} // namespace archcheck::lang::syntax
