//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares DescribedPredicate, the open boolean test used to narrow
// selections and to parameterise conditions, together with its combinators.
//
// Predicates are immutable and shared through PredicatePtr.  Composites keep
// their operands alive and re-derive their description from them:
//   and_(a, b)  -> "<a> and <b>"
//   or_(a, b)   -> "<a> or <b>"
//   not_(a)     -> "not <a>"
//
// forSubtype adapts a predicate over a supertype (e.g. Member) so it can be
// applied wherever a predicate over a subtype (e.g. Method) is expected.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace archcheck::lang
{

/// @brief Pure boolean test over @p T with a human-readable description.
template <class T> class DescribedPredicate
{
  public:
    /// @brief Element type this predicate is typed for.
    using subject_type = T;

    explicit DescribedPredicate(std::string description) : description_(std::move(description)) {}

    virtual ~DescribedPredicate() = default;

    /// @brief Evaluate the predicate; must not have side effects.
    virtual bool test(const T &item) const = 0;

    [[nodiscard]] const std::string &description() const
    {
        return description_;
    }

  private:
    std::string description_;
};

template <class T> using PredicatePtr = std::shared_ptr<const DescribedPredicate<T>>;

namespace detail
{

/// @brief Throw std::invalid_argument when @p ptr is null.
template <class Ptr> const Ptr &requireNonNull(const Ptr &ptr, const char *what)
{
    if (!ptr)
        throw std::invalid_argument(std::string(what) + ": null argument");
    return ptr;
}

template <class T, class F> class FunctionPredicate final : public DescribedPredicate<T>
{
  public:
    FunctionPredicate(std::string description, F fn)
        : DescribedPredicate<T>(std::move(description)), fn_(std::move(fn))
    {
    }

    bool test(const T &item) const override
    {
        return static_cast<bool>(fn_(item));
    }

  private:
    F fn_;
};

template <class T> class AndPredicate final : public DescribedPredicate<T>
{
  public:
    AndPredicate(PredicatePtr<T> lhs, PredicatePtr<T> rhs)
        : DescribedPredicate<T>(lhs->description() + " and " + rhs->description()),
          lhs_(std::move(lhs)), rhs_(std::move(rhs))
    {
    }

    bool test(const T &item) const override
    {
        return lhs_->test(item) && rhs_->test(item);
    }

  private:
    PredicatePtr<T> lhs_;
    PredicatePtr<T> rhs_;
};

template <class T> class OrPredicate final : public DescribedPredicate<T>
{
  public:
    OrPredicate(PredicatePtr<T> lhs, PredicatePtr<T> rhs)
        : DescribedPredicate<T>(lhs->description() + " or " + rhs->description()),
          lhs_(std::move(lhs)), rhs_(std::move(rhs))
    {
    }

    bool test(const T &item) const override
    {
        return lhs_->test(item) || rhs_->test(item);
    }

  private:
    PredicatePtr<T> lhs_;
    PredicatePtr<T> rhs_;
};

template <class T> class NotPredicate final : public DescribedPredicate<T>
{
  public:
    explicit NotPredicate(PredicatePtr<T> inner)
        : DescribedPredicate<T>("not " + inner->description()), inner_(std::move(inner))
    {
    }

    bool test(const T &item) const override
    {
        return !inner_->test(item);
    }

  private:
    PredicatePtr<T> inner_;
};

/// @brief Same test as the wrapped predicate under a different description.
template <class T> class RenamedPredicate final : public DescribedPredicate<T>
{
  public:
    RenamedPredicate(PredicatePtr<T> inner, std::string description)
        : DescribedPredicate<T>(std::move(description)), inner_(std::move(inner))
    {
    }

    bool test(const T &item) const override
    {
        return inner_->test(item);
    }

  private:
    PredicatePtr<T> inner_;
};

template <class T, class U> class SubtypePredicate final : public DescribedPredicate<T>
{
  public:
    explicit SubtypePredicate(PredicatePtr<U> inner)
        : DescribedPredicate<T>(inner->description()), inner_(std::move(inner))
    {
    }

    bool test(const T &item) const override
    {
        return inner_->test(static_cast<const U &>(item));
    }

  private:
    PredicatePtr<U> inner_;
};

} // namespace detail

namespace predicates
{

/// @brief Build a predicate from any callable taking `const T &`.
template <class T, class F> PredicatePtr<T> describe(std::string description, F fn)
{
    return std::make_shared<detail::FunctionPredicate<T, F>>(std::move(description), std::move(fn));
}

template <class T> PredicatePtr<T> and_(PredicatePtr<T> lhs, PredicatePtr<T> rhs)
{
    detail::requireNonNull(lhs, "and_");
    detail::requireNonNull(rhs, "and_");
    return std::make_shared<detail::AndPredicate<T>>(std::move(lhs), std::move(rhs));
}

template <class T> PredicatePtr<T> or_(PredicatePtr<T> lhs, PredicatePtr<T> rhs)
{
    detail::requireNonNull(lhs, "or_");
    detail::requireNonNull(rhs, "or_");
    return std::make_shared<detail::OrPredicate<T>>(std::move(lhs), std::move(rhs));
}

template <class T> PredicatePtr<T> not_(PredicatePtr<T> inner)
{
    detail::requireNonNull(inner, "not_");
    return std::make_shared<detail::NotPredicate<T>>(std::move(inner));
}

/// @brief Replace the description of @p inner.
template <class T> PredicatePtr<T> as(PredicatePtr<T> inner, std::string description)
{
    detail::requireNonNull(inner, "as");
    return std::make_shared<detail::RenamedPredicate<T>>(std::move(inner), std::move(description));
}

/// @brief View a predicate over supertype @p U as one over subtype @p T.
template <class T, class U> PredicatePtr<T> forSubtype(PredicatePtr<U> inner)
{
    static_assert(std::is_base_of_v<U, T>,
                  "predicate element type must be the selected type or one of its supertypes");
    detail::requireNonNull(inner, "forSubtype");
    if constexpr (std::is_same_v<T, U>)
        return inner;
    else
        return std::make_shared<detail::SubtypePredicate<T, U>>(std::move(inner));
}

} // namespace predicates

} // namespace archcheck::lang
