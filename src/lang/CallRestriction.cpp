//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the call-graph restriction conditions.  Edges are read from the
// model's incoming/outgoing indices, so each check costs the fan-in (or
// fan-out) of the element rather than a scan over every edge.
//
//===----------------------------------------------------------------------===//

#include "lang/CallRestriction.hpp"

#include "core/CodeModel.hpp"

#include <memory>
#include <string>
#include <utility>

namespace archcheck::lang
{

std::string_view callerKindLabel(CallerKind kind)
{
    switch (kind)
    {
        case CallerKind::Classes:
            return "classes";
        case CallerKind::Methods:
            return "methods";
        case CallerKind::Constructors:
            return "constructors";
        case CallerKind::CodeUnits:
            return "code units";
    }
    return "";
}

bool admitsCaller(CallerKind kind, const core::CodeUnit &origin)
{
    switch (kind)
    {
        case CallerKind::Classes:
        case CallerKind::CodeUnits:
            return true;
        case CallerKind::Methods:
            return origin.isMethod();
        case CallerKind::Constructors:
            return origin.isConstructor();
    }
    return false;
}

namespace
{

/// Restriction on the callers of a code unit.  Exactly one of the two
/// predicates is set: the class predicate for CallerKind::Classes, the code
/// unit predicate otherwise.
class CallerRestriction final : public Condition<core::CodeUnit>
{
  public:
    CallerRestriction(CallerKind kind,
                      std::string predicateDescription,
                      PredicatePtr<core::Class> classPredicate,
                      PredicatePtr<core::CodeUnit> unitPredicate)
        : Condition<core::CodeUnit>("only be called by " + std::string(callerKindLabel(kind)) + " that " +
                                    predicateDescription),
          kind_(kind), classPredicate_(std::move(classPredicate)), unitPredicate_(std::move(unitPredicate))
    {
    }

    void check(const core::CodeUnit &item, const core::CodeModel &model, ConditionEvents &events) const override
    {
        for (const core::Dependency *call : model.callsTo(item))
        {
            if (!accepts(*call->origin))
                events.add(ConditionEvent({call->origin, call->target}, true, call->description()));
        }
    }

  private:
    bool accepts(const core::CodeUnit &origin) const
    {
        if (!admitsCaller(kind_, origin))
            return false;
        if (kind_ == CallerKind::Classes)
            return classPredicate_->test(origin.owner());
        return unitPredicate_->test(origin);
    }

    CallerKind kind_;
    PredicatePtr<core::Class> classPredicate_;
    PredicatePtr<core::CodeUnit> unitPredicate_;
};

/// Retype a predicate over one code unit kind as a predicate over code units.
/// admitsCaller filters the other kind out before it is called.
template <class K> PredicatePtr<core::CodeUnit> widen(PredicatePtr<K> predicate)
{
    return predicates::describe<core::CodeUnit>(predicate->description(),
                                                [predicate](const core::CodeUnit &unit)
                                                { return predicate->test(static_cast<const K &>(unit)); });
}

class DependencyRestriction final : public Condition<core::Class>
{
  public:
    explicit DependencyRestriction(PredicatePtr<core::Class> predicate)
        : Condition<core::Class>("only depend on classes that " + predicate->description()),
          predicate_(std::move(predicate))
    {
    }

    void check(const core::Class &item, const core::CodeModel &model, ConditionEvents &events) const override
    {
        for (const core::CodeUnit *unit : item.codeUnits())
        {
            for (const core::Dependency *dep : model.dependenciesFrom(*unit))
            {
                if (!predicate_->test(dep->target->owner()))
                    events.add(ConditionEvent({&item, dep->target}, true, dep->description()));
            }
        }
    }

  private:
    PredicatePtr<core::Class> predicate_;
};

} // namespace

namespace conditions
{

ConditionPtr<core::CodeUnit> onlyBeCalledByClassesThat(PredicatePtr<core::Class> predicate)
{
    detail::requireNonNull(predicate, "onlyBeCalledByClassesThat");
    std::string description = predicate->description();
    return std::make_shared<CallerRestriction>(
        CallerKind::Classes, std::move(description), std::move(predicate), nullptr);
}

ConditionPtr<core::CodeUnit> onlyBeCalledByMethodsThat(PredicatePtr<core::Method> predicate)
{
    detail::requireNonNull(predicate, "onlyBeCalledByMethodsThat");
    return std::make_shared<CallerRestriction>(
        CallerKind::Methods, predicate->description(), nullptr, widen(predicate));
}

ConditionPtr<core::CodeUnit> onlyBeCalledByConstructorsThat(PredicatePtr<core::Constructor> predicate)
{
    detail::requireNonNull(predicate, "onlyBeCalledByConstructorsThat");
    return std::make_shared<CallerRestriction>(
        CallerKind::Constructors, predicate->description(), nullptr, widen(predicate));
}

ConditionPtr<core::CodeUnit> onlyBeCalledByCodeUnitsThat(PredicatePtr<core::CodeUnit> predicate)
{
    detail::requireNonNull(predicate, "onlyBeCalledByCodeUnitsThat");
    std::string description = predicate->description();
    return std::make_shared<CallerRestriction>(
        CallerKind::CodeUnits, std::move(description), nullptr, std::move(predicate));
}

ConditionPtr<core::Class> onlyDependOnClassesThat(PredicatePtr<core::Class> predicate)
{
    detail::requireNonNull(predicate, "onlyDependOnClassesThat");
    return std::make_shared<DependencyRestriction>(std::move(predicate));
}

} // namespace conditions

} // namespace archcheck::lang
