//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the built-in conditions on top of the built-in predicates.  The
// negated forms reuse the positive predicate through not_ and swap the texts.
//
//===----------------------------------------------------------------------===//

#include "lang/Conditions.hpp"

#include "lang/Predicates.hpp"

#include <regex>

namespace archcheck::lang::conditions
{

namespace
{

/// Texts for one positive/negative condition pair over the same object text.
struct Phrase
{
    const char *positive;    ///< "have raw return type"
    const char *negative;    ///< "not have raw return type"
    const char *holds;       ///< "has raw return type"
    const char *doesNotHold; ///< "does not have raw return type"
};

template <class T>
ConditionPtr<T> affirm(const Phrase &phrase, const std::string &object, PredicatePtr<T> predicate)
{
    return detail::fromPredicate<T>(std::string(phrase.positive) + " " + object,
                                    std::move(predicate),
                                    std::string(phrase.doesNotHold) + " " + object,
                                    std::string(phrase.holds) + " " + object);
}

template <class T>
ConditionPtr<T> deny(const Phrase &phrase, const std::string &object, PredicatePtr<T> predicate)
{
    return detail::fromPredicate<T>(std::string(phrase.negative) + " " + object,
                                    predicates::not_(std::move(predicate)),
                                    std::string(phrase.holds) + " " + object,
                                    std::string(phrase.doesNotHold) + " " + object);
}

const Phrase kAnnotated{"be annotated with", "not be annotated with", "is annotated with", "is not annotated with"};
const Phrase kModifier{"have modifier", "not have modifier", "has modifier", "does not have modifier"};
const Phrase kName{"have name", "not have name", "has name", "does not have name"};
const Phrase kNameMatching{
    "have name matching", "not have name matching", "has name matching", "does not have name matching"};
const Phrase kPackage{
    "reside in a package", "not reside in a package", "resides in a package", "does not reside in a package"};
const Phrase kSimpleNameEnding{"have simple name ending with",
                               "not have simple name ending with",
                               "has simple name ending with",
                               "does not have simple name ending with"};
const Phrase kDeclaredIn{"be declared in", "not be declared in", "is declared in", "is not declared in"};
const Phrase kRawType{"have raw type", "not have raw type", "has raw type", "does not have raw type"};
const Phrase kParameters{"have raw parameter types",
                         "not have raw parameter types",
                         "has raw parameter types",
                         "does not have raw parameter types"};
const Phrase kReturnType{
    "have raw return type", "not have raw return type", "has raw return type", "does not have raw return type"};
const Phrase kThrowable{"declare throwable of type",
                        "not declare throwable of type",
                        "declares throwable of type",
                        "does not declare throwable of type"};

std::string quoted(const std::string &text)
{
    return "'" + text + "'";
}

} // namespace

ConditionPtr<core::Element> beAnnotatedWith(const core::Type &annotation)
{
    return beAnnotatedWith(annotation.fullName());
}

ConditionPtr<core::Element> beAnnotatedWith(const std::string &annotationName)
{
    return beAnnotatedWith(predicates::annotationType(annotationName));
}

ConditionPtr<core::Element> beAnnotatedWith(PredicatePtr<core::Type> annotation)
{
    detail::requireNonNull(annotation, "beAnnotatedWith");
    return affirm(kAnnotated, annotation->description(), predicates::areAnnotatedWith(annotation));
}

ConditionPtr<core::Element> notBeAnnotatedWith(const core::Type &annotation)
{
    return notBeAnnotatedWith(annotation.fullName());
}

ConditionPtr<core::Element> notBeAnnotatedWith(const std::string &annotationName)
{
    return notBeAnnotatedWith(predicates::annotationType(annotationName));
}

ConditionPtr<core::Element> notBeAnnotatedWith(PredicatePtr<core::Type> annotation)
{
    detail::requireNonNull(annotation, "notBeAnnotatedWith");
    return deny(kAnnotated, annotation->description(), predicates::areAnnotatedWith(annotation));
}

ConditionPtr<core::Element> haveModifier(core::Modifier modifier)
{
    return affirm(kModifier, std::string(core::toString(modifier)), predicates::haveModifier(modifier));
}

ConditionPtr<core::Element> notHaveModifier(core::Modifier modifier)
{
    return deny(kModifier, std::string(core::toString(modifier)), predicates::haveModifier(modifier));
}

ConditionPtr<core::Element> bePublic()
{
    return as(haveModifier(core::Modifier::Public), "be public");
}

ConditionPtr<core::Element> beProtected()
{
    return as(haveModifier(core::Modifier::Protected), "be protected");
}

ConditionPtr<core::Element> bePrivate()
{
    return as(haveModifier(core::Modifier::Private), "be private");
}

ConditionPtr<core::Element> bePackagePrivate()
{
    return detail::fromPredicate<core::Element>(
        "be package private", predicates::arePackagePrivate(), "is not package private", "is package private");
}

ConditionPtr<core::Element> haveName(const std::string &name)
{
    return affirm(kName, quoted(name), predicates::haveName(name));
}

ConditionPtr<core::Element> haveNameMatching(const std::string &regex)
{
    auto pattern = std::make_shared<const std::regex>(regex);
    return affirm(kNameMatching,
                  quoted(regex),
                  predicates::describe<core::Element>("name matching " + quoted(regex),
                                                      [pattern](const core::Element &element)
                                                      { return std::regex_match(element.name(), *pattern); }));
}

ConditionPtr<core::Class> resideInAPackage(const std::string &packageIdentifier)
{
    return affirm(kPackage, quoted(packageIdentifier), predicates::resideInAPackage(packageIdentifier));
}

ConditionPtr<core::Class> haveSimpleNameEndingWith(const std::string &suffix)
{
    return affirm(kSimpleNameEnding, quoted(suffix), predicates::haveSimpleNameEndingWith(suffix));
}

ConditionPtr<core::Member> beDeclaredIn(const core::Type &owner)
{
    return beDeclaredIn(owner.fullName());
}

ConditionPtr<core::Member> beDeclaredIn(const std::string &ownerName)
{
    return beDeclaredIn(predicates::as(predicates::haveFullyQualifiedName(ownerName), ownerName));
}

ConditionPtr<core::Member> beDeclaredIn(PredicatePtr<core::Class> owner)
{
    detail::requireNonNull(owner, "beDeclaredIn");
    return affirm(kDeclaredIn, owner->description(), predicates::declaredIn(owner));
}

ConditionPtr<core::Field> haveRawType(const core::Type &type)
{
    return haveRawType(type.fullName());
}

ConditionPtr<core::Field> haveRawType(const std::string &typeName)
{
    return haveRawType(predicates::typeNamed(typeName));
}

ConditionPtr<core::Field> haveRawType(PredicatePtr<core::Type> type)
{
    detail::requireNonNull(type, "haveRawType");
    return affirm(kRawType, type->description(), predicates::haveRawType(type));
}

ConditionPtr<core::CodeUnit> haveRawParameterTypes(const std::vector<core::Type> &types)
{
    return haveRawParameterTypes(predicates::typeListEqualTo(types));
}

ConditionPtr<core::CodeUnit> haveRawParameterTypes(const std::vector<std::string> &typeNames)
{
    return haveRawParameterTypes(core::typesNamed(typeNames));
}

ConditionPtr<core::CodeUnit> haveRawParameterTypes(PredicatePtr<std::vector<core::Type>> types)
{
    detail::requireNonNull(types, "haveRawParameterTypes");
    return affirm(kParameters, types->description(), predicates::haveRawParameterTypes(types));
}

ConditionPtr<core::CodeUnit> notHaveRawParameterTypes(const std::vector<core::Type> &types)
{
    return notHaveRawParameterTypes(predicates::typeListEqualTo(types));
}

ConditionPtr<core::CodeUnit> notHaveRawParameterTypes(const std::vector<std::string> &typeNames)
{
    return notHaveRawParameterTypes(core::typesNamed(typeNames));
}

ConditionPtr<core::CodeUnit> notHaveRawParameterTypes(PredicatePtr<std::vector<core::Type>> types)
{
    detail::requireNonNull(types, "notHaveRawParameterTypes");
    return deny(kParameters, types->description(), predicates::haveRawParameterTypes(types));
}

ConditionPtr<core::CodeUnit> haveRawReturnType(const core::Type &type)
{
    return haveRawReturnType(type.fullName());
}

ConditionPtr<core::CodeUnit> haveRawReturnType(const std::string &typeName)
{
    return haveRawReturnType(predicates::typeNamed(typeName));
}

ConditionPtr<core::CodeUnit> haveRawReturnType(PredicatePtr<core::Type> type)
{
    detail::requireNonNull(type, "haveRawReturnType");
    return affirm(kReturnType, type->description(), predicates::haveRawReturnType(type));
}

ConditionPtr<core::CodeUnit> notHaveRawReturnType(const core::Type &type)
{
    return notHaveRawReturnType(type.fullName());
}

ConditionPtr<core::CodeUnit> notHaveRawReturnType(const std::string &typeName)
{
    return notHaveRawReturnType(predicates::typeNamed(typeName));
}

ConditionPtr<core::CodeUnit> notHaveRawReturnType(PredicatePtr<core::Type> type)
{
    detail::requireNonNull(type, "notHaveRawReturnType");
    return deny(kReturnType, type->description(), predicates::haveRawReturnType(type));
}

ConditionPtr<core::CodeUnit> declareThrowableOfType(const core::Type &type)
{
    return declareThrowableOfType(type.fullName());
}

ConditionPtr<core::CodeUnit> declareThrowableOfType(const std::string &typeName)
{
    return declareThrowableOfType(predicates::typeNamed(typeName));
}

ConditionPtr<core::CodeUnit> declareThrowableOfType(PredicatePtr<core::Type> type)
{
    detail::requireNonNull(type, "declareThrowableOfType");
    return affirm(kThrowable, type->description(), predicates::declareThrowableOfType(type));
}

ConditionPtr<core::CodeUnit> notDeclareThrowableOfType(const core::Type &type)
{
    return notDeclareThrowableOfType(type.fullName());
}

ConditionPtr<core::CodeUnit> notDeclareThrowableOfType(const std::string &typeName)
{
    return notDeclareThrowableOfType(predicates::typeNamed(typeName));
}

ConditionPtr<core::CodeUnit> notDeclareThrowableOfType(PredicatePtr<core::Type> type)
{
    detail::requireNonNull(type, "notDeclareThrowableOfType");
    return deny(kThrowable, type->description(), predicates::declareThrowableOfType(type));
}

} // namespace archcheck::lang::conditions
