//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the built-in predicates.  Each name-based or type-based overload
// forwards to the predicate-based overload so the forms cannot drift apart.
//
//===----------------------------------------------------------------------===//

#include "lang/Predicates.hpp"

#include <algorithm>
#include <regex>
#include <string_view>

namespace archcheck::lang::predicates
{

PredicatePtr<core::Type> equivalentTo(const core::Type &type)
{
    return describe<core::Type>("equivalent to " + type.fullName(),
                                [type](const core::Type &t) { return t == type; });
}

PredicatePtr<core::Type> typeNamed(const std::string &fullName)
{
    core::Type type(fullName);
    return describe<core::Type>(fullName, [type](const core::Type &t) { return t == type; });
}

PredicatePtr<core::Type> annotationType(const std::string &fullName)
{
    core::Type type(fullName);
    return describe<core::Type>("@" + type.simpleName(),
                                [type](const core::Type &t) { return t == type; });
}

PredicatePtr<std::vector<core::Type>> typeListEqualTo(std::vector<core::Type> types)
{
    std::string description = core::formatTypeList(types);
    return describe<std::vector<core::Type>>(
        std::move(description),
        [types = std::move(types)](const std::vector<core::Type> &actual) { return actual == types; });
}

PredicatePtr<core::Class> belongToAnyOf(const std::vector<core::Type> &classes)
{
    return describe<core::Class>("belong to any of " + core::formatTypeList(classes),
                                 [classes](const core::Class &cls)
                                 {
                                     const std::string &name = cls.fullName();
                                     for (const auto &outer : classes)
                                     {
                                         const std::string &prefix = outer.fullName();
                                         if (name == prefix)
                                             return true;
                                         if (name.size() > prefix.size() &&
                                             name.compare(0, prefix.size(), prefix) == 0 &&
                                             name[prefix.size()] == '$')
                                             return true;
                                     }
                                     return false;
                                 });
}

PredicatePtr<core::Class> belongToAnyOf(const std::vector<std::string> &classNames)
{
    return belongToAnyOf(core::typesNamed(classNames));
}

PredicatePtr<core::Class> haveFullyQualifiedName(const std::string &fullName)
{
    return describe<core::Class>("have fully qualified name '" + fullName + "'",
                                 [fullName](const core::Class &cls) { return cls.fullName() == fullName; });
}

PredicatePtr<core::Class> haveSimpleName(const std::string &simpleName)
{
    return describe<core::Class>("have simple name '" + simpleName + "'",
                                 [simpleName](const core::Class &cls)
                                 { return cls.simpleName() == simpleName; });
}

PredicatePtr<core::Class> haveSimpleNameEndingWith(const std::string &suffix)
{
    return describe<core::Class>("have simple name ending with '" + suffix + "'",
                                 [suffix](const core::Class &cls)
                                 {
                                     const std::string name = cls.simpleName();
                                     return name.size() >= suffix.size() &&
                                            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
                                 });
}

namespace
{

/// Translate a package identifier such as "..service.." into a regex.
std::string packagePattern(std::string identifier)
{
    if (identifier == "..")
        return ".*";

    std::string prefix;
    std::string suffix;
    if (identifier.size() >= 2 && identifier.compare(0, 2, "..") == 0)
    {
        prefix = "(?:.*\\.)?";
        identifier.erase(0, 2);
    }
    if (identifier.size() >= 2 && identifier.compare(identifier.size() - 2, 2, "..") == 0)
    {
        suffix = "(?:\\..*)?";
        identifier.erase(identifier.size() - 2);
    }

    std::string body;
    for (size_t i = 0; i < identifier.size(); ++i)
    {
        const char c = identifier[i];
        if (c == '.' && i + 1 < identifier.size() && identifier[i + 1] == '.')
        {
            body += "\\.(?:.*\\.)?";
            ++i;
        }
        else if (c == '.')
            body += "\\.";
        else if (c == '*')
            body += "\\w+";
        else if (std::string_view("\\^$|?+()[]{}").find(c) != std::string_view::npos)
        {
            body += '\\';
            body += c;
        }
        else
            body += c;
    }
    return prefix + body + suffix;
}

} // namespace

bool packageMatches(const std::string &packageIdentifier, const std::string &packageName)
{
    return std::regex_match(packageName, std::regex(packagePattern(packageIdentifier)));
}

PredicatePtr<core::Class> resideInAPackage(const std::string &packageIdentifier)
{
    auto pattern = std::make_shared<const std::regex>(packagePattern(packageIdentifier));
    return describe<core::Class>("reside in a package '" + packageIdentifier + "'",
                                 [pattern](const core::Class &cls)
                                 { return std::regex_match(cls.packageName(), *pattern); });
}

PredicatePtr<core::Element> areAnnotatedWith(const core::Type &annotation)
{
    return areAnnotatedWith(annotation.fullName());
}

PredicatePtr<core::Element> areAnnotatedWith(const std::string &annotationName)
{
    return areAnnotatedWith(annotationType(annotationName));
}

PredicatePtr<core::Element> areAnnotatedWith(PredicatePtr<core::Type> annotation)
{
    detail::requireNonNull(annotation, "areAnnotatedWith");
    std::string description = "are annotated with " + annotation->description();
    return describe<core::Element>(std::move(description),
                                   [annotation](const core::Element &element)
                                   {
                                       const auto &annotations = element.annotations();
                                       return std::any_of(annotations.begin(),
                                                          annotations.end(),
                                                          [&](const core::Type &t)
                                                          { return annotation->test(t); });
                                   });
}

PredicatePtr<core::Element> haveModifier(core::Modifier modifier)
{
    return describe<core::Element>("have modifier " + std::string(core::toString(modifier)),
                                   [modifier](const core::Element &element)
                                   { return element.hasModifier(modifier); });
}

PredicatePtr<core::Element> arePublic()
{
    return as(haveModifier(core::Modifier::Public), "are public");
}

PredicatePtr<core::Element> areProtected()
{
    return as(haveModifier(core::Modifier::Protected), "are protected");
}

PredicatePtr<core::Element> arePrivate()
{
    return as(haveModifier(core::Modifier::Private), "are private");
}

PredicatePtr<core::Element> arePackagePrivate()
{
    return describe<core::Element>("are package private",
                                   [](const core::Element &element) { return element.isPackagePrivate(); });
}

PredicatePtr<core::Element> haveName(const std::string &name)
{
    return describe<core::Element>("have name '" + name + "'",
                                   [name](const core::Element &element) { return element.name() == name; });
}

PredicatePtr<core::Member> declaredIn(const core::Type &owner)
{
    return declaredIn(owner.fullName());
}

PredicatePtr<core::Member> declaredIn(const std::string &ownerName)
{
    return declaredIn(as(haveFullyQualifiedName(ownerName), ownerName));
}

PredicatePtr<core::Member> declaredIn(PredicatePtr<core::Class> owner)
{
    detail::requireNonNull(owner, "declaredIn");
    std::string description = "are declared in " + owner->description();
    return describe<core::Member>(std::move(description),
                                  [owner](const core::Member &member) { return owner->test(member.owner()); });
}

PredicatePtr<core::Field> haveRawType(const core::Type &type)
{
    return haveRawType(type.fullName());
}

PredicatePtr<core::Field> haveRawType(const std::string &typeName)
{
    return haveRawType(typeNamed(typeName));
}

PredicatePtr<core::Field> haveRawType(PredicatePtr<core::Type> type)
{
    detail::requireNonNull(type, "haveRawType");
    std::string description = "have raw type " + type->description();
    return describe<core::Field>(std::move(description),
                                 [type](const core::Field &field) { return type->test(field.rawType()); });
}

PredicatePtr<core::CodeUnit> areMethods()
{
    return describe<core::CodeUnit>("are methods", [](const core::CodeUnit &unit) { return unit.isMethod(); });
}

PredicatePtr<core::CodeUnit> areConstructors()
{
    return describe<core::CodeUnit>("are constructors",
                                    [](const core::CodeUnit &unit) { return unit.isConstructor(); });
}

PredicatePtr<core::CodeUnit> haveRawParameterTypes(const std::vector<core::Type> &types)
{
    return haveRawParameterTypes(typeListEqualTo(types));
}

PredicatePtr<core::CodeUnit> haveRawParameterTypes(const std::vector<std::string> &typeNames)
{
    return haveRawParameterTypes(core::typesNamed(typeNames));
}

PredicatePtr<core::CodeUnit> haveRawParameterTypes(PredicatePtr<std::vector<core::Type>> types)
{
    detail::requireNonNull(types, "haveRawParameterTypes");
    std::string description = "have raw parameter types " + types->description();
    return describe<core::CodeUnit>(std::move(description),
                                    [types](const core::CodeUnit &unit)
                                    { return types->test(unit.rawParameterTypes()); });
}

PredicatePtr<core::CodeUnit> haveRawReturnType(const core::Type &type)
{
    return haveRawReturnType(type.fullName());
}

PredicatePtr<core::CodeUnit> haveRawReturnType(const std::string &typeName)
{
    return haveRawReturnType(typeNamed(typeName));
}

PredicatePtr<core::CodeUnit> haveRawReturnType(PredicatePtr<core::Type> type)
{
    detail::requireNonNull(type, "haveRawReturnType");
    std::string description = "have raw return type " + type->description();
    return describe<core::CodeUnit>(std::move(description),
                                    [type](const core::CodeUnit &unit) { return type->test(unit.rawReturnType()); });
}

PredicatePtr<core::CodeUnit> declareThrowableOfType(const core::Type &type)
{
    return declareThrowableOfType(type.fullName());
}

PredicatePtr<core::CodeUnit> declareThrowableOfType(const std::string &typeName)
{
    return declareThrowableOfType(typeNamed(typeName));
}

PredicatePtr<core::CodeUnit> declareThrowableOfType(PredicatePtr<core::Type> type)
{
    detail::requireNonNull(type, "declareThrowableOfType");
    std::string description = "declare throwable of type " + type->description();
    return describe<core::CodeUnit>(std::move(description),
                                    [type](const core::CodeUnit &unit)
                                    {
                                        const auto &thrown = unit.throwsClause();
                                        return std::any_of(thrown.begin(),
                                                           thrown.end(),
                                                           [&](const core::Type &t) { return type->test(t); });
                                    });
}

} // namespace archcheck::lang::predicates
