//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Built-in predicates over the code model, used with `that(...)` and as
// parameters of conditions.
//
// Type-based filters come in three forms: a concrete Type, a fully-qualified
// name, or an arbitrary predicate.  The first two build the third, so the
// three forms select the same elements and produce the same description.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Class.hpp"
#include "core/Member.hpp"
#include "core/Modifier.hpp"
#include "core/Type.hpp"
#include "lang/Predicate.hpp"

#include <string>
#include <vector>

namespace archcheck::lang::predicates
{

/// @brief True for a type named exactly like @p type; described "equivalent to <fqn>".
PredicatePtr<core::Type> equivalentTo(const core::Type &type);

/// @brief Type identity described by the fully-qualified name alone.
PredicatePtr<core::Type> typeNamed(const std::string &fullName);

/// @brief Type identity described "@<SimpleName>", for annotation filters.
PredicatePtr<core::Type> annotationType(const std::string &fullName);

/// @brief Positional equality of a parameter list, described "[a, b]".
PredicatePtr<std::vector<core::Type>> typeListEqualTo(std::vector<core::Type> types);

// Classes --------------------------------------------------------------------

/// @brief Class is one of @p classes or nested (at any depth) inside one of them.
PredicatePtr<core::Class> belongToAnyOf(const std::vector<core::Type> &classes);
PredicatePtr<core::Class> belongToAnyOf(const std::vector<std::string> &classNames);

PredicatePtr<core::Class> haveFullyQualifiedName(const std::string &fullName);
PredicatePtr<core::Class> haveSimpleName(const std::string &simpleName);
PredicatePtr<core::Class> haveSimpleNameEndingWith(const std::string &suffix);

/// @brief Package match; ".." at either end of @p packageIdentifier stands for
///        any number of package segments, "*" for one segment name.
PredicatePtr<core::Class> resideInAPackage(const std::string &packageIdentifier);

/// @brief True when @p packageName matches @p packageIdentifier (see resideInAPackage).
bool packageMatches(const std::string &packageIdentifier, const std::string &packageName);

// Elements -------------------------------------------------------------------

PredicatePtr<core::Element> areAnnotatedWith(const core::Type &annotation);
PredicatePtr<core::Element> areAnnotatedWith(const std::string &annotationName);
PredicatePtr<core::Element> areAnnotatedWith(PredicatePtr<core::Type> annotation);

PredicatePtr<core::Element> haveModifier(core::Modifier modifier);
PredicatePtr<core::Element> arePublic();
PredicatePtr<core::Element> areProtected();
PredicatePtr<core::Element> arePrivate();
PredicatePtr<core::Element> arePackagePrivate();
PredicatePtr<core::Element> haveName(const std::string &name);

// Members --------------------------------------------------------------------

PredicatePtr<core::Member> declaredIn(const core::Type &owner);
PredicatePtr<core::Member> declaredIn(const std::string &ownerName);
PredicatePtr<core::Member> declaredIn(PredicatePtr<core::Class> owner);

PredicatePtr<core::Field> haveRawType(const core::Type &type);
PredicatePtr<core::Field> haveRawType(const std::string &typeName);
PredicatePtr<core::Field> haveRawType(PredicatePtr<core::Type> type);

// Code units -----------------------------------------------------------------

PredicatePtr<core::CodeUnit> areMethods();
PredicatePtr<core::CodeUnit> areConstructors();

PredicatePtr<core::CodeUnit> haveRawParameterTypes(const std::vector<core::Type> &types);
PredicatePtr<core::CodeUnit> haveRawParameterTypes(const std::vector<std::string> &typeNames);
PredicatePtr<core::CodeUnit> haveRawParameterTypes(PredicatePtr<std::vector<core::Type>> types);

PredicatePtr<core::CodeUnit> haveRawReturnType(const core::Type &type);
PredicatePtr<core::CodeUnit> haveRawReturnType(const std::string &typeName);
PredicatePtr<core::CodeUnit> haveRawReturnType(PredicatePtr<core::Type> type);

/// @brief Some declared throwable of the code unit matches.
PredicatePtr<core::CodeUnit> declareThrowableOfType(const core::Type &type);
PredicatePtr<core::CodeUnit> declareThrowableOfType(const std::string &typeName);
PredicatePtr<core::CodeUnit> declareThrowableOfType(PredicatePtr<core::Type> type);

} // namespace archcheck::lang::predicates
