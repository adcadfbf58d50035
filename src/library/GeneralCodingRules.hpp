//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Ready-made rules for conventions most code bases share.  Each function
// returns a fresh Rule that callers may refine with because() or as().
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lang/Condition.hpp"
#include "lang/Rule.hpp"

#include <string>

namespace archcheck::library
{

/// @brief A class named "<Impl><suffix>" must live in the package of the class
///        named "<Impl>".
/// @details The rule holds when no class "<Impl>" exists, and when another
///          class named "<Impl><suffix>" already lives in the implementation's
///          package (several test classes may share a name).
lang::Rule testClassesShouldResideInTheSamePackageAsImplementation(const std::string &testClassSuffix = "Test");

/// @brief The condition behind testClassesShouldResideInTheSamePackageAsImplementation.
lang::ConditionPtr<core::Class> resideInTheSamePackageAsImplementation(const std::string &testClassSuffix);

/// @brief No code unit declares java.lang.Throwable, java.lang.Exception or
///        java.lang.RuntimeException in its throws clause.
lang::Rule codeUnitsShouldNotDeclareGenericExceptions();

} // namespace archcheck::library
