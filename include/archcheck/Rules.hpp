//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/archcheck/Rules.hpp
// Purpose: Stable public entry point for writing and checking rules.
// Key invariants: Re-exports the rule syntax, the built-in predicates and
//                 conditions, and the rule library.
// Ownership/Lifetime: Types mirror definitions in archcheck::lang.
// Links: docs/codemap.md
#pragma once

#include "archcheck/Model.hpp"
#include "lang/CallRestriction.hpp"
#include "lang/Conditions.hpp"
#include "lang/EvaluationResult.hpp"
#include "lang/Predicates.hpp"
#include "lang/Rule.hpp"
#include "lang/syntax/RuleDefinition.hpp"
#include "library/GeneralCodingRules.hpp"
