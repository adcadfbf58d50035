//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the settings that influence rule evaluation.
// Key invariants: None.
// Ownership/Lifetime: Caller owns option values.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

namespace archcheck::support
{

/// @brief Global settings consulted by Rule::evaluate and Rule::check.
/// @invariant Flags are independent booleans.
/// @ownership Value type.
struct Options
{
    /// @brief Record trace notes (checked element counts, violations, edges
    ///        into external classes) in the supplied diagnostic engine.
    bool trace = false;

    /// @brief Fail check() when a rule's selection matched no element.
    ///        Individual rules may override this with allowEmptyShould().
    bool failOnEmptyShould = false;
};
} // namespace archcheck::support
