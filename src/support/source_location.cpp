//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Renders SourceLoc values in the parenthesised "(File:line)" form shared by
// every violation message.  The format is part of the stable report contract,
// so it lives in exactly one place.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the textual rendering of `SourceLoc`.

#include "support/source_location.hpp"

namespace archcheck::support
{

/// @brief Render the location as "(<file>:<line>)".
///
/// @details Unknown lines print as zero rather than being elided so consumers
///          parsing CI logs always see the same two-field shape.  An unknown
///          file prints as an empty name.
std::string SourceLoc::str() const
{
    std::string out;
    out.reserve(file.size() + 16);
    out.push_back('(');
    out.append(file);
    out.push_back(':');
    out.append(std::to_string(line));
    out.push_back(')');
    return out;
}

} // namespace archcheck::support
