//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source location value attached to classes, members and
//          dependency edges.
// Key invariants: An empty file name denotes an unknown file; line 0 denotes an
//                 unknown line.
// Ownership/Lifetime: Value type; owns its file name string.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

namespace archcheck::support
{

/// @brief Position of a declaration or access within a source file.
/// @invariant line == 0 indicates the line is unknown.
/// @ownership Value type; the file name is stored by value.
struct SourceLoc
{
    /// @brief Simple file name such as "Widget.java"; empty when unknown.
    std::string file;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief Check whether a file name is attached.
    [[nodiscard]] bool hasFile() const
    {
        return !file.empty();
    }

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    /// @brief Render the location as it appears in violation messages.
    /// @return Text of the form "(Widget.java:12)"; the line renders as 0 when
    ///         unknown.
    [[nodiscard]] std::string str() const;
};

} // namespace archcheck::support
