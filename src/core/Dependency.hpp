// File: src/core/Dependency.hpp
// Purpose: Declares directed call and field-access edges between members.
// Key invariants: origin belongs to an analyzed class; target may be external.
// Ownership/Lifetime: Endpoints are non-owning; the CodeModel owns edges and
//                     members alike.
// Links: docs/codemap.md
#pragma once

#include "core/fwd.hpp"
#include "support/source_location.hpp"

#include <string>
#include <string_view>

namespace archcheck::core
{

/// @brief Kind of access an edge records.
enum class DependencyKind
{
    Call,
    FieldRead,
    FieldWrite
};

/// @brief Directed edge from a code unit to the member it calls or accesses.
struct Dependency
{
    const CodeUnit *origin = nullptr; ///< Calling or accessing code unit.
    const Member *target = nullptr;   ///< Called code unit or accessed field.
    DependencyKind kind = DependencyKind::Call;
    support::SourceLoc location; ///< Origin's declaring file and access line.

    /// @brief Render the edge, e.g.
    ///        "Method <a.B.run()> calls constructor <a.W.<init>()> in (B.java:7)".
    [[nodiscard]] std::string description() const;
};

/// @brief Verb phrase for the edge kind ("calls", "gets", "sets").
std::string_view verbOf(const Dependency &dependency);

} // namespace archcheck::core
