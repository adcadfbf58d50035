//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// A direct dependency index over the code model's edge list.  Unlike a graph of
// nested pointers it stores only edge positions keyed by member identity, so
// the caller/callee relation can contain cycles without any entity owning
// another.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Incoming/outgoing edge index for dependency queries.
/// @details Records, for every member, the positions of the edges that target
///          it and, for every code unit, the positions of the edges it
///          originates.  Positions refer to the dependency vector the index was
///          built from and keep insertion order.

#pragma once

#include "core/Dependency.hpp"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace archcheck::analysis
{

/// @brief Dependency index for a code model.
struct CallGraph
{
    /// @brief Edge positions keyed by target member.
    std::unordered_map<const core::Member *, std::vector<size_t>> incoming;
    /// @brief Edge positions keyed by origin code unit.
    std::unordered_map<const core::CodeUnit *, std::vector<size_t>> outgoing;
};

/// @brief Index the edges of a code model.
/// @details Every edge is indexed under both endpoints.  Repeated edges are
///          kept, one position per call site.
/// @param dependencies Edge list to index; not modified.
/// @return Index whose positions refer into @p dependencies.
CallGraph buildCallGraph(const std::vector<core::Dependency> &dependencies);

} // namespace archcheck::analysis
