//===----------------------------------------------------------------------===//
//
// Part of the Archcheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Implements dependency index construction.
/// @details Walks the edge list once, appending each edge position to the
///          incoming list of its target and the outgoing list of its origin.
//
//===----------------------------------------------------------------------===//

#include "analysis/CallGraph.hpp"

namespace archcheck::analysis
{

CallGraph buildCallGraph(const std::vector<core::Dependency> &dependencies)
{
    CallGraph cg;
    for (size_t i = 0; i < dependencies.size(); ++i)
    {
        const core::Dependency &dep = dependencies[i];
        cg.incoming[dep.target].push_back(i);
        cg.outgoing[dep.origin].push_back(i);
    }
    return cg;
}

} // namespace archcheck::analysis
