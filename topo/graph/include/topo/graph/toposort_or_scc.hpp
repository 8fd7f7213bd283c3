#pragma once

#include <topo/core/allocator.hpp>
#include <topo/core/dynamic_array.hpp>
#include <topo/core/expected.hpp>
#include <topo/graph/forward.hpp>
#include <topo/graph/index_graph.hpp>

namespace topo
{
    /// @brief Sorts the graph topologically or, if it has cycles, finds its strongly connected components.
    /// @details The topological order is computed with Kahn's algorithm. When that fails to order every vertex, the
    /// components are extracted with Kosaraju's algorithm, reusing the buffers of the first pass. Both run in
    /// O(V + E) time with O(V) additional space.
    ///
    /// On success the result holds a permutation of all vertices where every edge points forward. Ties are broken by
    /// vertex index and edge insertion order.
    ///
    /// On failure the error holds one list per cyclic component. Only vertices lying on a cycle are reported, so a
    /// single vertex appears on its own only if it has a self-loop. Components are listed in the order Kosaraju's
    /// second pass discovers them, and vertices within a component in reverse traversal order. Only the grouping
    /// itself should be relied upon.
    /// @param graph The graph to sort, it is consumed by the call and left empty.
    /// @param temporaryAllocator Allocator for the scratch memory which does not outlive the call.
    [[nodiscard]] toposort_result toposort_or_scc(index_graph&& graph,
        allocator* temporaryAllocator = get_global_allocator());
}
