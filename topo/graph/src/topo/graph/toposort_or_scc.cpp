#include <topo/graph/toposort_or_scc.hpp>

#include <topo/core/debug.hpp>
#include <topo/core/utility.hpp>
#include <topo/log/log.hpp>
#include <topo/trace/profile.hpp>

#include <utility>

namespace topo
{
    namespace
    {
        enum class visit_state : u8
        {
            unvisited,
            discovered,
            assigned,
        };

        struct dfs_frame
        {
            vertex_index vertex;
            u32 nextEdge;
        };

        // Kahn's algorithm, the order doubles as the queue: the vertices after the head are the ones still pending.
        // The in-degree counters are consumed in the process.
        void kahn_sort(dynamic_array<vertex>& vertices, vertex_order& order)
        {
            const auto vertexCount = narrow_cast<vertex_index>(vertices.size());

            order.reserve(vertexCount);

            for (vertex_index v = 0; v < vertexCount; ++v)
            {
                if (vertices[v].inDegree == 0)
                {
                    order.push_back(v);
                }
            }

            for (usize head = 0; head < order.size(); ++head)
            {
                const auto& current = vertices[order[head]];

                for (const auto next : current.outEdges)
                {
                    auto& dst = vertices[next];
                    TOPO_ASSERT(dst.inDegree > 0);

                    if (--dst.inDegree == 0)
                    {
                        order.push_back(next);
                    }
                }
            }
        }

        // First pass of Kosaraju's algorithm, appends every vertex to the finish order in DFS post-order.
        void forward_visit(const dynamic_array<vertex>& vertices,
            dynamic_array<visit_state>& states,
            dynamic_array<dfs_frame>& stack,
            vertex_order& finishOrder)
        {
            const auto vertexCount = narrow_cast<vertex_index>(vertices.size());

            for (vertex_index root = 0; root < vertexCount; ++root)
            {
                if (states[root] != visit_state::unvisited)
                {
                    continue;
                }

                states[root] = visit_state::discovered;
                stack.push_back({root, 0u});

                while (!stack.empty())
                {
                    auto& frame = stack.back();
                    const auto& outEdges = vertices[frame.vertex].outEdges;

                    if (frame.nextEdge < outEdges.size())
                    {
                        const auto next = outEdges[frame.nextEdge];
                        ++frame.nextEdge;

                        if (states[next] == visit_state::unvisited)
                        {
                            states[next] = visit_state::discovered;
                            stack.push_back({next, 0u});
                        }
                    }
                    else
                    {
                        finishOrder.push_back(frame.vertex);
                        stack.pop_back();
                    }
                }
            }
        }

        // Second pass, walks the in edges from each root in reverse finish order. The root itself is only collected
        // when the traversal comes back to it, i.e. when it lies on a cycle.
        void collect_components(const dynamic_array<vertex>& vertices,
            dynamic_array<visit_state>& states,
            dynamic_array<dfs_frame>& stack,
            vertex_order& finishOrder,
            component_list& components)
        {
            while (!finishOrder.empty())
            {
                const auto root = finishOrder.back();
                finishOrder.pop_back();

                if (states[root] == visit_state::assigned)
                {
                    continue;
                }

                dynamic_array<vertex_index> component;

                stack.push_back({root, 0u});

                while (!stack.empty())
                {
                    auto& frame = stack.back();
                    const auto& inEdges = vertices[frame.vertex].inEdges;

                    if (frame.nextEdge < inEdges.size())
                    {
                        const auto next = inEdges[frame.nextEdge];
                        ++frame.nextEdge;

                        if (states[next] == visit_state::discovered)
                        {
                            states[next] = visit_state::assigned;
                            component.push_back(next);
                            stack.push_back({next, 0u});
                        }
                    }
                    else
                    {
                        stack.pop_back();
                    }
                }

                if (states[root] == visit_state::assigned)
                {
                    components.push_back(std::move(component));
                }
                else
                {
                    states[root] = visit_state::assigned;
                }
            }
        }
    }

    toposort_result toposort_or_scc(index_graph&& graph, allocator* temporaryAllocator)
    {
        TOPO_PROFILE_SCOPE();

        index_graph consumed{std::move(graph)};
        auto& vertices = consumed.m_vertices;

        const usize vertexCount = vertices.size();
        TOPO_PROFILE_VALUE(vertexCount);

        vertex_order order;
        kahn_sort(vertices, order);

        if (order.size() == vertexCount)
        {
            return order;
        }

        log::debug("Topological sort ordered {} of {} vertices, extracting strongly connected components",
            order.size(),
            vertexCount);

        // Empty graphs are always sorted, so there is at least one vertex from here on
        TOPO_ASSERT(vertexCount > 0);

        vertex_order& finishOrder = order;
        finishOrder.clear();

        dynamic_array<visit_state> states{temporaryAllocator};
        states.resize(vertexCount, visit_state::unvisited);

        dynamic_array<dfs_frame> stack{temporaryAllocator};

        forward_visit(vertices, states, stack, finishOrder);
        TOPO_ASSERT(finishOrder.size() == vertexCount);

        component_list components;
        collect_components(vertices, states, stack, finishOrder, components);

        log::debug("Found {} strongly connected components", components.size());

        return components;
    }
}
