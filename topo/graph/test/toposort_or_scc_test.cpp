#include <gtest/gtest.h>

#include <topo/graph/index_graph.hpp>
#include <topo/graph/toposort_or_scc.hpp>

#include <random>
#include <unordered_map>
#include <utility>
#include <vector>

namespace topo
{
    namespace
    {
        using components = std::vector<std::vector<vertex_index>>;

        struct tracking_allocator final : allocator
        {
            byte* allocate(usize size, usize alignment) noexcept override
            {
                auto* const ptr = upstream->allocate(size, alignment);
                live.emplace(ptr, size);
                ++allocationCount;
                return ptr;
            }

            void deallocate(byte* ptr, usize size, usize alignment) noexcept override
            {
                const auto it = live.find(ptr);
                ASSERT_NE(it, live.end());
                ASSERT_EQ(it->second, size);

                live.erase(it);
                upstream->deallocate(ptr, size, alignment);
            }

            allocator* upstream{get_global_allocator()};
            std::unordered_map<void*, usize> live;
            usize allocationCount{};
        };

        using edge_list = std::vector<std::pair<vertex_index, vertex_index>>;

        index_graph make_graph(usize vertexCount, const edge_list& edges)
        {
            index_graph graph{vertexCount};

            for (const auto& [from, to] : edges)
            {
                graph.add_edge(from, to);
            }

            return graph;
        }

        // Transitive closure by Floyd-Warshall, only meant for the small graphs used in tests
        std::vector<std::vector<bool>> compute_reachability(usize vertexCount, const edge_list& edges)
        {
            std::vector<std::vector<bool>> reach(vertexCount, std::vector<bool>(vertexCount, false));

            for (const auto& [from, to] : edges)
            {
                reach[from][to] = true;
            }

            for (usize k = 0; k < vertexCount; ++k)
            {
                for (usize i = 0; i < vertexCount; ++i)
                {
                    if (!reach[i][k])
                    {
                        continue;
                    }

                    for (usize j = 0; j < vertexCount; ++j)
                    {
                        if (reach[k][j])
                        {
                            reach[i][j] = true;
                        }
                    }
                }
            }

            return reach;
        }

        edge_list make_random_edges(std::mt19937& rng, usize vertexCount, usize edgeCount, bool acyclic)
        {
            std::uniform_int_distribution<vertex_index> dist{0, vertex_index(vertexCount - 1)};

            edge_list edges;
            edges.reserve(edgeCount);

            while (edges.size() < edgeCount)
            {
                auto from = dist(rng);
                auto to = dist(rng);

                if (acyclic)
                {
                    if (from == to)
                    {
                        continue;
                    }

                    if (from > to)
                    {
                        std::swap(from, to);
                    }
                }

                edges.emplace_back(from, to);
            }

            return edges;
        }

        void check_topological_order(usize vertexCount, const edge_list& edges, const vertex_order& order)
        {
            ASSERT_EQ(order.size(), vertexCount);

            std::vector<usize> position(vertexCount, vertexCount);

            for (usize i = 0; i < order.size(); ++i)
            {
                ASSERT_LT(order[i], vertexCount);
                ASSERT_EQ(position[order[i]], vertexCount) << "Vertex " << order[i] << " appears twice";
                position[order[i]] = i;
            }

            for (const auto& [from, to] : edges)
            {
                ASSERT_LT(position[from], position[to]) << "Edge " << from << " -> " << to << " points backwards";
            }
        }

        void check_components(usize vertexCount, const edge_list& edges, const component_list& result)
        {
            const auto reach = compute_reachability(vertexCount, edges);

            constexpr usize unassigned = ~usize{};
            std::vector<usize> componentOf(vertexCount, unassigned);

            for (usize c = 0; c < result.size(); ++c)
            {
                ASSERT_FALSE(result[c].empty());

                for (const auto v : result[c])
                {
                    ASSERT_LT(v, vertexCount);
                    ASSERT_EQ(componentOf[v], unassigned) << "Vertex " << v << " appears twice";
                    ASSERT_TRUE(reach[v][v]) << "Vertex " << v << " is not on a cycle";
                    componentOf[v] = c;
                }
            }

            for (usize u = 0; u < vertexCount; ++u)
            {
                // Every vertex on a cycle has to be reported, every other vertex must not be
                ASSERT_EQ(reach[u][u], componentOf[u] != unassigned) << "Vertex " << u;

                for (usize v = 0; v < vertexCount; ++v)
                {
                    if (componentOf[u] == unassigned || componentOf[v] == unassigned)
                    {
                        continue;
                    }

                    const bool stronglyConnected = u == v || (reach[u][v] && reach[v][u]);
                    ASSERT_EQ(stronglyConnected, componentOf[u] == componentOf[v]) << "Vertices " << u << ", " << v;
                }
            }
        }
    }

    TEST(toposort_or_scc, empty_graph)
    {
        const auto result = toposort_or_scc(index_graph{0});

        ASSERT_TRUE(result);
        ASSERT_TRUE(result->empty());
    }

    TEST(toposort_or_scc, single_vertex)
    {
        const auto result = toposort_or_scc(index_graph{1});

        ASSERT_TRUE(result);

        const auto expected = {vertex_index{0}};
        ASSERT_EQ(*result, expected);
    }

    TEST(toposort_or_scc, single_vertex_self_loop)
    {
        index_graph graph{1};
        graph.add_edge(0, 0);

        const auto result = toposort_or_scc(std::move(graph));

        ASSERT_FALSE(result);
        ASSERT_EQ(result.error(), (components{{0}}));
    }

    TEST(toposort_or_scc, dag_follows_insertion_order)
    {
        auto graph = index_graph::from_adjacency({{3}, {3, 4}, {4, 7}, {5, 6, 7}, {6}, {}, {}, {}});

        const auto result = toposort_or_scc(std::move(graph));

        ASSERT_TRUE(result);

        const auto expected = {0u, 1u, 2u, 3u, 4u, 5u, 7u, 6u};
        ASSERT_EQ(*result, expected);
    }

    TEST(toposort_or_scc, self_loop_and_cycle)
    {
        auto graph = index_graph::from_adjacency({{3}, {3, 4}, {4, 7}, {5, 6, 7}, {6}, {}, {}, {}});

        graph.add_edge(0, 0);
        graph.add_edge(6, 2);

        const auto result = toposort_or_scc(std::move(graph));

        ASSERT_FALSE(result);
        ASSERT_EQ(result.error(), (components{{0}, {4, 2, 6}}));
    }

    TEST(toposort_or_scc, cycle_through_two_paths)
    {
        auto graph = index_graph::from_adjacency({{3}, {3, 4}, {4}, {5, 6, 7}, {6}, {2}, {2}, {}});

        const auto result = toposort_or_scc(std::move(graph));

        ASSERT_FALSE(result);
        ASSERT_EQ(result.error(), (components{{6, 4, 2}}));
    }

    TEST(toposort_or_scc, multiple_components)
    {
        auto graph = index_graph::from_adjacency({{1}, {2, 4, 5}, {3, 6}, {2, 7}, {0, 5}, {6}, {5}, {3, 6}});

        const auto result = toposort_or_scc(std::move(graph));

        ASSERT_FALSE(result);
        ASSERT_EQ(result.error(), (components{{4, 1, 0}, {3, 2, 7}, {5, 6}}));
    }

    TEST(toposort_or_scc, cycle_unreachable_from_first_vertex)
    {
        auto graph = index_graph::from_adjacency({{}, {2}, {1}});

        const auto result = toposort_or_scc(std::move(graph));

        ASSERT_FALSE(result);
        ASSERT_EQ(result.error(), (components{{2, 1}}));
    }

    TEST(toposort_or_scc, acyclic_vertices_are_not_reported)
    {
        // 2 only points into the cycle, 3 is only reached from it
        auto graph = index_graph::from_adjacency({{1}, {0, 3}, {0}, {}});

        const auto result = toposort_or_scc(std::move(graph));

        ASSERT_FALSE(result);
        ASSERT_EQ(result.error(), (components{{1, 0}}));
    }

    TEST(toposort_or_scc, duplicate_edges)
    {
        auto graph = index_graph::from_adjacency({{1, 1, 2}, {2, 2}, {}});

        const auto result = toposort_or_scc(std::move(graph));

        ASSERT_TRUE(result);

        const auto expected = {0u, 1u, 2u};
        ASSERT_EQ(*result, expected);
    }

    TEST(toposort_or_scc, transposed_graph_reverses_order)
    {
        auto graph = index_graph::from_adjacency({{1}, {2}, {}});
        graph.transpose();

        const auto result = toposort_or_scc(std::move(graph));

        ASSERT_TRUE(result);

        const auto expected = {2u, 1u, 0u};
        ASSERT_EQ(*result, expected);
    }

    TEST(toposort_or_scc, consumes_graph)
    {
        auto graph = index_graph::from_adjacency({{1}, {0}});

        const auto result = toposort_or_scc(std::move(graph));

        ASSERT_FALSE(result);
        ASSERT_EQ(graph.get_vertex_count(), 0);
        ASSERT_EQ(graph.get_edge_count(), 0);
    }

    TEST(toposort_or_scc, scratch_memory_comes_from_temporary_allocator)
    {
        tracking_allocator scratch;

        {
            const auto sorted = toposort_or_scc(index_graph::from_adjacency({{1}, {2}, {}}), &scratch);
            ASSERT_TRUE(sorted);

            // Sorting succeeded without needing any traversal state
            ASSERT_EQ(scratch.allocationCount, 0);

            const auto cyclic = toposort_or_scc(index_graph::from_adjacency({{1}, {2}, {0}}), &scratch);
            ASSERT_FALSE(cyclic);
            ASSERT_EQ(cyclic.error(), (components{{2, 1, 0}}));

            ASSERT_GT(scratch.allocationCount, 0);
        }

        ASSERT_TRUE(scratch.live.empty());
    }

    TEST(toposort_or_scc, random_dags_are_sorted)
    {
        std::mt19937 rng{42};

        for (usize iteration = 0; iteration < 50; ++iteration)
        {
            const usize vertexCount = 2 + iteration;
            const auto edges = make_random_edges(rng, vertexCount, vertexCount * 2, true);

            const auto result = toposort_or_scc(make_graph(vertexCount, edges));

            ASSERT_TRUE(result) << "Iteration " << iteration;
            check_topological_order(vertexCount, edges, *result);
        }
    }

    TEST(toposort_or_scc, random_graphs_are_partitioned)
    {
        std::mt19937 rng{1337};

        usize cyclicGraphs{};

        for (usize iteration = 0; iteration < 100; ++iteration)
        {
            const usize vertexCount = 2 + iteration % 30;
            const usize edgeCount = vertexCount + iteration % 7;

            const auto edges = make_random_edges(rng, vertexCount, edgeCount, false);
            const auto reach = compute_reachability(vertexCount, edges);

            bool hasCycle = false;

            for (usize v = 0; v < vertexCount; ++v)
            {
                hasCycle |= reach[v][v];
            }

            const auto result = toposort_or_scc(make_graph(vertexCount, edges));

            ASSERT_EQ(bool(result), !hasCycle) << "Iteration " << iteration;

            if (result)
            {
                check_topological_order(vertexCount, edges, *result);
            }
            else
            {
                ++cyclicGraphs;
                check_components(vertexCount, edges, result.error());
            }
        }

        ASSERT_GT(cyclicGraphs, 0);
    }
}
