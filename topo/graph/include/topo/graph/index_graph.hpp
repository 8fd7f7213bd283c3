#pragma once

#include <topo/core/dynamic_array.hpp>
#include <topo/core/types.hpp>
#include <topo/graph/forward.hpp>

#include <initializer_list>
#include <iterator>
#include <span>
#include <utility>

namespace topo
{
    struct vertex
    {
        u32 inDegree{};
        u32 outDegree{};

        dynamic_array<vertex_index> inEdges;
        dynamic_array<vertex_index> outEdges;
    };

    /// @brief Adjacency-list graph over the dense vertex indices [0, N).
    /// @remarks The vertex count is fixed at construction. Edges are stored in insertion order on both endpoints, and
    /// duplicates are allowed. Out-of-range indices are a broken contract and panic.
    class index_graph
    {
    public:
        index_graph() = default;
        explicit index_graph(usize vertexCount);

        index_graph(const index_graph&) = default;
        index_graph(index_graph&& other) noexcept;

        index_graph& operator=(const index_graph&) = default;
        index_graph& operator=(index_graph&& other) noexcept;

        ~index_graph() = default;

        /// @brief Creates a graph with one vertex per element of the range, invoking f(index_graph_builder&, const T&)
        /// once for each element, in order.
        template <typename Range, typename F>
        static index_graph from_items(const Range& items, F&& f);

        /// @brief Creates a graph where the i-th list holds the destinations of the out edges of vertex i.
        static index_graph from_adjacency(std::span<const dynamic_array<vertex_index>> adjacency);
        static index_graph from_adjacency(std::initializer_list<std::initializer_list<vertex_index>> adjacency);

        void add_edge(vertex_index from, vertex_index to);

        /// @brief Reverses the direction of every edge, in place.
        void transpose() noexcept;

        usize get_vertex_count() const noexcept
        {
            return m_vertices.size();
        }

        usize get_edge_count() const noexcept
        {
            return m_edgeCount;
        }

        std::span<const vertex> get_vertices() const noexcept
        {
            return {m_vertices.data(), m_vertices.size()};
        }

        std::span<const vertex_index> get_out_edges(vertex_index v) const;
        std::span<const vertex_index> get_in_edges(vertex_index v) const;

        const vertex& operator[](vertex_index v) const;

        const vertex* begin() const noexcept
        {
            return m_vertices.begin();
        }

        const vertex* end() const noexcept
        {
            return m_vertices.end();
        }

    private:
        friend toposort_result toposort_or_scc(index_graph&& graph, allocator* temporaryAllocator);

    private:
        dynamic_array<vertex> m_vertices;
        usize m_edgeCount{};
    };

    /// @brief Adds edges on behalf of a single vertex while a graph is being built from a sequence of items.
    class index_graph_builder
    {
    public:
        index_graph_builder(index_graph& graph, vertex_index index) : m_graph{&graph}, m_index{index} {}

        index_graph& get_graph() const noexcept
        {
            return *m_graph;
        }

        vertex_index get_index() const noexcept
        {
            return m_index;
        }

        /// @brief Adds an edge from the bound vertex to the given one. Duplicates are not checked.
        void add_out_edge(vertex_index to)
        {
            m_graph->add_edge(m_index, to);
        }

        /// @brief Adds an edge from the given vertex to the bound one. Duplicates are not checked.
        void add_in_edge(vertex_index from)
        {
            m_graph->add_edge(from, m_index);
        }

    private:
        index_graph* m_graph;
        vertex_index m_index;
    };

    template <typename Range, typename F>
    index_graph index_graph::from_items(const Range& items, F&& f)
    {
        index_graph graph{usize(std::size(items))};

        vertex_index index{};

        for (const auto& item : items)
        {
            index_graph_builder builder{graph, index};
            f(builder, item);

            ++index;
        }

        return graph;
    }
}
