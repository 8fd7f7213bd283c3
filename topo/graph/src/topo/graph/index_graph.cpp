#include <topo/graph/index_graph.hpp>

#include <topo/core/panic.hpp>

#include <limits>
#include <utility>

namespace topo
{
    index_graph::index_graph(usize vertexCount)
    {
        TOPO_VERIFY(vertexCount <= std::numeric_limits<vertex_index>::max(), "Vertex count exceeds the index range");
        m_vertices.resize(vertexCount);
    }

    index_graph::index_graph(index_graph&& other) noexcept :
        m_vertices{std::move(other.m_vertices)}, m_edgeCount{std::exchange(other.m_edgeCount, 0)}
    {
    }

    index_graph& index_graph::operator=(index_graph&& other) noexcept
    {
        m_vertices = std::move(other.m_vertices);
        m_edgeCount = std::exchange(other.m_edgeCount, 0);
        return *this;
    }

    index_graph index_graph::from_adjacency(std::span<const dynamic_array<vertex_index>> adjacency)
    {
        return from_items(adjacency,
            [](index_graph_builder& builder, const dynamic_array<vertex_index>& outEdges)
            {
                for (const auto to : outEdges)
                {
                    builder.add_out_edge(to);
                }
            });
    }

    index_graph index_graph::from_adjacency(std::initializer_list<std::initializer_list<vertex_index>> adjacency)
    {
        return from_items(adjacency,
            [](index_graph_builder& builder, const std::initializer_list<vertex_index>& outEdges)
            {
                for (const auto to : outEdges)
                {
                    builder.add_out_edge(to);
                }
            });
    }

    void index_graph::add_edge(vertex_index from, vertex_index to)
    {
        TOPO_VERIFY(from < m_vertices.size() && to < m_vertices.size(), "Vertex index out of bounds");

        auto& src = m_vertices[from];
        auto& dst = m_vertices[to];

        ++src.outDegree;
        ++dst.inDegree;

        src.outEdges.push_back(to);
        dst.inEdges.push_back(from);

        ++m_edgeCount;
    }

    void index_graph::transpose() noexcept
    {
        for (auto& v : m_vertices)
        {
            std::swap(v.inDegree, v.outDegree);
            v.inEdges.swap(v.outEdges);
        }
    }

    std::span<const vertex_index> index_graph::get_out_edges(vertex_index v) const
    {
        const auto& storage = (*this)[v];
        return {storage.outEdges.data(), storage.outEdges.size()};
    }

    std::span<const vertex_index> index_graph::get_in_edges(vertex_index v) const
    {
        const auto& storage = (*this)[v];
        return {storage.inEdges.data(), storage.inEdges.size()};
    }

    const vertex& index_graph::operator[](vertex_index v) const
    {
        TOPO_VERIFY(v < m_vertices.size(), "Vertex index out of bounds");
        return m_vertices[v];
    }
}
