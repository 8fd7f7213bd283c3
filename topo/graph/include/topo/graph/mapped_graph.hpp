#pragma once

#include <topo/core/allocator.hpp>
#include <topo/core/debug.hpp>
#include <topo/core/dynamic_array.hpp>
#include <topo/core/expected.hpp>
#include <topo/graph/forward.hpp>
#include <topo/graph/index_graph.hpp>
#include <topo/graph/toposort_or_scc.hpp>

#include <iterator>
#include <utility>

namespace topo
{
    /// @brief Pair of pure functions converting between caller-defined identifiers and dense vertex indices.
    /// @remarks The tag is an opaque value (e.g. a pool or generation id) that fromIndex needs to rebuild a full
    /// identifier from an index. It is the same for every vertex of a graph.
    template <typename Id>
    struct id_mapping
    {
        using to_index_fn = vertex_index (*)(const Id& id);
        using from_index_fn = Id (*)(u32 tag, vertex_index index);

        to_index_fn toIndex{};
        from_index_fn fromIndex{};
    };

    template <typename Id>
    class mapped_graph_builder
    {
    public:
        mapped_graph_builder(index_graph_builder builder, const id_mapping<Id>& mapping) :
            m_builder{builder}, m_mapping{&mapping}
        {
        }

        vertex_index get_index() const noexcept
        {
            return m_builder.get_index();
        }

        void add_out_edge(const Id& to)
        {
            m_builder.add_out_edge(m_mapping->toIndex(to));
        }

        void add_in_edge(const Id& from)
        {
            m_builder.add_in_edge(m_mapping->toIndex(from));
        }

    private:
        index_graph_builder m_builder;
        const id_mapping<Id>* m_mapping;
    };

    /// @brief An index_graph whose vertices are addressed through caller-defined identifiers.
    template <typename Id>
    class mapped_graph
    {
    public:
        using id_type = Id;
        using order_type = dynamic_array<Id>;
        using components_type = dynamic_array<dynamic_array<Id>>;
        using result_type = expected<order_type, components_type>;

    public:
        mapped_graph(u32 tag, usize vertexCount, const id_mapping<Id>& mapping) :
            m_graph{vertexCount}, m_mapping{mapping}, m_tag{tag}
        {
            TOPO_ASSERT(mapping.toIndex && mapping.fromIndex);
        }

        /// @brief Creates a graph with one vertex per element of the range, invoking f(mapped_graph_builder<Id>&,
        /// const T&) once for each element, in order.
        template <typename Range, typename F>
        static mapped_graph from_items(u32 tag, const Range& items, const id_mapping<Id>& mapping, F&& f)
        {
            mapped_graph graph{tag, usize(std::size(items)), mapping};

            vertex_index index{};

            for (const auto& item : items)
            {
                mapped_graph_builder<Id> builder{index_graph_builder{graph.m_graph, index}, graph.m_mapping};
                f(builder, item);

                ++index;
            }

            return graph;
        }

        void add_edge(const Id& from, const Id& to)
        {
            m_graph.add_edge(m_mapping.toIndex(from), m_mapping.toIndex(to));
        }

        void transpose() noexcept
        {
            m_graph.transpose();
        }

        Id to_id(vertex_index index) const
        {
            return m_mapping.fromIndex(m_tag, index);
        }

        vertex_index to_index(const Id& id) const
        {
            return m_mapping.toIndex(id);
        }

        const index_graph& get_graph() const noexcept
        {
            return m_graph;
        }

        const id_mapping<Id>& get_mapping() const noexcept
        {
            return m_mapping;
        }

        u32 get_tag() const noexcept
        {
            return m_tag;
        }

        /// @brief Moves the underlying graph out, leaving this one without vertices.
        [[nodiscard]] index_graph release() && noexcept
        {
            return std::move(m_graph);
        }

    private:
        index_graph m_graph;
        id_mapping<Id> m_mapping;
        u32 m_tag;
    };

    /// @brief Runs toposort_or_scc on the underlying graph, translating the resulting indices back to identifiers.
    template <typename Id>
    [[nodiscard]] typename mapped_graph<Id>::result_type toposort_or_scc(mapped_graph<Id>&& graph,
        allocator* temporaryAllocator = get_global_allocator())
    {
        const auto tag = graph.get_tag();
        const auto fromIndex = graph.get_mapping().fromIndex;

        const auto result = toposort_or_scc(std::move(graph).release(), temporaryAllocator);

        if (result)
        {
            typename mapped_graph<Id>::order_type order;
            order.reserve(result->size());

            for (const auto v : *result)
            {
                order.push_back(fromIndex(tag, v));
            }

            return order;
        }

        typename mapped_graph<Id>::components_type components;
        components.reserve(result.error().size());

        for (const auto& component : result.error())
        {
            auto& mapped = components.emplace_back();
            mapped.reserve(component.size());

            for (const auto v : component)
            {
                mapped.push_back(fromIndex(tag, v));
            }
        }

        return components;
    }
}
