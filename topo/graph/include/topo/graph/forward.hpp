#pragma once

#include <topo/core/forward.hpp>
#include <topo/core/types.hpp>

namespace topo
{
    using vertex_index = u32;

    struct vertex;

    class index_graph;
    class index_graph_builder;

    template <typename Id>
    struct id_mapping;

    template <typename Id>
    class mapped_graph;

    template <typename Id>
    class mapped_graph_builder;

    using vertex_order = dynamic_array<vertex_index>;
    using component_list = dynamic_array<dynamic_array<vertex_index>>;

    using toposort_result = expected<vertex_order, component_list>;
}
