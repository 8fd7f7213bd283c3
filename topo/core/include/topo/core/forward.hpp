#pragma once

namespace topo
{
    class allocator;

    template <typename T>
    class dynamic_array;

    template <typename T, typename E>
    class expected;
}
