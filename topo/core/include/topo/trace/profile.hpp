#pragma once

#ifdef TRACY_ENABLE

    #include <source_location>

    #include <tracy/Tracy.hpp>

namespace topo::trace
{
    consteval const char* make_scope_name(const char* name)
    {
        return name;
    }

    consteval const char* make_scope_name(std::source_location loc = std::source_location::current())
    {
        return loc.function_name();
    }
}

    #define TOPO_PROFILE_SCOPE(...) ZoneScopedN(topo::trace::make_scope_name(__VA_ARGS__))

    #define TOPO_PROFILE_VALUE(Value) ZoneValue(Value)

#else

    #define TOPO_PROFILE_SCOPE(...)
    #define TOPO_PROFILE_VALUE(Value)

#endif
