#pragma once

#ifdef TOPO_ENABLE_ASSERT

    #define TOPO_ASSERT_2(Condition, Message)                                                                          \
        {                                                                                                              \
            if (!(Condition))                                                                                          \
                ::topo::debug_assert_report(__FILE__, __LINE__, Message);                                              \
        };

    #define TOPO_ASSERT_1(Condition) TOPO_ASSERT_2((Condition), #Condition)
    #define TOPO_ASSERT_OVERLOAD(_1, _2, NAME, ...) NAME
    #define TOPO_ASSERT(...) TOPO_ASSERT_OVERLOAD(__VA_ARGS__, TOPO_ASSERT_2, TOPO_ASSERT_1)(__VA_ARGS__)

#else

    #define TOPO_ASSERT(...)

#endif

namespace topo
{
    void debug_assert_report(const char* filename, int lineNumber, const char* message);
}
