#include <topo/core/debug.hpp>

#include <cstdio>

namespace topo
{
    void debug_assert_report(const char* filename, int lineNumber, const char* message)
    {
        std::fprintf(stderr, "[Assert Failed] [%s:%d] %s\n", filename, lineNumber, message);
        std::fflush(stderr);
    }
}
