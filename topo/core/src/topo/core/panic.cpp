#include <topo/core/panic.hpp>

#include <cstdio>
#include <exception>

namespace topo
{
    namespace
    {
        void panic_default_handler(const char* file, int line, const char* message, void*)
        {
            std::fprintf(stderr, "[Panic] %s:%d %s\n", file, line, message);
            std::fflush(stderr);
        }

        void* g_userdata{};
        panic_handler g_handler{panic_default_handler};
    }

    void panic(const char* file, int line, const char* message)
    {
        if (g_handler)
        {
            g_handler(file, line, message, g_userdata);
        }

        std::terminate();
    }

    void set_panic_handler(panic_handler handler, void* userdata)
    {
        g_handler = handler ? handler : panic_default_handler;
        g_userdata = userdata;
    }
}
