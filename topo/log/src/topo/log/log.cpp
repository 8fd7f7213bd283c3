#include <topo/log/log.hpp>

#include <topo/core/debug.hpp>
#include <topo/core/utility.hpp>
#include <topo/log/log_internal.hpp>

namespace topo::log
{
    void add_sink(std::unique_ptr<log_sink> sink)
    {
        TOPO_ASSERT(sink);

        auto& storage = g_logSinks.emplace_back(std::make_unique<sink_storage>());
        storage->sink = std::move(sink);
    }

    void clear_sinks()
    {
        g_logSinks.clear();
        g_logSinks.shrink_to_fit();
    }

    namespace detail
    {
        void sink_it(severity severity, char* str, usize n)
        {
            // Make sure it's null-terminated
            const auto last = min(detail::MaxLogMessageLength, n);
            str[last] = '\0';

            const std::string_view message{str, last};

            for (const auto& storage : g_logSinks)
            {
                const std::lock_guard lock{storage->mutex};
                storage->sink->sink(severity, message);
            }
        }
    }
}
