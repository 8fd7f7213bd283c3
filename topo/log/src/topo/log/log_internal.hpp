#pragma once

#include <topo/core/dynamic_array.hpp>
#include <topo/core/platform/compiler.hpp>
#include <topo/log/log.hpp>
#include <topo/log/log_sink.hpp>

#include <memory>
#include <mutex>
#include <string_view>

namespace topo::log
{
    struct sink_storage
    {
        std::unique_ptr<log_sink> sink;
        std::mutex mutex;
    };

    inline dynamic_array<std::unique_ptr<sink_storage>> g_logSinks;

    constexpr std::string_view g_severityStrings[]{
        "[DEBUG] ",
        "[INFO] ",
        "[WARN] ",
        "[ERROR] ",
    };

    TOPO_FORCEINLINE std::string_view get_severity_string(severity severity)
    {
        return g_severityStrings[u32(severity)];
    }
}
