#pragma once

#include <topo/core/types.hpp>

#include <string_view>

namespace topo::log
{
    enum class severity : u8;

    class log_sink
    {
    public:
        virtual ~log_sink() = default;

        /// @param message The formatted message, the view is always null-terminated.
        virtual void sink(severity severity, std::string_view message) = 0;
    };
}
