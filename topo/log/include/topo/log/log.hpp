#pragma once

#include <topo/core/types.hpp>

#include <format>
#include <memory>
#include <utility>

namespace topo::log
{
    class log_sink;

    enum class severity : u8
    {
        debug,
        info,
        warn,
        error
    };

    namespace detail
    {
        static constexpr usize MaxLogMessageLength{1023u};
        void sink_it(severity severity, char* str, usize n);
    }

    /// @brief Registers a sink that receives every subsequent message.
    /// @remarks Registration is not synchronized with logging, sinks are expected to be set up at startup.
    void add_sink(std::unique_ptr<log_sink> sink);

    /// @brief Unregisters and destroys all sinks, messages are dropped until a new sink is added.
    void clear_sinks();

    template <typename... Args>
    void generic(severity severity, std::format_string<Args...> formatString, Args&&... args)
    {
        char buffer[detail::MaxLogMessageLength + 1];

        const auto endIt =
            std::format_to_n(buffer, detail::MaxLogMessageLength, formatString, std::forward<Args>(args)...);

        detail::sink_it(severity, buffer, usize(endIt.out - buffer));
    }

    template <typename... Args>
    void debug(std::format_string<Args...> formatString, Args&&... args)
    {
        generic(severity::debug, formatString, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> formatString, Args&&... args)
    {
        generic(severity::info, formatString, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::format_string<Args...> formatString, Args&&... args)
    {
        generic(severity::warn, formatString, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::format_string<Args...> formatString, Args&&... args)
    {
        generic(severity::error, formatString, std::forward<Args>(args)...);
    }
}
