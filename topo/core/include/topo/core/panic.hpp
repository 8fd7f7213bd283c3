#pragma once

namespace topo
{
    /// @brief Reports a broken contract through the installed handler, then terminates the process.
    /// @remarks Used for caller misuse that would corrupt internal invariants if execution continued, e.g. an
    /// out-of-range vertex index. Unlike TOPO_ASSERT it is active in every build configuration.
    [[noreturn]] void panic(const char* file, int line, const char* message);

    using panic_handler = void (*)(const char* file, int line, const char* message, void* userdata);

    /// @brief Replaces the handler invoked by panic before terminating.
    /// @param handler The new handler, nullptr restores the default one which writes to stderr.
    void set_panic_handler(panic_handler handler, void* userdata);
}

#define TOPO_VERIFY(Condition, Message)                                                                                \
    do                                                                                                                 \
    {                                                                                                                  \
        if (!(Condition)) [[unlikely]]                                                                                 \
        {                                                                                                              \
            ::topo::panic(__FILE__, __LINE__, Message);                                                                \
        }                                                                                                              \
    } while (false)
