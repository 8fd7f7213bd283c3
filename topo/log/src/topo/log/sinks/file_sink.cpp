#include <topo/log/sinks/file_sink.hpp>

#include <topo/core/debug.hpp>
#include <topo/log/log_internal.hpp>

namespace topo::log
{
    file_sink::file_sink(FILE* ptr) : m_file{ptr}
    {
        TOPO_ASSERT(ptr);
    }

    void file_sink::sink(severity severity, std::string_view message)
    {
        const auto severityString = get_severity_string(severity);
        std::fwrite(severityString.data(), 1, severityString.size(), m_file);

        std::fwrite(message.data(), 1, message.size(), m_file);
        std::fputc('\n', m_file);
    }
}
