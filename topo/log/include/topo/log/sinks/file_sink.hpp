#pragma once

#include <topo/log/log_sink.hpp>

#include <cstdio>

namespace topo::log
{
    /// @brief Writes one line per message, prefixed by its severity. The file is not owned by the sink.
    class file_sink : public log_sink
    {
    public:
        explicit file_sink(FILE* ptr);

        file_sink(const file_sink&) = delete;
        file_sink(file_sink&&) = delete;

        file_sink& operator=(const file_sink&) = delete;
        file_sink& operator=(file_sink&&) = delete;

        ~file_sink() override = default;

        void sink(severity severity, std::string_view message) override;

    private:
        FILE* m_file{};
    };
}
