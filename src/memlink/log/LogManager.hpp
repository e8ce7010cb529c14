#pragma once

#include <plog/Severity.h>

#include <cstddef>
#include <string>

namespace memlink
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name = "memlink";
        std::string filepath = "logs/memlink.log";
        bool append = true;
        plog::Severity level = plog::info;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    /**
     * @brief Route a plog instance to a rolling file appender (and optionally the console)
     *
     * plog::init runs once per instance. Registering again replaces the
     * previous appenders instead of adding to them.
     */
    template <int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    /// Silence the default instance and release its appenders.
    static void Shutdown();

    static bool IsInitialized() { return s_initialized; }
    static const std::string& LastError() { return s_last_error; }

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static std::string s_last_error;
};

} // namespace memlink
