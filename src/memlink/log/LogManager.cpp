#include "LogManager.hpp"

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/IAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <vector>

namespace memlink
{

namespace
{
// plog loggers only ever gain appenders, so each instance gets one of these
// and the real appenders are swapped behind it.
class SwitchingAppender : public plog::IAppender
{
public:
    void write(const plog::Record& record) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& appender : m_appenders)
        {
            appender->write(record);
        }
    }

    void Replace(std::vector<std::unique_ptr<plog::IAppender>> appenders)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_appenders = std::move(appenders);
    }

private:
    std::mutex m_mutex;
    std::vector<std::unique_ptr<plog::IAppender>> m_appenders;
};

template <int InstanceId>
SwitchingAppender& RouterFor()
{
    static SwitchingAppender router;
    return router;
}
} // namespace

bool LogManager::s_initialized = false;
std::string LogManager::s_last_error;

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    auto parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        s_last_error = "Unable to prepare log directory " + parent.string() + ": " + ec.message();
        return false;
    }
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (config.filepath.empty())
    {
        s_last_error = "No log file configured for " + config.name;
        return false;
    }

    if (!PrepareLogDirectory(config.filepath))
        return false;

    try
    {
        if (!config.append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        std::vector<std::unique_ptr<plog::IAppender>> appenders;
        appenders.push_back(std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count)));
        if (config.add_console_appender)
        {
            appenders.push_back(std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>());
        }

        auto& router = RouterFor<InstanceId>();
        router.Replace(std::move(appenders));

        if (auto logger = plog::get<InstanceId>())
        {
            logger->setMaxSeverity(config.level);
        }
        else
        {
            plog::init<InstanceId>(config.level, &router);
        }

        s_initialized = true;
        return true;
    }
    catch (const std::exception& ex)
    {
        s_last_error = "Failed to register logger " + config.name + ": " + ex.what();
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::Shutdown()
{
    if (auto logger = plog::get<0>())
    {
        logger->setMaxSeverity(plog::none);
    }
    RouterFor<0>().Replace({});
    s_initialized = false;
}

} // namespace memlink
