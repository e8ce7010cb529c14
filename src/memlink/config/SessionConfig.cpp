#include "SessionConfig.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <filesystem>
#include <limits>
#include <sstream>

namespace memlink
{

namespace
{
bool ApplyTable(const toml::table& root, SessionConfig& out, std::string& error)
{
    if (auto target = root["target"].as_table())
    {
        if (auto name = (*target)["process"].value<std::string>())
            out.channel.process_name = *name;
        if (auto pid = (*target)["pid"].value<int64_t>())
        {
            if (*pid < 0 || *pid > std::numeric_limits<ProcessId>::max())
            {
                error = "target.pid is out of range";
                return false;
            }
            out.channel.pid = static_cast<ProcessId>(*pid);
        }
        if (auto protect = (*target)["protect"].value<bool>())
            out.channel.honor_protection = *protect;
    }

    if (auto modules = root["modules"].as_table())
    {
        if (auto client = (*modules)["client"].value<std::string>())
            out.channel.client_module = *client;
        if (auto engine = (*modules)["engine"].value<std::string>())
            out.channel.engine_module = *engine;
        if (auto schema_system = (*modules)["schemasystem"].value<std::string>())
            out.channel.schema_system_module = *schema_system;
    }

    if (auto reader = root["reader"].as_table())
    {
        if (auto max_length = (*reader)["max_string_length"].value<int64_t>())
        {
            if (*max_length < 0)
            {
                error = "reader.max_string_length must not be negative";
                return false;
            }
            out.session.max_string_length = static_cast<size_t>(*max_length);
        }
        if (auto threshold = (*reader)["snapshot_threshold"].value<int64_t>())
        {
            if (*threshold < 0)
            {
                error = "reader.snapshot_threshold must not be negative";
                return false;
            }
            out.session.snapshot_threshold = static_cast<size_t>(*threshold);
        }
    }

    if (auto log = root["log"].as_table())
    {
        if (auto level = (*log)["level"].value<int64_t>())
        {
            if (*level < plog::none || *level > plog::verbose)
            {
                error = "log.level must be between 0 and 6";
                return false;
            }
            out.log.level = static_cast<plog::Severity>(*level);
        }
        if (auto file = (*log)["file"].value<std::string>())
            out.log.filepath = *file;
        if (auto append = (*log)["append"].value<bool>())
            out.log.append = *append;
        if (auto console = (*log)["console"].value<bool>())
            out.log.add_console_appender = *console;
    }

    return true;
}
} // namespace

bool SessionConfigLoader::LoadString(const std::string& toml_text, SessionConfig& out, std::string& error)
{
    try
    {
        auto root = toml::parse(toml_text);
        return ApplyTable(root, out, error);
    }
    catch (const toml::parse_error& pe)
    {
        std::ostringstream oss;
        oss << "TOML parse error at line " << pe.source().begin.line << ": " << pe.description();
        error = oss.str();
        return false;
    }
}

bool SessionConfigLoader::LoadFile(const std::string& path, SessionConfig& out, std::string& error)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        PLOG_DEBUG << "No config at " << path << ", using defaults";
        return true;
    }

    try
    {
        auto root = toml::parse_file(path);
        return ApplyTable(root, out, error);
    }
    catch (const toml::parse_error& pe)
    {
        std::ostringstream oss;
        oss << path << ":" << pe.source().begin.line << ": " << pe.description();
        error = oss.str();
        return false;
    }
}

} // namespace memlink
