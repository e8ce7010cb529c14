#include "channel/LibmemChannel.hpp"
#include "config/SessionConfig.hpp"
#include "log/LogManager.hpp"
#include "pattern/Pattern.hpp"
#include "session/RemoteHandle.hpp"

#include <plog/Log.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace
{

struct Query
{
    enum class Type
    {
        ReadU64,
        ReadString,
        FindPattern
    };

    Type type = Type::ReadU64;
    memlink::Module module = memlink::Module::Absolute;
    memlink::OffsetChain offsets;
    std::string pattern;
};

void PrintUsage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " [OPTIONS] QUERIES...\n";
    std::cout << "memlink - typed remote memory reader\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>              Config file (default memlink.toml)\n";
    std::cout << "  --pid <pid>                  Target process id\n";
    std::cout << "  --process <name>             Target process name\n";
    std::cout << "  --verbose                    Log to the console at debug level\n";
    std::cout << "  --version                    Show version information\n";
    std::cout << "  --help                       Show this help message\n";
    std::cout << "\nQueries:\n";
    std::cout << "  --read <module>:<offsets>    Read a u64 at the end of the offset chain\n";
    std::cout << "  --string <module>:<offsets>  Read a null terminated string\n";
    std::cout << "  --find <module> <pattern>    Search a module for a byte pattern\n";
    std::cout << "\nModules: absolute, client, engine, schemasystem\n";
    std::cout << "Offsets: comma separated hex values, e.g. client:1A2B30,10,8\n";
}

void PrintVersion()
{
    std::cout << "memlink CLI\n";
    std::cout << "Version: 1.0.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

std::optional<memlink::Module> ParseModule(const std::string& name)
{
    if (name == "absolute")
        return memlink::Module::Absolute;
    if (name == "client")
        return memlink::Module::Client;
    if (name == "engine")
        return memlink::Module::Engine;
    if (name == "schemasystem")
        return memlink::Module::SchemaSystem;
    return std::nullopt;
}

bool ParseOffsets(const std::string& text, memlink::OffsetChain& out)
{
    std::istringstream iss(text);
    std::string token;
    while (std::getline(iss, token, ','))
    {
        if (token.empty())
            return false;

        char* end = nullptr;
        unsigned long long value = std::strtoull(token.c_str(), &end, 16);
        if (end == token.c_str() || *end != '\0')
            return false;
        out.push_back(static_cast<uint64_t>(value));
    }
    return !out.empty();
}

bool ParseLocation(const std::string& arg, Query& query)
{
    auto colon = arg.find(':');
    if (colon == std::string::npos)
        return false;

    auto module = ParseModule(arg.substr(0, colon));
    if (!module)
        return false;

    query.module = *module;
    return ParseOffsets(arg.substr(colon + 1), query.offsets);
}

bool RunQuery(const memlink::RemoteHandle& handle, const Query& query)
{
    using namespace memlink;

    switch (query.type)
    {
    case Query::Type::ReadU64:
    {
        auto value = handle.Read<uint64_t>(query.module, query.offsets);
        if (!value)
        {
            std::cerr << "ERROR: read failed: " << value.GetStatus().Describe() << "\n";
            return false;
        }
        std::cout << "0x" << std::hex << std::uppercase << *value << std::dec << "\n";
        return true;
    }
    case Query::Type::ReadString:
    {
        auto text = handle.ReadString(query.module, query.offsets);
        if (!text)
        {
            std::cerr << "ERROR: string read failed: " << text.GetStatus().Describe() << "\n";
            return false;
        }
        std::cout << *text << "\n";
        return true;
    }
    case Query::Type::FindPattern:
    {
        auto pattern = SearchPattern::FromString(query.pattern);
        if (!pattern.IsValid())
        {
            std::cerr << "ERROR: invalid pattern \"" << query.pattern << "\"\n";
            return false;
        }

        auto offset = handle.FindPattern(query.module, pattern);
        if (!offset)
        {
            std::cerr << "ERROR: pattern search failed: " << offset.GetStatus().Describe() << "\n";
            return false;
        }
        if (!offset->has_value())
        {
            std::cout << "not found\n";
            return true;
        }
        std::cout << ModuleName(query.module) << "+0x" << std::hex << std::uppercase << **offset << std::dec
                  << "\n";
        return true;
    }
    }
    return false;
}

} // namespace

int main(int argc, char* argv[])
{
    using namespace memlink;

    std::string config_path = SessionConfigLoader::kDefaultPath;
    std::optional<ProcessId> opt_pid;
    std::optional<std::string> opt_process;
    bool opt_verbose = false;
    std::vector<Query> queries;

    for (int i = 1; i < argc; ++i)
    {
        const bool has_value = i + 1 < argc;

        if (strcmp(argv[i], "--version") == 0)
        {
            PrintVersion();
            return 0;
        }
        else if (strcmp(argv[i], "--help") == 0)
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (strcmp(argv[i], "--verbose") == 0)
        {
            opt_verbose = true;
        }
        else if (strcmp(argv[i], "--config") == 0 && has_value)
        {
            config_path = argv[++i];
        }
        else if (strcmp(argv[i], "--pid") == 0 && has_value)
        {
            opt_pid = static_cast<ProcessId>(std::strtol(argv[++i], nullptr, 10));
        }
        else if (strcmp(argv[i], "--process") == 0 && has_value)
        {
            opt_process = argv[++i];
        }
        else if ((strcmp(argv[i], "--read") == 0 || strcmp(argv[i], "--string") == 0) && has_value)
        {
            Query query;
            query.type = strcmp(argv[i], "--read") == 0 ? Query::Type::ReadU64 : Query::Type::ReadString;
            if (!ParseLocation(argv[++i], query))
            {
                std::cerr << "ERROR: invalid location \"" << argv[i] << "\"\n";
                return 1;
            }
            queries.push_back(query);
        }
        else if (strcmp(argv[i], "--find") == 0 && i + 2 < argc)
        {
            Query query;
            query.type = Query::Type::FindPattern;
            auto module = ParseModule(argv[++i]);
            if (!module)
            {
                std::cerr << "ERROR: unknown module \"" << argv[i] << "\"\n";
                return 1;
            }
            query.module = *module;
            query.pattern = argv[++i];
            queries.push_back(query);
        }
        else
        {
            std::cerr << "ERROR: unknown or incomplete option " << argv[i] << "\n\n";
            PrintUsage(argv[0]);
            return 1;
        }
    }

    SessionConfig config;
    std::string error;
    if (!SessionConfigLoader::LoadFile(config_path, config, error))
    {
        std::cerr << "ERROR: " << error << "\n";
        return 1;
    }

    if (opt_verbose)
    {
        config.log.level = plog::debug;
        config.log.add_console_appender = true;
    }
    if (!LogManager::RegisterLogger(config.log))
    {
        std::cerr << "WARNING: logging disabled: " << LogManager::LastError() << "\n";
    }

    if (opt_pid)
        config.channel.pid = *opt_pid;
    if (opt_process)
    {
        config.channel.process_name = *opt_process;
        if (!opt_pid)
            config.channel.pid = 0;
    }

    auto handle = RemoteHandle::Create(std::make_unique<LibmemChannel>(config.channel), config.session);
    if (!handle)
    {
        std::cerr << "ERROR: failed to attach: " << handle.GetStatus().Describe() << "\n";
        LogManager::Shutdown();
        return 1;
    }

    PLOG_INFO << "Session ready, pid " << (*handle)->Pid() << ", " << queries.size() << " queries";

    bool ok = true;
    for (const auto& query : queries)
    {
        ok = RunQuery(**handle, query) && ok;
    }

    LogManager::Shutdown();
    return ok ? 0 : 1;
}
