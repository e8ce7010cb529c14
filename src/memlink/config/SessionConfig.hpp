#pragma once

#include "../channel/LibmemChannel.hpp"
#include "../log/LogManager.hpp"
#include "../session/RemoteHandle.hpp"

#include <string>

namespace memlink
{

/**
 * @brief Everything read from memlink.toml
 *
 *   [target]   process = "cs2", pid = 0
 *   [modules]  client = "libclient.so", engine = "libengine2.so", schemasystem = "libschemasystem.so"
 *   [reader]   max_string_length = 4096, snapshot_threshold = 65536
 *   [log]      level = 3, file = "logs/memlink.log", append = true, console = false
 */
struct SessionConfig
{
    LibmemChannelConfig channel;
    SessionOptions session;
    LogManager::LoggerConfig log;
};

class SessionConfigLoader
{
public:
    static constexpr const char* kDefaultPath = "memlink.toml";

    /**
     * @brief Load a config file; a missing file yields the defaults
     * @return false on a malformed file, `error` describes the problem
     */
    static bool LoadFile(const std::string& path, SessionConfig& out, std::string& error);

    static bool LoadString(const std::string& toml_text, SessionConfig& out, std::string& error);
};

} // namespace memlink
