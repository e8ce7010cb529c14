#include <catch2/catch_test_macros.hpp>
#include "memlink/config/SessionConfig.hpp"

#include <filesystem>
#include <fstream>

using namespace memlink;

TEST_CASE("SessionConfig - Defaults", "[config]") {
    SessionConfig config;
    REQUIRE(config.channel.pid == 0);
    REQUIRE(config.channel.honor_protection);
    REQUIRE(config.session.snapshot_threshold == 0x10000);
    REQUIRE(config.session.max_string_length == 4096);
    REQUIRE(config.log.level == plog::info);
}

TEST_CASE("SessionConfig - LoadString", "[config]") {
    SessionConfig config;
    std::string error;

    SECTION("All sections") {
        const std::string text = R"(
[target]
process = "cs2"
pid = 1234
protect = false

[modules]
client = "libclient.so"
engine = "libengine2.so"
schemasystem = "libschemasystem.so"

[reader]
max_string_length = 0
snapshot_threshold = 4096

[log]
level = 5
file = "out/test.log"
append = false
console = true
)";
        REQUIRE(SessionConfigLoader::LoadString(text, config, error));
        REQUIRE(config.channel.process_name == "cs2");
        REQUIRE(config.channel.pid == 1234);
        REQUIRE_FALSE(config.channel.honor_protection);
        REQUIRE(config.channel.client_module == "libclient.so");
        REQUIRE(config.channel.engine_module == "libengine2.so");
        REQUIRE(config.channel.schema_system_module == "libschemasystem.so");
        REQUIRE(config.session.max_string_length == 0);
        REQUIRE(config.session.snapshot_threshold == 4096);
        REQUIRE(config.log.level == plog::debug);
        REQUIRE(config.log.filepath == "out/test.log");
        REQUIRE_FALSE(config.log.append);
        REQUIRE(config.log.add_console_appender);
    }

    SECTION("Missing keys keep their defaults") {
        REQUIRE(SessionConfigLoader::LoadString("[target]\nprocess = \"game\"\n", config, error));
        REQUIRE(config.channel.process_name == "game");
        REQUIRE(config.session.snapshot_threshold == 0x10000);
        REQUIRE(config.log.filepath == "logs/memlink.log");
    }

    SECTION("Negative values are rejected") {
        REQUIRE_FALSE(SessionConfigLoader::LoadString("[reader]\nmax_string_length = -1\n", config, error));
        REQUIRE(error.find("max_string_length") != std::string::npos);

        REQUIRE_FALSE(SessionConfigLoader::LoadString("[target]\npid = -5\n", config, error));
        REQUIRE(error.find("pid") != std::string::npos);
    }

    SECTION("Pid wider than the platform pid type") {
        REQUIRE_FALSE(SessionConfigLoader::LoadString("[target]\npid = 4294967296\n", config, error));
        REQUIRE(error.find("target.pid") != std::string::npos);
        REQUIRE(config.channel.pid == 0);
    }

    SECTION("Log level out of range") {
        REQUIRE_FALSE(SessionConfigLoader::LoadString("[log]\nlevel = 9\n", config, error));
        REQUIRE(error.find("log.level") != std::string::npos);
    }

    SECTION("Huge log level is not truncated into range") {
        REQUIRE_FALSE(SessionConfigLoader::LoadString("[log]\nlevel = 4294967300\n", config, error));
        REQUIRE(error.find("log.level") != std::string::npos);
        REQUIRE(config.log.level == plog::info);
    }

    SECTION("Malformed TOML") {
        REQUIRE_FALSE(SessionConfigLoader::LoadString("[target\nprocess = ", config, error));
        REQUIRE_FALSE(error.empty());
    }
}

TEST_CASE("SessionConfig - LoadFile", "[config]") {
    auto dir = std::filesystem::temp_directory_path() / "memlink_config_test";
    std::filesystem::create_directories(dir);

    SECTION("Missing file yields defaults") {
        SessionConfig config;
        std::string error;
        REQUIRE(SessionConfigLoader::LoadFile((dir / "does_not_exist.toml").string(), config, error));
        REQUIRE(config.session.max_string_length == 4096);
    }

    SECTION("File contents are applied") {
        auto path = dir / "memlink.toml";
        {
            std::ofstream out(path);
            out << "[reader]\nsnapshot_threshold = 128\n";
        }

        SessionConfig config;
        std::string error;
        REQUIRE(SessionConfigLoader::LoadFile(path.string(), config, error));
        REQUIRE(config.session.snapshot_threshold == 128);
    }

    std::filesystem::remove_all(dir);
}
