#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "race_schema.hpp"

namespace typerace::server
{
    struct ServerConfig
    {
        std::string host{"127.0.0.1"};
        int port{8080};                 // 0 picks an ephemeral port
        int statusPort{0};              // 0 disables the status API
        RoomSettings roomDefaults{};
        std::filesystem::path textFile;
        std::string logLevel{"info"};

        std::chrono::milliseconds heartbeatInterval{std::chrono::seconds(30)};
        std::chrono::milliseconds heartbeatTimeout{std::chrono::seconds(60)};
        std::chrono::milliseconds reaperInterval{std::chrono::seconds(60)};
        std::chrono::milliseconds reaperGrace{std::chrono::minutes(5)};
        std::chrono::milliseconds countdownTick{std::chrono::seconds(1)};
    };

    // Reads TYPERACE_* environment variables on top of the defaults above.
    // Values that fail to parse or fall out of range are logged and ignored.
    ServerConfig load_server_config_from_env();
}
