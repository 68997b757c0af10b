#include "server_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace typerace::server
{
    namespace
    {
        std::string read_env_var(const char* name)
        {
            const char* value = std::getenv(name);
            return value == nullptr ? std::string{} : std::string{value};
        }

        std::optional<long long> read_integer(const char* name, long long min, long long max)
        {
            const auto value = read_env_var(name);
            if (value.empty())
            {
                return std::nullopt;
            }

            long long candidate = 0;
            try
            {
                std::size_t consumed = 0;
                candidate = std::stoll(value, &consumed);
                if (consumed != value.size())
                {
                    throw std::invalid_argument("trailing characters");
                }
            }
            catch (const std::exception&)
            {
                spdlog::warn("{} value '{}' is not an integer; using default", name, value);
                return std::nullopt;
            }

            if (candidate < min || candidate > max)
            {
                spdlog::warn("{} value '{}' is out of range [{}, {}]; using default", name, value, min, max);
                return std::nullopt;
            }

            return candidate;
        }
    }

    ServerConfig load_server_config_from_env()
    {
        ServerConfig config;

        if (auto host = read_env_var("TYPERACE_HOST"); !host.empty())
        {
            config.host = host;
        }
        if (auto port = read_integer("TYPERACE_PORT", 0, 65535))
        {
            config.port = static_cast<int>(*port);
        }
        if (auto statusPort = read_integer("TYPERACE_STATUS_PORT", 0, 65535))
        {
            config.statusPort = static_cast<int>(*statusPort);
        }
        if (auto target = read_integer("TYPERACE_TARGET_CHARS", 1, 100000))
        {
            config.roomDefaults.target_char_count = *target;
        }
        if (auto maxPlayers = read_integer("TYPERACE_MAX_PLAYERS", 2, 64))
        {
            config.roomDefaults.max_participants = static_cast<std::size_t>(*maxPlayers);
        }
        if (auto textFile = read_env_var("TYPERACE_TEXT_FILE"); !textFile.empty())
        {
            config.textFile = textFile;
        }
        if (auto level = read_env_var("TYPERACE_LOG_LEVEL"); !level.empty())
        {
            config.logLevel = level;
        }

        return config;
    }
}
