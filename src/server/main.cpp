#include "race_server.hpp"
#include "server_config.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{
    constexpr char server_name[] = "typerace-server";

    std::atomic_bool& is_running()
    {
        static std::atomic_bool running{true};
        return running;
    }

    void handle_signal(int)
    {
        is_running() = false;
    }

    void configure_logging(const std::string& level)
    {
        if (!spdlog::get(server_name))
        {
            auto logger = spdlog::stdout_color_mt(server_name);
            spdlog::set_default_logger(logger);
        }

        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        const auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off")
        {
            spdlog::warn("TYPERACE_LOG_LEVEL value '{}' is not recognised; using info", level);
            spdlog::set_level(spdlog::level::info);
        }
        else
        {
            spdlog::set_level(parsed);
        }

        spdlog::info("{} starting up (protocol v{})", server_name, typerace::protocol_version);
    }
}

int main()
{
    auto config = typerace::server::load_server_config_from_env();
    configure_logging(config.logLevel);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    typerace::server::RaceServer server(config);
    if (!server.start())
    {
        spdlog::error("Unable to start race server on {}:{}", config.host, config.port);
        spdlog::shutdown();
        return 1;
    }

    spdlog::info("Race endpoint available at ws://{}:{}/race?roomId=<code>&playerId=<id>", config.host, server.port());
    if (server.statusPort() > 0)
    {
        spdlog::info("Status API available at http://{}:{}/health", config.host, server.statusPort());
    }

    spdlog::info("Press Ctrl+C to shut down.");
    while (is_running())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Shutdown signal received; stopping server...");
    server.stop();

    spdlog::info("{} terminated cleanly.", server_name);
    spdlog::shutdown();
    return 0;
}
