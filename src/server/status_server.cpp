#include "status_server.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string_view>
#include <utility>

namespace
{
    constexpr const char* application_json = "application/json";
    constexpr const char* text_plain = "text/plain";

    nlohmann::json make_error(std::string_view message)
    {
        return nlohmann::json{{"status", "error"}, {"message", message}};
    }
}

namespace typerace::server
{
    nlohmann::json serialize_room_summary(const RoomSummary& summary)
    {
        return nlohmann::json{
            {"id", summary.id},
            {"state", to_string(summary.state)},
            {"participants", summary.participantCount},
            {"connected", summary.connectedCount},
            {"created_at_ms", summary.createdAtMs}
        };
    }

    StatusServer::StatusServer(std::string host, int port, Sources sources)
        : host_(std::move(host))
        , port_(port)
        , sources_(std::move(sources))
    {
        configureRoutes();
    }

    StatusServer::~StatusServer()
    {
        stop();
    }

    bool StatusServer::start()
    {
        if (running_.load())
        {
            spdlog::warn("[status] already running on {}:{}", host_, port_);
            return true;
        }

        if (port_ == 0)
        {
            const int bound = server_.bind_to_any_port(host_.c_str());
            if (bound <= 0)
            {
                spdlog::error("[status] failed to bind {} to any port", host_);
                return false;
            }
            port_ = bound;
        }
        else if (!server_.bind_to_port(host_.c_str(), port_))
        {
            spdlog::error("[status] failed to bind {}:{}", host_, port_);
            return false;
        }

        running_.store(true);
        startedAt_ = std::chrono::steady_clock::now();

        serverThread_ = std::thread([this]() {
            spdlog::info("[status] listening on http://{}:{}", host_, port_);
            server_.listen_after_bind();
            spdlog::info("[status] shutdown complete");
        });

        return true;
    }

    void StatusServer::stop()
    {
        if (!running_.exchange(false))
        {
            return;
        }

        server_.stop();

        if (serverThread_.joinable())
        {
            serverThread_.join();
        }
    }

    long long StatusServer::uptimeMilliseconds() const
    {
        if (startedAt_ == std::chrono::steady_clock::time_point{})
        {
            return 0;
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startedAt_).count();
    }

    void StatusServer::configureRoutes()
    {
        server_.set_default_headers({
            {"Access-Control-Allow-Origin", "*"},
            {"Access-Control-Allow-Methods", "GET, OPTIONS"}
        });

        server_.Options(".*", [](const httplib::Request&, httplib::Response& res) {
            res.status = 204;
        });

        server_.set_error_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_content("Resource not found", text_plain);
            res.status = 404;
        });

        server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
            nlohmann::json payload = make_error("Unhandled exception");
            try
            {
                if (ep)
                {
                    std::rethrow_exception(ep);
                }
            }
            catch (const std::exception& ex)
            {
                payload["message"] = ex.what();
            }
            res.set_content(payload.dump(), application_json);
            res.status = 500;
        });

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            const nlohmann::json payload{
                {"status", "ok"},
                {"uptime_ms", uptimeMilliseconds()},
                {"ws_port", sources_.websocketPort},
                {"connections", sources_.connectionCount ? sources_.connectionCount() : 0},
                {"protocol_version", protocol_version}
            };

            res.set_content(payload.dump(), application_json);
            res.status = 200;
        });

        server_.Get("/rooms", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json rooms = nlohmann::json::array();
            if (sources_.rooms)
            {
                for (const auto& summary : sources_.rooms())
                {
                    rooms.push_back(serialize_room_summary(summary));
                }
            }

            const nlohmann::json payload{
                {"status", "ok"},
                {"count", rooms.size()},
                {"rooms", std::move(rooms)}
            };

            res.set_content(payload.dump(), application_json);
            res.status = 200;
        });
    }
}
