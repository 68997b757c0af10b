#include "race_server.hpp"

#include <spdlog/spdlog.h>

#include "race_protocol.hpp"
#include "websocket_codec.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace typerace::server
{
    namespace
    {
        constexpr int max_join_attempts = 3;
    }

    RaceServer::RaceServer(ServerConfig config)
        : RaceServer(config, load_text_provider(config.textFile))
    {
    }

    RaceServer::RaceServer(ServerConfig config, std::unique_ptr<ReferenceTextProvider> texts)
        : config_(std::move(config))
        , texts_(std::move(texts))
        , registry_()
        , broadcaster_(registry_)
        , rooms_(registry_, broadcaster_, *texts_, config_.roomDefaults, config_.countdownTick)
        , hub_(WebSocketHub::Config{config_.host, config_.port, "/race"}, *this)
    {
    }

    RaceServer::~RaceServer()
    {
        stop();
    }

    bool RaceServer::start()
    {
        if (running_.exchange(true))
        {
            spdlog::warn("Race server already running on {}:{}", config_.host, hub_.port());
            return true;
        }

        if (!hub_.start())
        {
            spdlog::error("Unable to start WebSocket hub on {}:{}", config_.host, config_.port);
            running_.store(false);
            return false;
        }

        if (config_.statusPort > 0)
        {
            StatusServer::Sources sources;
            sources.rooms = [this]() { return rooms_.summaries(); };
            sources.connectionCount = [this]() { return registry_.size(); };
            sources.websocketPort = hub_.port();

            status_ = std::make_unique<StatusServer>(config_.host, config_.statusPort, std::move(sources));
            if (!status_->start())
            {
                spdlog::warn("Status API unavailable on {}:{}", config_.host, config_.statusPort);
                status_.reset();
            }
        }

        liveness_.start("liveness", config_.heartbeatInterval, [this]() {
            sweepLiveness(SteadyClock::now());
            return true;
        });

        reaper_.start("reaper", config_.reaperInterval, [this]() {
            reapRooms(SteadyClock::now());
            return true;
        });

        spdlog::info("Race server ready (target {} chars, max {} participants per room)",
                     config_.roomDefaults.target_char_count, config_.roomDefaults.max_participants);
        return true;
    }

    void RaceServer::stop()
    {
        if (!running_.exchange(false))
        {
            return;
        }

        liveness_.stop();
        reaper_.stop();
        hub_.stop();

        if (status_)
        {
            status_->stop();
            status_.reset();
        }

        rooms_.clear();
        spdlog::info("Race server stopped");
    }

    int RaceServer::statusPort() const noexcept
    {
        return status_ ? status_->port() : 0;
    }

    void RaceServer::onOpen(const std::shared_ptr<Connection>& connection, const JoinRequest& request)
    {
        if (request.roomId.empty() || request.participantId.empty())
        {
            spdlog::warn("[ws] connection {} from {} missing join parameters", connection->id(), connection->remoteAddress());
            reject(*connection, "Missing roomId or playerId parameters", ErrorCode::ValidationError, ws::close_code::policy_violation);
            return;
        }

        if (!ws::is_valid_utf8(request.roomId) || !ws::is_valid_utf8(request.participantId) ||
            (request.displayName && !ws::is_valid_utf8(*request.displayName)))
        {
            spdlog::warn("[ws] connection {} from {} sent join parameters that are not UTF-8", connection->id(), connection->remoteAddress());
            reject(*connection, "Join parameters must be valid UTF-8", ErrorCode::ValidationError, ws::close_code::policy_violation);
            return;
        }

        for (int attempt = 0; attempt < max_join_attempts; ++attempt)
        {
            const auto now = SteadyClock::now();
            auto room = rooms_.findOrCreate(request.roomId, now);
            const auto result = room->join(connection, request, now);

            switch (result.status)
            {
                case JoinStatus::Joined:
                case JoinStatus::Rejoined:
                    return;
                case JoinStatus::RoomFull:
                    reject(*connection, "Room is full", ErrorCode::RoomFull, ws::close_code::try_again_later);
                    return;
                case JoinStatus::AlreadyStarted:
                    reject(*connection, "Game already in progress", ErrorCode::GameAlreadyStarted, ws::close_code::try_again_later);
                    return;
                case JoinStatus::Retired:
                    spdlog::debug("[room {}] retired during join; retrying", request.roomId);
                    break;
            }
        }

        spdlog::error("[room {}] join for {} kept racing the reaper", request.roomId, request.participantId);
        reject(*connection, "Room not available", ErrorCode::RoomNotFound, ws::close_code::try_again_later);
    }

    void RaceServer::onMessage(Connection& connection, const std::string& text)
    {
        const auto binding = registry_.find(connection.id());
        if (!binding)
        {
            spdlog::debug("[ws] dropping message from unbound connection {}", connection.id());
            return;
        }

        std::string error;
        auto event = validate_event(text, error);
        if (!event)
        {
            spdlog::warn("[room {}] invalid message from {}: {}", binding->roomId, binding->participantId, error);
            sendError(connection, "Invalid message: " + error, ErrorCode::InvalidMessage);
            return;
        }

        auto room = rooms_.find(binding->roomId);
        if (!room)
        {
            sendError(connection, "Room not found", ErrorCode::RoomNotFound);
            return;
        }

        std::visit([&](const auto& message) {
            using T = std::decay_t<decltype(message)>;

            ApplyStatus status = ApplyStatus::Applied;
            std::string named = binding->participantId;

            if constexpr (std::is_same_v<T, HeartbeatEvent>)
            {
                registry_.touch(connection.id(), SteadyClock::now());
                broadcaster_.sendTo(connection, HeartbeatEvent{now_ms()});
            }
            else if constexpr (std::is_same_v<T, PlayerReadyEvent>)
            {
                status = room->setReady(binding->participantId, message.is_ready);
            }
            else if constexpr (std::is_same_v<T, TypingProgressEvent>)
            {
                named = message.player_id;
                status = room->applyProgress(message);
            }
            else if constexpr (std::is_same_v<T, PlayerFinishedEvent>)
            {
                named = message.player_id;
                status = room->applyFinish(message);
            }
            else
            {
                spdlog::warn("[room {}] unhandled {} from {}", binding->roomId, event_type(*event), binding->participantId);
                sendError(connection, std::string{"Unsupported message type: "} + event_type(*event), ErrorCode::InvalidMessage);
            }

            if (status == ApplyStatus::PlayerNotFound)
            {
                spdlog::warn("[room {}] {} names unknown participant {}", binding->roomId, event_type(*event), named);
                sendError(connection, "Player not found: " + named, ErrorCode::PlayerNotFound);
            }
        }, *event);
    }

    void RaceServer::onPong(Connection& connection)
    {
        registry_.touch(connection.id(), SteadyClock::now());
    }

    void RaceServer::onClose(Connection& connection)
    {
        disconnect(connection.id(), "connection closed");
    }

    void RaceServer::sweepLiveness(SteadyClock::time_point now)
    {
        auto result = registry_.sweep(now, config_.heartbeatTimeout);

        for (const auto& connection : result.probe)
        {
            connection->sendPing();
        }

        for (const auto& connection : result.expired)
        {
            spdlog::info("[liveness] evicting connection {} ({})", connection->id(), connection->remoteAddress());
            connection->close(ws::close_code::going_away, "heartbeat timeout");
            disconnect(connection->id(), "heartbeat timeout");
        }

        if (!result.expired.empty() || !result.probe.empty())
        {
            spdlog::debug("[liveness] probed {}, evicted {}", result.probe.size(), result.expired.size());
        }
    }

    std::vector<std::string> RaceServer::reapRooms(SteadyClock::time_point now)
    {
        auto removed = rooms_.reap(now, config_.reaperGrace);
        if (!removed.empty())
        {
            spdlog::info("[reaper] {} room(s) removed, {} remaining", removed.size(), rooms_.size());
        }
        return removed;
    }

    void RaceServer::reject(Connection& connection, const std::string& message, ErrorCode code, std::uint16_t closeCode)
    {
        sendError(connection, message, code);
        connection.close(closeCode, message);
    }

    void RaceServer::sendError(Connection& connection, const std::string& message, ErrorCode code)
    {
        broadcaster_.sendTo(connection, make_error_event(message, code));
    }

    void RaceServer::disconnect(std::uint64_t connectionId, const char* reason)
    {
        const auto binding = registry_.find(connectionId);
        if (!binding)
        {
            return;
        }

        if (auto room = rooms_.find(binding->roomId))
        {
            room->disconnect(connectionId, reason);
            return;
        }

        if (registry_.unbind(connectionId))
        {
            spdlog::debug("[ws] connection {} unbound from missing room {}", connectionId, binding->roomId);
        }
    }
}
