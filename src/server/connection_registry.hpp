#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "connection.hpp"

namespace typerace::server
{
    using SteadyClock = std::chrono::steady_clock;

    struct ConnectionBinding
    {
        std::shared_ptr<Connection> connection;
        std::string participantId;
        std::string roomId;
        SteadyClock::time_point lastSeen{};
        bool awaitingPong{false};
    };

    // Maps live connections to (room, participant) and tracks liveness.
    // Never calls back into rooms; callers act on what it returns.
    class ConnectionRegistry
    {
    public:
        void bind(std::shared_ptr<Connection> connection, std::string participantId, std::string roomId, SteadyClock::time_point now);

        // Removing a binding is the gate that makes disconnect handling run
        // once: only the caller that gets a value back owns the side effects.
        std::optional<ConnectionBinding> unbind(std::uint64_t connectionId);
        std::optional<ConnectionBinding> unbindParticipant(const std::string& roomId, const std::string& participantId);

        std::optional<ConnectionBinding> find(std::uint64_t connectionId) const;

        // Any pong or heartbeat from the peer.
        void touch(std::uint64_t connectionId, SteadyClock::time_point now);

        std::vector<std::shared_ptr<Connection>> connectionsInRoom(const std::string& roomId, const std::optional<std::string>& excludeParticipant) const;
        std::vector<std::shared_ptr<Connection>> allConnections() const;
        std::size_t size() const;

        struct SweepResult
        {
            std::vector<std::shared_ptr<Connection>> expired;
            std::vector<std::shared_ptr<Connection>> probe;
        };

        // Two-strike liveness policy. Connections silent for longer than
        // timeout, or that left the previous probe unanswered, are returned
        // as expired; every other connection is flagged as awaiting a pong
        // and returned for probing.
        SweepResult sweep(SteadyClock::time_point now, std::chrono::milliseconds timeout);

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::uint64_t, ConnectionBinding> bindings_;
    };
}
