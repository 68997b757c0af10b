#pragma once

#include <optional>
#include <string>

#include "connection.hpp"
#include "connection_registry.hpp"
#include "race_protocol.hpp"

namespace typerace::server
{
    // Fan-out of events to the connections bound to a room. Fire-and-forget:
    // nothing is returned, retried or acknowledged.
    class BroadcastEngine
    {
    public:
        explicit BroadcastEngine(const ConnectionRegistry& registry);

        void broadcast(const std::string& roomId, const Event& event, const std::optional<std::string>& excludeParticipant = std::nullopt) const;
        void sendTo(Connection& connection, const Event& event) const;

    private:
        const ConnectionRegistry& registry_;
    };
}
