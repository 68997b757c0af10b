#include "broadcast_engine.hpp"

#include <spdlog/spdlog.h>

namespace typerace::server
{
    BroadcastEngine::BroadcastEngine(const ConnectionRegistry& registry)
        : registry_(registry)
    {
    }

    void BroadcastEngine::broadcast(const std::string& roomId, const Event& event, const std::optional<std::string>& excludeParticipant) const
    {
        const auto serialized = encode_event(event);
        const auto targets = registry_.connectionsInRoom(roomId, excludeParticipant);

        std::size_t delivered = 0;
        for (const auto& connection : targets)
        {
            if (!connection->isOpen())
            {
                continue;
            }
            connection->sendText(serialized);
            ++delivered;
        }

        spdlog::trace("[room {}] {} sent to {}/{} connections", roomId, event_type(event), delivered, targets.size());
    }

    void BroadcastEngine::sendTo(Connection& connection, const Event& event) const
    {
        if (!connection.isOpen())
        {
            spdlog::debug("[ws] dropping {} for closed connection {}", event_type(event), connection.id());
            return;
        }
        connection.sendText(encode_event(event));
    }
}
