#include "connection_registry.hpp"

#include <utility>

namespace typerace::server
{
    void ConnectionRegistry::bind(std::shared_ptr<Connection> connection, std::string participantId, std::string roomId, SteadyClock::time_point now)
    {
        const auto id = connection->id();

        ConnectionBinding binding;
        binding.connection = std::move(connection);
        binding.participantId = std::move(participantId);
        binding.roomId = std::move(roomId);
        binding.lastSeen = now;

        std::lock_guard<std::mutex> guard(mutex_);
        bindings_[id] = std::move(binding);
    }

    std::optional<ConnectionBinding> ConnectionRegistry::unbind(std::uint64_t connectionId)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = bindings_.find(connectionId);
        if (it == bindings_.end())
        {
            return std::nullopt;
        }

        ConnectionBinding binding = std::move(it->second);
        bindings_.erase(it);
        return binding;
    }

    std::optional<ConnectionBinding> ConnectionRegistry::unbindParticipant(const std::string& roomId, const std::string& participantId)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        for (auto it = bindings_.begin(); it != bindings_.end(); ++it)
        {
            if (it->second.roomId == roomId && it->second.participantId == participantId)
            {
                ConnectionBinding binding = std::move(it->second);
                bindings_.erase(it);
                return binding;
            }
        }
        return std::nullopt;
    }

    std::optional<ConnectionBinding> ConnectionRegistry::find(std::uint64_t connectionId) const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = bindings_.find(connectionId);
        if (it == bindings_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void ConnectionRegistry::touch(std::uint64_t connectionId, SteadyClock::time_point now)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = bindings_.find(connectionId);
        if (it != bindings_.end())
        {
            it->second.lastSeen = now;
            it->second.awaitingPong = false;
        }
    }

    std::vector<std::shared_ptr<Connection>> ConnectionRegistry::connectionsInRoom(const std::string& roomId, const std::optional<std::string>& excludeParticipant) const
    {
        std::vector<std::shared_ptr<Connection>> result;

        std::lock_guard<std::mutex> guard(mutex_);
        for (const auto& [id, binding] : bindings_)
        {
            if (binding.roomId != roomId)
            {
                continue;
            }
            if (excludeParticipant.has_value() && binding.participantId == *excludeParticipant)
            {
                continue;
            }
            result.push_back(binding.connection);
        }
        return result;
    }

    std::vector<std::shared_ptr<Connection>> ConnectionRegistry::allConnections() const
    {
        std::vector<std::shared_ptr<Connection>> result;

        std::lock_guard<std::mutex> guard(mutex_);
        result.reserve(bindings_.size());
        for (const auto& [id, binding] : bindings_)
        {
            result.push_back(binding.connection);
        }
        return result;
    }

    std::size_t ConnectionRegistry::size() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return bindings_.size();
    }

    ConnectionRegistry::SweepResult ConnectionRegistry::sweep(SteadyClock::time_point now, std::chrono::milliseconds timeout)
    {
        SweepResult result;

        std::lock_guard<std::mutex> guard(mutex_);
        for (auto& [id, binding] : bindings_)
        {
            if (now - binding.lastSeen > timeout || binding.awaitingPong)
            {
                result.expired.push_back(binding.connection);
                continue;
            }

            binding.awaitingPong = true;
            result.probe.push_back(binding.connection);
        }
        return result;
    }
}
