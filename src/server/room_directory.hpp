#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "race_room.hpp"

namespace typerace::server
{
    // Owns every room by id. Rooms appear on first join and leave only
    // through reap() or clear().
    class RoomDirectory
    {
    public:
        RoomDirectory(ConnectionRegistry& registry,
                      const BroadcastEngine& broadcaster,
                      ReferenceTextProvider& texts,
                      RoomSettings defaults,
                      std::chrono::milliseconds countdownTick);
        ~RoomDirectory();

        RoomDirectory(const RoomDirectory&) = delete;
        RoomDirectory& operator=(const RoomDirectory&) = delete;

        std::shared_ptr<RaceRoom> findOrCreate(const std::string& roomId, SteadyClock::time_point now);
        std::shared_ptr<RaceRoom> find(const std::string& roomId) const;

        // Removes rooms with nobody connected once they are older than grace.
        // Returns the ids removed.
        std::vector<std::string> reap(SteadyClock::time_point now, std::chrono::milliseconds grace);

        std::vector<RoomSummary> summaries() const;
        std::size_t size() const;
        void clear();

    private:
        ConnectionRegistry& registry_;
        const BroadcastEngine& broadcaster_;
        ReferenceTextProvider& texts_;
        const RoomSettings defaults_;
        const std::chrono::milliseconds countdownTick_;

        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<RaceRoom>> rooms_;
    };
}
