#include "room_directory.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace typerace::server
{
    RoomDirectory::RoomDirectory(ConnectionRegistry& registry,
                                 const BroadcastEngine& broadcaster,
                                 ReferenceTextProvider& texts,
                                 RoomSettings defaults,
                                 std::chrono::milliseconds countdownTick)
        : registry_(registry)
        , broadcaster_(broadcaster)
        , texts_(texts)
        , defaults_(defaults)
        , countdownTick_(countdownTick)
    {
    }

    RoomDirectory::~RoomDirectory()
    {
        clear();
    }

    std::shared_ptr<RaceRoom> RoomDirectory::findOrCreate(const std::string& roomId, SteadyClock::time_point now)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = rooms_.find(roomId);
        if (it != rooms_.end())
        {
            return it->second;
        }

        auto room = std::make_shared<RaceRoom>(roomId, defaults_, registry_, broadcaster_, texts_, countdownTick_, now);
        rooms_.emplace(roomId, room);
        spdlog::info("[room {}] created (target {} chars, max {} participants)", roomId, defaults_.target_char_count, defaults_.max_participants);
        return room;
    }

    std::shared_ptr<RaceRoom> RoomDirectory::find(const std::string& roomId) const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = rooms_.find(roomId);
        if (it == rooms_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    std::vector<std::string> RoomDirectory::reap(SteadyClock::time_point now, std::chrono::milliseconds grace)
    {
        std::vector<std::shared_ptr<RaceRoom>> retired;

        {
            std::lock_guard<std::mutex> guard(mutex_);
            for (auto it = rooms_.begin(); it != rooms_.end();)
            {
                if (it->second->retireIfIdle(now, grace))
                {
                    retired.push_back(std::move(it->second));
                    it = rooms_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }

        std::vector<std::string> ids;
        ids.reserve(retired.size());
        for (auto& room : retired)
        {
            room->stop();
            ids.push_back(room->id());
            spdlog::info("[reaper] removed idle room {}", room->id());
        }
        return ids;
    }

    std::vector<RoomSummary> RoomDirectory::summaries() const
    {
        std::vector<std::shared_ptr<RaceRoom>> rooms;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            rooms.reserve(rooms_.size());
            for (const auto& [id, room] : rooms_)
            {
                rooms.push_back(room);
            }
        }

        std::vector<RoomSummary> result;
        result.reserve(rooms.size());
        for (const auto& room : rooms)
        {
            result.push_back(room->summary());
        }
        return result;
    }

    std::size_t RoomDirectory::size() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return rooms_.size();
    }

    void RoomDirectory::clear()
    {
        std::map<std::string, std::shared_ptr<RaceRoom>> rooms;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            rooms.swap(rooms_);
        }

        for (auto& [id, room] : rooms)
        {
            room->stop();
        }
    }
}
