#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "broadcast_engine.hpp"
#include "connection.hpp"
#include "connection_registry.hpp"
#include "periodic_task.hpp"
#include "race_protocol.hpp"
#include "race_schema.hpp"
#include "text_provider.hpp"

namespace typerace::server
{
    constexpr int countdown_start_phase = 3;

    struct RoomSummary
    {
        std::string id;
        RaceState state{RaceState::Waiting};
        std::size_t participantCount{0};
        std::size_t connectedCount{0};
        std::int64_t createdAtMs{0};
    };

    enum class JoinStatus
    {
        Joined,
        Rejoined,
        RoomFull,
        AlreadyStarted,
        Retired
    };

    struct JoinResult
    {
        JoinStatus status{JoinStatus::Joined};
        std::string participantName;
    };

    enum class ApplyStatus
    {
        Applied,
        Ignored,
        PlayerNotFound
    };

    // One race session. Every mutation, countdown ticks included, runs under
    // the room mutex. The registry lock is only ever taken inside it.
    class RaceRoom
    {
    public:
        RaceRoom(std::string id,
                 RoomSettings settings,
                 ConnectionRegistry& registry,
                 const BroadcastEngine& broadcaster,
                 ReferenceTextProvider& texts,
                 std::chrono::milliseconds countdownTick,
                 SteadyClock::time_point created);
        ~RaceRoom();

        RaceRoom(const RaceRoom&) = delete;
        RaceRoom& operator=(const RaceRoom&) = delete;

        const std::string& id() const noexcept { return id_; }
        const RoomSettings& settings() const noexcept { return settings_; }

        // Binds the connection and announces the participant. A participant
        // already known to the room takes over from its previous connection.
        JoinResult join(const std::shared_ptr<Connection>& connection, const JoinRequest& request, SteadyClock::time_point now);

        ApplyStatus setReady(const std::string& participantId, bool ready);
        ApplyStatus applyProgress(const TypingProgressEvent& progress);
        ApplyStatus applyFinish(const PlayerFinishedEvent& finish);

        // Runs the disconnect side effects if this call removed the binding.
        bool disconnect(std::uint64_t connectionId, std::string_view reason);

        // True when nobody is connected and the room is older than grace. A
        // retired room refuses joins so the caller can create a fresh one.
        bool retireIfIdle(SteadyClock::time_point now, std::chrono::milliseconds grace);

        // Retires the room and cancels the countdown. Must not be called with
        // the room lock held.
        void stop();

        RaceState state() const;
        RoomSummary summary() const;
        GameStateSyncEvent snapshot() const;
        std::optional<Participant> participant(const std::string& participantId) const;
        std::string referenceText() const;
        std::int64_t raceStartedAtMs() const;

    private:
        Participant* findLocked(const std::string& participantId);
        const Participant* findLocked(const std::string& participantId) const;
        std::size_t connectedCountLocked() const;
        GameStateSyncEvent snapshotLocked() const;

        void transitionLocked(RaceState next);
        void maybeStartCountdownLocked();
        void completeLocked();
        bool countdownTick();

        const std::string id_;
        const RoomSettings settings_;
        ConnectionRegistry& registry_;
        const BroadcastEngine& broadcaster_;
        ReferenceTextProvider& texts_;
        const std::chrono::milliseconds countdownTick_;
        const SteadyClock::time_point created_;
        const std::int64_t createdAtMs_;

        mutable std::mutex mutex_;
        std::vector<Participant> participants_;
        RaceState state_{RaceState::Waiting};
        std::string referenceText_;
        int phase_{countdown_start_phase};
        std::int64_t countdownStartedAtMs_{0};
        std::int64_t raceStartedAtMs_{0};
        std::int64_t raceFinishedAtMs_{0};
        bool retired_{false};

        PeriodicTask countdown_;
    };
}
