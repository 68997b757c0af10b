#include "race_room.hpp"

#include <spdlog/spdlog.h>

#include "websocket_codec.hpp"

#include <algorithm>
#include <utility>

namespace typerace::server
{
    RaceRoom::RaceRoom(std::string id,
                       RoomSettings settings,
                       ConnectionRegistry& registry,
                       const BroadcastEngine& broadcaster,
                       ReferenceTextProvider& texts,
                       std::chrono::milliseconds countdownTick,
                       SteadyClock::time_point created)
        : id_(std::move(id))
        , settings_(settings)
        , registry_(registry)
        , broadcaster_(broadcaster)
        , texts_(texts)
        , countdownTick_(countdownTick)
        , created_(created)
        , createdAtMs_(now_ms())
    {
    }

    RaceRoom::~RaceRoom()
    {
        stop();
    }

    JoinResult RaceRoom::join(const std::shared_ptr<Connection>& connection, const JoinRequest& request, SteadyClock::time_point now)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (retired_)
        {
            return {JoinStatus::Retired, {}};
        }

        JoinStatus status = JoinStatus::Joined;
        Participant* participant = findLocked(request.participantId);

        if (participant)
        {
            auto superseded = registry_.unbindParticipant(id_, request.participantId);
            if (superseded && superseded->connection && superseded->connection->id() != connection->id())
            {
                spdlog::info("[room {}] {} reconnected; closing previous connection {}", id_, request.participantId, superseded->connection->id());
                superseded->connection->close(ws::close_code::normal, "superseded by a new connection");
            }

            participant->connected = true;
            if (request.displayName && !request.displayName->empty())
            {
                participant->name = *request.displayName;
            }
            status = JoinStatus::Rejoined;
        }
        else
        {
            if (participants_.size() >= settings_.max_participants)
            {
                spdlog::info("[room {}] rejecting {}: room full ({}/{})", id_, request.participantId, participants_.size(), settings_.max_participants);
                return {JoinStatus::RoomFull, {}};
            }

            if (state_ != RaceState::Waiting)
            {
                spdlog::info("[room {}] rejecting {}: race is {}", id_, request.participantId, to_string(state_));
                return {JoinStatus::AlreadyStarted, {}};
            }

            std::string name = request.displayName && !request.displayName->empty()
                ? *request.displayName
                : "Player " + std::to_string(participants_.size() + 1);
            participants_.push_back(make_participant(request.participantId, std::move(name)));
            participant = &participants_.back();
        }

        registry_.bind(connection, participant->id, id_, now);

        spdlog::info("[room {}] {} ({}) {} from {}", id_, participant->name, participant->id,
                     status == JoinStatus::Rejoined ? "rejoined" : "joined", connection->remoteAddress());

        const auto timestamp = now_ms();
        broadcaster_.broadcast(id_, PlayerJoinEvent{participant->id, participant->name, timestamp}, participant->id);
        broadcaster_.sendTo(*connection, snapshotLocked());

        return {status, participant->name};
    }

    ApplyStatus RaceRoom::setReady(const std::string& participantId, bool ready)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Participant* participant = findLocked(participantId);
        if (!participant)
        {
            return ApplyStatus::PlayerNotFound;
        }

        if (state_ != RaceState::Waiting)
        {
            spdlog::debug("[room {}] ignoring ready from {} while {}", id_, participantId, to_string(state_));
            return ApplyStatus::Ignored;
        }

        participant->ready = ready;
        broadcaster_.broadcast(id_, PlayerReadyEvent{participantId, ready, now_ms()});

        maybeStartCountdownLocked();
        return ApplyStatus::Applied;
    }

    ApplyStatus RaceRoom::applyProgress(const TypingProgressEvent& progress)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Participant* participant = findLocked(progress.player_id);
        if (!participant)
        {
            return ApplyStatus::PlayerNotFound;
        }

        if (state_ != RaceState::Active)
        {
            spdlog::debug("[room {}] ignoring progress from {} while {}", id_, progress.player_id, to_string(state_));
            return ApplyStatus::Ignored;
        }

        // Last write wins; the sequence number is only echoed back as an ack.
        participant->correct_chars = progress.correct_chars;
        participant->current_word_index = progress.current_word_index;
        participant->completed_words = progress.completed_words;
        participant->current_word_input = progress.current_word_input;
        participant->wpm = progress.wpm;
        participant->accuracy = progress.accuracy;
        if (progress.sequence)
        {
            participant->ack_sequence = *progress.sequence;
        }

        if (participant->correct_chars >= settings_.target_char_count && !participant->finished)
        {
            const auto now = now_ms();
            participant->finished = true;
            participant->finish_time_ms = now - raceStartedAtMs_;

            FinalStats stats;
            stats.correct_chars = participant->correct_chars;
            stats.wpm = participant->wpm;
            stats.accuracy = participant->accuracy;
            stats.finish_time_ms = *participant->finish_time_ms;

            spdlog::info("[room {}] {} finished in {} ms ({:.0f} wpm)", id_, participant->id, stats.finish_time_ms, stats.wpm);
            broadcaster_.broadcast(id_, PlayerFinishedEvent{participant->id, stats, now});

            completeLocked();
        }
        else
        {
            broadcaster_.broadcast(id_, progress, progress.player_id);
        }

        return ApplyStatus::Applied;
    }

    ApplyStatus RaceRoom::applyFinish(const PlayerFinishedEvent& finish)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Participant* participant = findLocked(finish.player_id);
        if (!participant)
        {
            return ApplyStatus::PlayerNotFound;
        }

        if (state_ == RaceState::Waiting || state_ == RaceState::Countdown)
        {
            spdlog::debug("[room {}] ignoring finish from {} while {}", id_, finish.player_id, to_string(state_));
            return ApplyStatus::Ignored;
        }

        if (participant->finished)
        {
            spdlog::debug("[room {}] {} already finished", id_, finish.player_id);
            return ApplyStatus::Ignored;
        }

        participant->finished = true;
        participant->finish_time_ms = finish.final_stats.finish_time_ms;
        participant->correct_chars = finish.final_stats.correct_chars;
        participant->wpm = finish.final_stats.wpm;
        participant->accuracy = finish.final_stats.accuracy;

        spdlog::info("[room {}] {} reported finish at {} ms", id_, finish.player_id, finish.final_stats.finish_time_ms);
        broadcaster_.broadcast(id_, finish, finish.player_id);

        completeLocked();
        return ApplyStatus::Applied;
    }

    bool RaceRoom::disconnect(std::uint64_t connectionId, std::string_view reason)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto binding = registry_.unbind(connectionId);
        if (!binding)
        {
            return false;
        }

        Participant* participant = findLocked(binding->participantId);
        if (!participant)
        {
            spdlog::debug("[room {}] connection {} closed for unknown participant {}", id_, connectionId, binding->participantId);
            return true;
        }

        spdlog::info("[room {}] {} disconnected ({})", id_, participant->id, reason);

        participant->connected = false;
        broadcaster_.broadcast(id_, PlayerLeaveEvent{participant->id, now_ms()}, participant->id);

        if (state_ == RaceState::Active && connectedCountLocked() < 2)
        {
            transitionLocked(RaceState::Paused);
            broadcaster_.broadcast(id_, snapshotLocked());
        }

        if (state_ == RaceState::Waiting)
        {
            const auto leaving = participant->id;
            participants_.erase(std::remove_if(participants_.begin(), participants_.end(),
                                               [&leaving](const Participant& p) { return p.id == leaving; }),
                                participants_.end());
        }

        return true;
    }

    bool RaceRoom::retireIfIdle(SteadyClock::time_point now, std::chrono::milliseconds grace)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (retired_)
        {
            return true;
        }
        if (connectedCountLocked() > 0 || now - created_ <= grace)
        {
            return false;
        }

        retired_ = true;
        return true;
    }

    void RaceRoom::stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            retired_ = true;
        }
        countdown_.stop();
    }

    RaceState RaceRoom::state() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    RoomSummary RaceRoom::summary() const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        RoomSummary result;
        result.id = id_;
        result.state = state_;
        result.participantCount = participants_.size();
        result.connectedCount = connectedCountLocked();
        result.createdAtMs = createdAtMs_;
        return result;
    }

    GameStateSyncEvent RaceRoom::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshotLocked();
    }

    std::optional<Participant> RaceRoom::participant(const std::string& participantId) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Participant* found = findLocked(participantId);
        if (!found)
        {
            return std::nullopt;
        }
        return *found;
    }

    std::string RaceRoom::referenceText() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return referenceText_;
    }

    std::int64_t RaceRoom::raceStartedAtMs() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return raceStartedAtMs_;
    }

    Participant* RaceRoom::findLocked(const std::string& participantId)
    {
        auto it = std::find_if(participants_.begin(), participants_.end(),
                               [&participantId](const Participant& p) { return p.id == participantId; });
        return it == participants_.end() ? nullptr : &*it;
    }

    const Participant* RaceRoom::findLocked(const std::string& participantId) const
    {
        auto it = std::find_if(participants_.begin(), participants_.end(),
                               [&participantId](const Participant& p) { return p.id == participantId; });
        return it == participants_.end() ? nullptr : &*it;
    }

    std::size_t RaceRoom::connectedCountLocked() const
    {
        return static_cast<std::size_t>(std::count_if(participants_.begin(), participants_.end(),
                                                      [](const Participant& p) { return p.connected; }));
    }

    GameStateSyncEvent RaceRoom::snapshotLocked() const
    {
        GameStateSyncEvent event;
        event.game_state = state_;
        event.players = participants_;
        event.timestamp = now_ms();
        return event;
    }

    void RaceRoom::transitionLocked(RaceState next)
    {
        spdlog::info("[room {}] {} -> {}", id_, to_string(state_), to_string(next));
        state_ = next;
    }

    void RaceRoom::maybeStartCountdownLocked()
    {
        if (state_ != RaceState::Waiting || participants_.size() < 2)
        {
            return;
        }

        const bool allReady = std::all_of(participants_.begin(), participants_.end(),
                                          [](const Participant& p) { return p.ready; });
        if (!allReady)
        {
            return;
        }

        referenceText_ = texts_.nextText();
        countdownStartedAtMs_ = now_ms();
        phase_ = countdown_start_phase;
        transitionLocked(RaceState::Countdown);
        broadcaster_.broadcast(id_, snapshotLocked());

        if (!countdown_.start("countdown " + id_, countdownTick_, [this]() { return countdownTick(); }))
        {
            spdlog::error("[room {}] countdown task already running", id_);
        }
    }

    void RaceRoom::completeLocked()
    {
        if (state_ != RaceState::Active)
        {
            return;
        }

        raceFinishedAtMs_ = now_ms();
        transitionLocked(RaceState::Finished);
        spdlog::info("[room {}] race finished after {} ms", id_, raceFinishedAtMs_ - raceStartedAtMs_);
        broadcaster_.broadcast(id_, snapshotLocked());
    }

    bool RaceRoom::countdownTick()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != RaceState::Countdown || retired_)
        {
            return false;
        }

        const auto now = now_ms();
        broadcaster_.broadcast(id_, CountdownSyncEvent{phase_, now, now});

        --phase_;
        if (phase_ >= 0)
        {
            return true;
        }

        raceStartedAtMs_ = now_ms();
        transitionLocked(RaceState::Active);
        spdlog::debug("[room {}] countdown took {} ms", id_, raceStartedAtMs_ - countdownStartedAtMs_);

        broadcaster_.broadcast(id_, GameStartEvent{referenceText_, settings_.target_char_count, raceStartedAtMs_});
        broadcaster_.broadcast(id_, snapshotLocked());
        return false;
    }
}
