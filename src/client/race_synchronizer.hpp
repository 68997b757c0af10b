#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "race_schema.hpp"

namespace typerace::client
{
    constexpr std::int64_t max_reported_lag_ms = 1000;
    constexpr std::int64_t countdown_phase_ms = 1000;

    struct PredictedState
    {
        std::int64_t correct_chars{0};
        std::int64_t current_word_index{0};
        std::string current_word_input;
        std::vector<std::string> completed_words;
        std::int64_t timestamp_ms{0};
        bool confirmed{true};
    };

    struct PendingInput
    {
        std::int64_t sequence{0};
        std::int64_t estimated_server_ms{0};
        std::int64_t local_ms{0};
        std::string input;
        std::int64_t word_index{0};
    };

    struct CountdownView
    {
        int phase{0};
        std::int64_t time_remaining_ms{0};
    };

    // Last authoritative view of the room.
    struct ServerView
    {
        RaceState state{RaceState::Waiting};
        std::vector<Participant> players;
        std::string text_content;
        std::int64_t target_char_count{0};
        std::int64_t server_time_ms{0};
    };

    // Client-side prediction and reconciliation for one participant. Not
    // thread-safe; the owner serializes calls.
    class RaceSynchronizer
    {
    public:
        using Clock = std::function<std::int64_t()>;

        explicit RaceSynchronizer(std::string participantId, Clock clock = now_ms);

        // Records the input as pending and recomputes the predicted state from
        // it. The result is always unconfirmed.
        const PredictedState& predictiveUpdate(const std::string& input, std::int64_t wordIndex, const std::vector<std::string>& referenceWords);

        // Drops inputs up to ackSequence, then either confirms the prediction
        // (within one character and on the same word) or rebuilds it from the
        // snapshot and replays what is still pending.
        const PredictedState& reconcileWithServer(const Participant& snapshot, std::int64_t serverTimestamp, std::int64_t ackSequence);

        CountdownView syncCountdown(int phase, std::int64_t serverTimestamp);

        // Age of the oldest pending input, capped at max_reported_lag_ms.
        std::int64_t detectNetworkLag() const;

        void updateServerState(RaceState state, std::vector<Participant> players, std::int64_t serverTimestamp);
        void setRaceText(std::string text, std::int64_t targetCharCount);
        void setRoundTripTime(std::int64_t rttMs) noexcept { roundTripMs_ = rttMs < 0 ? 0 : rttMs; }
        void reset();

        const std::string& participantId() const noexcept { return participantId_; }
        const PredictedState& predictedState() const noexcept { return predicted_; }
        const std::deque<PendingInput>& pendingInputs() const noexcept { return pending_; }
        const ServerView& serverView() const noexcept { return server_; }
        std::int64_t lastConfirmedSequence() const noexcept { return lastConfirmedSequence_; }
        std::int64_t lastAssignedSequence() const noexcept { return nextSequence_ - 1; }
        std::int64_t clockOffset() const noexcept { return clockOffsetMs_; }
        std::int64_t roundTripTime() const noexcept { return roundTripMs_; }
        std::int64_t serverTime() const { return clock_() + clockOffsetMs_; }

    private:
        PredictedState computeState(const PredictedState& from, const std::string& input, std::int64_t wordIndex, const std::vector<std::string>& words) const;
        bool isPredictionAccurate(const Participant& snapshot) const noexcept;
        void updateClockOffset(std::int64_t serverTimestamp);

        std::string participantId_;
        Clock clock_;
        PredictedState predicted_;
        std::deque<PendingInput> pending_;
        std::vector<std::string> referenceWords_;
        ServerView server_;
        std::int64_t nextSequence_{0};
        std::int64_t lastConfirmedSequence_{-1};
        std::int64_t clockOffsetMs_{0};
        std::int64_t roundTripMs_{0};
    };
}
