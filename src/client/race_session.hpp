#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "identifiers.hpp"
#include "race_protocol.hpp"
#include "race_synchronizer.hpp"
#include "race_transport.hpp"

namespace typerace::client
{
    // Presentation callbacks. Every handler has an empty default so a view only
    // overrides what it renders. Called on the transport's reader thread.
    class RaceEventListener
    {
    public:
        virtual ~RaceEventListener() = default;

        virtual void onPlayerJoin(const Participant&) {}
        virtual void onPlayerLeave(const std::string&) {}
        virtual void onPlayerReady(const std::string&, bool) {}
        virtual void onGameStart(const std::string&, std::int64_t) {}
        virtual void onCountdown(const CountdownView&) {}
        virtual void onTypingProgress(const std::string&, const Participant&) {}
        virtual void onPlayerFinished(const std::string&, const FinalStats&) {}
        virtual void onGameStateSync(RaceState, const std::vector<Participant>&) {}
        virtual void onPredictedState(const PredictedState&) {}
        virtual void onConnectionChanged(ConnectionStatus) {}
        virtual void onError(const std::string&, ErrorCode) {}
    };

    struct TypingStats
    {
        double wpm{0.0};
        double accuracy{100.0};
    };

    // What the local player sees: the room as last reported plus the local
    // prediction for the player's own progress.
    struct SessionView
    {
        ConnectionStatus status{ConnectionStatus::Disconnected};
        RaceState state{RaceState::Waiting};
        std::map<std::string, Participant> players;
        std::string textContent;
        std::int64_t targetCharCount{0};
        std::optional<std::int64_t> startedAtMs;
        std::optional<CountdownView> countdown;
        double wpm{0.0};
        double accuracy{100.0};
    };

    class RaceSession : public TransportListener
    {
    public:
        RaceSession(TransportConfig config, RaceEventListener& listener, std::string participantId = generate_participant_id(),
                    RaceSynchronizer::Clock clock = now_ms);
        ~RaceSession() override;

        RaceSession(const RaceSession&) = delete;
        RaceSession& operator=(const RaceSession&) = delete;

        bool connect(const std::string& roomId, std::optional<std::string> displayName = std::nullopt);
        void disconnect();

        // Only sent while connected.
        void setReady(bool ready);

        // Ignored unless the race is active. Without stats, wpm and accuracy
        // are derived from the prediction and the local race start time.
        void handleTyping(const std::string& input, std::int64_t wordIndex, std::optional<TypingStats> stats = std::nullopt);

        // Clears local progress; the room itself is untouched.
        void resetGame();

        const std::string& participantId() const noexcept { return participantId_; }
        ConnectionStatus status() const { return transport_.status(); }
        SessionView view() const;
        PredictedState predictedState() const;
        double playerProgress(const std::string& participantId) const;
        std::int64_t networkLag() const;

        void onEvent(const Event& event) override;
        void onStatusChanged(ConnectionStatus status) override;
        void onTransportError(const std::string& message, ErrorCode code) override;
        void onRoundTrip(std::int64_t rttMs) override;

    private:
        RaceEventListener& listener_;
        std::string participantId_;
        RaceSynchronizer::Clock clock_;

        mutable std::mutex mutex_;
        RaceSynchronizer sync_;
        SessionView view_;
        std::vector<std::string> referenceWords_;

        RaceTransport transport_;
    };
}
