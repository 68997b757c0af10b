#include "race_session.hpp"
#include "race_synchronizer.hpp"

#include "test_harness.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{
    using typerace::testing::expect;
    using typerace::testing::run_case;

    using typerace::Participant;
    using typerace::RaceState;
    using typerace::client::RaceSession;
    using typerace::client::RaceSynchronizer;

    const std::vector<std::string> words{"the", "quick", "brown", "fox"};

    struct ManualClock
    {
        std::shared_ptr<std::int64_t> now = std::make_shared<std::int64_t>(1000);

        RaceSynchronizer::Clock fn() const
        {
            auto shared = now;
            return [shared]() { return *shared; };
        }

        void advance(std::int64_t ms) { *now += ms; }
    };

    Participant snapshot_of(const std::string& id, std::int64_t correctChars, std::int64_t wordIndex, std::string input = {},
                            std::vector<std::string> completed = {}, std::int64_t ack = -1)
    {
        Participant participant = typerace::make_participant(id, id);
        participant.correct_chars = correctChars;
        participant.current_word_index = wordIndex;
        participant.current_word_input = std::move(input);
        participant.completed_words = std::move(completed);
        participant.ack_sequence = ack;
        return participant;
    }

    class RecordingListener : public typerace::client::RaceEventListener
    {
    public:
        void onPredictedState(const typerace::client::PredictedState& state) override { predictions.push_back(state); }
        void onGameStart(const std::string& text, std::int64_t) override { startedWith = text; }
        void onError(const std::string&, typerace::ErrorCode code) override { errors.push_back(code); }
        void onPlayerLeave(const std::string& id) override { left.push_back(id); }

        std::vector<typerace::client::PredictedState> predictions;
        std::string startedWith;
        std::vector<typerace::ErrorCode> errors;
        std::vector<std::string> left;
    };

    typerace::client::TransportConfig offline_transport()
    {
        typerace::client::TransportConfig config;
        config.port = 1;
        return config;
    }
}

int main()
{
    int failures = 0;

    run_case("predictive update scores completed words and the current word", []() {
        ManualClock clock;
        RaceSynchronizer sync("p1", clock.fn());

        auto state = sync.predictiveUpdate("th", 0, words);
        expect(state.correct_chars == 2 && !state.confirmed, "partial first word");

        state = sync.predictiveUpdate("", 1, words);
        expect(state.completed_words.size() == 1 && state.completed_words[0] == "the", "word index increase completes the word");
        expect(state.correct_chars == 4, "completed word counts its length plus the separator");

        state = sync.predictiveUpdate("qxi", 1, words);
        expect(state.correct_chars == 6, "only matching positions of the current word count");

        state = sync.predictiveUpdate("", 3, words);
        expect(state.completed_words.size() == 3 && state.correct_chars == 4 + 6 + 6, "skipping ahead completes every passed word");

        state = sync.predictiveUpdate("t", 0, words);
        expect(state.completed_words.empty() && state.correct_chars == 1, "moving back truncates the completed list");

        expect(sync.pendingInputs().size() == 5, "every input stays pending");
        expect(sync.lastAssignedSequence() == 4, "sequence numbers increase by one");
    }, failures);

    run_case("reconcile confirms an accurate prediction", []() {
        ManualClock clock;
        RaceSynchronizer sync("p1", clock.fn());
        sync.predictiveUpdate("th", 0, words);
        sync.predictiveUpdate("the", 0, words);
        sync.predictiveUpdate("", 1, words);

        const auto state = sync.reconcileWithServer(snapshot_of("p1", 3, 1), 5000, 1);
        expect(state.confirmed, "within one character on the same word confirms");
        expect(state.correct_chars == 4, "confirmed prediction is kept as is");
        expect(sync.pendingInputs().size() == 1 && sync.pendingInputs().front().sequence == 2, "acknowledged inputs dropped");
        expect(sync.lastConfirmedSequence() == 1, "ack recorded");
    }, failures);

    run_case("reconcile replays pending input over a divergent snapshot", []() {
        ManualClock clock;
        RaceSynchronizer sync("p1", clock.fn());
        sync.predictiveUpdate("th", 0, words);
        sync.predictiveUpdate("", 1, words);
        sync.predictiveUpdate("qu", 1, words);

        const auto state = sync.reconcileWithServer(snapshot_of("p1", 1, 0, "t"), 5000, 0);
        expect(!state.confirmed, "corrected state is unconfirmed");
        expect(state.current_word_index == 1 && state.current_word_input == "qu", "pending input replayed");
        expect(state.correct_chars == 6, "replayed score");
        expect(sync.pendingInputs().size() == 2, "unacknowledged inputs remain");

        const auto adopted = sync.reconcileWithServer(snapshot_of("p1", 9, 1, "quick", {"the"}), 5100, 2);
        expect(sync.pendingInputs().empty(), "everything acknowledged");
        expect(adopted.correct_chars == 9 && adopted.current_word_input == "quick", "authoritative state adopted when nothing is pending");
    }, failures);

    run_case("clock offset uses half the round trip", []() {
        ManualClock clock;
        RaceSynchronizer sync("p1", clock.fn());
        sync.setRoundTripTime(100);
        sync.updateServerState(RaceState::Waiting, {}, 5000);

        expect(sync.clockOffset() == 4050, "offset = server + rtt/2 - local");
        clock.advance(10);
        expect(sync.serverTime() == 5060, "server time follows the local clock");
        expect(sync.serverView().server_time_ms == 5000, "last authoritative timestamp kept");
    }, failures);

    run_case("countdown display compensates for transit time", []() {
        ManualClock clock;
        RaceSynchronizer sync("p1", clock.fn());

        auto view = sync.syncCountdown(3, 1000);
        expect(view.phase == 3 && view.time_remaining_ms == 1000, "no delay means a full phase");

        sync.setRoundTripTime(400);
        view = sync.syncCountdown(2, 9000);
        expect(view.phase == 2 && view.time_remaining_ms == 800, "one-way delay is subtracted");

        sync.setRoundTripTime(2400);
        view = sync.syncCountdown(2, 9000);
        expect(view.phase == 1 && view.time_remaining_ms == 800, "delays beyond a phase move the display on");
    }, failures);

    run_case("network lag is the age of the oldest pending input", []() {
        ManualClock clock;
        RaceSynchronizer sync("p1", clock.fn());
        expect(sync.detectNetworkLag() == 0, "no pending input means no lag");

        sync.predictiveUpdate("t", 0, words);
        clock.advance(300);
        sync.predictiveUpdate("th", 0, words);
        expect(sync.detectNetworkLag() == 300, "oldest input age");

        clock.advance(5000);
        expect(sync.detectNetworkLag() == 1000, "lag is capped");
    }, failures);

    run_case("reset restores the initial prediction", []() {
        ManualClock clock;
        RaceSynchronizer sync("p1", clock.fn());
        sync.setRaceText("the quick brown fox", 19);
        sync.predictiveUpdate("the", 0, words);
        sync.reset();

        expect(sync.predictedState().correct_chars == 0 && sync.predictedState().confirmed, "prediction cleared");
        expect(sync.pendingInputs().empty(), "pending cleared");
        expect(sync.lastAssignedSequence() == -1 && sync.lastConfirmedSequence() == -1, "sequences cleared");
    }, failures);

    run_case("session ignores typing until the race is active", []() {
        ManualClock clock;
        RecordingListener listener;
        RaceSession session(offline_transport(), listener, "p1", clock.fn());

        session.handleTyping("th", 0);
        expect(listener.predictions.empty(), "typing while waiting is ignored");

        session.onEvent(typerace::GameStartEvent{"the quick brown fox", 19, 1000});
        expect(listener.startedWith == "the quick brown fox", "game start forwarded");
        expect(session.view().state == RaceState::Active, "game start activates the session");

        clock.advance(12000);
        session.handleTyping("", 1);
        expect(listener.predictions.size() == 1 && listener.predictions[0].correct_chars == 4, "prediction published");
        expect(session.view().wpm == 4.0, "wpm derived from the local start time");
        expect(session.view().accuracy == 100.0, "no mistakes in an empty word");

        session.handleTyping("qa", 1, typerace::client::TypingStats{55.0, 91.0});
        expect(session.view().wpm == 55.0 && session.view().accuracy == 91.0, "explicit stats win");
    }, failures);

    run_case("session reconciles its own participant from snapshots", []() {
        ManualClock clock;
        RecordingListener listener;
        RaceSession session(offline_transport(), listener, "p1", clock.fn());

        session.onEvent(typerace::GameStartEvent{"the quick brown fox", 19, 1000});
        session.handleTyping("the", 0);
        session.handleTyping("", 1);

        typerace::GameStateSyncEvent sync;
        sync.game_state = RaceState::Active;
        sync.players = {snapshot_of("p1", 4, 1, "", {"the"}, 1), snapshot_of("p2", 7, 1)};
        sync.timestamp = 1500;
        session.onEvent(sync);

        expect(listener.predictions.back().confirmed, "matching snapshot confirms the prediction");
        expect(session.view().players.size() == 2, "room view replaced from the snapshot");
        expect(session.playerProgress("p2") > 36.0 && session.playerProgress("p2") < 37.0, "progress against the target");
        expect(session.networkLag() == 0, "nothing left pending");

        session.onEvent(typerace::PlayerLeaveEvent{"p2", 1600});
        expect(listener.left.size() == 1 && session.view().players.count("p2") == 0, "leave removes the participant");

        session.onEvent(typerace::make_error_event("Player not found: ghost", typerace::ErrorCode::PlayerNotFound));
        expect(listener.errors.size() == 1 && listener.errors[0] == typerace::ErrorCode::PlayerNotFound, "server errors forwarded");
    }, failures);

    run_case("session reset clears local progress only", []() {
        ManualClock clock;
        RecordingListener listener;
        RaceSession session(offline_transport(), listener, "p1", clock.fn());

        session.onEvent(typerace::GameStartEvent{"the quick brown fox", 19, 1000});
        session.handleTyping("the", 0);
        session.resetGame();

        expect(session.predictedState().correct_chars == 0, "prediction cleared");
        expect(session.view().textContent == "the quick brown fox", "race text kept");
        expect(!session.view().startedAtMs.has_value(), "local start time cleared");

        session.handleTyping("th", 0);
        expect(listener.predictions.back().correct_chars == 2, "typing scores against the kept text");
    }, failures);

    if (failures == 0)
    {
        std::cout << "All synchronizer tests passed\n";
    }
    else
    {
        std::cerr << failures << " synchronizer test(s) failed\n";
    }

    return failures == 0 ? 0 : 1;
}
