#include "race_session.hpp"

#include "typing_metrics.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>
#include <utility>
#include <variant>

namespace typerace::client
{
    RaceSession::RaceSession(TransportConfig config, RaceEventListener& listener, std::string participantId, RaceSynchronizer::Clock clock)
        : listener_(listener)
        , participantId_(std::move(participantId))
        , clock_(std::move(clock))
        , sync_(participantId_, clock_)
        , transport_(std::move(config), *this)
    {
    }

    RaceSession::~RaceSession()
    {
        transport_.disconnect();
    }

    bool RaceSession::connect(const std::string& roomId, std::optional<std::string> displayName)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            view_ = SessionView{};
            referenceWords_.clear();
            sync_.reset();
        }
        return transport_.connect(roomId, participantId_, std::move(displayName));
    }

    void RaceSession::disconnect()
    {
        transport_.disconnect();
    }

    void RaceSession::setReady(bool ready)
    {
        if (transport_.status() != ConnectionStatus::Connected)
        {
            spdlog::debug("[client] ready toggle dropped while {}", to_string(transport_.status()));
            return;
        }

        transport_.send(PlayerReadyEvent{participantId_, ready, clock_()});
    }

    void RaceSession::handleTyping(const std::string& input, std::int64_t wordIndex, std::optional<TypingStats> stats)
    {
        PredictedState predicted;
        TypingProgressEvent progress;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (view_.state != RaceState::Active)
            {
                spdlog::debug("[client] typing ignored while {}", to_string(view_.state));
                return;
            }

            predicted = sync_.predictiveUpdate(input, wordIndex, referenceWords_);

            if (!stats)
            {
                const auto elapsed = view_.startedAtMs ? clock_() - *view_.startedAtMs : 0;

                auto mistakes = static_cast<std::int64_t>(input.size());
                if (wordIndex >= 0 && wordIndex < static_cast<std::int64_t>(referenceWords_.size()))
                {
                    mistakes -= count_matching_chars(input, referenceWords_[static_cast<std::size_t>(wordIndex)]);
                }

                stats = TypingStats{calculate_wpm(predicted.correct_chars, elapsed),
                                    calculate_accuracy(predicted.correct_chars, predicted.correct_chars + mistakes)};
            }
            view_.wpm = stats->wpm;
            view_.accuracy = stats->accuracy;

            progress.player_id = participantId_;
            progress.correct_chars = predicted.correct_chars;
            progress.current_word_index = predicted.current_word_index;
            progress.completed_words = predicted.completed_words;
            progress.current_word_input = predicted.current_word_input;
            progress.wpm = stats->wpm;
            progress.accuracy = stats->accuracy;
            progress.sequence = sync_.lastAssignedSequence();
            progress.timestamp = clock_();
        }

        transport_.send(progress);
        listener_.onPredictedState(predicted);
    }

    void RaceSession::resetGame()
    {
        PredictedState predicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sync_.reset();
            if (!view_.textContent.empty())
            {
                sync_.setRaceText(view_.textContent, view_.targetCharCount);
            }
            view_.startedAtMs.reset();
            view_.countdown.reset();
            view_.wpm = 0.0;
            view_.accuracy = 100.0;
            predicted = sync_.predictedState();
        }
        listener_.onPredictedState(predicted);
    }

    SessionView RaceSession::view() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return view_;
    }

    PredictedState RaceSession::predictedState() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sync_.predictedState();
    }

    double RaceSession::playerProgress(const std::string& participantId) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = view_.players.find(participantId);
        if (it == view_.players.end())
        {
            return 0.0;
        }
        return progress_percent(it->second.correct_chars, view_.targetCharCount);
    }

    std::int64_t RaceSession::networkLag() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sync_.detectNetworkLag();
    }

    void RaceSession::onEvent(const Event& event)
    {
        std::visit([&](const auto& message) {
            using T = std::decay_t<decltype(message)>;

            if constexpr (std::is_same_v<T, PlayerJoinEvent>)
            {
                Participant joined;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    auto [it, inserted] = view_.players.try_emplace(message.player_id, make_participant(message.player_id, message.player_name));
                    if (!inserted)
                    {
                        it->second.name = message.player_name;
                        it->second.connected = true;
                    }
                    joined = it->second;
                }
                listener_.onPlayerJoin(joined);
            }
            else if constexpr (std::is_same_v<T, PlayerLeaveEvent>)
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    view_.players.erase(message.player_id);
                }
                listener_.onPlayerLeave(message.player_id);
            }
            else if constexpr (std::is_same_v<T, PlayerReadyEvent>)
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    const auto it = view_.players.find(message.player_id);
                    if (it != view_.players.end())
                    {
                        it->second.ready = message.is_ready;
                    }
                }
                listener_.onPlayerReady(message.player_id, message.is_ready);
            }
            else if constexpr (std::is_same_v<T, GameStartEvent>)
            {
                std::size_t wordCount = 0;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    sync_.setRaceText(message.text_content, message.target_char_count);
                    referenceWords_ = split_words(message.text_content);
                    view_.state = RaceState::Active;
                    view_.textContent = message.text_content;
                    view_.targetCharCount = message.target_char_count;
                    view_.startedAtMs = clock_();
                    view_.countdown.reset();
                    wordCount = referenceWords_.size();
                }
                spdlog::info("[client] race started ({} words, target {} chars)", wordCount, message.target_char_count);
                listener_.onGameStart(message.text_content, message.target_char_count);
            }
            else if constexpr (std::is_same_v<T, CountdownSyncEvent>)
            {
                CountdownView countdown;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    countdown = sync_.syncCountdown(message.phase, message.server_time);
                    view_.state = RaceState::Countdown;
                    view_.countdown = countdown;
                }
                listener_.onCountdown(countdown);
            }
            else if constexpr (std::is_same_v<T, TypingProgressEvent>)
            {
                Participant updated;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    const auto it = view_.players.find(message.player_id);
                    if (it == view_.players.end())
                    {
                        spdlog::debug("[client] progress for unknown participant {}", message.player_id);
                        return;
                    }
                    it->second.correct_chars = message.correct_chars;
                    it->second.current_word_index = message.current_word_index;
                    it->second.completed_words = message.completed_words;
                    it->second.current_word_input = message.current_word_input;
                    it->second.wpm = message.wpm;
                    it->second.accuracy = message.accuracy;
                    updated = it->second;
                }
                listener_.onTypingProgress(message.player_id, updated);
            }
            else if constexpr (std::is_same_v<T, PlayerFinishedEvent>)
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    const auto it = view_.players.find(message.player_id);
                    if (it != view_.players.end())
                    {
                        it->second.finished = true;
                        it->second.finish_time_ms = message.final_stats.finish_time_ms;
                    }
                }
                listener_.onPlayerFinished(message.player_id, message.final_stats);
            }
            else if constexpr (std::is_same_v<T, GameStateSyncEvent>)
            {
                std::optional<PredictedState> reconciled;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    sync_.updateServerState(message.game_state, message.players, message.timestamp);

                    view_.state = message.game_state;
                    view_.players.clear();
                    for (const auto& participant : message.players)
                    {
                        view_.players.emplace(participant.id, participant);
                    }
                    if (message.game_state != RaceState::Countdown)
                    {
                        view_.countdown.reset();
                    }

                    const auto own = view_.players.find(participantId_);
                    if (own != view_.players.end())
                    {
                        reconciled = sync_.reconcileWithServer(own->second, message.timestamp, own->second.ack_sequence);
                    }
                }
                listener_.onGameStateSync(message.game_state, message.players);
                if (reconciled)
                {
                    listener_.onPredictedState(*reconciled);
                }
            }
            else if constexpr (std::is_same_v<T, ErrorEvent>)
            {
                spdlog::warn("[client] server error {}: {}", to_string(message.code), message.message);
                listener_.onError(message.message, message.code);
            }
            else
            {
                spdlog::debug("[client] {} not handled by session", event_type(event));
            }
        }, event);
    }

    void RaceSession::onStatusChanged(ConnectionStatus status)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            view_.status = status;
        }
        listener_.onConnectionChanged(status);
    }

    void RaceSession::onTransportError(const std::string& message, ErrorCode code)
    {
        listener_.onError(message, code);
    }

    void RaceSession::onRoundTrip(std::int64_t rttMs)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sync_.setRoundTripTime(rttMs);
    }
}
