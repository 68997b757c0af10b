#include "race_synchronizer.hpp"

#include "typing_metrics.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace typerace::client
{
    RaceSynchronizer::RaceSynchronizer(std::string participantId, Clock clock)
        : participantId_(std::move(participantId))
        , clock_(std::move(clock))
    {
        reset();
    }

    const PredictedState& RaceSynchronizer::predictiveUpdate(const std::string& input, std::int64_t wordIndex, const std::vector<std::string>& referenceWords)
    {
        if (referenceWords_ != referenceWords)
        {
            referenceWords_ = referenceWords;
        }

        PendingInput pending;
        pending.sequence = nextSequence_++;
        pending.estimated_server_ms = serverTime();
        pending.local_ms = clock_();
        pending.input = input;
        pending.word_index = wordIndex;
        pending_.push_back(pending);

        predicted_ = computeState(predicted_, input, wordIndex, referenceWords_);
        predicted_.timestamp_ms = pending.estimated_server_ms;
        predicted_.confirmed = false;
        return predicted_;
    }

    const PredictedState& RaceSynchronizer::reconcileWithServer(const Participant& snapshot, std::int64_t serverTimestamp, std::int64_t ackSequence)
    {
        updateClockOffset(serverTimestamp);

        lastConfirmedSequence_ = std::max(lastConfirmedSequence_, ackSequence);
        while (!pending_.empty() && pending_.front().sequence <= ackSequence)
        {
            pending_.pop_front();
        }

        if (isPredictionAccurate(snapshot))
        {
            predicted_.confirmed = true;
            return predicted_;
        }

        PredictedState rebuilt;
        rebuilt.correct_chars = snapshot.correct_chars;
        rebuilt.current_word_index = snapshot.current_word_index;
        rebuilt.current_word_input = snapshot.current_word_input;
        rebuilt.completed_words = snapshot.completed_words;

        for (const auto& input : pending_)
        {
            rebuilt = computeState(rebuilt, input.input, input.word_index, referenceWords_);
        }

        rebuilt.timestamp_ms = serverTime();
        rebuilt.confirmed = false;
        predicted_ = std::move(rebuilt);
        return predicted_;
    }

    CountdownView RaceSynchronizer::syncCountdown(int phase, std::int64_t serverTimestamp)
    {
        updateClockOffset(serverTimestamp);

        const auto elapsed = std::max<std::int64_t>(0, serverTime() - serverTimestamp);

        CountdownView view;
        view.phase = static_cast<int>(std::max<std::int64_t>(0, phase - elapsed / countdown_phase_ms));
        view.time_remaining_ms = std::max<std::int64_t>(0, countdown_phase_ms - elapsed % countdown_phase_ms);
        return view;
    }

    std::int64_t RaceSynchronizer::detectNetworkLag() const
    {
        if (pending_.empty())
        {
            return 0;
        }

        const auto lag = clock_() - pending_.front().local_ms;
        return std::clamp<std::int64_t>(lag, 0, max_reported_lag_ms);
    }

    void RaceSynchronizer::updateServerState(RaceState state, std::vector<Participant> players, std::int64_t serverTimestamp)
    {
        updateClockOffset(serverTimestamp);

        server_.state = state;
        server_.players = std::move(players);
        server_.server_time_ms = serverTimestamp;
    }

    void RaceSynchronizer::setRaceText(std::string text, std::int64_t targetCharCount)
    {
        referenceWords_ = split_words(text);
        server_.text_content = std::move(text);
        server_.target_char_count = targetCharCount;
    }

    void RaceSynchronizer::reset()
    {
        predicted_ = PredictedState{};
        predicted_.timestamp_ms = clock_();
        pending_.clear();
        referenceWords_.clear();
        server_ = ServerView{};
        server_.server_time_ms = clock_();
        nextSequence_ = 0;
        lastConfirmedSequence_ = -1;
        clockOffsetMs_ = 0;
    }

    PredictedState RaceSynchronizer::computeState(const PredictedState& from, const std::string& input, std::int64_t wordIndex, const std::vector<std::string>& words) const
    {
        PredictedState next = from;
        if (wordIndex < 0)
        {
            return next;
        }

        const auto wordCount = static_cast<std::int64_t>(words.size());

        if (wordIndex > from.current_word_index)
        {
            for (auto i = from.current_word_index; i < wordIndex && i < wordCount; ++i)
            {
                next.completed_words.push_back(words[static_cast<std::size_t>(i)]);
            }
        }
        else if (wordIndex < from.current_word_index)
        {
            const auto keep = std::min<std::size_t>(next.completed_words.size(), static_cast<std::size_t>(wordIndex));
            next.completed_words.resize(keep);
        }

        std::int64_t correct = 0;
        for (const auto& word : next.completed_words)
        {
            correct += static_cast<std::int64_t>(word.size()) + 1;
        }
        if (wordIndex < wordCount)
        {
            correct += count_matching_chars(input, words[static_cast<std::size_t>(wordIndex)]);
        }

        next.correct_chars = correct;
        next.current_word_index = wordIndex;
        next.current_word_input = input;
        return next;
    }

    bool RaceSynchronizer::isPredictionAccurate(const Participant& snapshot) const noexcept
    {
        return std::llabs(predicted_.correct_chars - snapshot.correct_chars) <= 1 &&
               predicted_.current_word_index == snapshot.current_word_index;
    }

    void RaceSynchronizer::updateClockOffset(std::int64_t serverTimestamp)
    {
        const auto oneWayDelay = roundTripMs_ / 2;
        clockOffsetMs_ = serverTimestamp + oneWayDelay - clock_();
    }
}
