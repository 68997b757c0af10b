#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace typerace
{
    constexpr int protocol_version = 1;

    enum class RaceState
    {
        Waiting,
        Countdown,
        Active,
        Finished,
        Paused
    };

    enum class ErrorCode
    {
        RoomNotFound,
        RoomFull,
        InvalidMessage,
        PlayerNotFound,
        GameAlreadyStarted,
        NetworkError,
        ValidationError
    };

    [[nodiscard]] const char* to_string(RaceState state) noexcept;
    [[nodiscard]] std::optional<RaceState> parse_race_state(std::string_view value);

    [[nodiscard]] const char* to_string(ErrorCode code) noexcept;
    [[nodiscard]] std::optional<ErrorCode> parse_error_code(std::string_view value);

    struct RoomSettings
    {
        std::int64_t target_char_count{200};
        std::size_t max_participants{4};
    };

    struct FinalStats
    {
        std::int64_t correct_chars{0};
        double wpm{0.0};
        double accuracy{0.0};
        std::int64_t finish_time_ms{0};
    };

    // One racer's record. The room holds the authoritative copy; game_state_sync
    // carries the same shape to clients.
    struct Participant
    {
        std::string id;
        std::string name;
        bool ready{false};
        bool connected{true};
        std::int64_t correct_chars{0};
        std::int64_t current_word_index{0};
        std::vector<std::string> completed_words;
        std::string current_word_input;
        double wpm{0.0};
        double accuracy{100.0};
        bool finished{false};
        std::optional<std::int64_t> finish_time_ms;
        std::int64_t ack_sequence{-1};   // last client input sequence applied, -1 when none
    };

    [[nodiscard]] Participant make_participant(std::string id, std::string name);

    [[nodiscard]] std::int64_t now_ms();
}
