#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "race_schema.hpp"

namespace typerace
{
    struct PlayerJoinEvent
    {
        std::string player_id;
        std::string player_name;
        std::int64_t timestamp{0};
    };

    struct PlayerLeaveEvent
    {
        std::string player_id;
        std::int64_t timestamp{0};
    };

    struct PlayerReadyEvent
    {
        std::string player_id;
        bool is_ready{false};
        std::int64_t timestamp{0};
    };

    struct GameStartEvent
    {
        std::string text_content;
        std::int64_t target_char_count{0};
        std::int64_t timestamp{0};
    };

    struct CountdownSyncEvent
    {
        int phase{0};
        std::int64_t server_time{0};
        std::int64_t timestamp{0};
    };

    struct TypingProgressEvent
    {
        std::string player_id;
        std::int64_t correct_chars{0};
        std::int64_t current_word_index{0};
        std::vector<std::string> completed_words;
        std::string current_word_input;
        double wpm{0.0};
        double accuracy{0.0};
        std::optional<std::int64_t> sequence;
        std::int64_t timestamp{0};
    };

    struct PlayerFinishedEvent
    {
        std::string player_id;
        FinalStats final_stats;
        std::int64_t timestamp{0};
    };

    // Server only.
    struct GameStateSyncEvent
    {
        RaceState game_state{RaceState::Waiting};
        std::vector<Participant> players;
        std::int64_t timestamp{0};
    };

    struct HeartbeatEvent
    {
        std::int64_t timestamp{0};
    };

    // Server only.
    struct ErrorEvent
    {
        std::string message;
        ErrorCode code{ErrorCode::InvalidMessage};
        std::int64_t timestamp{0};
    };

    using Event = std::variant<
        PlayerJoinEvent,
        PlayerLeaveEvent,
        PlayerReadyEvent,
        GameStartEvent,
        CountdownSyncEvent,
        TypingProgressEvent,
        PlayerFinishedEvent,
        GameStateSyncEvent,
        HeartbeatEvent,
        ErrorEvent>;

    // Wire tag of the event ("player_join", "typing_progress", ...).
    [[nodiscard]] const char* event_type(const Event& event) noexcept;

    // Throws std::invalid_argument describing the first structural problem found.
    [[nodiscard]] Event parse_event(const nlohmann::json& json);
    [[nodiscard]] nlohmann::json serialize_event(const Event& event);
    [[nodiscard]] std::string encode_event(const Event& event);

    // Parses and validates a raw text frame. On rejection returns std::nullopt and
    // fills error; no other state is touched.
    [[nodiscard]] std::optional<Event> validate_event(std::string_view raw, std::string& error);

    [[nodiscard]] Participant parse_participant(const nlohmann::json& json);
    [[nodiscard]] nlohmann::json serialize_participant(const Participant& participant);

    [[nodiscard]] ErrorEvent make_error_event(std::string message, ErrorCode code);
}
