#include "race_schema.hpp"

#include <array>
#include <chrono>
#include <utility>

namespace typerace
{
    namespace
    {
        struct RaceStateName
        {
            RaceState state;
            const char* name;
        };

        constexpr std::array<RaceStateName, 5> race_state_names{{
            {RaceState::Waiting, "waiting"},
            {RaceState::Countdown, "countdown"},
            {RaceState::Active, "active"},
            {RaceState::Finished, "finished"},
            {RaceState::Paused, "paused"},
        }};

        struct ErrorCodeName
        {
            ErrorCode code;
            const char* name;
        };

        constexpr std::array<ErrorCodeName, 7> error_code_names{{
            {ErrorCode::RoomNotFound, "ROOM_NOT_FOUND"},
            {ErrorCode::RoomFull, "ROOM_FULL"},
            {ErrorCode::InvalidMessage, "INVALID_MESSAGE"},
            {ErrorCode::PlayerNotFound, "PLAYER_NOT_FOUND"},
            {ErrorCode::GameAlreadyStarted, "GAME_ALREADY_STARTED"},
            {ErrorCode::NetworkError, "NETWORK_ERROR"},
            {ErrorCode::ValidationError, "VALIDATION_ERROR"},
        }};
    }

    const char* to_string(RaceState state) noexcept
    {
        for (const auto& entry : race_state_names)
        {
            if (entry.state == state)
            {
                return entry.name;
            }
        }
        return "unknown";
    }

    std::optional<RaceState> parse_race_state(std::string_view value)
    {
        for (const auto& entry : race_state_names)
        {
            if (value == entry.name)
            {
                return entry.state;
            }
        }
        return std::nullopt;
    }

    const char* to_string(ErrorCode code) noexcept
    {
        for (const auto& entry : error_code_names)
        {
            if (entry.code == code)
            {
                return entry.name;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ErrorCode> parse_error_code(std::string_view value)
    {
        for (const auto& entry : error_code_names)
        {
            if (value == entry.name)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

    Participant make_participant(std::string id, std::string name)
    {
        Participant participant;
        participant.id = std::move(id);
        participant.name = std::move(name);
        return participant;
    }

    std::int64_t now_ms()
    {
        const auto now = std::chrono::system_clock::now();
        return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
    }
}
