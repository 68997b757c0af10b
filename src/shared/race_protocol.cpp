#include "race_protocol.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace typerace
{
    namespace
    {
        const nlohmann::json& require_field(const nlohmann::json& obj, const char* key)
        {
            if (!obj.contains(key))
            {
                throw std::invalid_argument(std::string{"Missing field: "} + key);
            }
            return obj.at(key);
        }

        std::string read_string(const nlohmann::json& obj, const char* key)
        {
            const auto& value = require_field(obj, key);
            if (!value.is_string())
            {
                throw std::invalid_argument(std::string{"Field '"} + key + "' must be a string");
            }

            return value.get<std::string>();
        }

        bool read_bool(const nlohmann::json& obj, const char* key)
        {
            const auto& value = require_field(obj, key);
            if (!value.is_boolean())
            {
                throw std::invalid_argument(std::string{"Field '"} + key + "' must be boolean");
            }

            return value.get<bool>();
        }

        double read_double(const nlohmann::json& obj, const char* key)
        {
            const auto& value = require_field(obj, key);
            if (!value.is_number())
            {
                throw std::invalid_argument(std::string{"Field '"} + key + "' must be numeric");
            }

            return value.get<double>();
        }

        std::int64_t read_int64(const nlohmann::json& obj, const char* key)
        {
            const auto& value = require_field(obj, key);
            if (!value.is_number_integer())
            {
                throw std::invalid_argument(std::string{"Field '"} + key + "' must be an integer");
            }

            return value.get<std::int64_t>();
        }

        std::optional<std::int64_t> read_optional_int64(const nlohmann::json& obj, const char* key)
        {
            if (!obj.contains(key) || obj.at(key).is_null())
            {
                return std::nullopt;
            }
            return read_int64(obj, key);
        }

        // Browsers send Date.now() as an integer, but any JSON number is tolerated.
        std::int64_t read_timestamp(const nlohmann::json& obj, bool required)
        {
            if (!obj.contains("timestamp"))
            {
                if (required)
                {
                    throw std::invalid_argument("Missing field: timestamp");
                }
                return 0;
            }

            const auto& value = obj.at("timestamp");
            if (value.is_number_integer())
            {
                return value.get<std::int64_t>();
            }
            if (value.is_number())
            {
                return static_cast<std::int64_t>(std::llround(value.get<double>()));
            }
            throw std::invalid_argument("Field 'timestamp' must be numeric");
        }

        std::vector<std::string> read_string_array(const nlohmann::json& obj, const char* key)
        {
            const auto& value = require_field(obj, key);
            if (!value.is_array())
            {
                throw std::invalid_argument(std::string{"Field '"} + key + "' must be an array");
            }

            std::vector<std::string> result;
            result.reserve(value.size());
            for (const auto& item : value)
            {
                if (!item.is_string())
                {
                    throw std::invalid_argument(std::string{"Entries of '"} + key + "' must be strings");
                }
                result.push_back(item.get<std::string>());
            }
            return result;
        }

        FinalStats parse_final_stats(const nlohmann::json& obj)
        {
            const auto& value = require_field(obj, "finalStats");
            if (!value.is_object())
            {
                throw std::invalid_argument("Field 'finalStats' must be an object");
            }

            FinalStats stats;
            stats.correct_chars = read_int64(value, "correctChars");
            stats.wpm = read_double(value, "wpm");
            stats.accuracy = read_double(value, "accuracy");
            stats.finish_time_ms = read_int64(value, "finishTime");
            return stats;
        }

        template <class T>
        constexpr const char* tag_of() noexcept
        {
            if constexpr (std::is_same_v<T, PlayerJoinEvent>) return "player_join";
            else if constexpr (std::is_same_v<T, PlayerLeaveEvent>) return "player_leave";
            else if constexpr (std::is_same_v<T, PlayerReadyEvent>) return "player_ready";
            else if constexpr (std::is_same_v<T, GameStartEvent>) return "game_start";
            else if constexpr (std::is_same_v<T, CountdownSyncEvent>) return "countdown_sync";
            else if constexpr (std::is_same_v<T, TypingProgressEvent>) return "typing_progress";
            else if constexpr (std::is_same_v<T, PlayerFinishedEvent>) return "player_finished";
            else if constexpr (std::is_same_v<T, GameStateSyncEvent>) return "game_state_sync";
            else if constexpr (std::is_same_v<T, HeartbeatEvent>) return "heartbeat";
            else return "error";
        }
    }

    const char* event_type(const Event& event) noexcept
    {
        return std::visit([](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            return tag_of<T>();
        }, event);
    }

    Participant parse_participant(const nlohmann::json& json)
    {
        if (!json.is_object())
        {
            throw std::invalid_argument("players entries must be objects");
        }

        Participant participant;
        participant.id = read_string(json, "id");
        participant.name = read_string(json, "name");
        participant.ready = read_bool(json, "isReady");
        participant.connected = read_bool(json, "isConnected");
        participant.correct_chars = read_int64(json, "correctChars");
        participant.current_word_index = read_int64(json, "currentWordIndex");
        participant.wpm = read_double(json, "wpm");
        participant.accuracy = read_double(json, "accuracy");
        participant.finished = read_bool(json, "isFinished");
        participant.finish_time_ms = read_optional_int64(json, "finishTime");

        if (json.contains("completedWords"))
        {
            participant.completed_words = read_string_array(json, "completedWords");
        }
        if (json.contains("currentWordInput"))
        {
            participant.current_word_input = read_string(json, "currentWordInput");
        }
        if (auto ack = read_optional_int64(json, "ackSequence"))
        {
            participant.ack_sequence = *ack;
        }
        return participant;
    }

    nlohmann::json serialize_participant(const Participant& participant)
    {
        nlohmann::json json{
            {"id", participant.id},
            {"name", participant.name},
            {"isReady", participant.ready},
            {"isConnected", participant.connected},
            {"correctChars", participant.correct_chars},
            {"currentWordIndex", participant.current_word_index},
            {"completedWords", participant.completed_words},
            {"currentWordInput", participant.current_word_input},
            {"wpm", participant.wpm},
            {"accuracy", participant.accuracy},
            {"isFinished", participant.finished},
            {"ackSequence", participant.ack_sequence}
        };
        if (participant.finish_time_ms.has_value())
        {
            json["finishTime"] = *participant.finish_time_ms;
        }
        return json;
    }

    Event parse_event(const nlohmann::json& json)
    {
        if (!json.is_object())
        {
            throw std::invalid_argument("Message must be a JSON object");
        }

        const std::string type = read_string(json, "type");

        if (type == "player_join")
        {
            PlayerJoinEvent event;
            event.player_id = read_string(json, "playerId");
            event.player_name = read_string(json, "playerName");
            event.timestamp = read_timestamp(json, true);
            return event;
        }
        if (type == "player_leave")
        {
            PlayerLeaveEvent event;
            event.player_id = read_string(json, "playerId");
            event.timestamp = read_timestamp(json, true);
            return event;
        }
        if (type == "player_ready")
        {
            PlayerReadyEvent event;
            event.player_id = read_string(json, "playerId");
            event.is_ready = read_bool(json, "isReady");
            event.timestamp = read_timestamp(json, true);
            return event;
        }
        if (type == "game_start")
        {
            GameStartEvent event;
            event.text_content = read_string(json, "textContent");
            event.target_char_count = read_int64(json, "targetCharCount");
            event.timestamp = read_timestamp(json, true);
            return event;
        }
        if (type == "countdown_sync")
        {
            CountdownSyncEvent event;
            const auto phase = read_int64(json, "phase");
            if (phase < std::numeric_limits<int>::min() || phase > std::numeric_limits<int>::max())
            {
                throw std::invalid_argument("Field 'phase' is out of range");
            }
            event.phase = static_cast<int>(phase);
            event.server_time = read_int64(json, "serverTime");
            event.timestamp = read_timestamp(json, true);
            return event;
        }
        if (type == "typing_progress")
        {
            TypingProgressEvent event;
            event.player_id = read_string(json, "playerId");
            event.correct_chars = read_int64(json, "correctChars");
            event.current_word_index = read_int64(json, "currentWordIndex");
            event.completed_words = read_string_array(json, "completedWords");
            event.current_word_input = read_string(json, "currentWordInput");
            event.wpm = read_double(json, "wpm");
            event.accuracy = read_double(json, "accuracy");
            event.sequence = read_optional_int64(json, "sequence");
            event.timestamp = read_timestamp(json, true);
            return event;
        }
        if (type == "player_finished")
        {
            PlayerFinishedEvent event;
            event.player_id = read_string(json, "playerId");
            event.final_stats = parse_final_stats(json);
            event.timestamp = read_timestamp(json, true);
            return event;
        }
        if (type == "game_state_sync")
        {
            GameStateSyncEvent event;
            const auto stateName = read_string(json, "gameState");
            const auto state = parse_race_state(stateName);
            if (!state)
            {
                throw std::invalid_argument("Unknown gameState: " + stateName);
            }
            event.game_state = *state;

            const auto& players = require_field(json, "players");
            if (!players.is_array())
            {
                throw std::invalid_argument("Field 'players' must be an array");
            }
            event.players.reserve(players.size());
            for (const auto& raw : players)
            {
                event.players.push_back(parse_participant(raw));
            }
            event.timestamp = read_timestamp(json, false);
            return event;
        }
        if (type == "heartbeat")
        {
            HeartbeatEvent event;
            event.timestamp = read_timestamp(json, true);
            return event;
        }
        if (type == "error")
        {
            ErrorEvent event;
            event.message = read_string(json, "message");
            const auto codeName = read_string(json, "code");
            const auto code = parse_error_code(codeName);
            if (!code)
            {
                throw std::invalid_argument("Unknown error code: " + codeName);
            }
            event.code = *code;
            event.timestamp = read_timestamp(json, false);
            return event;
        }

        throw std::invalid_argument("Unknown message type: " + type);
    }

    nlohmann::json serialize_event(const Event& event)
    {
        nlohmann::json json = std::visit([](const auto& value) -> nlohmann::json {
            using T = std::decay_t<decltype(value)>;
            nlohmann::json out{{"type", tag_of<T>()}};

            if constexpr (std::is_same_v<T, PlayerJoinEvent>)
            {
                out["playerId"] = value.player_id;
                out["playerName"] = value.player_name;
            }
            else if constexpr (std::is_same_v<T, PlayerLeaveEvent>)
            {
                out["playerId"] = value.player_id;
            }
            else if constexpr (std::is_same_v<T, PlayerReadyEvent>)
            {
                out["playerId"] = value.player_id;
                out["isReady"] = value.is_ready;
            }
            else if constexpr (std::is_same_v<T, GameStartEvent>)
            {
                out["textContent"] = value.text_content;
                out["targetCharCount"] = value.target_char_count;
            }
            else if constexpr (std::is_same_v<T, CountdownSyncEvent>)
            {
                out["phase"] = value.phase;
                out["serverTime"] = value.server_time;
            }
            else if constexpr (std::is_same_v<T, TypingProgressEvent>)
            {
                out["playerId"] = value.player_id;
                out["correctChars"] = value.correct_chars;
                out["currentWordIndex"] = value.current_word_index;
                out["completedWords"] = value.completed_words;
                out["currentWordInput"] = value.current_word_input;
                out["wpm"] = value.wpm;
                out["accuracy"] = value.accuracy;
                if (value.sequence.has_value())
                {
                    out["sequence"] = *value.sequence;
                }
            }
            else if constexpr (std::is_same_v<T, PlayerFinishedEvent>)
            {
                out["playerId"] = value.player_id;
                out["finalStats"] = {
                    {"correctChars", value.final_stats.correct_chars},
                    {"wpm", value.final_stats.wpm},
                    {"accuracy", value.final_stats.accuracy},
                    {"finishTime", value.final_stats.finish_time_ms}
                };
            }
            else if constexpr (std::is_same_v<T, GameStateSyncEvent>)
            {
                out["gameState"] = to_string(value.game_state);
                nlohmann::json players = nlohmann::json::array();
                for (const auto& participant : value.players)
                {
                    players.push_back(serialize_participant(participant));
                }
                out["players"] = std::move(players);
            }
            else if constexpr (std::is_same_v<T, ErrorEvent>)
            {
                out["message"] = value.message;
                out["code"] = to_string(value.code);
            }

            out["timestamp"] = value.timestamp;
            return out;
        }, event);

        return json;
    }

    std::string encode_event(const Event& event)
    {
        return serialize_event(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::optional<Event> validate_event(std::string_view raw, std::string& error)
    {
        auto json = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
        if (json.is_discarded())
        {
            error = "Invalid JSON";
            return std::nullopt;
        }

        try
        {
            return parse_event(json);
        }
        catch (const std::invalid_argument& ex)
        {
            error = ex.what();
        }
        catch (const nlohmann::json::exception& ex)
        {
            error = ex.what();
        }
        return std::nullopt;
    }

    ErrorEvent make_error_event(std::string message, ErrorCode code)
    {
        ErrorEvent event;
        event.message = std::move(message);
        event.code = code;
        event.timestamp = now_ms();
        return event;
    }
}
