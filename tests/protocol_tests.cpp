#include "identifiers.hpp"
#include "race_protocol.hpp"
#include "race_schema.hpp"
#include "typing_metrics.hpp"
#include "websocket_codec.hpp"

#include "test_harness.hpp"

#include <cctype>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace
{
    using typerace::testing::expect;
    using typerace::testing::run_case;

    typerace::Event must_validate(const std::string& raw)
    {
        std::string error;
        auto event = typerace::validate_event(raw, error);
        if (!event)
        {
            throw std::runtime_error("expected message to validate, got: " + error);
        }
        return *event;
    }

    std::string must_reject(const std::string& raw)
    {
        std::string error;
        auto event = typerace::validate_event(raw, error);
        if (event)
        {
            throw std::runtime_error("expected rejection for: " + raw);
        }
        if (error.empty())
        {
            throw std::runtime_error("rejection carried no reason for: " + raw);
        }
        return error;
    }
}

int main()
{
    int failures = 0;

    run_case("typing progress parses with and without sequence", []() {
        const auto withSequence = must_validate(R"({"type":"typing_progress","playerId":"p1","correctChars":12,"currentWordIndex":3,)"
                                                R"("completedWords":["the","quick","brown"],"currentWordInput":"fo","wpm":42.5,"accuracy":97,)"
                                                R"("sequence":7,"timestamp":1700000000000})");
        const auto* progress = std::get_if<typerace::TypingProgressEvent>(&withSequence);
        expect(progress != nullptr, "expected typing_progress");
        expect(progress->player_id == "p1", "unexpected player id");
        expect(progress->correct_chars == 12, "unexpected correct chars");
        expect(progress->completed_words.size() == 3 && progress->completed_words[2] == "brown", "unexpected completed words");
        expect(progress->current_word_input == "fo", "unexpected current input");
        expect(progress->sequence && *progress->sequence == 7, "sequence not carried");

        const auto withoutSequence = must_validate(R"({"type":"typing_progress","playerId":"p1","correctChars":0,"currentWordIndex":0,)"
                                                   R"("completedWords":[],"currentWordInput":"","wpm":0,"accuracy":100,"timestamp":1})");
        expect(!std::get<typerace::TypingProgressEvent>(withoutSequence).sequence.has_value(), "sequence should be absent");
    }, failures);

    run_case("fractional timestamps are tolerated", []() {
        const auto event = must_validate(R"({"type":"heartbeat","timestamp":1700000000000.6})");
        expect(std::get<typerace::HeartbeatEvent>(event).timestamp == 1700000000001, "timestamp not rounded");
    }, failures);

    run_case("malformed payloads are rejected with a reason", []() {
        must_reject("not json at all");
        must_reject("[1,2,3]");
        must_reject(R"({"playerId":"p1"})");
        must_reject(R"({"type":"launch_rockets","timestamp":1})");
        must_reject(R"({"type":"player_ready","playerId":"p1","timestamp":1})");
        must_reject(R"({"type":"player_ready","playerId":"p1","isReady":"yes","timestamp":1})");
        must_reject(R"({"type":"typing_progress","playerId":"p1","correctChars":"12","currentWordIndex":0,)"
                    R"("completedWords":[],"currentWordInput":"","wpm":0,"accuracy":100,"timestamp":1})");
        must_reject(R"({"type":"typing_progress","playerId":"p1","correctChars":1,"currentWordIndex":0,)"
                    R"("completedWords":[1],"currentWordInput":"","wpm":0,"accuracy":100,"timestamp":1})");
        must_reject(R"({"type":"player_finished","playerId":"p1","finalStats":{"wpm":1},"timestamp":1})");
        must_reject(R"({"type":"countdown_sync","phase":3,"timestamp":1})");
        must_reject(R"({"type":"error","message":"boom","code":"NOT_A_CODE"})");
        must_reject(R"({"type":"game_state_sync","gameState":"racing","players":[]})");

        const auto reason = must_reject(R"({"type":"player_leave","timestamp":1})");
        expect(reason.find("playerId") != std::string::npos, "reason should name the missing field: " + reason);
    }, failures);

    run_case("server-only events parse without timestamps", []() {
        const auto sync = must_validate(R"({"type":"game_state_sync","gameState":"paused","players":[)"
                                        R"({"id":"a","name":"Ann","isReady":true,"isConnected":false,"correctChars":4,)"
                                        R"("currentWordIndex":1,"wpm":10,"accuracy":90,"isFinished":false,"ackSequence":5}]})");
        const auto& state = std::get<typerace::GameStateSyncEvent>(sync);
        expect(state.game_state == typerace::RaceState::Paused, "unexpected game state");
        expect(state.players.size() == 1, "unexpected player count");
        expect(!state.players[0].connected, "connected flag lost");
        expect(state.players[0].ack_sequence == 5, "ack sequence lost");
        expect(!state.players[0].finish_time_ms.has_value(), "finish time should be absent");

        const auto error = must_validate(R"({"type":"error","message":"Room is full","code":"ROOM_FULL"})");
        expect(std::get<typerace::ErrorEvent>(error).code == typerace::ErrorCode::RoomFull, "unexpected error code");
    }, failures);

    run_case("validation is idempotent over re-encoding", []() {
        const std::vector<std::string> samples{
            R"({"type":"player_join","playerId":"p1","playerName":"Ann","timestamp":5})",
            R"({"type":"countdown_sync","phase":2,"serverTime":99,"timestamp":99})",
            R"({"type":"player_finished","playerId":"p1","finalStats":{"correctChars":50,"wpm":61.5,"accuracy":98,"finishTime":4100},"timestamp":7})",
            R"({"type":"game_start","textContent":"a b c","targetCharCount":5,"timestamp":3})",
        };

        for (const auto& raw : samples)
        {
            const auto first = must_validate(raw);
            const auto encoded = typerace::encode_event(first);
            const auto second = must_validate(encoded);
            expect(typerace::encode_event(second) == encoded, "re-encoding changed the message: " + raw);
            expect(nlohmann::json::parse(encoded) == nlohmann::json::parse(raw), "encoding drifted from input: " + raw);
        }
    }, failures);

    run_case("event type tags", []() {
        expect(std::string{typerace::event_type(typerace::PlayerReadyEvent{})} == "player_ready", "ready tag");
        expect(std::string{typerace::event_type(typerace::GameStateSyncEvent{})} == "game_state_sync", "sync tag");
        expect(std::string{typerace::event_type(typerace::make_error_event("x", typerace::ErrorCode::InvalidMessage))} == "error", "error tag");
    }, failures);

    run_case("typing metrics", []() {
        const auto words = typerace::split_words("The quick brown fox");
        expect(words.size() == 4 && words[3] == "fox", "unexpected split");
        expect(typerace::split_words("").empty(), "empty text should have no words");

        expect(typerace::count_matching_chars("quack", "quick") == 4, "matching chars");
        expect(typerace::count_matching_chars("quickest", "quick") == 5, "matching chars with overflow");

        expect(typerace::calculate_wpm(50, 60000) == 10.0, "wpm over a minute");
        expect(typerace::calculate_wpm(50, 0) == 0.0, "wpm with no elapsed time");
        expect(typerace::calculate_accuracy(9, 10) == 90.0, "accuracy");
        expect(typerace::calculate_accuracy(0, 0) == 100.0, "accuracy with no input");
        expect(typerace::progress_percent(150, 100) == 100.0, "progress is capped");
        expect(typerace::progress_percent(25, 100) == 25.0, "progress");
    }, failures);

    run_case("identifiers", []() {
        for (int i = 0; i < 20; ++i)
        {
            expect(typerace::is_room_code(typerace::generate_room_code()), "generated code is not a room code");
        }
        expect(typerace::is_room_code("ZZZZZZ"), "ZZZZZZ is a room code");
        expect(!typerace::is_room_code("abc123"), "lower case is not a room code");
        expect(!typerace::is_room_code("ABC12"), "short code accepted");

        const auto id = typerace::generate_participant_id();
        expect(id.rfind("player_", 0) == 0, "participant id prefix");
        const auto suffix = id.substr(id.find_last_of('_') + 1);
        expect(suffix.size() == 9, "participant id suffix length");
        for (const char c : suffix)
        {
            expect(std::isdigit(static_cast<unsigned char>(c)) || std::islower(static_cast<unsigned char>(c)), "suffix must be base36");
        }
    }, failures);

    run_case("state and error code names", []() {
        expect(std::string{typerace::to_string(typerace::RaceState::Countdown)} == "countdown", "countdown name");
        expect(typerace::parse_race_state("finished") == typerace::RaceState::Finished, "finished parse");
        expect(!typerace::parse_race_state("Finished").has_value(), "names are case sensitive");
        expect(std::string{typerace::to_string(typerace::ErrorCode::GameAlreadyStarted)} == "GAME_ALREADY_STARTED", "error name");
        expect(typerace::parse_error_code("VALIDATION_ERROR") == typerace::ErrorCode::ValidationError, "error parse");
    }, failures);

    run_case("websocket accept key", []() {
        expect(typerace::ws::compute_accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=", "RFC 6455 sample key");
        expect(typerace::ws::generate_client_key().size() == 24, "client key must be 16 bytes base64 encoded");
    }, failures);

    run_case("websocket frame encoding", []() {
        const auto frame = typerace::ws::encode_frame(typerace::ws::Opcode::Text, "hi", false);
        expect(frame.size() == 4, "unexpected unmasked frame size");
        expect(frame[0] == 0x81 && frame[1] == 0x02 && frame[2] == 'h' && frame[3] == 'i', "unexpected unmasked frame bytes");

        const auto masked = typerace::ws::encode_frame(typerace::ws::Opcode::Text, "hi", true);
        expect(masked.size() == 8 && (masked[1] & 0x80) != 0, "masked frame must carry the mask bit and key");

        const std::string large(300, 'x');
        const auto extended = typerace::ws::encode_frame(typerace::ws::Opcode::Binary, large, false);
        expect(extended[1] == 126 && extended[2] == 0x01 && extended[3] == 0x2C, "16-bit extended length");

        const auto close = typerace::ws::encode_close_payload(1013, "busy");
        expect(typerace::ws::decode_close_code(close) == std::uint16_t{1013}, "close code round trip");
        expect(!typerace::ws::decode_close_code("").has_value(), "empty close payload has no code");
    }, failures);

    run_case("utf-8 validation and message size limit", []() {
        expect(typerace::ws::is_valid_utf8("Ann Lee"), "ascii is valid");
        expect(typerace::ws::is_valid_utf8("Zo\xC3\xAB \xE2\x82\xAC \xF0\x9F\x8E\x89"), "multi-byte sequences are valid");
        expect(!typerace::ws::is_valid_utf8(typerace::ws::url_decode("%FF")), "0xFF is never valid");
        expect(!typerace::ws::is_valid_utf8("\xC3"), "truncated sequence");
        expect(!typerace::ws::is_valid_utf8("\xC0\xAF"), "overlong encoding");
        expect(!typerace::ws::is_valid_utf8("\xED\xA0\x80"), "surrogate code point");

        const auto limit = static_cast<std::size_t>(typerace::ws::max_payload_bytes);
        expect(!typerace::ws::exceeds_message_limit(0, limit), "a single full-size frame fits");
        expect(!typerace::ws::exceeds_message_limit(limit - 10, 10), "fragments up to the limit fit");
        expect(typerace::ws::exceeds_message_limit(limit - 10, 11), "fragments past the limit are refused");
        expect(typerace::ws::exceeds_message_limit(limit, 1), "a full message accepts nothing more");
    }, failures);

    run_case("encoding replaces invalid text instead of throwing", []() {
        const auto encoded = typerace::encode_event(typerace::PlayerJoinEvent{"\xFF", "Player 1", 1});
        const auto event = must_validate(encoded);
        expect(std::get<typerace::PlayerJoinEvent>(event).player_id == "\xEF\xBF\xBD", "invalid byte becomes U+FFFD");
    }, failures);

    run_case("http head and query parsing", []() {
        const auto head = typerace::ws::parse_http_head("GET /race?roomId=ABC123 HTTP/1.1\r\nHost: x\r\nSec-WebSocket-Key: abc\r\n");
        expect(head.has_value(), "head should parse");
        expect(head->start_line == "GET /race?roomId=ABC123 HTTP/1.1", "start line");
        expect(head->headers.at("sec-websocket-key") == "abc", "header names are lower-cased");

        const auto params = typerace::ws::parse_query_params("roomId=ABC123&playerId=player_1&playerName=Ann%20Lee");
        expect(params.at("roomId") == "ABC123", "roomId param");
        expect(params.at("playerName") == "Ann Lee", "percent decoding");
        expect(typerace::ws::url_decode("a+b") == "a b", "plus decodes to space");
        expect(typerace::ws::url_encode("Ann Lee&co") == "Ann%20Lee%26co", "url encoding");
    }, failures);

    if (failures == 0)
    {
        std::cout << "All protocol tests passed\n";
    }
    else
    {
        std::cerr << failures << " protocol test(s) failed\n";
    }

    return failures == 0 ? 0 : 1;
}
