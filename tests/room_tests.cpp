#include "connection.hpp"
#include "race_protocol.hpp"
#include "race_server.hpp"
#include "server_config.hpp"
#include "text_provider.hpp"

#include "test_harness.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace
{
    using namespace std::chrono_literals;
    using typerace::testing::expect;
    using typerace::testing::run_case;
    using typerace::testing::wait_until;

    using typerace::Event;
    using typerace::RaceState;
    using typerace::server::JoinRequest;
    using typerace::server::RaceServer;
    using typerace::server::ServerConfig;
    using typerace::server::SteadyClock;

    constexpr char race_text[] = "the quick brown fox jumps over the lazy dog";

    class FakeConnection : public typerace::server::Connection
    {
    public:
        explicit FakeConnection(std::uint64_t id)
            : id_(id)
            , address_("fake:" + std::to_string(id))
        {
        }

        std::uint64_t id() const noexcept override { return id_; }
        bool isOpen() const noexcept override { return open_.load(); }
        const std::string& remoteAddress() const noexcept override { return address_; }

        void sendText(const std::string& text) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (open_.load())
            {
                texts_.push_back(text);
            }
        }

        void sendPing() override { ++pings_; }

        void close(std::uint16_t code, const std::string&) override
        {
            closeCode_ = code;
            open_.store(false);
        }

        std::vector<Event> events() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<Event> parsed;
            for (const auto& text : texts_)
            {
                std::string error;
                auto event = typerace::validate_event(text, error);
                if (!event)
                {
                    throw std::runtime_error("server sent an invalid message: " + error);
                }
                parsed.push_back(*event);
            }
            return parsed;
        }

        template <typename T>
        std::vector<T> eventsOf() const
        {
            std::vector<T> matching;
            for (const auto& event : events())
            {
                if (const auto* typed = std::get_if<T>(&event))
                {
                    matching.push_back(*typed);
                }
            }
            return matching;
        }

        std::optional<typerace::ErrorCode> lastErrorCode() const
        {
            const auto errors = eventsOf<typerace::ErrorEvent>();
            if (errors.empty())
            {
                return std::nullopt;
            }
            return errors.back().code;
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            texts_.clear();
        }

        int pings() const { return pings_.load(); }
        std::uint16_t closeCode() const { return closeCode_.load(); }

    private:
        std::uint64_t id_;
        std::string address_;
        std::atomic_bool open_{true};
        mutable std::mutex mutex_;
        std::vector<std::string> texts_;
        std::atomic_int pings_{0};
        std::atomic<std::uint16_t> closeCode_{0};
    };

    ServerConfig make_config(std::int64_t targetChars = 50, std::size_t maxPlayers = 4)
    {
        ServerConfig config;
        config.port = 0;
        config.roomDefaults.target_char_count = targetChars;
        config.roomDefaults.max_participants = maxPlayers;
        config.countdownTick = 10ms;
        return config;
    }

    std::unique_ptr<RaceServer> make_server(ServerConfig config = make_config())
    {
        std::vector<std::string> passages{race_text};
        return std::make_unique<RaceServer>(std::move(config), std::make_unique<typerace::server::PassageTextProvider>(std::move(passages)));
    }

    std::shared_ptr<FakeConnection> join(RaceServer& server, const std::string& roomId, const std::string& participantId)
    {
        static std::atomic<std::uint64_t> nextId{1};
        auto connection = std::make_shared<FakeConnection>(nextId++);
        server.onOpen(connection, JoinRequest{roomId, participantId, std::nullopt});
        return connection;
    }

    void send(RaceServer& server, FakeConnection& connection, const Event& event)
    {
        server.onMessage(connection, typerace::encode_event(event));
    }

    void send_ready(RaceServer& server, FakeConnection& connection, const std::string& participantId)
    {
        send(server, connection, typerace::PlayerReadyEvent{participantId, true, typerace::now_ms()});
    }

    typerace::TypingProgressEvent progress(const std::string& participantId, std::int64_t correctChars, std::optional<std::int64_t> sequence = std::nullopt)
    {
        typerace::TypingProgressEvent event;
        event.player_id = participantId;
        event.correct_chars = correctChars;
        event.current_word_index = correctChars / 5;
        event.wpm = 60.0;
        event.accuracy = 98.0;
        event.sequence = sequence;
        event.timestamp = typerace::now_ms();
        return event;
    }

    RaceState room_state(RaceServer& server, const std::string& roomId)
    {
        auto room = server.rooms().find(roomId);
        if (!room)
        {
            throw std::runtime_error("room " + roomId + " does not exist");
        }
        return room->state();
    }

    struct RunningRace
    {
        std::shared_ptr<FakeConnection> first;
        std::shared_ptr<FakeConnection> second;
    };

    RunningRace start_race(RaceServer& server, const std::string& roomId)
    {
        RunningRace race{join(server, roomId, "p1"), join(server, roomId, "p2")};
        send_ready(server, *race.first, "p1");
        send_ready(server, *race.second, "p2");
        expect(wait_until([&]() { return room_state(server, roomId) == RaceState::Active; }), "race never became active");
        race.first->clear();
        race.second->clear();
        return race;
    }
}

int main()
{
    int failures = 0;

    run_case("join to unknown room creates it", []() {
        auto server = make_server();
        auto connection = join(*server, "ZZZZZZ", "p1");

        auto room = server->rooms().find("ZZZZZZ");
        expect(room != nullptr, "room was not created");
        expect(room->state() == RaceState::Waiting, "new room should be waiting");

        const auto syncs = connection->eventsOf<typerace::GameStateSyncEvent>();
        expect(syncs.size() == 1, "joiner should receive one snapshot");
        expect(syncs[0].players.size() == 1 && syncs[0].players[0].name == "Player 1", "default display name");
    }, failures);

    run_case("missing join parameters are a validation error", []() {
        auto server = make_server();
        auto connection = join(*server, "", "p1");
        expect(connection->lastErrorCode() == typerace::ErrorCode::ValidationError, "expected VALIDATION_ERROR");
        expect(connection->closeCode() == 1008, "expected policy violation close");
        expect(server->rooms().size() == 0, "no room should be created");
    }, failures);

    run_case("countdown needs at least two ready participants", []() {
        auto server = make_server();
        auto first = join(*server, "ABC123", "p1");
        send_ready(*server, *first, "p1");
        expect(room_state(*server, "ABC123") == RaceState::Waiting, "a lone ready participant must not start the countdown");

        auto second = join(*server, "ABC123", "p2");
        const auto joins = first->eventsOf<typerace::PlayerJoinEvent>();
        expect(joins.size() == 1 && joins[0].player_id == "p2", "existing participant should hear about the newcomer");
        expect(second->eventsOf<typerace::PlayerJoinEvent>().empty(), "joiner should not hear its own join");

        send_ready(*server, *second, "p2");
        const auto state = room_state(*server, "ABC123");
        expect(state == RaceState::Countdown || state == RaceState::Active, "both ready should start the countdown");
        expect(second->eventsOf<typerace::PlayerReadyEvent>().size() == 1, "ready is echoed to the sender");
        expect(first->eventsOf<typerace::PlayerReadyEvent>().size() == 2, "ready is broadcast to the room");
    }, failures);

    run_case("countdown waits until every participant is ready", []() {
        auto server = make_server();
        auto first = join(*server, "READY3", "p1");
        auto second = join(*server, "READY3", "p2");
        auto third = join(*server, "READY3", "p3");

        send_ready(*server, *first, "p1");
        send_ready(*server, *second, "p2");
        expect(room_state(*server, "READY3") == RaceState::Waiting, "one participant is still not ready");

        send(*server, *second, typerace::PlayerReadyEvent{"p2", false, typerace::now_ms()});
        send_ready(*server, *third, "p3");
        expect(room_state(*server, "READY3") == RaceState::Waiting, "un-readying before the last ready holds the countdown");
        expect(first->eventsOf<typerace::CountdownSyncEvent>().empty(), "no countdown tick while someone is not ready");

        send_ready(*server, *second, "p2");
        const auto state = room_state(*server, "READY3");
        expect(state == RaceState::Countdown || state == RaceState::Active, "all ready starts the countdown");
    }, failures);

    run_case("countdown ticks down before the race starts", []() {
        auto server = make_server();
        auto first = join(*server, "ABC123", "p1");
        auto second = join(*server, "ABC123", "p2");
        send_ready(*server, *first, "p1");
        send_ready(*server, *second, "p2");

        expect(wait_until([&]() { return !first->eventsOf<typerace::GameStartEvent>().empty(); }), "game_start never arrived");

        const auto ticks = first->eventsOf<typerace::CountdownSyncEvent>();
        expect(ticks.size() == 4, "expected phases 3, 2, 1, 0");
        for (std::size_t i = 0; i < ticks.size(); ++i)
        {
            expect(ticks[i].phase == 3 - static_cast<int>(i), "phases must count down in order");
        }

        const auto events = first->events();
        std::size_t lastTick = 0;
        std::size_t start = 0;
        for (std::size_t i = 0; i < events.size(); ++i)
        {
            if (std::holds_alternative<typerace::CountdownSyncEvent>(events[i]))
            {
                lastTick = i;
            }
            if (std::holds_alternative<typerace::GameStartEvent>(events[i]))
            {
                start = i;
            }
        }
        expect(start > lastTick, "game_start must follow the last tick");

        const auto game = first->eventsOf<typerace::GameStartEvent>().front();
        expect(game.text_content == race_text, "reference text not captured");
        expect(game.target_char_count == 50, "target not announced");
        expect(room_state(*server, "ABC123") == RaceState::Active, "room should be active");
    }, failures);

    run_case("scenario ABC123 finishes at threshold 50", []() {
        auto server = make_server(make_config(50));
        auto race = start_race(*server, "ABC123");

        send(*server, *race.first, progress("p1", 30));
        expect(race.second->eventsOf<typerace::TypingProgressEvent>().size() == 1, "progress should reach the other participant");
        expect(race.first->eventsOf<typerace::TypingProgressEvent>().empty(), "progress must not echo to its sender");
        expect(room_state(*server, "ABC123") == RaceState::Active, "30 of 50 must not finish");

        send(*server, *race.first, progress("p1", 50));
        const auto finished = race.second->eventsOf<typerace::PlayerFinishedEvent>();
        expect(finished.size() == 1 && finished[0].player_id == "p1", "one finish event for p1");
        expect(race.first->eventsOf<typerace::PlayerFinishedEvent>().size() == 1, "finish goes to the whole room");
        expect(finished[0].final_stats.correct_chars == 50, "final stats carry the count");
        expect(finished[0].final_stats.finish_time_ms >= 0, "finish time is measured from race start");
        expect(room_state(*server, "ABC123") == RaceState::Finished, "first finisher ends the race");

        const auto syncs = race.second->eventsOf<typerace::GameStateSyncEvent>();
        expect(!syncs.empty() && syncs.back().game_state == RaceState::Finished, "final snapshot broadcast");

        send(*server, *race.second, progress("p2", 60));
        send(*server, *race.first, progress("p1", 55));
        expect(race.second->eventsOf<typerace::PlayerFinishedEvent>().size() == 1, "no further finish events after completion");

        auto room = server->rooms().find("ABC123");
        const auto p2 = room->participant("p2");
        expect(p2 && !p2->finished, "progress after completion is ignored");
    }, failures);

    run_case("join to a running race is rejected", []() {
        auto server = make_server();
        start_race(*server, "ZZZZZZ");

        auto late = join(*server, "ZZZZZZ", "p3");
        expect(late->lastErrorCode() == typerace::ErrorCode::GameAlreadyStarted, "expected GAME_ALREADY_STARTED");
        expect(late->closeCode() == 1013, "expected try-again-later close");
        expect(!server->rooms().find("ZZZZZZ")->participant("p3"), "rejected participant must not be added");
    }, failures);

    run_case("join during the countdown is rejected", []() {
        auto config = make_config();
        config.countdownTick = 10s;
        auto server = make_server(config);
        auto first = join(*server, "COUNT1", "p1");
        auto second = join(*server, "COUNT1", "p2");
        send_ready(*server, *first, "p1");
        send_ready(*server, *second, "p2");
        expect(room_state(*server, "COUNT1") == RaceState::Countdown, "room should be counting down");

        auto late = join(*server, "COUNT1", "p3");
        expect(late->lastErrorCode() == typerace::ErrorCode::GameAlreadyStarted, "expected GAME_ALREADY_STARTED");
        expect(late->closeCode() == 1013, "expected try-again-later close");
        expect(!server->rooms().find("COUNT1")->participant("p3"), "rejected participant must not be added");
    }, failures);

    run_case("join parameters must be valid UTF-8", []() {
        auto server = make_server();
        auto badId = join(*server, "UTF801", "\xFF");
        expect(badId->lastErrorCode() == typerace::ErrorCode::ValidationError, "expected VALIDATION_ERROR for the id");
        expect(badId->closeCode() == 1008, "expected policy violation close");
        expect(server->rooms().size() == 0, "no room should be created");

        auto badName = std::make_shared<FakeConnection>(9001);
        server->onOpen(badName, JoinRequest{"UTF801", "p1", std::string{"Ann\xC3"}});
        expect(badName->lastErrorCode() == typerace::ErrorCode::ValidationError, "expected VALIDATION_ERROR for the name");

        auto first = join(*server, "UTF801", "p1");
        auto second = join(*server, "UTF801", "p2");
        const auto syncs = second->eventsOf<typerace::GameStateSyncEvent>();
        expect(syncs.size() == 1 && syncs[0].players.size() == 2, "room still accepts well-formed joiners");
        expect(first->eventsOf<typerace::PlayerJoinEvent>().size() == 1, "join broadcast still delivered");
    }, failures);

    run_case("full room rejects newcomers", []() {
        auto server = make_server(make_config(50, 2));
        join(*server, "FULL01", "p1");
        join(*server, "FULL01", "p2");
        auto third = join(*server, "FULL01", "p3");
        expect(third->lastErrorCode() == typerace::ErrorCode::RoomFull, "expected ROOM_FULL");
        expect(third->closeCode() == 1013, "expected try-again-later close");
    }, failures);

    run_case("disconnect during race pauses without resuming", []() {
        auto server = make_server();
        auto race = start_race(*server, "PAUSE1");

        race.second->close(1006, "");
        server->onClose(*race.second);

        const auto leaves = race.first->eventsOf<typerace::PlayerLeaveEvent>();
        expect(leaves.size() == 1 && leaves[0].player_id == "p2", "remaining participant should hear the leave");
        const auto syncs = race.first->eventsOf<typerace::GameStateSyncEvent>();
        expect(!syncs.empty() && syncs.back().game_state == RaceState::Paused, "paused snapshot broadcast");
        expect(room_state(*server, "PAUSE1") == RaceState::Paused, "room should be paused");

        auto room = server->rooms().find("PAUSE1");
        const auto departed = room->participant("p2");
        expect(departed && !departed->connected, "participant is kept but marked disconnected");

        auto returning = join(*server, "PAUSE1", "p2");
        expect(returning->isOpen(), "known participant may rejoin");
        expect(room->participant("p2")->connected, "rejoin marks the participant connected");
        expect(room_state(*server, "PAUSE1") == RaceState::Paused, "paused races do not resume on their own");

        send(*server, *race.first, progress("p1", 10));
        expect(returning->eventsOf<typerace::TypingProgressEvent>().empty(), "progress is ignored while paused");
    }, failures);

    run_case("leaving while waiting removes the participant", []() {
        auto server = make_server();
        auto first = join(*server, "WAIT01", "p1");
        auto second = join(*server, "WAIT01", "p2");

        server->onClose(*second);
        auto room = server->rooms().find("WAIT01");
        expect(!room->participant("p2"), "waiting participant should be removed");
        expect(room->summary().participantCount == 1, "one participant left");
        expect(first->eventsOf<typerace::PlayerLeaveEvent>().size() == 1, "leave broadcast");

        server->onClose(*second);
        expect(first->eventsOf<typerace::PlayerLeaveEvent>().size() == 1, "disconnect side effects run once");
    }, failures);

    run_case("rejoin supersedes the previous connection", []() {
        auto server = make_server();
        auto original = join(*server, "DUP001", "p1");
        auto replacement = join(*server, "DUP001", "p1");

        expect(original->closeCode() == 1000, "previous connection closed normally");
        expect(replacement->isOpen(), "replacement stays open");

        server->onClose(*original);
        auto room = server->rooms().find("DUP001");
        const auto p1 = room->participant("p1");
        expect(p1 && p1->connected, "closing the superseded connection must not disconnect the participant");
        expect(room->summary().participantCount == 1, "participant not duplicated");
    }, failures);

    run_case("invalid messages are answered without closing", []() {
        auto server = make_server();
        auto connection = join(*server, "BAD001", "p1");

        server->onMessage(*connection, "{not json");
        expect(connection->lastErrorCode() == typerace::ErrorCode::InvalidMessage, "expected INVALID_MESSAGE");
        expect(connection->isOpen(), "connection should stay open");

        send(*server, *connection, typerace::PlayerJoinEvent{"p1", "Ann", typerace::now_ms()});
        expect(connection->eventsOf<typerace::ErrorEvent>().size() == 2, "client-sent join is not supported");
        expect(connection->lastErrorCode() == typerace::ErrorCode::InvalidMessage, "unsupported type is INVALID_MESSAGE");
    }, failures);

    run_case("progress for an unknown participant", []() {
        auto server = make_server();
        auto race = start_race(*server, "GHOST1");

        send(*server, *race.first, progress("ghost", 10));
        expect(race.first->lastErrorCode() == typerace::ErrorCode::PlayerNotFound, "expected PLAYER_NOT_FOUND");
        expect(race.second->eventsOf<typerace::TypingProgressEvent>().empty(), "nothing broadcast");
    }, failures);

    run_case("progress records the acknowledged sequence", []() {
        auto server = make_server();
        auto race = start_race(*server, "ACK001");

        send(*server, *race.first, progress("p1", 8, 4));
        const auto p1 = server->rooms().find("ACK001")->participant("p1");
        expect(p1 && p1->ack_sequence == 4, "sequence should be recorded as the ack");
        expect(p1->correct_chars == 8, "progress applied");

        send(*server, *race.first, progress("p1", 6));
        expect(server->rooms().find("ACK001")->participant("p1")->correct_chars == 6, "last write wins");
    }, failures);

    run_case("explicit finish is rebroadcast and ends the race", []() {
        auto server = make_server();
        auto waiting = join(*server, "FIN001", "p9");
        send(*server, *waiting, typerace::PlayerFinishedEvent{"p9", typerace::FinalStats{10, 50.0, 99.0, 1000}, typerace::now_ms()});
        expect(!server->rooms().find("FIN001")->participant("p9")->finished, "finish while waiting is ignored");

        auto race = start_race(*server, "FIN002");
        const typerace::PlayerFinishedEvent finish{"p2", typerace::FinalStats{48, 72.0, 96.0, 4200}, typerace::now_ms()};
        send(*server, *race.second, finish);

        const auto heard = race.first->eventsOf<typerace::PlayerFinishedEvent>();
        expect(heard.size() == 1 && heard[0].final_stats.finish_time_ms == 4200, "finish forwarded at face value");
        expect(race.second->eventsOf<typerace::PlayerFinishedEvent>().empty(), "finish not echoed to its sender");
        expect(room_state(*server, "FIN002") == RaceState::Finished, "explicit finish completes the race");

        send(*server, *race.second, finish);
        expect(race.first->eventsOf<typerace::PlayerFinishedEvent>().size() == 1, "duplicate finish ignored");
    }, failures);

    run_case("ready is ignored once the race has started", []() {
        auto server = make_server();
        auto race = start_race(*server, "RDY001");
        send(*server, *race.first, typerace::PlayerReadyEvent{"p1", false, typerace::now_ms()});
        expect(race.second->eventsOf<typerace::PlayerReadyEvent>().empty(), "no ready broadcast during the race");
        expect(room_state(*server, "RDY001") == RaceState::Active, "state unchanged");
    }, failures);

    run_case("heartbeat is echoed", []() {
        auto server = make_server();
        auto connection = join(*server, "BEAT01", "p1");
        send(*server, *connection, typerace::HeartbeatEvent{typerace::now_ms()});
        expect(connection->eventsOf<typerace::HeartbeatEvent>().size() == 1, "expected heartbeat echo");
    }, failures);

    run_case("liveness probes then evicts silent connections", []() {
        auto server = make_server();
        auto quiet = join(*server, "LIVE01", "p1");
        auto chatty = join(*server, "LIVE01", "p2");

        const auto now = SteadyClock::now();
        server->sweepLiveness(now);
        expect(quiet->pings() == 1 && chatty->pings() == 1, "first pass probes everyone");

        server->onPong(*chatty);
        server->sweepLiveness(now + 1s);

        expect(quiet->closeCode() == 1001, "unanswered probe evicts with going-away");
        expect(chatty->isOpen() && chatty->pings() == 2, "answered probe keeps the connection");
        expect(!server->rooms().find("LIVE01")->participant("p1"), "evicted waiting participant removed");

        server->sweepLiveness(now + 10min);
        expect(chatty->closeCode() == 1001, "silence beyond the timeout evicts");
    }, failures);

    run_case("reaper removes idle rooms after the grace period", []() {
        auto server = make_server();
        auto idle = join(*server, "IDLE01", "p1");
        join(*server, "BUSY01", "p2");
        server->onClose(*idle);

        const auto now = SteadyClock::now();
        expect(server->reapRooms(now).empty(), "rooms younger than the grace period are kept");

        const auto removed = server->reapRooms(now + 6min);
        expect(removed.size() == 1 && removed[0] == "IDLE01", "only the empty room is reaped");
        expect(!server->rooms().find("IDLE01"), "reaped room is gone");
        expect(server->rooms().find("BUSY01") != nullptr, "occupied room survives");

        auto again = join(*server, "IDLE01", "p1");
        expect(again->isOpen() && server->rooms().find("IDLE01"), "a reaped id can be reused");
    }, failures);

    run_case("passage provider rotates and falls back", []() {
        typerace::server::PassageTextProvider rotating({"one", "two"});
        expect(rotating.nextText() == "one" && rotating.nextText() == "two" && rotating.nextText() == "one", "rotation order");

        typerace::server::PassageTextProvider empty({});
        expect(empty.nextText() == typerace::server::default_reference_text(), "empty provider uses the built-in text");

        const auto path = std::filesystem::temp_directory_path() / "typerace_passages_test.txt";
        {
            std::ofstream out(path);
            out << "first passage\n\n  second passage  \n";
        }
        auto loaded = typerace::server::load_text_provider(path);
        expect(loaded->nextText() == "first passage", "first line");
        expect(loaded->nextText() == "second passage", "blank lines skipped and text trimmed");
        std::filesystem::remove(path);

        auto missing = typerace::server::load_text_provider(std::filesystem::temp_directory_path() / "typerace_missing_passages.txt");
        expect(missing->nextText() == typerace::server::default_reference_text(), "missing file falls back");
    }, failures);

    run_case("configuration from the environment", []() {
        setenv("TYPERACE_PORT", "9100", 1);
        setenv("TYPERACE_MAX_PLAYERS", "1000", 1);
        setenv("TYPERACE_TARGET_CHARS", "abc", 1);
        setenv("TYPERACE_LOG_LEVEL", "debug", 1);

        const auto config = typerace::server::load_server_config_from_env();
        expect(config.port == 9100, "port read");
        expect(config.roomDefaults.max_participants == 4, "out of range value ignored");
        expect(config.roomDefaults.target_char_count == 200, "unparsable value ignored");
        expect(config.logLevel == "debug", "log level read");

        unsetenv("TYPERACE_PORT");
        unsetenv("TYPERACE_MAX_PLAYERS");
        unsetenv("TYPERACE_TARGET_CHARS");
        unsetenv("TYPERACE_LOG_LEVEL");
    }, failures);

    if (failures == 0)
    {
        std::cout << "All room tests passed\n";
    }
    else
    {
        std::cerr << failures << " room test(s) failed\n";
    }

    return failures == 0 ? 0 : 1;
}
