#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <asio.hpp>

#include "race_protocol.hpp"
#include "websocket_codec.hpp"

namespace typerace::client
{
    enum class ConnectionStatus
    {
        Disconnected,
        Connecting,
        Connected,
        Reconnecting,
        Failed
    };

    [[nodiscard]] const char* to_string(ConnectionStatus status) noexcept;

    struct TransportConfig
    {
        std::string host{"127.0.0.1"};
        int port{8080};
        std::string path{"/race"};
        std::chrono::milliseconds connectTimeout{std::chrono::seconds(5)};
        std::chrono::milliseconds reconnectBase{std::chrono::seconds(1)};
        std::chrono::milliseconds reconnectCap{std::chrono::seconds(30)};
        int maxReconnectAttempts{10};
        std::chrono::milliseconds heartbeatInterval{std::chrono::seconds(30)};
    };

    // Delay before reconnect attempt n (1-based): base * 2^(n-1), capped.
    [[nodiscard]] std::chrono::milliseconds reconnect_delay(int attempt, std::chrono::milliseconds base, std::chrono::milliseconds cap) noexcept;

    class TransportListener
    {
    public:
        virtual ~TransportListener() = default;

        // Called on the transport's reader thread.
        virtual void onEvent(const Event& event) = 0;
        virtual void onStatusChanged(ConnectionStatus status) = 0;
        virtual void onTransportError(const std::string& message, ErrorCode code) = 0;
        virtual void onRoundTrip(std::int64_t rttMs) = 0;
    };

    // WebSocket client for one room and participant. Sends never block on a
    // missing connection: they are queued and flushed in order on (re)connect.
    class RaceTransport
    {
    public:
        RaceTransport(TransportConfig config, TransportListener& listener);
        ~RaceTransport();

        RaceTransport(const RaceTransport&) = delete;
        RaceTransport& operator=(const RaceTransport&) = delete;

        // Returns false if the upgrade is not acknowledged within the connect
        // timeout.
        bool connect(const std::string& roomId, const std::string& participantId, std::optional<std::string> displayName = std::nullopt);

        // Closes with 1000 and never reconnects.
        void disconnect();

        void send(const Event& event);

        ConnectionStatus status() const;
        std::size_t queuedCount() const;
        int reconnectAttempts() const;
        std::int64_t roundTripTime() const noexcept { return roundTripMs_.load(); }

    private:
        bool openSocket(std::string& error);
        std::optional<std::uint16_t> readUntilClosed();
        bool reconnect();
        void sessionLoop();
        void heartbeatLoop();
        void markConnected();
        void sendHeartbeat();
        bool writeFrameLocked(ws::Opcode opcode, std::string_view payload);
        void publishStatus(ConnectionStatus status);
        std::string buildRequestTarget() const;

        TransportConfig config_;
        TransportListener& listener_;
        std::string roomId_;
        std::string participantId_;
        std::optional<std::string> displayName_;

        asio::io_context io_;
        std::unique_ptr<asio::ip::tcp::socket> socket_;
        std::string buffered_;

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        ConnectionStatus status_{ConnectionStatus::Disconnected};
        std::deque<std::string> queue_;
        bool stopping_{false};
        int reconnectAttempts_{0};
        std::int64_t lastHeartbeatSentMs_{0};
        std::atomic<std::int64_t> roundTripMs_{0};

        std::thread sessionThread_;
        std::thread heartbeatThread_;
    };
}
