#include "race_transport.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <utility>
#include <variant>

namespace typerace::client
{
    const char* to_string(ConnectionStatus status) noexcept
    {
        switch (status)
        {
            case ConnectionStatus::Disconnected:
                return "disconnected";
            case ConnectionStatus::Connecting:
                return "connecting";
            case ConnectionStatus::Connected:
                return "connected";
            case ConnectionStatus::Reconnecting:
                return "reconnecting";
            case ConnectionStatus::Failed:
                return "failed";
        }
        return "unknown";
    }

    std::chrono::milliseconds reconnect_delay(int attempt, std::chrono::milliseconds base, std::chrono::milliseconds cap) noexcept
    {
        if (attempt < 1)
        {
            attempt = 1;
        }

        auto delay = base;
        for (int i = 1; i < attempt && delay < cap; ++i)
        {
            delay *= 2;
        }
        return delay < cap ? delay : cap;
    }

    RaceTransport::RaceTransport(TransportConfig config, TransportListener& listener)
        : config_(std::move(config))
        , listener_(listener)
    {
    }

    RaceTransport::~RaceTransport()
    {
        disconnect();
    }

    bool RaceTransport::connect(const std::string& roomId, const std::string& participantId, std::optional<std::string> displayName)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!stopping_ && (status_ == ConnectionStatus::Connected || status_ == ConnectionStatus::Reconnecting))
            {
                spdlog::warn("[client] connect called while {}", to_string(status_));
                return status_ == ConnectionStatus::Connected;
            }
        }

        // Clears out a session that ended on its own (rejected, failed or closed by the server).
        disconnect();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            roomId_ = roomId;
            participantId_ = participantId;
            displayName_ = std::move(displayName);
            stopping_ = false;
            reconnectAttempts_ = 0;
            status_ = ConnectionStatus::Connecting;
        }
        publishStatus(ConnectionStatus::Connecting);

        std::string error;
        if (!openSocket(error))
        {
            spdlog::warn("[client] unable to connect to {}:{} - {}", config_.host, config_.port, error);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                status_ = ConnectionStatus::Disconnected;
            }
            listener_.onTransportError("Unable to connect: " + error, ErrorCode::NetworkError);
            publishStatus(ConnectionStatus::Disconnected);
            return false;
        }

        spdlog::info("[client] connected to room {} as {}", roomId_, participantId_);
        markConnected();

        sessionThread_ = std::thread([this]() {
            sessionLoop();
        });
        heartbeatThread_ = std::thread([this]() {
            heartbeatLoop();
        });
        return true;
    }

    void RaceTransport::disconnect()
    {
        bool wasActive = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            wasActive = !stopping_ && status_ != ConnectionStatus::Disconnected;
            stopping_ = true;

            if (socket_ && socket_->is_open())
            {
                if (status_ == ConnectionStatus::Connected)
                {
                    writeFrameLocked(ws::Opcode::Close, ws::encode_close_payload(ws::close_code::normal, "Client disconnect"));
                }
                asio::error_code ec;
                socket_->shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            }
            status_ = ConnectionStatus::Disconnected;
        }
        cv_.notify_all();

        for (auto* thread : {&sessionThread_, &heartbeatThread_})
        {
            if (!thread->joinable())
            {
                continue;
            }
            if (thread->get_id() == std::this_thread::get_id())
            {
                thread->detach();
            }
            else
            {
                thread->join();
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (socket_)
            {
                asio::error_code ec;
                socket_->close(ec);
                socket_.reset();
            }
            buffered_.clear();
        }

        if (wasActive)
        {
            spdlog::info("[client] disconnected from room {}", roomId_);
            publishStatus(ConnectionStatus::Disconnected);
        }
    }

    void RaceTransport::send(const Event& event)
    {
        const auto text = encode_event(event);

        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == ConnectionStatus::Connected && writeFrameLocked(ws::Opcode::Text, text))
        {
            return;
        }

        if (status_ == ConnectionStatus::Failed)
        {
            spdlog::warn("[client] dropping {}: connection failed", event_type(event));
            return;
        }

        queue_.push_back(text);
        spdlog::debug("[client] queued {} while {} ({} pending)", event_type(event), to_string(status_), queue_.size());
    }

    ConnectionStatus RaceTransport::status() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    std::size_t RaceTransport::queuedCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    int RaceTransport::reconnectAttempts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return reconnectAttempts_;
    }

    std::string RaceTransport::buildRequestTarget() const
    {
        std::string target = config_.path + "?roomId=" + ws::url_encode(roomId_) + "&playerId=" + ws::url_encode(participantId_);
        if (displayName_ && !displayName_->empty())
        {
            target += "&playerName=" + ws::url_encode(*displayName_);
        }
        return target;
    }

    bool RaceTransport::openSocket(std::string& error)
    {
        io_.restart();
        auto socket = std::make_unique<asio::ip::tcp::socket>(io_);

        asio::error_code ec;
        asio::ip::tcp::resolver resolver(io_);
        const auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port), ec);
        if (ec)
        {
            error = "resolve failed: " + ec.message();
            return false;
        }

        const auto key = ws::generate_client_key();

        std::ostringstream request;
        request << "GET " << buildRequestTarget() << " HTTP/1.1\r\n";
        request << "Host: " << config_.host << ":" << config_.port << "\r\n";
        request << "Upgrade: websocket\r\n";
        request << "Connection: Upgrade\r\n";
        request << "Sec-WebSocket-Key: " << key << "\r\n";
        request << "Sec-WebSocket-Version: 13\r\n";
        request << "\r\n";
        const auto requestText = request.str();

        std::string response;
        bool finished = false;
        asio::error_code result;

        asio::async_connect(*socket, endpoints, [&](const asio::error_code& connectEc, const asio::ip::tcp::endpoint&) {
            if (connectEc)
            {
                result = connectEc;
                finished = true;
                return;
            }
            asio::async_write(*socket, asio::buffer(requestText), [&](const asio::error_code& writeEc, std::size_t) {
                if (writeEc)
                {
                    result = writeEc;
                    finished = true;
                    return;
                }
                asio::async_read_until(*socket, asio::dynamic_buffer(response, ws::max_header_bytes), "\r\n\r\n",
                                       [&](const asio::error_code& readEc, std::size_t) {
                                           result = readEc;
                                           finished = true;
                                       });
            });
        });

        io_.run_for(config_.connectTimeout);
        if (!finished)
        {
            socket->close(ec);
            io_.restart();
            io_.run();
            error = "no upgrade acknowledgment within " + std::to_string(config_.connectTimeout.count()) + " ms";
            return false;
        }
        if (result)
        {
            error = result.message();
            return false;
        }

        const auto headerEnd = response.find("\r\n\r\n");
        const auto head = ws::parse_http_head(response.substr(0, headerEnd));
        if (!head || head->start_line.find(" 101") == std::string::npos)
        {
            error = "upgrade refused: " + (head ? head->start_line : std::string{"malformed response"});
            return false;
        }

        const auto acceptIt = head->headers.find("sec-websocket-accept");
        if (acceptIt == head->headers.end() || acceptIt->second != ws::compute_accept_key(key))
        {
            error = "invalid Sec-WebSocket-Accept";
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        socket_ = std::move(socket);
        buffered_ = response.substr(headerEnd + 4);
        return true;
    }

    void RaceTransport::markConnected()
    {
        std::size_t flushed = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_ = ConnectionStatus::Connected;
            reconnectAttempts_ = 0;
            while (!queue_.empty())
            {
                if (!writeFrameLocked(ws::Opcode::Text, queue_.front()))
                {
                    break;
                }
                queue_.pop_front();
                ++flushed;
            }
        }

        if (flushed > 0)
        {
            spdlog::info("[client] flushed {} queued message(s)", flushed);
        }

        publishStatus(ConnectionStatus::Connected);
        sendHeartbeat();
    }

    void RaceTransport::sendHeartbeat()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != ConnectionStatus::Connected)
        {
            return;
        }

        lastHeartbeatSentMs_ = now_ms();
        writeFrameLocked(ws::Opcode::Text, encode_event(HeartbeatEvent{lastHeartbeatSentMs_}));
    }

    bool RaceTransport::writeFrameLocked(ws::Opcode opcode, std::string_view payload)
    {
        if (!socket_)
        {
            return false;
        }

        const auto frame = ws::encode_frame(opcode, payload, true);
        asio::error_code ec;
        asio::write(*socket_, asio::buffer(frame), ec);
        if (ec)
        {
            spdlog::debug("[client] write failed: {}", ec.message());
            return false;
        }
        return true;
    }

    std::optional<std::uint16_t> RaceTransport::readUntilClosed()
    {
        std::string message;
        bool assembling = false;
        ws::Frame frame;

        while (ws::read_frame(*socket_, buffered_, frame))
        {
            switch (frame.opcode)
            {
                case ws::Opcode::Text:
                case ws::Opcode::Continuation:
                {
                    if (frame.opcode == ws::Opcode::Continuation && !assembling)
                    {
                        break;
                    }
                    if (frame.opcode == ws::Opcode::Text)
                    {
                        message.clear();
                    }
                    if (ws::exceeds_message_limit(message.size(), frame.payload.size()))
                    {
                        spdlog::warn("[client] server message exceeds {} bytes", ws::max_payload_bytes);
                        std::lock_guard<std::mutex> lock(mutex_);
                        writeFrameLocked(ws::Opcode::Close, ws::encode_close_payload(ws::close_code::message_too_big, "Message too big"));
                        return ws::close_code::message_too_big;
                    }
                    message += frame.payload;
                    assembling = !frame.fin;
                    if (assembling)
                    {
                        break;
                    }

                    std::string error;
                    auto event = validate_event(message, error);
                    if (!event)
                    {
                        spdlog::warn("[client] invalid message from server: {}", error);
                        listener_.onTransportError("Invalid message format: " + error, ErrorCode::InvalidMessage);
                        break;
                    }

                    if (std::holds_alternative<HeartbeatEvent>(*event))
                    {
                        std::int64_t sentAt = 0;
                        {
                            std::lock_guard<std::mutex> lock(mutex_);
                            sentAt = lastHeartbeatSentMs_;
                        }
                        if (sentAt > 0)
                        {
                            const auto rtt = now_ms() - sentAt;
                            roundTripMs_.store(rtt);
                            listener_.onRoundTrip(rtt);
                        }
                        break;
                    }

                    try
                    {
                        listener_.onEvent(*event);
                    }
                    catch (const std::exception& ex)
                    {
                        spdlog::error("[client] {} handler failed: {}", event_type(*event), ex.what());
                    }
                    break;
                }
                case ws::Opcode::Ping:
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    writeFrameLocked(ws::Opcode::Pong, frame.payload);
                    break;
                }
                case ws::Opcode::Pong:
                    break;
                case ws::Opcode::Close:
                {
                    const auto code = ws::decode_close_code(frame.payload).value_or(ws::close_code::normal);
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (!stopping_)
                    {
                        writeFrameLocked(ws::Opcode::Close, ws::encode_close_payload(code, ""));
                    }
                    return code;
                }
                case ws::Opcode::Binary:
                    spdlog::debug("[client] binary frame ignored");
                    break;
            }
        }

        return std::nullopt;
    }

    void RaceTransport::sessionLoop()
    {
        while (true)
        {
            const auto closeCode = readUntilClosed();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_)
                {
                    return;
                }
                if (socket_)
                {
                    asio::error_code ec;
                    socket_->close(ec);
                }
            }

            if (closeCode && (*closeCode == ws::close_code::policy_violation || *closeCode == ws::close_code::try_again_later))
            {
                spdlog::warn("[client] server rejected the connection (close {})", *closeCode);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    status_ = ConnectionStatus::Failed;
                }
                publishStatus(ConnectionStatus::Failed);
                return;
            }

            if (closeCode && *closeCode == ws::close_code::normal)
            {
                spdlog::info("[client] server closed the connection");
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    status_ = ConnectionStatus::Disconnected;
                }
                publishStatus(ConnectionStatus::Disconnected);
                return;
            }

            spdlog::warn("[client] connection lost (close {}); reconnecting", closeCode.value_or(ws::close_code::abnormal));
            {
                std::lock_guard<std::mutex> lock(mutex_);
                status_ = ConnectionStatus::Reconnecting;
            }
            publishStatus(ConnectionStatus::Reconnecting);

            if (!reconnect())
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (stopping_)
                    {
                        return;
                    }
                    status_ = ConnectionStatus::Failed;
                }
                spdlog::error("[client] giving up after {} reconnect attempts", config_.maxReconnectAttempts);
                listener_.onTransportError("Reconnection failed", ErrorCode::NetworkError);
                publishStatus(ConnectionStatus::Failed);
                return;
            }
        }
    }

    bool RaceTransport::reconnect()
    {
        for (int attempt = 1; attempt <= config_.maxReconnectAttempts; ++attempt)
        {
            const auto delay = reconnect_delay(attempt, config_.reconnectBase, config_.reconnectCap);
            {
                std::unique_lock<std::mutex> lock(mutex_);
                reconnectAttempts_ = attempt;
                if (cv_.wait_for(lock, delay, [this]() { return stopping_; }))
                {
                    return false;
                }
            }

            spdlog::info("[client] reconnect attempt {}/{} after {} ms", attempt, config_.maxReconnectAttempts, delay.count());

            std::string error;
            if (!openSocket(error))
            {
                spdlog::warn("[client] reconnect attempt {} failed: {}", attempt, error);
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_)
                {
                    asio::error_code ec;
                    socket_->close(ec);
                    return false;
                }
            }

            markConnected();
            return true;
        }
        return false;
    }

    void RaceTransport::heartbeatLoop()
    {
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (cv_.wait_for(lock, config_.heartbeatInterval, [this]() { return stopping_; }))
                {
                    return;
                }
            }
            sendHeartbeat();
        }
    }

    void RaceTransport::publishStatus(ConnectionStatus status)
    {
        try
        {
            listener_.onStatusChanged(status);
        }
        catch (const std::exception& ex)
        {
            spdlog::error("[client] status handler failed: {}", ex.what());
        }
    }
}
