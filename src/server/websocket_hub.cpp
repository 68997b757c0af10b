#include "websocket_hub.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "websocket_codec.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <utility>

namespace
{
    std::string make_http_error_response(int status, const std::string& message)
    {
        nlohmann::json payload{{"status", "error"}, {"message", message}};
        const auto body = payload.dump();

        std::ostringstream oss;
        oss << "HTTP/1.1 " << status << " Error\r\n";
        oss << "Content-Type: application/json\r\n";
        oss << "Content-Length: " << body.size() << "\r\n";
        oss << "Connection: close\r\n\r\n";
        oss << body;
        return oss.str();
    }
}

namespace typerace::server
{
    class WebSocketHub::WebSocketConnection : public Connection
    {
    public:
        WebSocketConnection(std::uint64_t id, asio::ip::tcp::socket socket)
            : id_(id)
            , socket_(std::move(socket))
        {
            asio::error_code ec;
            const auto endpoint = socket_.remote_endpoint(ec);
            remoteAddress_ = ec ? std::string{"unknown"} : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

        ~WebSocketConnection() override
        {
            shutdownSocket();
            if (readerThread_.joinable())
            {
                if (readerThread_.get_id() == std::this_thread::get_id())
                {
                    readerThread_.detach();
                }
                else
                {
                    readerThread_.join();
                }
            }
        }

        std::uint64_t id() const noexcept override { return id_; }
        bool isOpen() const noexcept override { return open_.load(); }
        const std::string& remoteAddress() const noexcept override { return remoteAddress_; }

        void sendText(const std::string& text) override
        {
            if (!open_.load())
            {
                return;
            }
            writeFrame(ws::Opcode::Text, text);
        }

        void sendPing() override
        {
            if (!open_.load())
            {
                return;
            }
            tryWriteFrame(ws::Opcode::Ping, {});
        }

        void close(std::uint16_t code, const std::string& reason) override
        {
            if (!open_.exchange(false))
            {
                return;
            }

            spdlog::debug("[ws] closing connection {} ({}): {} {}", id_, remoteAddress_, code, reason);
            tryWriteFrame(ws::Opcode::Close, ws::encode_close_payload(code, reason));
            shutdownSocket();
        }

        void markOpen() noexcept { open_.store(true); }
        void markClosed() noexcept { open_.store(false); }

        bool writeFrame(ws::Opcode opcode, std::string_view payload)
        {
            const auto frame = ws::encode_frame(opcode, payload, false);

            std::lock_guard<std::mutex> lock(writeMutex_);
            asio::error_code ec;
            asio::write(socket_, asio::buffer(frame), ec);
            if (ec)
            {
                spdlog::debug("[ws] failed to send to {}: {}", remoteAddress_, ec.message());
                open_.store(false);
                return false;
            }
            return true;
        }

        // Control frames never queue behind a stalled write; shutting the socket down unblocks it.
        bool tryWriteFrame(ws::Opcode opcode, std::string_view payload)
        {
            const auto frame = ws::encode_frame(opcode, payload, false);

            std::unique_lock<std::mutex> lock(writeMutex_, std::try_to_lock);
            if (!lock.owns_lock())
            {
                spdlog::debug("[ws] write to {} in progress; skipping {} frame", remoteAddress_, static_cast<int>(opcode));
                return false;
            }

            asio::error_code ec;
            asio::write(socket_, asio::buffer(frame), ec);
            if (ec)
            {
                spdlog::debug("[ws] failed to send to {}: {}", remoteAddress_, ec.message());
                open_.store(false);
                return false;
            }
            return true;
        }

        void writeRaw(const std::string& data)
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            asio::error_code ec;
            asio::write(socket_, asio::buffer(data), ec);
            if (ec)
            {
                spdlog::debug("[ws] failed to send to {}: {}", remoteAddress_, ec.message());
            }
        }

        void shutdownSocket()
        {
            asio::error_code ec;
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        }

        void closeSocket()
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            asio::error_code ec;
            socket_.close(ec);
        }

        asio::ip::tcp::socket& socket() noexcept { return socket_; }
        std::string& buffered() noexcept { return buffered_; }
        std::thread& readerThread() noexcept { return readerThread_; }

    private:
        const std::uint64_t id_;
        asio::ip::tcp::socket socket_;
        std::string remoteAddress_;
        std::string buffered_;
        std::mutex writeMutex_;
        std::thread readerThread_;
        std::atomic_bool open_{false};
    };

    WebSocketHub::WebSocketHub(Config config, ConnectionListener& listener)
        : config_(std::move(config))
        , listener_(listener)
        , io_()
        , acceptor_(io_)
    {
    }

    WebSocketHub::~WebSocketHub()
    {
        stop();
    }

    bool WebSocketHub::start()
    {
        if (running_.exchange(true))
        {
            return true;
        }

        asio::error_code ec;
        const auto address = asio::ip::make_address(config_.host, ec);
        if (ec)
        {
            spdlog::error("[ws] invalid host {}: {}", config_.host, ec.message());
            running_.store(false);
            return false;
        }

        asio::ip::tcp::endpoint endpoint(address, static_cast<unsigned short>(config_.port));

        acceptor_.open(endpoint.protocol(), ec);
        if (ec)
        {
            spdlog::error("[ws] failed to open acceptor: {}", ec.message());
            running_.store(false);
            return false;
        }

        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
        if (ec)
        {
            spdlog::warn("[ws] reuse_address failed: {}", ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec)
        {
            spdlog::error("[ws] failed to bind {}:{} - {}", config_.host, config_.port, ec.message());
            acceptor_.close(ec);
            running_.store(false);
            return false;
        }

        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
        if (ec)
        {
            spdlog::error("[ws] listen failed: {}", ec.message());
            acceptor_.close(ec);
            running_.store(false);
            return false;
        }

        // Port 0 asks the OS for a free port.
        config_.port = static_cast<int>(acceptor_.local_endpoint().port());

        acceptThread_ = std::thread([this]() {
            acceptLoop();
        });

        spdlog::info("[ws] listening on ws://{}:{}{}", config_.host, config_.port, config_.path);
        return true;
    }

    void WebSocketHub::stop()
    {
        if (!running_.exchange(false))
        {
            return;
        }

        // A blocking accept() is not interrupted by closing the acceptor on
        // every platform; poke it with a loopback connection instead.
        {
            asio::error_code ec;
            auto target = acceptor_.local_endpoint(ec);
            if (!ec)
            {
                if (target.address().is_unspecified())
                {
                    target.address(target.address().is_v6()
                        ? asio::ip::address(asio::ip::address_v6::loopback())
                        : asio::ip::address(asio::ip::address_v4::loopback()));
                }
                asio::io_context wakeIo;
                asio::ip::tcp::socket wake(wakeIo);
                wake.connect(target, ec);
                wake.close(ec);
            }
        }

        if (acceptThread_.joinable())
        {
            acceptThread_.join();
        }

        asio::error_code ec;
        acceptor_.close(ec);

        std::vector<std::shared_ptr<WebSocketConnection>> connections;
        {
            std::lock_guard<std::mutex> guard(connectionsMutex_);
            connections.swap(connections_);
        }

        for (auto& connection : connections)
        {
            connection->close(ws::close_code::going_away, "server shutting down");
            connection->shutdownSocket();
        }

        for (auto& connection : connections)
        {
            if (connection->readerThread().joinable())
            {
                connection->readerThread().join();
            }
        }

        spdlog::info("[ws] hub stopped");
    }

    std::size_t WebSocketHub::connectionCount() const
    {
        std::lock_guard<std::mutex> guard(connectionsMutex_);
        return connections_.size();
    }

    void WebSocketHub::acceptLoop()
    {
        while (running_.load())
        {
            asio::error_code ec;
            asio::ip::tcp::socket socket(io_);
            acceptor_.accept(socket, ec);
            if (!running_.load())
            {
                socket.close(ec);
                break;
            }
            if (ec)
            {
                spdlog::warn("[ws] accept failed: {}", ec.message());
                continue;
            }

            auto connection = std::make_shared<WebSocketConnection>(nextConnectionId_.fetch_add(1), std::move(socket));

            std::lock_guard<std::mutex> guard(connectionsMutex_);
            connections_.push_back(connection);
            connection->readerThread() = std::thread([this, connection]() {
                connectionLoop(connection);
            });
        }
    }

    bool WebSocketHub::performHandshake(WebSocketConnection& connection, JoinRequest& request)
    {
        try
        {
            auto& buffer = connection.buffered();
            while (buffer.find("\r\n\r\n") == std::string::npos)
            {
                std::array<char, 512> temp{};
                const auto bytes = connection.socket().read_some(asio::buffer(temp));
                if (bytes == 0)
                {
                    return false;
                }
                buffer.append(temp.data(), bytes);
                if (buffer.size() > ws::max_header_bytes)
                {
                    connection.writeRaw(make_http_error_response(431, "Request header too large"));
                    return false;
                }
            }

            const auto headerEnd = buffer.find("\r\n\r\n");
            const auto head = ws::parse_http_head(buffer.substr(0, headerEnd));
            // Anything after the header belongs to the first frame.
            buffer.erase(0, headerEnd + 4);

            if (!head)
            {
                connection.writeRaw(make_http_error_response(400, "Malformed request"));
                return false;
            }

            std::istringstream requestLineStream(head->start_line);
            std::string method;
            std::string target;
            std::string version;
            requestLineStream >> method >> target >> version;
            if (method != "GET")
            {
                connection.writeRaw(make_http_error_response(405, "Only GET supported for WebSocket handshake"));
                return false;
            }

            std::string path = target;
            std::string query;
            const auto queryPos = target.find('?');
            if (queryPos != std::string::npos)
            {
                path = target.substr(0, queryPos);
                query = target.substr(queryPos + 1);
            }

            if (path != config_.path)
            {
                connection.writeRaw(make_http_error_response(404, "Unknown WebSocket endpoint"));
                return false;
            }

            const auto& headers = head->headers;
            const auto upgradeIt = headers.find("upgrade");
            const auto connectionIt = headers.find("connection");
            const auto keyIt = headers.find("sec-websocket-key");

            if (upgradeIt == headers.end() || ws::to_lower(upgradeIt->second) != "websocket" ||
                connectionIt == headers.end() || ws::to_lower(connectionIt->second).find("upgrade") == std::string::npos ||
                keyIt == headers.end())
            {
                connection.writeRaw(make_http_error_response(400, "Missing required WebSocket headers"));
                return false;
            }

            const auto params = ws::parse_query_params(query);
            if (auto it = params.find("roomId"); it != params.end())
            {
                request.roomId = it->second;
            }
            if (auto it = params.find("playerId"); it != params.end())
            {
                request.participantId = it->second;
            }
            if (auto it = params.find("playerName"); it != params.end() && !it->second.empty())
            {
                request.displayName = it->second;
            }

            std::ostringstream response;
            response << "HTTP/1.1 101 Switching Protocols\r\n";
            response << "Upgrade: websocket\r\n";
            response << "Connection: Upgrade\r\n";
            response << "Sec-WebSocket-Accept: " << ws::compute_accept_key(keyIt->second) << "\r\n";
            response << "Sec-WebSocket-Version: 13\r\n";
            response << "Access-Control-Allow-Origin: *\r\n";
            response << "\r\n";

            const auto handshake = response.str();
            asio::write(connection.socket(), asio::buffer(handshake));
            return true;
        }
        catch (const std::exception& ex)
        {
            spdlog::warn("[ws] handshake exception from {}: {}", connection.remoteAddress(), ex.what());
            return false;
        }
    }

    void WebSocketHub::connectionLoop(std::shared_ptr<WebSocketConnection> connection)
    {
        JoinRequest request;
        if (!performHandshake(*connection, request))
        {
            connection->closeSocket();
            forget(*connection);
            return;
        }

        connection->markOpen();
        spdlog::debug("[ws] connection {} opened from {}", connection->id(), connection->remoteAddress());

        try
        {
            listener_.onOpen(connection, request);

            std::string message;
            bool assembling = false;
            ws::Frame frame;
            while (ws::read_frame(connection->socket(), connection->buffered(), frame))
            {
                switch (frame.opcode)
                {
                    case ws::Opcode::Text:
                    case ws::Opcode::Continuation:
                    {
                        if (frame.opcode == ws::Opcode::Continuation && !assembling)
                        {
                            spdlog::debug("[ws] unexpected continuation frame from {}", connection->remoteAddress());
                            break;
                        }
                        if (frame.opcode == ws::Opcode::Text)
                        {
                            message.clear();
                        }
                        if (ws::exceeds_message_limit(message.size(), frame.payload.size()))
                        {
                            spdlog::warn("[ws] message from {} exceeds {} bytes", connection->remoteAddress(), ws::max_payload_bytes);
                            connection->close(ws::close_code::message_too_big, "Message too big");
                            break;
                        }
                        message += frame.payload;
                        assembling = !frame.fin;
                        if (frame.fin)
                        {
                            listener_.onMessage(*connection, message);
                        }
                        break;
                    }
                    case ws::Opcode::Ping:
                        if (connection->isOpen())
                        {
                            connection->writeFrame(ws::Opcode::Pong, frame.payload);
                        }
                        break;
                    case ws::Opcode::Pong:
                        listener_.onPong(*connection);
                        break;
                    case ws::Opcode::Close:
                    {
                        const auto code = ws::decode_close_code(frame.payload).value_or(ws::close_code::normal);
                        spdlog::debug("[ws] connection {} sent close {}", connection->id(), code);
                        connection->close(code, "");
                        break;
                    }
                    case ws::Opcode::Binary:
                        spdlog::debug("[ws] binary frame from {} ignored", connection->remoteAddress());
                        break;
                }

                if (frame.opcode == ws::Opcode::Close || !connection->isOpen())
                {
                    break;
                }
            }
        }
        catch (const std::exception& ex)
        {
            spdlog::warn("[ws] connection {} failed: {}", connection->id(), ex.what());
        }

        connection->markClosed();
        connection->shutdownSocket();

        try
        {
            listener_.onClose(*connection);
        }
        catch (const std::exception& ex)
        {
            spdlog::error("[ws] close handling for connection {} failed: {}", connection->id(), ex.what());
        }

        connection->closeSocket();
        spdlog::debug("[ws] connection {} closed", connection->id());
        forget(*connection);
    }

    void WebSocketHub::forget(const WebSocketConnection& connection)
    {
        std::lock_guard<std::mutex> guard(connectionsMutex_);
        connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                          [&connection](const auto& candidate) { return candidate.get() == &connection; }),
                           connections_.end());
    }
}
