#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace typerace::server
{
    // One live transport connection as seen by the race logic.
    class Connection
    {
    public:
        virtual ~Connection() = default;

        virtual std::uint64_t id() const noexcept = 0;
        virtual bool isOpen() const noexcept = 0;
        virtual const std::string& remoteAddress() const noexcept = 0;

        // Best effort; failures are logged and mark the connection closed.
        virtual void sendText(const std::string& text) = 0;
        virtual void sendPing() = 0;
        virtual void close(std::uint16_t code, const std::string& reason) = 0;
    };

    // Join parameters carried on the upgrade request.
    struct JoinRequest
    {
        std::string roomId;
        std::string participantId;
        std::optional<std::string> displayName;
    };

    class ConnectionListener
    {
    public:
        virtual ~ConnectionListener() = default;

        virtual void onOpen(const std::shared_ptr<Connection>& connection, const JoinRequest& request) = 0;
        virtual void onMessage(Connection& connection, const std::string& text) = 0;
        virtual void onPong(Connection& connection) = 0;
        virtual void onClose(Connection& connection) = 0;
    };
}
