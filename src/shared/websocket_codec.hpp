#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <asio.hpp>

namespace typerace::ws
{
    constexpr const char* websocket_guid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    constexpr std::size_t max_header_bytes = 16384;
    constexpr std::uint64_t max_payload_bytes = 1 << 20;

    enum class Opcode : unsigned char
    {
        Continuation = 0x0,
        Text = 0x1,
        Binary = 0x2,
        Close = 0x8,
        Ping = 0x9,
        Pong = 0xA
    };

    namespace close_code
    {
        constexpr std::uint16_t normal = 1000;
        constexpr std::uint16_t going_away = 1001;
        constexpr std::uint16_t abnormal = 1006;
        constexpr std::uint16_t policy_violation = 1008;
        constexpr std::uint16_t message_too_big = 1009;
        constexpr std::uint16_t try_again_later = 1013;
    }

    struct Frame
    {
        Opcode opcode{Opcode::Text};
        bool fin{true};
        std::string payload;
    };

    // Client to server frames must be masked (RFC 6455 5.3).
    [[nodiscard]] std::vector<unsigned char> encode_frame(Opcode opcode, std::string_view payload, bool masked);
    [[nodiscard]] std::string encode_close_payload(std::uint16_t code, std::string_view reason);
    [[nodiscard]] std::optional<std::uint16_t> decode_close_code(std::string_view payload);

    // Reads one frame, consuming bytes left over in `buffered` (e.g. from the
    // handshake) before touching the socket. Returns false on EOF or error.
    bool read_frame(asio::ip::tcp::socket& socket, std::string& buffered, Frame& frame);

    [[nodiscard]] std::string compute_accept_key(const std::string& client_key);
    [[nodiscard]] std::string generate_client_key();

    struct HttpHead
    {
        std::string start_line;
        std::unordered_map<std::string, std::string> headers;   // lower-cased names
    };

    [[nodiscard]] std::optional<HttpHead> parse_http_head(const std::string& head);
    [[nodiscard]] std::unordered_map<std::string, std::string> parse_query_params(const std::string& query);
    [[nodiscard]] std::string url_decode(const std::string& input);
    [[nodiscard]] std::string url_encode(std::string_view input);
    [[nodiscard]] std::string to_lower(std::string value);

    // Strict UTF-8: rejects overlong forms, surrogates and code points past U+10FFFF.
    [[nodiscard]] bool is_valid_utf8(std::string_view value) noexcept;

    // True when appending `incoming` bytes to a fragmented message would pass max_payload_bytes.
    [[nodiscard]] constexpr bool exceeds_message_limit(std::size_t assembled, std::size_t incoming) noexcept
    {
        return incoming > max_payload_bytes || assembled > max_payload_bytes - incoming;
    }
}
