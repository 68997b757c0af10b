#include "websocket_codec.hpp"

#include <openssl/sha.h>
#include <httplib.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <random>
#include <sstream>

namespace typerace::ws
{
    namespace
    {
        std::mt19937& generator()
        {
            thread_local std::mt19937 engine{std::random_device{}()};
            return engine;
        }

        bool read_exact(asio::ip::tcp::socket& socket, std::string& buffered, void* buffer, std::size_t length)
        {
            auto* out = static_cast<char*>(buffer);
            const std::size_t fromBuffer = std::min(length, buffered.size());
            if (fromBuffer > 0)
            {
                std::copy_n(buffered.data(), fromBuffer, out);
                buffered.erase(0, fromBuffer);
            }

            if (fromBuffer == length)
            {
                return true;
            }

            asio::error_code ec;
            asio::read(socket, asio::buffer(out + fromBuffer, length - fromBuffer), asio::transfer_exactly(length - fromBuffer), ec);
            return !ec;
        }

        std::string make_trimmed(const std::string& value)
        {
            auto begin = value.find_first_not_of(" \t\r\n");
            auto end = value.find_last_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return {};
            }
            return value.substr(begin, end - begin + 1);
        }

        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f')
            {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F')
            {
                return c - 'A' + 10;
            }
            return -1;
        }
    }

    std::vector<unsigned char> encode_frame(Opcode opcode, std::string_view payload, bool masked)
    {
        std::vector<unsigned char> frame;
        frame.reserve(payload.size() + 14);
        frame.push_back(static_cast<unsigned char>(0x80 | static_cast<unsigned char>(opcode)));

        const unsigned char maskBit = masked ? 0x80 : 0x00;
        const auto len = payload.size();
        if (len <= 125)
        {
            frame.push_back(static_cast<unsigned char>(maskBit | len));
        }
        else if (len <= 65535)
        {
            frame.push_back(static_cast<unsigned char>(maskBit | 126));
            frame.push_back(static_cast<unsigned char>((len >> 8) & 0xFF));
            frame.push_back(static_cast<unsigned char>(len & 0xFF));
        }
        else
        {
            frame.push_back(static_cast<unsigned char>(maskBit | 127));
            const std::uint64_t bigLen = static_cast<std::uint64_t>(len);
            for (int i = 7; i >= 0; --i)
            {
                frame.push_back(static_cast<unsigned char>((bigLen >> (i * 8)) & 0xFF));
            }
        }

        if (!masked)
        {
            frame.insert(frame.end(), payload.begin(), payload.end());
            return frame;
        }

        std::uniform_int_distribution<int> byte(0, 255);
        std::array<unsigned char, 4> mask{};
        for (auto& b : mask)
        {
            b = static_cast<unsigned char>(byte(generator()));
        }
        frame.insert(frame.end(), mask.begin(), mask.end());
        for (std::size_t i = 0; i < payload.size(); ++i)
        {
            frame.push_back(static_cast<unsigned char>(payload[i]) ^ mask[i % 4]);
        }
        return frame;
    }

    std::string encode_close_payload(std::uint16_t code, std::string_view reason)
    {
        std::string payload;
        payload.push_back(static_cast<char>((code >> 8) & 0xFF));
        payload.push_back(static_cast<char>(code & 0xFF));
        // control frame payloads are limited to 125 bytes
        payload.append(reason.substr(0, 123));
        return payload;
    }

    std::optional<std::uint16_t> decode_close_code(std::string_view payload)
    {
        if (payload.size() < 2)
        {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>((static_cast<unsigned char>(payload[0]) << 8) | static_cast<unsigned char>(payload[1]));
    }

    bool read_frame(asio::ip::tcp::socket& socket, std::string& buffered, Frame& frame)
    {
        std::array<unsigned char, 2> header{};
        if (!read_exact(socket, buffered, header.data(), header.size()))
        {
            return false;
        }

        frame.fin = (header[0] & 0x80) != 0;
        frame.opcode = static_cast<Opcode>(header[0] & 0x0F);
        const bool masked = (header[1] & 0x80) != 0;
        std::uint64_t payloadLength = header[1] & 0x7F;

        if (payloadLength == 126)
        {
            std::array<unsigned char, 2> extended{};
            if (!read_exact(socket, buffered, extended.data(), extended.size()))
            {
                return false;
            }
            payloadLength = static_cast<std::uint64_t>(extended[0]) << 8 | static_cast<std::uint64_t>(extended[1]);
        }
        else if (payloadLength == 127)
        {
            std::array<unsigned char, 8> extended{};
            if (!read_exact(socket, buffered, extended.data(), extended.size()))
            {
                return false;
            }
            payloadLength = 0;
            for (int i = 0; i < 8; ++i)
            {
                payloadLength = (payloadLength << 8) | extended[i];
            }
        }

        if (payloadLength > max_payload_bytes)
        {
            return false;
        }

        std::array<unsigned char, 4> mask{};
        if (masked && !read_exact(socket, buffered, mask.data(), mask.size()))
        {
            return false;
        }

        frame.payload.assign(static_cast<std::size_t>(payloadLength), '\0');
        if (payloadLength > 0)
        {
            if (!read_exact(socket, buffered, frame.payload.data(), frame.payload.size()))
            {
                return false;
            }
            if (masked)
            {
                for (std::size_t i = 0; i < frame.payload.size(); ++i)
                {
                    frame.payload[i] = static_cast<char>(frame.payload[i] ^ mask[i % 4]);
                }
            }
        }
        return true;
    }

    std::string compute_accept_key(const std::string& client_key)
    {
        const std::string source = client_key + websocket_guid;
        std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
        SHA1(reinterpret_cast<const unsigned char*>(source.data()), source.size(), digest.data());

        const std::string hashString(reinterpret_cast<const char*>(digest.data()), digest.size());
        return httplib::detail::base64_encode(hashString);
    }

    std::string generate_client_key()
    {
        std::uniform_int_distribution<int> byte(0, 255);
        std::string nonce(16, '\0');
        for (auto& c : nonce)
        {
            c = static_cast<char>(byte(generator()));
        }
        return httplib::detail::base64_encode(nonce);
    }

    std::optional<HttpHead> parse_http_head(const std::string& head)
    {
        std::istringstream stream(head);
        HttpHead result;
        if (!std::getline(stream, result.start_line))
        {
            return std::nullopt;
        }
        if (!result.start_line.empty() && result.start_line.back() == '\r')
        {
            result.start_line.pop_back();
        }

        std::string line;
        while (std::getline(stream, line))
        {
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            if (line.empty())
            {
                continue;
            }
            const auto colon = line.find(':');
            if (colon == std::string::npos)
            {
                continue;
            }
            std::string key = make_trimmed(line.substr(0, colon));
            std::string value = make_trimmed(line.substr(colon + 1));
            result.headers[to_lower(key)] = value;
        }
        return result;
    }

    std::unordered_map<std::string, std::string> parse_query_params(const std::string& query)
    {
        std::unordered_map<std::string, std::string> params;
        std::size_t pos = 0;
        while (pos < query.size())
        {
            const auto amp = query.find('&', pos);
            const auto pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
            if (!pair.empty())
            {
                const auto eq = pair.find('=');
                if (eq == std::string::npos)
                {
                    params.emplace(url_decode(pair), std::string{});
                }
                else
                {
                    params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
                }
            }
            pos = (amp == std::string::npos) ? query.size() : amp + 1;
        }

        return params;
    }

    std::string url_decode(const std::string& input)
    {
        std::string output;
        output.reserve(input.size());

        for (std::size_t i = 0; i < input.size(); ++i)
        {
            const char c = input[i];
            if (c == '%' && i + 2 < input.size())
            {
                const int hi = hex_value(input[i + 1]);
                const int lo = hex_value(input[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    output.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                    continue;
                }
            }
            else if (c == '+')
            {
                output.push_back(' ');
                continue;
            }

            output.push_back(c);
        }

        return output;
    }

    bool is_valid_utf8(std::string_view value) noexcept
    {
        std::size_t i = 0;
        while (i < value.size())
        {
            const auto lead = static_cast<unsigned char>(value[i]);
            if (lead < 0x80)
            {
                ++i;
                continue;
            }

            std::size_t length = 0;
            std::uint32_t codePoint = 0;
            if ((lead & 0xE0) == 0xC0)
            {
                length = 2;
                codePoint = lead & 0x1F;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                length = 3;
                codePoint = lead & 0x0F;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                length = 4;
                codePoint = lead & 0x07;
            }
            else
            {
                return false;
            }

            if (i + length > value.size())
            {
                return false;
            }

            for (std::size_t k = 1; k < length; ++k)
            {
                const auto next = static_cast<unsigned char>(value[i + k]);
                if ((next & 0xC0) != 0x80)
                {
                    return false;
                }
                codePoint = (codePoint << 6) | (next & 0x3F);
            }

            const bool overlong = (length == 2 && codePoint < 0x80) || (length == 3 && codePoint < 0x800) ||
                                  (length == 4 && codePoint < 0x10000);
            if (overlong || codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF))
            {
                return false;
            }

            i += length;
        }
        return true;
    }

    std::string url_encode(std::string_view input)
    {
        constexpr const char* hex = "0123456789ABCDEF";
        std::string output;
        output.reserve(input.size());
        for (const char c : input)
        {
            const auto u = static_cast<unsigned char>(c);
            if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~')
            {
                output.push_back(c);
            }
            else
            {
                output.push_back('%');
                output.push_back(hex[(u >> 4) & 0x0F]);
                output.push_back(hex[u & 0x0F]);
            }
        }
        return output;
    }

    std::string to_lower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return value;
    }
}
