#include "identifiers.hpp"

#include "race_schema.hpp"

#include <algorithm>
#include <random>

namespace typerace
{
    namespace
    {
        constexpr std::string_view base36_alphabet = "0123456789abcdefghijklmnopqrstuvwxyz";

        std::mt19937& generator()
        {
            thread_local std::mt19937 engine{std::random_device{}()};
            return engine;
        }

        std::string random_string(std::string_view alphabet, std::size_t length)
        {
            std::uniform_int_distribution<std::size_t> pick(0, alphabet.size() - 1);
            std::string result;
            result.reserve(length);
            for (std::size_t i = 0; i < length; ++i)
            {
                result.push_back(alphabet[pick(generator())]);
            }
            return result;
        }
    }

    std::string generate_room_code()
    {
        return random_string(room_code_alphabet, room_code_length);
    }

    bool is_room_code(std::string_view value) noexcept
    {
        if (value.size() != room_code_length)
        {
            return false;
        }
        return std::all_of(value.begin(), value.end(), [](char c) {
            return room_code_alphabet.find(c) != std::string_view::npos;
        });
    }

    std::string generate_participant_id()
    {
        return "player_" + std::to_string(now_ms()) + "_" + random_string(base36_alphabet, 9);
    }
}
