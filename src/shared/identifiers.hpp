#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace typerace
{
    constexpr std::size_t room_code_length = 6;
    constexpr std::string_view room_code_alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

    // Random shareable code. Uniqueness is probabilistic only.
    [[nodiscard]] std::string generate_room_code();
    [[nodiscard]] bool is_room_code(std::string_view value) noexcept;

    // "player_<epoch ms>_<9 base36 chars>"
    [[nodiscard]] std::string generate_participant_id();
}
