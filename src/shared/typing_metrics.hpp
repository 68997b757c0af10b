#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace typerace
{
    // Word segmentation used for reference texts; separators are single spaces.
    [[nodiscard]] std::vector<std::string> split_words(std::string_view text);

    // Positions where input matches reference, compared index by index.
    [[nodiscard]] std::int64_t count_matching_chars(std::string_view input, std::string_view reference) noexcept;

    // Standard 5 characters per word.
    [[nodiscard]] double calculate_wpm(std::int64_t correct_chars, std::int64_t elapsed_ms) noexcept;
    [[nodiscard]] double calculate_accuracy(std::int64_t correct_chars, std::int64_t total_chars) noexcept;
    [[nodiscard]] double progress_percent(std::int64_t correct_chars, std::int64_t target_chars) noexcept;
}
