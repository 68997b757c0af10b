#include "typing_metrics.hpp"

#include <algorithm>
#include <cmath>

namespace typerace
{
    std::vector<std::string> split_words(std::string_view text)
    {
        std::vector<std::string> words;
        std::size_t start = 0;
        while (start <= text.size())
        {
            std::size_t end = text.find(' ', start);
            if (end == std::string_view::npos)
            {
                end = text.size();
            }
            if (end > start)
            {
                words.emplace_back(text.substr(start, end - start));
            }
            start = end + 1;
        }
        return words;
    }

    std::int64_t count_matching_chars(std::string_view input, std::string_view reference) noexcept
    {
        const std::size_t limit = std::min(input.size(), reference.size());
        std::int64_t matches = 0;
        for (std::size_t i = 0; i < limit; ++i)
        {
            if (input[i] == reference[i])
            {
                ++matches;
            }
        }
        return matches;
    }

    double calculate_wpm(std::int64_t correct_chars, std::int64_t elapsed_ms) noexcept
    {
        if (elapsed_ms <= 0)
        {
            return 0.0;
        }

        const double minutes = static_cast<double>(elapsed_ms) / 60000.0;
        const double words = static_cast<double>(correct_chars) / 5.0;
        return std::round(words / minutes);
    }

    double calculate_accuracy(std::int64_t correct_chars, std::int64_t total_chars) noexcept
    {
        if (total_chars <= 0)
        {
            return 100.0;
        }
        return std::round(static_cast<double>(correct_chars) / static_cast<double>(total_chars) * 100.0);
    }

    double progress_percent(std::int64_t correct_chars, std::int64_t target_chars) noexcept
    {
        if (target_chars <= 0)
        {
            return 0.0;
        }
        return std::min(100.0, static_cast<double>(correct_chars) / static_cast<double>(target_chars) * 100.0);
    }
}
