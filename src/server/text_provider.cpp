#include "text_provider.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <utility>

namespace typerace::server
{
    namespace
    {
        std::string trimmed(const std::string& value)
        {
            auto begin = value.find_first_not_of(" \t\r\n");
            auto end = value.find_last_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return {};
            }
            return value.substr(begin, end - begin + 1);
        }
    }

    PassageTextProvider::PassageTextProvider(std::vector<std::string> passages)
        : passages_(std::move(passages))
    {
        if (passages_.empty())
        {
            passages_.push_back(default_reference_text());
        }
    }

    std::string PassageTextProvider::nextText()
    {
        std::lock_guard<std::mutex> guard(mutex_);
        const auto& passage = passages_[next_];
        next_ = (next_ + 1) % passages_.size();
        return passage;
    }

    const std::string& default_reference_text()
    {
        static const std::string text =
            "The quick brown fox jumps over the lazy dog. This pangram contains all letters of the alphabet and is "
            "commonly used for typing practice. Speed and accuracy are both important when learning to type "
            "efficiently. In the digital age, typing has become an essential skill for students, professionals, and "
            "everyday computer users. The ability to type quickly and accurately can significantly improve "
            "productivity and communication. Many people spend hours each day using keyboards, whether for work, "
            "education, or personal activities. Touch typing, which involves typing without looking at the keyboard, "
            "is considered the most efficient method. It allows typists to focus on the content they are creating "
            "rather than searching for individual keys. Learning proper finger placement and muscle memory takes "
            "practice and dedication. The home row keys serve as the foundation for touch typing technique. Each "
            "finger has designated keys to press, and with consistent practice, the movements become automatic. "
            "Regular typing exercises help develop speed while maintaining accuracy. It is better to type slowly and "
            "correctly than to type quickly with many errors. Proofreading and editing skills are equally important as "
            "typing speed. Many typing programs and games are available to help people improve their skills. These "
            "tools often include lessons, tests, and challenges that make learning more engaging and fun. Some focus "
            "on specific areas like number typing, special characters, or programming symbols. Setting realistic "
            "goals and tracking progress can help maintain motivation during the learning process. Professional "
            "typists and data entry specialists can achieve typing speeds of over one hundred words per minute. "
            "However, for most people, a typing speed of thirty to fifty words per minute is sufficient for daily "
            "tasks. The key is finding the right balance between speed and accuracy for your specific needs and "
            "requirements.";
        return text;
    }

    std::unique_ptr<ReferenceTextProvider> load_text_provider(const std::filesystem::path& file)
    {
        std::vector<std::string> passages;

        if (!file.empty())
        {
            std::ifstream stream(file);
            if (!stream.is_open())
            {
                spdlog::warn("Unable to open reference text file {}; using built-in text", file.string());
            }
            else
            {
                std::string line;
                while (std::getline(stream, line))
                {
                    auto passage = trimmed(line);
                    if (!passage.empty())
                    {
                        passages.push_back(std::move(passage));
                    }
                }
                spdlog::info("Loaded {} reference passage(s) from {}", passages.size(), file.string());
            }
        }

        return std::make_unique<PassageTextProvider>(std::move(passages));
    }
}
