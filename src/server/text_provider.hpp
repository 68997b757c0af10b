#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace typerace::server
{
    // Supplies the reference text captured by a room when its countdown starts.
    class ReferenceTextProvider
    {
    public:
        virtual ~ReferenceTextProvider() = default;
        virtual std::string nextText() = 0;
    };

    // Hands out passages in rotation.
    class PassageTextProvider : public ReferenceTextProvider
    {
    public:
        explicit PassageTextProvider(std::vector<std::string> passages);

        std::string nextText() override;
        std::size_t passageCount() const noexcept { return passages_.size(); }

    private:
        std::vector<std::string> passages_;
        std::mutex mutex_;
        std::size_t next_{0};
    };

    const std::string& default_reference_text();

    // One passage per non-empty line. Falls back to the built-in text when the
    // file is missing or empty.
    std::unique_ptr<ReferenceTextProvider> load_text_provider(const std::filesystem::path& file);
}
