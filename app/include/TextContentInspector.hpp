#ifndef TEXT_CONTENT_INSPECTOR_HPP
#define TEXT_CONTENT_INSPECTOR_HPP

#include "IInspector.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace spdlog { class logger; }

// Reads the leading bytes of text-like files. Other files yield a signal carrying only their kind.
class TextContentInspector : public IInspector {
public:
    struct Config {
        std::size_t quick_bytes{1024};
        std::size_t full_bytes{8192};
    };

    explicit TextContentInspector(std::shared_ptr<spdlog::logger> logger = nullptr);
    TextContentInspector(Config config, std::shared_ptr<spdlog::logger> logger);

    ContentSignal inspect(const ScannedFile& file, InspectionDepth depth) override;

    static bool is_text_extension(const std::string& extension);

private:
    std::string read_prefix(const std::string& path, std::size_t max_bytes) const;

    Config config_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
