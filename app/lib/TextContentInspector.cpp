#include "TextContentInspector.hpp"
#include "KeywordExtractor.hpp"
#include "TaxonomyErrors.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <unordered_set>
#include <utility>

namespace {

const std::unordered_set<std::string>& text_extensions()
{
    static const std::unordered_set<std::string> extensions = {
        "txt", "md", "markdown", "rst", "csv", "tsv", "json", "xml", "yaml", "yml",
        "ini", "cfg", "conf", "log", "html", "htm", "tex", "srt", "vtt", "sub",
        "c", "cc", "cpp", "h", "hpp", "py", "js", "ts", "java", "rs", "go", "sh",
        "sql", "css", "rtf"
    };
    return extensions;
}

// Drops an incomplete multi-byte sequence left at the end of a truncated read.
void trim_partial_utf8_tail(std::string& text)
{
    std::size_t back = 0;
    while (back < text.size() && back < 4) {
        const auto ch = static_cast<unsigned char>(text[text.size() - 1 - back]);
        if ((ch & 0xC0) != 0x80) {
            std::size_t expected = 1;
            if ((ch & 0xE0) == 0xC0) expected = 2;
            else if ((ch & 0xF0) == 0xE0) expected = 3;
            else if ((ch & 0xF8) == 0xF0) expected = 4;
            if (expected > back + 1) {
                text.resize(text.size() - back - 1);
            }
            return;
        }
        ++back;
    }
}

} // namespace

TextContentInspector::TextContentInspector(std::shared_ptr<spdlog::logger> logger)
    : TextContentInspector(Config{}, std::move(logger))
{
}

TextContentInspector::TextContentInspector(Config config, std::shared_ptr<spdlog::logger> logger)
    : config_(config),
      logger_(std::move(logger))
{
}

bool TextContentInspector::is_text_extension(const std::string& extension)
{
    std::string ext = Utils::to_lower_copy(extension);
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(ext.begin());
    }
    return text_extensions().count(ext) > 0;
}

ContentSignal TextContentInspector::inspect(const ScannedFile& file, InspectionDepth depth)
{
    ContentSignal signal;
    signal.kind = to_string(KeywordExtractor::file_type_for_extension(file.extension));

    if (!is_text_extension(file.extension)) {
        if (logger_) {
            logger_->debug("No content reader for '{}', using filename only", file.name);
        }
        return signal;
    }

    const std::size_t limit = depth == InspectionDepth::Quick ? config_.quick_bytes : config_.full_bytes;
    std::string text = read_prefix(file.path, limit);
    trim_partial_utf8_tail(text);
    if (!Utils::is_valid_utf8(text)) {
        throw ExtractionError("File '" + file.name + "' does not contain UTF-8 text");
    }

    signal.kind = "text";
    signal.text_cue = Utils::trim_copy(std::move(text));
    if (logger_) {
        logger_->debug("Read {} chars of text from '{}'", signal.text_cue.size(), file.name);
    }
    return signal;
}

std::string TextContentInspector::read_prefix(const std::string& path, std::size_t max_bytes) const
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ExtractionError("Unable to open '" + path + "'");
    }
    std::string buffer(max_bytes, '\0');
    in.read(buffer.data(), static_cast<std::streamsize>(max_bytes));
    if (in.bad()) {
        throw ExtractionError("Read error on '" + path + "'");
    }
    buffer.resize(static_cast<std::size_t>(in.gcount()));
    return buffer;
}
