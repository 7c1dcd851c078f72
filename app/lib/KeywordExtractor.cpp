#include "KeywordExtractor.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace {

const std::unordered_set<std::string>& stopwords() {
    static const std::unordered_set<std::string> kStopwords = {
        "the", "and", "for", "with", "from", "this", "that", "your", "you",
        "are", "was", "were", "been", "being", "have", "has", "had", "having",
        "does", "did", "doing", "will", "would", "could", "should", "may",
        "might", "must", "shall", "can", "need", "our", "ours", "their",
        // Noise words that show up in downloaded or edited filenames.
        "download", "file", "files", "copy", "new", "old", "final", "draft",
        "version", "ver", "rev", "edit", "edited", "original", "backup",
        "tmp", "temp", "test", "sample", "example", "demo", "untitled"
    };
    return kStopwords;
}

const std::unordered_map<std::string, FileTypeHint>& extension_hints() {
    static const std::unordered_map<std::string, FileTypeHint> kHints = {
        {"pdf", FileTypeHint::Document}, {"doc", FileTypeHint::Document}, {"docx", FileTypeHint::Document},
        {"txt", FileTypeHint::Document}, {"rtf", FileTypeHint::Document}, {"odt", FileTypeHint::Document},
        {"pages", FileTypeHint::Document},
        {"mp4", FileTypeHint::Video}, {"mov", FileTypeHint::Video}, {"avi", FileTypeHint::Video},
        {"mkv", FileTypeHint::Video}, {"wmv", FileTypeHint::Video}, {"flv", FileTypeHint::Video},
        {"webm", FileTypeHint::Video}, {"m4v", FileTypeHint::Video},
        {"mp3", FileTypeHint::Audio}, {"wav", FileTypeHint::Audio}, {"aac", FileTypeHint::Audio},
        {"flac", FileTypeHint::Audio}, {"m4a", FileTypeHint::Audio}, {"ogg", FileTypeHint::Audio},
        {"wma", FileTypeHint::Audio},
        {"jpg", FileTypeHint::Image}, {"jpeg", FileTypeHint::Image}, {"png", FileTypeHint::Image},
        {"gif", FileTypeHint::Image}, {"bmp", FileTypeHint::Image}, {"tiff", FileTypeHint::Image},
        {"webp", FileTypeHint::Image}, {"heic", FileTypeHint::Image}, {"svg", FileTypeHint::Image},
        {"zip", FileTypeHint::Archive}, {"rar", FileTypeHint::Archive}, {"7z", FileTypeHint::Archive},
        {"tar", FileTypeHint::Archive}, {"gz", FileTypeHint::Archive}, {"bz2", FileTypeHint::Archive},
        {"app", FileTypeHint::Application}, {"exe", FileTypeHint::Application},
        {"dmg", FileTypeHint::Application}, {"pkg", FileTypeHint::Application}
    };
    return kHints;
}

const std::vector<std::string>& month_abbreviations() {
    static const std::vector<std::string> kMonths = {
        "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"
    };
    return kMonths;
}

const std::vector<std::string>& month_names() {
    static const std::vector<std::string> kMonths = {
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december"
    };
    return kMonths;
}

bool is_separator(char ch) {
    static const std::string separators = "_-.()[]{}";
    return separators.find(ch) != std::string::npos || std::isspace(static_cast<unsigned char>(ch));
}

bool is_numeric(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch);
    });
}

// Splits "HTTPServerLog2024" into HTTP, Server, Log, 2024.
std::vector<std::string> split_camel_case(const std::string& token) {
    std::vector<std::string> parts;
    std::string current;
    for (size_t i = 0; i < token.size(); ++i) {
        const auto ch = static_cast<unsigned char>(token[i]);
        if (!current.empty()) {
            const auto prev = static_cast<unsigned char>(current.back());
            const bool next_is_lower = i + 1 < token.size() &&
                std::islower(static_cast<unsigned char>(token[i + 1]));
            const bool lower_to_upper = std::islower(prev) && std::isupper(ch);
            const bool acronym_end = std::isupper(prev) && std::isupper(ch) && next_is_lower;
            const bool alpha_digit = (std::isalpha(prev) && std::isdigit(ch)) ||
                                     (std::isdigit(prev) && std::isalpha(ch));
            if (lower_to_upper || acronym_end || alpha_digit) {
                parts.push_back(current);
                current.clear();
            }
        }
        current.push_back(static_cast<char>(ch));
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

std::string strip_extension(const std::string& filename, std::string* extension) {
    const auto dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= filename.size()) {
        if (extension) {
            extension->clear();
        }
        return filename;
    }
    if (extension) {
        *extension = Utils::to_lower_copy(filename.substr(dot + 1));
    }
    return filename.substr(0, dot);
}

} // namespace

KeywordExtractor::KeywordExtractor()
    : config_(Config::fast()) {}

KeywordExtractor::KeywordExtractor(Config config)
    : config_(config) {}

bool KeywordExtractor::is_stopword(const std::string& word)
{
    return stopwords().contains(word);
}

FileTypeHint KeywordExtractor::file_type_for_extension(const std::string& extension)
{
    std::string normalized = Utils::to_lower_copy(extension);
    if (!normalized.empty() && normalized.front() == '.') {
        normalized.erase(normalized.begin());
    }
    const auto& hints = extension_hints();
    auto it = hints.find(normalized);
    return it == hints.end() ? FileTypeHint::Other : it->second;
}

std::vector<std::string> KeywordExtractor::tokenize(const std::string& name_without_extension)
{
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (current.empty()) {
            return;
        }
        for (auto& part : split_camel_case(current)) {
            tokens.push_back(Utils::to_lower_copy(std::move(part)));
        }
        current.clear();
    };
    for (char ch : name_without_extension) {
        if (is_separator(ch)) {
            flush();
        } else {
            current.push_back(ch);
        }
    }
    flush();
    return tokens;
}

std::string KeywordExtractor::stem(const std::string& word)
{
    auto ends_with = [&word](const std::string& suffix) {
        return word.size() > suffix.size() &&
               word.compare(word.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (word.size() > 4 && ends_with("ies")) {
        return word.substr(0, word.size() - 3) + "y";
    }
    if (word.size() > 5 && ends_with("ing")) {
        return word.substr(0, word.size() - 3);
    }
    if (word.size() > 4 && ends_with("ed")) {
        return word.substr(0, word.size() - 2);
    }
    if (word.size() > 3 && ends_with("s") && !ends_with("ss")) {
        return word.substr(0, word.size() - 1);
    }
    return word;
}

ExtractedKeywords KeywordExtractor::extract(const ScannedFile& file) const
{
    ExtractedKeywords result = extract(file.name, file.id);
    result.source_path = file.path;
    return result;
}

ExtractedKeywords KeywordExtractor::extract(const std::string& filename, const std::string& file_id) const
{
    ExtractedKeywords result;
    result.file_id = file_id.empty() ? filename : file_id;
    result.original_filename = filename;

    std::string extension;
    const std::string base_name = strip_extension(filename, &extension);
    result.file_type = file_type_for_extension(extension);

    const auto tokens = tokenize(base_name);
    for (const auto& token : tokens) {
        if (token.size() < config_.min_keyword_length || is_numeric(token)) {
            continue;
        }
        if (config_.remove_stopwords && is_stopword(token)) {
            continue;
        }
        result.keywords.insert(token);
        if (config_.use_stemming) {
            result.stemmed_keywords.insert(stem(token));
        }
    }

    result.date_info = extract_date(base_name, tokens);
    return result;
}

std::vector<ExtractedKeywords> KeywordExtractor::extract_batch(const std::vector<ScannedFile>& files) const
{
    std::vector<ExtractedKeywords> extracted;
    extracted.reserve(files.size());
    for (const auto& file : files) {
        extracted.push_back(extract(file));
    }
    return extracted;
}

std::map<std::string, std::size_t> KeywordExtractor::keyword_frequencies(
    const std::vector<ExtractedKeywords>& extracted)
{
    std::map<std::string, std::size_t> frequencies;
    for (const auto& entry : extracted) {
        for (const auto& keyword : entry.keywords) {
            ++frequencies[keyword];
        }
    }
    return frequencies;
}

std::optional<DateInfo> KeywordExtractor::extract_date(const std::string& base_name,
                                                       const std::vector<std::string>& raw_tokens) const
{
    static const std::regex year_pattern(R"((?:^|[^0-9])((?:19|20)[0-9]{2})(?:[^0-9]|$))");
    static const std::regex quarter_pattern(R"((?:^|[^A-Za-z])[Qq]([1-4])(?:[^0-9]|$))");

    DateInfo info;
    std::smatch match;
    if (std::regex_search(base_name, match, year_pattern)) {
        info.year = std::stoi(match[1].str());
        return info;
    }
    if (std::regex_search(base_name, match, quarter_pattern)) {
        info.quarter = "Q" + match[1].str();
        return info;
    }

    const auto& abbreviations = month_abbreviations();
    const auto& names = month_names();
    for (const auto& token : raw_tokens) {
        for (size_t i = 0; i < abbreviations.size(); ++i) {
            if (token == abbreviations[i] || token == names[i]) {
                info.month = static_cast<int>(i) + 1;
                return info;
            }
        }
    }
    return std::nullopt;
}
