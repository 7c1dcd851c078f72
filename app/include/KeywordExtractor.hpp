#ifndef KEYWORD_EXTRACTOR_HPP
#define KEYWORD_EXTRACTOR_HPP

#include "Types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct DateInfo {
    std::optional<int> year;
    std::optional<std::string> quarter;
    std::optional<int> month;
};

struct ExtractedKeywords {
    std::string file_id;
    std::string original_filename;
    std::string source_path;
    std::set<std::string> keywords;
    std::set<std::string> stemmed_keywords;
    std::optional<DateInfo> date_info;
    FileTypeHint file_type{FileTypeHint::Other};
};

// Turns a filename into a normalized keyword set plus date and file-type hints.
// Stateless apart from its configuration; never throws for any filename.
class KeywordExtractor {
public:
    struct Config {
        std::size_t min_keyword_length{3};
        bool remove_stopwords{true};
        bool use_stemming{false};

        static Config fast() { return Config{3, true, false}; }
        static Config quality() { return Config{3, true, true}; }
    };

    KeywordExtractor();
    explicit KeywordExtractor(Config config);

    ExtractedKeywords extract(const ScannedFile& file) const;
    ExtractedKeywords extract(const std::string& filename, const std::string& file_id = std::string()) const;
    std::vector<ExtractedKeywords> extract_batch(const std::vector<ScannedFile>& files) const;

    static std::map<std::string, std::size_t> keyword_frequencies(const std::vector<ExtractedKeywords>& extracted);
    static FileTypeHint file_type_for_extension(const std::string& extension);
    static std::vector<std::string> tokenize(const std::string& name_without_extension);
    static std::string stem(const std::string& word);
    static bool is_stopword(const std::string& word);

    const Config& config() const { return config_; }

private:
    std::optional<DateInfo> extract_date(const std::string& base_name,
                                         const std::vector<std::string>& raw_tokens) const;

    Config config_;
};

#endif
