#ifndef SEMANTIC_THEME_CLUSTERER_HPP
#define SEMANTIC_THEME_CLUSTERER_HPP

#include "KeywordExtractor.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

using FileTypeGroups = std::map<FileTypeHint, std::vector<ExtractedKeywords>>;

struct SubTheme {
    std::string name;
    std::set<std::string> keywords;
    std::vector<ExtractedKeywords> files;
    FileTypeGroups file_type_groups;

    std::size_t total_file_count() const { return files.size(); }
};

struct ThemeCluster {
    std::string name;
    std::set<std::string> keywords;
    std::vector<ExtractedKeywords> files;
    std::vector<SubTheme> sub_themes;
    FileTypeGroups file_type_groups;

    std::size_t total_file_count() const { return files.size(); }
    bool has_sub_themes() const { return !sub_themes.empty(); }
};

class SemanticThemeClusterer {
public:
    struct Config {
        std::size_t target_theme_count{7};
        bool separate_file_types{true};
        std::size_t min_files_per_theme{3};
        double theme_similarity_threshold{0.15};
        std::size_t min_files_per_sub_theme{2};
        int max_depth{3};

        // Clamps the requested theme count to [3, 15].
        static Config with_target_count(std::size_t count, bool separate_types = true);
    };

    static constexpr const char* kUncategorizedTheme = "Uncategorized";
    static constexpr const char* kOtherSubTheme = "Other";

    SemanticThemeClusterer();
    explicit SemanticThemeClusterer(Config config);

    // Deterministic for a given input: every keyword map is walked in sorted order.
    std::vector<ThemeCluster> cluster(const std::vector<ExtractedKeywords>& files) const;

    static const std::map<std::string, std::set<std::string>>& semantic_groups();
    static double character_jaccard(const std::string& lhs, const std::string& rhs);
    static double keyword_jaccard(const std::set<std::string>& lhs, const std::set<std::string>& rhs);

    const Config& config() const { return config_; }

private:
    std::vector<ThemeCluster> identify_themes(const std::map<std::string, std::size_t>& frequency) const;
    void assign_files(const std::vector<ExtractedKeywords>& files, std::vector<ThemeCluster>& themes) const;
    std::vector<ExtractedKeywords> recluster_unassigned(const std::vector<ExtractedKeywords>& files,
                                                        const std::map<std::string, std::size_t>& frequency,
                                                        std::vector<ThemeCluster>& themes) const;
    std::vector<ThemeCluster> merge_small_themes(std::vector<ThemeCluster> themes) const;
    std::vector<SubTheme> cluster_into_sub_themes(const ThemeCluster& theme) const;
    static FileTypeGroups group_by_file_type(const std::vector<ExtractedKeywords>& files);

    Config config_;
};

#endif
