#include "SemanticThemeClusterer.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <unordered_set>
#include <utility>

namespace {
constexpr std::size_t kMaxKeywordThemes = 20;
constexpr double kMinAssignmentScore = 0.1;
constexpr double kMergeSimilarity = 0.2;

struct CandidateTheme {
    ThemeCluster theme;
    std::size_t score{0};
};

// Longest keyword wins, ties broken alphabetically.
std::string most_distinctive(const std::set<std::string>& keywords) {
    std::string best;
    for (const auto& keyword : keywords) {
        if (keyword.size() > best.size()) {
            best = keyword;
        }
    }
    return best;
}
} // namespace

SemanticThemeClusterer::Config SemanticThemeClusterer::Config::with_target_count(std::size_t count,
                                                                                 bool separate_types)
{
    Config config;
    config.target_theme_count = std::clamp<std::size_t>(count, 3, 15);
    config.separate_file_types = separate_types;
    return config;
}

SemanticThemeClusterer::SemanticThemeClusterer()
    : config_(Config()) {}

SemanticThemeClusterer::SemanticThemeClusterer(Config config)
    : config_(config) {}

const std::map<std::string, std::set<std::string>>& SemanticThemeClusterer::semantic_groups()
{
    static const std::map<std::string, std::set<std::string>> kGroups = {
        {"magic", {"magic", "trick", "tricks", "illusion", "card", "cards", "coin", "coins",
                   "sleight", "prestidigitation", "magician", "performance", "routine"}},
        {"cooking", {"recipe", "recipes", "cooking", "food", "chef", "kitchen", "baking",
                     "ingredients", "meal", "dinner", "lunch", "breakfast"}},
        {"music", {"music", "song", "songs", "album", "artist", "band", "concert",
                   "audio", "track", "playlist", "guitar", "piano"}},
        {"programming", {"code", "coding", "programming", "developer", "software", "app",
                         "swift", "python", "javascript", "api", "function", "class"}},
        {"photography", {"photo", "photos", "photography", "camera", "image", "images",
                         "picture", "pictures", "portrait", "landscape"}},
        {"video", {"video", "videos", "movie", "movies", "film", "footage", "clip"}},
        {"document", {"document", "documents", "report", "paper", "memo", "letter"}},
        {"project", {"project", "projects", "work", "task", "plan", "planning"}},
        {"personal", {"personal", "private", "family", "home", "vacation", "travel"}},
        {"finance", {"finance", "financial", "budget", "invoice", "tax", "bank", "money"}},
        {"education", {"tutorial", "tutorials", "lesson", "lessons", "course", "learn",
                       "learning", "training", "education", "study"}}
    };
    return kGroups;
}

double SemanticThemeClusterer::character_jaccard(const std::string& lhs, const std::string& rhs)
{
    const std::set<char> left(lhs.begin(), lhs.end());
    const std::set<char> right(rhs.begin(), rhs.end());
    std::vector<char> shared;
    std::set_intersection(left.begin(), left.end(), right.begin(), right.end(), std::back_inserter(shared));
    const std::size_t union_size = left.size() + right.size() - shared.size();
    return union_size == 0 ? 0.0 : static_cast<double>(shared.size()) / static_cast<double>(union_size);
}

double SemanticThemeClusterer::keyword_jaccard(const std::set<std::string>& lhs, const std::set<std::string>& rhs)
{
    std::vector<std::string> shared;
    std::set_intersection(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(shared));
    const std::size_t union_size = lhs.size() + rhs.size() - shared.size();
    return union_size == 0 ? 0.0 : static_cast<double>(shared.size()) / static_cast<double>(union_size);
}

std::vector<ThemeCluster> SemanticThemeClusterer::cluster(const std::vector<ExtractedKeywords>& files) const
{
    std::vector<ThemeCluster> themes;
    if (files.empty()) {
        return themes;
    }
    auto logger = Logger::get_logger("core_logger");

    const auto frequency = KeywordExtractor::keyword_frequencies(files);
    themes = identify_themes(frequency);
    if (logger) {
        logger->debug("Clustering {} files: {} unique keywords, {} candidate themes",
                      files.size(), frequency.size(), themes.size());
    }

    assign_files(files, themes);
    std::vector<ExtractedKeywords> uncategorized = recluster_unassigned(files, frequency, themes);
    themes = merge_small_themes(std::move(themes));

    for (auto& theme : themes) {
        if (theme.files.size() < config_.min_files_per_sub_theme * 2) {
            continue;
        }
        auto sub_themes = cluster_into_sub_themes(theme);
        if (sub_themes.size() > 1) {
            theme.sub_themes = std::move(sub_themes);
        }
    }

    if (config_.separate_file_types) {
        for (auto& theme : themes) {
            theme.file_type_groups = group_by_file_type(theme.files);
            for (auto& sub_theme : theme.sub_themes) {
                sub_theme.file_type_groups = group_by_file_type(sub_theme.files);
            }
        }
    }

    if (!uncategorized.empty()) {
        ThemeCluster bucket;
        bucket.name = kUncategorizedTheme;
        bucket.files = std::move(uncategorized);
        if (config_.separate_file_types) {
            bucket.file_type_groups = group_by_file_type(bucket.files);
        }
        themes.push_back(std::move(bucket));
    }

    std::stable_sort(themes.begin(), themes.end(), [](const ThemeCluster& lhs, const ThemeCluster& rhs) {
        return lhs.total_file_count() > rhs.total_file_count();
    });

    if (logger) {
        logger->info("Semantic clustering produced {} themes for {} files", themes.size(), files.size());
    }
    return themes;
}

std::vector<ThemeCluster> SemanticThemeClusterer::identify_themes(
    const std::map<std::string, std::size_t>& frequency) const
{
    std::vector<CandidateTheme> candidates;
    std::unordered_set<std::string> used_keywords;

    for (const auto& [group_name, vocabulary] : semantic_groups()) {
        CandidateTheme candidate;
        for (const auto& keyword : vocabulary) {
            auto it = frequency.find(keyword);
            if (it != frequency.end()) {
                candidate.theme.keywords.insert(keyword);
                candidate.score += it->second;
            }
        }
        if (candidate.score >= config_.min_files_per_theme) {
            candidate.theme.name = Utils::capitalize(group_name);
            used_keywords.insert(candidate.theme.keywords.begin(), candidate.theme.keywords.end());
            candidates.push_back(std::move(candidate));
        }
    }

    std::vector<std::pair<std::string, std::size_t>> leftovers;
    for (const auto& [keyword, count] : frequency) {
        if (!used_keywords.contains(keyword) && count >= config_.min_files_per_theme) {
            leftovers.emplace_back(keyword, count);
        }
    }
    std::stable_sort(leftovers.begin(), leftovers.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.second > rhs.second;
    });
    if (leftovers.size() > kMaxKeywordThemes) {
        leftovers.resize(kMaxKeywordThemes);
    }

    for (const auto& [keyword, count] : leftovers) {
        CandidateTheme candidate;
        candidate.theme.name = Utils::capitalize(keyword);
        candidate.theme.keywords.insert(keyword);
        for (const auto& entry : frequency) {
            if (entry.first != keyword &&
                character_jaccard(keyword, entry.first) >= config_.theme_similarity_threshold) {
                candidate.theme.keywords.insert(entry.first);
            }
        }
        candidate.score = count;
        candidates.push_back(std::move(candidate));
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const CandidateTheme& lhs, const CandidateTheme& rhs) {
        return lhs.score > rhs.score;
    });

    std::vector<ThemeCluster> selected;
    for (auto& candidate : candidates) {
        if (selected.size() >= config_.target_theme_count) {
            break;
        }
        selected.push_back(std::move(candidate.theme));
    }
    return selected;
}

void SemanticThemeClusterer::assign_files(const std::vector<ExtractedKeywords>& files,
                                          std::vector<ThemeCluster>& themes) const
{
    for (const auto& file : files) {
        std::size_t best_index = themes.size();
        double best_score = 0.0;
        for (std::size_t i = 0; i < themes.size(); ++i) {
            const double score = keyword_jaccard(file.keywords, themes[i].keywords);
            if (score > best_score && score > kMinAssignmentScore) {
                best_score = score;
                best_index = i;
            }
        }
        if (best_index < themes.size()) {
            themes[best_index].files.push_back(file);
        }
    }
}

std::vector<ExtractedKeywords> SemanticThemeClusterer::recluster_unassigned(
    const std::vector<ExtractedKeywords>& files,
    const std::map<std::string, std::size_t>& frequency,
    std::vector<ThemeCluster>& themes) const
{
    std::unordered_set<std::string> assigned;
    for (const auto& theme : themes) {
        for (const auto& file : theme.files) {
            assigned.insert(file.file_id);
        }
    }

    std::vector<ExtractedKeywords> remaining;
    std::map<std::string, std::vector<ExtractedKeywords>> keyword_groups;
    for (const auto& file : files) {
        if (assigned.contains(file.file_id)) {
            continue;
        }
        if (file.keywords.empty()) {
            remaining.push_back(file);
            continue;
        }
        // Most frequent keyword across the whole set; longer keyword wins a tie.
        std::string top_keyword;
        std::size_t top_count = 0;
        for (const auto& keyword : file.keywords) {
            auto it = frequency.find(keyword);
            const std::size_t count = it == frequency.end() ? 0 : it->second;
            if (count > top_count || (count == top_count && keyword.size() > top_keyword.size())) {
                top_keyword = keyword;
                top_count = count;
            }
        }
        keyword_groups[top_keyword].push_back(file);
    }

    for (auto& [keyword, group] : keyword_groups) {
        if (group.size() >= config_.min_files_per_theme) {
            ThemeCluster theme;
            theme.name = Utils::capitalize(keyword);
            theme.keywords.insert(keyword);
            theme.files = std::move(group);
            themes.push_back(std::move(theme));
        } else {
            remaining.insert(remaining.end(), group.begin(), group.end());
        }
    }
    return remaining;
}

std::vector<ThemeCluster> SemanticThemeClusterer::merge_small_themes(std::vector<ThemeCluster> themes) const
{
    std::vector<ThemeCluster> result;
    std::vector<ThemeCluster> small;
    for (auto& theme : themes) {
        if (theme.files.empty()) {
            continue;
        }
        if (theme.files.size() >= config_.min_files_per_theme) {
            result.push_back(std::move(theme));
        } else {
            small.push_back(std::move(theme));
        }
    }

    for (auto& theme : small) {
        std::size_t best_index = result.size();
        double best_similarity = kMergeSimilarity;
        for (std::size_t i = 0; i < result.size(); ++i) {
            const double similarity = keyword_jaccard(theme.keywords, result[i].keywords);
            if (similarity > best_similarity) {
                best_similarity = similarity;
                best_index = i;
            }
        }
        if (best_index < result.size()) {
            auto& target = result[best_index];
            target.files.insert(target.files.end(), theme.files.begin(), theme.files.end());
            target.keywords.insert(theme.keywords.begin(), theme.keywords.end());
        } else {
            result.push_back(std::move(theme));
        }
    }
    return result;
}

std::vector<SubTheme> SemanticThemeClusterer::cluster_into_sub_themes(const ThemeCluster& theme) const
{
    std::map<std::string, std::vector<const ExtractedKeywords*>> keyword_groups;
    for (const auto& file : theme.files) {
        std::set<std::string> distinctive;
        std::set_difference(file.keywords.begin(), file.keywords.end(),
                            theme.keywords.begin(), theme.keywords.end(),
                            std::inserter(distinctive, distinctive.end()));
        const std::string keyword = most_distinctive(distinctive);
        if (!keyword.empty()) {
            keyword_groups[keyword].push_back(&file);
        }
    }

    std::vector<std::pair<std::string, std::vector<const ExtractedKeywords*>>> ordered(
        keyword_groups.begin(), keyword_groups.end());
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.second.size() > rhs.second.size();
    });

    std::vector<SubTheme> sub_themes;
    std::unordered_set<std::string> assigned;
    for (const auto& [keyword, group] : ordered) {
        std::vector<ExtractedKeywords> members;
        for (const auto* file : group) {
            if (!assigned.contains(file->file_id)) {
                members.push_back(*file);
            }
        }
        if (members.size() < config_.min_files_per_sub_theme) {
            continue;
        }
        for (const auto& member : members) {
            assigned.insert(member.file_id);
        }
        SubTheme sub_theme;
        sub_theme.name = Utils::capitalize(keyword);
        sub_theme.keywords.insert(keyword);
        sub_theme.files = std::move(members);
        sub_themes.push_back(std::move(sub_theme));
    }

    if (sub_themes.empty()) {
        return sub_themes;
    }

    SubTheme other;
    other.name = kOtherSubTheme;
    for (const auto& file : theme.files) {
        if (!assigned.contains(file.file_id)) {
            other.files.push_back(file);
        }
    }
    if (!other.files.empty()) {
        sub_themes.push_back(std::move(other));
    }
    return sub_themes;
}

FileTypeGroups SemanticThemeClusterer::group_by_file_type(const std::vector<ExtractedKeywords>& files)
{
    FileTypeGroups groups;
    for (const auto& file : files) {
        groups[file.file_type].push_back(file);
    }
    return groups;
}
