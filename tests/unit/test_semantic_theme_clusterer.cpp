#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "KeywordExtractor.hpp"
#include "SemanticThemeClusterer.hpp"

#include <algorithm>

namespace {

std::vector<ExtractedKeywords> extract_all(const std::vector<std::string>& names)
{
    const KeywordExtractor extractor;
    std::vector<ExtractedKeywords> extracted;
    for (const auto& name : names) {
        extracted.push_back(extractor.extract(name));
    }
    return extracted;
}

std::vector<std::string> names_of(const std::vector<ExtractedKeywords>& files)
{
    std::vector<std::string> names;
    for (const auto& file : files) {
        names.push_back(file.original_filename);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

TEST_CASE("Magic files group together and the recipe lands in a second theme") {
    SemanticThemeClusterer::Config config;
    config.target_theme_count = 2;
    const SemanticThemeClusterer clusterer(config);

    const auto themes = clusterer.cluster(extract_all({"magic_trick_1.mp4", "card_trick.pdf", "recipe_pasta.txt"}));

    REQUIRE(themes.size() == 2);
    CHECK(themes[0].name == "Magic");
    CHECK(names_of(themes[0].files) == std::vector<std::string>{"card_trick.pdf", "magic_trick_1.mp4"});
    CHECK(names_of(themes[1].files) == std::vector<std::string>{"recipe_pasta.txt"});
    CHECK(themes[1].name == SemanticThemeClusterer::kUncategorizedTheme);
}

TEST_CASE("Every input file appears in exactly one theme") {
    const SemanticThemeClusterer clusterer;
    const std::vector<std::string> names{
        "vacation_photo_beach.jpg", "vacation_photo_hotel.jpg", "family_photo_home.png",
        "budget_2024.xlsx", "tax_return_2023.pdf", "invoice_march.pdf",
        "guitar_song_demo.mp3", "piano_track.wav", "band_album_cover.png",
        "random.bin", "", "zzz.dat"
    };
    const auto themes = clusterer.cluster(extract_all(names));

    std::vector<std::string> seen;
    for (const auto& theme : themes) {
        for (const auto& file : theme.files) {
            seen.push_back(file.file_id);
        }
    }
    std::sort(seen.begin(), seen.end());
    CHECK(std::adjacent_find(seen.begin(), seen.end()) == seen.end());
    CHECK(seen.size() == names.size());
}

TEST_CASE("Large themes are split into keyword sub-themes with an Other bucket") {
    const SemanticThemeClusterer clusterer;
    const auto themes = clusterer.cluster(extract_all({
        "recipe_pasta_italian.txt", "recipe_pizza_italian.txt",
        "recipe_soup_french.txt", "recipe_crepe_french.txt", "recipe_bread.txt"
    }));

    REQUIRE(themes.size() == 1);
    const auto& cooking = themes.front();
    CHECK(cooking.name == "Cooking");
    REQUIRE(cooking.has_sub_themes());
    REQUIRE(cooking.sub_themes.size() == 3);
    CHECK(cooking.sub_themes[0].name == "French");
    CHECK(cooking.sub_themes[1].name == "Italian");
    CHECK(cooking.sub_themes[2].name == SemanticThemeClusterer::kOtherSubTheme);
    CHECK(names_of(cooking.sub_themes[2].files) == std::vector<std::string>{"recipe_bread.txt"});
    CHECK(cooking.sub_themes[0].file_type_groups.at(FileTypeHint::Document).size() == 2);
}

TEST_CASE("Clustering is deterministic for the same input") {
    const SemanticThemeClusterer clusterer;
    const auto input = extract_all({
        "project_plan.docx", "project_tasks.xlsx", "work_plan_q2.pdf",
        "holiday_travel.jpg", "travel_itinerary.pdf", "travel_budget.xlsx"
    });
    const auto first = clusterer.cluster(input);
    const auto second = clusterer.cluster(input);

    REQUIRE(first.size() == second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        CHECK(first[i].name == second[i].name);
        CHECK(names_of(first[i].files) == names_of(second[i].files));
    }
}

TEST_CASE("File type groups are skipped when separation is disabled") {
    const SemanticThemeClusterer clusterer(SemanticThemeClusterer::Config::with_target_count(5, false));
    const auto themes = clusterer.cluster(extract_all({"song_a.mp3", "song_b.mp3", "song_c.flac"}));
    REQUIRE_FALSE(themes.empty());
    CHECK(themes.front().file_type_groups.empty());
}

TEST_CASE("Target count is clamped") {
    CHECK(SemanticThemeClusterer::Config::with_target_count(1).target_theme_count == 3);
    CHECK(SemanticThemeClusterer::Config::with_target_count(40).target_theme_count == 15);
    CHECK(SemanticThemeClusterer::Config::with_target_count(9).target_theme_count == 9);
}

TEST_CASE("Similarity helpers") {
    CHECK(SemanticThemeClusterer::character_jaccard("abc", "abd") == Catch::Approx(0.5));
    CHECK(SemanticThemeClusterer::character_jaccard("", "") == Catch::Approx(0.0));
    CHECK(SemanticThemeClusterer::keyword_jaccard({"a", "b"}, {"b", "c"}) == Catch::Approx(1.0 / 3.0));
}

TEST_CASE("Empty input produces no themes") {
    const SemanticThemeClusterer clusterer;
    CHECK(clusterer.cluster({}).empty());
}
