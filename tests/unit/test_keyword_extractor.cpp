#include <catch2/catch_test_macros.hpp>

#include "KeywordExtractor.hpp"
#include "TestHelpers.hpp"

TEST_CASE("Tokenizer splits separators and camel case") {
    const auto tokens = KeywordExtractor::tokenize("HTTPServerLog2024_final-copy (1)");
    const std::vector<std::string> expected{"http", "server", "log", "2024", "final", "copy", "1"};
    CHECK(tokens == expected);
}

TEST_CASE("Keywords drop stopwords, short tokens and numbers") {
    const KeywordExtractor extractor;
    const auto result = extractor.extract("The_Final_Budget_Report_v2_2024.pdf", "id-1");

    CHECK(result.file_id == "id-1");
    CHECK(result.file_type == FileTypeHint::Document);
    CHECK(result.keywords == std::set<std::string>{"budget", "report"});
    CHECK(result.stemmed_keywords.empty());
    REQUIRE(result.date_info.has_value());
    CHECK(result.date_info->year == 2024);
}

TEST_CASE("Quality config also records stems") {
    const KeywordExtractor extractor(KeywordExtractor::Config::quality());
    const auto result = extractor.extract("holiday_stories_cooking.txt");
    CHECK(result.keywords.count("stories") == 1);
    CHECK(result.stemmed_keywords.count("story") == 1);
    CHECK(result.stemmed_keywords.count("cook") == 1);
    CHECK(result.file_id == "holiday_stories_cooking.txt");
}

TEST_CASE("Stemmer handles common suffixes") {
    CHECK(KeywordExtractor::stem("recipes") == "recipe");
    CHECK(KeywordExtractor::stem("parties") == "party");
    CHECK(KeywordExtractor::stem("painting") == "paint");
    CHECK(KeywordExtractor::stem("edited") == "edit");
    CHECK(KeywordExtractor::stem("glass") == "glass");
}

TEST_CASE("Quarter and month hints are detected when no year is present") {
    const KeywordExtractor extractor;
    const auto quarter = extractor.extract("sales_Q3_summary.xlsx");
    REQUIRE(quarter.date_info.has_value());
    CHECK(quarter.date_info->quarter == std::optional<std::string>("Q3"));

    const auto month = extractor.extract("march_invoices.pdf");
    REQUIRE(month.date_info.has_value());
    CHECK(month.date_info->month == 3);

    CHECK_FALSE(extractor.extract("notes.md").date_info.has_value());
}

TEST_CASE("File type hints come from the extension") {
    CHECK(KeywordExtractor::file_type_for_extension(".MP4") == FileTypeHint::Video);
    CHECK(KeywordExtractor::file_type_for_extension("flac") == FileTypeHint::Audio);
    CHECK(KeywordExtractor::file_type_for_extension("heic") == FileTypeHint::Image);
    CHECK(KeywordExtractor::file_type_for_extension("7z") == FileTypeHint::Archive);
    CHECK(KeywordExtractor::file_type_for_extension("xyz") == FileTypeHint::Other);
}

TEST_CASE("Odd filenames never throw") {
    const KeywordExtractor extractor;
    CHECK(extractor.extract("").keywords.empty());
    CHECK(extractor.extract(".hidden").keywords == std::set<std::string>{"hidden"});
    CHECK(extractor.extract("___.---").keywords.empty());
    CHECK(extractor.extract("trailingdot.").keywords == std::set<std::string>{"trailingdot"});
}

TEST_CASE("Batch extraction keeps scanner ids and counts keyword frequency") {
    const KeywordExtractor extractor;
    const std::vector<ScannedFile> files{
        make_scanned_file("magic_trick_1.mp4"),
        make_scanned_file("card_trick.pdf"),
        make_scanned_file("recipe_pasta.txt"),
    };
    const auto extracted = extractor.extract_batch(files);
    REQUIRE(extracted.size() == 3);
    CHECK(extracted[0].file_id == files[0].id);
    CHECK(extracted[0].source_path == files[0].path);

    const auto frequencies = KeywordExtractor::keyword_frequencies(extracted);
    CHECK(frequencies.at("trick") == 2);
    CHECK(frequencies.at("pasta") == 1);
}
