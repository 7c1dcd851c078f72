#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "ILLMClient.hpp"
#include "LLMErrors.hpp"
#include "MergeSplitGatekeeper.hpp"
#include "SharedTaxonomy.hpp"
#include "TaxonomyBuilder.hpp"
#include "TaxonomyBuilderTestAccess.hpp"
#include "TaxonomyErrors.hpp"
#include "TestHelpers.hpp"

#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

// Answers each request through a callback and records the prompts it saw.
class ScriptedLLM : public ILLMClient {
public:
    using Handler = std::function<std::string(const std::string& prompt, bool json)>;

    explicit ScriptedLLM(Handler handler)
        : handler_(std::move(handler)) {}

    std::string identifier() const override { return "scripted"; }
    bool is_available() override { return true; }

    std::string complete(const std::string& prompt, const LLMOptions&) override {
        record(prompt);
        return handler_(prompt, false);
    }

    std::string complete_json(const std::string& prompt, const LLMOptions&) override {
        record(prompt);
        return handler_(prompt, true);
    }

    std::vector<std::string> prompts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompts_;
    }

private:
    void record(const std::string& prompt) {
        std::lock_guard<std::mutex> lock(mutex_);
        prompts_.push_back(prompt);
    }

    Handler handler_;
    mutable std::mutex mutex_;
    std::vector<std::string> prompts_;
};

bool is_naming_prompt(const std::string& prompt)
{
    return prompt.find("Current name: ") != std::string::npos;
}

std::string current_name_in(const std::string& prompt)
{
    const auto start = prompt.find("Current name: ") + 14;
    return prompt.substr(start, prompt.find('\n', start) - start);
}

bool is_merge_prompt(const std::string& prompt)
{
    return prompt.find("suggest which should be merged") != std::string::npos;
}

TaxonomyBuilderConfig quick_config()
{
    TaxonomyBuilderConfig config;
    config.refinement_delay = std::chrono::milliseconds(0);
    return config;
}

FileAssignment assignment(const std::string& filename)
{
    FileAssignment entry;
    entry.file_id = "id-" + filename;
    entry.filename = filename;
    entry.confidence = 0.7;
    return entry;
}

void fill(TaxonomyTree& tree, NodeId node, const std::vector<std::string>& filenames)
{
    for (const auto& name : filenames) {
        tree.assign_file(node, assignment(name));
    }
}

std::vector<RefinementProgress> finish(TaxonomyBuilder& builder)
{
    REQUIRE(builder.wait_for_refinement(std::chrono::seconds(10)));
    return builder.progress().drain();
}

} // namespace

TEST_CASE("Instant build rejects an empty file list") {
    const TaxonomyBuilder builder(quick_config());
    try {
        (void)builder.build_instant({});
        FAIL("expected TaxonomyError");
    } catch (const TaxonomyError& ex) {
        CHECK(ex.kind() == TaxonomyError::Kind::NoFilesProvided);
    }
}

TEST_CASE("Instant build places every file under theme and file type folders") {
    const TaxonomyBuilder builder(quick_config());
    const std::vector<ScannedFile> files{
        make_scanned_file("magic_trick_1.mp4"),
        make_scanned_file("card_trick.pdf"),
        make_scanned_file("recipe_pasta.txt"),
    };

    const TaxonomyTree tree = builder.build_instant(files, "Library");

    CHECK(tree.root().name == "Library");
    CHECK(tree.total_file_count() == files.size());
    const auto videos = tree.find({"Magic", "Videos"});
    REQUIRE(videos.has_value());
    CHECK(tree.node(*videos)->files.size() == 1);
    CHECK(tree.find({"Magic", "Documents"}).has_value());
    CHECK(tree.find({"Uncategorized", "Documents"}).has_value());

    for (const auto& entry : tree.all_assignments()) {
        CHECK(entry.confidence == Catch::Approx(0.7));
        CHECK(entry.source == AssignmentSource::Filename);
        CHECK_FALSE(entry.needs_deep_analysis);
    }
    const auto location = tree.locate_file(files[0].id);
    REQUIRE(location.has_value());
    CHECK(location->assignment.url == files[0].path);
    CHECK(location->assignment.filename == "magic_trick_1.mp4");
}

TEST_CASE("Instant build keeps files flat in the theme without type separation") {
    TaxonomyBuilderConfig config = quick_config();
    config.separate_file_types = false;
    const TaxonomyBuilder builder(config);

    const TaxonomyTree tree = builder.build_instant({
        make_scanned_file("magic_trick_1.mp4"),
        make_scanned_file("card_trick.pdf"),
    });

    const auto magic = tree.find({"Magic"});
    REQUIRE(magic.has_value());
    CHECK(tree.node(*magic)->files.size() == 2);
    CHECK(tree.node(*magic)->children.empty());
    CHECK(tree.max_depth() == 1);
}

TEST_CASE("Naming pass renames categories and leaves user-edited ones alone") {
    TaxonomyTree tree("Root");
    const NodeId cards = tree.find_or_create({"Cards"});
    const NodeId mine = tree.find_or_create({"Mine"});
    fill(tree, cards, {"card_trick.mp4", "card_force.pdf", "deck_flourish.mov", "ace_cut.mp4", "pass.mp4"});
    fill(tree, mine, {"notes.txt"});
    tree.set_refinement_state(mine, RefinementState::UserEdited);
    auto taxonomy = std::make_shared<SharedTaxonomy>(std::move(tree));

    auto llm = std::make_shared<ScriptedLLM>([](const std::string& prompt, bool) -> std::string {
        if (is_naming_prompt(prompt)) {
            return current_name_in(prompt) == "Cards" ? "\"Card Magic.\"" : current_name_in(prompt);
        }
        return "NO_MERGES";
    });

    TaxonomyBuilder builder(quick_config());
    REQUIRE(builder.start_refinement(taxonomy, llm));
    const auto progress = finish(builder);

    const TaxonomyTree result = taxonomy->snapshot();
    const TaxonomyNode* renamed = result.node(cards);
    REQUIRE(renamed != nullptr);
    CHECK(renamed->name == "Card Magic");
    CHECK(renamed->suggested_name == std::optional<std::string>("Card Magic"));
    CHECK(renamed->metadata.at("original_name") == "Cards");
    CHECK(renamed->refinement_state == RefinementState::Refined);

    CHECK(result.node(mine)->name == "Mine");
    CHECK(result.node(mine)->is_user_edited());
    for (const auto& prompt : llm->prompts()) {
        CHECK(prompt.find("Current name: Mine") == std::string::npos);
    }

    REQUIRE_FALSE(progress.empty());
    CHECK(progress.back().phase == RefinementPhase::Complete);
}

TEST_CASE("Naming pass keeps the old name when a sibling already uses the suggestion") {
    TaxonomyTree tree("Root");
    const NodeId a = tree.find_or_create({"Clips"});
    tree.find_or_create({"Videos"});
    fill(tree, a, {"clip1.mp4"});
    auto taxonomy = std::make_shared<SharedTaxonomy>(std::move(tree));

    auto llm = std::make_shared<ScriptedLLM>([](const std::string& prompt, bool) -> std::string {
        return is_naming_prompt(prompt) ? "Videos" : "NO_MERGES";
    });
    TaxonomyBuilder builder(quick_config());
    REQUIRE(builder.start_refinement(taxonomy, llm));
    finish(builder);

    const TaxonomyTree result = taxonomy->snapshot();
    CHECK(result.node(a)->name == "Clips");
    CHECK(result.node(a)->suggested_name == std::optional<std::string>("Videos"));
}

TEST_CASE("LLM failure during naming resets the category state") {
    TaxonomyTree tree("Root");
    const NodeId node = tree.find_or_create({"Docs"});
    fill(tree, node, {"a.pdf"});
    auto taxonomy = std::make_shared<SharedTaxonomy>(std::move(tree));

    auto llm = std::make_shared<ScriptedLLM>([](const std::string&, bool) -> std::string {
        throw LLMError(LLMError::Kind::ConnectionFailed, "offline");
    });
    TaxonomyBuilder builder(quick_config());
    REQUIRE(builder.start_refinement(taxonomy, llm));
    finish(builder);

    const TaxonomyTree result = taxonomy->snapshot();
    CHECK(result.node(node)->name == "Docs");
    CHECK(result.node(node)->refinement_state == RefinementState::Initial);
}

TEST_CASE("Unexpected naming failures leave no category stuck mid-refinement") {
    TaxonomyTree tree("Root");
    const NodeId broken = tree.find_or_create({"Broken"});
    const NodeId cards = tree.find_or_create({"Cards"});
    fill(tree, broken, {"a.pdf"});
    fill(tree, cards, {"card_trick.mp4"});
    auto taxonomy = std::make_shared<SharedTaxonomy>(std::move(tree));

    auto llm = std::make_shared<ScriptedLLM>([](const std::string& prompt, bool) -> std::string {
        if (is_naming_prompt(prompt) && current_name_in(prompt) == "Broken") {
            throw std::runtime_error("malformed payload");
        }
        if (is_naming_prompt(prompt)) {
            return "Card Magic";
        }
        throw std::runtime_error("merge service down");
    });
    TaxonomyBuilder builder(quick_config());
    REQUIRE(builder.start_refinement(taxonomy, llm));
    const auto progress = finish(builder);

    const TaxonomyTree result = taxonomy->snapshot();
    CHECK(result.node(broken)->name == "Broken");
    CHECK(result.node(broken)->refinement_state == RefinementState::Initial);
    CHECK(result.node(cards)->name == "Card Magic");
    CHECK(result.node(cards)->refinement_state == RefinementState::Refined);
    for (NodeId id : result.all_categories()) {
        CHECK(result.node(id)->refinement_state != RefinementState::Refining);
    }
    REQUIRE_FALSE(progress.empty());
    CHECK(progress.back().phase == RefinementPhase::Complete);
}

TEST_CASE("Small related categories are merged and given sub-structure") {
    TaxonomyTree tree("Root");
    const NodeId cards = tree.find_or_create({"Card Tricks"});
    const NodeId coins = tree.find_or_create({"Coin Magic"});
    const NodeId recipes = tree.find_or_create({"Recipes"});
    fill(tree, cards, {"card1.mp4", "card2.mp4"});
    fill(tree, coins, {"coin1.mp4", "coin2.mp4"});
    fill(tree, recipes, {"r1.txt", "r2.txt", "r3.txt", "r4.txt", "r5.txt", "r6.txt"});
    auto taxonomy = std::make_shared<SharedTaxonomy>(std::move(tree));

    auto llm = std::make_shared<ScriptedLLM>([](const std::string& prompt, bool json) -> std::string {
        if (json) {
            return "```json\n{\"subcategories\": ["
                   "{\"name\": \"Cards\", \"files\": [\"card1.mp4\", \"CARD2.mp4\"]},"
                   "{\"name\": \"Ghost\", \"files\": [\"missing.pdf\"]}]}\n```";
        }
        if (is_merge_prompt(prompt)) {
            return "card tricks + Coin Magic -> Magic Tricks\nRecipes + Nothing -> Food";
        }
        return current_name_in(prompt);
    });

    auto gatekeeper = std::make_shared<MergeSplitGatekeeper>();
    TaxonomyBuilder builder(quick_config(), gatekeeper);
    REQUIRE(builder.start_refinement(taxonomy, llm));
    const auto progress = finish(builder);

    const TaxonomyTree result = taxonomy->snapshot();
    CHECK_FALSE(result.contains(cards));
    CHECK_FALSE(result.contains(coins));
    const auto merged = result.find({"Magic Tricks"});
    REQUIRE(merged.has_value());
    CHECK(result.total_file_count(*merged) == 4);
    CHECK(result.node(*merged)->files.size() == 2);
    CHECK(result.node(*merged)->refinement_state == RefinementState::Refined);
    CHECK(result.node(*merged)->metadata.at("merged_from") == "Card Tricks, Coin Magic");

    const auto sub = result.find({"Magic Tricks", "Cards"});
    REQUIRE(sub.has_value());
    CHECK(result.node(*sub)->files.size() == 2);
    CHECK_FALSE(result.find({"Magic Tricks", "Ghost"}).has_value());
    CHECK(result.find({"Recipes"}).has_value());

    bool merge_prompt_seen = false;
    for (const auto& prompt : llm->prompts()) {
        if (is_merge_prompt(prompt)) {
            merge_prompt_seen = true;
            CHECK(prompt.find("- Card Tricks (2 files): card1.mp4, card2.mp4") != std::string::npos);
            CHECK(prompt.find("- Recipes") == std::string::npos);
        }
    }
    CHECK(merge_prompt_seen);

    const auto merges = gatekeeper->all_merges();
    REQUIRE(merges.size() == 1);
    CHECK(merges.front().status == SuggestionStatus::Applied);

    bool saw_merging = false;
    for (const auto& entry : progress) {
        saw_merging = saw_merging || entry.phase == RefinementPhase::Merging;
    }
    CHECK(saw_merging);
}

TEST_CASE("Merging themed categories combines their file type folders") {
    TaxonomyTree tree("Root");
    const NodeId card_videos = tree.find_or_create({"Card Tricks", "Videos"});
    const NodeId coin_videos = tree.find_or_create({"Coin Magic", "Videos"});
    const NodeId recipe_docs = tree.find_or_create({"Recipes", "Documents"});
    fill(tree, card_videos, {"card1.mp4", "card2.mp4"});
    fill(tree, coin_videos, {"coin1.mp4", "coin2.mp4"});
    fill(tree, recipe_docs, {"r1.txt", "r2.txt", "r3.txt", "r4.txt", "r5.txt", "r6.txt"});
    auto taxonomy = std::make_shared<SharedTaxonomy>(std::move(tree));

    std::vector<std::string> structure_requests;
    auto llm = std::make_shared<ScriptedLLM>([&](const std::string& prompt, bool json) -> std::string {
        if (json) {
            structure_requests.push_back(prompt);
            return "{\"subcategories\": [{\"name\": \"Videos\", "
                   "\"files\": [\"card1.mp4\", \"card2.mp4\", \"coin1.mp4\", \"coin2.mp4\"]}]}";
        }
        if (is_merge_prompt(prompt)) {
            return "Card Tricks + Coin Magic -> Magic Tricks";
        }
        return current_name_in(prompt);
    });

    TaxonomyBuilder builder(quick_config());
    REQUIRE(builder.start_refinement(taxonomy, llm));
    finish(builder);

    const TaxonomyTree result = taxonomy->snapshot();
    const auto merged = result.find({"Magic Tricks"});
    REQUIRE(merged.has_value());
    CHECK(result.total_file_count(*merged) == 4);

    const auto& children = result.node(*merged)->children;
    REQUIRE(children.size() == 1);
    CHECK(result.node(children.front())->name == "Videos");
    CHECK(result.node(children.front())->files.size() == 4);
    CHECK(result.node(*merged)->files.empty());

    REQUIRE(structure_requests.size() == 1);
    for (const auto* name : {"card1.mp4", "card2.mp4", "coin1.mp4", "coin2.mp4"}) {
        CHECK(structure_requests.front().find(name) != std::string::npos);
    }

    for (const auto* name : {"card1.mp4", "coin2.mp4"}) {
        const auto location = result.locate_file(std::string("id-") + name);
        REQUIRE(location.has_value());
        CHECK(location->node_id == children.front());
    }
    CHECK(result.find({"Recipes", "Documents"}).has_value());
}

TEST_CASE("User-edited categories are never offered for merging") {
    TaxonomyTree tree("Root");
    const NodeId cards = tree.find_or_create({"Card Tricks"});
    const NodeId coins = tree.find_or_create({"Coin Magic"});
    fill(tree, cards, {"card1.mp4"});
    fill(tree, coins, {"coin1.mp4"});
    tree.set_refinement_state(coins, RefinementState::UserEdited);
    auto taxonomy = std::make_shared<SharedTaxonomy>(std::move(tree));

    auto llm = std::make_shared<ScriptedLLM>([](const std::string& prompt, bool) -> std::string {
        if (is_merge_prompt(prompt)) {
            return "Card Tricks + Coin Magic -> Magic";
        }
        return current_name_in(prompt);
    });
    TaxonomyBuilder builder(quick_config());
    REQUIRE(builder.start_refinement(taxonomy, llm));
    finish(builder);

    const TaxonomyTree result = taxonomy->snapshot();
    CHECK(result.contains(cards));
    CHECK(result.contains(coins));
    CHECK_FALSE(result.find({"Magic"}).has_value());
    CHECK(builder.gatekeeper().all_merges().empty());
}

TEST_CASE("Only one refinement runs at a time and it can be cancelled") {
    TaxonomyTree tree("Root");
    for (int i = 0; i < 6; ++i) {
        const NodeId node = tree.find_or_create({"Category " + std::to_string(i)});
        fill(tree, node, {"file" + std::to_string(i) + ".txt"});
    }
    auto taxonomy = std::make_shared<SharedTaxonomy>(std::move(tree));

    auto llm = std::make_shared<ScriptedLLM>([](const std::string& prompt, bool) -> std::string {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return current_name_in(prompt);
    });
    TaxonomyBuilder builder(quick_config());
    REQUIRE(builder.start_refinement(taxonomy, llm));
    CHECK(builder.is_refining());
    CHECK_FALSE(builder.start_refinement(taxonomy, llm));

    builder.cancel_refinement();
    const auto progress = finish(builder);
    CHECK_FALSE(builder.is_refining());
    REQUIRE_FALSE(progress.empty());
    CHECK(progress.back().phase == RefinementPhase::Cancelled);
    CHECK(llm->prompts().size() < 6);
}

TEST_CASE("Merge grammar accepts both arrows and skips malformed lines") {
    const auto groupings = TaxonomyBuilderTestAccess::parse_merge_suggestions(
        "```\n"
        "- Card Tricks + Card Magic -> Card Magic\n"
        "Cooking + Recipes \xE2\x86\x92 Cooking & Recipes\n"
        "NO_MERGES\n"
        "Lonely -> Alone\n"
        "no arrow here\n"
        "A + B ->\n"
        "* Songs + Albums + Playlists -> Music\n"
        "```");

    REQUIRE(groupings.size() == 3);
    CHECK(groupings[0].sources == std::vector<std::string>{"Card Tricks", "Card Magic"});
    CHECK(groupings[0].merged_name == "Card Magic");
    CHECK(groupings[1].merged_name == "Cooking & Recipes");
    CHECK(groupings[2].sources.size() == 3);
    CHECK(TaxonomyBuilderTestAccess::parse_merge_suggestions("NO_MERGES").empty());
}

TEST_CASE("Merge grammar keeps at most five suggestions") {
    std::string response;
    for (int i = 0; i < 8; ++i) {
        response += "A" + std::to_string(i) + " + B" + std::to_string(i) + " -> C" + std::to_string(i) + "\n";
    }
    CHECK(TaxonomyBuilderTestAccess::parse_merge_suggestions(response).size() == 5);
}

TEST_CASE("Sub-structure replies must carry a subcategories array") {
    const auto parsed = TaxonomyBuilderTestAccess::parse_sub_structure(
        "Sure! {\"subcategories\": [{\"name\": \" Live \", \"files\": [\"a.mp4\", 3]}, {\"name\": \"x\"}]}");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->size() == 1);
    CHECK(parsed->front().name == "Live");
    CHECK(parsed->front().files == std::vector<std::string>{"a.mp4"});

    CHECK_FALSE(TaxonomyBuilderTestAccess::parse_sub_structure("{\"groups\": []}").has_value());
    CHECK_FALSE(TaxonomyBuilderTestAccess::parse_sub_structure("not json").has_value());
}

TEST_CASE("Category names are cleaned to a single safe label") {
    CHECK(TaxonomyBuilderTestAccess::clean_category_name("1. \"Travel/Photos\"\nextra") == "TravelPhotos");
    CHECK(TaxonomyBuilderTestAccess::clean_category_name("   \n\n").empty());

    const auto prompt = TaxonomyBuilderTestAccess::build_naming_prompt("Docs", {"a.pdf", "b.pdf"});
    CHECK(prompt.find("Current name: Docs") != std::string::npos);
    CHECK(prompt.find("a.pdf\nb.pdf") != std::string::npos);
}
