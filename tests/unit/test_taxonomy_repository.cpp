#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "TaxonomyRepository.hpp"
#include "TestHelpers.hpp"

#include <filesystem>

namespace {

TaxonomyTree sample_tree(const std::string& folder)
{
    TaxonomyTree tree("Library", folder);
    const NodeId cards = tree.find_or_create({"Magic", "Cards"});
    FileAssignment entry;
    entry.file_id = "id-card.mp4";
    entry.filename = "card.mp4";
    entry.url = "/data/card.mp4";
    entry.confidence = 0.65;
    tree.assign_file(cards, entry);
    return tree;
}

DeepAnalysisTask finished_task()
{
    DeepAnalysisTask task = DeepAnalysisTask::for_file(make_scanned_file("card.mp4"), {"Magic"}, 0.4,
                                                       TaskPriority::High);
    task.status = TaskStatus::Completed;
    task.attempts = 1;
    DeepAnalysisResult result;
    result.category_path = {"Magic", "Cards"};
    result.confidence = 0.9;
    task.result = result;
    task.recategorized = true;
    return task;
}

} // namespace

TEST_CASE("Repository creates its database under the config directory") {
    TempDir dir;
    EnvVarGuard db_name("FILE_TAXONOMY_DB_FILE", std::nullopt);
    const auto config_dir = dir.path() / "nested" / "config";

    TaxonomyRepository repository(config_dir.string());

    REQUIRE(repository.is_open());
    CHECK(repository.database_path() == config_dir.string() + "/taxonomy.db");
    CHECK(std::filesystem::exists(repository.database_path()));
}

TEST_CASE("Database file name honours the environment override") {
    TempDir dir;
    EnvVarGuard db_name("FILE_TAXONOMY_DB_FILE", std::string("custom.sqlite"));

    TaxonomyRepository repository(dir.path().string());

    REQUIRE(repository.is_open());
    CHECK(repository.database_path() == dir.path().string() + "/custom.sqlite");
}

TEST_CASE("Empty config directory leaves the repository closed") {
    TaxonomyRepository repository("");

    CHECK_FALSE(repository.is_open());
    CHECK_FALSE(repository.save_snapshot(sample_tree("x")));
    CHECK_FALSE(repository.record_audit("build", "x", "y"));
    CHECK(repository.load_task_ledger().empty());
}

TEST_CASE("Snapshots restore the latest tree per folder") {
    TempDir dir;
    EnvVarGuard db_name("FILE_TAXONOMY_DB_FILE", std::nullopt);
    TaxonomyRepository repository(dir.path().string());
    REQUIRE(repository.is_open());

    CHECK_FALSE(repository.load_latest_snapshot());

    const auto first = repository.save_snapshot(sample_tree("Videos"));
    TaxonomyTree second_tree = sample_tree("Videos");
    second_tree.find_or_create({"Magic", "Coins"});
    const auto second = repository.save_snapshot(second_tree);
    const auto other = repository.save_snapshot(sample_tree("Documents"));
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(other);
    CHECK(*second > *first);

    const auto videos = repository.load_latest_snapshot("Videos");
    REQUIRE(videos);
    CHECK(videos->root().name == "Library");
    CHECK(videos->source_folder_name() == "Videos");
    CHECK(videos->find({"Magic", "Coins"}));
    const auto location = videos->locate_file("id-card.mp4");
    REQUIRE(location);
    CHECK(videos->path_of(location->node_id) == CategoryPath{"Magic", "Cards"});
    CHECK(location->assignment.confidence == Catch::Approx(0.65));

    const auto latest = repository.load_latest_snapshot();
    REQUIRE(latest);
    CHECK(latest->source_folder_name() == "Documents");

    CHECK_FALSE(repository.load_latest_snapshot("Music"));
}

TEST_CASE("Task ledger upserts by task id") {
    TempDir dir;
    EnvVarGuard db_name("FILE_TAXONOMY_DB_FILE", std::nullopt);
    TaxonomyRepository repository(dir.path().string());
    REQUIRE(repository.is_open());

    DeepAnalysisTask task = finished_task();
    DeepAnalysisTask pending = task;
    pending.status = TaskStatus::Running;
    pending.result.reset();
    pending.recategorized = false;
    REQUIRE(repository.record_task(pending));

    auto ledger = repository.load_task_ledger();
    REQUIRE(ledger.size() == 1);
    CHECK(ledger.front().status == TaskStatus::Running);
    CHECK_FALSE(ledger.front().new_confidence);
    CHECK(ledger.front().new_path.empty());

    REQUIRE(repository.record_task(task));
    ledger = repository.load_task_ledger();
    REQUIRE(ledger.size() == 1);
    const auto& entry = ledger.front();
    CHECK(entry.task_id == task.id);
    CHECK(entry.file_id == "id-card.mp4");
    CHECK(entry.filename == "card.mp4");
    CHECK(entry.status == TaskStatus::Completed);
    CHECK(entry.priority == TaskPriority::High);
    CHECK(entry.attempts == 1);
    CHECK(entry.old_confidence == Catch::Approx(0.4));
    REQUIRE(entry.new_confidence);
    CHECK(*entry.new_confidence == Catch::Approx(0.9));
    CHECK(entry.old_path == "Magic");
    CHECK(entry.new_path == "Magic/Cards");
    CHECK(entry.recategorized);
    CHECK_FALSE(entry.recorded_at.empty());
}

TEST_CASE("Suggestion state is stored and updated") {
    TempDir dir;
    EnvVarGuard db_name("FILE_TAXONOMY_DB_FILE", std::nullopt);
    TaxonomyRepository repository(dir.path().string());
    REQUIRE(repository.is_open());

    MergeSuggestion merge;
    merge.id = "merge-1";
    merge.source_nodes = {2, 3};
    merge.source_names = {"Cards", "Coins"};
    merge.target_name = "Tricks";
    merge.created_at = Clock::now();
    SplitSuggestion split;
    split.id = "split-1";
    split.source_node = 4;
    split.source_name = "Recipes";
    split.proposed_subcategories = {{"Breads", {}, 0.7}};
    split.status = SuggestionStatus::Rejected;
    split.created_at = Clock::now();

    REQUIRE(repository.save_suggestions({merge}, {split}));
    auto statuses = repository.load_suggestion_statuses();
    REQUIRE(statuses.size() == 2);
    CHECK(statuses.at("merge-1") == SuggestionStatus::Pending);
    CHECK(statuses.at("split-1") == SuggestionStatus::Rejected);

    merge.status = SuggestionStatus::Applied;
    REQUIRE(repository.save_suggestions({merge}, {}));
    statuses = repository.load_suggestion_statuses();
    CHECK(statuses.size() == 2);
    CHECK(statuses.at("merge-1") == SuggestionStatus::Applied);
}

TEST_CASE("Audit log returns newest entries first") {
    TempDir dir;
    EnvVarGuard db_name("FILE_TAXONOMY_DB_FILE", std::nullopt);
    TaxonomyRepository repository(dir.path().string());
    REQUIRE(repository.is_open());

    REQUIRE(repository.record_audit("build", "Videos", "3 categories"));
    REQUIRE(repository.record_audit("refine", "Videos", "2 renames"));
    REQUIRE(repository.record_audit("deep_analysis", "Videos", "1 moved"));

    const auto entries = repository.load_audit_log(2);
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].action == "deep_analysis");
    CHECK(entries[1].action == "refine");
    CHECK(entries[0].id > entries[1].id);
    CHECK(entries[1].detail == "2 renames");
    CHECK(entries[1].subject == "Videos");
}

TEST_CASE("Data survives reopening the database") {
    TempDir dir;
    EnvVarGuard db_name("FILE_TAXONOMY_DB_FILE", std::nullopt);
    {
        TaxonomyRepository repository(dir.path().string());
        REQUIRE(repository.save_snapshot(sample_tree("Videos")));
        REQUIRE(repository.record_audit("build", "Videos", ""));
    }
    TaxonomyRepository reopened(dir.path().string());
    CHECK(reopened.load_latest_snapshot("Videos"));
    CHECK(reopened.load_audit_log().size() == 1);
}
