#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "TaxonomyErrors.hpp"
#include "TaxonomyTree.hpp"

#include <json/json.h>

#include <set>

namespace {

FileAssignment make_assignment(const std::string& file_id, double confidence = 0.7)
{
    FileAssignment assignment;
    assignment.file_id = file_id;
    assignment.filename = file_id + ".txt";
    assignment.url = "/data/" + file_id + ".txt";
    assignment.confidence = confidence;
    return assignment;
}

std::size_t count_occurrences(const TaxonomyTree& tree, const std::string& file_id)
{
    std::size_t count = 0;
    for (const auto& assignment : tree.all_assignments()) {
        if (assignment.file_id == file_id) {
            ++count;
        }
    }
    return count;
}

} // namespace

TEST_CASE("find_or_create is idempotent and does not duplicate nodes") {
    TaxonomyTree tree("Root");
    const NodeId first = tree.find_or_create({"Work", "Reports", "2024"});
    const auto count = tree.category_count();

    const NodeId second = tree.find_or_create({"Work", "Reports", "2024"});
    CHECK(first == second);
    CHECK(tree.category_count() == count);
    CHECK(count == 3);
    CHECK(tree.path_of(first) == CategoryPath{"Work", "Reports", "2024"});
    CHECK(tree.depth_of(first) == 3);
}

TEST_CASE("Blank path components never become categories") {
    TaxonomyTree tree("Root");
    const NodeId plain = tree.find_or_create({"Work", "Reports"});
    const auto count = tree.category_count();

    CHECK(tree.find_or_create({"Work", "", "Reports"}) == plain);
    CHECK(tree.find_or_create({"  ", "Work", "Reports", "\t"}) == plain);
    CHECK(tree.category_count() == count);
    REQUIRE(tree.find({"Work", " ", "Reports"}).has_value());
    CHECK(*tree.find({"Work", " ", "Reports"}) == plain);

    CHECK(tree.find_or_create_child(tree.root_id(), "") == kInvalidNodeId);
    CHECK(tree.find_or_create_child(tree.root_id(), "   ") == kInvalidNodeId);
    CHECK(tree.find_or_create(CategoryPath{""}) == tree.root_id());
    CHECK(tree.category_count() == count);
}

TEST_CASE("Paths may include the root name") {
    TaxonomyTree tree("Root");
    const NodeId created = tree.find_or_create({"Music"});
    REQUIRE(tree.find({"Root", "Music"}).has_value());
    CHECK(*tree.find({"Root", "Music"}) == created);
    CHECK(tree.find(CategoryPath{}) == tree.root_id());
}

TEST_CASE("A file keeps exactly one assignment across reassignments") {
    TaxonomyTree tree("Root");
    const NodeId docs = tree.find_or_create({"Docs"});
    tree.assign_file(docs, make_assignment("f1", 0.5));

    tree.reassign_file("f1", CategoryPath{"Work", "Notes"}, 0.9);
    tree.reassign_file("f1", CategoryPath{"Archive"}, 0.8, AssignmentSource::User);
    tree.reassign_file("f1", CategoryPath{"Work", "Notes"}, 0.95);

    CHECK(count_occurrences(tree, "f1") == 1);
    const auto location = tree.locate_file("f1");
    REQUIRE(location.has_value());
    CHECK(tree.path_of(location->node_id) == CategoryPath{"Work", "Notes"});
    CHECK(location->assignment.confidence == Catch::Approx(0.95));
    CHECK(location->assignment.source == AssignmentSource::Content);
    CHECK(location->assignment.filename == "f1.txt");
    CHECK(location->assignment.url == "/data/f1.txt");
    CHECK(tree.node(docs)->files.empty());
}

TEST_CASE("Assigning the same file id twice moves it instead of duplicating") {
    TaxonomyTree tree("Root");
    const NodeId a = tree.find_or_create({"A"});
    const NodeId b = tree.find_or_create({"B"});
    tree.assign_file(a, make_assignment("f1"));
    tree.assign_file(b, make_assignment("f1"));

    CHECK(tree.total_file_count() == 1);
    CHECK(tree.node(a)->files.empty());
    CHECK(tree.node(b)->files.size() == 1);
}

TEST_CASE("remove_category hands files and children to the parent") {
    TaxonomyTree tree("Root");
    const NodeId photos = tree.find_or_create({"Media", "Photos"});
    const NodeId raw = tree.find_or_create({"Media", "Photos", "Raw"});
    tree.assign_file(photos, make_assignment("p1"));
    tree.assign_file(photos, make_assignment("p2"));
    tree.assign_file(raw, make_assignment("r1"));
    tree.assign_file(tree.find_or_create({"Docs"}), make_assignment("d1"));
    const auto before = tree.total_file_count();

    REQUIRE(tree.remove_category({"Media", "Photos"}));

    CHECK(tree.total_file_count() == before);
    const auto media = tree.find({"Media"});
    REQUIRE(media.has_value());
    CHECK(tree.node(*media)->files.size() == 2);
    REQUIRE(tree.find({"Media", "Raw"}).has_value());
    CHECK(*tree.find({"Media", "Raw"}) == raw);
    CHECK(tree.locate_file("p1")->node_id == *media);
    CHECK_FALSE(tree.remove_node(tree.root_id()));
}

TEST_CASE("merge_categories folds files and children into the target") {
    TaxonomyTree tree("Root");
    const NodeId invoices = tree.find_or_create({"Invoices"});
    const NodeId receipts = tree.find_or_create({"Receipts"});
    tree.find_or_create({"Receipts", "2023"});
    tree.assign_file(invoices, make_assignment("i1"));
    tree.assign_file(receipts, make_assignment("r1"));

    REQUIRE(tree.merge_categories({"Receipts"}, {"Invoices"}));
    CHECK_FALSE(tree.find({"Receipts"}).has_value());
    CHECK(tree.node(invoices)->files.size() == 2);
    CHECK(tree.find({"Invoices", "2023"}).has_value());
    CHECK(tree.locate_file("r1")->node_id == invoices);
}

TEST_CASE("Merging combines children that share a name") {
    TaxonomyTree tree("Root");
    const NodeId cards = tree.find_or_create({"Card Tricks"});
    const NodeId card_videos = tree.find_or_create({"Card Tricks", "Videos"});
    const NodeId card_clips = tree.find_or_create({"Card Tricks", "Videos", "Clips"});
    const NodeId coin_videos = tree.find_or_create({"Coin Magic", "Videos"});
    const NodeId coin_clips = tree.find_or_create({"Coin Magic", "Videos", "Clips"});
    tree.assign_file(card_videos, make_assignment("c1"));
    tree.assign_file(card_clips, make_assignment("c2"));
    tree.assign_file(coin_videos, make_assignment("m1"));
    tree.assign_file(coin_clips, make_assignment("m2"));

    REQUIRE(tree.merge_categories({"Coin Magic"}, {"Card Tricks"}));

    REQUIRE(tree.node(cards)->children.size() == 1);
    CHECK(tree.node(cards)->children.front() == card_videos);
    REQUIRE(tree.node(card_videos)->children.size() == 1);
    CHECK(tree.node(card_videos)->children.front() == card_clips);
    CHECK_FALSE(tree.contains(coin_videos));
    CHECK_FALSE(tree.contains(coin_clips));

    CHECK(tree.node(card_videos)->files.size() == 2);
    CHECK(tree.node(card_clips)->files.size() == 2);
    CHECK(tree.locate_file("m1")->node_id == card_videos);
    CHECK(tree.locate_file("m2")->node_id == card_clips);
    CHECK(tree.total_file_count() == 4);
}

TEST_CASE("Removing a category merges its children into same-named siblings") {
    TaxonomyTree tree("Root");
    const NodeId media_videos = tree.find_or_create({"Media", "Videos"});
    const NodeId nested_videos = tree.find_or_create({"Media", "Old", "Videos"});
    tree.assign_file(media_videos, make_assignment("v1"));
    tree.assign_file(nested_videos, make_assignment("v2"));

    REQUIRE(tree.remove_category({"Media", "Old"}));

    const auto media = tree.find({"Media"});
    REQUIRE(media.has_value());
    REQUIRE(tree.node(*media)->children.size() == 1);
    CHECK(tree.node(*media)->children.front() == media_videos);
    CHECK_FALSE(tree.contains(nested_videos));
    CHECK(tree.node(media_videos)->files.size() == 2);
    CHECK(tree.locate_file("v2")->node_id == media_videos);
}

TEST_CASE("collapse_subtree pulls every descendant file up to the node") {
    TaxonomyTree tree("Root");
    const NodeId magic = tree.find_or_create({"Magic"});
    const NodeId videos = tree.find_or_create({"Magic", "Videos"});
    const NodeId clips = tree.find_or_create({"Magic", "Videos", "Clips"});
    const NodeId mine = tree.find_or_create({"Magic", "Mine"});
    tree.assign_file(magic, make_assignment("a"));
    tree.assign_file(videos, make_assignment("b"));
    tree.assign_file(clips, make_assignment("c"));
    tree.assign_file(mine, make_assignment("d"));
    tree.set_refinement_state(mine, RefinementState::UserEdited);

    CHECK(tree.collapse_subtree(magic) == 2);

    CHECK_FALSE(tree.contains(videos));
    CHECK_FALSE(tree.contains(clips));
    REQUIRE(tree.node(magic)->children.size() == 1);
    CHECK(tree.node(magic)->children.front() == mine);
    CHECK(tree.node(magic)->files.size() == 3);
    CHECK(tree.locate_file("c")->node_id == magic);
    CHECK(tree.locate_file("d")->node_id == mine);
    CHECK(tree.total_file_count(magic) == 4);
    CHECK(tree.collapse_subtree(kInvalidNodeId) == 0);
}

TEST_CASE("merge_nodes refuses to merge a node into its own descendant") {
    TaxonomyTree tree("Root");
    const NodeId parent = tree.find_or_create({"A"});
    const NodeId child = tree.find_or_create({"A", "B"});
    CHECK_FALSE(tree.merge_nodes(parent, child));
    CHECK_FALSE(tree.merge_nodes(parent, parent));
    CHECK(tree.merge_nodes(child, parent));
    CHECK(tree.node(parent)->children.empty());
}

TEST_CASE("split_category creates user-created children") {
    TaxonomyTree tree("Root");
    tree.find_or_create({"Projects"});
    const auto created = tree.split_category({"Projects"}, {"Active", "  ", "Archived"});
    REQUIRE(created.size() == 2);
    CHECK(tree.node(created[0])->name == "Active");
    CHECK(tree.node(created[1])->is_user_created);
    CHECK(tree.split_category({"Missing"}, {"X"}).empty());
}

TEST_CASE("move_node rejects cycles") {
    TaxonomyTree tree("Root");
    const NodeId a = tree.find_or_create({"A"});
    const NodeId b = tree.find_or_create({"A", "B"});
    const NodeId c = tree.find_or_create({"C"});
    CHECK_FALSE(tree.move_node(a, b));
    CHECK(tree.move_node(b, c));
    CHECK(tree.path_of(b) == CategoryPath{"C", "B"});
    CHECK(tree.is_descendant(b, c));
    CHECK_FALSE(tree.is_descendant(b, a));
}

TEST_CASE("User edited state cannot be cleared by later refinement states") {
    TaxonomyTree tree("Root");
    const NodeId node = tree.find_or_create({"Mine"});
    REQUIRE(tree.set_refinement_state(node, RefinementState::UserEdited));
    CHECK_FALSE(tree.set_refinement_state(node, RefinementState::Refined));
    CHECK(tree.node(node)->is_user_edited());
}

TEST_CASE("Statistics and depth reflect the tree contents") {
    TaxonomyTree tree("Root");
    const NodeId deep = tree.find_or_create({"A", "B", "C"});
    tree.assign_file(deep, make_assignment("f1", 0.4));
    auto flagged = make_assignment("f2", 0.6);
    flagged.needs_deep_analysis = true;
    tree.assign_file(tree.root_id(), flagged);
    tree.split_category({"A"}, {"Manual"});

    const auto stats = tree.statistics();
    CHECK(stats.category_count == 4);
    CHECK(stats.max_depth == 3);
    CHECK(stats.total_files == 2);
    CHECK(stats.files_needing_deep_analysis == 1);
    CHECK(stats.uncategorized_files == 1);
    CHECK(stats.average_confidence == Catch::Approx(0.5));
    CHECK(stats.user_created_categories == 1);
    CHECK(stats.inferred_categories == 3);
    CHECK(tree.files_needing_deep_analysis().size() == 1);
}

TEST_CASE("Confidence is clamped to the unit interval") {
    TaxonomyTree tree("Root");
    const NodeId node = tree.find_or_create({"A"});
    tree.assign_file(node, make_assignment("f1", 1.7));
    CHECK(tree.confidence_for_file("f1") == Catch::Approx(1.0));
    tree.set_confidence(node, -2.0);
    CHECK(tree.node(node)->confidence == Catch::Approx(0.0));
}

TEST_CASE("JSON export restores structure, files and metadata") {
    TaxonomyTree tree("Root", "Downloads");
    const NodeId node = tree.find_or_create({"Media", "Photos"});
    tree.assign_file(node, make_assignment("f1", 0.8));
    tree.set_metadata(node, "original_name", "Pictures");
    tree.set_refinement_state(node, RefinementState::UserEdited);

    const TaxonomyTree restored = TaxonomyTree::from_json(tree.to_json());
    const auto found = restored.find({"Media", "Photos"});
    REQUIRE(found.has_value());
    CHECK(restored.source_folder_name() == "Downloads");
    CHECK(restored.node(*found)->metadata.at("original_name") == "Pictures");
    CHECK(restored.node(*found)->is_user_edited());
    REQUIRE(restored.locate_file("f1").has_value());
    CHECK(restored.locate_file("f1")->node_id == *found);

    TaxonomyTree copy = restored;
    const NodeId added = copy.find_or_create({"New"});
    CHECK(added != kInvalidNodeId);
    CHECK(copy.category_count() == restored.category_count() + 1);
}

TEST_CASE("from_json rejects documents without a root") {
    Json::Value document(Json::objectValue);
    document["root"] = "not an object";
    CHECK_THROWS_AS(TaxonomyTree::from_json(document), TaxonomyError);
}
