#include <catch2/catch_test_macros.hpp>

#include "DepthEnforcer.hpp"
#include "TaxonomyErrors.hpp"

#include <algorithm>

namespace {

FileAssignment assignment(const std::string& filename)
{
    FileAssignment entry;
    entry.file_id = "id-" + filename;
    entry.filename = filename;
    entry.confidence = 0.6;
    return entry;
}

// Files / A / B / C / D / E with one file at D and one at E.
TaxonomyTree deep_tree()
{
    TaxonomyTree tree("Files");
    const NodeId e = tree.find_or_create({"A", "B", "C", "D", "E"});
    tree.assign_file(e, assignment("deepest.txt"));
    tree.assign_file(*tree.find({"A", "B", "C", "D"}), assignment("deep.txt"));
    tree.assign_file(tree.find_or_create({"Other"}), assignment("shallow.txt"));
    return tree;
}

DepthConfig config_with(int max_depth, DepthEnforcementMode mode)
{
    DepthConfig config;
    config.min_depth = 1;
    config.max_depth = max_depth;
    config.mode = mode;
    return config;
}

} // namespace

TEST_CASE("Validation reports over-depth categories") {
    const TaxonomyTree tree = deep_tree();
    const DepthEnforcer enforcer(config_with(3, DepthEnforcementMode::Advisory));

    const auto result = enforcer.validate(tree);

    CHECK_FALSE(result.is_valid);
    CHECK(result.current_max_depth == 5);
    CHECK(result.allowed_max_depth == 3);
    REQUIRE(result.violations.size() == 3);
    CHECK(result.violations[0].type == DepthViolation::Type::ExceedsMaximum);
    CHECK(result.violations[0].affected_nodes.size() == 2);
    CHECK(std::count_if(result.violations.begin(), result.violations.end(), [](const DepthViolation& v) {
        return v.type == DepthViolation::Type::NodeExceedsMaximum;
    }) == 2);

    const auto approaching = std::find_if(result.warnings.begin(), result.warnings.end(), [](const DepthWarning& w) {
        return w.type == DepthWarning::Type::ApproachingMaximum;
    });
    REQUIRE(approaching != result.warnings.end());
    CHECK(tree.path_of(approaching->node) == CategoryPath{"A", "B"});
}

TEST_CASE("Shallow trees produce a minimum depth warning") {
    TaxonomyTree tree("Files");
    tree.assign_file(tree.find_or_create({"Docs"}), assignment("a.txt"));
    DepthConfig config = DepthConfig::defaults();

    const auto result = DepthEnforcer(config).validate(tree);

    CHECK(result.is_valid);
    REQUIRE_FALSE(result.warnings.empty());
    CHECK(result.warnings.front().type == DepthWarning::Type::BelowMinimum);
    CHECK(result.warnings.front().current_depth == 1);
    CHECK(result.warnings.front().suggested_depth == 2);
    CHECK(DepthEnforcer(config).enforce(tree) == 0);
}

TEST_CASE("Strict mode refuses an over-depth tree") {
    TaxonomyTree tree = deep_tree();
    const DepthEnforcer enforcer(config_with(3, DepthEnforcementMode::Strict));

    try {
        (void)enforcer.enforce(tree);
        FAIL("expected TaxonomyPipelineError");
    } catch (const TaxonomyPipelineError& ex) {
        CHECK(ex.kind() == TaxonomyPipelineError::Kind::DepthConstraintViolation);
    }
    CHECK(tree.max_depth() == 5);
}

TEST_CASE("Advisory mode leaves the tree alone") {
    TaxonomyTree tree = deep_tree();
    const DepthEnforcer enforcer(config_with(3, DepthEnforcementMode::Advisory));

    CHECK(enforcer.enforce(tree) == 0);
    CHECK(tree.max_depth() == 5);
}

TEST_CASE("Flatten mode folds deep categories into their ancestors") {
    SharedTaxonomy taxonomy(deep_tree());
    const DepthEnforcer enforcer(config_with(3, DepthEnforcementMode::Flatten));

    CHECK(enforcer.enforce(taxonomy) == 2);

    taxonomy.read([](const TaxonomyTree& tree) {
        CHECK(tree.max_depth() == 3);
        CHECK(tree.total_file_count() == 3);
        const auto c = tree.find({"A", "B", "C"});
        REQUIRE(c);
        CHECK(tree.node(*c)->is_leaf());
        CHECK(tree.files_under(*c).size() == 2);
        CHECK(tree.locate_file("id-deepest.txt")->node_id == *c);
        CHECK(tree.path_of(tree.locate_file("id-shallow.txt")->node_id) == CategoryPath{"Other"});
        return 0;
    });
}

TEST_CASE("Flatten also folds user-edited categories") {
    TaxonomyTree tree = deep_tree();
    REQUIRE(tree.set_refinement_state(*tree.find({"A", "B", "C", "D", "E"}), RefinementState::UserEdited));

    CHECK(DepthEnforcer(config_with(4, DepthEnforcementMode::Flatten)).enforce(tree) == 1);
    CHECK(tree.max_depth() == 4);
    CHECK_FALSE(tree.find({"A", "B", "C", "D", "E"}));
}

TEST_CASE("Depth modes parse leniently") {
    CHECK(depth_enforcement_mode_from_string("Strict") == DepthEnforcementMode::Strict);
    CHECK(depth_enforcement_mode_from_string(" flatten ") == DepthEnforcementMode::Flatten);
    CHECK(depth_enforcement_mode_from_string("advisory") == DepthEnforcementMode::Advisory);
    CHECK(depth_enforcement_mode_from_string("whatever") == DepthEnforcementMode::Advisory);
    CHECK(to_string(DepthEnforcementMode::Flatten) == "flatten");
    CHECK(DepthConfig::strict().is_valid(3));
    CHECK_FALSE(DepthConfig::strict().is_valid(8));
}
