#include "UserEditGuardrails.hpp"

#include <spdlog/spdlog.h>

#include <utility>

UserEditGuardrails::UserEditGuardrails(bool protect_user_edits, std::shared_ptr<spdlog::logger> logger)
    : protect_user_edits_(protect_user_edits),
      logger_(std::move(logger)) {}

bool UserEditGuardrails::can_auto_modify(const TaxonomyTree& tree, NodeId node_id) const
{
    const auto* target = tree.node(node_id);
    if (!target) {
        return false;
    }
    if (!protect_user_edits_) {
        return true;
    }
    return !target->is_user_edited() && !target->is_user_created;
}

bool UserEditGuardrails::can_auto_reassign(const TaxonomyTree& tree, const std::string& file_id) const
{
    if (!protect_user_edits_) {
        return true;
    }
    auto location = tree.locate_file(file_id);
    if (!location) {
        return true;
    }
    const auto* owner = tree.node(location->node_id);
    return owner && !owner->is_user_edited();
}

bool UserEditGuardrails::can_auto_reassign(const TaxonomyTree& tree,
                                           const std::string& file_id,
                                           const CategoryPath& destination) const
{
    if (!can_auto_reassign(tree, file_id)) {
        return false;
    }
    if (!protect_user_edits_) {
        return true;
    }
    auto existing = tree.find(destination);
    if (!existing) {
        return true;
    }
    const auto* target = tree.node(*existing);
    return target && !target->is_user_edited();
}

bool UserEditGuardrails::mark_as_user_edited(TaxonomyTree& tree, NodeId node_id) const
{
    if (!tree.set_refinement_state(node_id, RefinementState::UserEdited)) {
        return false;
    }
    if (logger_) {
        logger_->info("Marked category '{}' as user-edited; automatic changes are blocked",
                      tree.path_string(node_id));
    }
    return true;
}

GuardrailCheckResult UserEditGuardrails::validate_merge(const TaxonomyTree& tree,
                                                        const std::vector<NodeId>& source_nodes,
                                                        NodeId target_node) const
{
    GuardrailCheckResult result;
    for (NodeId source : source_nodes) {
        const auto* node = tree.node(source);
        if (!node) {
            return {false, false, "Merge source no longer exists", {source}};
        }
        if (node->is_user_edited()) {
            result.affected_nodes.push_back(source);
        }
    }

    if (target_node != kInvalidNodeId) {
        const auto* target = tree.node(target_node);
        if (!target) {
            return {false, false, "Merge target no longer exists", {target_node}};
        }
        if (target->is_user_edited()) {
            result.affected_nodes.push_back(target_node);
        }
    }

    if (protect_user_edits_ && !result.affected_nodes.empty()) {
        result.allowed = false;
        result.requires_approval = true;
        result.reason = "Merge involves user-edited categories";
    }
    return result;
}

GuardrailCheckResult UserEditGuardrails::validate_split(const TaxonomyTree& tree, NodeId node_id) const
{
    const auto* node = tree.node(node_id);
    if (!node) {
        return {false, false, "Split source no longer exists", {node_id}};
    }
    if (protect_user_edits_ && node->is_user_edited()) {
        return {false, true, "Split involves a user-edited category", {node_id}};
    }
    return {};
}
