#ifndef USER_EDIT_GUARDRAILS_HPP
#define USER_EDIT_GUARDRAILS_HPP

#include "TaxonomyTree.hpp"

#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

struct GuardrailCheckResult {
    bool allowed{true};
    bool requires_approval{false};
    std::string reason;
    std::vector<NodeId> affected_nodes;
};

// Protection rules for categories a person has touched. The user-edited mark is one-way:
// nothing here or elsewhere clears it.
class UserEditGuardrails {
public:
    explicit UserEditGuardrails(bool protect_user_edits = true,
                                std::shared_ptr<spdlog::logger> logger = nullptr);

    bool can_auto_modify(const TaxonomyTree& tree, NodeId node_id) const;
    bool can_auto_reassign(const TaxonomyTree& tree, const std::string& file_id) const;
    // Also refuses when the destination category already exists and is user-edited.
    bool can_auto_reassign(const TaxonomyTree& tree,
                           const std::string& file_id,
                           const CategoryPath& destination) const;
    bool mark_as_user_edited(TaxonomyTree& tree, NodeId node_id) const;

    GuardrailCheckResult validate_merge(const TaxonomyTree& tree,
                                        const std::vector<NodeId>& source_nodes,
                                        NodeId target_node) const;
    GuardrailCheckResult validate_split(const TaxonomyTree& tree, NodeId node_id) const;

    bool protects_user_edits() const { return protect_user_edits_; }

private:
    bool protect_user_edits_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
