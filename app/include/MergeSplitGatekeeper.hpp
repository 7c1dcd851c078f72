#ifndef MERGE_SPLIT_GATEKEEPER_HPP
#define MERGE_SPLIT_GATEKEEPER_HPP

#include "SharedTaxonomy.hpp"
#include "UserEditGuardrails.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

enum class SuggestionStatus {
    Pending,
    Approved,
    Rejected,
    Applied
};

std::string to_string(SuggestionStatus status);
SuggestionStatus suggestion_status_from_string(const std::string& value);

struct MergeSuggestion {
    std::string id;
    std::vector<NodeId> source_nodes;
    std::vector<std::string> source_names;
    // Existing category to merge into. When unset, a new category named target_name
    // is created under new_target_parent on approval.
    NodeId target_node{kInvalidNodeId};
    NodeId new_target_parent{kInvalidNodeId};
    std::string target_name;
    std::string reason;
    double confidence{0.0};
    TimePoint created_at{};
    SuggestionStatus status{SuggestionStatus::Pending};
    std::string resolution;
    NodeId applied_node{kInvalidNodeId};
};

struct ProposedSubcategory {
    std::string name;
    std::vector<std::string> exemplar_files;
    double confidence{0.0};
};

struct SplitSuggestion {
    std::string id;
    NodeId source_node{kInvalidNodeId};
    std::string source_name;
    std::vector<ProposedSubcategory> proposed_subcategories;
    std::string reason;
    double confidence{0.0};
    TimePoint created_at{};
    SuggestionStatus status{SuggestionStatus::Pending};
    std::string resolution;
    std::vector<NodeId> created_nodes;
};

struct AutoApplyResult {
    bool applied{false};
    std::string reason;
    std::vector<NodeId> nodes;
};

// Every merge or split is registered here before the tree changes. approve_* is the explicit
// path and overrides user-edit protection; auto_apply_* is the automatic path and is vetoed
// by the guardrails.
class MergeSplitGatekeeper {
public:
    explicit MergeSplitGatekeeper(UserEditGuardrails guardrails = UserEditGuardrails(),
                                  std::shared_ptr<spdlog::logger> logger = nullptr);

    std::string suggest_merge(MergeSuggestion suggestion, const SharedTaxonomy& taxonomy);
    std::string suggest_split(SplitSuggestion suggestion, const SharedTaxonomy& taxonomy);

    std::vector<MergeSuggestion> pending_merges() const;
    std::vector<SplitSuggestion> pending_splits() const;
    std::vector<MergeSuggestion> all_merges() const;
    std::vector<SplitSuggestion> all_splits() const;
    std::optional<MergeSuggestion> find_merge(const std::string& id) const;
    std::optional<SplitSuggestion> find_split(const std::string& id) const;

    // Throw TaxonomyPipelineError for unknown, already processed or stale suggestions.
    NodeId approve_merge(const std::string& id, SharedTaxonomy& taxonomy);
    std::vector<NodeId> approve_split(const std::string& id, SharedTaxonomy& taxonomy);
    void reject_merge(const std::string& id, const std::string& reason = std::string());
    void reject_split(const std::string& id, const std::string& reason = std::string());

    AutoApplyResult auto_apply_merge(const std::string& id, SharedTaxonomy& taxonomy);
    AutoApplyResult auto_apply_split(const std::string& id, SharedTaxonomy& taxonomy);

    std::size_t clear_processed();

    const UserEditGuardrails& guardrails() const { return guardrails_; }

private:
    MergeSuggestion& pending_merge_locked(const std::string& id);
    SplitSuggestion& pending_split_locked(const std::string& id);
    NodeId apply_merge(MergeSuggestion& suggestion, TaxonomyTree& tree);
    std::vector<NodeId> apply_split(SplitSuggestion& suggestion, TaxonomyTree& tree);

    UserEditGuardrails guardrails_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    std::vector<MergeSuggestion> merges_;
    std::vector<SplitSuggestion> splits_;
};

#endif
