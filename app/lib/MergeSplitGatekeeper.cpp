#include "MergeSplitGatekeeper.hpp"
#include "TaxonomyErrors.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace {

[[noreturn]] void throw_not_found(const std::string& id) {
    throw TaxonomyPipelineError(TaxonomyPipelineError::Kind::SuggestionNotFound,
                                fmt::format("Suggestion not found: {}", id));
}

[[noreturn]] void throw_already_processed(const std::string& id, SuggestionStatus status) {
    throw TaxonomyPipelineError(TaxonomyPipelineError::Kind::SuggestionAlreadyProcessed,
                                fmt::format("Suggestion {} was already {}", id, to_string(status)));
}

bool is_processed(SuggestionStatus status) {
    return status == SuggestionStatus::Rejected || status == SuggestionStatus::Applied;
}

std::vector<NodeId> live_nodes(const TaxonomyTree& tree, const std::vector<NodeId>& ids) {
    std::vector<NodeId> live;
    for (NodeId id : ids) {
        if (tree.contains(id) && std::find(live.begin(), live.end(), id) == live.end()) {
            live.push_back(id);
        }
    }
    return live;
}

} // namespace

std::string to_string(SuggestionStatus status)
{
    switch (status) {
        case SuggestionStatus::Pending: return "pending";
        case SuggestionStatus::Approved: return "approved";
        case SuggestionStatus::Rejected: return "rejected";
        case SuggestionStatus::Applied: return "applied";
        default: return "pending";
    }
}

SuggestionStatus suggestion_status_from_string(const std::string& value)
{
    if (value == "approved") return SuggestionStatus::Approved;
    if (value == "rejected") return SuggestionStatus::Rejected;
    if (value == "applied") return SuggestionStatus::Applied;
    return SuggestionStatus::Pending;
}

MergeSplitGatekeeper::MergeSplitGatekeeper(UserEditGuardrails guardrails, std::shared_ptr<spdlog::logger> logger)
    : guardrails_(std::move(guardrails)),
      logger_(std::move(logger)) {}

std::string MergeSplitGatekeeper::suggest_merge(MergeSuggestion suggestion, const SharedTaxonomy& taxonomy)
{
    if (suggestion.id.empty()) {
        suggestion.id = Utils::generate_id("merge");
    }
    suggestion.status = SuggestionStatus::Pending;
    suggestion.created_at = Clock::now();

    const auto check = taxonomy.read([&](const TaxonomyTree& tree) {
        if (suggestion.source_names.empty()) {
            for (NodeId source : suggestion.source_nodes) {
                if (const auto* node = tree.node(source)) {
                    suggestion.source_names.push_back(node->name);
                }
            }
        }
        return guardrails_.validate_merge(tree, suggestion.source_nodes, suggestion.target_node);
    });
    if (check.requires_approval && logger_) {
        logger_->warn("Merge suggestion {} touches user-edited categories and needs explicit approval",
                      suggestion.id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    merges_.push_back(suggestion);
    if (logger_) {
        logger_->info("Queued merge suggestion {}: [{}] -> '{}'", suggestion.id,
                      Utils::join(suggestion.source_names, ", "), suggestion.target_name);
    }
    return suggestion.id;
}

std::string MergeSplitGatekeeper::suggest_split(SplitSuggestion suggestion, const SharedTaxonomy& taxonomy)
{
    if (suggestion.id.empty()) {
        suggestion.id = Utils::generate_id("split");
    }
    suggestion.status = SuggestionStatus::Pending;
    suggestion.created_at = Clock::now();

    const auto check = taxonomy.read([&](const TaxonomyTree& tree) {
        if (suggestion.source_name.empty()) {
            if (const auto* node = tree.node(suggestion.source_node)) {
                suggestion.source_name = node->name;
            }
        }
        return guardrails_.validate_split(tree, suggestion.source_node);
    });
    if (check.requires_approval && logger_) {
        logger_->warn("Split suggestion {} touches a user-edited category and needs explicit approval",
                      suggestion.id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    splits_.push_back(suggestion);
    return suggestion.id;
}

std::vector<MergeSuggestion> MergeSplitGatekeeper::pending_merges() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MergeSuggestion> pending;
    std::copy_if(merges_.begin(), merges_.end(), std::back_inserter(pending), [](const MergeSuggestion& entry) {
        return entry.status == SuggestionStatus::Pending;
    });
    return pending;
}

std::vector<SplitSuggestion> MergeSplitGatekeeper::pending_splits() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SplitSuggestion> pending;
    std::copy_if(splits_.begin(), splits_.end(), std::back_inserter(pending), [](const SplitSuggestion& entry) {
        return entry.status == SuggestionStatus::Pending;
    });
    return pending;
}

std::vector<MergeSuggestion> MergeSplitGatekeeper::all_merges() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return merges_;
}

std::vector<SplitSuggestion> MergeSplitGatekeeper::all_splits() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return splits_;
}

std::optional<MergeSuggestion> MergeSplitGatekeeper::find_merge(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : merges_) {
        if (entry.id == id) {
            return entry;
        }
    }
    return std::nullopt;
}

std::optional<SplitSuggestion> MergeSplitGatekeeper::find_split(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : splits_) {
        if (entry.id == id) {
            return entry;
        }
    }
    return std::nullopt;
}

MergeSuggestion& MergeSplitGatekeeper::pending_merge_locked(const std::string& id)
{
    auto it = std::find_if(merges_.begin(), merges_.end(), [&id](const MergeSuggestion& entry) {
        return entry.id == id;
    });
    if (it == merges_.end()) {
        throw_not_found(id);
    }
    if (it->status != SuggestionStatus::Pending) {
        throw_already_processed(id, it->status);
    }
    return *it;
}

SplitSuggestion& MergeSplitGatekeeper::pending_split_locked(const std::string& id)
{
    auto it = std::find_if(splits_.begin(), splits_.end(), [&id](const SplitSuggestion& entry) {
        return entry.id == id;
    });
    if (it == splits_.end()) {
        throw_not_found(id);
    }
    if (it->status != SuggestionStatus::Pending) {
        throw_already_processed(id, it->status);
    }
    return *it;
}

NodeId MergeSplitGatekeeper::apply_merge(MergeSuggestion& suggestion, TaxonomyTree& tree)
{
    auto mark_stale = [&](const std::string& why) {
        suggestion.status = SuggestionStatus::Rejected;
        suggestion.resolution = why;
        throw TaxonomyPipelineError(TaxonomyPipelineError::Kind::StaleSuggestion,
                                    fmt::format("Merge {} is stale: {}", suggestion.id, why));
    };

    const auto sources = live_nodes(tree, suggestion.source_nodes);
    if (sources.empty()) {
        mark_stale("source categories no longer exist");
    }

    NodeId target = suggestion.target_node;
    if (target != kInvalidNodeId) {
        if (!tree.contains(target)) {
            mark_stale("target category no longer exists");
        }
    } else {
        const std::string name = Utils::sanitize_path_label(suggestion.target_name);
        if (name.empty()) {
            mark_stale("merged category name is empty");
        }
        if (!tree.contains(suggestion.new_target_parent)) {
            mark_stale("parent of the merged category no longer exists");
        }
        target = tree.find_or_create_child(suggestion.new_target_parent, name);
    }

    for (NodeId source : sources) {
        if (source == target) {
            continue;
        }
        if (!tree.merge_nodes(source, target) && logger_) {
            logger_->warn("Skipped merging category {} into {} for suggestion {}",
                          source, target, suggestion.id);
        }
    }
    if (!suggestion.source_names.empty()) {
        tree.set_metadata(target, "merged_from", Utils::join(suggestion.source_names, ", "));
    }

    suggestion.status = SuggestionStatus::Applied;
    suggestion.applied_node = target;
    if (logger_) {
        logger_->info("Applied merge {} into '{}'", suggestion.id, tree.path_string(target));
    }
    return target;
}

std::vector<NodeId> MergeSplitGatekeeper::apply_split(SplitSuggestion& suggestion, TaxonomyTree& tree)
{
    if (!tree.contains(suggestion.source_node)) {
        suggestion.status = SuggestionStatus::Rejected;
        suggestion.resolution = "source category no longer exists";
        throw TaxonomyPipelineError(TaxonomyPipelineError::Kind::StaleSuggestion,
                                    fmt::format("Split {} is stale: source category no longer exists",
                                                suggestion.id));
    }

    std::vector<std::string> names;
    for (const auto& proposed : suggestion.proposed_subcategories) {
        std::string name = Utils::sanitize_path_label(proposed.name);
        if (!name.empty()) {
            names.push_back(std::move(name));
        }
    }
    auto created = tree.split_node(suggestion.source_node, names);

    suggestion.status = SuggestionStatus::Applied;
    suggestion.created_nodes = created;
    if (logger_) {
        logger_->info("Applied split {} on '{}' ({} subcategories)",
                      suggestion.id, tree.path_string(suggestion.source_node), created.size());
    }
    return created;
}

NodeId MergeSplitGatekeeper::approve_merge(const std::string& id, SharedTaxonomy& taxonomy)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& suggestion = pending_merge_locked(id);
    suggestion.status = SuggestionStatus::Approved;
    return taxonomy.write([&](TaxonomyTree& tree) {
        return apply_merge(suggestion, tree);
    });
}

std::vector<NodeId> MergeSplitGatekeeper::approve_split(const std::string& id, SharedTaxonomy& taxonomy)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& suggestion = pending_split_locked(id);
    suggestion.status = SuggestionStatus::Approved;
    return taxonomy.write([&](TaxonomyTree& tree) {
        return apply_split(suggestion, tree);
    });
}

void MergeSplitGatekeeper::reject_merge(const std::string& id, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& suggestion = pending_merge_locked(id);
    suggestion.status = SuggestionStatus::Rejected;
    suggestion.resolution = reason.empty() ? "rejected" : reason;
}

void MergeSplitGatekeeper::reject_split(const std::string& id, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& suggestion = pending_split_locked(id);
    suggestion.status = SuggestionStatus::Rejected;
    suggestion.resolution = reason.empty() ? "rejected" : reason;
}

AutoApplyResult MergeSplitGatekeeper::auto_apply_merge(const std::string& id, SharedTaxonomy& taxonomy)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& suggestion = pending_merge_locked(id);

    return taxonomy.write([&](TaxonomyTree& tree) -> AutoApplyResult {
        auto check = guardrails_.validate_merge(tree, suggestion.source_nodes, suggestion.target_node);
        if (check.allowed && suggestion.target_node == kInvalidNodeId && guardrails_.protects_user_edits()) {
            // A new target whose name collides with a user-edited sibling would merge into it.
            auto existing = tree.find_child(suggestion.new_target_parent,
                                            Utils::sanitize_path_label(suggestion.target_name));
            const auto* sibling = existing ? tree.node(*existing) : nullptr;
            if (sibling && sibling->is_user_edited()) {
                check = {false, true, "Merge target is a user-edited category", {*existing}};
            }
        }
        if (!check.allowed) {
            suggestion.status = SuggestionStatus::Rejected;
            suggestion.resolution = check.reason;
            if (logger_) {
                logger_->warn("Guardrails vetoed merge {}: {}", suggestion.id, check.reason);
            }
            return {false, check.reason, check.affected_nodes};
        }
        suggestion.status = SuggestionStatus::Approved;
        try {
            return {true, std::string(), {apply_merge(suggestion, tree)}};
        } catch (const TaxonomyPipelineError& ex) {
            if (logger_) {
                logger_->warn("{}", ex.what());
            }
            return {false, ex.what(), {}};
        }
    });
}

AutoApplyResult MergeSplitGatekeeper::auto_apply_split(const std::string& id, SharedTaxonomy& taxonomy)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& suggestion = pending_split_locked(id);

    return taxonomy.write([&](TaxonomyTree& tree) -> AutoApplyResult {
        const auto check = guardrails_.validate_split(tree, suggestion.source_node);
        if (!check.allowed) {
            suggestion.status = SuggestionStatus::Rejected;
            suggestion.resolution = check.reason;
            if (logger_) {
                logger_->warn("Guardrails vetoed split {}: {}", suggestion.id, check.reason);
            }
            return {false, check.reason, check.affected_nodes};
        }
        suggestion.status = SuggestionStatus::Approved;
        try {
            return {true, std::string(), apply_split(suggestion, tree)};
        } catch (const TaxonomyPipelineError& ex) {
            if (logger_) {
                logger_->warn("{}", ex.what());
            }
            return {false, ex.what(), {}};
        }
    });
}

std::size_t MergeSplitGatekeeper::clear_processed()
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t before = merges_.size() + splits_.size();
    merges_.erase(std::remove_if(merges_.begin(), merges_.end(), [](const MergeSuggestion& entry) {
        return is_processed(entry.status);
    }), merges_.end());
    splits_.erase(std::remove_if(splits_.begin(), splits_.end(), [](const SplitSuggestion& entry) {
        return is_processed(entry.status);
    }), splits_.end());
    return before - (merges_.size() + splits_.size());
}
