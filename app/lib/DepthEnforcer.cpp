#include "DepthEnforcer.hpp"
#include "TaxonomyErrors.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <utility>

std::string to_string(DepthEnforcementMode mode)
{
    switch (mode) {
        case DepthEnforcementMode::Strict: return "strict";
        case DepthEnforcementMode::Advisory: return "advisory";
        case DepthEnforcementMode::Flatten: return "flatten";
        default: return "advisory";
    }
}

DepthEnforcementMode depth_enforcement_mode_from_string(const std::string& value)
{
    const std::string normalized = Utils::to_lower_copy(Utils::trim_copy(value));
    if (normalized == "strict") return DepthEnforcementMode::Strict;
    if (normalized == "flatten") return DepthEnforcementMode::Flatten;
    return DepthEnforcementMode::Advisory;
}

DepthEnforcer::DepthEnforcer(DepthConfig config, std::shared_ptr<spdlog::logger> logger)
    : config_(config),
      logger_(std::move(logger)) {}

DepthValidationResult DepthEnforcer::validate(const TaxonomyTree& tree) const
{
    DepthValidationResult result;
    result.current_max_depth = tree.max_depth();
    result.allowed_max_depth = config_.max_depth;

    const auto categories = tree.all_categories();
    if (result.current_max_depth > config_.max_depth) {
        DepthViolation overall;
        overall.type = DepthViolation::Type::ExceedsMaximum;
        overall.current_depth = result.current_max_depth;
        overall.allowed_depth = config_.max_depth;
        for (NodeId id : categories) {
            if (tree.depth_of(id) > config_.max_depth) {
                overall.affected_nodes.push_back(id);
            }
        }
        result.violations.push_back(std::move(overall));
    }

    if (result.current_max_depth < config_.min_depth) {
        result.warnings.push_back({DepthWarning::Type::BelowMinimum,
                                   result.current_max_depth, config_.min_depth, kInvalidNodeId});
    }

    for (NodeId id : categories) {
        const int depth = tree.depth_of(id);
        if (depth > config_.max_depth) {
            result.violations.push_back({DepthViolation::Type::NodeExceedsMaximum,
                                         depth, config_.max_depth, {id}});
        }
        const auto* node = tree.node(id);
        if (config_.show_warnings && node && !node->is_leaf() && depth == config_.max_depth - 1) {
            result.warnings.push_back({DepthWarning::Type::ApproachingMaximum,
                                       depth, config_.max_depth, id});
        }
    }

    result.is_valid = result.violations.empty();
    return result;
}

std::size_t DepthEnforcer::enforce(TaxonomyTree& tree) const
{
    const auto validation = validate(tree);
    if (validation.is_valid) {
        return 0;
    }

    switch (config_.mode) {
        case DepthEnforcementMode::Strict:
            throw TaxonomyPipelineError(
                TaxonomyPipelineError::Kind::DepthConstraintViolation,
                fmt::format("Taxonomy depth {} exceeds the allowed maximum of {}",
                            validation.current_max_depth, config_.max_depth));
        case DepthEnforcementMode::Advisory:
            if (logger_) {
                logger_->warn("Taxonomy depth {} exceeds the allowed maximum of {} ({} categories affected)",
                              validation.current_max_depth, config_.max_depth,
                              validation.violations.size() - 1);
            }
            return 0;
        case DepthEnforcementMode::Flatten:
            return flatten(tree);
    }
    return 0;
}

std::size_t DepthEnforcer::enforce(SharedTaxonomy& taxonomy) const
{
    return taxonomy.write([this](TaxonomyTree& tree) {
        return enforce(tree);
    });
}

std::size_t DepthEnforcer::flatten(TaxonomyTree& tree) const
{
    std::size_t removed = 0;
    while (tree.max_depth() > config_.max_depth) {
        // Deepest first, so each pass lifts one level.
        std::vector<std::pair<int, NodeId>> over_depth;
        for (NodeId id : tree.all_categories()) {
            const int depth = tree.depth_of(id);
            if (depth > config_.max_depth) {
                over_depth.emplace_back(depth, id);
            }
        }
        if (over_depth.empty()) {
            break;
        }
        std::stable_sort(over_depth.begin(), over_depth.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.first > rhs.first;
        });
        const int deepest = over_depth.front().first;
        for (const auto& [depth, id] : over_depth) {
            if (depth != deepest) {
                break;
            }
            const auto* node = tree.node(id);
            if (node && node->is_user_edited() && logger_) {
                logger_->warn("Flattening user-edited category '{}' to satisfy max depth {}",
                              tree.path_string(id), config_.max_depth);
            }
            if (tree.remove_node(id)) {
                ++removed;
            }
        }
    }

    if (logger_ && removed > 0) {
        logger_->info("Flattened {} categories to enforce max depth {}", removed, config_.max_depth);
    }
    return removed;
}
