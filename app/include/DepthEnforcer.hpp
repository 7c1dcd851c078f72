#ifndef DEPTH_ENFORCER_HPP
#define DEPTH_ENFORCER_HPP

#include "SharedTaxonomy.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

enum class DepthEnforcementMode {
    Strict,
    Advisory,
    Flatten
};

std::string to_string(DepthEnforcementMode mode);
DepthEnforcementMode depth_enforcement_mode_from_string(const std::string& value);

struct DepthConfig {
    int min_depth{2};
    int max_depth{5};
    DepthEnforcementMode mode{DepthEnforcementMode::Advisory};
    bool show_warnings{true};

    static DepthConfig defaults() { return DepthConfig{}; }
    static DepthConfig strict() { return DepthConfig{3, 7, DepthEnforcementMode::Strict, true}; }

    bool is_valid(int depth) const { return depth >= min_depth && depth <= max_depth; }
};

struct DepthViolation {
    enum class Type { ExceedsMaximum, NodeExceedsMaximum };
    Type type{Type::ExceedsMaximum};
    int current_depth{0};
    int allowed_depth{0};
    std::vector<NodeId> affected_nodes;
};

struct DepthWarning {
    enum class Type { BelowMinimum, ApproachingMaximum };
    Type type{Type::BelowMinimum};
    int current_depth{0};
    int suggested_depth{0};
    NodeId node{kInvalidNodeId};
};

struct DepthValidationResult {
    bool is_valid{true};
    std::vector<DepthViolation> violations;
    std::vector<DepthWarning> warnings;
    int current_max_depth{0};
    int allowed_max_depth{0};
};

class DepthEnforcer {
public:
    explicit DepthEnforcer(DepthConfig config = DepthConfig::defaults(),
                           std::shared_ptr<spdlog::logger> logger = nullptr);

    DepthValidationResult validate(const TaxonomyTree& tree) const;

    // Strict throws TaxonomyPipelineError(DepthConstraintViolation); advisory only logs;
    // flatten folds over-depth categories into their parents. Returns the number of
    // categories removed.
    std::size_t enforce(TaxonomyTree& tree) const;
    std::size_t enforce(SharedTaxonomy& taxonomy) const;

    const DepthConfig& config() const { return config_; }

private:
    std::size_t flatten(TaxonomyTree& tree) const;

    DepthConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
