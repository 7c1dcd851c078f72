#ifndef TAXONOMY_BUILDER_HPP
#define TAXONOMY_BUILDER_HPP

#include "EventChannel.hpp"
#include "TaxonomyTree.hpp"
#include "Types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class ILLMClient;
class MergeSplitGatekeeper;
class SharedTaxonomy;
namespace spdlog { class logger; }

struct TaxonomyBuilderConfig {
    std::size_t target_category_count{7};
    bool separate_file_types{true};
    std::size_t min_files_per_theme{3};
    double theme_similarity_threshold{0.15};
    bool auto_refine{true};
    std::string refinement_model{"llama3.2"};
    std::size_t refinement_batch_size{50};
    bool apply_refined_names{true};
    std::size_t merge_file_threshold{5};
    std::size_t sub_structure_threshold{3};
    std::chrono::milliseconds refinement_delay{100};
    bool use_stemming{false};
};

enum class RefinementPhase {
    RefiningNames,
    SuggestingMerges,
    Merging,
    InferringStructure,
    Complete,
    Cancelled
};

std::string to_string(RefinementPhase phase);

struct RefinementProgress {
    std::size_t total_categories{0};
    std::size_t refined_categories{0};
    std::string current_category;
    RefinementPhase phase{RefinementPhase::RefiningNames};

    double percentage() const {
        return total_categories == 0
            ? 100.0
            : 100.0 * static_cast<double>(refined_categories) / static_cast<double>(total_categories);
    }
};

struct MergeGrouping {
    std::vector<std::string> sources;
    std::string merged_name;
};

struct SubcategoryProposal {
    std::string name;
    std::vector<std::string> files;
};

// Phase 1 builds a taxonomy from filenames alone, synchronously and without network access.
// Phase 2 refines names and merges small categories with an LLM on a background thread.
class TaxonomyBuilder {
public:
    explicit TaxonomyBuilder(TaxonomyBuilderConfig config = TaxonomyBuilderConfig(),
                             std::shared_ptr<MergeSplitGatekeeper> gatekeeper = nullptr,
                             std::shared_ptr<spdlog::logger> logger = nullptr);
    ~TaxonomyBuilder();

    TaxonomyBuilder(const TaxonomyBuilder&) = delete;
    TaxonomyBuilder& operator=(const TaxonomyBuilder&) = delete;

    // Throws TaxonomyError(NoFilesProvided) for an empty input.
    TaxonomyTree build_instant(const std::vector<ScannedFile>& files,
                               const std::string& root_name = "Files") const;

    // Returns false when a refinement is already running.
    bool start_refinement(std::shared_ptr<SharedTaxonomy> taxonomy, std::shared_ptr<ILLMClient> llm);
    void cancel_refinement();
    bool wait_for_refinement(std::chrono::milliseconds timeout);
    bool is_refining() const;

    EventChannel<RefinementProgress>& progress() { return progress_; }
    const TaxonomyBuilderConfig& config() const { return config_; }
    MergeSplitGatekeeper& gatekeeper() { return *gatekeeper_; }

private:
    friend class TaxonomyBuilderTestAccess;

    void run_refinement(SharedTaxonomy& taxonomy, ILLMClient& llm, const CancellationToken& cancellation);
    std::size_t refine_names(SharedTaxonomy& taxonomy, ILLMClient& llm, const CancellationToken& cancellation);
    bool refine_category(SharedTaxonomy& taxonomy, ILLMClient& llm, NodeId node_id);
    void suggest_merges(SharedTaxonomy& taxonomy, ILLMClient& llm, const CancellationToken& cancellation);
    void infer_sub_structure(SharedTaxonomy& taxonomy, ILLMClient& llm, NodeId merged_node);
    bool pause_between_requests(const CancellationToken& cancellation) const;
    void publish(RefinementPhase phase, std::size_t total, std::size_t refined, const std::string& current);

    static std::string build_naming_prompt(const std::string& current_name, const std::vector<std::string>& filenames);
    static std::string build_merge_prompt(const std::vector<std::string>& candidate_lines);
    static std::string build_structure_prompt(const std::vector<std::string>& filenames);
    static std::string clean_category_name(const std::string& response);
    static std::vector<MergeGrouping> parse_merge_suggestions(const std::string& response);
    static std::optional<std::vector<SubcategoryProposal>> parse_sub_structure(const std::string& response);

    TaxonomyBuilderConfig config_;
    std::shared_ptr<MergeSplitGatekeeper> gatekeeper_;
    std::shared_ptr<spdlog::logger> logger_;
    EventChannel<RefinementProgress> progress_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool refining_{false};
    CancellationToken cancellation_;
    std::thread worker_;
};

#endif
