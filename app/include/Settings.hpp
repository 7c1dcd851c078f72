#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "DeepAnalysisTaskManager.hpp"
#include "DeepAnalyzer.hpp"
#include "DepthEnforcer.hpp"
#include "IniConfig.hpp"
#include "OllamaLLMClient.hpp"
#include "SemanticThemeClusterer.hpp"
#include "TaxonomyBuilder.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace spdlog { class logger; }

class Settings {
public:
    Settings();
    explicit Settings(std::string config_dir);

    // Returns false when config.ini does not exist yet; defaults stay in place.
    bool load();
    bool save();

    std::string get_config_dir() const { return config_dir; }
    std::string get_config_path() const { return config_path; }

    std::size_t get_target_category_count() const { return target_category_count; }
    void set_target_category_count(std::size_t value) { target_category_count = value; }
    bool get_separate_file_types() const { return separate_file_types; }
    void set_separate_file_types(bool value) { separate_file_types = value; }
    std::size_t get_min_files_per_theme() const { return min_files_per_theme; }
    void set_min_files_per_theme(std::size_t value) { min_files_per_theme = value; }
    double get_theme_similarity_threshold() const { return theme_similarity_threshold; }
    void set_theme_similarity_threshold(double value) { theme_similarity_threshold = value; }
    bool get_use_stemming() const { return use_stemming; }
    void set_use_stemming(bool value) { use_stemming = value; }

    bool get_auto_refine() const { return auto_refine; }
    void set_auto_refine(bool value) { auto_refine = value; }
    bool get_apply_refined_names() const { return apply_refined_names; }
    void set_apply_refined_names(bool value) { apply_refined_names = value; }
    std::size_t get_merge_file_threshold() const { return merge_file_threshold; }
    void set_merge_file_threshold(std::size_t value) { merge_file_threshold = value; }
    std::size_t get_sub_structure_threshold() const { return sub_structure_threshold; }
    void set_sub_structure_threshold(std::size_t value) { sub_structure_threshold = value; }
    int get_refinement_delay_ms() const { return refinement_delay_ms; }
    void set_refinement_delay_ms(int value) { refinement_delay_ms = value; }

    double get_deep_confidence_threshold() const { return deep_confidence_threshold; }
    void set_deep_confidence_threshold(double value) { deep_confidence_threshold = value; }
    int get_deep_max_concurrent() const { return deep_max_concurrent; }
    void set_deep_max_concurrent(int value) { deep_max_concurrent = value; }
    int get_deep_timeout_seconds() const { return deep_timeout_seconds; }
    void set_deep_timeout_seconds(int value) { deep_timeout_seconds = value; }
    bool get_use_hybrid_extraction() const { return use_hybrid_extraction; }
    void set_use_hybrid_extraction(bool value) { use_hybrid_extraction = value; }
    double get_full_extraction_threshold() const { return full_extraction_threshold; }
    void set_full_extraction_threshold(double value) { full_extraction_threshold = value; }

    int get_max_concurrent_tasks() const { return max_concurrent_tasks; }
    void set_max_concurrent_tasks(int value) { max_concurrent_tasks = value; }
    int get_task_start_delay_ms() const { return task_start_delay_ms; }
    void set_task_start_delay_ms(int value) { task_start_delay_ms = value; }
    bool get_auto_recategorize() const { return auto_recategorize; }
    void set_auto_recategorize(bool value) { auto_recategorize = value; }
    double get_min_confidence_improvement() const { return min_confidence_improvement; }
    void set_min_confidence_improvement(double value) { min_confidence_improvement = value; }
    bool get_respect_user_approvals() const { return respect_user_approvals; }
    void set_respect_user_approvals(bool value) { respect_user_approvals = value; }
    int get_max_retries() const { return max_retries; }
    void set_max_retries(int value) { max_retries = value; }
    // FILE_TAXONOMY_TASK_TIMEOUT takes precedence over the stored value.
    int get_task_timeout_seconds() const;
    void set_task_timeout_seconds(int value) { task_timeout_seconds = value; }
    std::size_t get_max_queue_size() const { return max_queue_size; }
    void set_max_queue_size(std::size_t value) { max_queue_size = value; }

    int get_min_depth() const { return min_depth; }
    void set_min_depth(int value) { min_depth = value; }
    int get_max_depth() const { return max_depth; }
    void set_max_depth(int value) { max_depth = value; }
    DepthEnforcementMode get_depth_mode() const { return depth_mode; }
    void set_depth_mode(DepthEnforcementMode value) { depth_mode = value; }
    bool get_show_depth_warnings() const { return show_depth_warnings; }
    void set_show_depth_warnings(bool value) { show_depth_warnings = value; }

    // FILE_TAXONOMY_OLLAMA_HOST takes precedence over the stored value.
    std::string get_ollama_host() const;
    void set_ollama_host(const std::string& value) { ollama_host = value; }
    std::string get_ollama_model() const { return ollama_model; }
    void set_ollama_model(const std::string& value) { ollama_model = value; }
    // FILE_TAXONOMY_LLM_TIMEOUT takes precedence over the stored value.
    int get_llm_timeout_seconds() const;
    void set_llm_timeout_seconds(int value) { llm_timeout_seconds = value; }

    SemanticThemeClusterer::Config make_clusterer_config() const;
    TaxonomyBuilderConfig make_builder_config() const;
    DeepAnalyzerConfig make_analyzer_config() const;
    TaskManagerConfig make_task_manager_config() const;
    DepthConfig make_depth_config() const;
    OllamaLLMClient::Config make_ollama_config() const;

private:
    void read_values();
    void write_values();
    int resolve_env_seconds(const char* env_name, int fallback) const;

    std::string config_dir;
    std::string config_path;
    IniConfig config;
    std::shared_ptr<spdlog::logger> core_logger;

    std::size_t target_category_count{7};
    bool separate_file_types{true};
    std::size_t min_files_per_theme{3};
    double theme_similarity_threshold{0.15};
    bool use_stemming{false};

    bool auto_refine{true};
    bool apply_refined_names{true};
    std::size_t merge_file_threshold{5};
    std::size_t sub_structure_threshold{3};
    int refinement_delay_ms{100};

    double deep_confidence_threshold{0.75};
    int deep_max_concurrent{2};
    int deep_timeout_seconds{120};
    bool use_hybrid_extraction{true};
    double full_extraction_threshold{0.6};

    int max_concurrent_tasks{2};
    int task_start_delay_ms{100};
    bool auto_recategorize{true};
    double min_confidence_improvement{0.15};
    bool respect_user_approvals{true};
    int max_retries{2};
    int task_timeout_seconds{120};
    std::size_t max_queue_size{10000};

    int min_depth{2};
    int max_depth{5};
    DepthEnforcementMode depth_mode{DepthEnforcementMode::Advisory};
    bool show_depth_warnings{true};

    std::string ollama_host{"http://127.0.0.1:11434"};
    std::string ollama_model{"llama3.2"};
    int llm_timeout_seconds{120};
};

#endif
