#include "Settings.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>

namespace {
constexpr const char* kConfigFileName = "config.ini";
constexpr const char* kOllamaHostEnv = "FILE_TAXONOMY_OLLAMA_HOST";
constexpr const char* kLlmTimeoutEnv = "FILE_TAXONOMY_LLM_TIMEOUT";
constexpr const char* kTaskTimeoutEnv = "FILE_TAXONOMY_TASK_TIMEOUT";

constexpr const char* kClusteringSection = "Clustering";
constexpr const char* kRefinementSection = "Refinement";
constexpr const char* kDeepAnalysisSection = "DeepAnalysis";
constexpr const char* kTaskManagerSection = "TaskManager";
constexpr const char* kDepthSection = "Depth";
constexpr const char* kOllamaSection = "Ollama";

std::string bool_to_string(bool value)
{
    return value ? "true" : "false";
}

class ValueReader {
public:
    ValueReader(const IniConfig& config, std::shared_ptr<spdlog::logger> logger)
        : config_(config), logger_(std::move(logger)) {}

    bool read_bool(const char* section, const char* key, bool fallback) const
    {
        const std::string raw = Utils::to_lower_copy(config_.get_value(section, key));
        if (raw.empty()) {
            return fallback;
        }
        if (raw == "true" || raw == "1" || raw == "yes" || raw == "on") {
            return true;
        }
        if (raw == "false" || raw == "0" || raw == "no" || raw == "off") {
            return false;
        }
        warn(section, key, raw, "not a boolean");
        return fallback;
    }

    int read_int(const char* section, const char* key, int fallback) const
    {
        const std::string raw = config_.get_value(section, key);
        if (raw.empty()) {
            return fallback;
        }
        try {
            return std::stoi(raw);
        } catch (const std::exception& ex) {
            warn(section, key, raw, ex.what());
            return fallback;
        }
    }

    std::size_t read_size(const char* section, const char* key, std::size_t fallback) const
    {
        const int value = read_int(section, key, static_cast<int>(fallback));
        if (value < 0) {
            warn(section, key, std::to_string(value), "negative count");
            return fallback;
        }
        return static_cast<std::size_t>(value);
    }

    double read_double(const char* section, const char* key, double fallback) const
    {
        const std::string raw = config_.get_value(section, key);
        if (raw.empty()) {
            return fallback;
        }
        try {
            return std::stod(raw);
        } catch (const std::exception& ex) {
            warn(section, key, raw, ex.what());
            return fallback;
        }
    }

    std::string read_string(const char* section, const char* key, const std::string& fallback) const
    {
        const std::string raw = config_.get_value(section, key);
        return raw.empty() ? fallback : raw;
    }

private:
    void warn(const char* section, const char* key, const std::string& raw, const char* reason) const
    {
        if (logger_) {
            logger_->warn("Ignoring invalid setting {}.{}='{}': {}", section, key, raw, reason);
        }
    }

    const IniConfig& config_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

Settings::Settings()
    : Settings(Utils::default_config_dir())
{
}

Settings::Settings(std::string config_dir)
    : config_dir(std::move(config_dir)),
      core_logger(Logger::get_logger("core_logger"))
{
    config_path = (std::filesystem::path(this->config_dir) / kConfigFileName).string();
}

bool Settings::load()
{
    if (!config.load(config_path)) {
        if (core_logger) {
            core_logger->info("No settings file at '{}', using defaults", config_path);
        }
        return false;
    }
    read_values();
    return true;
}

bool Settings::save()
{
    write_values();
    if (!config.save(config_path)) {
        if (core_logger) {
            core_logger->error("Failed to write settings to '{}'", config_path);
        }
        return false;
    }
    return true;
}

void Settings::read_values()
{
    const ValueReader reader(config, core_logger);

    target_category_count = reader.read_size(kClusteringSection, "target_category_count", target_category_count);
    separate_file_types = reader.read_bool(kClusteringSection, "separate_file_types", separate_file_types);
    min_files_per_theme = reader.read_size(kClusteringSection, "min_files_per_theme", min_files_per_theme);
    theme_similarity_threshold = reader.read_double(kClusteringSection, "theme_similarity_threshold",
                                                    theme_similarity_threshold);
    use_stemming = reader.read_bool(kClusteringSection, "use_stemming", use_stemming);

    auto_refine = reader.read_bool(kRefinementSection, "auto_refine", auto_refine);
    apply_refined_names = reader.read_bool(kRefinementSection, "apply_refined_names", apply_refined_names);
    merge_file_threshold = reader.read_size(kRefinementSection, "merge_file_threshold", merge_file_threshold);
    sub_structure_threshold = reader.read_size(kRefinementSection, "sub_structure_threshold",
                                               sub_structure_threshold);
    refinement_delay_ms = reader.read_int(kRefinementSection, "delay_ms", refinement_delay_ms);

    deep_confidence_threshold = reader.read_double(kDeepAnalysisSection, "confidence_threshold",
                                                   deep_confidence_threshold);
    deep_max_concurrent = reader.read_int(kDeepAnalysisSection, "max_concurrent", deep_max_concurrent);
    deep_timeout_seconds = reader.read_int(kDeepAnalysisSection, "timeout_seconds", deep_timeout_seconds);
    use_hybrid_extraction = reader.read_bool(kDeepAnalysisSection, "use_hybrid_extraction", use_hybrid_extraction);
    full_extraction_threshold = reader.read_double(kDeepAnalysisSection, "full_extraction_threshold",
                                                   full_extraction_threshold);

    max_concurrent_tasks = reader.read_int(kTaskManagerSection, "max_concurrent_tasks", max_concurrent_tasks);
    task_start_delay_ms = reader.read_int(kTaskManagerSection, "task_start_delay_ms", task_start_delay_ms);
    auto_recategorize = reader.read_bool(kTaskManagerSection, "auto_recategorize", auto_recategorize);
    min_confidence_improvement = reader.read_double(kTaskManagerSection, "min_confidence_improvement",
                                                    min_confidence_improvement);
    respect_user_approvals = reader.read_bool(kTaskManagerSection, "respect_user_approvals", respect_user_approvals);
    max_retries = reader.read_int(kTaskManagerSection, "max_retries", max_retries);
    task_timeout_seconds = reader.read_int(kTaskManagerSection, "task_timeout_seconds", task_timeout_seconds);
    max_queue_size = reader.read_size(kTaskManagerSection, "max_queue_size", max_queue_size);

    min_depth = reader.read_int(kDepthSection, "min_depth", min_depth);
    max_depth = reader.read_int(kDepthSection, "max_depth", max_depth);
    depth_mode = depth_enforcement_mode_from_string(
        reader.read_string(kDepthSection, "mode", to_string(depth_mode)));
    show_depth_warnings = reader.read_bool(kDepthSection, "show_warnings", show_depth_warnings);

    ollama_host = reader.read_string(kOllamaSection, "host", ollama_host);
    ollama_model = reader.read_string(kOllamaSection, "model", ollama_model);
    llm_timeout_seconds = reader.read_int(kOllamaSection, "timeout_seconds", llm_timeout_seconds);
}

void Settings::write_values()
{
    config.set_value(kClusteringSection, "target_category_count", std::to_string(target_category_count));
    config.set_value(kClusteringSection, "separate_file_types", bool_to_string(separate_file_types));
    config.set_value(kClusteringSection, "min_files_per_theme", std::to_string(min_files_per_theme));
    config.set_value(kClusteringSection, "theme_similarity_threshold", std::to_string(theme_similarity_threshold));
    config.set_value(kClusteringSection, "use_stemming", bool_to_string(use_stemming));

    config.set_value(kRefinementSection, "auto_refine", bool_to_string(auto_refine));
    config.set_value(kRefinementSection, "apply_refined_names", bool_to_string(apply_refined_names));
    config.set_value(kRefinementSection, "merge_file_threshold", std::to_string(merge_file_threshold));
    config.set_value(kRefinementSection, "sub_structure_threshold", std::to_string(sub_structure_threshold));
    config.set_value(kRefinementSection, "delay_ms", std::to_string(refinement_delay_ms));

    config.set_value(kDeepAnalysisSection, "confidence_threshold", std::to_string(deep_confidence_threshold));
    config.set_value(kDeepAnalysisSection, "max_concurrent", std::to_string(deep_max_concurrent));
    config.set_value(kDeepAnalysisSection, "timeout_seconds", std::to_string(deep_timeout_seconds));
    config.set_value(kDeepAnalysisSection, "use_hybrid_extraction", bool_to_string(use_hybrid_extraction));
    config.set_value(kDeepAnalysisSection, "full_extraction_threshold", std::to_string(full_extraction_threshold));

    config.set_value(kTaskManagerSection, "max_concurrent_tasks", std::to_string(max_concurrent_tasks));
    config.set_value(kTaskManagerSection, "task_start_delay_ms", std::to_string(task_start_delay_ms));
    config.set_value(kTaskManagerSection, "auto_recategorize", bool_to_string(auto_recategorize));
    config.set_value(kTaskManagerSection, "min_confidence_improvement", std::to_string(min_confidence_improvement));
    config.set_value(kTaskManagerSection, "respect_user_approvals", bool_to_string(respect_user_approvals));
    config.set_value(kTaskManagerSection, "max_retries", std::to_string(max_retries));
    config.set_value(kTaskManagerSection, "task_timeout_seconds", std::to_string(task_timeout_seconds));
    config.set_value(kTaskManagerSection, "max_queue_size", std::to_string(max_queue_size));

    config.set_value(kDepthSection, "min_depth", std::to_string(min_depth));
    config.set_value(kDepthSection, "max_depth", std::to_string(max_depth));
    config.set_value(kDepthSection, "mode", to_string(depth_mode));
    config.set_value(kDepthSection, "show_warnings", bool_to_string(show_depth_warnings));

    config.set_value(kOllamaSection, "host", ollama_host);
    config.set_value(kOllamaSection, "model", ollama_model);
    config.set_value(kOllamaSection, "timeout_seconds", std::to_string(llm_timeout_seconds));
}

int Settings::resolve_env_seconds(const char* env_name, int fallback) const
{
    const char* value = std::getenv(env_name);
    if (!value || *value == '\0') {
        return fallback;
    }

    try {
        const int parsed = std::stoi(value);
        if (parsed > 0) {
            return parsed;
        }
        if (core_logger) {
            core_logger->warn("Ignoring non-positive {} '{}'", env_name, value);
        }
    } catch (const std::exception& ex) {
        if (core_logger) {
            core_logger->warn("Failed to parse {} '{}': {}", env_name, value, ex.what());
        }
    }
    return fallback;
}

int Settings::get_task_timeout_seconds() const
{
    return resolve_env_seconds(kTaskTimeoutEnv, task_timeout_seconds);
}

int Settings::get_llm_timeout_seconds() const
{
    return resolve_env_seconds(kLlmTimeoutEnv, llm_timeout_seconds);
}

std::string Settings::get_ollama_host() const
{
    const char* value = std::getenv(kOllamaHostEnv);
    if (value && *value != '\0') {
        return value;
    }
    return ollama_host;
}

SemanticThemeClusterer::Config Settings::make_clusterer_config() const
{
    auto result = SemanticThemeClusterer::Config::with_target_count(target_category_count, separate_file_types);
    result.min_files_per_theme = min_files_per_theme;
    result.theme_similarity_threshold = theme_similarity_threshold;
    return result;
}

TaxonomyBuilderConfig Settings::make_builder_config() const
{
    TaxonomyBuilderConfig result;
    result.target_category_count = target_category_count;
    result.separate_file_types = separate_file_types;
    result.min_files_per_theme = min_files_per_theme;
    result.theme_similarity_threshold = theme_similarity_threshold;
    result.auto_refine = auto_refine;
    result.refinement_model = ollama_model;
    result.apply_refined_names = apply_refined_names;
    result.merge_file_threshold = merge_file_threshold;
    result.sub_structure_threshold = sub_structure_threshold;
    result.refinement_delay = std::chrono::milliseconds(refinement_delay_ms < 0 ? 0 : refinement_delay_ms);
    result.use_stemming = use_stemming;
    return result;
}

DeepAnalyzerConfig Settings::make_analyzer_config() const
{
    DeepAnalyzerConfig result;
    result.confidence_threshold = deep_confidence_threshold;
    result.max_concurrent = deep_max_concurrent > 0 ? deep_max_concurrent : 1;
    result.timeout_per_file = std::chrono::seconds(deep_timeout_seconds > 0 ? deep_timeout_seconds : 1);
    result.use_hybrid_extraction = use_hybrid_extraction;
    result.full_extraction_threshold = full_extraction_threshold;
    result.model = ollama_model;
    return result;
}

TaskManagerConfig Settings::make_task_manager_config() const
{
    TaskManagerConfig result;
    result.max_concurrent_tasks = max_concurrent_tasks > 0 ? max_concurrent_tasks : 1;
    result.task_start_delay = std::chrono::milliseconds(task_start_delay_ms < 0 ? 0 : task_start_delay_ms);
    result.auto_recategorize = auto_recategorize;
    result.min_confidence_improvement = min_confidence_improvement;
    result.respect_user_approvals = respect_user_approvals;
    result.max_retries = max_retries < 0 ? 0 : max_retries;
    const int timeout = get_task_timeout_seconds();
    result.task_timeout = std::chrono::seconds(timeout > 0 ? timeout : 1);
    result.max_queue_size = max_queue_size;
    return result;
}

DepthConfig Settings::make_depth_config() const
{
    DepthConfig result;
    result.min_depth = min_depth;
    result.max_depth = max_depth;
    result.mode = depth_mode;
    result.show_warnings = show_depth_warnings;
    return result;
}

OllamaLLMClient::Config Settings::make_ollama_config() const
{
    OllamaLLMClient::Config result;
    result.host = get_ollama_host();
    result.default_model = ollama_model;
    result.timeout_seconds = get_llm_timeout_seconds();
    return result;
}
