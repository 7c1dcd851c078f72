#include "DeepAnalyzer.hpp"
#include "ILLMClient.hpp"
#include "LLMErrors.hpp"
#include "LLMResponseParser.hpp"
#include "TaxonomyErrors.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace {

constexpr std::size_t kMaxTextCueChars = 2000;
constexpr std::size_t kMaxTags = 10;
constexpr std::size_t kMaxExistingCategories = 20;

std::string join_prefix(const std::vector<std::string>& values, std::size_t limit, const std::string& separator)
{
    std::vector<std::string> head(values.begin(),
                                  values.begin() + static_cast<std::ptrdiff_t>(std::min(limit, values.size())));
    return Utils::join(head, separator);
}

// Cuts at a code point boundary so the prompt never carries a broken sequence.
std::string utf8_prefix(const std::string& text, std::size_t max_bytes)
{
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

std::vector<std::string> string_array(const Json::Value& value)
{
    std::vector<std::string> out;
    if (!value.isArray()) {
        return out;
    }
    for (const auto& item : value) {
        if (item.isString()) {
            out.push_back(item.asString());
        }
    }
    return out;
}

} // namespace

std::string DeepAnalysisResult::path_string() const
{
    return Utils::join(category_path, " / ");
}

std::string to_string(DeepAnalysisErrorKind kind)
{
    switch (kind) {
        case DeepAnalysisErrorKind::InvalidResponse: return "invalid_response";
        case DeepAnalysisErrorKind::LLMUnavailable: return "llm_unavailable";
        case DeepAnalysisErrorKind::Cancelled: return "cancelled";
        case DeepAnalysisErrorKind::InvalidUtf8: return "invalid_utf8";
        case DeepAnalysisErrorKind::Timeout: return "timeout";
        default: return "invalid_response";
    }
}

DeepAnalysisOutcome DeepAnalysisOutcome::success(DeepAnalysisResult value)
{
    DeepAnalysisOutcome outcome;
    outcome.result = std::move(value);
    return outcome;
}

DeepAnalysisOutcome DeepAnalysisOutcome::failure(DeepAnalysisErrorKind kind, std::string message)
{
    DeepAnalysisOutcome outcome;
    outcome.error = kind;
    outcome.message = std::move(message);
    return outcome;
}

ConcurrencyLimiter::ConcurrencyLimiter(int max_concurrent)
    : capacity_(std::max(1, max_concurrent))
{
}

bool ConcurrencyLimiter::acquire(const CancellationToken& cancellation)
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (active_ >= capacity_) {
        if (cancellation.is_cancelled()) {
            return false;
        }
        // Cancellation is not signalled through the condition variable, so poll.
        cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
    if (cancellation.is_cancelled()) {
        return false;
    }
    ++active_;
    return true;
}

void ConcurrencyLimiter::release()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ > 0) {
            --active_;
        }
    }
    cv_.notify_one();
}

int ConcurrencyLimiter::active() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

ConcurrencyLimiter::Slot::Slot(ConcurrencyLimiter& limiter, const CancellationToken& cancellation)
    : limiter_(limiter),
      acquired_(limiter.acquire(cancellation))
{
}

ConcurrencyLimiter::Slot::~Slot()
{
    if (acquired_) {
        limiter_.release();
    }
}

DeepAnalyzer::DeepAnalyzer(DeepAnalyzerConfig config,
                           std::shared_ptr<ILLMClient> llm,
                           std::shared_ptr<IInspector> inspector,
                           std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      llm_(std::move(llm)),
      inspector_(std::move(inspector)),
      logger_(std::move(logger)),
      limiter_(config_.max_concurrent)
{
}

DeepAnalysisOutcome DeepAnalyzer::analyze(const ScannedFile& file,
                                          const std::vector<std::string>& existing_categories,
                                          const CancellationToken& cancellation)
{
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + config_.timeout_per_file;

    ConcurrencyLimiter::Slot slot(limiter_, cancellation);
    if (!slot.acquired()) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::Cancelled,
                                            "Cancelled while waiting for an analysis slot");
    }
    if (logger_) {
        logger_->debug("Deep analysis of '{}' started ({}/{} slots in use)",
                       file.name, limiter_.active(), limiter_.capacity());
    }

    const InspectionDepth first_depth =
        config_.use_hybrid_extraction ? InspectionDepth::Quick : InspectionDepth::Full;
    DeepAnalysisOutcome outcome = run_pass(file, existing_categories, cancellation, first_depth, deadline);

    if (outcome.ok() && first_depth == InspectionDepth::Quick &&
        outcome.result->confidence < config_.full_extraction_threshold) {
        if (logger_) {
            logger_->debug("Quick pass for '{}' gave {:.2f}; running full extraction",
                           file.name, outcome.result->confidence);
        }
        DeepAnalysisOutcome full = run_pass(file, existing_categories, cancellation, InspectionDepth::Full, deadline);
        if (full.ok() && full.result->confidence >= outcome.result->confidence) {
            outcome = std::move(full);
        } else if (!full.ok() && (full.error == DeepAnalysisErrorKind::Cancelled || full.is_fatal())) {
            outcome = std::move(full);
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (outcome.ok()) {
        outcome.result->duration = elapsed;
        if (logger_) {
            logger_->info("Deep analysis of '{}' -> {} ({:.0f}%) in {} ms",
                          file.name, outcome.result->path_string(),
                          outcome.result->confidence * 100.0, elapsed.count());
        }
    } else if (logger_) {
        logger_->warn("Deep analysis of '{}' failed [{}]: {}",
                      file.name, to_string(outcome.error), outcome.message);
    }
    return outcome;
}

std::vector<DeepAnalysisOutcome> DeepAnalyzer::analyze_files(const std::vector<ScannedFile>& files,
                                                             const std::vector<std::string>& existing_categories,
                                                             const CancellationToken& cancellation)
{
    std::vector<DeepAnalysisOutcome> outcomes;
    outcomes.reserve(files.size());
    std::size_t succeeded = 0;
    for (const auto& file : files) {
        if (cancellation.is_cancelled()) {
            outcomes.push_back(DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::Cancelled,
                                                            "Batch cancelled"));
            continue;
        }
        outcomes.push_back(analyze(file, existing_categories, cancellation));
        if (outcomes.back().ok()) {
            ++succeeded;
        }
    }
    if (logger_) {
        logger_->info("Deep analysis batch finished: {} succeeded, {} failed",
                      succeeded, files.size() - succeeded);
    }
    return outcomes;
}

DeepAnalysisOutcome DeepAnalyzer::run_pass(const ScannedFile& file,
                                           const std::vector<std::string>& existing_categories,
                                           const CancellationToken& cancellation,
                                           InspectionDepth depth,
                                           std::chrono::steady_clock::time_point deadline)
{
    if (cancellation.is_cancelled()) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::Cancelled, "Cancelled before inspection");
    }

    const ContentSignal signal = inspect_or_fallback(file, depth);

    if (cancellation.is_cancelled()) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::Cancelled, "Cancelled after inspection");
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::Timeout,
                                            "Timed out during content inspection");
    }
    if (!llm_) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::LLMUnavailable, "No LLM client configured");
    }

    const std::string prompt = build_prompt(file.name, signal, existing_categories);
    LLMOptions options = LLMOptions::defaults(config_.model);
    options.cancellation = cancellation;

    std::string response;
    try {
        response = llm_->complete_json(prompt, options);
    } catch (const LLMError& ex) {
        const auto kind = ex.kind() == LLMError::Kind::Cancelled ? DeepAnalysisErrorKind::Cancelled
                        : ex.kind() == LLMError::Kind::Timeout ? DeepAnalysisErrorKind::Timeout
                        : ex.kind() == LLMError::Kind::InvalidResponse ? DeepAnalysisErrorKind::InvalidResponse
                        : DeepAnalysisErrorKind::LLMUnavailable;
        return DeepAnalysisOutcome::failure(kind, ex.what());
    }

    if (cancellation.is_cancelled()) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::Cancelled, "Cancelled after LLM response");
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::Timeout,
                                            fmt::format("Exceeded {} s per-file timeout",
                                                        config_.timeout_per_file.count()));
    }

    DeepAnalysisOutcome outcome = parse_analysis_response(response, file);
    if (outcome.ok()) {
        outcome.result->used_full_extraction = depth == InspectionDepth::Full;
    }
    return outcome;
}

ContentSignal DeepAnalyzer::inspect_or_fallback(const ScannedFile& file, InspectionDepth depth)
{
    ContentSignal fallback;
    fallback.kind = "unknown";
    if (!inspector_) {
        return fallback;
    }
    try {
        return inspector_->inspect(file, depth);
    } catch (const ExtractionError& ex) {
        if (logger_) {
            logger_->warn("Content inspection failed for '{}': {}. Using filename only.", file.name, ex.what());
        }
    }
    return fallback;
}

std::string DeepAnalyzer::format_duration(double seconds)
{
    const auto total = static_cast<long long>(seconds);
    return fmt::format("{}m {}s", total / 60, total % 60);
}

std::string DeepAnalyzer::build_prompt(const std::string& filename,
                                       const ContentSignal& signal,
                                       const std::vector<std::string>& existing_categories)
{
    std::string prompt =
        "You are a file categorization expert. Analyze this file's CONTENT to determine its category.\n\n";
    prompt += "FILE: " + filename + "\n";
    prompt += "TYPE: " + (signal.kind.empty() ? std::string("unknown") : signal.kind) + "\n";

    if (!signal.text_cue.empty()) {
        prompt += "\nEXTRACTED TEXT CONTENT:\n" + utf8_prefix(signal.text_cue, kMaxTextCueChars) + "\n";
    }
    if (!signal.scene_tags.empty()) {
        prompt += "\nVISUAL CONTENT TAGS: " + join_prefix(signal.scene_tags, kMaxTags, ", ") + "\n";
    }
    if (!signal.detected_objects.empty()) {
        prompt += "\nDETECTED OBJECTS: " + join_prefix(signal.detected_objects, kMaxTags, ", ") + "\n";
    }
    if (signal.duration_seconds) {
        prompt += "\nDURATION: " + format_duration(*signal.duration_seconds) + "\n";
    }
    if (!existing_categories.empty()) {
        prompt += "\nEXISTING CATEGORIES (prefer these if content matches):\n" +
                  join_prefix(existing_categories, kMaxExistingCategories, "\n") + "\n";
    }

    prompt +=
        "\nBased on the actual CONTENT (not just filename), categorize this file.\n\n"
        "Return JSON:\n"
        "{\n"
        "    \"categoryPath\": [\"Main\", \"Sub1\", \"Sub2\"],\n"
        "    \"confidence\": 0.95,\n"
        "    \"rationale\": \"Why this category based on content\",\n"
        "    \"contentSummary\": \"Brief summary of what the file contains\",\n"
        "    \"suggestedTags\": [\"tag1\", \"tag2\"]\n"
        "}\n";
    return prompt;
}

DeepAnalysisOutcome DeepAnalyzer::parse_analysis_response(const std::string& response,
                                                          const ScannedFile& file)
{
    if (!Utils::is_valid_utf8(response)) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::InvalidUtf8,
                                            "LLM response is not valid UTF-8");
    }

    const JsonParseResult parsed = LLMResponseParser::parse_json_object(response);
    if (!parsed.ok()) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::InvalidResponse, parsed.error);
    }
    const Json::Value& root = *parsed.value;

    if (!root["categoryPath"].isArray()) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::InvalidResponse,
                                            "Missing 'categoryPath' array");
    }
    if (!root["confidence"].isNumeric()) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::InvalidResponse,
                                            "Missing numeric 'confidence'");
    }

    DeepAnalysisResult result;
    result.file_id = file.id;
    result.filename = file.name;
    for (const auto& component : string_array(root["categoryPath"])) {
        std::string trimmed = Utils::trim_copy(component);
        if (!trimmed.empty()) {
            result.category_path.push_back(std::move(trimmed));
        }
    }
    if (result.category_path.empty()) {
        return DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::InvalidResponse,
                                            "Empty 'categoryPath'");
    }

    result.confidence = std::clamp(root["confidence"].asDouble(), 0.0, 1.0);
    if (root["rationale"].isString()) {
        result.rationale = root["rationale"].asString();
    }
    if (root["contentSummary"].isString()) {
        result.content_summary = root["contentSummary"].asString();
    }
    result.suggested_tags = string_array(root["suggestedTags"]);
    return DeepAnalysisOutcome::success(std::move(result));
}
