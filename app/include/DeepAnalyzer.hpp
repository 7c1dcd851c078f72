#ifndef DEEP_ANALYZER_HPP
#define DEEP_ANALYZER_HPP

#include "IInspector.hpp"
#include "Types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class ILLMClient;
namespace spdlog { class logger; }

struct DeepAnalyzerConfig {
    double confidence_threshold{0.75};
    int max_concurrent{2};
    std::chrono::seconds timeout_per_file{120};
    bool use_hybrid_extraction{true};
    double full_extraction_threshold{0.6};
    std::string model{"llama3.2"};

    static DeepAnalyzerConfig defaults() { return DeepAnalyzerConfig{}; }
    static DeepAnalyzerConfig fast() {
        return DeepAnalyzerConfig{0.75, 3, std::chrono::seconds(60), false, 0.6, "llama3.2"};
    }
    static DeepAnalyzerConfig thorough() {
        return DeepAnalyzerConfig{0.75, 1, std::chrono::seconds(300), true, 0.5, "llama3.2"};
    }
};

struct DeepAnalysisResult {
    std::string file_id;
    std::string filename;
    std::vector<std::string> category_path;
    double confidence{0.0};
    std::string rationale;
    std::string content_summary;
    std::vector<std::string> suggested_tags;
    bool used_full_extraction{false};
    std::chrono::milliseconds duration{0};

    std::string path_string() const;
};

enum class DeepAnalysisErrorKind {
    InvalidResponse,
    LLMUnavailable,
    Cancelled,
    InvalidUtf8,
    Timeout
};

std::string to_string(DeepAnalysisErrorKind kind);

// Either a result or an error kind with a message. Never thrown.
struct DeepAnalysisOutcome {
    std::optional<DeepAnalysisResult> result;
    DeepAnalysisErrorKind error{DeepAnalysisErrorKind::InvalidResponse};
    std::string message;

    bool ok() const { return result.has_value(); }
    bool is_fatal() const { return !ok() && error == DeepAnalysisErrorKind::InvalidUtf8; }

    static DeepAnalysisOutcome success(DeepAnalysisResult value);
    static DeepAnalysisOutcome failure(DeepAnalysisErrorKind kind, std::string message);
};

class IDeepAnalyzer {
public:
    virtual ~IDeepAnalyzer() = default;
    virtual DeepAnalysisOutcome analyze(const ScannedFile& file,
                                        const std::vector<std::string>& existing_categories,
                                        const CancellationToken& cancellation) = 0;
};

// Caps the number of analyses in flight. Waiters give up when their token is cancelled.
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(int max_concurrent);

    bool acquire(const CancellationToken& cancellation);
    void release();
    int active() const;
    int capacity() const { return capacity_; }

    class Slot {
    public:
        Slot(ConcurrencyLimiter& limiter, const CancellationToken& cancellation);
        ~Slot();
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        bool acquired() const { return acquired_; }

    private:
        ConcurrencyLimiter& limiter_;
        bool acquired_{false};
    };

private:
    int capacity_;
    int active_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

class DeepAnalyzer : public IDeepAnalyzer {
public:
    DeepAnalyzer(DeepAnalyzerConfig config,
                 std::shared_ptr<ILLMClient> llm,
                 std::shared_ptr<IInspector> inspector,
                 std::shared_ptr<spdlog::logger> logger = nullptr);

    DeepAnalysisOutcome analyze(const ScannedFile& file,
                                const std::vector<std::string>& existing_categories,
                                const CancellationToken& cancellation) override;

    std::vector<DeepAnalysisOutcome> analyze_files(const std::vector<ScannedFile>& files,
                                                   const std::vector<std::string>& existing_categories,
                                                   const CancellationToken& cancellation);

    const DeepAnalyzerConfig& config() const { return config_; }
    int active_analyses() const { return limiter_.active(); }

private:
    friend class DeepAnalyzerTestAccess;

    DeepAnalysisOutcome run_pass(const ScannedFile& file,
                                 const std::vector<std::string>& existing_categories,
                                 const CancellationToken& cancellation,
                                 InspectionDepth depth,
                                 std::chrono::steady_clock::time_point deadline);
    ContentSignal inspect_or_fallback(const ScannedFile& file, InspectionDepth depth);

    static std::string build_prompt(const std::string& filename,
                                    const ContentSignal& signal,
                                    const std::vector<std::string>& existing_categories);
    static DeepAnalysisOutcome parse_analysis_response(const std::string& response,
                                                       const ScannedFile& file);
    static std::string format_duration(double seconds);

    DeepAnalyzerConfig config_;
    std::shared_ptr<ILLMClient> llm_;
    std::shared_ptr<IInspector> inspector_;
    std::shared_ptr<spdlog::logger> logger_;
    ConcurrencyLimiter limiter_;
};

#endif
