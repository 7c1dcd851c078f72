#ifndef DEEP_ANALYSIS_TASK_MANAGER_HPP
#define DEEP_ANALYSIS_TASK_MANAGER_HPP

#include "DeepAnalyzer.hpp"
#include "EventChannel.hpp"
#include "TaxonomyTree.hpp"
#include "Types.hpp"
#include "UserEditGuardrails.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class SharedTaxonomy;
namespace spdlog { class logger; }

enum class TaskPriority {
    Low = 0,
    Normal = 1,
    High = 2,
    Urgent = 3
};

enum class TaskStatus {
    Queued,
    Running,
    Completed,
    Failed,
    Cancelled
};

std::string to_string(TaskPriority priority);
std::string to_string(TaskStatus status);
TaskPriority task_priority_from_string(const std::string& value);
TaskStatus task_status_from_string(const std::string& value);

struct DeepAnalysisTask {
    std::string id;
    ScannedFile file;
    CategoryPath current_path;
    double current_confidence{0.0};
    TaskPriority priority{TaskPriority::Normal};
    bool user_approved{false};

    TaskStatus status{TaskStatus::Queued};
    int attempts{0};
    bool retryable{true};
    bool recategorized{false};
    std::optional<DeepAnalysisResult> result;
    std::string error;
    TimePoint created_at{};
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    CancellationToken cancellation;

    static DeepAnalysisTask for_file(ScannedFile file,
                                     CategoryPath current_path,
                                     double current_confidence,
                                     TaskPriority priority = TaskPriority::Normal);
    bool is_terminal() const;
};

struct TaskManagerConfig {
    int max_concurrent_tasks{2};
    std::chrono::milliseconds task_start_delay{100};
    bool auto_recategorize{true};
    double min_confidence_improvement{0.15};
    bool respect_user_approvals{true};
    int max_retries{2};
    std::chrono::seconds task_timeout{120};
    std::size_t max_queue_size{10000};

    static TaskManagerConfig defaults() { return TaskManagerConfig{}; }
    static TaskManagerConfig aggressive() {
        return TaskManagerConfig{4, std::chrono::milliseconds(50), true, 0.10, true, 1,
                                 std::chrono::seconds(60), 10000};
    }
    static TaskManagerConfig conservative() {
        return TaskManagerConfig{1, std::chrono::milliseconds(500), false, 0.20, true, 3,
                                 std::chrono::seconds(180), 10000};
    }
};

struct TaskManagerStatus {
    bool is_running{false};
    bool is_paused{false};
    std::size_t queued{0};
    std::size_t running{0};
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t cancelled{0};
    std::size_t total{0};
    std::vector<std::string> current_tasks;
    double progress{0.0};
    std::optional<std::chrono::milliseconds> estimated_time_remaining;
};

enum class TaskEventKind {
    StatusChanged,
    TaskCompleted,
    FileRecategorized,
    QueueRejected,
    Finished
};

struct TaskManagerEvent {
    TaskEventKind kind{TaskEventKind::StatusChanged};
    TaskManagerStatus status;
    std::string task_id;
    std::string file_id;
    TaskStatus task_status{TaskStatus::Queued};
    CategoryPath old_path;
    CategoryPath new_path;
    std::size_t rejected_count{0};
    std::string message;
};

// Priority queue of deep analysis work with a bounded running set. All queue and running
// state lives behind one mutex; callers interact through the public methods and the event channel.
class DeepAnalysisTaskManager {
public:
    DeepAnalysisTaskManager(TaskManagerConfig config,
                            std::shared_ptr<IDeepAnalyzer> analyzer,
                            std::shared_ptr<SharedTaxonomy> taxonomy,
                            std::shared_ptr<spdlog::logger> logger = nullptr,
                            UserEditGuardrails guardrails = UserEditGuardrails());
    ~DeepAnalysisTaskManager();

    DeepAnalysisTaskManager(const DeepAnalysisTaskManager&) = delete;
    DeepAnalysisTaskManager& operator=(const DeepAnalysisTaskManager&) = delete;

    bool enqueue_task(DeepAnalysisTask task);
    std::size_t enqueue_tasks(std::vector<DeepAnalysisTask> tasks);
    std::size_t enqueue_low_confidence_files(const SharedTaxonomy& taxonomy,
                                             double threshold,
                                             TaskPriority priority = TaskPriority::Normal);

    std::size_t remove_tasks(const std::vector<std::string>& file_ids);
    void clear_queue();
    bool cancel_task(const std::string& task_id);
    void cancel_all();

    void start();
    void pause();
    void resume();
    void stop();
    bool requeue_failed(const std::string& task_id);

    TaskManagerStatus status() const;
    std::vector<DeepAnalysisTask> completed_tasks() const;
    std::vector<DeepAnalysisTask> queued_tasks() const;
    bool wait_until_finished(std::chrono::milliseconds timeout);
    EventChannel<TaskManagerEvent>& events() { return events_; }
    const TaskManagerConfig& config() const { return config_; }

    // Moves when the confidence gain clears the threshold or the path changed, and the new
    // confidence is strictly higher. User-approved tasks never move while approvals are respected.
    static bool should_recategorize(const TaskManagerConfig& config,
                                    const DeepAnalysisTask& task,
                                    const DeepAnalysisResult& result);

private:
    struct RunningTask {
        DeepAnalysisTask task;
        std::future<DeepAnalysisOutcome> future;
        std::chrono::steady_clock::time_point started;
        std::chrono::steady_clock::time_point deadline;
    };

    struct Completion {
        DeepAnalysisTask task;
        std::optional<DeepAnalysisOutcome> outcome;
        std::string failure;
        std::chrono::milliseconds elapsed{0};
    };

    void run_loop();
    void start_locked(std::unique_lock<std::mutex>& lock);
    void launch_locked(DeepAnalysisTask task);
    std::vector<Completion> collect_completions_locked();
    void finish_task(Completion completion);
    bool apply_recategorization(DeepAnalysisTask& task, const DeepAnalysisResult& result);
    void sort_queue_locked();
    std::vector<std::string> existing_categories_locked() const;
    bool is_known_file_locked(const std::string& file_id) const;
    TaskManagerStatus build_status_locked() const;
    void publish_status_locked();

    std::future<DeepAnalysisOutcome> start_analysis_future(const DeepAnalysisTask& task,
                                                           std::vector<std::string> existing_categories) const;

    TaskManagerConfig config_;
    std::shared_ptr<IDeepAnalyzer> analyzer_;
    std::shared_ptr<SharedTaxonomy> taxonomy_;
    std::shared_ptr<spdlog::logger> logger_;
    UserEditGuardrails guardrails_;

    mutable std::mutex mutex_;
    std::condition_variable loop_cv_;
    std::condition_variable state_cv_;
    std::deque<DeepAnalysisTask> queue_;
    std::map<std::string, RunningTask> running_;
    std::vector<DeepAnalysisTask> finished_;
    // Index into finished_ where the current run begins; status counts only what follows.
    std::size_t run_start_{0};
    bool is_running_{false};
    bool is_paused_{false};
    bool stop_requested_{false};
    std::chrono::steady_clock::time_point next_launch_at_{};
    std::optional<double> average_task_ms_;
    TaskManagerStatus last_status_;
    std::thread loop_thread_;

    EventChannel<TaskManagerEvent> events_;
};

#endif
