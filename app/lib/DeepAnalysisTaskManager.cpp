#include "DeepAnalysisTaskManager.hpp"
#include "SharedTaxonomy.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <set>
#include <utility>

namespace {

constexpr double kDurationSmoothing = 0.3;
constexpr auto kLoopPollInterval = std::chrono::milliseconds(10);

std::string extension_of(const std::string& filename)
{
    std::string ext = std::filesystem::path(filename).extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(ext.begin());
    }
    return Utils::to_lower_copy(ext);
}

} // namespace

std::string to_string(TaskPriority priority)
{
    switch (priority) {
        case TaskPriority::Low: return "low";
        case TaskPriority::Normal: return "normal";
        case TaskPriority::High: return "high";
        case TaskPriority::Urgent: return "urgent";
        default: return "normal";
    }
}

std::string to_string(TaskStatus status)
{
    switch (status) {
        case TaskStatus::Queued: return "queued";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
        default: return "queued";
    }
}

TaskPriority task_priority_from_string(const std::string& value)
{
    if (value == "low") return TaskPriority::Low;
    if (value == "high") return TaskPriority::High;
    if (value == "urgent") return TaskPriority::Urgent;
    return TaskPriority::Normal;
}

TaskStatus task_status_from_string(const std::string& value)
{
    if (value == "running") return TaskStatus::Running;
    if (value == "completed") return TaskStatus::Completed;
    if (value == "failed") return TaskStatus::Failed;
    if (value == "cancelled") return TaskStatus::Cancelled;
    return TaskStatus::Queued;
}

DeepAnalysisTask DeepAnalysisTask::for_file(ScannedFile file,
                                            CategoryPath current_path,
                                            double current_confidence,
                                            TaskPriority priority)
{
    DeepAnalysisTask task;
    task.id = Utils::generate_id("task-");
    task.file = std::move(file);
    task.current_path = std::move(current_path);
    task.current_confidence = current_confidence;
    task.priority = priority;
    task.created_at = Clock::now();
    return task;
}

bool DeepAnalysisTask::is_terminal() const
{
    return status == TaskStatus::Completed || status == TaskStatus::Failed || status == TaskStatus::Cancelled;
}

DeepAnalysisTaskManager::DeepAnalysisTaskManager(TaskManagerConfig config,
                                                 std::shared_ptr<IDeepAnalyzer> analyzer,
                                                 std::shared_ptr<SharedTaxonomy> taxonomy,
                                                 std::shared_ptr<spdlog::logger> logger,
                                                 UserEditGuardrails guardrails)
    : config_(config),
      analyzer_(std::move(analyzer)),
      taxonomy_(std::move(taxonomy)),
      logger_(std::move(logger)),
      guardrails_(std::move(guardrails))
{
    if (config_.max_concurrent_tasks < 1) {
        config_.max_concurrent_tasks = 1;
    }
}

DeepAnalysisTaskManager::~DeepAnalysisTaskManager()
{
    stop();
}

bool DeepAnalysisTaskManager::enqueue_task(DeepAnalysisTask task)
{
    std::vector<DeepAnalysisTask> batch;
    batch.push_back(std::move(task));
    return enqueue_tasks(std::move(batch)) == 1;
}

std::size_t DeepAnalysisTaskManager::enqueue_tasks(std::vector<DeepAnalysisTask> tasks)
{
    std::unique_lock<std::mutex> lock(mutex_);
    std::size_t accepted = 0;
    std::size_t rejected = 0;
    for (auto& task : tasks) {
        if (is_known_file_locked(task.file.id)) {
            if (logger_) {
                logger_->debug("Skipping '{}': already queued or running", task.file.name);
            }
            continue;
        }
        if (queue_.size() >= config_.max_queue_size) {
            ++rejected;
            continue;
        }
        if (task.id.empty()) {
            task.id = Utils::generate_id("task-");
        }
        if (task.created_at == TimePoint{}) {
            task.created_at = Clock::now();
        }
        task.status = TaskStatus::Queued;
        queue_.push_back(std::move(task));
        ++accepted;
    }
    sort_queue_locked();

    if (rejected > 0) {
        if (logger_) {
            logger_->warn("Deep analysis queue is full ({} tasks); rejected {} task(s)",
                          config_.max_queue_size, rejected);
        }
        TaskManagerEvent event;
        event.kind = TaskEventKind::QueueRejected;
        event.rejected_count = rejected;
        event.message = "Queue limit reached";
        event.status = build_status_locked();
        events_.push(std::move(event));
    }
    if (logger_ && accepted > 0) {
        logger_->info("Queued {} deep analysis task(s), {} waiting", accepted, queue_.size());
    }

    if (accepted > 0 && !is_running_) {
        start_locked(lock);
    }
    publish_status_locked();
    return accepted;
}

std::size_t DeepAnalysisTaskManager::enqueue_low_confidence_files(const SharedTaxonomy& taxonomy,
                                                                  double threshold,
                                                                  TaskPriority priority)
{
    auto tasks = taxonomy.read([&](const TaxonomyTree& tree) {
        std::vector<DeepAnalysisTask> built;
        for (const auto& assignment : tree.all_assignments()) {
            if (assignment.confidence >= threshold && !assignment.needs_deep_analysis) {
                continue;
            }
            ScannedFile file;
            file.id = assignment.file_id;
            file.name = assignment.filename;
            file.path = assignment.url;
            file.extension = extension_of(assignment.filename);
            DeepAnalysisTask task = DeepAnalysisTask::for_file(std::move(file),
                                                               tree.path_of(assignment.category_id),
                                                               assignment.confidence,
                                                               priority);
            task.user_approved = assignment.source == AssignmentSource::User;
            built.push_back(std::move(task));
        }
        return built;
    });
    if (logger_) {
        logger_->info("{} file(s) fall below the {:.2f} confidence threshold", tasks.size(), threshold);
    }
    return enqueue_tasks(std::move(tasks));
}

std::size_t DeepAnalysisTaskManager::remove_tasks(const std::vector<std::string>& file_ids)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::set<std::string> ids(file_ids.begin(), file_ids.end());
    const auto before = queue_.size();
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                [&](const DeepAnalysisTask& task) { return ids.count(task.file.id) > 0; }),
                 queue_.end());
    const auto removed = before - queue_.size();
    if (removed > 0) {
        publish_status_locked();
    }
    return removed;
}

void DeepAnalysisTaskManager::clear_queue()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_ && !queue_.empty()) {
        logger_->info("Clearing {} queued deep analysis task(s)", queue_.size());
    }
    queue_.clear();
    publish_status_locked();
}

bool DeepAnalysisTaskManager::cancel_task(const std::string& task_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto queued = std::find_if(queue_.begin(), queue_.end(),
                               [&](const DeepAnalysisTask& task) { return task.id == task_id; });
    if (queued != queue_.end()) {
        DeepAnalysisTask task = std::move(*queued);
        queue_.erase(queued);
        task.status = TaskStatus::Cancelled;
        task.completed_at = Clock::now();
        finished_.push_back(std::move(task));
        publish_status_locked();
        loop_cv_.notify_all();
        return true;
    }

    auto running = running_.find(task_id);
    if (running != running_.end()) {
        DeepAnalysisTask task = std::move(running->second.task);
        running_.erase(running);
        task.cancellation.cancel();
        task.status = TaskStatus::Cancelled;
        task.completed_at = Clock::now();
        finished_.push_back(std::move(task));
        publish_status_locked();
        loop_cv_.notify_all();
        return true;
    }
    return false;
}

void DeepAnalysisTaskManager::cancel_all()
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    for (auto& task : queue_) {
        task.status = TaskStatus::Cancelled;
        task.completed_at = now;
        finished_.push_back(std::move(task));
    }
    queue_.clear();
    for (auto& [id, running] : running_) {
        running.task.cancellation.cancel();
        running.task.status = TaskStatus::Cancelled;
        running.task.completed_at = now;
        finished_.push_back(std::move(running.task));
    }
    running_.clear();
    if (logger_) {
        logger_->info("Cancelled all deep analysis tasks");
    }
    publish_status_locked();
    loop_cv_.notify_all();
}

void DeepAnalysisTaskManager::start()
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (is_running_) {
        return;
    }
    start_locked(lock);
    publish_status_locked();
}

void DeepAnalysisTaskManager::start_locked(std::unique_lock<std::mutex>& lock)
{
    is_running_ = true;
    stop_requested_ = false;
    run_start_ = finished_.size();
    std::thread previous = std::move(loop_thread_);
    if (previous.joinable()) {
        // The previous loop has already cleared is_running_ and is on its way out.
        lock.unlock();
        previous.join();
        lock.lock();
    }
    if (logger_) {
        logger_->debug("Deep analysis loop starting (max {} concurrent)", config_.max_concurrent_tasks);
    }
    loop_thread_ = std::thread(&DeepAnalysisTaskManager::run_loop, this);
}

void DeepAnalysisTaskManager::pause()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_paused_) {
        return;
    }
    is_paused_ = true;
    if (logger_) {
        logger_->info("Deep analysis paused; {} task(s) still running", running_.size());
    }
    publish_status_locked();
}

void DeepAnalysisTaskManager::resume()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_paused_) {
        return;
    }
    is_paused_ = false;
    if (logger_) {
        logger_->info("Deep analysis resumed");
    }
    publish_status_locked();
    loop_cv_.notify_all();
}

void DeepAnalysisTaskManager::stop()
{
    std::thread loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        const auto now = Clock::now();
        for (auto& [id, running] : running_) {
            running.task.cancellation.cancel();
            running.task.status = TaskStatus::Cancelled;
            running.task.completed_at = now;
            finished_.push_back(std::move(running.task));
        }
        running_.clear();
        if (logger_ && !queue_.empty()) {
            logger_->info("Stopping deep analysis; dropping {} queued task(s)", queue_.size());
        }
        queue_.clear();
        is_running_ = false;
        is_paused_ = false;
        loop = std::move(loop_thread_);
    }
    loop_cv_.notify_all();
    if (loop.joinable()) {
        loop.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
    publish_status_locked();
    state_cv_.notify_all();
}

bool DeepAnalysisTaskManager::requeue_failed(const std::string& task_id)
{
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = std::find_if(finished_.begin(), finished_.end(),
                           [&](const DeepAnalysisTask& task) { return task.id == task_id; });
    if (it == finished_.end() || it->status != TaskStatus::Failed) {
        return false;
    }
    if (!it->retryable || it->attempts > config_.max_retries) {
        if (logger_) {
            logger_->info("Not retrying '{}' after {} attempt(s)", it->file.name, it->attempts);
        }
        return false;
    }
    if (queue_.size() >= config_.max_queue_size) {
        return false;
    }

    if (static_cast<std::size_t>(it - finished_.begin()) < run_start_) {
        --run_start_;
    }
    DeepAnalysisTask task = std::move(*it);
    finished_.erase(it);
    task.status = TaskStatus::Queued;
    task.error.clear();
    task.result.reset();
    task.started_at.reset();
    task.completed_at.reset();
    task.cancellation = CancellationToken();
    queue_.push_back(std::move(task));
    sort_queue_locked();

    if (!is_running_) {
        start_locked(lock);
    }
    publish_status_locked();
    loop_cv_.notify_all();
    return true;
}

TaskManagerStatus DeepAnalysisTaskManager::status() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_status_;
}

std::vector<DeepAnalysisTask> DeepAnalysisTaskManager::completed_tasks() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

std::vector<DeepAnalysisTask> DeepAnalysisTaskManager::queued_tasks() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<DeepAnalysisTask>(queue_.begin(), queue_.end());
}

bool DeepAnalysisTaskManager::wait_until_finished(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [this] { return !is_running_; });
}

bool DeepAnalysisTaskManager::should_recategorize(const TaskManagerConfig& config,
                                                  const DeepAnalysisTask& task,
                                                  const DeepAnalysisResult& result)
{
    if (task.user_approved && config.respect_user_approvals) {
        return false;
    }
    if (!config.auto_recategorize) {
        return false;
    }
    const bool significant_gain = result.confidence > task.current_confidence + config.min_confidence_improvement;
    const bool path_changed = result.category_path != task.current_path;
    return (significant_gain || path_changed) && result.confidence > task.current_confidence;
}

void DeepAnalysisTaskManager::run_loop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        auto completions = collect_completions_locked();
        if (!completions.empty()) {
            lock.unlock();
            for (auto& completion : completions) {
                finish_task(std::move(completion));
            }
            lock.lock();
            if (stop_requested_) {
                break;
            }
        }

        const auto now = std::chrono::steady_clock::now();
        if (!is_paused_ && !queue_.empty() &&
            running_.size() < static_cast<std::size_t>(config_.max_concurrent_tasks) &&
            now >= next_launch_at_) {
            DeepAnalysisTask task = std::move(queue_.front());
            queue_.pop_front();
            launch_locked(std::move(task));
            next_launch_at_ = now + config_.task_start_delay;
            publish_status_locked();
            continue;
        }

        if (queue_.empty() && running_.empty()) {
            is_running_ = false;
            publish_status_locked();
            TaskManagerEvent event;
            event.kind = TaskEventKind::Finished;
            event.status = last_status_;
            events_.push(std::move(event));
            if (logger_) {
                logger_->info("Deep analysis finished: {} completed, {} failed, {} cancelled",
                              last_status_.completed, last_status_.failed, last_status_.cancelled);
            }
            state_cv_.notify_all();
            return;
        }

        loop_cv_.wait_for(lock, kLoopPollInterval);
    }
}

void DeepAnalysisTaskManager::launch_locked(DeepAnalysisTask task)
{
    task.status = TaskStatus::Running;
    task.started_at = Clock::now();
    ++task.attempts;
    if (logger_) {
        logger_->debug("Launching deep analysis of '{}' (attempt {}, priority {})",
                       task.file.name, task.attempts, to_string(task.priority));
    }

    RunningTask running;
    running.started = std::chrono::steady_clock::now();
    running.deadline = running.started + config_.task_timeout;
    running.future = start_analysis_future(task, existing_categories_locked());
    const std::string id = task.id;
    running.task = std::move(task);
    running_.emplace(id, std::move(running));
}

std::future<DeepAnalysisOutcome> DeepAnalysisTaskManager::start_analysis_future(
    const DeepAnalysisTask& task,
    std::vector<std::string> existing_categories) const
{
    auto promise = std::make_shared<std::promise<DeepAnalysisOutcome>>();
    std::future<DeepAnalysisOutcome> future = promise->get_future();

    std::thread([analyzer = analyzer_, promise, file = task.file,
                 categories = std::move(existing_categories), token = task.cancellation]() {
        try {
            if (!analyzer) {
                promise->set_value(DeepAnalysisOutcome::failure(DeepAnalysisErrorKind::LLMUnavailable,
                                                                "No analyzer configured"));
                return;
            }
            promise->set_value(analyzer->analyze(file, categories, token));
        } catch (...) {
            try {
                promise->set_exception(std::current_exception());
            } catch (const std::future_error&) {
                // promise already satisfied
            }
        }
    }).detach();

    return future;
}

std::vector<DeepAnalysisTaskManager::Completion> DeepAnalysisTaskManager::collect_completions_locked()
{
    std::vector<Completion> completions;
    const auto now = std::chrono::steady_clock::now();
    for (auto it = running_.begin(); it != running_.end();) {
        RunningTask& running = it->second;
        const bool ready = running.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        if (!ready && now < running.deadline) {
            ++it;
            continue;
        }

        Completion completion;
        completion.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - running.started);
        if (ready) {
            try {
                completion.outcome = running.future.get();
            } catch (const std::exception& ex) {
                completion.failure = ex.what();
            }
        } else {
            running.task.cancellation.cancel();
            completion.outcome = DeepAnalysisOutcome::failure(
                DeepAnalysisErrorKind::Timeout,
                "Timed out after " + std::to_string(config_.task_timeout.count()) + " s");
        }
        completion.task = std::move(running.task);
        completions.push_back(std::move(completion));
        it = running_.erase(it);
    }
    return completions;
}

void DeepAnalysisTaskManager::finish_task(Completion completion)
{
    DeepAnalysisTask& task = completion.task;
    bool moved = false;

    if (completion.outcome && completion.outcome->ok()) {
        task.status = TaskStatus::Completed;
        task.result = completion.outcome->result;
        if (should_recategorize(config_, task, *task.result)) {
            moved = apply_recategorization(task, *task.result);
        }
    } else {
        task.status = TaskStatus::Failed;
        if (completion.outcome) {
            task.error = to_string(completion.outcome->error) + ": " + completion.outcome->message;
            task.retryable = !completion.outcome->is_fatal();
        } else {
            task.error = completion.failure;
        }
        if (logger_) {
            logger_->warn("Deep analysis of '{}' failed: {}", task.file.name, task.error);
        }
    }
    task.completed_at = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    const double sample = static_cast<double>(completion.elapsed.count());
    average_task_ms_ = average_task_ms_
        ? kDurationSmoothing * sample + (1.0 - kDurationSmoothing) * *average_task_ms_
        : sample;

    TaskManagerEvent completed;
    completed.kind = TaskEventKind::TaskCompleted;
    completed.task_id = task.id;
    completed.file_id = task.file.id;
    completed.task_status = task.status;
    completed.message = task.error;

    TaskManagerEvent recategorized;
    if (moved) {
        recategorized.kind = TaskEventKind::FileRecategorized;
        recategorized.task_id = task.id;
        recategorized.file_id = task.file.id;
        recategorized.task_status = task.status;
        recategorized.old_path = task.current_path;
        recategorized.new_path = task.result->category_path;
    }

    finished_.push_back(std::move(task));
    const TaskManagerStatus snapshot = build_status_locked();
    completed.status = snapshot;
    events_.push(std::move(completed));
    if (moved) {
        recategorized.status = snapshot;
        events_.push(std::move(recategorized));
    }
    publish_status_locked();
}

bool DeepAnalysisTaskManager::apply_recategorization(DeepAnalysisTask& task, const DeepAnalysisResult& result)
{
    if (!taxonomy_) {
        return false;
    }
    const bool moved = taxonomy_->write([&](TaxonomyTree& tree) {
        if (!tree.locate_file(task.file.id)) {
            if (logger_) {
                logger_->warn("File '{}' is no longer in the taxonomy; skipping move", task.file.name);
            }
            return false;
        }
        if (!guardrails_.can_auto_reassign(tree, task.file.id, result.category_path)) {
            if (logger_) {
                logger_->info("Guardrails keep '{}' where it is", task.file.name);
            }
            return false;
        }
        const NodeId target = tree.reassign_file(task.file.id, result.category_path,
                                                 result.confidence, AssignmentSource::Content);
        if (target == kInvalidNodeId) {
            return false;
        }
        const TaxonomyNode* node = tree.node(target);
        if (node && !node->is_user_edited()) {
            tree.set_refinement_state(target, RefinementState::Refined);
        }
        return true;
    });

    if (moved) {
        if (logger_) {
            logger_->info("Recategorized '{}': {} -> {} ({:.2f} -> {:.2f})",
                          task.file.name, Utils::join(task.current_path, "/"),
                          Utils::join(result.category_path, "/"),
                          task.current_confidence, result.confidence);
        }
        task.recategorized = true;
    }
    return moved;
}

void DeepAnalysisTaskManager::sort_queue_locked()
{
    std::stable_sort(queue_.begin(), queue_.end(), [](const DeepAnalysisTask& a, const DeepAnalysisTask& b) {
        if (a.priority != b.priority) {
            return static_cast<int>(a.priority) > static_cast<int>(b.priority);
        }
        return a.current_confidence < b.current_confidence;
    });
}

std::vector<std::string> DeepAnalysisTaskManager::existing_categories_locked() const
{
    std::set<std::string> seen;
    std::vector<std::string> categories;
    auto record = [&](const DeepAnalysisTask& task) {
        if (task.current_path.empty()) {
            return;
        }
        std::string joined = Utils::join(task.current_path, " / ");
        if (seen.insert(joined).second) {
            categories.push_back(std::move(joined));
        }
    };
    for (const auto& task : queue_) {
        record(task);
    }
    for (const auto& [id, running] : running_) {
        record(running.task);
    }
    return categories;
}

bool DeepAnalysisTaskManager::is_known_file_locked(const std::string& file_id) const
{
    if (file_id.empty()) {
        return false;
    }
    for (const auto& task : queue_) {
        if (task.file.id == file_id) {
            return true;
        }
    }
    for (const auto& [id, running] : running_) {
        if (running.task.file.id == file_id) {
            return true;
        }
    }
    return false;
}

TaskManagerStatus DeepAnalysisTaskManager::build_status_locked() const
{
    TaskManagerStatus status;
    status.is_running = is_running_;
    status.is_paused = is_paused_;
    status.queued = queue_.size();
    status.running = running_.size();
    const std::size_t first = std::min(run_start_, finished_.size());
    const std::size_t finished_this_run = finished_.size() - first;
    for (auto it = finished_.begin() + static_cast<std::ptrdiff_t>(first); it != finished_.end(); ++it) {
        switch (it->status) {
            case TaskStatus::Completed: ++status.completed; break;
            case TaskStatus::Failed: ++status.failed; break;
            case TaskStatus::Cancelled: ++status.cancelled; break;
            default: break;
        }
    }
    status.total = status.queued + status.running + finished_this_run;
    for (const auto& [id, running] : running_) {
        status.current_tasks.push_back(running.task.file.name);
    }
    status.progress = status.total == 0
        ? 0.0
        : static_cast<double>(finished_this_run) / static_cast<double>(status.total);
    if (average_task_ms_ && status.queued > 0) {
        const double remaining = *average_task_ms_ * static_cast<double>(status.queued) /
                                 static_cast<double>(config_.max_concurrent_tasks);
        status.estimated_time_remaining = std::chrono::milliseconds(static_cast<long long>(remaining));
    }
    return status;
}

void DeepAnalysisTaskManager::publish_status_locked()
{
    last_status_ = build_status_locked();
    TaskManagerEvent event;
    event.kind = TaskEventKind::StatusChanged;
    event.status = last_status_;
    events_.push(std::move(event));
}
