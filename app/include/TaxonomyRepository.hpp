#ifndef TAXONOMY_REPOSITORY_HPP
#define TAXONOMY_REPOSITORY_HPP

#include "DeepAnalysisTaskManager.hpp"
#include "MergeSplitGatekeeper.hpp"
#include "TaxonomyTree.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

struct TaskLedgerEntry {
    std::string task_id;
    std::string file_id;
    std::string filename;
    TaskStatus status{TaskStatus::Queued};
    TaskPriority priority{TaskPriority::Normal};
    int attempts{0};
    double old_confidence{0.0};
    std::optional<double> new_confidence;
    std::string old_path;
    std::string new_path;
    bool recategorized{false};
    std::string error;
    std::string recorded_at;
};

struct AuditEntry {
    std::int64_t id{0};
    std::string action;
    std::string subject;
    std::string detail;
    std::string recorded_at;
};

// SQLite store for tree snapshots, the deep analysis ledger, suggestion state and the audit log.
// Failures are logged and reported through the return value.
class TaxonomyRepository {
public:
    explicit TaxonomyRepository(std::string config_dir);
    ~TaxonomyRepository();

    TaxonomyRepository(const TaxonomyRepository&) = delete;
    TaxonomyRepository& operator=(const TaxonomyRepository&) = delete;

    bool is_open() const { return db != nullptr; }
    const std::string& database_path() const { return db_file; }

    std::optional<std::int64_t> save_snapshot(const TaxonomyTree& tree);
    std::optional<TaxonomyTree> load_latest_snapshot(const std::string& folder = std::string());

    bool record_task(const DeepAnalysisTask& task);
    std::vector<TaskLedgerEntry> load_task_ledger();

    bool save_suggestions(const std::vector<MergeSuggestion>& merges,
                          const std::vector<SplitSuggestion>& splits);
    std::map<std::string, SuggestionStatus> load_suggestion_statuses();

    bool record_audit(const std::string& action, const std::string& subject, const std::string& detail);
    std::vector<AuditEntry> load_audit_log(std::size_t limit = 100);

private:
    void initialize_schema();
    bool execute(const char* sql, const char* description);

    sqlite3* db;
    std::string config_dir;
    std::string db_file;
};

#endif
