#include "TaxonomyRepository.hpp"
#include "Logger.hpp"
#include "TaxonomyErrors.hpp"
#include "Utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <utility>

#include <json/json.h>
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {

template <typename... Args>
void db_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("db_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

StatementPtr prepare_statement(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return StatementPtr{};
    }
    return StatementPtr(raw);
}

std::string column_text(sqlite3_stmt* stmt, int column) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? std::string(text) : std::string();
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string to_compact_json(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

std::string node_list(const std::vector<NodeId>& nodes) {
    std::vector<std::string> parts;
    parts.reserve(nodes.size());
    for (NodeId id : nodes) {
        parts.push_back(std::to_string(id));
    }
    return Utils::join(parts, ",");
}

} // namespace

TaxonomyRepository::TaxonomyRepository(std::string config_dir)
    : db(nullptr),
      config_dir(std::move(config_dir)),
      db_file(this->config_dir + "/" +
              (std::getenv("FILE_TAXONOMY_DB_FILE")
                   ? std::getenv("FILE_TAXONOMY_DB_FILE")
                   : "taxonomy.db")) {
    if (this->config_dir.empty()) {
        db_log(spdlog::level::err, "Error: Database directory is empty");
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(this->config_dir, ec);
    if (ec) {
        db_log(spdlog::level::warn, "Could not create '{}': {}", this->config_dir, ec.message());
    }

    if (sqlite3_open(db_file.c_str(), &db) != SQLITE_OK) {
        db_log(spdlog::level::err, "Can't open database: {}", sqlite3_errmsg(db));
        sqlite3_close(db);
        db = nullptr;
        return;
    }

    sqlite3_extended_result_codes(db, 1);
    initialize_schema();
}

TaxonomyRepository::~TaxonomyRepository() {
    if (db) {
        sqlite3_close(db);
        db = nullptr;
    }
}

bool TaxonomyRepository::execute(const char* sql, const char* description) {
    char* error_msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
        db_log(spdlog::level::err, "Failed to {}: {}", description, error_msg ? error_msg : "");
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

void TaxonomyRepository::initialize_schema() {
    if (!db) return;

    execute(R"(
        CREATE TABLE IF NOT EXISTS taxonomy_snapshots (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            folder TEXT NOT NULL,
            root_name TEXT NOT NULL,
            tree_json TEXT NOT NULL,
            category_count INTEGER DEFAULT 0,
            file_count INTEGER DEFAULT 0,
            saved_at TEXT NOT NULL
        );
    )", "create taxonomy_snapshots table");
    execute("CREATE INDEX IF NOT EXISTS idx_snapshots_folder ON taxonomy_snapshots(folder, id);",
            "create snapshot index");

    execute(R"(
        CREATE TABLE IF NOT EXISTS analysis_ledger (
            task_id TEXT PRIMARY KEY,
            file_id TEXT NOT NULL,
            filename TEXT NOT NULL,
            status TEXT NOT NULL,
            priority TEXT NOT NULL,
            attempts INTEGER DEFAULT 0,
            old_confidence REAL,
            new_confidence REAL,
            old_path TEXT,
            new_path TEXT,
            recategorized INTEGER DEFAULT 0,
            error TEXT,
            recorded_at TEXT NOT NULL
        );
    )", "create analysis_ledger table");

    execute(R"(
        CREATE TABLE IF NOT EXISTS merge_suggestions (
            id TEXT PRIMARY KEY,
            source_nodes TEXT NOT NULL,
            source_names TEXT,
            target_node INTEGER,
            target_name TEXT,
            reason TEXT,
            confidence REAL,
            status TEXT NOT NULL,
            resolution TEXT,
            created_at TEXT NOT NULL
        );
    )", "create merge_suggestions table");

    execute(R"(
        CREATE TABLE IF NOT EXISTS split_suggestions (
            id TEXT PRIMARY KEY,
            source_node INTEGER NOT NULL,
            source_name TEXT,
            subcategories TEXT,
            reason TEXT,
            confidence REAL,
            status TEXT NOT NULL,
            resolution TEXT,
            created_at TEXT NOT NULL
        );
    )", "create split_suggestions table");

    execute(R"(
        CREATE TABLE IF NOT EXISTS audit_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            action TEXT NOT NULL,
            subject TEXT,
            detail TEXT,
            recorded_at TEXT NOT NULL
        );
    )", "create audit_log table");
}

std::optional<std::int64_t> TaxonomyRepository::save_snapshot(const TaxonomyTree& tree) {
    if (!db) return std::nullopt;

    const char* sql =
        "INSERT INTO taxonomy_snapshots (folder, root_name, tree_json, category_count, file_count, saved_at) "
        "VALUES (?, ?, ?, ?, ?, ?);";
    StatementPtr stmt = prepare_statement(db, sql);
    if (!stmt) {
        db_log(spdlog::level::err, "Failed to prepare snapshot insert: {}", sqlite3_errmsg(db));
        return std::nullopt;
    }

    bind_text(stmt.get(), 1, tree.source_folder_name());
    bind_text(stmt.get(), 2, tree.root().name);
    bind_text(stmt.get(), 3, to_compact_json(tree.to_json()));
    sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(tree.category_count()));
    sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(tree.total_file_count()));
    bind_text(stmt.get(), 6, Utils::format_timestamp(Clock::now()));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        db_log(spdlog::level::err, "Failed to save taxonomy snapshot: {}", sqlite3_errmsg(db));
        return std::nullopt;
    }
    const auto id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
    db_log(spdlog::level::info, "Saved taxonomy snapshot {} ({} categories, {} files)",
           id, tree.category_count(), tree.total_file_count());
    return id;
}

std::optional<TaxonomyTree> TaxonomyRepository::load_latest_snapshot(const std::string& folder) {
    if (!db) return std::nullopt;

    const char* sql = folder.empty()
        ? "SELECT tree_json FROM taxonomy_snapshots ORDER BY id DESC LIMIT 1;"
        : "SELECT tree_json FROM taxonomy_snapshots WHERE folder = ? ORDER BY id DESC LIMIT 1;";
    StatementPtr stmt = prepare_statement(db, sql);
    if (!stmt) {
        db_log(spdlog::level::err, "Failed to prepare snapshot query: {}", sqlite3_errmsg(db));
        return std::nullopt;
    }
    if (!folder.empty()) {
        bind_text(stmt.get(), 1, folder);
    }
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    const std::string text = column_text(stmt.get(), 0);
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value document;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &document, &errors)) {
        db_log(spdlog::level::err, "Stored snapshot is not valid JSON: {}", errors);
        return std::nullopt;
    }
    try {
        return TaxonomyTree::from_json(document);
    } catch (const TaxonomyError& ex) {
        db_log(spdlog::level::err, "Stored snapshot could not be restored: {}", ex.what());
        return std::nullopt;
    }
}

bool TaxonomyRepository::record_task(const DeepAnalysisTask& task) {
    if (!db) return false;

    const char* sql = R"(
        INSERT INTO analysis_ledger
            (task_id, file_id, filename, status, priority, attempts, old_confidence,
             new_confidence, old_path, new_path, recategorized, error, recorded_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(task_id) DO UPDATE SET
            status = excluded.status,
            attempts = excluded.attempts,
            new_confidence = excluded.new_confidence,
            new_path = excluded.new_path,
            recategorized = excluded.recategorized,
            error = excluded.error,
            recorded_at = excluded.recorded_at;
    )";
    StatementPtr stmt = prepare_statement(db, sql);
    if (!stmt) {
        db_log(spdlog::level::err, "Failed to prepare ledger upsert: {}", sqlite3_errmsg(db));
        return false;
    }

    bind_text(stmt.get(), 1, task.id);
    bind_text(stmt.get(), 2, task.file.id);
    bind_text(stmt.get(), 3, task.file.name);
    bind_text(stmt.get(), 4, to_string(task.status));
    bind_text(stmt.get(), 5, to_string(task.priority));
    sqlite3_bind_int(stmt.get(), 6, task.attempts);
    sqlite3_bind_double(stmt.get(), 7, task.current_confidence);
    if (task.result) {
        sqlite3_bind_double(stmt.get(), 8, task.result->confidence);
        bind_text(stmt.get(), 10, Utils::join(task.result->category_path, "/"));
    } else {
        sqlite3_bind_null(stmt.get(), 8);
        sqlite3_bind_null(stmt.get(), 10);
    }
    bind_text(stmt.get(), 9, Utils::join(task.current_path, "/"));
    sqlite3_bind_int(stmt.get(), 11, task.recategorized ? 1 : 0);
    bind_text(stmt.get(), 12, task.error);
    bind_text(stmt.get(), 13, Utils::format_timestamp(Clock::now()));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        db_log(spdlog::level::err, "Failed to record task {}: {}", task.id, sqlite3_errmsg(db));
        return false;
    }
    return true;
}

std::vector<TaskLedgerEntry> TaxonomyRepository::load_task_ledger() {
    std::vector<TaskLedgerEntry> entries;
    if (!db) return entries;

    const char* sql =
        "SELECT task_id, file_id, filename, status, priority, attempts, old_confidence, new_confidence, "
        "old_path, new_path, recategorized, error, recorded_at FROM analysis_ledger ORDER BY recorded_at, task_id;";
    StatementPtr stmt = prepare_statement(db, sql);
    if (!stmt) {
        db_log(spdlog::level::err, "Failed to prepare ledger query: {}", sqlite3_errmsg(db));
        return entries;
    }

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        TaskLedgerEntry entry;
        entry.task_id = column_text(stmt.get(), 0);
        entry.file_id = column_text(stmt.get(), 1);
        entry.filename = column_text(stmt.get(), 2);
        entry.status = task_status_from_string(column_text(stmt.get(), 3));
        entry.priority = task_priority_from_string(column_text(stmt.get(), 4));
        entry.attempts = sqlite3_column_int(stmt.get(), 5);
        entry.old_confidence = sqlite3_column_double(stmt.get(), 6);
        if (sqlite3_column_type(stmt.get(), 7) != SQLITE_NULL) {
            entry.new_confidence = sqlite3_column_double(stmt.get(), 7);
        }
        entry.old_path = column_text(stmt.get(), 8);
        entry.new_path = column_text(stmt.get(), 9);
        entry.recategorized = sqlite3_column_int(stmt.get(), 10) != 0;
        entry.error = column_text(stmt.get(), 11);
        entry.recorded_at = column_text(stmt.get(), 12);
        entries.push_back(std::move(entry));
    }
    return entries;
}

bool TaxonomyRepository::save_suggestions(const std::vector<MergeSuggestion>& merges,
                                          const std::vector<SplitSuggestion>& splits) {
    if (!db) return false;
    if (!execute("BEGIN TRANSACTION;", "begin suggestion transaction")) {
        return false;
    }

    bool ok = true;
    StatementPtr merge_stmt = prepare_statement(db, R"(
        INSERT OR REPLACE INTO merge_suggestions
            (id, source_nodes, source_names, target_node, target_name, reason, confidence, status, resolution, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    StatementPtr split_stmt = prepare_statement(db, R"(
        INSERT OR REPLACE INTO split_suggestions
            (id, source_node, source_name, subcategories, reason, confidence, status, resolution, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    if (!merge_stmt || !split_stmt) {
        db_log(spdlog::level::err, "Failed to prepare suggestion insert: {}", sqlite3_errmsg(db));
        ok = false;
    }

    for (const auto& merge : merges) {
        if (!ok) break;
        sqlite3_reset(merge_stmt.get());
        sqlite3_clear_bindings(merge_stmt.get());
        bind_text(merge_stmt.get(), 1, merge.id);
        bind_text(merge_stmt.get(), 2, node_list(merge.source_nodes));
        bind_text(merge_stmt.get(), 3, Utils::join(merge.source_names, " + "));
        sqlite3_bind_int64(merge_stmt.get(), 4, static_cast<sqlite3_int64>(merge.target_node));
        bind_text(merge_stmt.get(), 5, merge.target_name);
        bind_text(merge_stmt.get(), 6, merge.reason);
        sqlite3_bind_double(merge_stmt.get(), 7, merge.confidence);
        bind_text(merge_stmt.get(), 8, to_string(merge.status));
        bind_text(merge_stmt.get(), 9, merge.resolution);
        bind_text(merge_stmt.get(), 10, Utils::format_timestamp(merge.created_at));
        if (sqlite3_step(merge_stmt.get()) != SQLITE_DONE) {
            db_log(spdlog::level::err, "Failed to save merge suggestion {}: {}", merge.id, sqlite3_errmsg(db));
            ok = false;
        }
    }

    for (const auto& split : splits) {
        if (!ok) break;
        std::vector<std::string> names;
        for (const auto& proposed : split.proposed_subcategories) {
            names.push_back(proposed.name);
        }
        sqlite3_reset(split_stmt.get());
        sqlite3_clear_bindings(split_stmt.get());
        bind_text(split_stmt.get(), 1, split.id);
        sqlite3_bind_int64(split_stmt.get(), 2, static_cast<sqlite3_int64>(split.source_node));
        bind_text(split_stmt.get(), 3, split.source_name);
        bind_text(split_stmt.get(), 4, Utils::join(names, ", "));
        bind_text(split_stmt.get(), 5, split.reason);
        sqlite3_bind_double(split_stmt.get(), 6, split.confidence);
        bind_text(split_stmt.get(), 7, to_string(split.status));
        bind_text(split_stmt.get(), 8, split.resolution);
        bind_text(split_stmt.get(), 9, Utils::format_timestamp(split.created_at));
        if (sqlite3_step(split_stmt.get()) != SQLITE_DONE) {
            db_log(spdlog::level::err, "Failed to save split suggestion {}: {}", split.id, sqlite3_errmsg(db));
            ok = false;
        }
    }

    merge_stmt.reset();
    split_stmt.reset();
    if (!ok) {
        execute("ROLLBACK;", "roll back suggestion transaction");
        return false;
    }
    return execute("COMMIT;", "commit suggestion transaction");
}

std::map<std::string, SuggestionStatus> TaxonomyRepository::load_suggestion_statuses() {
    std::map<std::string, SuggestionStatus> statuses;
    if (!db) return statuses;

    const char* sql =
        "SELECT id, status FROM merge_suggestions UNION ALL SELECT id, status FROM split_suggestions;";
    StatementPtr stmt = prepare_statement(db, sql);
    if (!stmt) {
        db_log(spdlog::level::err, "Failed to prepare suggestion query: {}", sqlite3_errmsg(db));
        return statuses;
    }
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        statuses[column_text(stmt.get(), 0)] = suggestion_status_from_string(column_text(stmt.get(), 1));
    }
    return statuses;
}

bool TaxonomyRepository::record_audit(const std::string& action,
                                      const std::string& subject,
                                      const std::string& detail) {
    if (!db) return false;

    StatementPtr stmt = prepare_statement(
        db, "INSERT INTO audit_log (action, subject, detail, recorded_at) VALUES (?, ?, ?, ?);");
    if (!stmt) {
        db_log(spdlog::level::err, "Failed to prepare audit insert: {}", sqlite3_errmsg(db));
        return false;
    }
    bind_text(stmt.get(), 1, action);
    bind_text(stmt.get(), 2, subject);
    bind_text(stmt.get(), 3, detail);
    bind_text(stmt.get(), 4, Utils::format_timestamp(Clock::now()));
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        db_log(spdlog::level::err, "Failed to record audit entry: {}", sqlite3_errmsg(db));
        return false;
    }
    return true;
}

std::vector<AuditEntry> TaxonomyRepository::load_audit_log(std::size_t limit) {
    std::vector<AuditEntry> entries;
    if (!db) return entries;

    StatementPtr stmt = prepare_statement(
        db, "SELECT id, action, subject, detail, recorded_at FROM audit_log ORDER BY id DESC LIMIT ?;");
    if (!stmt) {
        db_log(spdlog::level::err, "Failed to prepare audit query: {}", sqlite3_errmsg(db));
        return entries;
    }
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(limit));
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        AuditEntry entry;
        entry.id = static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), 0));
        entry.action = column_text(stmt.get(), 1);
        entry.subject = column_text(stmt.get(), 2);
        entry.detail = column_text(stmt.get(), 3);
        entry.recorded_at = column_text(stmt.get(), 4);
        entries.push_back(std::move(entry));
    }
    return entries;
}
