#include "run_history.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

RunHistory::RunHistory() = default;

RunHistory::~RunHistory() {
    close();
}

bool RunHistory::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "history: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Concurrent runs may append at the same time
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 2000);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO runs (input_path, model, load, confidence, text, error, processing_time) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, input_path, model, load, confidence, text, error, processing_time "
        "FROM runs ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "history: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "history: prepare recent failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void RunHistory::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool RunHistory::insert(const RunRecord& r) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };
    auto bind_optional = [this](int idx, const std::optional<double>& val) {
        if (val) sqlite3_bind_double(insert_stmt_, idx, *val);
        else sqlite3_bind_null(insert_stmt_, idx);
    };

    sqlite3_bind_text(insert_stmt_, 1, r.input_path.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(2, r.model);
    bind_optional(3, r.load);
    bind_optional(4, r.confidence);
    bind_nullable(5, r.text);
    bind_nullable(6, r.error);
    sqlite3_bind_double(insert_stmt_, 7, r.processing_time);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "history: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<RunRecord> RunHistory::recent(int limit) {
    std::vector<RunRecord> records;
    if (!recent_stmt_) return records;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };
    auto get_optional = [](sqlite3_stmt* stmt, int col) -> std::optional<double> {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
        return sqlite3_column_double(stmt, col);
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        RunRecord r;
        r.id = sqlite3_column_int64(recent_stmt_, 0);
        r.timestamp = get_text(recent_stmt_, 1);
        r.input_path = get_text(recent_stmt_, 2);
        r.model = get_text(recent_stmt_, 3);
        r.load = get_optional(recent_stmt_, 4);
        r.confidence = get_optional(recent_stmt_, 5);
        r.text = get_text(recent_stmt_, 6);
        r.error = get_text(recent_stmt_, 7);
        r.processing_time = sqlite3_column_double(recent_stmt_, 8);
        records.push_back(std::move(r));
    }

    return records;
}

bool RunHistory::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            input_path TEXT NOT NULL,
            model TEXT,
            load REAL,
            confidence REAL,
            text TEXT,
            error TEXT,
            processing_time REAL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "history: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
