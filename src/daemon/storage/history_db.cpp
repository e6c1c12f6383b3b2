#include "storage/history_db.hpp"

#include "log.hpp"

#include <filesystem>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        log_error("db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO transcriptions (text, enhanced_text, audio_duration, "
        "transcription_duration, enhancement_duration, model_name, prompt_name, audio_path) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, text, enhanced_text, audio_duration, transcription_duration, "
        "enhancement_duration, model_name, prompt_name, audio_path "
        "FROM transcriptions ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        log_error("db: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        log_error("db: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void HistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const TranscriptionResult& r) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);

    auto bind_text = [this](int idx, const std::optional<std::string>& val) {
        if (!val) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val->c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, r.text.c_str(), -1, SQLITE_TRANSIENT);
    bind_text(2, r.enhanced_text);
    sqlite3_bind_double(insert_stmt_, 3, r.duration);
    sqlite3_bind_double(insert_stmt_, 4, r.transcription_duration);
    if (r.enhancement_duration) sqlite3_bind_double(insert_stmt_, 5, *r.enhancement_duration);
    else sqlite3_bind_null(insert_stmt_, 5);
    sqlite3_bind_text(insert_stmt_, 6, r.model_name.c_str(), -1, SQLITE_TRANSIENT);
    bind_text(7, r.prompt_name);
    if (r.audio_path.empty()) sqlite3_bind_null(insert_stmt_, 8);
    else sqlite3_bind_text(insert_stmt_, 8, r.audio_path.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        log_error("db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };
    auto get_opt_text = [&](sqlite3_stmt* stmt, int col) -> std::optional<std::string> {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
        return get_text(stmt, col);
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.text = get_text(recent_stmt_, 2);
        e.enhanced_text = get_opt_text(recent_stmt_, 3);
        e.audio_duration = sqlite3_column_double(recent_stmt_, 4);
        e.transcription_duration = sqlite3_column_double(recent_stmt_, 5);
        if (sqlite3_column_type(recent_stmt_, 6) != SQLITE_NULL) {
            e.enhancement_duration = sqlite3_column_double(recent_stmt_, 6);
        }
        e.model_name = get_text(recent_stmt_, 7);
        e.prompt_name = get_opt_text(recent_stmt_, 8);
        e.audio_path = get_text(recent_stmt_, 9);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            text TEXT NOT NULL,
            enhanced_text TEXT,
            audio_duration REAL,
            transcription_duration REAL,
            enhancement_duration REAL,
            model_name TEXT,
            prompt_name TEXT,
            audio_path TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        log_error("db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
