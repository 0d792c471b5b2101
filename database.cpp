#include "database.h"
#include <iostream>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>

Database::Database() : db_(nullptr) {}

Database::~Database() {
    close();
}

bool Database::init(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::cerr << "Cannot open database: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Enable WAL mode for better performance
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 2000);

    return create_tables();
}

void Database::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::create_tables() {
    const char* sessions_sql = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            started_at TEXT NOT NULL,
            ended_at TEXT,
            transcription TEXT DEFAULT '',
            status TEXT DEFAULT 'active'
        );
        CREATE INDEX IF NOT EXISTS idx_session_id ON sessions(session_id);
    )";

    const char* system_config_sql = R"(
        CREATE TABLE IF NOT EXISTS system_config (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('service_status', 'stopped');
        INSERT OR IGNORE INTO system_config (key, value) VALUES ('model_path', 'models/ggml-base.en.bin');
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sessions_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error creating sessions table: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        return false;
    }

    rc = sqlite3_exec(db_, system_config_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error creating system_config table: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        return false;
    }

    return true;
}

std::string Database::get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

int64_t Database::create_session_record(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return -1;

    const char* sql = "INSERT INTO sessions (session_id, started_at) VALUES (?, ?)";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare statement: " << sqlite3_errmsg(db_) << std::endl;
        return -1;
    }

    std::string timestamp = get_current_timestamp();
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, timestamp.c_str(), -1, SQLITE_STATIC);

    int64_t record_id = -1;
    if (sqlite3_step(stmt) == SQLITE_DONE) {
        record_id = sqlite3_last_insert_rowid(db_);
    }
    sqlite3_finalize(stmt);
    return record_id;
}

bool Database::append_transcription(int64_t record_id, const std::string& text) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    const char* sql = R"(
        UPDATE sessions
        SET transcription = CASE WHEN transcription = '' THEN ? ELSE transcription || ' ' || ? END
        WHERE id = ? AND status = 'active'
    )";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare statement: " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }

    sqlite3_bind_text(stmt, 1, text.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, text.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, record_id);

    bool success = sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(db_) > 0;
    sqlite3_finalize(stmt);
    return success;
}

bool Database::end_session_record(int64_t record_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    const char* sql = "UPDATE sessions SET ended_at = ?, status = 'ended' WHERE id = ? AND status = 'active'";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare statement: " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }

    std::string timestamp = get_current_timestamp();
    sqlite3_bind_text(stmt, 1, timestamp.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, record_id);

    bool success = sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(db_) > 0;
    sqlite3_finalize(stmt);
    return success;
}

static SessionRecord read_session_row(sqlite3_stmt* stmt) {
    SessionRecord record;
    record.id = sqlite3_column_int64(stmt, 0);

    const char* sid = (char*)sqlite3_column_text(stmt, 1);
    record.session_id = sid ? sid : "";

    const char* started = (char*)sqlite3_column_text(stmt, 2);
    record.started_at = started ? started : "";

    const char* ended = (char*)sqlite3_column_text(stmt, 3);
    record.ended_at = ended ? ended : "";

    const char* text = (char*)sqlite3_column_text(stmt, 4);
    record.transcription = text ? text : "";

    const char* status = (char*)sqlite3_column_text(stmt, 5);
    record.status = status ? status : "";
    return record;
}

SessionRecord Database::get_session_record(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    SessionRecord record;
    if (!db_) return record;

    const char* sql = R"(
        SELECT id, session_id, started_at, ended_at, transcription, status
        FROM sessions WHERE session_id = ? ORDER BY id DESC LIMIT 1
    )";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            record = read_session_row(stmt);
        }
    }
    sqlite3_finalize(stmt);
    return record;
}

SessionRecord Database::get_session_record_by_id(int64_t record_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    SessionRecord record;
    if (!db_) return record;

    const char* sql = R"(
        SELECT id, session_id, started_at, ended_at, transcription, status
        FROM sessions WHERE id = ?
    )";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(stmt, 1, record_id);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            record = read_session_row(stmt);
        }
    }
    sqlite3_finalize(stmt);
    return record;
}

int Database::count_session_records(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return 0;

    const char* sql = "SELECT COUNT(*) FROM sessions WHERE session_id = ?";
    sqlite3_stmt* stmt = nullptr;
    int count = 0;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int(stmt, 0);
        }
    }
    sqlite3_finalize(stmt);
    return count;
}

std::string Database::get_config(const std::string& key, const std::string& default_value) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::string value = default_value;
    if (!db_) return value;

    const char* sql = "SELECT value FROM system_config WHERE key = ?";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* v = (char*)sqlite3_column_text(stmt, 0);
            if (v) {
                value = v;
            }
        }
    }
    sqlite3_finalize(stmt);
    return value;
}

bool Database::set_config(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    const char* sql = "INSERT OR REPLACE INTO system_config (key, value, updated_at) VALUES (?, ?, CURRENT_TIMESTAMP)";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare statement: " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_STATIC);
    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    return success;
}

std::string Database::get_service_status() {
    return get_config("service_status", "stopped");
}

bool Database::set_service_status(const std::string& status) {
    return set_config("service_status", status);
}
