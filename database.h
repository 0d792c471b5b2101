#pragma once

#include <string>
#include <memory>
#include <vector>
#include <cstdint>
#include <mutex>
#include <sqlite3.h>

// One streaming session as recorded in the transcript log
struct SessionRecord {
    int64_t id = -1;
    std::string session_id;
    std::string started_at;
    std::string ended_at;
    std::string transcription;  // accumulated final texts
    std::string status;         // 'active', 'ended'
};

class Database {
public:
    Database();
    ~Database();

    bool init(const std::string& db_path = "speech_stream.db");
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Transcript log. Session ids are reused, so a live session writes only
    // to the row id returned when its record was created (-1 on failure).
    int64_t create_session_record(const std::string& session_id);
    bool append_transcription(int64_t record_id, const std::string& text);
    bool end_session_record(int64_t record_id);
    SessionRecord get_session_record(const std::string& session_id);  // newest row for the id
    SessionRecord get_session_record_by_id(int64_t record_id);
    int count_session_records(const std::string& session_id);

    // System configuration (key/value)
    std::string get_config(const std::string& key, const std::string& default_value = "");
    bool set_config(const std::string& key, const std::string& value);

    // Service status: "starting", "running", "stopped", "error"
    std::string get_service_status();
    bool set_service_status(const std::string& status);

private:
    sqlite3* db_;
    mutable std::mutex db_mutex_;  // Thread safety for database operations
    bool create_tables();
    std::string get_current_timestamp();
};
