#include "../database.h"
#include "test-support.h"
#include <cstdio>
#include <unistd.h>

static std::string temp_db_path() {
    return "/tmp/speech_stream_test_" + std::to_string(getpid()) + ".db";
}

static void remove_db(const std::string& path) {
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

static void test_config_and_status(Database& db) {
    CHECK_EQ(db.get_service_status(), std::string("stopped"));
    CHECK(db.set_service_status("running"));
    CHECK_EQ(db.get_service_status(), std::string("running"));

    CHECK_EQ(db.get_config("model_path"), std::string("models/ggml-base.en.bin"));
    CHECK(db.set_config("model_path", "models/ggml-small.bin"));
    CHECK_EQ(db.get_config("model_path"), std::string("models/ggml-small.bin"));
    CHECK_EQ(db.get_config("missing", "fallback"), std::string("fallback"));
}

static void test_transcript_log(Database& db) {
    int64_t first = db.create_session_record("caller-1");
    CHECK(first > 0);
    SessionRecord record = db.get_session_record("caller-1");
    CHECK_EQ(record.id, first);
    CHECK_EQ(record.status, std::string("active"));
    CHECK(record.transcription.empty());
    CHECK(!record.started_at.empty());
    CHECK(record.ended_at.empty());

    CHECK(db.append_transcription(first, "hello"));
    CHECK(db.append_transcription(first, "world"));
    CHECK_EQ(db.get_session_record("caller-1").transcription, std::string("hello world"));

    CHECK(db.end_session_record(first));
    record = db.get_session_record("caller-1");
    CHECK_EQ(record.status, std::string("ended"));
    CHECK(!record.ended_at.empty());

    // Nothing active to append to any more
    CHECK(!db.append_transcription(first, "late"));
    CHECK(!db.end_session_record(first));
    CHECK_EQ(db.get_session_record("caller-1").transcription, std::string("hello world"));

    // A reused id gets a new record
    int64_t second = db.create_session_record("caller-1");
    CHECK(second > first);
    CHECK_EQ(db.count_session_records("caller-1"), 2);
    record = db.get_session_record("caller-1");
    CHECK_EQ(record.id, second);
    CHECK_EQ(record.status, std::string("active"));
    CHECK(record.transcription.empty());
    CHECK(db.append_transcription(second, "again"));
    CHECK_EQ(db.get_session_record("caller-1").transcription, std::string("again"));

    CHECK_EQ(db.count_session_records("nobody"), 0);
    CHECK_EQ(db.get_session_record("nobody").id, -1);
    CHECK_EQ(db.get_session_record_by_id(9999).id, -1);
    CHECK(!db.append_transcription(9999, "nowhere"));
}

// Two live records under one session id: each write lands on its own row
static void test_overlapping_records(Database& db) {
    int64_t older = db.create_session_record("caller-2");
    CHECK(db.append_transcription(older, "first call"));
    int64_t newer = db.create_session_record("caller-2");
    CHECK(newer > older);

    CHECK(db.append_transcription(older, "tail"));
    CHECK(db.end_session_record(older));

    SessionRecord old_record = db.get_session_record_by_id(older);
    CHECK_EQ(old_record.status, std::string("ended"));
    CHECK_EQ(old_record.transcription, std::string("first call tail"));

    SessionRecord new_record = db.get_session_record_by_id(newer);
    CHECK_EQ(new_record.session_id, std::string("caller-2"));
    CHECK_EQ(new_record.status, std::string("active"));
    CHECK(new_record.transcription.empty());
    CHECK(new_record.ended_at.empty());
}

static void test_persistence(const std::string& path) {
    Database db;
    CHECK(db.init(path));
    CHECK_EQ(db.get_service_status(), std::string("running"));
    CHECK_EQ(db.count_session_records("caller-1"), 2);
}

static void test_closed_database() {
    Database db;
    CHECK(!db.is_open());
    CHECK_EQ(db.create_session_record("x"), -1);
    CHECK(!db.append_transcription(1, "text"));
    CHECK(!db.end_session_record(1));
    CHECK(!db.set_config("k", "v"));
    CHECK_EQ(db.get_config("k", "d"), std::string("d"));
}

int main() {
    std::cout << "🧪 Database tests" << std::endl;

    const std::string path = temp_db_path();
    remove_db(path);

    {
        Database db;
        CHECK(db.init(path));
        CHECK(db.is_open());
        test_config_and_status(db);
        test_transcript_log(db);
        test_overlapping_records(db);
        db.close();
        CHECK(!db.is_open());
    }
    test_persistence(path);
    test_closed_database();

    remove_db(path);
    return finish_tests("database_test");
}
