#include "../result-aggregator.h"
#include "test-support.h"
#include <limits>

static void test_missing_fields() {
    EngineResult raw;
    StreamResult partial = aggregate_result(raw, ResultKind::PARTIAL);
    CHECK(partial.kind == ResultKind::PARTIAL);
    CHECK(partial.text.empty());
    CHECK(!partial.has_confidence);

    StreamResult final_result = aggregate_result(raw, ResultKind::FINAL);
    CHECK(final_result.kind == ResultKind::FINAL);
    CHECK(final_result.text.empty());
    CHECK(!final_result.has_confidence);
}

static void test_trimming_and_confidence() {
    EngineResult raw;
    raw.text = std::string("  hello world \n");
    raw.confidence = 0.5f;

    StreamResult final_result = aggregate_result(raw, ResultKind::FINAL);
    CHECK_EQ(final_result.text, std::string("hello world"));
    CHECK(final_result.has_confidence);
    CHECK_EQ(final_result.confidence, 0.5f);

    // Partials never carry a confidence
    StreamResult partial = aggregate_result(raw, ResultKind::PARTIAL);
    CHECK_EQ(partial.text, std::string("hello world"));
    CHECK(!partial.has_confidence);

    raw.confidence = std::numeric_limits<float>::quiet_NaN();
    CHECK(!aggregate_result(raw, ResultKind::FINAL).has_confidence);
    raw.confidence = std::numeric_limits<float>::infinity();
    CHECK(!aggregate_result(raw, ResultKind::FINAL).has_confidence);

    raw.text = std::string(" \t\r\n");
    CHECK(aggregate_result(raw, ResultKind::PARTIAL).text.empty());
}

static void test_json_shapes() {
    CHECK_EQ(result_to_json(StreamResult::partial("he said")),
             std::string(R"({"text": "he said", "success": true, "type": "partial"})"));
    CHECK_EQ(result_to_json(StreamResult::final_text("")),
             std::string(R"({"text": "", "success": true, "type": "final"})"));
    CHECK_EQ(result_to_json(StreamResult::final_text("done", 0.25f)),
             std::string(R"({"text": "done", "confidence": 0.25, "success": true, "type": "final"})"));
    CHECK_EQ(result_to_json(StreamResult::failure(ErrorKind::EMPTY_INPUT, "Audio data is empty")),
             std::string(R"({"error": "Audio data is empty", "kind": "EmptyInput", "success": false})"));
}

static void test_json_escaping() {
    std::string json = result_to_json(StreamResult::final_text("say \"hi\"\\\n\t\x01"));
    CHECK(contains(json, R"(say \"hi\"\\\n\t\u0001)"));
    CHECK_EQ(json_escape("plain"), std::string("plain"));
    CHECK_EQ(json_escape("caf\xc3\xa9"), std::string("caf\xc3\xa9"));
}

static void test_http_status() {
    CHECK_EQ(result_http_status(StreamResult::partial("")), 200);
    CHECK_EQ(result_http_status(StreamResult::final_text("x")), 200);
    CHECK_EQ(result_http_status(StreamResult::failure(ErrorKind::EMPTY_INPUT, "")), 400);
    CHECK_EQ(result_http_status(StreamResult::failure(ErrorKind::MISALIGNED_INPUT, "")), 400);
    CHECK_EQ(result_http_status(StreamResult::failure(ErrorKind::INVALID_AUDIO_FORMAT, "")), 400);
    CHECK_EQ(result_http_status(StreamResult::failure(ErrorKind::MISSING_AUDIO, "")), 400);
    CHECK_EQ(result_http_status(StreamResult::failure(ErrorKind::ENGINE_UNAVAILABLE, "")), 500);
    CHECK_EQ(result_http_status(StreamResult::failure(ErrorKind::ENGINE_PROCESSING, "")), 500);

    CHECK_EQ(std::string(error_kind_name(ErrorKind::ENGINE_PROCESSING)), std::string("EngineProcessingError"));
    CHECK_EQ(std::string(error_kind_name(ErrorKind::MISALIGNED_INPUT)), std::string("MisalignedInput"));
}

int main() {
    std::cout << "🧪 Result aggregator tests" << std::endl;

    test_missing_fields();
    test_trimming_and_confidence();
    test_json_shapes();
    test_json_escaping();
    test_http_status();

    return finish_tests("result_aggregator_test");
}
