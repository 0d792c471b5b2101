#include "../audio-normalizer.h"
#include "test-support.h"
#include <cstdlib>
#include <limits>

static void test_rejects_invalid_shapes() {
    NormalizedPcm empty = normalize_fragment(std::string());
    CHECK(empty.status == NormalizeStatus::EMPTY_INPUT);
    CHECK(empty.samples.empty());

    for (size_t len : {1u, 2u, 3u, 5u, 6u, 641u, 4803u}) {
        NormalizedPcm r = normalize_fragment(std::string(len, '\0'));
        CHECK(r.status == NormalizeStatus::MISALIGNED_INPUT);
        CHECK(r.samples.empty());
    }
}

static void test_too_short() {
    // 319 float samples -> 638 bytes of PCM16, under the 640 byte floor
    NormalizedPcm r = normalize_fragment(constant_fragment(319, 0.1f));
    CHECK(r.status == NormalizeStatus::TOO_SHORT);
    CHECK(r.samples.empty());
    CHECK_EQ(r.input_samples, 319u);

    NormalizedPcm ok = normalize_fragment(constant_fragment(320, 0.1f));
    CHECK(ok.ok());
    CHECK_EQ(ok.samples.size(), 320u);
    CHECK_EQ(ok.byte_size(), 640u);
}

static void test_quantization_and_clamping() {
    // Neighbouring values stay within the declick threshold
    std::vector<float> in = {0.5f, 1.5f, 0.9f, 0.3f, 0.00002f, -0.3f, -0.9f, -5.0f, -0.5f};
    in.resize(400, 0.0f);
    NormalizedPcm r = normalize_fragment(make_fragment(in));
    CHECK(r.ok());
    CHECK_EQ(r.samples[0], 16383);    // 16383.5 truncated toward zero
    CHECK_EQ(r.samples[1], 32767);    // clamped
    CHECK_EQ(r.samples[2], 29490);
    CHECK_EQ(r.samples[3], 9830);
    CHECK_EQ(r.samples[4], 0);
    CHECK_EQ(r.samples[5], -9830);
    CHECK_EQ(r.samples[6], -29490);
    CHECK_EQ(r.samples[7], -32767);   // clamped
    CHECK_EQ(r.samples[8], -16383);
    CHECK_EQ(r.declicked_samples, 0u);
    CHECK_EQ(r.non_finite_replaced, 0u);
}

static void test_non_finite_values() {
    std::vector<float> in(400, 0.0f);
    in[10] = std::numeric_limits<float>::quiet_NaN();
    in[20] = std::numeric_limits<float>::infinity();
    in[30] = -std::numeric_limits<float>::infinity();
    NormalizedPcm r = normalize_fragment(make_fragment(in));
    CHECK(r.ok());
    CHECK_EQ(r.non_finite_replaced, 3u);
    CHECK_EQ(r.samples[10], 0);
    // +Inf -> 32767 and -Inf -> -32767 are jumps from 0 larger than the
    // declick threshold, so they are held at the previous value
    CHECK_EQ(r.samples[20], 0);
    CHECK_EQ(r.samples[30], 0);
    CHECK_EQ(r.declicked_samples, 2u);

    // A sustained full-scale signal survives once it is reached gradually
    std::vector<float> ramp;
    for (int i = 0; i <= 10; ++i) ramp.push_back(i / 10.0f);
    ramp.resize(400, std::numeric_limits<float>::infinity());
    NormalizedPcm full = normalize_fragment(make_fragment(ramp));
    CHECK(full.ok());
    CHECK_EQ(full.samples[10], 32767);
    CHECK_EQ(full.samples[399], 32767);
    CHECK_EQ(full.declicked_samples, 0u);
}

static void test_declick_uses_filtered_previous() {
    std::vector<float> in(400, 0.0f);
    in[100] = 0.9f;   // 29490: jump of 29490 from 0, replaced by 0
    in[101] = 0.9f;   // compared with the filtered 0, replaced again
    in[102] = 0.5f;   // 16383: within threshold of 0, kept
    NormalizedPcm r = normalize_fragment(make_fragment(in));
    CHECK(r.ok());
    CHECK_EQ(r.samples[100], 0);
    CHECK_EQ(r.samples[101], 0);
    CHECK_EQ(r.samples[102], 16383);
    CHECK_EQ(r.declicked_samples, 2u);

    for (size_t i = 1; i < r.samples.size(); ++i) {
        CHECK(std::abs(static_cast<int>(r.samples[i]) - static_cast<int>(r.samples[i - 1])) <= 20000);
    }
}

static void test_truncation() {
    NormalizedPcm r = normalize_fragment(constant_fragment(20000, 0.25f));
    CHECK(r.ok());
    CHECK(r.truncated);
    CHECK_EQ(r.samples.size(), 16000u);
    CHECK_EQ(r.byte_size(), 32000u);
    CHECK_EQ(r.input_samples, 20000u);
}

static void test_output_bounds() {
    for (size_t n : {320u, 321u, 1000u, 4800u, 16000u, 16001u, 48000u}) {
        NormalizedPcm r = normalize_fragment(make_fragment(sine_wave(n, 440.0, 24000, 0.5f)));
        CHECK(r.ok());
        CHECK(r.byte_size() % 2 == 0);
        CHECK(r.byte_size() >= 320);
        CHECK(r.byte_size() <= 32000);
        CHECK(!r.padded);
    }
}

static void test_24k_sine_fragment() {
    // 200 ms of 24 kHz audio sent unresampled
    NormalizedPcm r = normalize_fragment(make_fragment(sine_wave(4800, 440.0, 24000, 0.5f)));
    CHECK(r.ok());
    CHECK_EQ(r.samples.size(), 4800u);
    CHECK_EQ(r.declicked_samples, 0u);
    CHECK_EQ(r.non_finite_replaced, 0u);
}

static void test_raw_pointer_overload() {
    std::string bytes = constant_fragment(400, -0.25f);
    NormalizedPcm r = normalize_fragment(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
    CHECK(r.ok());
    CHECK_EQ(r.samples[0], static_cast<int16_t>(-8191));

    NormalizedPcm null_input = normalize_fragment(nullptr, 0);
    CHECK(null_input.status == NormalizeStatus::EMPTY_INPUT);
    CHECK(std::string(normalize_status_name(NormalizeStatus::MISALIGNED_INPUT)) == "MisalignedInput");
}

int main() {
    std::cout << "🧪 Audio normalizer tests" << std::endl;

    test_rejects_invalid_shapes();
    test_too_short();
    test_quantization_and_clamping();
    test_non_finite_values();
    test_declick_uses_filtered_previous();
    test_truncation();
    test_output_bounds();
    test_24k_sine_fragment();
    test_raw_pointer_overload();

    return finish_tests("audio_normalizer_test");
}
