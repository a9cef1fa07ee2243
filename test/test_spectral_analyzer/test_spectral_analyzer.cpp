/**
 * @file test_spectral_analyzer.cpp
 * @brief Unit tests for the FFT wrapper and SpectralAnalyzer
 *
 * Validates:
 * - Forward/inverse transform recovers the input
 * - Dominant frequency of a sine lands on its bin
 * - Entropy bounds for tonal and flat spectra
 * - Band labelling edges
 */

#include "unity.h"
#include "dsp/fft_engine.hpp"
#include "dsp/spectral_analyzer.hpp"

#include <cmath>
#include <cstring>

using namespace pdi;

static const float PI_F = 3.14159265358979f;

void setUp(void) {}

void tearDown(void) {}

// =============================================================================
// FFT wrapper
// =============================================================================

void test_fft_rejects_non_power_of_two(void) {
    float data[12 * 2] = {};
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, fftInit(12));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, fftForward(data, 12));
}

void test_fft_inverse_recovers_input(void) {
    const size_t n = 64;
    TEST_ASSERT_EQUAL(ESP_OK, fftInit(n));

    float reference[n * 2];
    float data[n * 2];
    for (size_t i = 0; i < n; i++) {
        reference[i * 2] = sinf(0.3f * i) + 0.25f * cosf(1.7f * i);
        reference[i * 2 + 1] = 0.0f;
    }
    memcpy(data, reference, sizeof(data));

    TEST_ASSERT_EQUAL(ESP_OK, fftForward(data, n));
    TEST_ASSERT_EQUAL(ESP_OK, fftInverse(data, n));

    for (size_t i = 0; i < n * 2; i++) {
        TEST_ASSERT_FLOAT_WITHIN(1e-4f, reference[i], data[i]);
    }
}

void test_fft_dc_lands_in_bin_zero(void) {
    const size_t n = 32;
    TEST_ASSERT_EQUAL(ESP_OK, fftInit(n));

    float data[n * 2];
    for (size_t i = 0; i < n; i++) {
        data[i * 2] = 1.0f;
        data[i * 2 + 1] = 0.0f;
    }
    TEST_ASSERT_EQUAL(ESP_OK, fftForward(data, n));

    TEST_ASSERT_FLOAT_WITHIN(1e-3f, static_cast<float>(n), data[0]);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.0f, data[2]);
}

// =============================================================================
// SpectralAnalyzer
// =============================================================================

void test_sine_dominant_frequency_within_one_bin(void) {
    const size_t n = 512;
    const float fs = 50.0f;
    SpectralAnalyzer analyzer(n);
    TEST_ASSERT_EQUAL(ESP_OK, analyzer.init());

    // Bin 200 -> 19.53 Hz, inside the motor band
    const float bin_hz = fs / n;
    const float freq = 200.0f * bin_hz;
    static float samples[n];
    for (size_t i = 0; i < n; i++) {
        samples[i] = 1.0f + 0.5f * sinf(2.0f * PI_F * freq * i / fs);
    }

    SpectralSnapshot snap;
    TEST_ASSERT_EQUAL(ESP_OK, analyzer.analyze(samples, n, fs, snap));

    TEST_ASSERT_TRUE(snap.valid);
    TEST_ASSERT_FLOAT_WITHIN(bin_hz, freq, snap.dominant_hz);
    TEST_ASSERT_EQUAL(static_cast<int>(FrequencyBand::MOTOR_FAN), static_cast<int>(snap.band));
    TEST_ASSERT_FLOAT_WITHIN(bin_hz * 60.0f, freq * 60.0f, snap.rpm);
    TEST_ASSERT_TRUE(snap.entropy < 0.35f);
}

void test_short_block_is_rejected(void) {
    SpectralAnalyzer analyzer(256);
    TEST_ASSERT_EQUAL(ESP_OK, analyzer.init());

    float samples[100] = {};
    SpectralSnapshot snap;
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_SIZE, analyzer.analyze(samples, 100, 50.0f, snap));
}

void test_pcm_tone_detected_at_audio_rate(void) {
    const size_t n = 1024;
    const float fs = 16000.0f;
    SpectralAnalyzer analyzer(n);
    TEST_ASSERT_EQUAL(ESP_OK, analyzer.init());

    static int16_t pcm[n];
    const float freq = 1000.0f;
    for (size_t i = 0; i < n; i++) {
        pcm[i] = static_cast<int16_t>(8000.0f * sinf(2.0f * PI_F * freq * i / fs));
    }

    SpectralSnapshot snap;
    TEST_ASSERT_EQUAL(ESP_OK, analyzer.analyzePcm(pcm, n, fs, snap));
    TEST_ASSERT_FLOAT_WITHIN(fs / n, freq, snap.dominant_hz);
}

void test_mains_hum_resolved_between_bins(void) {
    const size_t n = 1024;
    const float fs = 16000.0f;
    SpectralAnalyzer analyzer(n);
    TEST_ASSERT_EQUAL(ESP_OK, analyzer.init());

    // 50 Hz and 60 Hz both fall between the 15.6 Hz wide bins
    static int16_t pcm[n];
    const float tones[] = {50.0f, 60.0f};
    const FrequencyBand bands[] = {FrequencyBand::MAINS_50HZ, FrequencyBand::MAINS_60HZ};

    for (size_t t = 0; t < 2; t++) {
        for (size_t i = 0; i < n; i++) {
            pcm[i] = static_cast<int16_t>(8000.0f * sinf(2.0f * PI_F * tones[t] * i / fs));
        }

        SpectralSnapshot snap;
        TEST_ASSERT_EQUAL(ESP_OK, analyzer.analyzePcm(pcm, n, fs, snap));
        TEST_ASSERT_FLOAT_WITHIN(0.6f, tones[t], snap.dominant_hz);
        TEST_ASSERT_EQUAL(static_cast<int>(bands[t]), static_cast<int>(snap.band));
        TEST_ASSERT_EQUAL_FLOAT(0.0f, snap.rpm);
    }
}

void test_refine_peak_bin(void) {
    float symmetric[8] = {0.0f, 1.0f, 2.0f, 4.0f, 2.0f, 1.0f, 0.0f, 0.0f};
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 3.0f, SpectralAnalyzer::refinePeakBin(symmetric, 8, 3));

    // Heavier right neighbour pulls the estimate right, never past half a bin
    float skewed[8] = {0.0f, 1.0f, 2.0f, 4.0f, 3.5f, 1.0f, 0.0f, 0.0f};
    float refined = SpectralAnalyzer::refinePeakBin(skewed, 8, 3);
    TEST_ASSERT_TRUE(refined > 3.0f);
    TEST_ASSERT_TRUE(refined <= 3.5f);

    // Zero neighbour or edge bin: no refinement
    TEST_ASSERT_EQUAL_FLOAT(1.0f, SpectralAnalyzer::refinePeakBin(symmetric, 8, 1));
    TEST_ASSERT_EQUAL_FLOAT(7.0f, SpectralAnalyzer::refinePeakBin(symmetric, 8, 7));
}

void test_entropy_impulse_is_zero(void) {
    float mags[256] = {};
    mags[40] = 5.0f;
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, SpectralAnalyzer::spectralEntropy(mags, 256, 512));
}

void test_entropy_flat_spectrum_is_near_one(void) {
    float mags[256];
    for (size_t i = 0; i < 256; i++) {
        mags[i] = 1.0f;
    }
    float h = SpectralAnalyzer::spectralEntropy(mags, 256, 512);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 1.0f, h);
    TEST_ASSERT_TRUE(h <= 1.0f);
}

void test_entropy_of_silence_is_zero(void) {
    float mags[256] = {};
    TEST_ASSERT_EQUAL_FLOAT(0.0f, SpectralAnalyzer::spectralEntropy(mags, 256, 512));
}

void test_band_labels(void) {
    const SpectralConfig& cfg = DEFAULT_SPECTRAL_CONFIG;
    TEST_ASSERT_EQUAL(static_cast<int>(FrequencyBand::MAINS_50HZ),
                      static_cast<int>(SpectralAnalyzer::labelFrequency(50.0f, cfg)));
    TEST_ASSERT_EQUAL(static_cast<int>(FrequencyBand::MAINS_60HZ),
                      static_cast<int>(SpectralAnalyzer::labelFrequency(60.0f, cfg)));
    TEST_ASSERT_EQUAL(static_cast<int>(FrequencyBand::MOTOR_FAN),
                      static_cast<int>(SpectralAnalyzer::labelFrequency(25.0f, cfg)));
    TEST_ASSERT_EQUAL(static_cast<int>(FrequencyBand::LOW_FREQUENCY),
                      static_cast<int>(SpectralAnalyzer::labelFrequency(2.0f, cfg)));
    TEST_ASSERT_EQUAL(static_cast<int>(FrequencyBand::UNLABELED),
                      static_cast<int>(SpectralAnalyzer::labelFrequency(0.0f, cfg)));
    TEST_ASSERT_EQUAL(static_cast<int>(FrequencyBand::UNLABELED),
                      static_cast<int>(SpectralAnalyzer::labelFrequency(8.0f, cfg)));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_fft_rejects_non_power_of_two);
    RUN_TEST(test_fft_inverse_recovers_input);
    RUN_TEST(test_fft_dc_lands_in_bin_zero);
    RUN_TEST(test_sine_dominant_frequency_within_one_bin);
    RUN_TEST(test_short_block_is_rejected);
    RUN_TEST(test_pcm_tone_detected_at_audio_rate);
    RUN_TEST(test_mains_hum_resolved_between_bins);
    RUN_TEST(test_refine_peak_bin);
    RUN_TEST(test_entropy_impulse_is_zero);
    RUN_TEST(test_entropy_flat_spectrum_is_near_one);
    RUN_TEST(test_entropy_of_silence_is_zero);
    RUN_TEST(test_band_labels);
    return UNITY_END();
}
