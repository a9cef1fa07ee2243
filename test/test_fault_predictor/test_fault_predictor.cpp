/**
 * @file test_fault_predictor.cpp
 * @brief Unit tests for the TTF models and the engine state classifier
 */

#include "unity.h"
#include "engine/fault_predictor.hpp"

#include <cmath>
#include <cstring>

using namespace pdi;

static FaultInputs inputs(float amplitude, float hz, bool has_hz) {
    FaultInputs in{};
    in.amplitude = amplitude;
    in.dominant_hz = hz;
    in.has_frequency = has_hz;
    return in;
}

static SpectralSnapshot spectrum(float entropy, float energy) {
    SpectralSnapshot s{};
    s.valid = true;
    s.entropy = entropy;
    s.total_energy = energy;
    return s;
}

void setUp(void) {}

void tearDown(void) {}

// =============================================================================
// TieredDecayModel
// =============================================================================

void test_quiet_machine_is_healthy(void) {
    TieredDecayModel model;
    FaultPrediction p = model.predict(inputs(0.5f, 30.0f, true));

    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::HEALTHY), static_cast<int>(p.kind));
    TEST_ASSERT_FALSE(p.has_forecast);
    TEST_ASSERT_EQUAL_FLOAT(0.05f, p.confidence);
}

void test_high_amplitude_high_frequency_is_bearing_wear(void) {
    TieredDecayModel model;
    FaultPrediction p = model.predict(inputs(6.0f, 35.0f, true));

    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::BEARING_WEAR), static_cast<int>(p.kind));
    TEST_ASSERT_TRUE(p.has_forecast);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 24.0f * expf(-0.5f * 2.0f), p.ttf_hours);
    // Boost 0.10 capped at 0.09
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 0.99f, p.confidence);
    TEST_ASSERT_NOT_NULL(strstr(p.text, "Bearing"));
}

void test_high_amplitude_low_frequency_is_imbalance(void) {
    TieredDecayModel model;
    FaultPrediction p = model.predict(inputs(5.0f, 12.0f, true));

    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::IMBALANCE), static_cast<int>(p.kind));
    TEST_ASSERT_FLOAT_WITHIN(1e-2f, 168.0f * expf(-0.3f), p.ttf_hours);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 0.90f, p.confidence);
    TEST_ASSERT_NOT_NULL(strstr(p.text, "days"));
}

void test_high_amplitude_without_spectrum_is_imbalance(void) {
    TieredDecayModel model;
    FaultPrediction p = model.predict(inputs(5.0f, 35.0f, false));
    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::IMBALANCE), static_cast<int>(p.kind));
}

void test_moderate_amplitude_warns_about_mounts(void) {
    TieredDecayModel model;
    FaultPrediction p = model.predict(inputs(2.5f, 25.0f, true));

    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::WARNING_MOUNTS), static_cast<int>(p.kind));
    TEST_ASSERT_FLOAT_WITHIN(1e-2f, 720.0f * expf(-0.1f), p.ttf_hours);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 0.70f, p.confidence);
}

void test_warning_needs_mechanical_frequency(void) {
    TieredDecayModel model;

    // Band edges are inclusive
    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::WARNING_MOUNTS),
                      static_cast<int>(model.predict(inputs(2.5f, 10.0f, true)).kind));
    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::WARNING_MOUNTS),
                      static_cast<int>(model.predict(inputs(2.5f, 60.0f, true)).kind));

    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::HEALTHY),
                      static_cast<int>(model.predict(inputs(2.5f, 4.0f, true)).kind));
    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::HEALTHY),
                      static_cast<int>(model.predict(inputs(2.5f, 75.0f, true)).kind));
    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::HEALTHY),
                      static_cast<int>(model.predict(inputs(2.5f, 25.0f, false)).kind));
}

// =============================================================================
// GradientTrendModel
// =============================================================================

void test_trend_without_gradient_has_no_forecast(void) {
    GradientTrendModel model;
    FaultInputs in = inputs(1.0f, 0.0f, false);
    in.shimmer = 0.5f;
    in.long_gradient = 0.0f;

    FaultPrediction p = model.predict(in);
    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::NO_FORECAST), static_cast<int>(p.kind));
    TEST_ASSERT_FALSE(p.has_forecast);
}

void test_trend_extrapolates_log_shimmer(void) {
    GradientTrendModel model;
    FaultInputs in = inputs(1.0f, 0.0f, false);
    in.shimmer = 0.1f;
    in.long_gradient = 0.5f;

    FaultPrediction p = model.predict(in);
    TEST_ASSERT_EQUAL(static_cast<int>(FaultKind::TREND), static_cast<int>(p.kind));
    TEST_ASSERT_TRUE(p.has_forecast);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, logf(10.0f) / 0.5f, p.ttf_hours);
}

void test_trend_clamps_negative_ttf(void) {
    GradientTrendModel model;
    FaultInputs in = inputs(1.0f, 0.0f, false);
    in.shimmer = 3.0f;
    in.long_gradient = 0.5f;

    FaultPrediction p = model.predict(in);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, p.ttf_hours);
}

// =============================================================================
// State classifier
// =============================================================================

void test_state_guards_apply_in_order(void) {
    const FaultConfig& cfg = DEFAULT_FAULT_CONFIG;
    SpectralSnapshot tonal = spectrum(0.2f, 10.0f);
    SpectralSnapshot broad = spectrum(0.8f, 10.0f);

    TEST_ASSERT_EQUAL(static_cast<int>(EngineStateTag::CRITICAL),
                      static_cast<int>(classifyEngineState(3, 0.0f, tonal, cfg)));
    TEST_ASSERT_EQUAL(static_cast<int>(EngineStateTag::CRITICAL),
                      static_cast<int>(classifyEngineState(0, 5.0f, broad, cfg)));
    TEST_ASSERT_EQUAL(static_cast<int>(EngineStateTag::TONAL_DOMINANCE),
                      static_cast<int>(classifyEngineState(2, 0.0f, tonal, cfg)));
    TEST_ASSERT_EQUAL(static_cast<int>(EngineStateTag::DESCRIPTOR),
                      static_cast<int>(classifyEngineState(1, 0.0f, broad, cfg)));
    TEST_ASSERT_EQUAL(static_cast<int>(EngineStateTag::BASELINE),
                      static_cast<int>(classifyEngineState(0, 0.0f, broad, cfg)));
}

void test_silent_spectrum_is_not_tonal(void) {
    SpectralSnapshot silent = spectrum(0.0f, 0.0f);
    TEST_ASSERT_EQUAL(static_cast<int>(EngineStateTag::BASELINE),
                      static_cast<int>(classifyEngineState(0, 0.0f, silent, DEFAULT_FAULT_CONFIG)));

    SpectralSnapshot invalid{};
    TEST_ASSERT_EQUAL(static_cast<int>(EngineStateTag::BASELINE),
                      static_cast<int>(classifyEngineState(0, 0.0f, invalid, DEFAULT_FAULT_CONFIG)));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_quiet_machine_is_healthy);
    RUN_TEST(test_high_amplitude_high_frequency_is_bearing_wear);
    RUN_TEST(test_high_amplitude_low_frequency_is_imbalance);
    RUN_TEST(test_high_amplitude_without_spectrum_is_imbalance);
    RUN_TEST(test_moderate_amplitude_warns_about_mounts);
    RUN_TEST(test_warning_needs_mechanical_frequency);
    RUN_TEST(test_trend_without_gradient_has_no_forecast);
    RUN_TEST(test_trend_extrapolates_log_shimmer);
    RUN_TEST(test_trend_clamps_negative_ttf);
    RUN_TEST(test_state_guards_apply_in_order);
    RUN_TEST(test_silent_spectrum_is_not_tonal);
    return UNITY_END();
}
