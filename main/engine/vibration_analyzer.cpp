/**
 * @file vibration_analyzer.cpp
 * @brief VibrationAnalyzer implementation
 */

#include "vibration_analyzer.hpp"

#include "esp_log.h"
#include <cmath>

namespace pdi {

static const char* TAG = "Vibration";

VibrationAnalyzer::VibrationAnalyzer(const VibrationConfig& config)
    : config_(config)
{
}

esp_err_t VibrationAnalyzer::initState(VibrationState& state) const {
    esp_err_t ret = state.raw_window.init(config_.raw_window);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Raw window alloc failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = state.vibration_window.init(config_.vibration_window);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Vibration window alloc failed: %s", esp_err_to_name(ret));
        return ret;
    }

    state.peak = 0.0f;
    state.long_gradient = 0.0f;
    return ESP_OK;
}

ZoneGrade VibrationAnalyzer::classify(float velocity_rms_mm_s) const {
    if (velocity_rms_mm_s >= config_.zone_d_mm_s) return {IsoZone::D, 3};
    if (velocity_rms_mm_s >= config_.zone_c_mm_s) return {IsoZone::C, 2};
    if (velocity_rms_mm_s >= config_.zone_b_mm_s) return {IsoZone::B, 1};
    return {IsoZone::A, 0};
}

float VibrationAnalyzer::shortGradient(const RingBuffer& ring) {
    size_t half = ring.size() / 2;
    if (half == 0) {
        return 0.0f;
    }

    // Odd counts leave the middle sample out of both halves
    double oldest = ring.sum(0, half);
    double newest = ring.sum(ring.size() - half, half);
    return static_cast<float>((newest - oldest) / static_cast<double>(half));
}

VibrationMetrics VibrationAnalyzer::update(const Vec3& calibrated, const Vec3& linear,
                                           VibrationState& state) const {
    VibrationMetrics m{};

    m.vibration_mag = linear.norm();
    m.raw_mag = calibrated.norm();

    // Shimmer compares against history that excludes the current sample
    if (!state.raw_window.empty()) {
        float deviation = m.raw_mag - static_cast<float>(state.raw_window.mean());
        m.shimmer = deviation * deviation;
    }
    state.raw_window.push(m.raw_mag);

    m.gradient_short = shortGradient(state.raw_window);
    state.long_gradient = config_.long_gradient_keep * state.long_gradient +
                          (1.0f - config_.long_gradient_keep) * m.gradient_short;
    m.gradient_long = state.long_gradient;

    state.vibration_window.push(m.vibration_mag);
    double sum_sq = 0.0;
    for (size_t i = 0; i < state.vibration_window.size(); i++) {
        double v = state.vibration_window.at(i);
        sum_sq += v * v;
    }
    m.rms = static_cast<float>(sqrt(sum_sq / static_cast<double>(state.vibration_window.size())));

    if (m.vibration_mag > state.peak) {
        state.peak = m.vibration_mag;
    } else {
        state.peak *= config_.peak_decay;
    }
    m.peak = state.peak;

    m.velocity_rms = m.vibration_mag * config_.velocity_gain;
    m.grade = classify(m.velocity_rms);

    ESP_LOGV(TAG, "mag=%.4f rms=%.4f vel=%.2f zone=%s shimmer=%.5f",
             m.vibration_mag, m.rms, m.velocity_rms, toString(m.grade.zone), m.shimmer);

    return m;
}

}  // namespace pdi
