/**
 * @file acoustic_meter.cpp
 * @brief AcousticMeter implementation
 */

#include "acoustic_meter.hpp"

#include "esp_log.h"
#include <cmath>

namespace pdi {

AcousticMeter::AcousticMeter(const AcousticConfig& config)
    : config_(config)
    , hp_alpha_(0.0f)
{
}

esp_err_t AcousticMeter::init() {
    if (config_.sample_rate_hz == 0 || config_.highpass_cutoff_hz <= 0.0f ||
        config_.highpass_cutoff_hz >= config_.sample_rate_hz / 2.0f) {
        ESP_LOGE(TAG, "Invalid weighting: fs=%u fc=%.1f",
                 static_cast<unsigned>(config_.sample_rate_hz), config_.highpass_cutoff_hz);
        return ESP_ERR_INVALID_ARG;
    }

    const float rc = 1.0f / (2.0f * static_cast<float>(M_PI) * config_.highpass_cutoff_hz);
    const float dt = 1.0f / static_cast<float>(config_.sample_rate_hz);
    hp_alpha_ = rc / (rc + dt);

    ESP_LOGI(TAG, "A-weighting: fs=%u Hz, HPF %.0f Hz (alpha=%.4f), gain %.3f, offset %.1f dB",
             static_cast<unsigned>(config_.sample_rate_hz), config_.highpass_cutoff_hz,
             hp_alpha_, config_.shaping_gain, config_.default_spl_offset_db);
    return ESP_OK;
}

esp_err_t AcousticMeter::initState(AcousticState& state) const {
    state.dba = 0.0f;
    state.offset_db = config_.default_spl_offset_db;
    state.uncertainty_db = 0.0f;
    state.has_reading = false;
    return state.db_history.init(config_.db_history);
}

float AcousticMeter::weightedRms(const int16_t* pcm, size_t count) const {
    if (!pcm || count == 0) {
        return 0.0f;
    }

    float prev_x = static_cast<float>(pcm[0]) / 32768.0f;
    float prev_y = 0.0f;
    double sum_sq = 0.0;

    for (size_t i = 0; i < count; i++) {
        float x = static_cast<float>(pcm[i]) / 32768.0f;
        float y = hp_alpha_ * (prev_y + x - prev_x);
        prev_x = x;
        prev_y = y;

        float shaped = y * config_.shaping_gain;
        sum_sq += static_cast<double>(shaped) * shaped;
    }

    return static_cast<float>(sqrt(sum_sq / static_cast<double>(count)));
}

float AcousticMeter::correctionDb(float shimmer) const {
    if (shimmer <= 0.0f) {
        return 0.0f;
    }
    float c = config_.shimmer_coupling_db * logf(1.0f + shimmer);
    return c < config_.max_correction_db ? c : config_.max_correction_db;
}

float AcousticMeter::levelDb(float weighted_rms, float spl_offset_db, float shimmer) const {
    if (weighted_rms <= 0.0f) {
        return 0.0f;
    }
    return 20.0f * log10f(weighted_rms + config_.log_epsilon) + spl_offset_db +
           correctionDb(shimmer);
}

float AcousticMeter::measure(const int16_t* pcm, size_t count, float spl_offset_db,
                             float shimmer, AcousticState& state) const {
    float rms = weightedRms(pcm, count);
    state.dba = levelDb(rms, spl_offset_db, shimmer);
    state.offset_db = spl_offset_db;
    state.has_reading = true;

    state.db_history.push(state.dba);
    state.uncertainty_db = static_cast<float>(state.db_history.stdDevSample());

    ESP_LOGD(TAG, "rms_w=%.6f dBA=%.1f +/- %.2f", rms, state.dba, state.uncertainty_db);
    return state.dba;
}

void AcousticMeter::applyOffsetChange(float new_offset_db, AcousticState& state) const {
    if (!state.has_reading) {
        return;
    }

    state.dba += new_offset_db - state.offset_db;
    state.offset_db = new_offset_db;
    state.db_history.clear();
    state.db_history.push(state.dba);
    state.uncertainty_db = 0.0f;
}

}  // namespace pdi
