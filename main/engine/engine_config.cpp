/**
 * @file engine_config.cpp
 * @brief EngineConfig validation
 */

#include "engine_config.hpp"
#include "../dsp/fft_engine.hpp"

#include "esp_log.h"

namespace pdi {

static const char* TAG = "EngineConfig";

static bool checkFftSize(const char* name, size_t n) {
    if (!isPowerOfTwo(n) || n > FFT_MAX_SIZE) {
        ESP_LOGE(TAG, "%s=%u must be a power of two <= %u", name,
                 static_cast<unsigned>(n), static_cast<unsigned>(FFT_MAX_SIZE));
        return false;
    }
    return true;
}

esp_err_t validateConfig(const EngineConfig& config) {
    const float alpha = config.orientation.gravity_alpha;
    if (!(alpha > 0.0f && alpha < 1.0f)) {
        ESP_LOGE(TAG, "gravity_alpha=%.3f outside (0, 1)", alpha);
        return ESP_ERR_INVALID_ARG;
    }

    if (config.orientation.tilt_history == 0 || config.vibration.raw_window == 0 ||
        config.vibration.vibration_window == 0 || config.spectral.rate_history == 0 ||
        config.acoustic.db_history == 0 || config.photonic.lux_history == 0) {
        ESP_LOGE(TAG, "Ring capacities must be non-zero");
        return ESP_ERR_INVALID_ARG;
    }

    const VibrationConfig& vib = config.vibration;
    if (!(vib.zone_b_mm_s < vib.zone_c_mm_s && vib.zone_c_mm_s < vib.zone_d_mm_s)) {
        ESP_LOGE(TAG, "Zone thresholds not ascending: %.2f %.2f %.2f",
                 vib.zone_b_mm_s, vib.zone_c_mm_s, vib.zone_d_mm_s);
        return ESP_ERR_INVALID_ARG;
    }
    if (!(vib.long_gradient_keep > 0.0f && vib.long_gradient_keep < 1.0f) ||
        !(vib.peak_decay > 0.0f && vib.peak_decay < 1.0f)) {
        ESP_LOGE(TAG, "Decay weights must lie in (0, 1)");
        return ESP_ERR_INVALID_ARG;
    }

    const SpectralConfig& spectral = config.spectral;
    if (!checkFftSize("vibration_fft_size", spectral.vibration_fft_size) ||
        !checkFftSize("audio_fft_size", spectral.audio_fft_size)) {
        return ESP_ERR_INVALID_ARG;
    }
    if (vib.vibration_window < spectral.vibration_fft_size) {
        ESP_LOGE(TAG, "vibration_window=%u shorter than vibration_fft_size=%u",
                 static_cast<unsigned>(vib.vibration_window),
                 static_cast<unsigned>(spectral.vibration_fft_size));
        return ESP_ERR_INVALID_ARG;
    }
    if (spectral.duty_cycle_frames == 0 || spectral.nominal_vibration_rate_hz <= 0.0f) {
        ESP_LOGE(TAG, "Duty cycle and nominal rate must be positive");
        return ESP_ERR_INVALID_ARG;
    }

    if (config.acoustic.sample_rate_hz == 0) {
        ESP_LOGE(TAG, "Audio sample rate must be positive");
        return ESP_ERR_INVALID_ARG;
    }

    if (!(config.fault.warning_amplitude < config.fault.high_amplitude)) {
        ESP_LOGE(TAG, "warning_amplitude=%.2f must be below high_amplitude=%.2f",
                 config.fault.warning_amplitude, config.fault.high_amplitude);
        return ESP_ERR_INVALID_ARG;
    }
    if (!(config.fault.warning_low_hz < config.fault.warning_high_hz)) {
        ESP_LOGE(TAG, "Warning band [%.1f, %.1f] Hz is empty",
                 config.fault.warning_low_hz, config.fault.warning_high_hz);
        return ESP_ERR_INVALID_ARG;
    }

    return ESP_OK;
}

}  // namespace pdi
