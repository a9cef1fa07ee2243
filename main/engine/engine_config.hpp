/**
 * @file engine_config.hpp
 * @brief Tunable constants for every DiagnosticEngine stage
 *
 * Each stage has its own aggregate with a constexpr default. The
 * defaults reproduce the behaviour the engine was tuned with on the
 * bench; change them per deployment through EngineConfig.
 */

#pragma once

#include "esp_err.h"
#include <cstddef>
#include <cstdint>

namespace pdi {

/**
 * @brief Gravity filter and tilt history
 */
struct OrientationConfig {
    float gravity_alpha;        // Low-pass weight of previous gravity estimate
    size_t tilt_history;        // Samples in the tilt confidence window
};

constexpr OrientationConfig DEFAULT_ORIENTATION_CONFIG = {
    .gravity_alpha = 0.8f,
    .tilt_history = 50
};

/**
 * @brief Vibration rings, velocity proxy and ISO zone boundaries
 *
 * velocity_gain converts linear acceleration magnitude (m/s^2) into an
 * RMS velocity proxy in mm/s, assuming a single 10 Hz component
 * (1000 / (2 * pi * 10)). It is a proxy, not a certified measurement.
 */
struct VibrationConfig {
    size_t raw_window;          // Raw |accel| ring (shimmer, gradients)
    size_t vibration_window;    // Linear |accel| ring (RMS, spectral input)
    float velocity_gain;        // (m/s^2) -> mm/s
    float zone_b_mm_s;          // Lower bound of zone B (inclusive)
    float zone_c_mm_s;
    float zone_d_mm_s;
    float peak_decay;           // Peak multiplier when no new maximum
    float long_gradient_keep;   // Weight of previous long gradient
};

constexpr VibrationConfig DEFAULT_VIBRATION_CONFIG = {
    .raw_window = 128,
    .vibration_window = 512,
    .velocity_gain = 15.915f,
    .zone_b_mm_s = 1.8f,
    .zone_c_mm_s = 4.5f,
    .zone_d_mm_s = 11.0f,
    .peak_decay = 0.99f,
    .long_gradient_keep = 0.999f
};

/**
 * @brief FFT sizes, duty cycle and frequency label bands
 */
struct SpectralConfig {
    size_t vibration_fft_size;  // Must equal vibration_window
    size_t audio_fft_size;
    float nominal_vibration_rate_hz;
    uint32_t duty_cycle_frames; // Run spectral stage every N frames
    size_t rate_history;        // Timestamp deltas averaged for real Hz
    float mains_50_low_hz;
    float mains_50_high_hz;
    float mains_60_low_hz;
    float mains_60_high_hz;
    float motor_low_hz;
    float motor_high_hz;
    float low_frequency_max_hz;
};

constexpr SpectralConfig DEFAULT_SPECTRAL_CONFIG = {
    .vibration_fft_size = 512,
    .audio_fft_size = 1024,
    .nominal_vibration_rate_hz = 50.0f,
    .duty_cycle_frames = 10,
    .rate_history = 20,
    .mains_50_low_hz = 49.0f,
    .mains_50_high_hz = 51.0f,
    .mains_60_low_hz = 59.0f,
    .mains_60_high_hz = 61.0f,
    .motor_low_hz = 13.0f,
    .motor_high_hz = 60.0f,
    .low_frequency_max_hz = 5.0f
};

/**
 * @brief Acoustic meter
 *
 * The weighting network is a one-pole high-pass followed by a fixed
 * gain that restores unity at 1 kHz. With a 500 Hz corner the response
 * is within a few dB of the A-curve between 200 Hz and 4 kHz.
 */
struct AcousticConfig {
    uint32_t sample_rate_hz;
    float highpass_cutoff_hz;
    float shaping_gain;
    float default_spl_offset_db;    // Full-scale RMS 1.0 -> this many dB
    float log_epsilon;
    size_t db_history;
    float shimmer_coupling_db;      // dB per ln(1 + shimmer)
    float max_correction_db;
};

constexpr AcousticConfig DEFAULT_ACOUSTIC_CONFIG = {
    .sample_rate_hz = 16000,
    .highpass_cutoff_hz = 500.0f,
    .shaping_gain = 1.118f,
    .default_spl_offset_db = 90.0f,
    .log_epsilon = 1e-9f,
    .db_history = 40,
    .shimmer_coupling_db = 0.5f,
    .max_correction_db = 3.0f
};

/**
 * @brief Lux flicker statistics and light source thresholds
 */
struct PhotonicConfig {
    size_t lux_history;
    float dark_lux;             // Mean below this is Dark
    float natural_flicker;      // Flicker index below this is Natural
};

constexpr PhotonicConfig DEFAULT_PHOTONIC_CONFIG = {
    .lux_history = 50,
    .dark_lux = 5.0f,
    .natural_flicker = 0.01f
};

/**
 * @brief Which time-to-failure model the engine installs at init
 */
enum class FaultModelKind : uint8_t {
    TIERED_DECAY,
    GRADIENT_TREND
};

/**
 * @brief Parameters of one tier of the tiered-decay model
 *
 * ttf = base_hours * exp(-decay * excess)
 * confidence = base_confidence + min(confidence_cap, confidence_slope * excess)
 */
struct FaultTier {
    float base_hours;
    float decay;
    float base_confidence;
    float confidence_slope;
    float confidence_cap;
};

/**
 * @brief Fault predictor and engine state classifier
 */
struct FaultConfig {
    FaultModelKind model;
    float high_amplitude;       // Above: bearing or imbalance
    float warning_amplitude;    // Above: warning / mounts
    float bearing_cutoff_hz;    // Dominant above this with high amplitude: bearing
    float warning_low_hz;       // Warning tier needs a dominant in [low, high]
    float warning_high_hz;
    FaultTier bearing;
    FaultTier imbalance;
    FaultTier warning;
    float healthy_confidence;
    float trend_epsilon;        // Minimum shimmer and long gradient to extrapolate
    float trend_hours_per_unit; // Scales ln(1/shimmer)/gradient into hours
    float critical_shimmer;
    float tonal_entropy;        // Entropy below this is tonal dominance
};

constexpr FaultConfig DEFAULT_FAULT_CONFIG = {
    .model = FaultModelKind::TIERED_DECAY,
    .high_amplitude = 4.0f,
    .warning_amplitude = 1.5f,
    .bearing_cutoff_hz = 20.0f,
    .warning_low_hz = 10.0f,
    .warning_high_hz = 60.0f,
    .bearing = {.base_hours = 24.0f, .decay = 0.5f,
                .base_confidence = 0.90f, .confidence_slope = 0.05f, .confidence_cap = 0.09f},
    .imbalance = {.base_hours = 168.0f, .decay = 0.3f,
                  .base_confidence = 0.85f, .confidence_slope = 0.05f, .confidence_cap = 0.14f},
    .warning = {.base_hours = 720.0f, .decay = 0.1f,
                .base_confidence = 0.60f, .confidence_slope = 0.1f, .confidence_cap = 0.19f},
    .healthy_confidence = 0.05f,
    .trend_epsilon = 1e-6f,
    .trend_hours_per_unit = 1.0f,
    .critical_shimmer = 4.0f,
    .tonal_entropy = 0.35f
};

/**
 * @brief Complete engine configuration
 */
struct EngineConfig {
    OrientationConfig orientation;
    VibrationConfig vibration;
    SpectralConfig spectral;
    AcousticConfig acoustic;
    PhotonicConfig photonic;
    FaultConfig fault;
    int64_t warm_sensor_after_ns;   // Continuous Active time before warm notice

    static EngineConfig defaultConfig();
};

constexpr EngineConfig DEFAULT_ENGINE_CONFIG = {
    .orientation = DEFAULT_ORIENTATION_CONFIG,
    .vibration = DEFAULT_VIBRATION_CONFIG,
    .spectral = DEFAULT_SPECTRAL_CONFIG,
    .acoustic = DEFAULT_ACOUSTIC_CONFIG,
    .photonic = DEFAULT_PHOTONIC_CONFIG,
    .fault = DEFAULT_FAULT_CONFIG,
    .warm_sensor_after_ns = 20LL * 60LL * 1000000000LL
};

inline EngineConfig EngineConfig::defaultConfig() {
    return DEFAULT_ENGINE_CONFIG;
}

/**
 * @brief Check a configuration before the engine allocates anything
 * @return ESP_OK, or ESP_ERR_INVALID_ARG after logging the offending field
 */
esp_err_t validateConfig(const EngineConfig& config);

}  // namespace pdi
