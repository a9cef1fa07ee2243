/**
 * @file vibration_analyzer.hpp
 * @brief Linear acceleration metrics, ISO zone proxy, shimmer and gradients
 */

#pragma once

#include "sensor_types.hpp"
#include "engine_config.hpp"
#include "ring_buffer.hpp"

#include "esp_err.h"

namespace pdi {

/**
 * @brief Vibration rings and running trackers
 */
struct VibrationState {
    RingBuffer raw_window;          // |calibrated accel|, shimmer and gradients
    RingBuffer vibration_window;    // |linear accel|, RMS and spectral input
    float peak;
    float long_gradient;
};

struct ZoneGrade {
    IsoZone zone;
    uint8_t severity;
};

struct VibrationMetrics {
    float vibration_mag;
    float raw_mag;
    float rms;
    float peak;
    float velocity_rms;     // mm/s proxy
    ZoneGrade grade;
    float shimmer;
    float gradient_short;
    float gradient_long;
};

class VibrationAnalyzer {
public:
    explicit VibrationAnalyzer(const VibrationConfig& config = DEFAULT_VIBRATION_CONFIG);

    esp_err_t initState(VibrationState& state) const;

    /**
     * @brief Zone and severity for a velocity proxy
     *
     * Thresholds are evaluated from D down to B; a value equal to a
     * boundary belongs to the higher zone.
     */
    ZoneGrade classify(float velocity_rms_mm_s) const;

    /**
     * @brief (sum of newest half - sum of oldest half) / half
     *
     * 0 until the ring holds at least two values.
     */
    static float shortGradient(const RingBuffer& ring);

    VibrationMetrics update(const Vec3& calibrated, const Vec3& linear,
                            VibrationState& state) const;

private:
    VibrationConfig config_;
};

}  // namespace pdi
