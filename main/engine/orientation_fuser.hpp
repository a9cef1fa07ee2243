/**
 * @file orientation_fuser.hpp
 * @brief Gravity separation, pitch/roll and tilt with rolling confidence
 *
 * The gravity estimate starts from the first calibrated sample instead
 * of zero, so a resting device reports no linear acceleration from the
 * first frame on.
 *
 * Pipeline per sample:
 *   raw accel - accel_zero -> remap to display rotation -> gravity low-pass
 *   -> linear = calibrated - gravity -> pitch/roll from gravity
 *   -> tilt = acos(cos(pitch) * cos(roll))
 */

#pragma once

#include "sensor_types.hpp"
#include "engine_config.hpp"
#include "calibration.hpp"
#include "ring_buffer.hpp"

#include "esp_err.h"

namespace pdi {

/**
 * @brief Per-engine orientation state
 */
struct OrientationState {
    Vec3 gravity;
    bool gravity_seeded;    // First sample initializes the estimate
    RingBuffer tilt_history;
};

/**
 * @brief Orientation outputs for one sample
 */
struct OrientationSample {
    Vec3 calibrated;        // Zero corrected, remapped accel
    Vec3 gravity;
    Vec3 linear;
    float raw_pitch_deg;    // Before zero offsets
    float raw_roll_deg;
    float pitch_deg;
    float roll_deg;
    float tilt_deg;
    float tilt_confidence_deg;
    bool tilt_zeroed;       // A zero request was resolved on this sample
};

class OrientationFuser {
public:
    explicit OrientationFuser(const OrientationConfig& config = DEFAULT_ORIENTATION_CONFIG);

    esp_err_t initState(OrientationState& state) const;

    /**
     * @brief Rotate a device-frame vector into the display frame (z unchanged)
     */
    static Vec3 remap(const Vec3& v, DisplayRotation rotation);

    /**
     * @brief Pitch and roll in degrees from a gravity vector
     */
    static void pitchRoll(const Vec3& gravity, float& pitch_deg, float& roll_deg);

    /**
     * @brief Combined tilt from level in degrees, [0, 180]
     */
    static float tiltFromLevel(float pitch_deg, float roll_deg);

    /**
     * @brief Fuse one accelerometer sample
     *
     * When zero_tilt is set, the current raw pitch/roll become the new
     * zero offsets in profile before tilt is computed.
     */
    OrientationSample update(const Vec3& accel, DisplayRotation rotation,
                             CalibrationProfile& profile, bool zero_tilt,
                             OrientationState& state) const;

private:
    OrientationConfig config_;
};

}  // namespace pdi
