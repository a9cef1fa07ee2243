/**
 * @file orientation_fuser.cpp
 * @brief OrientationFuser implementation
 */

#include "orientation_fuser.hpp"

#include <cmath>

namespace pdi {

namespace {

constexpr float RAD_TO_DEG = 57.29577951f;
constexpr float DEG_TO_RAD = 0.01745329252f;

}  // namespace

OrientationFuser::OrientationFuser(const OrientationConfig& config)
    : config_(config)
{
}

esp_err_t OrientationFuser::initState(OrientationState& state) const {
    state.gravity = Vec3{};
    state.gravity_seeded = false;
    return state.tilt_history.init(config_.tilt_history);
}

Vec3 OrientationFuser::remap(const Vec3& v, DisplayRotation rotation) {
    switch (rotation) {
        case DisplayRotation::ROT_90:  return Vec3{-v.y,  v.x, v.z};
        case DisplayRotation::ROT_180: return Vec3{-v.x, -v.y, v.z};
        case DisplayRotation::ROT_270: return Vec3{ v.y, -v.x, v.z};
        case DisplayRotation::ROT_0:
        default:                       return v;
    }
}

void OrientationFuser::pitchRoll(const Vec3& gravity, float& pitch_deg, float& roll_deg) {
    pitch_deg = atan2f(gravity.y, gravity.z) * RAD_TO_DEG;
    roll_deg = atan2f(-gravity.x, sqrtf(gravity.y * gravity.y + gravity.z * gravity.z)) * RAD_TO_DEG;
}

float OrientationFuser::tiltFromLevel(float pitch_deg, float roll_deg) {
    float c = cosf(pitch_deg * DEG_TO_RAD) * cosf(roll_deg * DEG_TO_RAD);
    if (c > 1.0f) c = 1.0f;
    if (c < -1.0f) c = -1.0f;
    return acosf(c) * RAD_TO_DEG;
}

OrientationSample OrientationFuser::update(const Vec3& accel, DisplayRotation rotation,
                                           CalibrationProfile& profile, bool zero_tilt,
                                           OrientationState& state) const {
    OrientationSample out{};

    // Zero offsets are in the device frame, so subtract before remapping
    out.calibrated = remap(accel - profile.accel_zero, rotation);

    if (!state.gravity_seeded) {
        state.gravity = out.calibrated;
        state.gravity_seeded = true;
    } else {
        const float alpha = config_.gravity_alpha;
        state.gravity = state.gravity * alpha + out.calibrated * (1.0f - alpha);
    }
    out.gravity = state.gravity;
    out.linear = out.calibrated - state.gravity;

    pitchRoll(state.gravity, out.raw_pitch_deg, out.raw_roll_deg);

    if (zero_tilt) {
        profile.pitch_zero_deg = out.raw_pitch_deg;
        profile.roll_zero_deg = out.raw_roll_deg;
        // Older values were measured against a different zero
        state.tilt_history.clear();
        out.tilt_zeroed = true;
    }

    out.pitch_deg = out.raw_pitch_deg - profile.pitch_zero_deg;
    out.roll_deg = out.raw_roll_deg - profile.roll_zero_deg;
    out.tilt_deg = tiltFromLevel(out.pitch_deg, out.roll_deg);

    state.tilt_history.push(out.tilt_deg);
    out.tilt_confidence_deg = static_cast<float>(state.tilt_history.stdDevSample());

    return out;
}

}  // namespace pdi
