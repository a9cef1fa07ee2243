/**
 * @file test_orientation_fuser.cpp
 * @brief Unit tests for gravity separation, remapping and tilt zeroing
 */

#include "unity.h"
#include "engine/orientation_fuser.hpp"

#include <cmath>

using namespace pdi;

static const float DEG_TO_RAD = 0.01745329252f;

static CalibrationProfile neutralProfile() {
    CalibrationProfile p{};
    p.spl_offset_db = 90.0f;
    return p;
}

void setUp(void) {}

void tearDown(void) {}

void test_flat_device_reads_level(void) {
    OrientationFuser fuser;
    OrientationState state;
    TEST_ASSERT_EQUAL(ESP_OK, fuser.initState(state));
    CalibrationProfile profile = neutralProfile();

    OrientationSample s{};
    for (int i = 0; i < 50; i++) {
        s = fuser.update(Vec3{0.0f, 0.0f, 9.81f}, DisplayRotation::ROT_0, profile, false, state);
    }

    TEST_ASSERT_FLOAT_WITHIN(0.01f, 0.0f, s.tilt_deg);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.0f, s.linear.norm());
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.0f, s.tilt_confidence_deg);
}

void test_gravity_converges_after_step(void) {
    OrientationFuser fuser;
    OrientationState state;
    TEST_ASSERT_EQUAL(ESP_OK, fuser.initState(state));
    CalibrationProfile profile = neutralProfile();

    fuser.update(Vec3{0.0f, 0.0f, 9.81f}, DisplayRotation::ROT_0, profile, false, state);

    // Device pitched by 30 degrees about x
    const float g = 9.81f;
    Vec3 tilted{0.0f, g * sinf(30.0f * DEG_TO_RAD), g * cosf(30.0f * DEG_TO_RAD)};
    OrientationSample s{};
    for (int i = 0; i < 60; i++) {
        s = fuser.update(tilted, DisplayRotation::ROT_0, profile, false, state);
    }

    TEST_ASSERT_FLOAT_WITHIN(0.05f, 30.0f, s.pitch_deg);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 0.0f, s.roll_deg);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 30.0f, s.tilt_deg);
}

void test_remap_follows_display_rotation(void) {
    Vec3 v{1.0f, 2.0f, 3.0f};

    Vec3 r90 = OrientationFuser::remap(v, DisplayRotation::ROT_90);
    TEST_ASSERT_EQUAL_FLOAT(-2.0f, r90.x);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, r90.y);

    Vec3 r180 = OrientationFuser::remap(v, DisplayRotation::ROT_180);
    TEST_ASSERT_EQUAL_FLOAT(-1.0f, r180.x);
    TEST_ASSERT_EQUAL_FLOAT(-2.0f, r180.y);

    Vec3 r270 = OrientationFuser::remap(v, DisplayRotation::ROT_270);
    TEST_ASSERT_EQUAL_FLOAT(2.0f, r270.x);
    TEST_ASSERT_EQUAL_FLOAT(-1.0f, r270.y);
    TEST_ASSERT_EQUAL_FLOAT(3.0f, r270.z);
}

void test_zero_tilt_uses_current_attitude(void) {
    OrientationFuser fuser;
    OrientationState state;
    TEST_ASSERT_EQUAL(ESP_OK, fuser.initState(state));
    CalibrationProfile profile = neutralProfile();

    const float g = 9.81f;
    Vec3 tilted{-g * sinf(10.0f * DEG_TO_RAD), 0.0f, g * cosf(10.0f * DEG_TO_RAD)};
    for (int i = 0; i < 10; i++) {
        fuser.update(tilted, DisplayRotation::ROT_0, profile, false, state);
    }

    OrientationSample s = fuser.update(tilted, DisplayRotation::ROT_0, profile, true, state);
    TEST_ASSERT_TRUE(s.tilt_zeroed);
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 10.0f, profile.roll_zero_deg);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 0.0f, s.tilt_deg);
    // History restarted with this sample
    TEST_ASSERT_EQUAL(1, state.tilt_history.size());
}

void test_accel_zero_is_removed_before_fusion(void) {
    OrientationFuser fuser;
    OrientationState state;
    TEST_ASSERT_EQUAL(ESP_OK, fuser.initState(state));
    CalibrationProfile profile = neutralProfile();
    profile.accel_zero = Vec3{0.5f, 0.0f, 0.0f};

    OrientationSample s = fuser.update(Vec3{0.5f, 0.0f, 9.81f}, DisplayRotation::ROT_0,
                                       profile, false, state);

    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 0.0f, s.calibrated.x);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 0.0f, s.tilt_deg);
}

void test_tilt_from_level_is_bounded(void) {
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.0f, OrientationFuser::tiltFromLevel(0.0f, 0.0f));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 90.0f, OrientationFuser::tiltFromLevel(90.0f, 0.0f));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 180.0f, OrientationFuser::tiltFromLevel(180.0f, 0.0f));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_flat_device_reads_level);
    RUN_TEST(test_gravity_converges_after_step);
    RUN_TEST(test_remap_follows_display_rotation);
    RUN_TEST(test_zero_tilt_uses_current_attitude);
    RUN_TEST(test_accel_zero_is_removed_before_fusion);
    RUN_TEST(test_tilt_from_level_is_bounded);
    return UNITY_END();
}
