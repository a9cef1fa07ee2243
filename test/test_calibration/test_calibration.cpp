/**
 * @file test_calibration.cpp
 * @brief Unit tests for CalibrationChannel and AccelZeroSampler
 */

#include "unity.h"
#include "engine/calibration.hpp"

using namespace pdi;

static CalibrationChannel* channel = nullptr;

void setUp(void) {
    channel = new CalibrationChannel();
    channel->init(90.0f);
}

void tearDown(void) {
    delete channel;
    channel = nullptr;
}

void test_neutral_profile_after_init(void) {
    CalibrationProfile p = channel->profile();
    TEST_ASSERT_EQUAL_FLOAT(0.0f, p.accel_zero.x);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, p.pitch_zero_deg);
    TEST_ASSERT_EQUAL_FLOAT(90.0f, p.spl_offset_db);
}

void test_snapshot_consumes_one_shot_requests(void) {
    channel->requestTiltZero();
    channel->requestReferenceLevel(40.0f);

    CalibrationProfile p;
    CalibrationRequests r;
    channel->snapshot(p, r);
    TEST_ASSERT_TRUE(r.zero_tilt);
    TEST_ASSERT_TRUE(r.reference_level);
    TEST_ASSERT_EQUAL_FLOAT(40.0f, r.reference_target_db);

    channel->snapshot(p, r);
    TEST_ASSERT_FALSE(r.zero_tilt);
    TEST_ASSERT_FALSE(r.reference_level);
}

void test_set_calibration_keeps_tilt_zero(void) {
    channel->commitTiltZero(3.0f, -2.0f);
    channel->setCalibration(Vec3{0.1f, 0.2f, 0.3f}, Vec3{}, 85.0f);

    CalibrationProfile p = channel->profile();
    TEST_ASSERT_EQUAL_FLOAT(0.2f, p.accel_zero.y);
    TEST_ASSERT_EQUAL_FLOAT(85.0f, p.spl_offset_db);
    TEST_ASSERT_EQUAL_FLOAT(3.0f, p.pitch_zero_deg);
    TEST_ASSERT_EQUAL_FLOAT(-2.0f, p.roll_zero_deg);
}

void test_restore_does_not_override_newer_request(void) {
    channel->requestReferenceLevel(40.0f);

    CalibrationProfile p;
    CalibrationRequests r;
    channel->snapshot(p, r);

    // A newer request arrives before the old one is put back
    channel->requestReferenceLevel(55.0f);
    channel->restoreReferenceRequest(r.reference_target_db);

    channel->snapshot(p, r);
    TEST_ASSERT_TRUE(r.reference_level);
    TEST_ASSERT_EQUAL_FLOAT(55.0f, r.reference_target_db);
}

void test_spl_commit_keeps_newer_calibration(void) {
    channel->requestReferenceLevel(40.0f);

    CalibrationProfile p;
    CalibrationRequests r;
    channel->snapshot(p, r);
    TEST_ASSERT_EQUAL_FLOAT(90.0f, p.spl_offset_db);

    // Control path writes a new offset while the frame is being processed
    channel->setCalibration(Vec3{}, Vec3{}, 70.0f);

    TEST_ASSERT_FALSE(channel->commitSplOffset(p.spl_offset_db, 55.0f));
    TEST_ASSERT_EQUAL_FLOAT(70.0f, channel->profile().spl_offset_db);

    // Retried against the next snapshot
    channel->restoreReferenceRequest(r.reference_target_db);
    channel->snapshot(p, r);
    TEST_ASSERT_TRUE(r.reference_level);
    TEST_ASSERT_EQUAL_FLOAT(70.0f, p.spl_offset_db);
    TEST_ASSERT_TRUE(channel->commitSplOffset(p.spl_offset_db, 55.0f));
    TEST_ASSERT_EQUAL_FLOAT(55.0f, channel->profile().spl_offset_db);
}

void test_set_accel_zero_keeps_other_fields(void) {
    channel->setCalibration(Vec3{}, Vec3{0.01f, 0.02f, 0.03f}, 80.0f);
    TEST_ASSERT_TRUE(channel->commitSplOffset(80.0f, 65.0f));
    channel->commitTiltZero(1.5f, 0.5f);

    channel->setAccelZero(Vec3{0.1f, -0.2f, 0.05f});

    CalibrationProfile p = channel->profile();
    TEST_ASSERT_EQUAL_FLOAT(0.1f, p.accel_zero.x);
    TEST_ASSERT_EQUAL_FLOAT(-0.2f, p.accel_zero.y);
    TEST_ASSERT_EQUAL_FLOAT(0.02f, p.gyro_zero.y);
    TEST_ASSERT_EQUAL_FLOAT(65.0f, p.spl_offset_db);
    TEST_ASSERT_EQUAL_FLOAT(1.5f, p.pitch_zero_deg);
}

void test_reset_restores_default_offset(void) {
    TEST_ASSERT_TRUE(channel->commitSplOffset(90.0f, 70.0f));
    channel->requestTiltZero();

    channel->reset();

    CalibrationProfile p;
    CalibrationRequests r;
    channel->snapshot(p, r);
    TEST_ASSERT_EQUAL_FLOAT(90.0f, p.spl_offset_db);
    TEST_ASSERT_FALSE(r.zero_tilt);
}

void test_accel_zero_sampler_removes_gravity(void) {
    AccelZeroSampler sampler(4);
    Vec3 zero;
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, sampler.result(zero));

    for (int i = 0; i < 3; i++) {
        TEST_ASSERT_FALSE(sampler.add(Vec3{0.2f, -0.1f, 9.9f}));
    }
    TEST_ASSERT_TRUE(sampler.add(Vec3{0.2f, -0.1f, 9.9f}));

    TEST_ASSERT_EQUAL(ESP_OK, sampler.result(zero));
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 0.2f, zero.x);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, -0.1f, zero.y);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 9.9f - STANDARD_GRAVITY, zero.z);

    sampler.restart();
    TEST_ASSERT_EQUAL(0, sampler.count());
    TEST_ASSERT_FALSE(sampler.isComplete());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_neutral_profile_after_init);
    RUN_TEST(test_snapshot_consumes_one_shot_requests);
    RUN_TEST(test_set_calibration_keeps_tilt_zero);
    RUN_TEST(test_restore_does_not_override_newer_request);
    RUN_TEST(test_spl_commit_keeps_newer_calibration);
    RUN_TEST(test_set_accel_zero_keeps_other_fields);
    RUN_TEST(test_reset_restores_default_offset);
    RUN_TEST(test_accel_zero_sampler_removes_gravity);
    return UNITY_END();
}
