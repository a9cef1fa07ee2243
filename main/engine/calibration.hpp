/**
 * @file calibration.hpp
 * @brief Calibration profile and the thread-safe channel that feeds it
 *
 * UI code (button handler, console) posts calibration changes from its
 * own task; the sensor task picks them up at the start of each frame.
 * Zero-tilt and reference-level requests are one-shot: they are
 * resolved against the next reading that can satisfy them, so a request
 * made before the first sample simply waits for that sample.
 */

#pragma once

#include "sensor_types.hpp"

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "esp_err.h"

namespace pdi {

/**
 * @brief Offsets applied by the orientation and acoustic stages
 */
struct CalibrationProfile {
    Vec3 accel_zero;
    Vec3 gyro_zero;
    float spl_offset_db;
    float pitch_zero_deg;
    float roll_zero_deg;
};

/**
 * @brief One-shot requests consumed by the sensor task
 */
struct CalibrationRequests {
    bool zero_tilt;
    bool reference_level;
    float reference_target_db;
};

/**
 * @class CalibrationChannel
 * @brief Mutex guarded profile plus pending one-shot requests
 */
class CalibrationChannel {
public:
    CalibrationChannel();
    ~CalibrationChannel();

    // Prevent copying
    CalibrationChannel(const CalibrationChannel&) = delete;
    CalibrationChannel& operator=(const CalibrationChannel&) = delete;

    /**
     * @brief Create the mutex and load a neutral profile
     * @param default_spl_offset_db Offset used until setCalibration() or a reference level
     */
    esp_err_t init(float default_spl_offset_db);

    /**
     * @brief Replace sensor zero offsets and SPL offset
     *
     * Pitch/roll zero offsets are left untouched.
     */
    void setCalibration(const Vec3& accel_zero, const Vec3& gyro_zero, float spl_offset_db);

    /**
     * @brief Replace the accelerometer zero only, other fields untouched
     */
    void setAccelZero(const Vec3& accel_zero);

    void requestTiltZero();
    void requestReferenceLevel(float target_db);

    /**
     * @brief Copy the profile and consume pending requests
     */
    void snapshot(CalibrationProfile& profile, CalibrationRequests& requests);

    void commitTiltZero(float pitch_zero_deg, float roll_zero_deg);

    /**
     * @brief Store a new SPL offset if the current one is still expected_db
     *
     * expected_db is the offset the frame was measured with. A different
     * value means setCalibration() ran since snapshot(); that offset is
     * kept and false is returned.
     */
    bool commitSplOffset(float expected_db, float spl_offset_db);

    /**
     * @brief Put back a reference request that could not be resolved yet
     *
     * Ignored when a newer request was posted in the meantime.
     */
    void restoreReferenceRequest(float target_db);

    /**
     * @brief Back to the neutral profile, dropping pending requests
     */
    void reset();

    CalibrationProfile profile() const;

private:
    static constexpr const char* TAG = "Calibration";

    SemaphoreHandle_t mutex_;
    CalibrationProfile profile_;
    CalibrationRequests pending_;
    float default_spl_offset_db_;

    void lock() const;
    void unlock() const;
};

/**
 * @class AccelZeroSampler
 * @brief Averages a run of stationary accelerometer samples into a zero offset
 *
 * The device is assumed flat and face up, so gravity is removed from z.
 */
class AccelZeroSampler {
public:
    static constexpr size_t DEFAULT_SAMPLES = 50;

    explicit AccelZeroSampler(size_t target_samples = DEFAULT_SAMPLES);

    /**
     * @brief Add one raw sample
     * @return true once enough samples were collected
     */
    bool add(const Vec3& accel);

    bool isComplete() const { return count_ >= target_; }
    size_t count() const { return count_; }

    /**
     * @brief Averaged offset
     * @return ESP_ERR_INVALID_STATE until complete
     */
    esp_err_t result(Vec3& accel_zero) const;

    void restart();

private:
    size_t target_;
    size_t count_;
    Vec3 sum_;
};

}  // namespace pdi
