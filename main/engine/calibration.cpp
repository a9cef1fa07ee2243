/**
 * @file calibration.cpp
 * @brief CalibrationChannel and AccelZeroSampler implementation
 */

#include "calibration.hpp"

#include "esp_log.h"

namespace pdi {

// ============================================================================
// CalibrationChannel
// ============================================================================

CalibrationChannel::CalibrationChannel()
    : mutex_(nullptr)
    , profile_{}
    , pending_{}
    , default_spl_offset_db_(0.0f)
{
}

CalibrationChannel::~CalibrationChannel() {
    if (mutex_) {
        vSemaphoreDelete(mutex_);
    }
}

esp_err_t CalibrationChannel::init(float default_spl_offset_db) {
    if (!mutex_) {
        mutex_ = xSemaphoreCreateMutex();
        if (!mutex_) {
            ESP_LOGE(TAG, "Failed to create mutex");
            return ESP_ERR_NO_MEM;
        }
    }

    default_spl_offset_db_ = default_spl_offset_db;
    reset();
    return ESP_OK;
}

void CalibrationChannel::lock() const {
    xSemaphoreTake(mutex_, portMAX_DELAY);
}

void CalibrationChannel::unlock() const {
    xSemaphoreGive(mutex_);
}

void CalibrationChannel::setCalibration(const Vec3& accel_zero, const Vec3& gyro_zero,
                                        float spl_offset_db) {
    lock();
    profile_.accel_zero = accel_zero;
    profile_.gyro_zero = gyro_zero;
    profile_.spl_offset_db = spl_offset_db;
    unlock();

    ESP_LOGI(TAG, "Calibration set: accel0=(%.3f, %.3f, %.3f) spl=%.1f dB",
             accel_zero.x, accel_zero.y, accel_zero.z, spl_offset_db);
}

void CalibrationChannel::setAccelZero(const Vec3& accel_zero) {
    lock();
    profile_.accel_zero = accel_zero;
    unlock();

    ESP_LOGI(TAG, "Accel zero set: (%.3f, %.3f, %.3f)", accel_zero.x, accel_zero.y, accel_zero.z);
}

void CalibrationChannel::requestTiltZero() {
    lock();
    pending_.zero_tilt = true;
    unlock();
}

void CalibrationChannel::requestReferenceLevel(float target_db) {
    lock();
    pending_.reference_level = true;
    pending_.reference_target_db = target_db;
    unlock();
}

void CalibrationChannel::snapshot(CalibrationProfile& profile, CalibrationRequests& requests) {
    lock();
    profile = profile_;
    requests = pending_;
    pending_ = CalibrationRequests{};
    unlock();
}

void CalibrationChannel::commitTiltZero(float pitch_zero_deg, float roll_zero_deg) {
    lock();
    profile_.pitch_zero_deg = pitch_zero_deg;
    profile_.roll_zero_deg = roll_zero_deg;
    unlock();

    ESP_LOGI(TAG, "Tilt zeroed at pitch=%.2f roll=%.2f", pitch_zero_deg, roll_zero_deg);
}

bool CalibrationChannel::commitSplOffset(float expected_db, float spl_offset_db) {
    lock();
    bool current = profile_.spl_offset_db == expected_db;
    if (current) {
        profile_.spl_offset_db = spl_offset_db;
    }
    unlock();

    if (!current) {
        ESP_LOGW(TAG, "SPL offset changed during reference level, retrying");
        return false;
    }
    ESP_LOGI(TAG, "SPL offset now %.2f dB", spl_offset_db);
    return true;
}

void CalibrationChannel::restoreReferenceRequest(float target_db) {
    lock();
    if (!pending_.reference_level) {
        pending_.reference_level = true;
        pending_.reference_target_db = target_db;
    }
    unlock();
}

void CalibrationChannel::reset() {
    lock();
    profile_ = CalibrationProfile{};
    profile_.spl_offset_db = default_spl_offset_db_;
    pending_ = CalibrationRequests{};
    unlock();
}

CalibrationProfile CalibrationChannel::profile() const {
    lock();
    CalibrationProfile copy = profile_;
    unlock();
    return copy;
}

// ============================================================================
// AccelZeroSampler
// ============================================================================

AccelZeroSampler::AccelZeroSampler(size_t target_samples)
    : target_(target_samples > 0 ? target_samples : 1)
    , count_(0)
    , sum_{}
{
}

bool AccelZeroSampler::add(const Vec3& accel) {
    if (count_ < target_) {
        sum_ = sum_ + accel;
        count_++;
    }
    return isComplete();
}

esp_err_t AccelZeroSampler::result(Vec3& accel_zero) const {
    if (!isComplete()) {
        return ESP_ERR_INVALID_STATE;
    }

    accel_zero = sum_ * (1.0f / static_cast<float>(count_));
    accel_zero.z -= STANDARD_GRAVITY;
    return ESP_OK;
}

void AccelZeroSampler::restart() {
    count_ = 0;
    sum_ = Vec3{};
}

}  // namespace pdi
