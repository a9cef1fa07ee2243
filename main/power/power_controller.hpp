/**
 * @file power_controller.hpp
 * @brief Motion-driven sampling rate state machine
 *
 * Active -> Eco when no vibration above the wake threshold was seen for
 * eco_timeout. Any vibration above the threshold returns to Active.
 * UltraEco is an explicit override that pins the minimum rate and stops
 * the automatic transitions until it is cleared. A device temperature
 * above the throttle threshold also pins the minimum rate, with
 * hysteresis.
 *
 * Listeners are told about (state, rate) changes only, never per update.
 */

#pragma once

#include "../engine/sensor_types.hpp"

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "esp_err.h"
#include <cstdint>

namespace pdi {

/**
 * @brief Power controller configuration
 */
struct PowerConfig {
    float wake_threshold;           // Vibration magnitude, m/s^2
    int64_t eco_timeout_ns;
    uint32_t active_rate_hz;
    uint32_t eco_rate_hz;
    uint32_t ultra_eco_rate_hz;
    float throttle_on_c;
    float throttle_off_c;
};

constexpr PowerConfig DEFAULT_POWER_CONFIG = {
    .wake_threshold = 0.12f,
    .eco_timeout_ns = 8000LL * 1000000LL,
    .active_rate_hz = 50,
    .eco_rate_hz = 10,
    .ultra_eco_rate_hz = 5,
    .throttle_on_c = 45.0f,
    .throttle_off_c = 40.0f
};

/**
 * @brief Receives edge notifications, called with no lock held
 */
class PowerStateListener {
public:
    virtual ~PowerStateListener() = default;
    virtual void onPowerStateChange(EcoState state, uint32_t rate_hz) = 0;
};

class PowerController {
public:
    explicit PowerController(const PowerConfig& config = DEFAULT_POWER_CONFIG);
    ~PowerController();

    // Prevent copying
    PowerController(const PowerController&) = delete;
    PowerController& operator=(const PowerController&) = delete;

    /**
     * @brief Create the mutex
     * @return ESP_ERR_INVALID_ARG for inconsistent rates or thresholds
     */
    esp_err_t init();

    void setListener(PowerStateListener* listener);

    /**
     * @brief Feed one vibration magnitude sample
     */
    void update(float vibration_mag, int64_t timestamp_ns);

    /**
     * @brief Enter or leave the UltraEco override
     *
     * Leaving restarts the inactivity timer from the last update.
     */
    void setUltraEco(bool enabled);

    /**
     * @brief Feed a device temperature reading (deg C)
     */
    void updateTemperature(float celsius);

    /**
     * @brief Change the Active rate (scan presets)
     * @return ESP_ERR_INVALID_ARG if below the Eco rate
     */
    esp_err_t setActiveRate(uint32_t rate_hz);

    EcoState state() const;
    uint32_t samplingRateHz() const;
    bool isThrottled() const;
    uint32_t transitionCount() const;

private:
    static constexpr const char* TAG = "Power";

    PowerConfig config_;
    SemaphoreHandle_t mutex_;
    PowerStateListener* listener_;

    EcoState state_;
    bool ultra_override_;
    bool throttled_;
    bool has_motion_time_;
    int64_t last_motion_ns_;
    int64_t last_update_ns_;

    // Last (state, rate) pair reported to the listener
    EcoState notified_state_;
    uint32_t notified_rate_;
    uint32_t transitions_;

    uint32_t rateLocked() const;

    /**
     * @brief Compare with the last notified pair, call with mutex held
     * @return true if the listener must be told
     */
    bool commitLocked(EcoState& state, uint32_t& rate);

    void notify(EcoState state, uint32_t rate);
};

}  // namespace pdi
