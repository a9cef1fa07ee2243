/**
 * @file power_controller.cpp
 * @brief PowerController implementation
 */

#include "power_controller.hpp"

#include "esp_log.h"

namespace pdi {

PowerController::PowerController(const PowerConfig& config)
    : config_(config)
    , mutex_(nullptr)
    , listener_(nullptr)
    , state_(EcoState::ACTIVE)
    , ultra_override_(false)
    , throttled_(false)
    , has_motion_time_(false)
    , last_motion_ns_(0)
    , last_update_ns_(0)
    , notified_state_(EcoState::ACTIVE)
    , notified_rate_(config.active_rate_hz)
    , transitions_(0)
{
}

PowerController::~PowerController() {
    if (mutex_) {
        vSemaphoreDelete(mutex_);
    }
}

esp_err_t PowerController::init() {
    if (config_.ultra_eco_rate_hz == 0 || config_.ultra_eco_rate_hz > config_.eco_rate_hz ||
        config_.eco_rate_hz > config_.active_rate_hz || config_.eco_timeout_ns <= 0 ||
        config_.throttle_off_c >= config_.throttle_on_c) {
        ESP_LOGE(TAG, "Invalid power config");
        return ESP_ERR_INVALID_ARG;
    }

    if (!mutex_) {
        mutex_ = xSemaphoreCreateMutex();
        if (!mutex_) {
            ESP_LOGE(TAG, "Failed to create mutex");
            return ESP_ERR_NO_MEM;
        }
    }

    ESP_LOGI(TAG, "Power controller: wake > %.2f m/s^2, eco after %lld ms, rates %u/%u/%u Hz",
             config_.wake_threshold, static_cast<long long>(config_.eco_timeout_ns / 1000000LL),
             static_cast<unsigned>(config_.active_rate_hz),
             static_cast<unsigned>(config_.eco_rate_hz),
             static_cast<unsigned>(config_.ultra_eco_rate_hz));
    return ESP_OK;
}

void PowerController::setListener(PowerStateListener* listener) {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    listener_ = listener;
    xSemaphoreGive(mutex_);
}

uint32_t PowerController::rateLocked() const {
    if (state_ == EcoState::ULTRA_ECO || throttled_) {
        return config_.ultra_eco_rate_hz;
    }
    if (state_ == EcoState::ECO) {
        return config_.eco_rate_hz;
    }
    return config_.active_rate_hz;
}

bool PowerController::commitLocked(EcoState& state, uint32_t& rate) {
    state = state_;
    rate = rateLocked();
    if (state == notified_state_ && rate == notified_rate_) {
        return false;
    }
    notified_state_ = state;
    notified_rate_ = rate;
    transitions_++;
    return true;
}

void PowerController::notify(EcoState state, uint32_t rate) {
    ESP_LOGI(TAG, "-> %s at %u Hz", toString(state), static_cast<unsigned>(rate));

    xSemaphoreTake(mutex_, portMAX_DELAY);
    PowerStateListener* listener = listener_;
    xSemaphoreGive(mutex_);

    if (listener) {
        listener->onPowerStateChange(state, rate);
    }
}

void PowerController::update(float vibration_mag, int64_t timestamp_ns) {
    EcoState state;
    uint32_t rate;
    bool changed;

    xSemaphoreTake(mutex_, portMAX_DELAY);
    last_update_ns_ = timestamp_ns;
    if (!has_motion_time_) {
        last_motion_ns_ = timestamp_ns;
        has_motion_time_ = true;
    }

    if (!ultra_override_) {
        if (vibration_mag > config_.wake_threshold) {
            last_motion_ns_ = timestamp_ns;
            state_ = EcoState::ACTIVE;
        } else if (state_ == EcoState::ACTIVE &&
                   timestamp_ns - last_motion_ns_ > config_.eco_timeout_ns) {
            state_ = EcoState::ECO;
        }
    }
    changed = commitLocked(state, rate);
    xSemaphoreGive(mutex_);

    if (changed) {
        notify(state, rate);
    }
}

void PowerController::setUltraEco(bool enabled) {
    EcoState state;
    uint32_t rate;
    bool changed;

    xSemaphoreTake(mutex_, portMAX_DELAY);
    ultra_override_ = enabled;
    if (enabled) {
        state_ = EcoState::ULTRA_ECO;
    } else if (state_ == EcoState::ULTRA_ECO) {
        state_ = EcoState::ACTIVE;
        last_motion_ns_ = last_update_ns_;
    }
    changed = commitLocked(state, rate);
    xSemaphoreGive(mutex_);

    if (changed) {
        notify(state, rate);
    }
}

void PowerController::updateTemperature(float celsius) {
    EcoState state;
    uint32_t rate;
    bool changed;

    xSemaphoreTake(mutex_, portMAX_DELAY);
    if (!throttled_ && celsius > config_.throttle_on_c) {
        throttled_ = true;
        ESP_LOGW(TAG, "Thermal throttle on at %.1f C", celsius);
    } else if (throttled_ && celsius < config_.throttle_off_c) {
        throttled_ = false;
        ESP_LOGI(TAG, "Thermal throttle off at %.1f C", celsius);
    }
    changed = commitLocked(state, rate);
    xSemaphoreGive(mutex_);

    if (changed) {
        notify(state, rate);
    }
}

esp_err_t PowerController::setActiveRate(uint32_t rate_hz) {
    EcoState state;
    uint32_t rate;
    bool changed;

    xSemaphoreTake(mutex_, portMAX_DELAY);
    if (rate_hz < config_.eco_rate_hz) {
        xSemaphoreGive(mutex_);
        ESP_LOGE(TAG, "Active rate %u Hz below eco rate", static_cast<unsigned>(rate_hz));
        return ESP_ERR_INVALID_ARG;
    }
    config_.active_rate_hz = rate_hz;
    changed = commitLocked(state, rate);
    xSemaphoreGive(mutex_);

    if (changed) {
        notify(state, rate);
    }
    return ESP_OK;
}

EcoState PowerController::state() const {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    EcoState s = state_;
    xSemaphoreGive(mutex_);
    return s;
}

uint32_t PowerController::samplingRateHz() const {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    uint32_t r = rateLocked();
    xSemaphoreGive(mutex_);
    return r;
}

bool PowerController::isThrottled() const {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    bool t = throttled_;
    xSemaphoreGive(mutex_);
    return t;
}

uint32_t PowerController::transitionCount() const {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    uint32_t n = transitions_;
    xSemaphoreGive(mutex_);
    return n;
}

}  // namespace pdi
