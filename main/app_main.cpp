/**
 * @file app_main.cpp
 * @brief Portable Diagnostic Instrument - Main Application
 *
 * Handheld survey firmware: an MPU6050 and an INMP441 microphone feed
 * the DiagnosticEngine once per sensor tick. The PowerController lowers
 * the tick rate when the instrument is left still.
 *
 * Hardware Configuration:
 *   - MPU6050 SDA: GPIO21
 *   - MPU6050 SCL: GPIO22
 *   - INMP441 SCK/WS/SD: GPIO33 / GPIO25 / GPIO32
 *   - BOOT button: GPIO0 (short press: zero tilt, 3 s hold: accel zero)
 */

#include <cstdio>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "driver/gpio.h"
#include "esp_log.h"
#include "esp_system.h"
#include "esp_timer.h"

#include "engine/diagnostic_engine.hpp"
#include "engine/calibration.hpp"
#include "power/power_controller.hpp"
#include "audio/audio_mailbox.hpp"
#include "audio/audio_capture.hpp"
#include "drivers/mpu6050_imu.hpp"
#include "drivers/i2s_microphone.hpp"

static const char* TAG = "PDI-Main";

// ============================================================================
// Hardware and Task Configuration
// ============================================================================
namespace config {
    // I2C Configuration
    constexpr i2c_port_t I2C_PORT     = I2C_NUM_0;
    constexpr gpio_num_t I2C_SDA_PIN  = GPIO_NUM_21;
    constexpr gpio_num_t I2C_SCL_PIN  = GPIO_NUM_22;

    // BOOT button, active low
    constexpr gpio_num_t BUTTON_PIN   = GPIO_NUM_0;
    constexpr uint32_t BUTTON_POLL_MS = 20;
    constexpr uint32_t LONG_PRESS_MS  = 3000;

    // Audio block handed to the engine, matches the audio FFT length
    constexpr size_t AUDIO_BLOCK_SAMPLES = 1024;

    // Tasks
    constexpr uint32_t SENSOR_TASK_STACK = 8192;
    constexpr UBaseType_t SENSOR_TASK_PRIORITY = 5;
    constexpr BaseType_t SENSOR_TASK_CORE = 1;
    constexpr uint32_t BUTTON_TASK_STACK = 2048;
    constexpr UBaseType_t BUTTON_TASK_PRIORITY = 3;

    // Summary log cadence in frames
    constexpr uint32_t LOG_EVERY_FRAMES = 50;
}

// ============================================================================
// Scan Modes
// ============================================================================

enum class ScanMode : uint8_t {
    BATTERY_SAVER,
    LEVEL_STABILITY,
    VIBRATION_MONITOR,
    NOISE_SCANNER,
    LIGHT_METER
};

struct ScanPreset {
    const char* name;
    uint32_t active_rate_hz;
    bool audio_enabled;
};

static ScanPreset presetFor(ScanMode mode) {
    switch (mode) {
        case ScanMode::BATTERY_SAVER:     return {"Battery saver", 10, false};
        case ScanMode::LEVEL_STABILITY:   return {"Level / stability", 25, false};
        case ScanMode::NOISE_SCANNER:     return {"Noise scanner", 25, true};
        case ScanMode::LIGHT_METER:       return {"Light meter", 10, false};
        case ScanMode::VIBRATION_MONITOR:
        default:                          return {"Vibration monitor", 50, true};
    }
}

constexpr ScanMode STARTUP_SCAN_MODE = ScanMode::VIBRATION_MONITOR;

// ============================================================================
// Application State
// ============================================================================

class LoggingPowerListener : public pdi::PowerStateListener {
public:
    void onPowerStateChange(pdi::EcoState state, uint32_t rate_hz) override {
        ESP_LOGI(TAG, "Power state: %s (%lu Hz)", pdi::toString(state),
                 static_cast<unsigned long>(rate_hz));
    }
};

struct AppContext {
    pdi::DiagnosticEngine* engine;
    pdi::PowerController* power;
    pdi::Mpu6050Imu* imu;
    pdi::AudioMailbox* mailbox;
    bool audio_running;
    bool audio_failed;      // Preset wanted audio but the microphone did not start
    volatile bool accel_zero_requested;
};

static pdi::DiagnosticEngine s_engine;
static pdi::PowerController s_power;
static LoggingPowerListener s_power_listener;
static pdi::AudioMailbox s_mailbox(config::AUDIO_BLOCK_SAMPLES);
static pdi::I2SMicrophone s_microphone;
static pdi::AudioCapture s_capture(s_microphone, s_mailbox);
static AppContext s_app = {};

// ============================================================================
// Function Prototypes
// ============================================================================
static esp_err_t startAudio();
static void sensorTask(void* arg);
static void buttonTask(void* arg);
static void logSummary(const pdi::DiagnosticResult& r);

// ============================================================================
// Main Application Entry Point
// ============================================================================
extern "C" void app_main(void) {
    ESP_LOGI(TAG, "========================================");
    ESP_LOGI(TAG, "  Portable Diagnostic Instrument");
    ESP_LOGI(TAG, "========================================");

    const ScanPreset preset = presetFor(STARTUP_SCAN_MODE);
    ESP_LOGI(TAG, "Scan mode: %s", preset.name);

    esp_err_t ret = s_engine.init();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Engine init failed: %s", esp_err_to_name(ret));
        vTaskDelay(pdMS_TO_TICKS(5000));
        esp_restart();
    }

    ret = s_power.init();
    if (ret == ESP_OK) {
        ret = s_power.setActiveRate(preset.active_rate_hz);
    }
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Power controller init failed: %s", esp_err_to_name(ret));
        vTaskDelay(pdMS_TO_TICKS(5000));
        esp_restart();
    }
    s_power.setListener(&s_power_listener);

    // The IMU is owned by the sensor task for the lifetime of the firmware
    static pdi::Mpu6050Imu imu(config::I2C_PORT, config::I2C_SDA_PIN, config::I2C_SCL_PIN);
    ret = imu.init();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to initialize MPU6050! Error: %s", esp_err_to_name(ret));
        ESP_LOGE(TAG, "Check wiring: SDA=GPIO%d, SCL=GPIO%d",
                 config::I2C_SDA_PIN, config::I2C_SCL_PIN);
        vTaskDelay(pdMS_TO_TICKS(5000));
        esp_restart();
    }

    s_app.engine = &s_engine;
    s_app.power = &s_power;
    s_app.imu = &imu;
    s_app.mailbox = &s_mailbox;
    s_app.audio_running = false;
    s_app.audio_failed = false;
    s_app.accel_zero_requested = false;

    if (preset.audio_enabled) {
        // Without a microphone the engine still runs, audio reports Unavailable
        ret = startAudio();
        if (ret == ESP_OK) {
            s_app.audio_running = true;
        } else {
            ESP_LOGW(TAG, "Audio capture disabled: %s", esp_err_to_name(ret));
            s_app.audio_failed = true;
        }
    }

    gpio_config_t button_cfg = {
        .pin_bit_mask = 1ULL << config::BUTTON_PIN,
        .mode = GPIO_MODE_INPUT,
        .pull_up_en = GPIO_PULLUP_ENABLE,
        .pull_down_en = GPIO_PULLDOWN_DISABLE,
        .intr_type = GPIO_INTR_DISABLE,
    };
    ret = gpio_config(&button_cfg);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "BOOT button unavailable: %s", esp_err_to_name(ret));
    } else {
        xTaskCreate(buttonTask, "button", config::BUTTON_TASK_STACK, &s_app,
                    config::BUTTON_TASK_PRIORITY, nullptr);
    }

    BaseType_t created = xTaskCreatePinnedToCore(
        sensorTask, "sensor", config::SENSOR_TASK_STACK, &s_app,
        config::SENSOR_TASK_PRIORITY, nullptr, config::SENSOR_TASK_CORE);
    if (created != pdPASS) {
        ESP_LOGE(TAG, "Failed to create sensor task");
        esp_restart();
    }

    ESP_LOGI(TAG, "Free heap: %lu bytes", static_cast<unsigned long>(esp_get_free_heap_size()));
}

// ============================================================================
// Audio
// ============================================================================

static esp_err_t startAudio() {
    esp_err_t ret = s_mailbox.init();
    if (ret != ESP_OK) {
        return ret;
    }
    ret = s_microphone.init();
    if (ret != ESP_OK) {
        return ret;
    }
    ret = s_capture.init();
    if (ret != ESP_OK) {
        return ret;
    }
    return s_capture.start();
}

// ============================================================================
// Tasks
// ============================================================================

/**
 * @brief Read sensors, run the engine and drive the power controller
 */
static void sensorTask(void* arg) {
    AppContext* app = static_cast<AppContext*>(arg);

    static int16_t pcm[config::AUDIO_BLOCK_SAMPLES];
    pdi::AccelZeroSampler zero_sampler;
    bool sampling_zero = false;
    uint32_t read_failures = 0;

    TickType_t last_wake = xTaskGetTickCount();

    while (true) {
        uint32_t rate_hz = app->power->samplingRateHz();
        TickType_t period = pdMS_TO_TICKS(1000 / rate_hz);
        if (period == 0) {
            period = 1;
        }
        vTaskDelayUntil(&last_wake, period);

        pdi::ImuSample sample;
        esp_err_t ret = app->imu->readSample(sample);
        if (ret != ESP_OK) {
            if (read_failures++ % 100 == 0) {
                ESP_LOGW(TAG, "IMU read failed: %s", esp_err_to_name(ret));
            }
            continue;
        }

        // Accel zero capture runs alongside normal processing
        if (app->accel_zero_requested && !sampling_zero) {
            app->accel_zero_requested = false;
            zero_sampler.restart();
            sampling_zero = true;
            ESP_LOGI(TAG, "Accel zero capture: hold the device flat and still");
        }
        if (sampling_zero && zero_sampler.add(sample.accel)) {
            pdi::Vec3 accel_zero;
            if (zero_sampler.result(accel_zero) == ESP_OK) {
                app->engine->setAccelZero(accel_zero);
                ESP_LOGI(TAG, "Accel zero: (%.3f, %.3f, %.3f) m/s^2",
                         accel_zero.x, accel_zero.y, accel_zero.z);
            }
            sampling_zero = false;
        }

        pdi::SensorFrame frame;
        frame.accel = sample.accel;
        frame.gyro = sample.gyro;
        frame.has_gyro = true;
        frame.timestamp_ns = esp_timer_get_time() * 1000LL;
        frame.eco_state = app->power->state();

        if (app->audio_running) {
            size_t count = 0;
            if (app->mailbox->consume(pcm, config::AUDIO_BLOCK_SAMPLES, count) == ESP_OK) {
                frame.pcm = pcm;
                frame.pcm_len = count;
            }
            frame.audio_device_ok = app->mailbox->isSourceHealthy();
        } else {
            frame.audio_device_ok = !app->audio_failed;
        }

        pdi::DiagnosticResult result;
        ret = app->engine->processFrame(frame, result);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "processFrame failed: %s", esp_err_to_name(ret));
            continue;
        }

        app->power->update(result.vibration_mag, frame.timestamp_ns);
        app->power->updateTemperature(sample.temp_c);

        if (result.frame_index % config::LOG_EVERY_FRAMES == 0) {
            logSummary(result);
        }
    }
}

/**
 * @brief Poll the BOOT button: short press zeroes tilt, long hold zeroes accel
 */
static void buttonTask(void* arg) {
    AppContext* app = static_cast<AppContext*>(arg);

    bool pressed = false;
    bool long_fired = false;
    uint32_t held_ms = 0;

    while (true) {
        bool down = gpio_get_level(config::BUTTON_PIN) == 0;

        if (down) {
            if (!pressed) {
                pressed = true;
                long_fired = false;
                held_ms = 0;
            }
            held_ms += config::BUTTON_POLL_MS;
            if (!long_fired && held_ms >= config::LONG_PRESS_MS) {
                long_fired = true;
                app->accel_zero_requested = true;
            }
        } else if (pressed) {
            pressed = false;
            if (!long_fired) {
                app->engine->zeroTilt();
                ESP_LOGI(TAG, "Tilt zero requested");
            }
        }

        vTaskDelay(pdMS_TO_TICKS(config::BUTTON_POLL_MS));
    }
}

static void logSummary(const pdi::DiagnosticResult& r) {
    ESP_LOGI(TAG, "#%lu %.1f Hz | tilt %.2f (+-%.2f) deg | vib %.3f m/s^2 rms, %.2f mm/s zone %s sev %u",
             static_cast<unsigned long>(r.frame_index), r.real_hz,
             r.tilt_deg, r.tilt_confidence_deg,
             r.vibration_rms, r.velocity_rms_mm_s, pdi::toString(r.iso_zone), r.severity);
    ESP_LOGI(TAG, "  dBA %.1f (+-%.1f, %s) | dom %.1f Hz %s | entropy %.2f",
             r.dba, r.dba_uncertainty, pdi::toString(r.audio_status),
             r.dominant_hz, pdi::toString(r.freq_label), r.spectral_entropy);
    ESP_LOGI(TAG, "  %s (%.0f%%) | state %s%s",
             r.fault.text, r.fault.confidence * 100.0f, pdi::toString(r.state),
             r.warm_sensor ? " | warm sensor" : "");
}
