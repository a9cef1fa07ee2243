/**
 * @file audio_capture.hpp
 * @brief Background microphone capture feeding an AudioMailbox
 *
 * The capture task fills a fixed block from the PcmSource across as
 * many reads as it takes and publishes only complete blocks. Read
 * errors are reported to the mailbox so the sensor task can flag audio
 * as unavailable.
 */

#pragma once

#include "pcm_source.hpp"
#include "audio_mailbox.hpp"

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "freertos/semphr.h"
#include "esp_err.h"
#include <cstddef>
#include <cstdint>

namespace pdi {

struct CaptureConfig {
    size_t block_samples;       // Published block length
    uint32_t read_timeout_ms;
    uint32_t error_backoff_ms;  // Pause after a failed read
    uint32_t task_stack_size;
    UBaseType_t task_priority;
    BaseType_t task_core;
};

constexpr CaptureConfig DEFAULT_CAPTURE_CONFIG = {
    .block_samples = 1024,
    .read_timeout_ms = 200,
    .error_backoff_ms = 500,
    .task_stack_size = 4096,
    .task_priority = 6,
    .task_core = 0
};

class AudioCapture {
public:
    AudioCapture(PcmSource& source, AudioMailbox& mailbox,
                 const CaptureConfig& config = DEFAULT_CAPTURE_CONFIG);
    ~AudioCapture();

    // Prevent copying
    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /**
     * @brief Allocate the fill buffer
     * @return ESP_ERR_INVALID_SIZE if the block does not fit the mailbox
     */
    esp_err_t init();

    /**
     * @brief Start the source and the capture task
     */
    esp_err_t start();

    /**
     * @brief Stop the capture task and the source
     *
     * After ESP_ERR_TIMEOUT the task is still winding down; calling
     * stop() again resumes the wait.
     *
     * @return ESP_ERR_TIMEOUT if the task did not exit in time
     */
    esp_err_t stop();

    /**
     * @brief One read step, publishes when the block completes
     *
     * The task body calls this in a loop; tests call it directly.
     */
    esp_err_t captureOnce();

    bool isRunning() const { return running_; }
    bool isTaskAlive() const { return task_ != nullptr; }
    size_t filled() const { return filled_; }

private:
    static constexpr const char* TAG = "AudioCapture";
    static constexpr uint32_t STOP_TIMEOUT_MS = 1000;

    PcmSource& source_;
    AudioMailbox& mailbox_;
    CaptureConfig config_;

    int16_t* block_;
    size_t filled_;

    TaskHandle_t task_;
    SemaphoreHandle_t exited_;
    volatile bool running_;

    static void taskEntry(void* arg);
    esp_err_t waitForExit(TickType_t ticks);
};

}  // namespace pdi
