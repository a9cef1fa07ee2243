/**
 * @file audio_capture.cpp
 * @brief AudioCapture implementation
 */

#include "audio_capture.hpp"

#include "esp_log.h"
#include <cstdlib>

namespace pdi {

AudioCapture::AudioCapture(PcmSource& source, AudioMailbox& mailbox, const CaptureConfig& config)
    : source_(source)
    , mailbox_(mailbox)
    , config_(config)
    , block_(nullptr)
    , filled_(0)
    , task_(nullptr)
    , exited_(nullptr)
    , running_(false)
{
}

AudioCapture::~AudioCapture() {
    if (running_ || task_) {
        esp_err_t ret = stop();
        if (ret == ESP_ERR_TIMEOUT) {
            // The task still reads into block_ through this object
            ESP_LOGW(TAG, "Waiting for capture task before release");
            ret = waitForExit(portMAX_DELAY);
        }
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Stop on destruction failed: %s", esp_err_to_name(ret));
        }
    }
    if (exited_) vSemaphoreDelete(exited_);
    if (block_) free(block_);
}

esp_err_t AudioCapture::init() {
    if (block_) {
        return ESP_OK;
    }
    if (config_.block_samples == 0 || config_.block_samples > mailbox_.capacity()) {
        ESP_LOGE(TAG, "Block of %u samples does not fit mailbox of %u",
                 static_cast<unsigned>(config_.block_samples),
                 static_cast<unsigned>(mailbox_.capacity()));
        return ESP_ERR_INVALID_SIZE;
    }

    block_ = static_cast<int16_t*>(malloc(config_.block_samples * sizeof(int16_t)));
    if (!block_) {
        ESP_LOGE(TAG, "Failed to allocate capture block");
        return ESP_ERR_NO_MEM;
    }

    exited_ = xSemaphoreCreateBinary();
    if (!exited_) {
        ESP_LOGE(TAG, "Failed to create exit semaphore");
        return ESP_ERR_NO_MEM;
    }

    ESP_LOGI(TAG, "Capture block: %u samples (%.1f ms at %u Hz)",
             static_cast<unsigned>(config_.block_samples),
             1000.0f * config_.block_samples / source_.sampleRate(),
             static_cast<unsigned>(source_.sampleRate()));
    return ESP_OK;
}

esp_err_t AudioCapture::captureOnce() {
    if (!block_) {
        return ESP_ERR_INVALID_STATE;
    }

    size_t got = 0;
    esp_err_t ret = source_.read(block_ + filled_, config_.block_samples - filled_, got,
                                 config_.read_timeout_ms);
    if (ret != ESP_OK) {
        // A partial block is stale after a failure
        filled_ = 0;
        mailbox_.reportFault(ret);
        return ret;
    }

    filled_ += got;
    if (filled_ < config_.block_samples) {
        return ESP_OK;
    }

    filled_ = 0;
    return mailbox_.publish(block_, config_.block_samples);
}

void AudioCapture::taskEntry(void* arg) {
    AudioCapture* self = static_cast<AudioCapture*>(arg);

    while (self->running_) {
        esp_err_t ret = self->captureOnce();
        if (ret != ESP_OK) {
            ESP_LOGD(TAG, "Capture step failed: %s", esp_err_to_name(ret));
            vTaskDelay(pdMS_TO_TICKS(self->config_.error_backoff_ms));
        }
    }

    xSemaphoreGive(self->exited_);
    vTaskDelete(nullptr);
}

esp_err_t AudioCapture::start() {
    if (!block_) {
        ESP_LOGE(TAG, "Not initialized");
        return ESP_ERR_INVALID_STATE;
    }
    if (running_) {
        return ESP_OK;
    }
    if (task_) {
        ESP_LOGE(TAG, "Previous capture task has not exited");
        return ESP_ERR_INVALID_STATE;
    }

    esp_err_t ret = source_.start();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Source start failed: %s", esp_err_to_name(ret));
        mailbox_.reportFault(ret);
        return ret;
    }

    filled_ = 0;
    running_ = true;
    BaseType_t created = xTaskCreatePinnedToCore(
        taskEntry,
        "audio_capture",
        config_.task_stack_size,
        this,
        config_.task_priority,
        &task_,
        config_.task_core
    );
    if (created != pdPASS) {
        running_ = false;
        task_ = nullptr;
        esp_err_t stop_ret = source_.stop();
        if (stop_ret != ESP_OK) {
            ESP_LOGW(TAG, "Source stop failed: %s", esp_err_to_name(stop_ret));
        }
        ESP_LOGE(TAG, "Failed to create capture task");
        return ESP_ERR_NO_MEM;
    }

    ESP_LOGI(TAG, "Capture started");
    return ESP_OK;
}

esp_err_t AudioCapture::stop() {
    if (!running_ && !task_) {
        return ESP_OK;
    }

    running_ = false;
    esp_err_t ret = waitForExit(pdMS_TO_TICKS(STOP_TIMEOUT_MS + config_.read_timeout_ms +
                                              config_.error_backoff_ms));
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Capture task did not exit");
    }
    return ret;
}

esp_err_t AudioCapture::waitForExit(TickType_t ticks) {
    if (task_) {
        if (xSemaphoreTake(exited_, ticks) != pdTRUE) {
            return ESP_ERR_TIMEOUT;
        }
        task_ = nullptr;
    }

    esp_err_t ret = source_.stop();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Source stop failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ESP_LOGI(TAG, "Capture stopped");
    return ESP_OK;
}

}  // namespace pdi
