/**
 * @file audio_mailbox.cpp
 * @brief AudioMailbox implementation
 */

#include "audio_mailbox.hpp"

#include "esp_log.h"
#include <cstdlib>
#include <cstring>

namespace pdi {

AudioMailbox::AudioMailbox(size_t capacity_samples)
    : capacity_(capacity_samples)
    , slot_(nullptr)
    , slot_count_(0)
    , has_unread_(false)
    , fault_(ESP_OK)
    , stats_{}
    , mutex_(nullptr)
{
}

AudioMailbox::~AudioMailbox() {
    if (mutex_) vSemaphoreDelete(mutex_);
    if (slot_) free(slot_);
}

esp_err_t AudioMailbox::init() {
    if (capacity_ == 0) {
        return ESP_ERR_INVALID_ARG;
    }
    if (slot_) {
        return ESP_OK;
    }

    slot_ = static_cast<int16_t*>(malloc(capacity_ * sizeof(int16_t)));
    if (!slot_) {
        ESP_LOGE(TAG, "Failed to allocate %u sample slot", static_cast<unsigned>(capacity_));
        return ESP_ERR_NO_MEM;
    }

    mutex_ = xSemaphoreCreateMutex();
    if (!mutex_) {
        free(slot_);
        slot_ = nullptr;
        ESP_LOGE(TAG, "Failed to create mutex");
        return ESP_ERR_NO_MEM;
    }

    ESP_LOGI(TAG, "Mailbox ready: %u samples", static_cast<unsigned>(capacity_));
    return ESP_OK;
}

esp_err_t AudioMailbox::publish(const int16_t* samples, size_t count) {
    if (!slot_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (!samples || count == 0 || count > capacity_) {
        return ESP_ERR_INVALID_SIZE;
    }

    xSemaphoreTake(mutex_, portMAX_DELAY);
    memcpy(slot_, samples, count * sizeof(int16_t));
    slot_count_ = count;
    if (has_unread_) {
        stats_.overwritten++;
    }
    has_unread_ = true;
    fault_ = ESP_OK;
    stats_.published++;
    xSemaphoreGive(mutex_);

    return ESP_OK;
}

esp_err_t AudioMailbox::consume(int16_t* out, size_t out_capacity, size_t& count) {
    count = 0;
    if (!slot_) {
        return ESP_ERR_INVALID_STATE;
    }

    esp_err_t ret = ESP_OK;

    xSemaphoreTake(mutex_, portMAX_DELAY);
    if (!has_unread_) {
        ret = ESP_ERR_NOT_FOUND;
    } else if (out_capacity < slot_count_) {
        ret = ESP_ERR_INVALID_SIZE;
    } else {
        memcpy(out, slot_, slot_count_ * sizeof(int16_t));
        count = slot_count_;
        has_unread_ = false;
        stats_.consumed++;
    }
    xSemaphoreGive(mutex_);

    return ret;
}

void AudioMailbox::reportFault(esp_err_t error) {
    if (!mutex_) {
        return;
    }

    bool first = false;

    xSemaphoreTake(mutex_, portMAX_DELAY);
    first = (fault_ == ESP_OK);
    fault_ = error;
    stats_.faults++;
    xSemaphoreGive(mutex_);

    if (first) {
        ESP_LOGW(TAG, "Capture fault: %s", esp_err_to_name(error));
    }
}

bool AudioMailbox::isSourceHealthy() const {
    return lastFault() == ESP_OK;
}

esp_err_t AudioMailbox::lastFault() const {
    if (!mutex_) {
        return ESP_ERR_INVALID_STATE;
    }

    xSemaphoreTake(mutex_, portMAX_DELAY);
    esp_err_t f = fault_;
    xSemaphoreGive(mutex_);
    return f;
}

MailboxStats AudioMailbox::stats() const {
    if (!mutex_) {
        return stats_;
    }

    xSemaphoreTake(mutex_, portMAX_DELAY);
    MailboxStats s = stats_;
    xSemaphoreGive(mutex_);
    return s;
}

}  // namespace pdi
