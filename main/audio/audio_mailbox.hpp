/**
 * @file audio_mailbox.hpp
 * @brief Single-slot, most-recent-wins handoff of PCM blocks
 *
 * The capture task publishes complete blocks; the sensor task consumes
 * at most one per frame. A block that is not consumed before the next
 * publish is overwritten, never queued. The lock covers the copy only.
 */

#pragma once

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "esp_err.h"
#include <cstddef>
#include <cstdint>

namespace pdi {

struct MailboxStats {
    uint32_t published;
    uint32_t overwritten;   // Published over an unread block
    uint32_t consumed;
    uint32_t faults;
};

class AudioMailbox {
public:
    explicit AudioMailbox(size_t capacity_samples);
    ~AudioMailbox();

    // Prevent copying
    AudioMailbox(const AudioMailbox&) = delete;
    AudioMailbox& operator=(const AudioMailbox&) = delete;

    esp_err_t init();

    /**
     * @brief Copy a complete block into the slot, replacing any unread one
     * @return ESP_ERR_INVALID_SIZE if count exceeds the slot capacity
     */
    esp_err_t publish(const int16_t* samples, size_t count);

    /**
     * @brief Copy the unread block out and mark the slot empty
     * @param out Destination, at least capacity() samples
     * @param count Samples copied
     * @return ESP_ERR_NOT_FOUND when nothing new was published
     */
    esp_err_t consume(int16_t* out, size_t out_capacity, size_t& count);

    /**
     * @brief Record a capture failure; isSourceHealthy() goes false
     *
     * The next successful publish clears the fault.
     */
    void reportFault(esp_err_t error);

    bool isSourceHealthy() const;
    esp_err_t lastFault() const;
    MailboxStats stats() const;
    size_t capacity() const { return capacity_; }

private:
    static constexpr const char* TAG = "AudioMailbox";

    size_t capacity_;
    int16_t* slot_;
    size_t slot_count_;
    bool has_unread_;
    esp_err_t fault_;
    MailboxStats stats_;
    SemaphoreHandle_t mutex_;
};

}  // namespace pdi
