/**
 * @file i2s_microphone.hpp
 * @brief INMP441 I2S microphone as a PcmSource
 *
 * Hardware Connection:
 * - INMP441 SD   -> GPIO32 (Data In)
 * - INMP441 SCK  -> GPIO33 (Bit Clock)
 * - INMP441 WS   -> GPIO25 (Word Select / LRCLK)
 * - INMP441 L/R  -> GND (left slot)
 *
 * The INMP441 sends 24-bit samples left-justified in 32-bit slots; the
 * driver keeps the top 16 bits.
 */

#pragma once

#include "../audio/pcm_source.hpp"

#include "freertos/FreeRTOS.h"
#include "driver/i2s_std.h"
#include "esp_log.h"
#include "esp_err.h"
#include <cstdint>
#include <cstdlib>

namespace pdi {

struct I2SMicConfig {
    gpio_num_t bck_pin;
    gpio_num_t ws_pin;
    gpio_num_t data_pin;
    uint32_t sample_rate;
    size_t dma_buffer_count;
    size_t dma_buffer_size;     // Frames per DMA buffer
    size_t max_read_samples;    // Largest single read() request
    i2s_port_t i2s_port;
};

constexpr I2SMicConfig DEFAULT_MIC_CONFIG = {
    .bck_pin = GPIO_NUM_33,
    .ws_pin = GPIO_NUM_25,
    .data_pin = GPIO_NUM_32,
    .sample_rate = 16000,
    .dma_buffer_count = 6,
    .dma_buffer_size = 256,
    .max_read_samples = 1024,
    .i2s_port = I2S_NUM_0
};

class I2SMicrophone : public PcmSource {
public:
    explicit I2SMicrophone(const I2SMicConfig& config = DEFAULT_MIC_CONFIG);
    ~I2SMicrophone() override;

    // Prevent copying
    I2SMicrophone(const I2SMicrophone&) = delete;
    I2SMicrophone& operator=(const I2SMicrophone&) = delete;

    /**
     * @brief Create and configure the RX channel, allocate the raw buffer
     */
    esp_err_t init();

    esp_err_t start() override;
    esp_err_t stop() override;

    esp_err_t read(int16_t* buffer, size_t num_samples, size_t& samples_read,
                   uint32_t timeout_ms) override;

    uint32_t sampleRate() const override { return config_.sample_rate; }

    bool isRunning() const { return is_running_; }

private:
    static constexpr const char* TAG = "I2S_MIC";

    I2SMicConfig config_;
    i2s_chan_handle_t rx_channel_;
    bool is_initialized_;
    bool is_running_;

    int32_t* raw_buffer_;   // 32-bit slots straight from DMA

    esp_err_t configureChannel();
};

// ============================================================================
// Implementation
// ============================================================================

inline I2SMicrophone::I2SMicrophone(const I2SMicConfig& config)
    : config_(config)
    , rx_channel_(nullptr)
    , is_initialized_(false)
    , is_running_(false)
    , raw_buffer_(nullptr)
{
}

inline I2SMicrophone::~I2SMicrophone() {
    if (is_running_) {
        i2s_channel_disable(rx_channel_);
    }
    if (rx_channel_ != nullptr) {
        i2s_del_channel(rx_channel_);
    }
    if (raw_buffer_) {
        free(raw_buffer_);
    }
}

inline esp_err_t I2SMicrophone::init() {
    if (is_initialized_) {
        return ESP_OK;
    }

    ESP_LOGI(TAG, "I2S%d: BCK GPIO%d, WS GPIO%d, DATA GPIO%d, %lu Hz",
             config_.i2s_port, config_.bck_pin, config_.ws_pin, config_.data_pin,
             static_cast<unsigned long>(config_.sample_rate));

    raw_buffer_ = static_cast<int32_t*>(malloc(config_.max_read_samples * sizeof(int32_t)));
    if (!raw_buffer_) {
        ESP_LOGE(TAG, "Failed to allocate raw buffer");
        return ESP_ERR_NO_MEM;
    }

    i2s_chan_config_t chan_cfg = {
        .id = config_.i2s_port,
        .role = I2S_ROLE_MASTER,
        .dma_desc_num = static_cast<uint32_t>(config_.dma_buffer_count),
        .dma_frame_num = static_cast<uint32_t>(config_.dma_buffer_size),
        .auto_clear = true,
    };

    esp_err_t ret = i2s_new_channel(&chan_cfg, nullptr, &rx_channel_);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to create I2S channel: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = configureChannel();
    if (ret != ESP_OK) {
        i2s_del_channel(rx_channel_);
        rx_channel_ = nullptr;
        return ret;
    }

    is_initialized_ = true;
    return ESP_OK;
}

inline esp_err_t I2SMicrophone::configureChannel() {
    i2s_std_config_t std_cfg = {
        .clk_cfg = I2S_STD_CLK_DEFAULT_CONFIG(config_.sample_rate),
        .slot_cfg = I2S_STD_PHILIPS_SLOT_DEFAULT_CONFIG(I2S_DATA_BIT_WIDTH_32BIT, I2S_SLOT_MODE_MONO),
        .gpio_cfg = {
            .mclk = I2S_GPIO_UNUSED,
            .bclk = config_.bck_pin,
            .ws = config_.ws_pin,
            .dout = I2S_GPIO_UNUSED,
            .din = config_.data_pin,
            .invert_flags = {
                .mclk_inv = false,
                .bclk_inv = false,
                .ws_inv = false,
            },
        },
    };
    std_cfg.slot_cfg.slot_mask = I2S_STD_SLOT_LEFT;

    esp_err_t ret = i2s_channel_init_std_mode(rx_channel_, &std_cfg);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to configure I2S channel: %s", esp_err_to_name(ret));
    }
    return ret;
}

inline esp_err_t I2SMicrophone::start() {
    if (!is_initialized_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (is_running_) {
        return ESP_OK;
    }

    esp_err_t ret = i2s_channel_enable(rx_channel_);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to enable I2S channel: %s", esp_err_to_name(ret));
        return ret;
    }

    is_running_ = true;
    return ESP_OK;
}

inline esp_err_t I2SMicrophone::stop() {
    if (!is_running_) {
        return ESP_OK;
    }

    esp_err_t ret = i2s_channel_disable(rx_channel_);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to disable I2S channel: %s", esp_err_to_name(ret));
        return ret;
    }

    is_running_ = false;
    return ESP_OK;
}

inline esp_err_t I2SMicrophone::read(int16_t* buffer, size_t num_samples, size_t& samples_read,
                                     uint32_t timeout_ms) {
    samples_read = 0;
    if (!is_running_) {
        return ESP_ERR_INVALID_STATE;
    }

    if (num_samples > config_.max_read_samples) {
        num_samples = config_.max_read_samples;
    }

    size_t bytes_read = 0;
    esp_err_t ret = i2s_channel_read(rx_channel_, raw_buffer_, num_samples * sizeof(int32_t),
                                     &bytes_read, pdMS_TO_TICKS(timeout_ms));
    if (ret != ESP_OK && ret != ESP_ERR_TIMEOUT) {
        ESP_LOGE(TAG, "I2S read error: %s", esp_err_to_name(ret));
        return ret;
    }

    // 24-bit sample sits in the upper bits of the 32-bit slot
    samples_read = bytes_read / sizeof(int32_t);
    for (size_t i = 0; i < samples_read; i++) {
        buffer[i] = static_cast<int16_t>(raw_buffer_[i] >> 16);
    }

    return ESP_OK;
}

}  // namespace pdi
