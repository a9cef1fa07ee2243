/**
 * @file fft_engine.cpp
 * @brief esp-dsp FFT wrapper
 */

#include "fft_engine.hpp"

#include "esp_log.h"
#include "esp_dsp.h"

namespace pdi {

static const char* TAG = "FFT";

// Size the shared esp-dsp table was built for, 0 when not initialized
static size_t s_table_size = 0;

esp_err_t fftInit(size_t n) {
    if (!isPowerOfTwo(n) || n > FFT_MAX_SIZE) {
        ESP_LOGE(TAG, "Unsupported FFT size %u", static_cast<unsigned>(n));
        return ESP_ERR_INVALID_ARG;
    }

    if (n <= s_table_size) {
        return ESP_OK;
    }

    if (s_table_size > 0) {
        dsps_fft2r_deinit_fc32();
        s_table_size = 0;
    }

    esp_err_t ret = dsps_fft2r_init_fc32(nullptr, static_cast<int>(n));
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to initialize FFT: %s", esp_err_to_name(ret));
        return ret;
    }

    s_table_size = n;
    ESP_LOGI(TAG, "FFT table ready for N <= %u", static_cast<unsigned>(n));
    return ESP_OK;
}

esp_err_t fftForward(float* data, size_t n) {
    if (!isPowerOfTwo(n)) {
        return ESP_ERR_INVALID_ARG;
    }
    if (n > s_table_size) {
        return ESP_ERR_INVALID_STATE;
    }

    esp_err_t ret = dsps_fft2r_fc32(data, static_cast<int>(n));
    if (ret != ESP_OK) {
        return ret;
    }
    return dsps_bit_rev_fc32(data, static_cast<int>(n));
}

esp_err_t fftInverse(float* data, size_t n) {
    if (!isPowerOfTwo(n)) {
        return ESP_ERR_INVALID_ARG;
    }
    if (n > s_table_size) {
        return ESP_ERR_INVALID_STATE;
    }

    for (size_t i = 0; i < n; i++) {
        data[i * 2 + 1] = -data[i * 2 + 1];
    }

    esp_err_t ret = fftForward(data, n);
    if (ret != ESP_OK) {
        return ret;
    }

    const float scale = 1.0f / static_cast<float>(n);
    for (size_t i = 0; i < n; i++) {
        data[i * 2] *= scale;
        data[i * 2 + 1] = -data[i * 2 + 1] * scale;
    }
    return ESP_OK;
}

void fftDeinit() {
    if (s_table_size > 0) {
        dsps_fft2r_deinit_fc32();
        s_table_size = 0;
    }
}

}  // namespace pdi
