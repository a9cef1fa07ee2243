/**
 * @file fft_engine.hpp
 * @brief Shared esp-dsp radix-2 complex FFT with inverse transform
 *
 * esp-dsp keeps one twiddle table for the whole process, sized for the
 * largest transform. Every analyzer calls fftInit() with its own size;
 * the table is rebuilt only when a larger size is requested.
 *
 * Data layout is interleaved complex float: data[2k] = re, data[2k+1] = im.
 */

#pragma once

#include "esp_err.h"
#include <cstddef>

namespace pdi {

/// Upper bound accepted by validateConfig (esp-dsp default table limit)
constexpr size_t FFT_MAX_SIZE = 4096;

inline bool isPowerOfTwo(size_t n) {
    return n >= 2 && (n & (n - 1)) == 0;
}

/**
 * @brief Make sure the twiddle table covers transforms of size n
 */
esp_err_t fftInit(size_t n);

/**
 * @brief In-place forward transform, output in natural bin order
 * @return ESP_ERR_INVALID_ARG if n is not a power of two,
 *         ESP_ERR_INVALID_STATE if the table does not cover n
 */
esp_err_t fftForward(float* data, size_t n);

/**
 * @brief In-place inverse transform, scaled by 1/n
 *
 * Computed as conj(FFT(conj(x))) / n on the forward kernel.
 */
esp_err_t fftInverse(float* data, size_t n);

/**
 * @brief Release the twiddle table
 */
void fftDeinit();

}  // namespace pdi
