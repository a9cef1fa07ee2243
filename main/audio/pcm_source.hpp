/**
 * @file pcm_source.hpp
 * @brief Interface for anything that produces mono int16 PCM
 */

#pragma once

#include "esp_err.h"
#include <cstddef>
#include <cstdint>

namespace pdi {

class PcmSource {
public:
    virtual ~PcmSource() = default;

    virtual esp_err_t start() = 0;
    virtual esp_err_t stop() = 0;

    /**
     * @brief Read up to num_samples samples
     *
     * A timeout with a partial block is not an error: samples_read says
     * how much arrived.
     */
    virtual esp_err_t read(int16_t* buffer, size_t num_samples, size_t& samples_read,
                           uint32_t timeout_ms) = 0;

    virtual uint32_t sampleRate() const = 0;
};

}  // namespace pdi
