/**
 * @file photonic_analyzer.hpp
 * @brief Lux flicker statistics and light source classification
 */

#pragma once

#include "sensor_types.hpp"
#include "engine_config.hpp"
#include "ring_buffer.hpp"

#include "esp_err.h"

namespace pdi {

struct PhotonicState {
    RingBuffer lux_history;
    float flicker_index;
    LightSource source;
};

struct PhotonicReading {
    float lux;
    float mean_lux;
    float flicker_index;
    LightSource source;
};

class PhotonicAnalyzer {
public:
    explicit PhotonicAnalyzer(const PhotonicConfig& photonic = DEFAULT_PHOTONIC_CONFIG,
                              const SpectralConfig& spectral = DEFAULT_SPECTRAL_CONFIG);

    esp_err_t initState(PhotonicState& state) const;

    /**
     * @brief Add one lux sample and classify
     *
     * Order: Dark (mean below threshold), Natural (flicker below
     * threshold), Grid (dominant frequency in a mains band), Artificial.
     * A zero mean keeps the previous flicker index and classification.
     *
     * @param dominant_hz Dominant frequency of the primary spectrum
     * @param has_dominant False when no spectrum is available yet
     */
    PhotonicReading update(float lux, float dominant_hz, bool has_dominant,
                           PhotonicState& state) const;

private:
    PhotonicConfig config_;
    SpectralConfig spectral_;
};

}  // namespace pdi
