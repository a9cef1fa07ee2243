/**
 * @file photonic_analyzer.cpp
 * @brief PhotonicAnalyzer implementation
 */

#include "photonic_analyzer.hpp"
#include "../dsp/spectral_analyzer.hpp"

#include <cmath>

namespace pdi {

PhotonicAnalyzer::PhotonicAnalyzer(const PhotonicConfig& photonic, const SpectralConfig& spectral)
    : config_(photonic)
    , spectral_(spectral)
{
}

esp_err_t PhotonicAnalyzer::initState(PhotonicState& state) const {
    state.flicker_index = 0.0f;
    state.source = LightSource::NONE;
    return state.lux_history.init(config_.lux_history);
}

PhotonicReading PhotonicAnalyzer::update(float lux, float dominant_hz, bool has_dominant,
                                         PhotonicState& state) const {
    state.lux_history.push(lux);

    PhotonicReading r{};
    r.lux = lux;
    r.mean_lux = static_cast<float>(state.lux_history.mean());

    if (r.mean_lux != 0.0f) {
        float stddev = static_cast<float>(sqrt(state.lux_history.variancePopulation()));
        state.flicker_index = stddev / r.mean_lux;

        if (r.mean_lux < config_.dark_lux) {
            state.source = LightSource::DARK;
        } else if (state.flicker_index < config_.natural_flicker) {
            state.source = LightSource::NATURAL;
        } else {
            FrequencyBand band = has_dominant
                ? SpectralAnalyzer::labelFrequency(dominant_hz, spectral_)
                : FrequencyBand::UNLABELED;
            bool mains = band == FrequencyBand::MAINS_50HZ || band == FrequencyBand::MAINS_60HZ;
            state.source = mains ? LightSource::GRID : LightSource::ARTIFICIAL;
        }
    }

    r.flicker_index = state.flicker_index;
    r.source = state.source;
    return r;
}

}  // namespace pdi
