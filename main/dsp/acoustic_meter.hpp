/**
 * @file acoustic_meter.hpp
 * @brief A-weighted sound level (dBA) with rolling uncertainty
 *
 * Weighting network: one-pole high-pass then a fixed shaping gain,
 * run sample by sample over each PCM block with fresh filter state.
 *
 *   dBA = 20 * log10(rms_w + eps) + spl_offset + correction(shimmer)
 *
 * correction(shimmer) = min(max_correction, coupling * ln(1 + shimmer))
 * couples the level to mechanical roughness measured by the vibration
 * stage. A block with zero weighted RMS reads 0 dBA.
 */

#pragma once

#include "../engine/engine_config.hpp"
#include "../engine/ring_buffer.hpp"

#include "esp_err.h"
#include <cstddef>
#include <cstdint>

namespace pdi {

/**
 * @brief Meter history owned by the engine context
 */
struct AcousticState {
    RingBuffer db_history;
    float dba;              // Last reported level
    float offset_db;        // SPL offset dba was computed with
    float uncertainty_db;
    bool has_reading;
};

class AcousticMeter {
public:
    explicit AcousticMeter(const AcousticConfig& config = DEFAULT_ACOUSTIC_CONFIG);

    /**
     * @brief Derive filter coefficients for the configured sample rate
     */
    esp_err_t init();

    esp_err_t initState(AcousticState& state) const;

    /**
     * @brief Weighted RMS of a block, PCM normalized to [-1, 1)
     */
    float weightedRms(const int16_t* pcm, size_t count) const;

    float correctionDb(float shimmer) const;

    /**
     * @brief Level for a weighted RMS under a given offset, 0 when rms <= 0
     */
    float levelDb(float weighted_rms, float spl_offset_db, float shimmer) const;

    /**
     * @brief Measure one block and push the reading into the history
     * @return The reported dBA
     */
    float measure(const int16_t* pcm, size_t count, float spl_offset_db, float shimmer,
                  AcousticState& state) const;

    /**
     * @brief Offset that maps the current reading onto target_db
     *
     * new_offset = target - (current - previous_offset)
     */
    static float referenceOffset(float target_db, float current_db, float previous_offset_db) {
        return target_db - (current_db - previous_offset_db);
    }

    /**
     * @brief Move the last reading onto a new offset and restart the history
     */
    void applyOffsetChange(float new_offset_db, AcousticState& state) const;

private:
    static constexpr const char* TAG = "Acoustic";

    AcousticConfig config_;
    float hp_alpha_;    // RC / (RC + dt)
};

}  // namespace pdi
