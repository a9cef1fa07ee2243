/**
 * @file fault_predictor.hpp
 * @brief Pluggable time-to-failure models and the engine state classifier
 *
 * Both TTF models are heuristics. They sit behind TtfModel so a
 * calibrated model can replace them without touching the engine.
 */

#pragma once

#include "sensor_types.hpp"
#include "engine_config.hpp"

namespace pdi {

/**
 * @brief Metrics a TTF model may use
 */
struct FaultInputs {
    float amplitude;        // Vibration RMS, m/s^2
    float dominant_hz;      // Mechanical (vibration path) dominant frequency
    bool has_frequency;
    float shimmer;
    float long_gradient;
};

/**
 * @brief Time-to-failure model interface
 */
class TtfModel {
public:
    virtual ~TtfModel() = default;

    virtual const char* name() const = 0;

    virtual FaultPrediction predict(const FaultInputs& inputs) const = 0;
};

/**
 * @class TieredDecayModel
 * @brief Amplitude tiers with exponential TTF decay
 *
 * - amplitude > high and dominant > cutoff: bearing / gear wear
 * - amplitude > high otherwise: structural imbalance
 * - amplitude > warning: loose mounts warning
 * - else healthy, no forecast
 */
class TieredDecayModel : public TtfModel {
public:
    explicit TieredDecayModel(const FaultConfig& config = DEFAULT_FAULT_CONFIG);

    const char* name() const override { return "tiered-decay"; }

    FaultPrediction predict(const FaultInputs& inputs) const override;

private:
    FaultConfig config_;
};

/**
 * @class GradientTrendModel
 * @brief ttf = ln(1 / shimmer) / (long_gradient * scale)
 *
 * Reports NO_FORECAST unless both shimmer and the long-term gradient
 * exceed trend_epsilon. Negative extrapolations clamp to 0.
 */
class GradientTrendModel : public TtfModel {
public:
    explicit GradientTrendModel(const FaultConfig& config = DEFAULT_FAULT_CONFIG);

    const char* name() const override { return "gradient-trend"; }

    FaultPrediction predict(const FaultInputs& inputs) const override;

private:
    FaultConfig config_;
};

/**
 * @brief Per-frame state tag, guards checked in this order:
 *
 * 1. severity >= 3 or shimmer > critical_shimmer -> CRITICAL
 * 2. primary spectrum valid with energy and entropy < tonal_entropy -> TONAL_DOMINANCE
 * 3. severity >= 1 -> DESCRIPTOR
 * 4. BASELINE
 */
EngineStateTag classifyEngineState(uint8_t severity, float shimmer,
                                   const SpectralSnapshot& primary,
                                   const FaultConfig& config);

}  // namespace pdi
