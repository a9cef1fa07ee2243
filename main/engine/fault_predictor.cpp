/**
 * @file fault_predictor.cpp
 * @brief TTF models and engine state classifier
 */

#include "fault_predictor.hpp"

#include <cmath>
#include <cstdio>

namespace pdi {

namespace {

FaultPrediction tierPrediction(FaultKind kind, const FaultTier& tier, float excess,
                               const char* label) {
    FaultPrediction p{};
    p.kind = kind;
    p.has_forecast = true;
    p.ttf_hours = tier.base_hours * expf(-tier.decay * excess);

    float boost = tier.confidence_slope * excess;
    p.confidence = tier.base_confidence + (boost < tier.confidence_cap ? boost : tier.confidence_cap);

    if (p.ttf_hours >= 48.0f) {
        snprintf(p.text, sizeof(p.text), "%s: ~%.1f days", label, p.ttf_hours / 24.0f);
    } else {
        snprintf(p.text, sizeof(p.text), "%s: ~%.1f h", label, p.ttf_hours);
    }
    return p;
}

}  // namespace

// ============================================================================
// TieredDecayModel
// ============================================================================

TieredDecayModel::TieredDecayModel(const FaultConfig& config)
    : config_(config)
{
}

FaultPrediction TieredDecayModel::predict(const FaultInputs& in) const {
    if (in.amplitude > config_.high_amplitude) {
        float excess = in.amplitude - config_.high_amplitude;
        if (in.has_frequency && in.dominant_hz > config_.bearing_cutoff_hz) {
            return tierPrediction(FaultKind::BEARING_WEAR, config_.bearing, excess, "Bearing wear");
        }
        return tierPrediction(FaultKind::IMBALANCE, config_.imbalance, excess, "Imbalance");
    }

    bool mechanical_band = in.has_frequency &&
                           in.dominant_hz >= config_.warning_low_hz &&
                           in.dominant_hz <= config_.warning_high_hz;
    if (in.amplitude > config_.warning_amplitude && mechanical_band) {
        float excess = in.amplitude - config_.warning_amplitude;
        return tierPrediction(FaultKind::WARNING_MOUNTS, config_.warning, excess, "Check mounts");
    }

    FaultPrediction p{};
    p.kind = FaultKind::HEALTHY;
    p.confidence = config_.healthy_confidence;
    p.has_forecast = false;
    snprintf(p.text, sizeof(p.text), "Healthy");
    return p;
}

// ============================================================================
// GradientTrendModel
// ============================================================================

GradientTrendModel::GradientTrendModel(const FaultConfig& config)
    : config_(config)
{
}

FaultPrediction GradientTrendModel::predict(const FaultInputs& in) const {
    FaultPrediction p{};

    if (in.shimmer <= config_.trend_epsilon || in.long_gradient <= config_.trend_epsilon) {
        p.kind = FaultKind::NO_FORECAST;
        p.has_forecast = false;
        snprintf(p.text, sizeof(p.text), "No forecast");
        return p;
    }

    float ttf = logf(1.0f / in.shimmer) / (in.long_gradient * config_.trend_hours_per_unit);
    if (ttf < 0.0f) ttf = 0.0f;

    p.kind = FaultKind::TREND;
    p.has_forecast = true;
    p.ttf_hours = ttf;
    // Reported at the warning tier base
    p.confidence = config_.warning.base_confidence;
    snprintf(p.text, sizeof(p.text), "Trend: ~%.1f h", ttf);
    return p;
}

// ============================================================================
// State classifier
// ============================================================================

EngineStateTag classifyEngineState(uint8_t severity, float shimmer,
                                   const SpectralSnapshot& primary,
                                   const FaultConfig& config) {
    if (severity >= 3 || shimmer > config.critical_shimmer) {
        return EngineStateTag::CRITICAL;
    }
    if (primary.valid && primary.total_energy > 0.0f && primary.entropy < config.tonal_entropy) {
        return EngineStateTag::TONAL_DOMINANCE;
    }
    if (severity >= 1) {
        return EngineStateTag::DESCRIPTOR;
    }
    return EngineStateTag::BASELINE;
}

}  // namespace pdi
