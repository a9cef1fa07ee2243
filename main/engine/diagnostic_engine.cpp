/**
 * @file diagnostic_engine.cpp
 * @brief DiagnosticEngine implementation
 */

#include "diagnostic_engine.hpp"

#include "esp_log.h"
#include <cstdlib>

namespace pdi {

DiagnosticEngine::DiagnosticEngine(const EngineConfig& config)
    : config_(config)
    , fuser_(config.orientation)
    , vibration_(config.vibration)
    , vibration_spectrum_(config.spectral.vibration_fft_size, config.spectral)
    , audio_spectrum_(config.spectral.audio_fft_size, config.spectral)
    , meter_(config.acoustic)
    , photonic_(config.photonic, config.spectral)
    , tiered_model_(config.fault)
    , trend_model_(config.fault)
    , model_(nullptr)
    , context_{}
    , vibration_frame_(nullptr)
    , is_initialized_(false)
{
    model_ = configuredModel();
}

DiagnosticEngine::~DiagnosticEngine() {
    if (vibration_frame_) free(vibration_frame_);
}

TtfModel* DiagnosticEngine::configuredModel() {
    if (config_.fault.model == FaultModelKind::GRADIENT_TREND) {
        return &trend_model_;
    }
    return &tiered_model_;
}

esp_err_t DiagnosticEngine::init() {
    if (is_initialized_) {
        return ESP_OK;
    }

    ESP_LOGI(TAG, "Initializing diagnostic engine");

    esp_err_t ret = validateConfig(config_);
    if (ret != ESP_OK) {
        return ret;
    }

    ret = calibration_.init(config_.acoustic.default_spl_offset_db);
    if (ret != ESP_OK) {
        return ret;
    }

    ret = vibration_spectrum_.init();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Vibration spectrum init failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = audio_spectrum_.init();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Audio spectrum init failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = meter_.init();
    if (ret != ESP_OK) {
        return ret;
    }

    // Kept across a retried init()
    if (!vibration_frame_) {
        vibration_frame_ = static_cast<float*>(
            malloc(config_.vibration.vibration_window * sizeof(float)));
    }
    if (!vibration_frame_) {
        ESP_LOGE(TAG, "Failed to allocate vibration frame buffer");
        return ESP_ERR_NO_MEM;
    }

    ret = initContext();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Context allocation failed: %s", esp_err_to_name(ret));
        return ret;
    }

    is_initialized_ = true;

    ESP_LOGI(TAG, "  Rings: tilt=%u raw=%u vib=%u dB=%u lux=%u rate=%u",
             static_cast<unsigned>(config_.orientation.tilt_history),
             static_cast<unsigned>(config_.vibration.raw_window),
             static_cast<unsigned>(config_.vibration.vibration_window),
             static_cast<unsigned>(config_.acoustic.db_history),
             static_cast<unsigned>(config_.photonic.lux_history),
             static_cast<unsigned>(config_.spectral.rate_history));
    ESP_LOGI(TAG, "  FFT: vibration N=%u, audio N=%u, every %u frames",
             static_cast<unsigned>(config_.spectral.vibration_fft_size),
             static_cast<unsigned>(config_.spectral.audio_fft_size),
             static_cast<unsigned>(config_.spectral.duty_cycle_frames));
    ESP_LOGI(TAG, "  Fault model: %s", model_->name());

    return ESP_OK;
}

esp_err_t DiagnosticEngine::initContext() {
    EngineContext& ctx = context_;

    esp_err_t ret = fuser_.initState(ctx.orientation);
    if (ret != ESP_OK) return ret;

    ret = vibration_.initState(ctx.vibration);
    if (ret != ESP_OK) return ret;

    ret = meter_.initState(ctx.acoustic);
    if (ret != ESP_OK) return ret;

    ret = photonic_.initState(ctx.photonic);
    if (ret != ESP_OK) return ret;

    ret = ctx.rate.rates.init(config_.spectral.rate_history);
    if (ret != ESP_OK) return ret;
    ctx.rate.last_timestamp_ns = 0;
    ctx.rate.has_timestamp = false;

    ctx.spectral = SpectralState{};
    ctx.audio_status = AudioStatus::NONE;
    ctx.last_state = EngineStateTag::BASELINE;
    ctx.frame_index = 0;
    ctx.active_since_ns = 0;
    ctx.active_tracked = false;

    return ESP_OK;
}

esp_err_t DiagnosticEngine::reset() {
    if (!is_initialized_) {
        return ESP_ERR_INVALID_STATE;
    }

    calibration_.reset();
    model_ = configuredModel();

    esp_err_t ret = initContext();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Reset failed: %s", esp_err_to_name(ret));
        is_initialized_ = false;
        return ret;
    }

    ESP_LOGI(TAG, "Engine reset");
    return ESP_OK;
}

void DiagnosticEngine::setCalibration(const Vec3& accel_zero, const Vec3& gyro_zero,
                                      float spl_offset_db) {
    calibration_.setCalibration(accel_zero, gyro_zero, spl_offset_db);
}

void DiagnosticEngine::setAccelZero(const Vec3& accel_zero) {
    calibration_.setAccelZero(accel_zero);
}

void DiagnosticEngine::zeroTilt() {
    calibration_.requestTiltZero();
}

void DiagnosticEngine::setReferenceLevel(float target_db) {
    calibration_.requestReferenceLevel(target_db);
}

void DiagnosticEngine::setFaultModel(TtfModel* model) {
    model_ = model ? model : configuredModel();
    ESP_LOGI(TAG, "Fault model: %s", model_->name());
}

// ============================================================================
// Frame processing
// ============================================================================

esp_err_t DiagnosticEngine::processFrame(const SensorFrame& frame, DiagnosticResult& result) {
    if (!is_initialized_) {
        ESP_LOGE(TAG, "processFrame before init");
        return ESP_ERR_INVALID_STATE;
    }

    EngineContext& ctx = context_;
    DiagnosticResult r{};
    r.timestamp_ns = frame.timestamp_ns;
    r.frame_index = ctx.frame_index++;

    CalibrationProfile profile;
    CalibrationRequests requests;
    calibration_.snapshot(profile, requests);

    r.real_hz = updateRate(frame.timestamp_ns);

    // Orientation
    OrientationSample o = fuser_.update(frame.accel, frame.rotation, profile,
                                        requests.zero_tilt, ctx.orientation);
    if (o.tilt_zeroed) {
        calibration_.commitTiltZero(profile.pitch_zero_deg, profile.roll_zero_deg);
    }
    r.tilt_deg = o.tilt_deg;
    r.tilt_confidence_deg = o.tilt_confidence_deg;
    r.pitch_deg = o.pitch_deg;
    r.roll_deg = o.roll_deg;
    r.gravity = o.gravity;
    r.linear_accel = o.linear;

    if (frame.has_gyro) {
        r.angular_rate = (frame.gyro - profile.gyro_zero).norm();
    }

    // Vibration
    VibrationMetrics v = vibration_.update(o.calibrated, o.linear, ctx.vibration);
    r.vibration_mag = v.vibration_mag;
    r.vibration_rms = v.rms;
    r.vibration_peak = v.peak;
    r.velocity_rms_mm_s = v.velocity_rms;
    r.iso_zone = v.grade.zone;
    r.severity = v.grade.severity;
    r.shimmer = v.shimmer;
    r.gradient_short = v.gradient_short;
    r.gradient_long = v.gradient_long;

    runVibrationSpectrum(frame.eco_state, r.real_hz);

    // Acoustic
    runAcoustic(frame, profile.spl_offset_db, v.shimmer);
    if (requests.reference_level) {
        resolveReferenceLevel(requests, profile.spl_offset_db);
    }
    r.dba = ctx.acoustic.dba;
    r.dba_uncertainty = ctx.acoustic.uncertainty_db;
    r.audio_status = ctx.audio_status;

    r.vibration_spectrum = ctx.spectral.vibration;
    r.acoustic_spectrum = ctx.spectral.acoustic;
    const SpectralSnapshot& primary = ctx.spectral.acoustic.valid
        ? ctx.spectral.acoustic : ctx.spectral.vibration;
    r.dominant_hz = primary.dominant_hz;
    r.freq_label = primary.band;
    r.spectral_entropy = primary.entropy;

    // Photonic
    if (frame.has_lux) {
        PhotonicReading p = photonic_.update(frame.lux, primary.dominant_hz, primary.valid,
                                             ctx.photonic);
        r.lux = p.lux;
    } else {
        r.lux = static_cast<float>(ctx.photonic.lux_history.newest());
    }
    r.flicker_index = ctx.photonic.flicker_index;
    r.light_source = ctx.photonic.source;

    // Fault and state
    FaultInputs inputs{};
    inputs.amplitude = v.rms;
    inputs.dominant_hz = ctx.spectral.vibration.dominant_hz;
    inputs.has_frequency = ctx.spectral.vibration.valid;
    inputs.shimmer = v.shimmer;
    inputs.long_gradient = v.gradient_long;
    r.fault = model_->predict(inputs);

    r.state = classifyEngineState(r.severity, r.shimmer, primary, config_.fault);
    if (r.state != ctx.last_state) {
        ESP_LOGI(TAG, "State %s -> %s (zone %s, shimmer %.3f, entropy %.3f)",
                 toString(ctx.last_state), toString(r.state), toString(r.iso_zone),
                 r.shimmer, r.spectral_entropy);
        ctx.last_state = r.state;
    }

    r.warm_sensor = updateWarmSensor(frame);

    result = r;
    return ESP_OK;
}

float DiagnosticEngine::updateRate(int64_t timestamp_ns) {
    RateState& rate = context_.rate;

    if (rate.has_timestamp) {
        int64_t dt = timestamp_ns - rate.last_timestamp_ns;
        if (dt > 0) {
            rate.rates.push(1e9 / static_cast<double>(dt));
        }
    }
    rate.last_timestamp_ns = timestamp_ns;
    rate.has_timestamp = true;

    return static_cast<float>(rate.rates.mean());
}

void DiagnosticEngine::runVibrationSpectrum(EcoState eco_state, float real_hz) {
    SpectralState& spectral = context_.spectral;

    if (spectral.vibration_countdown > 0) {
        spectral.vibration_countdown--;
        return;
    }

    // Suspended in Eco/UltraEco, waits for a full window
    if (eco_state != EcoState::ACTIVE || !context_.vibration.vibration_window.isFull()) {
        return;
    }

    const float fs = context_.rate.rates.isFull()
        ? real_hz : config_.spectral.nominal_vibration_rate_hz;

    const RingBuffer& ring = context_.vibration.vibration_window;
    ring.copyTo(vibration_frame_);

    SpectralSnapshot snapshot;
    esp_err_t ret = vibration_spectrum_.analyze(vibration_frame_, ring.size(), fs, snapshot);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Vibration spectrum skipped: %s", esp_err_to_name(ret));
        return;
    }

    spectral.vibration = snapshot;
    spectral.vibration_countdown = config_.spectral.duty_cycle_frames - 1;
}

void DiagnosticEngine::runAcoustic(const SensorFrame& frame, float spl_offset_db, float shimmer) {
    EngineContext& ctx = context_;
    SpectralState& spectral = ctx.spectral;
    AudioStatus status;

    // Due once the countdown has run out; stays due until a full block arrives
    const bool spectrum_due = spectral.acoustic_countdown == 0;
    if (spectral.acoustic_countdown > 0) {
        spectral.acoustic_countdown--;
    }

    if (!frame.audio_device_ok) {
        status = AudioStatus::UNAVAILABLE;
    } else if (!frame.pcm || frame.pcm_len == 0) {
        status = ctx.acoustic.has_reading ? AudioStatus::REUSED : AudioStatus::NONE;
    } else {
        meter_.measure(frame.pcm, frame.pcm_len, spl_offset_db, shimmer, ctx.acoustic);

        if (frame.pcm_len < config_.spectral.audio_fft_size) {
            status = AudioStatus::SHORT_BUFFER;
        } else {
            status = AudioStatus::FRESH;
            if (spectrum_due) {
                SpectralSnapshot snapshot;
                esp_err_t ret = audio_spectrum_.analyzePcm(
                    frame.pcm, frame.pcm_len,
                    static_cast<float>(config_.acoustic.sample_rate_hz), snapshot);
                if (ret == ESP_OK) {
                    spectral.acoustic = snapshot;
                    spectral.acoustic_countdown = config_.spectral.duty_cycle_frames - 1;
                } else {
                    ESP_LOGW(TAG, "Audio spectrum skipped: %s", esp_err_to_name(ret));
                }
            }
        }
    }

    if (status != ctx.audio_status) {
        if (status == AudioStatus::UNAVAILABLE) {
            ESP_LOGW(TAG, "Audio unavailable, holding last level %.1f dBA", ctx.acoustic.dba);
        } else if (status == AudioStatus::SHORT_BUFFER) {
            ESP_LOGW(TAG, "Audio block of %u samples shorter than N=%u",
                     static_cast<unsigned>(frame.pcm_len),
                     static_cast<unsigned>(config_.spectral.audio_fft_size));
        } else if (ctx.audio_status == AudioStatus::UNAVAILABLE) {
            ESP_LOGI(TAG, "Audio available again");
        }
        ctx.audio_status = status;
    }
}

void DiagnosticEngine::resolveReferenceLevel(const CalibrationRequests& requests,
                                             float measured_offset_db) {
    AcousticState& acoustic = context_.acoustic;

    // A silent block reads exactly 0 dBA and cannot anchor an offset
    if (!acoustic.has_reading || acoustic.dba == 0.0f) {
        calibration_.restoreReferenceRequest(requests.reference_target_db);
        return;
    }

    float offset = AcousticMeter::referenceOffset(requests.reference_target_db,
                                                  acoustic.dba, acoustic.offset_db);
    if (!calibration_.commitSplOffset(measured_offset_db, offset)) {
        calibration_.restoreReferenceRequest(requests.reference_target_db);
        return;
    }
    meter_.applyOffsetChange(offset, acoustic);
}

bool DiagnosticEngine::updateWarmSensor(const SensorFrame& frame) {
    EngineContext& ctx = context_;

    if (frame.eco_state != EcoState::ACTIVE) {
        ctx.active_tracked = false;
        return false;
    }

    if (!ctx.active_tracked) {
        ctx.active_since_ns = frame.timestamp_ns;
        ctx.active_tracked = true;
    }
    return frame.timestamp_ns - ctx.active_since_ns >= config_.warm_sensor_after_ns;
}

}  // namespace pdi
