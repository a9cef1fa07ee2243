/**
 * @file diagnostic_engine.hpp
 * @brief Per-frame sensor fusion and diagnostics
 *
 * Stage order inside processFrame():
 *   calibration snapshot -> sample rate -> orientation -> vibration
 *   -> vibration spectrum (duty cycled) -> acoustic level + spectrum
 *   -> photonic -> fault model -> state tag
 *
 * The engine performs no I/O and holds no lock of its own: call
 * processFrame() from one task only. Calibration entry points may be
 * called from any task; they go through CalibrationChannel and take
 * effect on the next frame.
 */

#pragma once

#include "sensor_types.hpp"
#include "engine_config.hpp"
#include "ring_buffer.hpp"
#include "calibration.hpp"
#include "orientation_fuser.hpp"
#include "vibration_analyzer.hpp"
#include "photonic_analyzer.hpp"
#include "fault_predictor.hpp"
#include "../dsp/spectral_analyzer.hpp"
#include "../dsp/acoustic_meter.hpp"

#include "esp_err.h"

namespace pdi {

/**
 * @brief Measured frame rate from timestamp deltas
 */
struct RateState {
    RingBuffer rates;
    int64_t last_timestamp_ns;
    bool has_timestamp;
};

/**
 * @brief Last spectra and duty cycle countdowns
 */
struct SpectralState {
    SpectralSnapshot vibration;
    SpectralSnapshot acoustic;
    uint32_t vibration_countdown;   // Frames until the vibration FFT may run
    uint32_t acoustic_countdown;
};

/**
 * @brief All mutable engine state, owned by one DiagnosticEngine
 */
struct EngineContext {
    OrientationState orientation;
    VibrationState vibration;
    AcousticState acoustic;
    PhotonicState photonic;
    RateState rate;
    SpectralState spectral;

    AudioStatus audio_status;
    EngineStateTag last_state;
    uint32_t frame_index;

    int64_t active_since_ns;        // Start of the current Active stretch
    bool active_tracked;
};

/**
 * @class DiagnosticEngine
 * @brief Synchronous frame transform from SensorFrame to DiagnosticResult
 */
class DiagnosticEngine {
public:
    explicit DiagnosticEngine(const EngineConfig& config = DEFAULT_ENGINE_CONFIG);
    ~DiagnosticEngine();

    // Prevent copying
    DiagnosticEngine(const DiagnosticEngine&) = delete;
    DiagnosticEngine& operator=(const DiagnosticEngine&) = delete;

    /**
     * @brief Validate config, allocate rings and FFT buffers
     * @return ESP_OK, ESP_ERR_INVALID_ARG or ESP_ERR_NO_MEM
     */
    esp_err_t init();

    /**
     * @brief Process one frame
     *
     * Audio problems and missing inputs are reported in result fields,
     * not as errors.
     *
     * @return ESP_OK, or ESP_ERR_INVALID_STATE before init()
     */
    esp_err_t processFrame(const SensorFrame& frame, DiagnosticResult& result);

    /**
     * @brief Replace accel/gyro zero offsets and the SPL offset
     */
    void setCalibration(const Vec3& accel_zero, const Vec3& gyro_zero, float spl_offset_db);

    /**
     * @brief Replace the accelerometer zero, keeping gyro zero and SPL offset
     */
    void setAccelZero(const Vec3& accel_zero);

    /**
     * @brief Take the next frame's pitch/roll as level
     */
    void zeroTilt();

    /**
     * @brief Shift the SPL offset so the current reading equals target_db
     *
     * Resolved on the next frame that has an acoustic reading.
     */
    void setReferenceLevel(float target_db);

    /**
     * @brief Install a TTF model (not owned), nullptr restores the configured one
     */
    void setFaultModel(TtfModel* model);

    /**
     * @brief Clear all history and calibration, keep allocations
     */
    esp_err_t reset();

    const EngineContext& context() const { return context_; }
    const EngineConfig& config() const { return config_; }
    CalibrationProfile calibration() const { return calibration_.profile(); }
    const TtfModel& faultModel() const { return *model_; }
    bool isInitialized() const { return is_initialized_; }

private:
    static constexpr const char* TAG = "Engine";

    EngineConfig config_;

    CalibrationChannel calibration_;
    OrientationFuser fuser_;
    VibrationAnalyzer vibration_;
    SpectralAnalyzer vibration_spectrum_;
    SpectralAnalyzer audio_spectrum_;
    AcousticMeter meter_;
    PhotonicAnalyzer photonic_;
    TieredDecayModel tiered_model_;
    GradientTrendModel trend_model_;
    TtfModel* model_;

    EngineContext context_;
    float* vibration_frame_;    // Ring copy handed to the FFT

    bool is_initialized_;

    esp_err_t initContext();
    TtfModel* configuredModel();
    float updateRate(int64_t timestamp_ns);
    void runVibrationSpectrum(EcoState eco_state, float real_hz);
    void runAcoustic(const SensorFrame& frame, float spl_offset_db, float shimmer);
    void resolveReferenceLevel(const CalibrationRequests& requests, float measured_offset_db);
    bool updateWarmSensor(const SensorFrame& frame);
};

}  // namespace pdi
