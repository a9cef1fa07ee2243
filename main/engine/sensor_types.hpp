/**
 * @file sensor_types.hpp
 * @brief Frame, snapshot and result types shared by every engine stage
 *
 * A SensorFrame goes into DiagnosticEngine::processFrame() once per
 * sensor callback and a DiagnosticResult comes out. Everything in this
 * header is plain data: no stage keeps pointers into a frame or result
 * beyond the call that received it.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cmath>

namespace pdi {  // Portable Diagnostic Instrument namespace

/// Standard gravity used for accelerometer zero correction (m/s^2)
constexpr float STANDARD_GRAVITY = 9.80665f;

/**
 * @brief Three-axis vector (accelerometer m/s^2, gyroscope rad/s)
 */
struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    float norm() const {
        return sqrtf(x * x + y * y + z * z);
    }
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) {
    return Vec3{a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Vec3 operator-(const Vec3& a, const Vec3& b) {
    return Vec3{a.x - b.x, a.y - b.y, a.z - b.z};
}

inline Vec3 operator*(const Vec3& v, float k) {
    return Vec3{v.x * k, v.y * k, v.z * k};
}

/**
 * @brief Display rotation reported by the host (screen orientation)
 */
enum class DisplayRotation : uint8_t {
    ROT_0   = 0,
    ROT_90  = 1,
    ROT_180 = 2,
    ROT_270 = 3
};

/**
 * @brief Sampling power state driven by the PowerController
 */
enum class EcoState : uint8_t {
    ACTIVE,     ///< Full sampling rate
    ECO,        ///< Reduced rate after inactivity timeout
    ULTRA_ECO   ///< Minimum rate, explicit override
};

/**
 * @brief ISO-10816 style vibration severity zone (proxy only)
 */
enum class IsoZone : uint8_t {
    A,  ///< Good
    B,  ///< Satisfactory
    C,  ///< Unsatisfactory
    D   ///< Unacceptable
};

/**
 * @brief Per-frame engine classification, ordered by escalating severity
 */
enum class EngineStateTag : uint8_t {
    BASELINE,
    DESCRIPTOR,
    TONAL_DOMINANCE,
    CRITICAL
};

/**
 * @brief Frequency label bands, evaluated top-down
 */
enum class FrequencyBand : uint8_t {
    UNLABELED,
    MAINS_50HZ,
    MAINS_60HZ,
    MOTOR_FAN,
    LOW_FREQUENCY   ///< Suspension / human motion
};

/**
 * @brief Light source classification from lux flicker statistics
 */
enum class LightSource : uint8_t {
    NONE,       ///< No lux sample observed yet
    DARK,
    NATURAL,
    GRID,
    ARTIFICIAL
};

/**
 * @brief What the acoustic stage did with this frame's audio input
 */
enum class AudioStatus : uint8_t {
    NONE,           ///< No audio seen yet, device not reported failing
    FRESH,          ///< A full buffer was processed this frame
    REUSED,         ///< No new buffer, previous reading retained
    SHORT_BUFFER,   ///< Buffer shorter than the FFT length, skipped
    UNAVAILABLE     ///< Capture device missing or denied
};

/**
 * @brief Fault model outcome families
 */
enum class FaultKind : uint8_t {
    HEALTHY,
    WARNING_MOUNTS,
    IMBALANCE,
    BEARING_WEAR,
    TREND,          ///< Gradient-trend forecast
    NO_FORECAST     ///< Trend model had nothing to extrapolate
};

/**
 * @brief One synchronous engine input
 *
 * pcm points at caller-owned int16 samples and is only read during
 * processFrame(); pass nullptr when no new audio buffer is available.
 */
struct SensorFrame {
    Vec3 accel{};                   ///< Raw accelerometer, m/s^2
    Vec3 gyro{};                    ///< Raw gyroscope, rad/s
    bool has_gyro = false;

    const int16_t* pcm = nullptr;   ///< Latest complete microphone block
    size_t pcm_len = 0;
    bool audio_device_ok = true;    ///< False when capture failed or was denied

    float lux = 0.0f;
    bool has_lux = false;

    DisplayRotation rotation = DisplayRotation::ROT_0;
    int64_t timestamp_ns = 0;       ///< Monotonic
    EcoState eco_state = EcoState::ACTIVE;
};

/**
 * @brief Result of one spectral analysis run
 */
struct SpectralSnapshot {
    bool valid = false;
    float dominant_hz = 0.0f;
    float peak_magnitude = 0.0f;
    float total_energy = 0.0f;      ///< Sum of magnitudes over bins 1..N/2-1
    float entropy = 0.0f;           ///< Normalized Shannon entropy [0, 1]
    FrequencyBand band = FrequencyBand::UNLABELED;
    float rpm = 0.0f;               ///< Shaft speed for MOTOR_FAN, else 0
    uint32_t fft_size = 0;
    float sample_rate_hz = 0.0f;
};

/**
 * @brief Heuristic fault / time-to-failure estimate
 */
struct FaultPrediction {
    FaultKind kind = FaultKind::HEALTHY;
    float confidence = 0.0f;
    float ttf_hours = 0.0f;
    bool has_forecast = false;      ///< False is the "no forecast" sentinel
    char text[64] = {};
};

/**
 * @brief Per-frame diagnostic snapshot
 */
struct DiagnosticResult {
    int64_t timestamp_ns = 0;
    uint32_t frame_index = 0;
    float real_hz = 0.0f;

    // Orientation
    float tilt_deg = 0.0f;
    float tilt_confidence_deg = 0.0f;
    float pitch_deg = 0.0f;
    float roll_deg = 0.0f;
    Vec3 gravity{};
    Vec3 linear_accel{};
    float angular_rate = 0.0f;      ///< |gyro - zero|, rad/s

    // Vibration
    float vibration_mag = 0.0f;
    float vibration_rms = 0.0f;
    float vibration_peak = 0.0f;
    float velocity_rms_mm_s = 0.0f;
    IsoZone iso_zone = IsoZone::A;
    uint8_t severity = 0;
    float shimmer = 0.0f;
    float gradient_short = 0.0f;
    float gradient_long = 0.0f;

    // Acoustic
    float dba = 0.0f;
    float dba_uncertainty = 0.0f;
    AudioStatus audio_status = AudioStatus::NONE;

    // Photonic
    float lux = 0.0f;
    float flicker_index = 0.0f;
    LightSource light_source = LightSource::NONE;

    // Spectral (primary snapshot plus both paths)
    float dominant_hz = 0.0f;
    FrequencyBand freq_label = FrequencyBand::UNLABELED;
    float spectral_entropy = 0.0f;
    SpectralSnapshot vibration_spectrum{};
    SpectralSnapshot acoustic_spectrum{};

    FaultPrediction fault{};
    EngineStateTag state = EngineStateTag::BASELINE;
    bool warm_sensor = false;
};

// ============================================================================
// String helpers
// ============================================================================

inline const char* toString(IsoZone zone) {
    switch (zone) {
        case IsoZone::A: return "A";
        case IsoZone::B: return "B";
        case IsoZone::C: return "C";
        case IsoZone::D: return "D";
        default:         return "?";
    }
}

inline const char* toString(EngineStateTag tag) {
    switch (tag) {
        case EngineStateTag::BASELINE:        return "Baseline";
        case EngineStateTag::DESCRIPTOR:      return "Descriptor";
        case EngineStateTag::TONAL_DOMINANCE: return "TonalDominance";
        case EngineStateTag::CRITICAL:        return "Critical";
        default:                              return "Unknown";
    }
}

inline const char* toString(EcoState state) {
    switch (state) {
        case EcoState::ACTIVE:    return "Active";
        case EcoState::ECO:       return "Eco";
        case EcoState::ULTRA_ECO: return "UltraEco";
        default:                  return "Unknown";
    }
}

inline const char* toString(FrequencyBand band) {
    switch (band) {
        case FrequencyBand::MAINS_50HZ:    return "Electrical Mains (50Hz)";
        case FrequencyBand::MAINS_60HZ:    return "Electrical Mains (60Hz)";
        case FrequencyBand::MOTOR_FAN:     return "Motor/Fan";
        case FrequencyBand::LOW_FREQUENCY: return "Suspension/Human";
        case FrequencyBand::UNLABELED:
        default:                           return "Unlabeled";
    }
}

inline const char* toString(LightSource source) {
    switch (source) {
        case LightSource::DARK:       return "Dark";
        case LightSource::NATURAL:    return "Natural";
        case LightSource::GRID:       return "Grid";
        case LightSource::ARTIFICIAL: return "Artificial";
        case LightSource::NONE:
        default:                      return "None";
    }
}

inline const char* toString(AudioStatus status) {
    switch (status) {
        case AudioStatus::FRESH:        return "Fresh";
        case AudioStatus::REUSED:       return "Reused";
        case AudioStatus::SHORT_BUFFER: return "ShortBuffer";
        case AudioStatus::UNAVAILABLE:  return "Unavailable";
        case AudioStatus::NONE:
        default:                        return "None";
    }
}

inline const char* toString(FaultKind kind) {
    switch (kind) {
        case FaultKind::HEALTHY:        return "Healthy";
        case FaultKind::WARNING_MOUNTS: return "WarningMounts";
        case FaultKind::IMBALANCE:      return "Imbalance";
        case FaultKind::BEARING_WEAR:   return "BearingWear";
        case FaultKind::TREND:          return "Trend";
        case FaultKind::NO_FORECAST:    return "NoForecast";
        default:                        return "Unknown";
    }
}

}  // namespace pdi
