/**
 * @file spectral_analyzer.hpp
 * @brief Windowed FFT spectrum: dominant frequency, entropy and band label
 *
 * One instance per signal path (vibration magnitude ring, microphone
 * block). Each instance owns its buffers; the twiddle table is shared
 * through fft_engine.
 *
 * Memory:
 * - All buffers are allocated in init()
 * - analyze() does no allocation
 */

#pragma once

#include "fft_engine.hpp"
#include "../engine/sensor_types.hpp"
#include "../engine/engine_config.hpp"

#include "esp_log.h"
#include "esp_err.h"
#include "esp_dsp.h"
#include <cstdint>
#include <cstdlib>
#include <cmath>

namespace pdi {

/**
 * @class SpectralAnalyzer
 * @brief Single-frame spectrum analysis on esp-dsp
 *
 * The input frame has its mean removed and a Hann window applied before
 * the transform. Bins 1..N/2-1 take part in the peak search and the
 * entropy; DC and Nyquist are excluded.
 */
class SpectralAnalyzer {
public:
    /**
     * @param fft_size Transform length (power of two)
     * @param config Band edges for labelling
     */
    SpectralAnalyzer(size_t fft_size, const SpectralConfig& config = DEFAULT_SPECTRAL_CONFIG);

    ~SpectralAnalyzer();

    // Prevent copying
    SpectralAnalyzer(const SpectralAnalyzer&) = delete;
    SpectralAnalyzer& operator=(const SpectralAnalyzer&) = delete;

    /**
     * @brief Build the FFT table and allocate buffers
     * @return ESP_OK on success
     */
    esp_err_t init();

    /**
     * @brief Analyze the newest fft_size samples of a float block
     *
     * @param samples Input block, oldest first
     * @param count Samples in block, must be >= fft_size
     * @param sample_rate_hz Rate the block was sampled at
     * @param out Snapshot filled on success
     * @return ESP_ERR_INVALID_SIZE when count < fft_size
     */
    esp_err_t analyze(const float* samples, size_t count, float sample_rate_hz,
                      SpectralSnapshot& out);

    /**
     * @brief Same as analyze() for int16 PCM, normalized to [-1, 1)
     */
    esp_err_t analyzePcm(const int16_t* pcm, size_t count, float sample_rate_hz,
                         SpectralSnapshot& out);

    /**
     * @brief Normalized Shannon entropy of bins 1..num_bins-1
     *
     * p_k = m_k / sum(m), H = -sum(p ln p) / ln(fft_size / 2).
     * Returns 0 when the magnitudes sum to 0.
     */
    static float spectralEntropy(const float* magnitudes, size_t num_bins, size_t fft_size);

    /**
     * @brief Fractional peak position from a parabola through the log
     *        magnitudes of the peak bin and its neighbours
     *
     * Resolves mains hum on a 1024-point 16 kHz spectrum, where the bins
     * are 15.6 Hz apart. Returns peak_bin unchanged at the edges or when
     * a neighbour is zero.
     */
    static float refinePeakBin(const float* magnitudes, size_t num_bins, size_t peak_bin);

    /**
     * @brief First matching band, checked mains 50, mains 60, motor, low
     */
    static FrequencyBand labelFrequency(float hz, const SpectralConfig& config);

    /// Magnitudes of the last analysis, getNumBins() values
    const float* magnitudes() const { return magnitude_; }

    size_t getNumBins() const { return fft_size_ / 2; }
    size_t getFftSize() const { return fft_size_; }

private:
    static constexpr const char* TAG = "Spectral";

    size_t fft_size_;
    SpectralConfig config_;

    float* fft_input_;      // Interleaved complex, fft_size * 2
    float* window_;         // Hann coefficients
    float* frame_buffer_;   // Detrended time-domain frame
    float* magnitude_;      // fft_size / 2 bins

    bool is_initialized_;

    esp_err_t transformFrame(float sample_rate_hz, SpectralSnapshot& out);
};

// ============================================================================
// Implementation
// ============================================================================

inline SpectralAnalyzer::SpectralAnalyzer(size_t fft_size, const SpectralConfig& config)
    : fft_size_(fft_size)
    , config_(config)
    , fft_input_(nullptr)
    , window_(nullptr)
    , frame_buffer_(nullptr)
    , magnitude_(nullptr)
    , is_initialized_(false)
{
}

inline SpectralAnalyzer::~SpectralAnalyzer() {
    if (fft_input_) free(fft_input_);
    if (window_) free(window_);
    if (frame_buffer_) free(frame_buffer_);
    if (magnitude_) free(magnitude_);
}

inline esp_err_t SpectralAnalyzer::init() {
    if (is_initialized_) {
        return ESP_OK;
    }

    esp_err_t ret = fftInit(fft_size_);
    if (ret != ESP_OK) {
        return ret;
    }

    // A retried init() keeps whatever was allocated before the failure
    if (!fft_input_) fft_input_ = static_cast<float*>(malloc(fft_size_ * 2 * sizeof(float)));
    if (!window_) window_ = static_cast<float*>(malloc(fft_size_ * sizeof(float)));
    if (!frame_buffer_) frame_buffer_ = static_cast<float*>(malloc(fft_size_ * sizeof(float)));
    if (!magnitude_) magnitude_ = static_cast<float*>(calloc(fft_size_ / 2, sizeof(float)));
    if (!fft_input_ || !window_ || !frame_buffer_ || !magnitude_) {
        ESP_LOGE(TAG, "Failed to allocate buffers for N=%u", static_cast<unsigned>(fft_size_));
        return ESP_ERR_NO_MEM;
    }

    dsps_wind_hann_f32(window_, static_cast<int>(fft_size_));

    is_initialized_ = true;
    ESP_LOGI(TAG, "Spectral analyzer ready: N=%u, %u bins",
             static_cast<unsigned>(fft_size_), static_cast<unsigned>(getNumBins()));
    return ESP_OK;
}

inline esp_err_t SpectralAnalyzer::analyze(const float* samples, size_t count,
                                           float sample_rate_hz, SpectralSnapshot& out) {
    if (!is_initialized_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (count < fft_size_) {
        return ESP_ERR_INVALID_SIZE;
    }

    const float* frame = samples + (count - fft_size_);
    for (size_t i = 0; i < fft_size_; i++) {
        frame_buffer_[i] = frame[i];
    }
    return transformFrame(sample_rate_hz, out);
}

inline esp_err_t SpectralAnalyzer::analyzePcm(const int16_t* pcm, size_t count,
                                              float sample_rate_hz, SpectralSnapshot& out) {
    if (!is_initialized_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (count < fft_size_) {
        return ESP_ERR_INVALID_SIZE;
    }

    const int16_t* frame = pcm + (count - fft_size_);
    for (size_t i = 0; i < fft_size_; i++) {
        frame_buffer_[i] = static_cast<float>(frame[i]) / 32768.0f;
    }
    return transformFrame(sample_rate_hz, out);
}

inline esp_err_t SpectralAnalyzer::transformFrame(float sample_rate_hz, SpectralSnapshot& out) {
    // Remove DC so the window does not smear it into the low bins
    float mean = 0.0f;
    for (size_t i = 0; i < fft_size_; i++) {
        mean += frame_buffer_[i];
    }
    mean /= static_cast<float>(fft_size_);

    for (size_t i = 0; i < fft_size_; i++) {
        fft_input_[i * 2] = (frame_buffer_[i] - mean) * window_[i];
        fft_input_[i * 2 + 1] = 0.0f;
    }

    esp_err_t ret = fftForward(fft_input_, fft_size_);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "FFT failed: %s", esp_err_to_name(ret));
        return ret;
    }

    const size_t num_bins = getNumBins();
    for (size_t i = 0; i < num_bins; i++) {
        float re = fft_input_[i * 2];
        float im = fft_input_[i * 2 + 1];
        magnitude_[i] = sqrtf(re * re + im * im);
    }

    size_t peak_bin = 0;
    float peak = 0.0f;
    float total = 0.0f;
    for (size_t i = 1; i < num_bins; i++) {
        total += magnitude_[i];
        if (magnitude_[i] > peak) {
            peak = magnitude_[i];
            peak_bin = i;
        }
    }

    out = SpectralSnapshot{};
    out.valid = true;
    out.fft_size = static_cast<uint32_t>(fft_size_);
    out.sample_rate_hz = sample_rate_hz;
    out.total_energy = total;
    out.peak_magnitude = peak;
    out.dominant_hz = refinePeakBin(magnitude_, num_bins, peak_bin)
                      * sample_rate_hz / static_cast<float>(fft_size_);
    out.entropy = spectralEntropy(magnitude_, num_bins, fft_size_);
    out.band = labelFrequency(out.dominant_hz, config_);
    if (out.band == FrequencyBand::MOTOR_FAN) {
        out.rpm = out.dominant_hz * 60.0f;
    }

    ESP_LOGD(TAG, "N=%u dominant=%.2f Hz (%s) entropy=%.3f",
             static_cast<unsigned>(fft_size_), out.dominant_hz, toString(out.band), out.entropy);
    return ESP_OK;
}

inline float SpectralAnalyzer::refinePeakBin(const float* magnitudes, size_t num_bins,
                                             size_t peak_bin) {
    if (peak_bin < 1 || peak_bin + 1 >= num_bins) {
        return static_cast<float>(peak_bin);
    }

    float left = magnitudes[peak_bin - 1];
    float centre = magnitudes[peak_bin];
    float right = magnitudes[peak_bin + 1];
    if (left <= 0.0f || centre <= 0.0f || right <= 0.0f) {
        return static_cast<float>(peak_bin);
    }

    float a = logf(left);
    float b = logf(centre);
    float c = logf(right);
    float denom = a - 2.0f * b + c;
    if (denom >= 0.0f) {
        return static_cast<float>(peak_bin);
    }

    float delta = 0.5f * (a - c) / denom;
    if (delta > 0.5f) delta = 0.5f;
    if (delta < -0.5f) delta = -0.5f;
    return static_cast<float>(peak_bin) + delta;
}

inline float SpectralAnalyzer::spectralEntropy(const float* magnitudes, size_t num_bins,
                                               size_t fft_size) {
    float total = 0.0f;
    for (size_t i = 1; i < num_bins; i++) {
        total += magnitudes[i];
    }
    if (total <= 0.0f || fft_size < 4) {
        return 0.0f;
    }

    float h = 0.0f;
    for (size_t i = 1; i < num_bins; i++) {
        float p = magnitudes[i] / total;
        if (p > 0.0f) {
            h -= p * logf(p);
        }
    }

    float normalized = h / logf(static_cast<float>(fft_size / 2));
    if (normalized < 0.0f) normalized = 0.0f;
    if (normalized > 1.0f) normalized = 1.0f;
    return normalized;
}

inline FrequencyBand SpectralAnalyzer::labelFrequency(float hz, const SpectralConfig& config) {
    if (hz >= config.mains_50_low_hz && hz <= config.mains_50_high_hz) {
        return FrequencyBand::MAINS_50HZ;
    }
    if (hz >= config.mains_60_low_hz && hz <= config.mains_60_high_hz) {
        return FrequencyBand::MAINS_60HZ;
    }
    if (hz >= config.motor_low_hz && hz <= config.motor_high_hz) {
        return FrequencyBand::MOTOR_FAN;
    }
    if (hz > 0.0f && hz < config.low_frequency_max_hz) {
        return FrequencyBand::LOW_FREQUENCY;
    }
    return FrequencyBand::UNLABELED;
}

}  // namespace pdi
