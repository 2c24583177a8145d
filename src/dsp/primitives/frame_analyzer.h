// ==============================================================================
// Layer 1: DSP Primitive - Overlapped Frame Analyzer
// ==============================================================================
// Offline short-time analysis of a complete clip: slices the signal into
// Hann-windowed, overlapping frames, transforms each, and averages the magnitude
// spectra into one long-term spectrum.
//
// Frames advance by the hop until one reaches the end of the clip, so every
// sample lands in at least one frame. The last frame (or the only one, for a
// clip shorter than a frame) is zero-padded.
// Analysis checks the stop token between frames; a stopped analysis leaves the
// output untouched.
// ==============================================================================

#pragma once

#include "fft.h"
#include "../core/window_functions.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stop_token>
#include <vector>

namespace VoiceShaper::DSP {

/// @brief Result of a frame-averaging pass
enum class FrameAnalysisStatus : uint8_t {
    Complete,
    Cancelled,
    NotPrepared
};

// =============================================================================
// FrameAnalyzer Class
// =============================================================================

class FrameAnalyzer {
public:
    FrameAnalyzer() noexcept = default;

    // Non-copyable, movable
    FrameAnalyzer(const FrameAnalyzer&) = delete;
    FrameAnalyzer& operator=(const FrameAnalyzer&) = delete;
    FrameAnalyzer(FrameAnalyzer&&) noexcept = default;
    FrameAnalyzer& operator=(FrameAnalyzer&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare analyzer
    /// @param fftSize Frame length (power of 2, 256-8192)
    /// @param hopSize Frame advance in samples, 0 < hopSize <= fftSize
    /// @return false when either size is unsupported
    bool prepare(size_t fftSize, size_t hopSize) {
        fftSize_ = 0;
        if (hopSize == 0 || hopSize > fftSize || !fft_.prepare(fftSize)) {
            return false;
        }

        fftSize_ = fftSize;
        hopSize_ = hopSize;
        window_ = Window::hann(fftSize);
        windowedFrame_.assign(fftSize, 0.0f);
        frameMagnitudes_.assign(fft_.numBins(), 0.0f);
        return true;
    }

    // -------------------------------------------------------------------------
    // Analysis
    // -------------------------------------------------------------------------

    /// @brief Average the magnitude spectra of all frames of a clip
    /// @param samples Mono samples
    /// @param count Number of samples (0 yields one silent frame)
    /// @param meanMagnitudes Receives numBins() averaged magnitudes
    /// @param stop Checked between frames
    FrameAnalysisStatus averageMagnitudes(const float* samples,
                                          size_t count,
                                          std::vector<float>& meanMagnitudes,
                                          std::stop_token stop = {}) {
        if (!isPrepared()) return FrameAnalysisStatus::NotPrepared;
        if (samples == nullptr) count = 0;

        std::vector<double> accumulator(fft_.numBins(), 0.0);
        size_t frames = 0;

        size_t start = 0;
        for (;;) {
            if (stop.stop_requested()) {
                return FrameAnalysisStatus::Cancelled;
            }

            const size_t available = (start < count) ? std::min(fftSize_, count - start) : 0;
            for (size_t i = 0; i < fftSize_; ++i) {
                const float s = (i < available) ? samples[start + i] : 0.0f;
                windowedFrame_[i] = s * window_[i];
            }

            fft_.magnitudeSpectrum(windowedFrame_.data(), frameMagnitudes_.data());
            for (size_t k = 0; k < accumulator.size(); ++k) {
                accumulator[k] += static_cast<double>(frameMagnitudes_[k]);
            }
            ++frames;

            // Stop once a frame reaches the end of the clip
            if (start + fftSize_ >= count) break;
            start += hopSize_;
        }

        meanMagnitudes.resize(accumulator.size());
        const double scale = 1.0 / static_cast<double>(frames);
        for (size_t k = 0; k < accumulator.size(); ++k) {
            meanMagnitudes[k] = static_cast<float>(accumulator[k] * scale);
        }
        framesAnalyzed_ = frames;
        return FrameAnalysisStatus::Complete;
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t fftSize() const noexcept { return fftSize_; }
    [[nodiscard]] size_t hopSize() const noexcept { return hopSize_; }
    [[nodiscard]] size_t numBins() const noexcept { return fft_.numBins(); }
    [[nodiscard]] bool isPrepared() const noexcept { return fftSize_ > 0; }

    /// @brief Frames averaged by the last complete pass
    [[nodiscard]] size_t framesAnalyzed() const noexcept { return framesAnalyzed_; }

    /// @brief Frequency of bin k for a given sample rate
    [[nodiscard]] float binFrequency(size_t bin, float sampleRate) const noexcept {
        if (!isPrepared()) return 0.0f;
        return static_cast<float>(bin) * sampleRate / static_cast<float>(fftSize_);
    }

private:
    FFT fft_;
    std::vector<float> window_;
    std::vector<float> windowedFrame_;
    std::vector<float> frameMagnitudes_;
    size_t fftSize_ = 0;
    size_t hopSize_ = 0;
    size_t framesAnalyzed_ = 0;
};

} // namespace VoiceShaper::DSP
