// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// Radix-2 Decimation-in-Time FFT for spectral measurement.
// Forward (real-to-complex) transform plus a magnitude-spectrum helper; the
// fingerprint path never resynthesises, so there is no inverse.
//
// Algorithm: Cooley-Tukey Radix-2 DIT
// ==============================================================================

#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <vector>

namespace VoiceShaper::DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum supported FFT size
inline constexpr size_t kMinFFTSize = 256;

/// Maximum supported FFT size
inline constexpr size_t kMaxFFTSize = 8192;

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for FFT operations
struct Complex {
    float real = 0.0f;
    float imag = 0.0f;

    [[nodiscard]] constexpr Complex operator+(const Complex& other) const noexcept {
        return {real + other.real, imag + other.imag};
    }

    [[nodiscard]] constexpr Complex operator-(const Complex& other) const noexcept {
        return {real - other.real, imag - other.imag};
    }

    [[nodiscard]] constexpr Complex operator*(const Complex& other) const noexcept {
        return {
            real * other.real - imag * other.imag,
            real * other.imag + imag * other.real
        };
    }

    /// @brief Get magnitude |z| = sqrt(real^2 + imag^2)
    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }
};

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Forward real FFT
/// @note Uses Radix-2 Decimation-in-Time (DIT) algorithm
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    // Non-copyable, movable
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare FFT for given size (allocates LUTs and buffers)
    /// @param fftSize Power of 2 in range [256, 8192]
    /// @return false (and unprepared) when fftSize is not a supported power of 2
    bool prepare(size_t fftSize) {
        size_ = 0;
        if (fftSize < kMinFFTSize || fftSize > kMaxFFTSize || !std::has_single_bit(fftSize)) {
            return false;
        }
        size_ = fftSize;

        const size_t numBits = static_cast<size_t>(std::countr_zero(fftSize));

        bitReversalLUT_.resize(fftSize);
        for (size_t i = 0; i < fftSize; ++i) {
            size_t reversed = 0;
            size_t temp = i;
            for (size_t b = 0; b < numBits; ++b) {
                reversed = (reversed << 1) | (temp & 1);
                temp >>= 1;
            }
            bitReversalLUT_[i] = reversed;
        }

        // Twiddle factors W_N^k = exp(-2πik/N), first half only
        const size_t halfSize = fftSize / 2;
        twiddleFactors_.resize(halfSize);
        const double twoPi = 2.0 * std::numbers::pi;
        for (size_t k = 0; k < halfSize; ++k) {
            const double angle = -twoPi * static_cast<double>(k) / static_cast<double>(fftSize);
            twiddleFactors_[k] = {
                static_cast<float>(std::cos(angle)),
                static_cast<float>(std::sin(angle))
            };
        }

        workBuffer_.assign(fftSize, Complex{});
        return true;
    }

    // -------------------------------------------------------------------------
    // Processing
    // -------------------------------------------------------------------------

    /// @brief Forward FFT: real time-domain → complex frequency-domain
    /// @param input N real samples
    /// @param output N/2+1 complex bins (DC to Nyquist)
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        for (size_t i = 0; i < size_; ++i) {
            workBuffer_[bitReversalLUT_[i]] = {input[i], 0.0f};
        }

        for (size_t stage = 1; stage < size_; stage <<= 1) {
            const size_t twiddleStep = size_ / (stage << 1);

            for (size_t k = 0; k < size_; k += (stage << 1)) {
                size_t twiddleIndex = 0;

                for (size_t j = 0; j < stage; ++j) {
                    const size_t evenIdx = k + j;
                    const size_t oddIdx = evenIdx + stage;

                    const Complex even = workBuffer_[evenIdx];
                    const Complex odd = workBuffer_[oddIdx] * twiddleFactors_[twiddleIndex];

                    workBuffer_[evenIdx] = even + odd;
                    workBuffer_[oddIdx] = even - odd;

                    twiddleIndex += twiddleStep;
                }
            }
        }

        const size_t bins = numBins();
        std::copy(workBuffer_.begin(), workBuffer_.begin() + static_cast<std::ptrdiff_t>(bins), output);

        // Real input: DC and Nyquist are purely real
        output[0].imag = 0.0f;
        output[size_ / 2].imag = 0.0f;
    }

    /// @brief Forward FFT reduced to magnitudes
    /// @param input N real samples
    /// @param magnitudes N/2+1 magnitudes |X[k]|
    void magnitudeSpectrum(const float* input, float* magnitudes) {
        if (!isPrepared() || input == nullptr || magnitudes == nullptr) return;

        spectrum_.resize(numBins());
        forward(input, spectrum_.data());
        for (size_t k = 0; k < spectrum_.size(); ++k) {
            magnitudes[k] = spectrum_[k].magnitude();
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Number of output bins (N/2+1)
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }

    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0; }

private:
    size_t size_ = 0;
    std::vector<size_t> bitReversalLUT_;
    std::vector<Complex> twiddleFactors_;
    std::vector<Complex> workBuffer_;
    std::vector<Complex> spectrum_;
};

} // namespace VoiceShaper::DSP
