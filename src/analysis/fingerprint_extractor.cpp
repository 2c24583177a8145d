#include "analysis/fingerprint_extractor.h"

#include "dsp/primitives/frame_analyzer.h"
#include "io/wav_reader.h"

#include <algorithm>
#include <bit>
#include <cmath>
#include <string>
#include <vector>

namespace VoiceShaper {

namespace {

/// Sum of squared magnitudes over [lowHz, highHz]
double bandEnergy(const std::vector<float>& magnitudes, float binHz, float lowHz, float highHz) {
    if (binHz <= 0.0f) return 0.0;
    const size_t first = static_cast<size_t>(std::ceil(lowHz / binHz));
    const size_t last = std::min(magnitudes.size() - 1, static_cast<size_t>(std::floor(highHz / binHz)));

    double energy = 0.0;
    for (size_t k = first; k <= last; ++k) {
        const double m = magnitudes[k];
        energy += m * m;
    }
    return energy;
}

} // namespace

size_t FingerprintExtractor::frameSizeFor(int sampleRate) const noexcept {
    if (sampleRate <= 0 || config_.targetResolutionHz <= 0.0f) {
        return config_.minFrameSize;
    }
    const auto wanted = static_cast<size_t>(
        std::ceil(static_cast<float>(sampleRate) / config_.targetResolutionHz));
    return std::clamp(std::bit_ceil(wanted),
                      static_cast<size_t>(config_.minFrameSize),
                      static_cast<size_t>(config_.maxFrameSize));
}

float FingerprintExtractor::centroidToPadX(float centroidHz) const noexcept {
    const float span = config_.centroidHighHz - config_.centroidLowHz;
    if (span <= 0.0f) return 0.0f;
    const float t = (centroidHz - config_.centroidLowHz) / span;
    return std::clamp(2.0f * t - 1.0f, kPadMin, kPadMax);
}

float FingerprintExtractor::balanceToPadY(float balanceDb) const noexcept {
    if (config_.balanceSpanDb <= 0.0f) return 0.0f;
    return std::clamp((config_.balanceCenterDb - balanceDb) / config_.balanceSpanDb, kPadMin, kPadMax);
}

Result<Fingerprint> FingerprintExtractor::analyze(const WavData& wav, std::stop_token stop) const {
    if (!wav.isMonoPcm()) {
        return Result<Fingerprint>::failure(
            ErrorCode::UnsupportedFormat,
            "expected mono PCM, got " + std::to_string(wav.channels) + " channel(s), format "
                + std::to_string(wav.formatTag));
    }
    return analyze(std::span<const float>(wav.samples), wav.sampleRate, std::move(stop));
}

Result<Fingerprint> FingerprintExtractor::analyze(std::span<const float> samples,
                                                  int sampleRate,
                                                  std::stop_token stop) const {
    using R = Result<Fingerprint>;

    if (sampleRate <= 0) {
        return R::failure(ErrorCode::UnsupportedFormat, "sample rate must be positive");
    }

    Fingerprint fp;
    fp.sampleRate = sampleRate;
    fp.durationMs = 1000.0f * static_cast<float>(samples.size()) / static_cast<float>(sampleRate);
    if (fp.durationMs < config_.minDurationMs) {
        return R::failure(ErrorCode::EmptySignal,
                          "clip shorter than " + std::to_string(config_.minDurationMs) + " ms");
    }

    // Sanitise: non-finite samples become silence
    std::vector<float> clean(samples.begin(), samples.end());
    size_t clipped = 0;
    for (float& s : clean) {
        if (!std::isfinite(s)) {
            s = 0.0f;
            fp.flags |= kFingerprintNonFinite;
        } else if (std::fabs(s) >= config_.clipLevel) {
            ++clipped;
        }
    }
    if (static_cast<float>(clipped) > config_.maxClippedFraction * static_cast<float>(clean.size())) {
        fp.flags |= kFingerprintClipped;
    }

    fp.rmsDb = DSP::rmsDb(clean.data(), clean.size());
    if (fp.rmsDb < config_.silenceThresholdDb) {
        fp.flags |= kFingerprintSilent;
    }

    DSP::FrameAnalyzer analyzer;
    fp.fftSize = frameSizeFor(sampleRate);
    if (!analyzer.prepare(fp.fftSize, fp.fftSize / 2)) {
        return R::failure(ErrorCode::UnsupportedFormat,
                          "unsupported frame size " + std::to_string(fp.fftSize));
    }

    std::vector<float> spectrum;
    if (analyzer.averageMagnitudes(clean.data(), clean.size(), spectrum, std::move(stop))
        != DSP::FrameAnalysisStatus::Complete) {
        return R::failure(ErrorCode::Cancelled, "analysis cancelled");
    }
    fp.frameCount = analyzer.framesAnalyzed();

    // Brightness: centroid over the analysis band
    const float nyquist = 0.5f * static_cast<float>(sampleRate);
    const float binHz = analyzer.binFrequency(1, static_cast<float>(sampleRate));
    const float bandHigh = std::min(config_.analysisMaxHz, nyquist);

    double weighted = 0.0;
    double total = 0.0;
    for (size_t k = 0; k < spectrum.size(); ++k) {
        const float f = static_cast<float>(k) * binHz;
        if (f < config_.analysisMinHz || f > bandHigh) continue;
        weighted += static_cast<double>(f) * spectrum[k];
        total += spectrum[k];
    }

    if (total <= 0.0) {
        // Nothing to measure: keep the neutral point
        fp.flags |= kFingerprintSilent | kFingerprintNoBandEnergy;
        return R::success(fp);
    }

    fp.centroidHz = static_cast<float>(weighted / total);
    fp.point.x = centroidToPadX(fp.centroidHz);

    // Vocal colour: chest/head energy balance
    const double chest = bandEnergy(spectrum, binHz, config_.chestBandLowHz,
                                    std::min(config_.chestBandHighHz, nyquist));
    const double head = bandEnergy(spectrum, binHz, config_.headBandLowHz,
                                   std::min(config_.headBandHighHz, nyquist));

    if (chest + head <= 0.0) {
        fp.flags |= kFingerprintNoBandEnergy;
    } else {
        // Floor both bands relative to the larger so a band at exactly zero
        // saturates the mapping instead of dividing by zero
        const double floor = 1e-12 * std::max(chest, head);
        fp.balanceDb = DSP::powerRatioToDb(static_cast<float>((chest + floor) / (head + floor)));
        fp.point.y = balanceToPadY(fp.balanceDb);
    }

    return R::success(fp);
}

} // namespace VoiceShaper
