#pragma once

// ==============================================================================
// Engine Configuration
// ==============================================================================
// Every tunable constant of the mapping, fingerprint and dispatch stages.
// The defaults are starting points chosen by ear and by the librarian's
// update rate; they are meant to be calibrated against real hardware.
//
// IMPORTANT: Field order matters for C++20 designated initializers.
// If fields are reordered, update ALL initializer sites.
// ==============================================================================

#include <cstdint>
#include <string>

namespace VoiceShaper {

// ==============================================================================
// Default Limits
// ==============================================================================
// Shared by MappingConfig and the static profile table.

inline constexpr float kDefaultLevelMax = 63.0f;
inline constexpr float kDefaultResonanceMin = 3.0f;
inline constexpr float kDefaultResonanceMax = 7.0f;

// ==============================================================================
// MappingConfig - Pad Interpolation Constants
// ==============================================================================

struct MappingConfig {
    float brightnessShift = 0.15f;        // kBright: F scale per unit of pad x
    float brightnessSliderShift = 0.10f;  // F scale per unit of brightness slider
    float resonanceLevelCut = 0.5f;       // kRes: level cut at resonance = +1
    float resonanceQScale = 0.3f;         // R scale per unit of resonance slider (+ = lower Q)
    float levelMax = kDefaultLevelMax;    // LMAX
    float resonanceMin = kDefaultResonanceMin;  // RMIN
    float resonanceMax = kDefaultResonanceMax;  // RMAX
};

// ==============================================================================
// FingerprintConfig - Spectral Fingerprint Constants
// ==============================================================================

struct FingerprintConfig {
    float minDurationMs = 50.0f;          // Shorter clips fail with EmptySignal
    float targetResolutionHz = 12.0f;     // Drives the frame length
    uint32_t minFrameSize = 2048;
    uint32_t maxFrameSize = 4096;

    float analysisMinHz = 50.0f;          // Bins outside are ignored
    float analysisMaxHz = 8000.0f;        // Capped at Nyquist

    float centroidLowHz = 1500.0f;        // Maps to pad x = -1
    float centroidHighHz = 4000.0f;       // Maps to pad x = +1

    float chestBandLowHz = 100.0f;
    float chestBandHighHz = 800.0f;
    float headBandLowHz = 2000.0f;
    float headBandHighHz = 5000.0f;

    float balanceCenterDb = 10.0f;        // chest/head ratio mapped to pad y = 0
    float balanceSpanDb = 20.0f;          // dB per unit of pad y

    float silenceThresholdDb = -60.0f;    // RMS below this is low confidence
    float clipLevel = 0.999f;
    float maxClippedFraction = 0.01f;     // More clipped samples than this is low confidence
};

// ==============================================================================
// DispatchConfig - Outbound Throttling
// ==============================================================================

struct DispatchConfig {
    uint32_t minIntervalMs = 150;  // Minimum spacing between dispatch starts
    bool diffingEnabled = true;    // Send only changed fields on non-forced dispatches
};

// ==============================================================================
// EngineConfig
// ==============================================================================

struct EngineConfig {
    MappingConfig mapping;
    FingerprintConfig fingerprint;
    DispatchConfig dispatch;
    std::string defaultProfile = "Tenor";
};

} // namespace VoiceShaper
