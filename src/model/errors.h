#pragma once

// ==============================================================================
// Error Codes and Result Types
// ==============================================================================
// Every fallible engine operation returns a Result<T> (or Status) carrying an
// ErrorCode and a human-readable message. Nothing throws across module
// boundaries.
// ==============================================================================

#include <cstdint>
#include <string>
#include <utility>

namespace VoiceShaper {

enum class ErrorCode : uint8_t {
    None,
    UnknownProfile,     ///< Profile name not in the table
    InvalidPad,         ///< Pad coordinate outside [-1,1] or not finite
    InvalidSlider,      ///< Slider value outside [-1,1] or not finite
    MissingBase,        ///< Operation needs a captured base preset
    UnsupportedFormat,  ///< Audio is not mono PCM, or unusable sample rate
    EmptySignal,        ///< Audio shorter than the minimum analysis duration
    Cancelled,          ///< Background analysis was cancelled
    DispatchFailure,    ///< Command sink unreachable or rejected a command
    SlotUnavailable,    ///< Preset slot missing or unreadable
    IoError,            ///< File could not be read or written
    NoFingerprint,      ///< Snap requested before any analysis finished
    InvalidConfig       ///< Config override unknown, malformed or inconsistent
};

[[nodiscard]] constexpr const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:              return "None";
        case ErrorCode::UnknownProfile:    return "UnknownProfile";
        case ErrorCode::InvalidPad:        return "InvalidPad";
        case ErrorCode::InvalidSlider:     return "InvalidSlider";
        case ErrorCode::MissingBase:       return "MissingBase";
        case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorCode::EmptySignal:       return "EmptySignal";
        case ErrorCode::Cancelled:         return "Cancelled";
        case ErrorCode::DispatchFailure:   return "DispatchFailure";
        case ErrorCode::SlotUnavailable:   return "SlotUnavailable";
        case ErrorCode::IoError:           return "IoError";
        case ErrorCode::NoFingerprint:     return "NoFingerprint";
        case ErrorCode::InvalidConfig:     return "InvalidConfig";
    }
    return "Unknown";
}

/// Outcome of an operation without a payload
struct Status {
    ErrorCode error = ErrorCode::None;
    std::string message;

    [[nodiscard]] explicit operator bool() const noexcept { return error == ErrorCode::None; }

    [[nodiscard]] static Status ok() { return {}; }

    [[nodiscard]] static Status failure(ErrorCode code, std::string msg) {
        return Status{code, std::move(msg)};
    }
};

/// Outcome of an operation producing a value. value is default-constructed on failure.
template <typename T>
struct Result {
    T value{};
    ErrorCode error = ErrorCode::None;
    std::string message;

    [[nodiscard]] explicit operator bool() const noexcept { return error == ErrorCode::None; }

    [[nodiscard]] static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    [[nodiscard]] static Result failure(ErrorCode code, std::string msg) {
        Result r;
        r.error = code;
        r.message = std::move(msg);
        return r;
    }

    /// Re-type a failure from another Result/Status
    template <typename Other>
    [[nodiscard]] static Result forward(const Other& other) {
        return failure(other.error, other.message);
    }

    [[nodiscard]] Status status() const { return Status{error, message}; }
};

} // namespace VoiceShaper
