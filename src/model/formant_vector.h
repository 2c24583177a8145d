#pragma once

// ==============================================================================
// FormantVector - Twelve-Field Formant Parameter Set
// ==============================================================================
// F1..F4 frequencies (Hz), L1..L4 levels [0, LMAX], R1..R4 resonances
// [RMIN, RMAX]. Immutable value type: setters return a modified copy.
//
// Field identifiers and their order are fixed; the order is the dispatch
// order used when a vector is sent to the librarian.
// ==============================================================================

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace VoiceShaper {

inline constexpr size_t kNumFormants = 4;
inline constexpr size_t kNumFormantFields = 3 * kNumFormants;

// ==============================================================================
// Field Identifiers
// ==============================================================================

enum class FieldKind : uint8_t {
    Frequency,
    Level,
    Resonance
};

enum class FormantField : uint8_t {
    F1, F2, F3, F4,
    L1, L2, L3, L4,
    R1, R2, R3, R4
};

/// Fixed transmission order: F1..F4, L1..L4, R1..R4
inline constexpr std::array<FormantField, kNumFormantFields> kDispatchOrder = {
    FormantField::F1, FormantField::F2, FormantField::F3, FormantField::F4,
    FormantField::L1, FormantField::L2, FormantField::L3, FormantField::L4,
    FormantField::R1, FormantField::R2, FormantField::R3, FormantField::R4
};

[[nodiscard]] constexpr FieldKind fieldKind(FormantField field) noexcept {
    return static_cast<FieldKind>(static_cast<uint8_t>(field) / kNumFormants);
}

/// Zero-based formant index (F3 -> 2)
[[nodiscard]] constexpr size_t formantIndex(FormantField field) noexcept {
    return static_cast<size_t>(field) % kNumFormants;
}

[[nodiscard]] constexpr FormantField makeField(FieldKind kind, size_t index) noexcept {
    return static_cast<FormantField>(static_cast<size_t>(kind) * kNumFormants + index);
}

/// Parameter identifier as accepted by the librarian ("F1", "L3", ...)
[[nodiscard]] std::string_view fieldName(FormantField field) noexcept;

/// Inverse of fieldName; nullopt for anything else
[[nodiscard]] std::optional<FormantField> fieldFromName(std::string_view name) noexcept;

// ==============================================================================
// ParameterRange
// ==============================================================================

struct ParameterRange {
    float min = 0.0f;
    float max = 0.0f;

    [[nodiscard]] constexpr bool contains(float v) const noexcept { return v >= min && v <= max; }
    [[nodiscard]] constexpr float clamp(float v) const noexcept { return std::clamp(v, min, max); }
};

// ==============================================================================
// FormantVector
// ==============================================================================

class FormantVector {
public:
    using Bank = std::array<float, kNumFormants>;

    constexpr FormantVector() noexcept = default;

    constexpr FormantVector(const Bank& frequencies, const Bank& levels, const Bank& resonances) noexcept
        : frequencies_(frequencies)
        , levels_(levels)
        , resonances_(resonances)
    {
    }

    [[nodiscard]] constexpr float frequency(size_t index) const noexcept { return frequencies_[index]; }
    [[nodiscard]] constexpr float level(size_t index) const noexcept { return levels_[index]; }
    [[nodiscard]] constexpr float resonance(size_t index) const noexcept { return resonances_[index]; }

    [[nodiscard]] constexpr const Bank& frequencies() const noexcept { return frequencies_; }
    [[nodiscard]] constexpr const Bank& levels() const noexcept { return levels_; }
    [[nodiscard]] constexpr const Bank& resonances() const noexcept { return resonances_; }

    [[nodiscard]] constexpr float value(FormantField field) const noexcept {
        return bank(fieldKind(field))[formantIndex(field)];
    }

    [[nodiscard]] constexpr const Bank& bank(FieldKind kind) const noexcept {
        switch (kind) {
            case FieldKind::Level:     return levels_;
            case FieldKind::Resonance: return resonances_;
            case FieldKind::Frequency: break;
        }
        return frequencies_;
    }

    /// Copy with one field replaced
    [[nodiscard]] FormantVector withValue(FormantField field, float v) const noexcept;

    /// Soft invariant F1 < F2 < F3 < F4
    [[nodiscard]] bool isFormantOrdered() const noexcept;

    [[nodiscard]] bool operator==(const FormantVector& other) const noexcept = default;

private:
    Bank frequencies_{};
    Bank levels_{};
    Bank resonances_{};
};

/// "F1=500.0 F2=1500.0 ... R4=5.0"
[[nodiscard]] std::string toString(const FormantVector& v);

} // namespace VoiceShaper
