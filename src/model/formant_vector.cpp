#include "model/formant_vector.h"

#include <cstdio>

namespace VoiceShaper {

namespace {

constexpr std::array<std::string_view, kNumFormantFields> kFieldNames = {
    "F1", "F2", "F3", "F4",
    "L1", "L2", "L3", "L4",
    "R1", "R2", "R3", "R4"
};

} // namespace

std::string_view fieldName(FormantField field) noexcept {
    return kFieldNames[static_cast<size_t>(field)];
}

std::optional<FormantField> fieldFromName(std::string_view name) noexcept {
    for (size_t i = 0; i < kFieldNames.size(); ++i) {
        if (kFieldNames[i] == name) {
            return static_cast<FormantField>(i);
        }
    }
    return std::nullopt;
}

FormantVector FormantVector::withValue(FormantField field, float v) const noexcept {
    FormantVector copy = *this;
    const size_t index = formantIndex(field);
    switch (fieldKind(field)) {
        case FieldKind::Frequency: copy.frequencies_[index] = v; break;
        case FieldKind::Level:     copy.levels_[index] = v; break;
        case FieldKind::Resonance: copy.resonances_[index] = v; break;
    }
    return copy;
}

bool FormantVector::isFormantOrdered() const noexcept {
    for (size_t i = 1; i < kNumFormants; ++i) {
        if (!(frequencies_[i - 1] < frequencies_[i])) {
            return false;
        }
    }
    return true;
}

std::string toString(const FormantVector& v) {
    std::string out;
    char buffer[32];
    for (FormantField field : kDispatchOrder) {
        if (!out.empty()) out += ' ';
        std::snprintf(buffer, sizeof(buffer), "%.1f", static_cast<double>(v.value(field)));
        out += fieldName(field);
        out += '=';
        out += buffer;
    }
    return out;
}

} // namespace VoiceShaper
