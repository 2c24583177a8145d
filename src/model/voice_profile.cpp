#include "model/voice_profile.h"

#include "config/engine_config.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace VoiceShaper {

namespace {

// ==============================================================================
// Reference Data
// ==============================================================================
// Typical vowel ranges (Hz) of the first four formants per voice type.

struct FormantRangeRow {
    VoiceType type;
    std::array<ParameterRange, kNumFormants> frequency;
};

inline constexpr std::array<FormantRangeRow, kNumVoiceTypes> kFormantRanges = {{
    {VoiceType::Bass,     {{{300.0f, 650.0f}, {700.0f, 1200.0f}, {1700.0f, 2400.0f}, {2200.0f, 3200.0f}}}},
    {VoiceType::Baritone, {{{330.0f, 700.0f}, {800.0f, 1350.0f}, {1800.0f, 2500.0f}, {2300.0f, 3400.0f}}}},
    {VoiceType::Tenor,    {{{380.0f, 750.0f}, {900.0f, 1500.0f}, {1900.0f, 2600.0f}, {2400.0f, 3400.0f}}}},
    {VoiceType::Alto,     {{{400.0f, 800.0f}, {1000.0f, 1700.0f}, {2100.0f, 2900.0f}, {2600.0f, 3500.0f}}}},
    {VoiceType::Mezzo,    {{{420.0f, 850.0f}, {1100.0f, 1800.0f}, {2200.0f, 3000.0f}, {2700.0f, 3600.0f}}}},
    {VoiceType::Soprano,  {{{450.0f, 900.0f}, {1200.0f, 2000.0f}, {2400.0f, 3100.0f}, {2800.0f, 3700.0f}}}},
    {VoiceType::Neutral,  {{{360.0f, 780.0f}, {850.0f, 1500.0f}, {1900.0f, 2700.0f}, {2400.0f, 3400.0f}}}},
}};

/// F1/F2 carry the vowel, F3/F4 sit lower to keep the top end tame
inline constexpr FormantVector::Bank kCanonicalLevels = {55.0f, 45.0f, 32.0f, 25.0f};

inline constexpr float kCanonicalResonance = 5.0f;

VoiceProfile buildProfile(const FormantRangeRow& row) {
    VoiceProfile profile;
    profile.type = row.type;
    profile.name = std::string(voiceTypeName(row.type));

    FormantVector::Bank frequencies{};
    FormantVector::Bank resonances{};
    for (size_t i = 0; i < kNumFormants; ++i) {
        const ParameterRange& r = row.frequency[i];
        frequencies[i] = 0.5f * (r.min + r.max);
        resonances[i] = kCanonicalResonance;

        profile.ranges[static_cast<size_t>(makeField(FieldKind::Frequency, i))] = r;
        profile.ranges[static_cast<size_t>(makeField(FieldKind::Level, i))] = {0.0f, kDefaultLevelMax};
        profile.ranges[static_cast<size_t>(makeField(FieldKind::Resonance, i))] =
            {kDefaultResonanceMin, kDefaultResonanceMax};
    }
    profile.canonical = FormantVector(frequencies, kCanonicalLevels, resonances);
    return profile;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::string_view voiceTypeName(VoiceType type) noexcept {
    switch (type) {
        case VoiceType::Bass:     return "Bass";
        case VoiceType::Baritone: return "Baritone";
        case VoiceType::Tenor:    return "Tenor";
        case VoiceType::Alto:     return "Alto";
        case VoiceType::Mezzo:    return "Mezzo";
        case VoiceType::Soprano:  return "Soprano";
        case VoiceType::Neutral:  return "Neutral";
    }
    return "Neutral";
}

std::vector<ProfileIssue> validateProfile(const VoiceProfile& profile) {
    std::vector<ProfileIssue> issues;

    if (!profile.canonical.isFormantOrdered()) {
        issues.push_back({profile.name, "canonical formants are not strictly ascending (F1<F2<F3<F4)"});
    }

    char buffer[96];
    for (FormantField field : kDispatchOrder) {
        const float v = profile.canonical.value(field);
        const ParameterRange& r = profile.range(field);
        if (!r.contains(v)) {
            std::snprintf(buffer, sizeof(buffer), "%.*s=%.1f outside [%.1f, %.1f]",
                          static_cast<int>(fieldName(field).size()), fieldName(field).data(),
                          static_cast<double>(v), static_cast<double>(r.min), static_cast<double>(r.max));
            issues.push_back({profile.name, buffer});
        }
    }
    return issues;
}

// ==============================================================================
// VoiceProfileTable
// ==============================================================================

VoiceProfileTable::VoiceProfileTable() {
    for (const auto& row : kFormantRanges) {
        VoiceProfile profile = buildProfile(row);

        for (auto& issue : validateProfile(profile)) {
            Log::logger()->warn("voice profile {}: {}", issue.profile, issue.description);
            issues_.push_back(std::move(issue));
        }

        orderedNames_.push_back(profile.name);
        byName_.emplace(profile.name, std::move(profile));
    }
}

const VoiceProfileTable& VoiceProfileTable::instance() {
    static const VoiceProfileTable table;
    return table;
}

Result<const VoiceProfile*> VoiceProfileTable::get(std::string_view name) const {
    for (const auto& [key, profile] : byName_) {
        if (equalsIgnoreCase(key, name)) {
            return Result<const VoiceProfile*>::success(&profile);
        }
    }
    return Result<const VoiceProfile*>::failure(
        ErrorCode::UnknownProfile, "unknown voice profile '" + std::string(name) + "'");
}

const VoiceProfile& VoiceProfileTable::get(VoiceType type) const {
    return byName_.find(voiceTypeName(type))->second;
}

} // namespace VoiceShaper
