#pragma once

// ==============================================================================
// VoiceProfile Table
// ==============================================================================
// Static per-voice-type reference formant sets. Built once on first use and
// read-only afterwards; there is no mutation API.
//
// Canonical frequencies sit at the centre of each voice type's typical vowel
// range for that formant; the range itself is kept as the field's valid range.
//
// Load-time validation reports (logs) canonical vectors that break the soft
// F1 < F2 < F3 < F4 ordering or leave their own ranges. Violations are
// reported, never rejected: special timbres sometimes cross formants.
// ==============================================================================

#include "model/errors.h"
#include "model/formant_vector.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace VoiceShaper {

enum class VoiceType : uint8_t {
    Bass,
    Baritone,
    Tenor,
    Alto,
    Mezzo,
    Soprano,
    Neutral
};

inline constexpr size_t kNumVoiceTypes = 7;

struct VoiceProfile {
    VoiceType type = VoiceType::Neutral;
    std::string name;
    FormantVector canonical;
    std::array<ParameterRange, kNumFormantFields> ranges{};

    [[nodiscard]] const ParameterRange& range(FormantField field) const noexcept {
        return ranges[static_cast<size_t>(field)];
    }
};

/// One validation finding for a profile
struct ProfileIssue {
    std::string profile;
    std::string description;
};

/// Check ordering and range consistency of a profile's canonical vector
[[nodiscard]] std::vector<ProfileIssue> validateProfile(const VoiceProfile& profile);

// ==============================================================================
// VoiceProfileTable
// ==============================================================================

class VoiceProfileTable {
public:
    using ProfileMap = std::map<std::string, VoiceProfile, std::less<>>;

    /// Process-wide table, built on first call
    [[nodiscard]] static const VoiceProfileTable& instance();

    VoiceProfileTable(const VoiceProfileTable&) = delete;
    VoiceProfileTable& operator=(const VoiceProfileTable&) = delete;

    /// All profiles keyed by display name ("Bass", "Tenor", ...)
    [[nodiscard]] const ProfileMap& profilesByName() const noexcept { return byName_; }

    /// Display names in voice order, Bass first, Neutral last
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return orderedNames_; }

    /// Case-insensitive lookup; fails with UnknownProfile
    [[nodiscard]] Result<const VoiceProfile*> get(std::string_view name) const;

    [[nodiscard]] const VoiceProfile& get(VoiceType type) const;

    /// Findings of the load-time validation pass
    [[nodiscard]] const std::vector<ProfileIssue>& validationIssues() const noexcept { return issues_; }

private:
    VoiceProfileTable();

    ProfileMap byName_;
    std::vector<std::string> orderedNames_;
    std::vector<ProfileIssue> issues_;
};

/// Display name of a voice type
[[nodiscard]] std::string_view voiceTypeName(VoiceType type) noexcept;

} // namespace VoiceShaper
