#pragma once

// ==============================================================================
// DlinCommandSink - D-Lev Librarian Knob Commands
// ==============================================================================
// Sends each field as
//     [sudo] <d-lin> knob -pkv <page>f:<knob>:<value>
// page = formant index (0..3); knob 2 = frequency, 3 = level, 6 = resonance.
// Frequencies are mapped linearly from [freqLowHz, freqHighHz] onto knob
// values [freqKnobLow, freqKnobHigh]; levels and resonances are rounded.
//
// The process launch is injectable so the formatting can be exercised without
// hardware attached.
// ==============================================================================

#include "io/command_sink.h"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace VoiceShaper {

struct DlinSinkConfig {
    std::filesystem::path dlinPath = "d-lin";
    bool useSudo = false;

    float freqLowHz = 200.0f;
    float freqHighHz = 4000.0f;
    int freqKnobLow = 100;
    int freqKnobHigh = 3500;

    ParameterRange levelRange{0.0f, 63.0f};
    ParameterRange resonanceRange{0.0f, 15.0f};
};

class DlinCommandSink : public ICommandSink {
public:
    /// Runs argv, returns the exit status (non-zero = failure)
    using ProcessRunner = std::function<int(const std::vector<std::string>& argv)>;

    explicit DlinCommandSink(DlinSinkConfig config = {}, ProcessRunner runner = {});

    [[nodiscard]] ParameterRange acceptedRange(FormantField field) const override;

    [[nodiscard]] Status send(const ParameterCommand& command) override;

    /// "<page>f:<knob>:<value>" for a command, after clamping
    [[nodiscard]] std::string formatKnobAddress(const ParameterCommand& command) const;

    /// Full argument vector for a command
    [[nodiscard]] std::vector<std::string> buildArguments(const ParameterCommand& command) const;

    /// Knob value for a frequency in Hz
    [[nodiscard]] int frequencyToKnob(float hz) const noexcept;

    /// Default runner: joins argv (single-quoted) and runs it through the shell
    [[nodiscard]] static int runWithShell(const std::vector<std::string>& argv);

private:
    DlinSinkConfig config_;
    ProcessRunner runner_;
};

} // namespace VoiceShaper
