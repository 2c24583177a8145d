#include "io/dlin_command_sink.h"

#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace VoiceShaper {

namespace {

// Knob numbers on each formant page
constexpr int kFrequencyKnob = 2;
constexpr int kLevelKnob = 3;
constexpr int kResonanceKnob = 6;

std::string quoteArgument(const std::string& arg) {
#if defined(_WIN32)
    return "\"" + arg + "\"";
#else
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
#endif
}

} // namespace

DlinCommandSink::DlinCommandSink(DlinSinkConfig config, ProcessRunner runner)
    : config_(std::move(config))
    , runner_(runner ? std::move(runner) : ProcessRunner(&DlinCommandSink::runWithShell))
{
}

ParameterRange DlinCommandSink::acceptedRange(FormantField field) const {
    switch (fieldKind(field)) {
        case FieldKind::Frequency: return {config_.freqLowHz, config_.freqHighHz};
        case FieldKind::Level:     return config_.levelRange;
        case FieldKind::Resonance: return config_.resonanceRange;
    }
    return {};
}

int DlinCommandSink::frequencyToKnob(float hz) const noexcept {
    const float span = config_.freqHighHz - config_.freqLowHz;
    if (span <= 0.0f) return config_.freqKnobLow;

    const float f = std::clamp(hz, config_.freqLowHz, config_.freqHighHz);
    const float t = (f - config_.freqLowHz) / span;
    const float knob = static_cast<float>(config_.freqKnobLow)
                     + t * static_cast<float>(config_.freqKnobHigh - config_.freqKnobLow);
    return static_cast<int>(std::lround(knob));
}

std::string DlinCommandSink::formatKnobAddress(const ParameterCommand& command) const {
    const float value = acceptedRange(command.field).clamp(command.value);

    int knob = kFrequencyKnob;
    long knobValue = 0;
    switch (fieldKind(command.field)) {
        case FieldKind::Frequency:
            knob = kFrequencyKnob;
            knobValue = frequencyToKnob(value);
            break;
        case FieldKind::Level:
            knob = kLevelKnob;
            knobValue = std::lround(value);
            break;
        case FieldKind::Resonance:
            knob = kResonanceKnob;
            knobValue = std::lround(value);
            break;
    }

    return std::to_string(formantIndex(command.field)) + "f:" + std::to_string(knob) + ":"
         + std::to_string(knobValue);
}

std::vector<std::string> DlinCommandSink::buildArguments(const ParameterCommand& command) const {
    std::vector<std::string> argv;
    if (config_.useSudo) {
        argv.emplace_back("sudo");
    }
    argv.push_back(config_.dlinPath.string());
    argv.emplace_back("knob");
    argv.emplace_back("-pkv");
    argv.push_back(formatKnobAddress(command));
    return argv;
}

Status DlinCommandSink::send(const ParameterCommand& command) {
    const auto argv = buildArguments(command);
    Log::logger()->debug("d-lin knob -pkv {} ({}={})", argv.back(), command.name(), command.value);

    const int status = runner_(argv);
    if (status != 0) {
        return Status::failure(ErrorCode::DispatchFailure,
                               "d-lin exited with status " + std::to_string(status)
                                   + " for " + std::string(command.name()));
    }
    return Status::ok();
}

int DlinCommandSink::runWithShell(const std::vector<std::string>& argv) {
    std::string commandLine;
    for (const auto& arg : argv) {
        if (!commandLine.empty()) commandLine += ' ';
        commandLine += quoteArgument(arg);
    }

    const int status = std::system(commandLine.c_str());
    if (status == -1) {
        return -1;
    }
#if defined(_WIN32)
    return status;
#else
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
}

} // namespace VoiceShaper
