// ==============================================================================
// voiceshaper - Command Line Front End
// ==============================================================================
// Usage:
//   voiceshaper profiles
//   voiceshaper map <x> <y> [--profile NAME] [--brightness B] [--resonance R]
//                   (--base-slot N [--slots DIR] | --base-profile NAME)
//   voiceshaper analyze <file.wav>
//   voiceshaper send <slot> [--slots DIR] [--dlin PATH] [--sudo] [--dry-run]
//
// Global options: --verbose, --version, plus tuning overrides such as
// --k-bright, --rmin, --rmax, --centroid-low (see printUsage)
// Exit status: 0 on success, 1 on an engine error, 2 on bad usage.
// ==============================================================================

#include "analysis/fingerprint_extractor.h"
#include "config/config_overrides.h"
#include "config/engine_config.h"
#include "engine/pad_interpolation.h"
#include "io/dlin_command_sink.h"
#include "io/preset_slot_store.h"
#include "io/wav_reader.h"
#include "logging/logger.h"
#include "model/voice_profile.h"
#include "session/ab_state.h"
#include "version.h"

#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace VoiceShaper;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void printUsage() {
    std::cout << VOICESHAPER_PROGRAM_NAME " " VOICESHAPER_VERSION_STR " - " VOICESHAPER_DESCRIPTION "\n\n"
              << "Usage:\n"
              << "  voiceshaper profiles\n"
              << "  voiceshaper map <x> <y> [--profile NAME] [--brightness B] [--resonance R]\n"
              << "                  (--base-slot N [--slots DIR] | --base-profile NAME)\n"
              << "  voiceshaper analyze <file.wav>\n"
              << "  voiceshaper send <slot> [--slots DIR] [--dlin PATH] [--sudo] [--dry-run]\n\n"
              << "Pad coordinates and sliders are in [-1, 1].\n"
              << "Global options: --verbose, --version\n\n"
              << "Tuning overrides (default in brackets):\n";
    for (const auto& entry : configOverrides()) {
        std::cout << "  " << std::left << std::setw(20) << entry.name << entry.help << "\n";
    }
    std::cout << std::right;
}

int reportError(ErrorCode code, const std::string& message) {
    std::cerr << "error (" << errorCodeName(code) << "): " << message << std::endl;
    return kExitError;
}

template <typename T>
int reportError(const T& failed) {
    return reportError(failed.error, failed.message);
}

std::optional<float> parseFloat(std::string_view text) {
    float value = 0.0f;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> parseInt(std::string_view text) {
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Positional arguments plus "--name value" / "--flag" options
struct Arguments {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options;
    std::vector<std::string> flags;

    [[nodiscard]] std::optional<std::string> option(std::string_view name) const {
        for (const auto& [key, value] : options) {
            if (key == name) return value;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool flag(std::string_view name) const {
        for (const auto& f : flags) {
            if (f == name) return true;
        }
        return false;
    }
};

bool isFlag(std::string_view arg) {
    return arg == "--sudo" || arg == "--dry-run" || arg == "--verbose" || arg == "--version";
}

// Negative numbers ("-0.5") are positional, not options
bool isOption(std::string_view arg) {
    return arg.size() > 2 && arg.substr(0, 2) == "--";
}

std::optional<Arguments> splitArguments(int argc, char* argv[], int first) {
    Arguments args;
    for (int i = first; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (isFlag(arg)) {
            args.flags.emplace_back(arg);
        } else if (isOption(arg)) {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << std::endl;
                return std::nullopt;
            }
            args.options.emplace_back(std::string(arg), argv[++i]);
        } else {
            args.positional.emplace_back(arg);
        }
    }
    return args;
}

void printVector(const FormantVector& v) {
    std::cout << std::fixed << std::setprecision(1);
    for (FormantField field : kDispatchOrder) {
        std::cout << "  " << fieldName(field) << " = " << std::setw(7) << v.value(field) << "\n";
    }
}

// =============================================================================
// Sub-commands
// =============================================================================

int runProfiles() {
    const auto& table = VoiceProfileTable::instance();
    for (const auto& name : table.names()) {
        const auto profile = table.get(name);
        if (!profile) return reportError(profile);
        std::cout << name << ": " << toString(profile.value->canonical) << "\n";
    }
    for (const auto& issue : table.validationIssues()) {
        std::cout << "warning: " << issue.profile << ": " << issue.description << "\n";
    }
    return kExitOk;
}

int runMap(const Arguments& args, const EngineConfig& config) {
    if (args.positional.size() != 2) {
        printUsage();
        return kExitUsage;
    }
    const auto x = parseFloat(args.positional[0]);
    const auto y = parseFloat(args.positional[1]);
    if (!x || !y) {
        std::cerr << "pad coordinates must be numbers" << std::endl;
        return kExitUsage;
    }

    float brightness = 0.0f;
    float resonance = 0.0f;
    if (auto text = args.option("--brightness")) {
        auto value = parseFloat(*text);
        if (!value) return reportError(ErrorCode::InvalidSlider, "brightness '" + *text + "'");
        brightness = *value;
    }
    if (auto text = args.option("--resonance")) {
        auto value = parseFloat(*text);
        if (!value) return reportError(ErrorCode::InvalidSlider, "resonance '" + *text + "'");
        resonance = *value;
    }

    const auto& table = VoiceProfileTable::instance();
    const auto profile = table.get(args.option("--profile").value_or(config.defaultProfile));
    if (!profile) return reportError(profile);

    BasePreset base;
    if (auto slotText = args.option("--base-slot")) {
        const auto slot = parseInt(*slotText);
        if (!slot) {
            std::cerr << "slot must be an integer" << std::endl;
            return kExitUsage;
        }
        DirectorySlotStore store(args.option("--slots").value_or("."));
        auto read = store.readSlot(*slot);
        if (!read) return reportError(read);
        base = read.value;
    } else if (auto baseProfile = args.option("--base-profile")) {
        const auto source = table.get(*baseProfile);
        if (!source) return reportError(source);
        base = source.value->canonical;
    }

    const PadInterpolator interpolator(config.mapping);
    const auto result = interpolator.compute(base, PadPoint{*x, *y}, *profile.value, brightness, resonance);
    if (!result) return reportError(result);

    std::cout << "pad (" << *x << ", " << *y << "), profile " << profile.value->name << "\n";
    printVector(result.value);
    if (!result.value.isFormantOrdered()) {
        std::cout << "note: formants are not in ascending order\n";
    }
    return kExitOk;
}

int runAnalyze(const Arguments& args, const EngineConfig& config) {
    if (args.positional.size() != 1) {
        printUsage();
        return kExitUsage;
    }

    const auto wav = readWavFile(args.positional[0]);
    if (!wav) return reportError(wav);

    const FingerprintExtractor extractor(config.fingerprint);
    const auto result = extractor.analyze(wav.value);
    if (!result) return reportError(result);

    const Fingerprint& fp = result.value;
    std::cout << std::fixed << std::setprecision(3)
              << "pad        (" << fp.point.x << ", " << fp.point.y << ")\n"
              << std::setprecision(1)
              << "centroid   " << fp.centroidHz << " Hz\n"
              << "balance    " << fp.balanceDb << " dB (chest/head)\n"
              << "rms        " << fp.rmsDb << " dBFS\n"
              << "duration   " << fp.durationMs << " ms at " << fp.sampleRate << " Hz\n"
              << "frames     " << fp.frameCount << " x " << fp.fftSize << "\n";

    if (fp.isLowConfidence()) {
        std::cout << "confidence low:";
        if (fp.hasFlag(kFingerprintSilent)) std::cout << " silent";
        if (fp.hasFlag(kFingerprintClipped)) std::cout << " clipped";
        if (fp.hasFlag(kFingerprintNonFinite)) std::cout << " non-finite";
        if (fp.hasFlag(kFingerprintNoBandEnergy)) std::cout << " no-band-energy";
        std::cout << "\n";
    }
    return kExitOk;
}

int runSend(const Arguments& args) {
    if (args.positional.size() != 1) {
        printUsage();
        return kExitUsage;
    }
    const auto slot = parseInt(args.positional[0]);
    if (!slot) {
        std::cerr << "slot must be an integer" << std::endl;
        return kExitUsage;
    }

    DirectorySlotStore store(args.option("--slots").value_or("."));
    auto read = store.readSlot(*slot);
    if (!read) return reportError(read);

    DlinSinkConfig sinkConfig;
    sinkConfig.useSudo = args.flag("--sudo");
    if (auto path = args.option("--dlin")) {
        sinkConfig.dlinPath = *path;
    }

    DlinCommandSink::ProcessRunner runner;
    if (args.flag("--dry-run")) {
        runner = [](const std::vector<std::string>& argv) {
            for (const auto& arg : argv) std::cout << arg << ' ';
            std::cout << "\n";
            return 0;
        };
    }
    DlinCommandSink sink(sinkConfig, runner);

    ABSession session(ABState::Base);
    session.setCapturedBase(read.value);
    const Status status = session.dispatch(sink);
    if (!status) return reportError(status);

    std::cout << "slot " << *slot << " sent\n";
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return kExitUsage;
    }

    const std::string_view command = argv[1];
    const auto args = splitArguments(argc, argv, 2);
    if (!args) {
        return kExitUsage;
    }

    if (command == "--version" || args->flag("--version")) {
        std::cout << VOICESHAPER_PROGRAM_NAME " " VOICESHAPER_VERSION_STR "\n";
        return kExitOk;
    }
    if (args->flag("--verbose")) {
        Log::setLevel(spdlog::level::debug);
    }

    EngineConfig config;
    if (Status status = applyConfigOverrides(config, args->options); !status) {
        std::cerr << "error (" << errorCodeName(status.error) << "): " << status.message << std::endl;
        return kExitUsage;
    }

    if (command == "profiles") return runProfiles();
    if (command == "map") return runMap(*args, config);
    if (command == "analyze") return runAnalyze(*args, config);
    if (command == "send") return runSend(*args);

    printUsage();
    return kExitUsage;
}
