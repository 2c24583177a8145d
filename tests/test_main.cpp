// ==============================================================================
// VoiceShaper Tests Main
// ==============================================================================
// Provides Catch2 main() for the voiceshaper_tests executable. Engine logging
// is kept at warn so test output stays readable.
// ==============================================================================

#include <catch2/catch_session.hpp>

#include "logging/logger.h"

int main(int argc, char* argv[]) {
    VoiceShaper::Log::setLevel(spdlog::level::warn);
    return Catch::Session().run(argc, argv);
}
