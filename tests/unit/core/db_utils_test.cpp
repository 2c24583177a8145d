// ==============================================================================
// Level and Ratio Conversions - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: src/dsp/core/db_utils.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "dsp/core/db_utils.h"

#include <array>
#include <cmath>
#include <limits>

using namespace VoiceShaper::DSP;
using Catch::Approx;

// ==============================================================================
// gainToDb
// ==============================================================================

TEST_CASE("gainToDb converts linear amplitude to decibels", "[dsp][core][db_utils]") {

    SECTION("unity gain is exactly 0 dB") {
        REQUIRE(gainToDb(1.0f) == 0.0f);
    }

    SECTION("0.1 is -20 dB") {
        REQUIRE(gainToDb(0.1f) == Approx(-20.0f));
    }

    SECTION("0.5 is about -6.02 dB") {
        REQUIRE(gainToDb(0.5f) == Approx(-6.0206f).margin(0.001f));
    }

    SECTION("gain above unity is positive") {
        REQUIRE(gainToDb(10.0f) == Approx(20.0f));
    }
}

TEST_CASE("gainToDb floors silence", "[dsp][core][db_utils]") {
    REQUIRE(gainToDb(0.0f) == kSilenceFloorDb);
    REQUIRE(gainToDb(-0.5f) == kSilenceFloorDb);
    REQUIRE(gainToDb(std::numeric_limits<float>::quiet_NaN()) == kSilenceFloorDb);
    REQUIRE(gainToDb(1e-10f) == kSilenceFloorDb);
}

// ==============================================================================
// powerRatioToDb
// ==============================================================================

TEST_CASE("powerRatioToDb uses 10*log10", "[dsp][core][db_utils]") {
    REQUIRE(powerRatioToDb(1.0f) == 0.0f);
    REQUIRE(powerRatioToDb(100.0f) == Approx(20.0f));
    REQUIRE(powerRatioToDb(0.01f) == Approx(-20.0f));
    REQUIRE(powerRatioToDb(1e12f) == Approx(120.0f));

    SECTION("non-positive and NaN ratios floor") {
        REQUIRE(powerRatioToDb(0.0f) == kSilenceFloorDb);
        REQUIRE(powerRatioToDb(std::numeric_limits<float>::quiet_NaN()) == kSilenceFloorDb);
    }
}

// ==============================================================================
// rmsDb
// ==============================================================================

TEST_CASE("rmsDb measures block level", "[dsp][core][db_utils]") {

    SECTION("constant full scale is 0 dB") {
        const std::array<float, 8> block = {1.0f, -1.0f, 1.0f, -1.0f, 1.0f, -1.0f, 1.0f, -1.0f};
        REQUIRE(rmsDb(block.data(), block.size()) == Approx(0.0f).margin(1e-5f));
    }

    SECTION("half scale constant is about -6 dB") {
        const std::array<float, 4> block = {0.5f, 0.5f, -0.5f, -0.5f};
        REQUIRE(rmsDb(block.data(), block.size()) == Approx(-6.0206f).margin(0.001f));
    }

    SECTION("silence and empty input floor") {
        const std::array<float, 4> zeros{};
        REQUIRE(rmsDb(zeros.data(), zeros.size()) == kSilenceFloorDb);
        REQUIRE(rmsDb(nullptr, 16) == kSilenceFloorDb);
        REQUIRE(rmsDb(zeros.data(), 0) == kSilenceFloorDb);
    }
}

TEST_CASE("NaN detection is constexpr-safe", "[dsp][core][db_utils]") {
    STATIC_REQUIRE_FALSE(detail::isNaN(1.0f));
    STATIC_REQUIRE_FALSE(detail::isNaN(std::numeric_limits<float>::infinity()));
    STATIC_REQUIRE(detail::isNaN(std::numeric_limits<float>::quiet_NaN()));
}
