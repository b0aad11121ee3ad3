// ==============================================================================
// Layer 0: Core Utility Tests - dB conversion
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <gyro/dsp/core/db_utils.h>

#include <limits>

using Catch::Approx;
using namespace Gyro::DSP;

TEST_CASE("dbToGain converts decibels to linear gain", "[db_utils]") {
    REQUIRE(dbToGain(0.0) == Approx(1.0));
    REQUIRE(dbToGain(-20.0) == Approx(0.1));
    REQUIRE(dbToGain(20.0) == Approx(10.0));
    REQUIRE(dbToGain(std::numeric_limits<double>::quiet_NaN()) == 0.0);
}

TEST_CASE("gainToDb converts gain to decibels with a silence floor", "[db_utils]") {
    SECTION("regular values") {
        REQUIRE(gainToDb(1.0) == Approx(0.0).margin(1e-12));
        REQUIRE(gainToDb(0.5) == Approx(-6.0206).margin(1e-4));
        REQUIRE(gainToDb(10.0) == Approx(20.0));
    }

    SECTION("zero, negative and NaN hit the floor") {
        REQUIRE(gainToDb(0.0) == kSilenceFloorDb);
        REQUIRE(gainToDb(-1.0) == kSilenceFloorDb);
        REQUIRE(gainToDb(std::numeric_limits<double>::quiet_NaN()) == kSilenceFloorDb);
    }

    SECTION("tiny gains clamp to the floor") {
        REQUIRE(gainToDb(1e-12) == kSilenceFloorDb);
    }
}

TEST_CASE("magnitudeToDb adds the spectral floor before the logarithm", "[db_utils]") {
    REQUIRE(magnitudeToDb(1.0) == Approx(0.0).margin(1e-8));
    REQUIRE(magnitudeToDb(0.0) == Approx(-200.0));
    REQUIRE(magnitudeToDb(0.1) == Approx(-20.0).margin(1e-6));
}

TEST_CASE("isFiniteBits and isNaNBits classify special values", "[db_utils]") {
    REQUIRE(detail::isFiniteBits(0.0));
    REQUIRE(detail::isFiniteBits(-1e300));
    REQUIRE_FALSE(detail::isFiniteBits(std::numeric_limits<double>::infinity()));
    REQUIRE_FALSE(detail::isFiniteBits(std::numeric_limits<double>::quiet_NaN()));
    REQUIRE(detail::isNaNBits(std::numeric_limits<double>::quiet_NaN()));
    REQUIRE_FALSE(detail::isNaNBits(std::numeric_limits<double>::infinity()));
}
