#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "transcript/timestamp.hpp"

#include <limits>

using Catch::Matchers::WithinAbs;

TEST_CASE("Timestamp parse", "[timestamp]") {

    SECTION("HoursMinutesSeconds") {
        REQUIRE_THAT(timestamp::parse("00:00:02.000"), WithinAbs(2.0, 1e-9));
        REQUIRE_THAT(timestamp::parse("01:02:03.500"), WithinAbs(3723.5, 1e-9));
    }

    SECTION("MinutesSeconds") {
        REQUIRE_THAT(timestamp::parse("00:06.00"), WithinAbs(6.0, 1e-9));
        REQUIRE_THAT(timestamp::parse("12:30.25"), WithinAbs(750.25, 1e-9));
    }

    SECTION("UnboundedMinutes") {
        REQUIRE_THAT(timestamp::parse("75:00.00"), WithinAbs(4500.0, 1e-9));
    }

    SECTION("WrongShapeIsZero") {
        REQUIRE(timestamp::parse("") == 0.0);
        REQUIRE(timestamp::parse("12.5") == 0.0);
        REQUIRE(timestamp::parse("1:2:3:4") == 0.0);
        REQUIRE(timestamp::parse("aa:bb.cc") == 0.0);
        REQUIRE(timestamp::parse("00:1x.00") == 0.0);
    }

    SECTION("NonFiniteIsZero") {
        REQUIRE(timestamp::parse("00:inf") == 0.0);
        REQUIRE(timestamp::parse("00:00:nan") == 0.0);
        REQUIRE(timestamp::parse("00:INFINITY") == 0.0);
        REQUIRE(timestamp::to_canonical("00:inf") == "00:00.00");
    }
}

TEST_CASE("Timestamp render", "[timestamp]") {

    SECTION("ZeroPadded") {
        REQUIRE(timestamp::render(0.0) == "00:00.00");
        REQUIRE(timestamp::render(6.0) == "00:06.00");
        REQUIRE(timestamp::render(18.5) == "00:18.50");
    }

    SECTION("MinutesPastAnHour") {
        REQUIRE(timestamp::render(3723.5) == "62:03.50");
        REQUIRE(timestamp::render(6000.0) == "100:00.00");
    }

    SECTION("RoundingCarriesIntoMinutes") {
        REQUIRE(timestamp::render(59.999) == "01:00.00");
        REQUIRE(timestamp::render(119.996) == "02:00.00");
    }

    SECTION("NegativeClampedToZero") {
        REQUIRE(timestamp::render(-3.0) == "00:00.00");
    }

    SECTION("NonFiniteRendersZero") {
        REQUIRE(timestamp::render(std::numeric_limits<double>::infinity()) == "00:00.00");
        REQUIRE(timestamp::render(-std::numeric_limits<double>::infinity()) == "00:00.00");
        REQUIRE(timestamp::render(std::numeric_limits<double>::quiet_NaN()) == "00:00.00");
        REQUIRE(timestamp::render(1e300) == "00:00.00");
    }
}

TEST_CASE("Timestamp canonical form", "[timestamp]") {

    SECTION("BothDialectsAgree") {
        REQUIRE(timestamp::to_canonical("00:00:18.500") == "00:18.50");
        REQUIRE(timestamp::to_canonical("00:18.50") == "00:18.50");
    }

    SECTION("HoursFoldIntoMinutes") {
        REQUIRE(timestamp::to_canonical("01:00:00.000") == "60:00.00");
    }

    SECTION("RoundTripWithinAHundredth") {
        for (const char* ts : {"00:00:18.505", "00:12:03.999", "02:00:00.001", "07:30:00.000",
                               "00:06.00", "59:59.995", "00:00.004"}) {
            double once = timestamp::parse(ts);
            double again = timestamp::parse(timestamp::render(once));
            REQUIRE_THAT(again, WithinAbs(once, 0.01));
        }
    }

    SECTION("CanonicalIsFixedPoint") {
        for (const char* ts : {"00:00.00", "00:06.00", "03:14.15", "59:59.99", "123:45.67"}) {
            REQUIRE(timestamp::to_canonical(ts) == ts);
        }
    }
}
