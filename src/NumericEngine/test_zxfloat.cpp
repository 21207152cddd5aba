#include <catch2/catch_all.hpp>
#include "ZXFloat.hpp"
#include "Common/ZXError.hpp"

using namespace zxbasic;
using namespace zxbasic::ZXFloat;

TEST_CASE("ZXFloat small integers", "[zxfloat]") {
    SECTION("Positive values") {
        REQUIRE(encode(0) == ZXNumber(0x00, 0x00, 0x00, 0x00, 0x00));
        REQUIRE(encode(5) == ZXNumber(0x00, 0x00, 0x05, 0x00, 0x00));
        REQUIRE(encode(10) == ZXNumber(0x00, 0x00, 0x0A, 0x00, 0x00));
        REQUIRE(encode(65535) == ZXNumber(0x00, 0x00, 0xFF, 0xFF, 0x00));
    }

    SECTION("Negative values") {
        REQUIRE(encode(-1) == ZXNumber(0x00, 0xFF, 0xFF, 0xFF, 0x00));
        REQUIRE(encode(-256) == ZXNumber(0x00, 0xFF, 0x00, 0xFF, 0x00));
        REQUIRE(encode(-1).isNegative());
    }

    SECTION("BIN literal form") {
        REQUIRE(encodeSmallInteger(0xFFFF) == ZXNumber(0x00, 0x00, 0xFF, 0xFF, 0x00));
        REQUIRE(encodeSmallInteger(5).isSmallInteger());
    }

    SECTION("Decode") {
        REQUIRE(decode(encode(1234)) == 1234.0);
        REQUIRE(decode(encode(-42)) == -42.0);
        REQUIRE(decode(encode(65535)) == 65535.0);
    }
}

TEST_CASE("ZXFloat floating point form", "[zxfloat]") {
    SECTION("Known ROM encodings") {
        REQUIRE(encode(0.5) == ZXNumber(0x80, 0x00, 0x00, 0x00, 0x00));
        REQUIRE(encode(1.5) == ZXNumber(0x81, 0x40, 0x00, 0x00, 0x00));
        REQUIRE(encode(0.1) == ZXNumber(0x7D, 0x4C, 0xCC, 0xCC, 0xCD));
        REQUIRE(encode(-0.5) == ZXNumber(0x80, 0x80, 0x00, 0x00, 0x00));
    }

    SECTION("Integers outside the small range") {
        ZXNumber number = encode(100000);
        REQUIRE_FALSE(number.isSmallInteger());
        REQUIRE(number == ZXNumber(0x91, 0x43, 0x50, 0x00, 0x00));
        REQUIRE(decode(number) == 100000.0);

        REQUIRE_FALSE(encode(-65537).isSmallInteger());
        REQUIRE(decode(encode(-65537)) == -65537.0);
    }

    SECTION("Decode is close to the encoded value") {
        REQUIRE(decode(encode(3.14159)) == Catch::Approx(3.14159).epsilon(1e-9));
        REQUIRE(decode(encode(-2.75)) == -2.75);
        REQUIRE(decode(encode(1e-10)) == Catch::Approx(1e-10).epsilon(1e-9));
        REQUIRE(decode(encode(1e30)) == Catch::Approx(1e30).epsilon(1e-9));
    }

    SECTION("Mantissa keeps the implied top bit") {
        ZXNumber number = encode(1.5);
        REQUIRE(number.getMantissaBits() == 0xC0000000u);
    }
}

TEST_CASE("ZXFloat range limits", "[zxfloat]") {
    SECTION("Largest exponents are accepted") {
        REQUIRE_NOTHROW(encode(1e38));
        REQUIRE_NOTHROW(encode(1e-38));
    }

    SECTION("Overflow is reported") {
        REQUIRE_THROWS_AS(encode(1e39), ZXError);
        try {
            encode(1e39);
        } catch (const ZXError& e) {
            REQUIRE(e.getErrorCode() == ErrorCodes::NUMBER_TOO_BIG);
        }
    }

    SECTION("Underflow is reported") {
        REQUIRE_THROWS_AS(encode(1e-45), ZXError);
    }
}

TEST_CASE("ZXFloat literals and listing", "[zxfloat]") {
    SECTION("Literal spellings") {
        REQUIRE(parseLiteral("12") == 12.0);
        REQUIRE(parseLiteral(".5") == 0.5);
        REQUIRE(parseLiteral("1E3") == 1000.0);
        REQUIRE(parseLiteral("2.5e-1") == 0.25);
    }

    SECTION("Format") {
        REQUIRE(format(encode(10)) == "10");
        REQUIRE(format(encode(-3)) == "-3");
        REQUIRE(format(encode(0.5)) == "0.5");
        REQUIRE(format(encode(1e20)) == "1E+20");
    }

    SECTION("Append writes the marker and five bytes") {
        std::vector<uint8_t> out;
        appendNumber(out, encode(5));
        REQUIRE(out == std::vector<uint8_t>{0x0E, 0x00, 0x00, 0x05, 0x00, 0x00});
    }
}
