#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * ZX Spectrum 5-byte Number Format
 *
 * Every numeric literal in a tokenized program line is stored twice: the
 * ASCII spelling as typed, followed by the marker byte 0x0E and this
 * 5-byte binary form.
 *
 * Small integer form (whole numbers in -65536..65535):
 * - Byte 0: 0x00
 * - Byte 1: sign, 0x00 positive or 0xFF negative
 * - Bytes 2-3: value, little-endian (value + 65536 when negative)
 * - Byte 4: 0x00
 *
 * Floating point form (value = 0.1m x 2^(e - 0x80)):
 * - Byte 0: exponent e, bias 0x80 on the frexp() exponent
 * - Byte 1: sign bit (0x80) + top 7 mantissa bits
 * - Bytes 2-4: remaining mantissa bits, most significant first
 * - The leading mantissa bit is implicit, its place holds the sign
 */

namespace zxbasic {
namespace ZXFloat {

constexpr uint8_t NUMBER_MARKER = 0x0E;
constexpr uint8_t EXPONENT_BIAS = 0x80;
constexpr uint8_t SIGN_MASK = 0x80;
constexpr uint8_t MANTISSA_MASK = 0x7F;
constexpr uint8_t NEGATIVE_INTEGER = 0xFF;
constexpr int32_t SMALL_INT_MIN = -65536;
constexpr int32_t SMALL_INT_MAX = 65535;
constexpr size_t NUMBER_SIZE = 5;

/**
 * ZXNumber - one 5-byte number as stored after the 0x0E marker
 */
struct ZXNumber {
    uint8_t bytes[NUMBER_SIZE];

    ZXNumber() : bytes{0, 0, 0, 0, 0} {}
    ZXNumber(uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3, uint8_t b4)
        : bytes{b0, b1, b2, b3, b4} {}

    // Construct from byte array
    explicit ZXNumber(const uint8_t data[NUMBER_SIZE])
        : bytes{data[0], data[1], data[2], data[3], data[4]} {}

    // Convert to byte array
    void toBytes(uint8_t data[NUMBER_SIZE]) const {
        for (size_t i = 0; i < NUMBER_SIZE; i++) data[i] = bytes[i];
    }

    bool isSmallInteger() const { return bytes[0] == 0; }
    bool isZero() const {
        return bytes[0] == 0 && bytes[2] == 0 && bytes[3] == 0 && bytes[1] == 0;
    }
    bool isNegative() const {
        return isSmallInteger() ? bytes[1] == NEGATIVE_INTEGER
                                : (bytes[1] & SIGN_MASK) != 0;
    }

    // 32-bit mantissa with the implicit leading bit restored
    uint32_t getMantissaBits() const {
        return 0x80000000u |
               (static_cast<uint32_t>(bytes[1] & MANTISSA_MASK) << 24) |
               (static_cast<uint32_t>(bytes[2]) << 16) |
               (static_cast<uint32_t>(bytes[3]) << 8) |
               bytes[4];
    }

    bool operator==(const ZXNumber& other) const {
        for (size_t i = 0; i < NUMBER_SIZE; i++) {
            if (bytes[i] != other.bytes[i]) return false;
        }
        return true;
    }
    bool operator!=(const ZXNumber& other) const { return !(*this == other); }
};

// Conversion functions

/**
 * Encode a value in the 5-byte form
 * Whole numbers in -65536..65535 use the small integer form.
 * @throws zxbasic::ZXError NUMBER_TOO_BIG when the exponent does not fit
 */
ZXNumber encode(double value);

/**
 * Encode a 16-bit unsigned value in the small integer form (BIN literals)
 */
ZXNumber encodeSmallInteger(uint16_t value);

/**
 * Decode a 5-byte number to IEEE double precision
 */
double decode(const ZXNumber& number);

// String conversion

/**
 * Parse the ASCII spelling of a numeric literal ("12", "3.5", ".5", "1E-3")
 * @return Parsed value; infinite when out of range for a double
 */
double parseLiteral(const std::string& text);

/**
 * Format a number the way it would be listed when no ASCII spelling exists
 */
std::string format(const ZXNumber& number);

// Append marker + 5 bytes to a token buffer
void appendNumber(std::vector<uint8_t>& out, const ZXNumber& number);

} // namespace ZXFloat
} // namespace zxbasic
