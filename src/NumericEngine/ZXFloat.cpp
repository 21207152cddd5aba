#include "ZXFloat.hpp"
#include "Common/ZXError.hpp"
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <iomanip>

namespace zxbasic {
namespace ZXFloat {

namespace {

// Exponent limits of the normalized form 1.m x 2^e
constexpr int MAX_EXPONENT = 126;
constexpr int MIN_EXPONENT = -129;

constexpr double TWO_POW_32 = 4294967296.0;

} // namespace

/**
 * Encode a value in the 5-byte form
 */
ZXNumber encode(double value) {
    if (std::isnan(value) || std::isinf(value)) {
        throw ZXError(ErrorCodes::NUMBER_TOO_BIG, "ERROR - Number too big");
    }

    // Small integer form
    if (value == std::floor(value) &&
        value >= SMALL_INT_MIN && value <= SMALL_INT_MAX) {
        int32_t intValue = static_cast<int32_t>(value);
        if (intValue >= 0) {
            return encodeSmallInteger(static_cast<uint16_t>(intValue));
        }
        uint32_t adjusted = static_cast<uint32_t>(intValue + 65536) & 0xFFFF;
        return ZXNumber(0x00, NEGATIVE_INTEGER,
                        static_cast<uint8_t>(adjusted & 0xFF),
                        static_cast<uint8_t>((adjusted >> 8) & 0xFF),
                        0x00);
    }

    bool negative = value < 0.0;
    double absValue = std::fabs(value);

    // absValue = fraction x 2^ex with fraction in [0.5, 1)
    int ex = 0;
    double fraction = std::frexp(absValue, &ex);
    int exponent = ex - 1; // normalized 1.m x 2^exponent

    // Round half up to 32 significant bits
    uint64_t mantissa = static_cast<uint64_t>(std::floor(fraction * TWO_POW_32 + 0.5));
    if (mantissa >= (static_cast<uint64_t>(1) << 32)) {
        // Rounding carried out of the top bit
        mantissa >>= 1;
        exponent++;
    }

    if (exponent > MAX_EXPONENT || exponent < MIN_EXPONENT) {
        throw ZXError(ErrorCodes::NUMBER_TOO_BIG, "ERROR - Number too big");
    }
    if (exponent == MIN_EXPONENT) {
        // Exponent byte would be zero: the ROM treats this as 0
        return ZXNumber();
    }

    uint32_t bits = static_cast<uint32_t>(mantissa);
    ZXNumber result;
    result.bytes[0] = static_cast<uint8_t>(exponent + 0x81);
    result.bytes[1] = static_cast<uint8_t>(((bits >> 24) & MANTISSA_MASK) | (negative ? SIGN_MASK : 0));
    result.bytes[2] = static_cast<uint8_t>((bits >> 16) & 0xFF);
    result.bytes[3] = static_cast<uint8_t>((bits >> 8) & 0xFF);
    result.bytes[4] = static_cast<uint8_t>(bits & 0xFF);
    return result;
}

ZXNumber encodeSmallInteger(uint16_t value) {
    return ZXNumber(0x00, 0x00,
                    static_cast<uint8_t>(value & 0xFF),
                    static_cast<uint8_t>((value >> 8) & 0xFF),
                    0x00);
}

/**
 * Decode a 5-byte number to IEEE double precision
 */
double decode(const ZXNumber& number) {
    if (number.isSmallInteger()) {
        int32_t magnitude = number.bytes[2] | (number.bytes[3] << 8);
        if (number.bytes[1] == NEGATIVE_INTEGER) {
            return static_cast<double>(magnitude - 65536);
        }
        return static_cast<double>(magnitude);
    }

    int ex = static_cast<int>(number.bytes[0]) - EXPONENT_BIAS;
    double value = std::ldexp(static_cast<double>(number.getMantissaBits()), ex - 32);
    return number.isNegative() ? -value : value;
}

double parseLiteral(const std::string& text) {
    return std::strtod(text.c_str(), nullptr);
}

/**
 * Format a number the way it would be listed
 */
std::string format(const ZXNumber& number) {
    double value = decode(number);

    if (number.isSmallInteger()) {
        return std::to_string(static_cast<int32_t>(value));
    }

    std::ostringstream oss;
    oss << std::setprecision(10) << value;

    // ZX BASIC lists exponents as E+nn / E-nn
    std::string result = oss.str();
    size_t ePos = result.find('e');
    if (ePos != std::string::npos) {
        result[ePos] = 'E';
    }
    return result;
}

void appendNumber(std::vector<uint8_t>& out, const ZXNumber& number) {
    out.push_back(NUMBER_MARKER);
    out.insert(out.end(), number.bytes, number.bytes + NUMBER_SIZE);
}

} // namespace ZXFloat
} // namespace zxbasic
