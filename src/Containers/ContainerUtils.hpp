#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace zxbasic {
namespace ContainerUtils {

// File type byte of a tape/microdrive header
constexpr uint8_t FILE_TYPE_PROGRAM = 0x00;
constexpr uint8_t FILE_TYPE_NUMBER_ARRAY = 0x01;
constexpr uint8_t FILE_TYPE_CHARACTER_ARRAY = 0x02;
constexpr uint8_t FILE_TYPE_CODE = 0x03;

constexpr uint8_t FLAG_HEADER = 0x00;
constexpr uint8_t FLAG_DATA = 0xFF;

constexpr size_t NAME_LENGTH = 10;
constexpr uint16_t NO_AUTOSTART = 0x8000;

/**
 * XOR checksum used by tape and RS232 blocks
 * @param data Bytes to check
 * @param begin First byte (the flag byte)
 * @param end One past the last payload byte
 */
uint8_t xorChecksum(const std::vector<uint8_t>& data, size_t begin, size_t end);
uint8_t xorChecksum(const std::vector<uint8_t>& data);

/**
 * Additive modulo-255 checksum used by Microdrive sectors
 * Never interchangeable with xorChecksum().
 */
uint8_t mdrChecksum(const uint8_t* data, size_t length);
uint8_t mdrChecksum(const std::vector<uint8_t>& data, size_t begin, size_t end);

/**
 * Blank-pad or truncate a name to exactly 10 characters
 */
std::string padName(const std::string& name, size_t length = NAME_LENGTH);

/**
 * Name field as text with trailing blanks removed
 */
std::string readName(const uint8_t* field, size_t length = NAME_LENGTH);

void writeLE16(std::vector<uint8_t>& out, uint16_t value);
void writeLE16(uint8_t* out, uint16_t value);
uint16_t readLE16(const uint8_t* data);
uint32_t readLE24(const uint8_t* data);
uint32_t readLE32(const uint8_t* data);

// Autostart field value (0x8000 when none)
uint16_t autostartField(uint16_t lineNumber, bool enabled);

} // namespace ContainerUtils
} // namespace zxbasic
