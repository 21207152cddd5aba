#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Interface 1 RS232 block format
 *
 * The same header/data pair a tape SAVE produces, streamed over the serial
 * link without the TAP length prefixes:
 * - Header (19 bytes): flag 0x00, type, 10-byte name, length, param1
 *   (autostart), param2 (variables offset), XOR checksum
 * - Data: flag 0xFF, data, XOR checksum
 */

namespace zxbasic {
namespace Rs232Block {

constexpr size_t HEADER_BLOCK_SIZE = 19;
constexpr size_t MIN_PACKAGE_SIZE = 21;
constexpr uint16_t MAX_AUTOSTART_LINE = 9999;
constexpr uint16_t NO_AUTOSTART = 32768;

struct HeaderBlock {
    uint8_t type = 0;
    std::string filename;       // Trailing blanks removed
    uint16_t dataLength = 0;
    uint16_t param1 = 0;        // Autostart line, 32768 and above for none
    uint16_t param2 = 0;        // Variables offset
};

struct PackageValidation {
    bool valid = false;
    std::optional<HeaderBlock> header;
    std::vector<uint8_t> programData;
    std::string error;
    uint16_t errorCode = 0;     // TRUNCATED_CONTAINER or CHECKSUM_MISMATCH when invalid
};

/**
 * Strip non-printable characters, then truncate and blank-pad to 10
 */
std::string normalizeFilename(const std::string& name);

/**
 * Program header block
 * @param autostartLine Autostart line, 0 or anything above 9999 for none
 * @param variablesOffset Offset of the variables area, program length when unset
 */
std::vector<uint8_t> createProgramHeader(const std::string& filename, uint16_t dataLength,
                                         uint16_t autostartLine = 0,
                                         std::optional<uint16_t> variablesOffset = std::nullopt);

std::vector<uint8_t> createDataBlock(const std::vector<uint8_t>& data);

/**
 * Header block followed by data block
 */
std::vector<uint8_t> createProgramPackage(const std::string& filename,
                                          const std::vector<uint8_t>& basicData,
                                          uint16_t autostartLine = 0);

/**
 * @return Header, or nullopt on a short block, wrong flag or bad checksum
 */
std::optional<HeaderBlock> parseHeaderBlock(const std::vector<uint8_t>& block);

/**
 * @return Data without flag and checksum, or nullopt when invalid
 */
std::optional<std::vector<uint8_t>> parseDataBlock(const std::vector<uint8_t>& block);

PackageValidation validateProgramPackage(const std::vector<uint8_t>& data);

} // namespace Rs232Block
} // namespace zxbasic
