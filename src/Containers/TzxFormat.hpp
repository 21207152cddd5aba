#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * ZX Spectrum TZX Tape Image
 *
 * Header: "ZXTape!" 0x1A major minor, followed by blocks that each start
 * with an ID byte. Standard speed data blocks (0x10) carry exactly the
 * contents of a TAP block:
 * - 2 bytes: pause after the block in ms, little-endian
 * - 2 bytes: data length, little-endian
 * - data (flag, payload, checksum)
 *
 * Only 0x10 and 0x30 blocks are written. Every block type of TZX 1.20 is
 * recognized when reading so that its length can be skipped.
 */

namespace zxbasic {
namespace TzxFormat {

constexpr char SIGNATURE[] = "ZXTape!";
constexpr uint8_t EOF_MARKER = 0x1A;
constexpr uint8_t MAJOR_VERSION = 1;
constexpr uint8_t MINOR_VERSION = 20;
constexpr size_t HEADER_SIZE = 10;

constexpr uint8_t BLOCK_STANDARD_SPEED = 0x10;
constexpr uint8_t BLOCK_TEXT_DESCRIPTION = 0x30;
constexpr uint16_t DEFAULT_PAUSE_MS = 1000;
constexpr size_t MAX_DESCRIPTION_LENGTH = 255;

struct TzxBlock {
    uint8_t id;
    std::vector<uint8_t> data;  // Block body without the ID byte
    size_t offset;              // Offset of the ID byte in the file
};

struct TzxFile {
    uint8_t majorVersion = 0;
    uint8_t minorVersion = 0;
    std::vector<TzxBlock> blocks;
    std::vector<std::string> warnings;
};

struct TzxMetadata {
    std::string version;
    size_t blockCount = 0;
    std::optional<std::string> description;
};

/**
 * Wrap every TAP block in a standard speed data block
 * @throws ZXError when the TAP data is malformed
 */
std::vector<uint8_t> convertTapToTzx(const std::vector<uint8_t>& tapData);

/**
 * Same as convertTapToTzx() with a text description block first
 * The description is cut to 255 characters.
 */
std::vector<uint8_t> createTzxWithDescription(const std::vector<uint8_t>& tapData,
                                              const std::string& description);

/**
 * Split a TZX file into blocks
 * Unknown block IDs are skipped through the 4-byte length that follows
 * the ID in every extension block, with a warning.
 * @throws ZXError BAD_SIGNATURE, TRUNCATED_CONTAINER or UNKNOWN_BLOCK
 */
TzxFile parseTzxFile(const std::vector<uint8_t>& tzxData);

/**
 * Rebuild a TAP file from the standard speed data blocks
 */
std::vector<uint8_t> convertTzxToTap(const std::vector<uint8_t>& tzxData);

TzxMetadata getTzxMetadata(const std::vector<uint8_t>& tzxData);

/**
 * Human-readable name of a block ID, empty if unknown
 */
std::string getBlockName(uint8_t id);

} // namespace TzxFormat
} // namespace zxbasic
