#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * ZX Spectrum TAP Tape Image
 *
 * A TAP file is a sequence of blocks, each prefixed by its length:
 * - 2 bytes: block length, little-endian (flag + payload + checksum)
 * - 1 byte: flag (0x00 header, 0xFF data)
 * - payload
 * - 1 byte: XOR of flag and payload
 *
 * A BASIC program is saved as a 17-byte header block followed by a data
 * block holding the program image.
 */

namespace zxbasic {
namespace TapFormat {

constexpr uint16_t HEADER_BLOCK_LENGTH = 19;
constexpr size_t HEADER_PAYLOAD_SIZE = 17;

// Parser states
enum class ParseState {
    AwaitingBlock,
    ReadingLength,
    ReadingPayload,
    VerifyingChecksum,
    Error
};

struct TapBlock {
    std::vector<uint8_t> data;  // Flag, payload and checksum
    size_t blockNumber;
    size_t offset;              // Offset of the length prefix in the file
    bool checksumValid;

    uint8_t flag() const { return data.empty() ? 0 : data[0]; }
};

struct TapParseResult {
    bool success = false;
    std::vector<TapBlock> blocks;
    std::string error;
    uint16_t errorCode = 0;     // ErrorCodes value when success is false
    size_t errorOffset = 0;
};

struct TapHeader {
    uint8_t fileType = 0;
    std::string programName;
    uint16_t programLength = 0;
    std::optional<uint16_t> autostart;  // Unset for 0x8000 and above
    uint16_t variablesOffset = 0;
};

struct TapProgram {
    TapHeader header;
    std::vector<uint8_t> image;         // Program as stored in memory
};

/**
 * Create a program header block (with length prefix)
 * @param name Program name, blank-padded or truncated to 10 characters
 * @param programLength Length of the program image
 * @param autostart Autostart line, none when unset
 */
std::vector<uint8_t> createHeaderBlock(const std::string& name, uint16_t programLength,
                                       std::optional<uint16_t> autostart = std::nullopt);

/**
 * Create a data block (with length prefix)
 */
std::vector<uint8_t> createDataBlock(const std::vector<uint8_t>& data);

/**
 * Create a complete TAP file: header block + data block
 */
std::vector<uint8_t> createTapFile(const std::vector<uint8_t>& programImage, const std::string& name,
                                   std::optional<uint16_t> autostart = std::nullopt);

/**
 * Split a TAP file into blocks
 * @param data TAP file contents
 * @param strict Treat a checksum mismatch as a parse error
 * @return Blocks, or the error and the offset it was found at
 */
TapParseResult parseTapFile(const std::vector<uint8_t>& data, bool strict = false);

/**
 * Decode a program header block
 * @return Header, or nullopt if the block is not a program header
 */
std::optional<TapHeader> parseHeader(const TapBlock& block);

/**
 * Header of the first block of a TAP file
 */
std::optional<TapHeader> getTapMetadata(const std::vector<uint8_t>& data);

/**
 * Verify every block checksum
 * @return false on a mismatch or a malformed file
 */
bool verifyTapChecksums(const std::vector<uint8_t>& data);

/**
 * Find the first BASIC program (header + data block)
 * @throws ZXError when the file is malformed or holds no program
 */
TapProgram extractProgram(const std::vector<uint8_t>& data);

} // namespace TapFormat
} // namespace zxbasic
