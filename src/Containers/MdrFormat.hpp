#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Sinclair Microdrive Cartridge Image (MDR)
 *
 * 254 sectors of 543 bytes followed by a write protection byte. Sectors
 * are stored from number 254 (file offset 0) down to 1.
 *
 * Sector layout:
 * - 0: header flag (0x01)
 * - 1: sector number
 * - 2-3: unused
 * - 4-13: cartridge name, blank-padded
 * - 14: header checksum over bytes 0-13
 * - 15: record flags (bit 1 = last record of a file, bit 2 = PRINT file)
 * - 16: record sequence number within the file
 * - 17-18: bytes used in this record, little-endian
 * - 19-28: file name, blank-padded
 * - 29: record checksum over bytes 15-28
 * - 30-541: data
 * - 542: data checksum over bytes 30-541
 *
 * All checksums are the additive modulo-255 sum, not XOR.
 *
 * The first record of a file starts with a 9-byte header: type, data
 * length, start address, program length and autostart line.
 */

namespace zxbasic {
namespace MdrFormat {

constexpr size_t SECTOR_SIZE = 543;
constexpr size_t TOTAL_SECTORS = 254;
constexpr size_t FILE_SIZE = TOTAL_SECTORS * SECTOR_SIZE + 1;
constexpr size_t HEADER_SIZE = 15;
constexpr size_t RECORD_SIZE = 15;
constexpr size_t DATA_SIZE = 512;

constexpr size_t HEADER_OFFSET = 0;
constexpr size_t RECORD_OFFSET = 15;
constexpr size_t DATA_OFFSET = 30;
constexpr size_t DATA_CHECKSUM_OFFSET = 542;

constexpr uint8_t HEADER_FLAG = 0x01;
constexpr uint8_t RECORD_FLAG_EOF = 0x02;
constexpr uint8_t RECORD_FLAG_PRINT = 0x04;

constexpr size_t FILE_HEADER_SIZE = 9;
constexpr uint16_t PROGRAM_START = 0x5CCB;
constexpr uint16_t NO_AUTOSTART = 0xFFFF;

/**
 * Error recovery policies (combine with |)
 */
enum MdrErrorPolicy : uint32_t {
    POLICY_NONE = 0x0000,               // Report checksum errors and drop the sector
    FIX_HEADER = 0x0001,                // Recompute broken header checksums
    FIX_RECORD = 0x0002,                // Recompute broken record checksums
    FIX_DATA = 0x0004,                  // Recompute broken data checksums
    ACCEPT_ERRORS = 0x0008,             // Use sectors despite checksum errors
    OVERWRITE_SECTORS = 0x0010,         // Replace a file of the same name when writing
    ALLOW_NONSTANDARD = 0x0040          // Accept images without the protection byte or with fewer sectors
};

/**
 * One 543-byte sector with field accessors
 */
struct MdrSector {
    std::array<uint8_t, SECTOR_SIZE> bytes;

    MdrSector() { bytes.fill(0); }
    explicit MdrSector(const uint8_t* data);

    uint8_t headerFlag() const { return bytes[0]; }
    uint8_t sectorNumber() const { return bytes[1]; }
    std::string cartridgeName() const;
    uint8_t headerChecksum() const { return bytes[14]; }

    uint8_t recordFlags() const { return bytes[15]; }
    uint8_t sequence() const { return bytes[16]; }
    uint16_t recordLength() const { return static_cast<uint16_t>(bytes[17] | (bytes[18] << 8)); }
    std::string filename() const;
    std::string rawFilename() const;
    uint8_t recordChecksum() const { return bytes[29]; }

    const uint8_t* data() const { return bytes.data() + DATA_OFFSET; }
    uint8_t dataChecksum() const { return bytes[DATA_CHECKSUM_OFFSET]; }

    bool isEof() const { return (recordFlags() & RECORD_FLAG_EOF) != 0; }
    bool isPrintFile() const { return (recordFlags() & RECORD_FLAG_PRINT) != 0; }
    bool isInUse() const { return recordLength() != 0 || isEof(); }

    void setHeader(uint8_t number, const std::string& cartridge);
    void setRecord(uint8_t flags, uint8_t sequenceNumber, const std::vector<uint8_t>& chunk,
                   const std::string& name);
    void clearRecord();
    void updateChecksums();
};

enum class MdrErrorType {
    HeaderChecksum,
    RecordChecksum,
    DataChecksum,
    Structure
};

struct MdrError {
    uint8_t sector;
    MdrErrorType type;
    std::string message;
    uint8_t expected = 0;
    uint8_t actual = 0;
};

struct MdrProgram {
    std::string name;
    std::string source;             // Listing
    uint8_t sector;                 // Sector of the first record
    std::optional<uint16_t> autostart;
    std::vector<uint8_t> image;     // Program as stored in memory
};

struct MdrMetadata {
    std::vector<MdrSector> sectors;
    bool writeProtected = false;
    std::string cartridgeName;
};

struct MdrParseResult {
    std::vector<MdrProgram> programs;
    MdrMetadata metadata;
    std::vector<MdrError> errors;
};

struct MdrInfo {
    std::string cartridgeName;
    size_t totalSectors = 0;
    size_t usedSectors = 0;
    size_t freeSectors = 0;
    bool writeProtected = false;
    std::vector<std::string> files;
};

/**
 * Check the three checksums of a sector
 * @return Errors, empty if the sector is intact
 */
std::vector<MdrError> validateMdrSector(const MdrSector& sector);

/**
 * Recompute the checksums the policy allows
 * @return true if any checksum was changed
 */
bool repairMdrSector(MdrSector& sector, uint32_t policy);

/**
 * Formatted cartridge with no files
 */
std::vector<uint8_t> createEmptyMdr(const std::string& cartridgeName = "EMPTY");

/**
 * Save a program to a cartridge image
 * @param cartridge Existing image, modified in place
 * @param programImage Program as stored in memory
 * @param programName File name, truncated to 10 characters
 * @param autostart Autostart line, none when unset
 * @param policy OVERWRITE_SECTORS replaces a file of the same name
 * @throws ZXError when the image is invalid, protected or full
 */
void addProgram(std::vector<uint8_t>& cartridge, const std::vector<uint8_t>& programImage,
                const std::string& programName, std::optional<uint16_t> autostart,
                uint32_t policy = POLICY_NONE);

/**
 * New cartridge image holding one program
 */
std::vector<uint8_t> createMdrFile(const std::vector<uint8_t>& programImage, const std::string& programName,
                                   const std::string& cartridgeName,
                                   std::optional<uint16_t> autostart = std::nullopt);

/**
 * Read every BASIC program from a cartridge image
 * @throws ZXError BAD_CONTAINER_SIZE when the image size is wrong
 */
MdrParseResult parseMdrFile(const std::vector<uint8_t>& buffer, uint32_t policy = POLICY_NONE);

/**
 * Sector by number (254 is stored first)
 */
std::optional<MdrSector> getMdrSector(const std::vector<uint8_t>& buffer, uint8_t sectorNumber);

/**
 * Size and header checksums look like a cartridge image
 */
bool isValidMdrFile(const std::vector<uint8_t>& buffer);

/**
 * Usage summary of a cartridge image
 * @throws ZXError BAD_CONTAINER_SIZE when the image size is wrong
 */
MdrInfo getMdrInfo(const std::vector<uint8_t>& buffer);

} // namespace MdrFormat
} // namespace zxbasic
