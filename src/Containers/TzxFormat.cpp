#include "TzxFormat.hpp"
#include "ContainerUtils.hpp"
#include "TapFormat.hpp"
#include "Common/ZXError.hpp"
#include <cstring>
#include <sstream>
#include <iomanip>

namespace zxbasic {
namespace TzxFormat {

using namespace ContainerUtils;

namespace {

/**
 * Body length of a block: fixedSize + multiplier * length field
 * The length field (lengthBytes wide, at lengthOffset) always lies inside
 * the fixed part.
 */
struct BlockRule {
    uint8_t id;
    const char* name;
    size_t fixedSize;
    size_t lengthOffset;
    size_t lengthBytes;
    size_t multiplier;
};

const BlockRule BLOCK_RULES[] = {
    {0x10, "Standard speed data", 4, 2, 2, 1},
    {0x11, "Turbo speed data", 18, 15, 3, 1},
    {0x12, "Pure tone", 4, 0, 0, 0},
    {0x13, "Pulse sequence", 1, 0, 1, 2},
    {0x14, "Pure data", 10, 7, 3, 1},
    {0x15, "Direct recording", 8, 5, 3, 1},
    {0x18, "CSW recording", 4, 0, 4, 1},
    {0x19, "Generalized data", 4, 0, 4, 1},
    {0x20, "Pause", 2, 0, 0, 0},
    {0x21, "Group start", 1, 0, 1, 1},
    {0x22, "Group end", 0, 0, 0, 0},
    {0x23, "Jump to block", 2, 0, 0, 0},
    {0x24, "Loop start", 2, 0, 0, 0},
    {0x25, "Loop end", 0, 0, 0, 0},
    {0x26, "Call sequence", 2, 0, 2, 2},
    {0x27, "Return from sequence", 0, 0, 0, 0},
    {0x28, "Select block", 2, 0, 2, 1},
    {0x2A, "Stop the tape if in 48K mode", 4, 0, 0, 0},
    {0x2B, "Set signal level", 5, 0, 0, 0},
    {0x30, "Text description", 1, 0, 1, 1},
    {0x31, "Message", 2, 1, 1, 1},
    {0x32, "Archive info", 2, 0, 2, 1},
    {0x33, "Hardware type", 1, 0, 1, 3},
    {0x35, "Custom info", 20, 16, 4, 1},
    {0x5A, "Glue", 9, 0, 0, 0},
};

const BlockRule* findRule(uint8_t id) {
    for (const auto& rule : BLOCK_RULES) {
        if (rule.id == id) return &rule;
    }
    return nullptr;
}

uint32_t readLength(const uint8_t* data, size_t bytes) {
    switch (bytes) {
        case 1: return data[0];
        case 2: return readLE16(data);
        case 3: return readLE24(data);
        case 4: return readLE32(data);
        default: return 0;
    }
}

std::string hexId(uint8_t id) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id);
    return oss.str();
}

std::vector<uint8_t> createHeader() {
    std::vector<uint8_t> header(SIGNATURE, SIGNATURE + std::strlen(SIGNATURE));
    header.push_back(EOF_MARKER);
    header.push_back(MAJOR_VERSION);
    header.push_back(MINOR_VERSION);
    return header;
}

void appendStandardSpeedBlock(std::vector<uint8_t>& out, const std::vector<uint8_t>& blockData) {
    out.push_back(BLOCK_STANDARD_SPEED);
    writeLE16(out, DEFAULT_PAUSE_MS);
    writeLE16(out, static_cast<uint16_t>(blockData.size()));
    out.insert(out.end(), blockData.begin(), blockData.end());
}

void appendTapBlocks(std::vector<uint8_t>& out, const std::vector<uint8_t>& tapData) {
    TapFormat::TapParseResult parsed = TapFormat::parseTapFile(tapData);
    if (!parsed.success) {
        throw ZXError(parsed.errorCode, "Invalid TAP data: " + parsed.error, 0, parsed.errorOffset);
    }
    for (const auto& block : parsed.blocks) {
        appendStandardSpeedBlock(out, block.data);
    }
}

} // namespace

std::vector<uint8_t> convertTapToTzx(const std::vector<uint8_t>& tapData) {
    std::vector<uint8_t> tzx = createHeader();
    appendTapBlocks(tzx, tapData);
    return tzx;
}

std::vector<uint8_t> createTzxWithDescription(const std::vector<uint8_t>& tapData,
                                              const std::string& description) {
    std::vector<uint8_t> tzx = createHeader();

    if (!description.empty()) {
        std::string text = description.substr(0, MAX_DESCRIPTION_LENGTH);
        tzx.push_back(BLOCK_TEXT_DESCRIPTION);
        tzx.push_back(static_cast<uint8_t>(text.size()));
        tzx.insert(tzx.end(), text.begin(), text.end());
    }

    appendTapBlocks(tzx, tapData);
    return tzx;
}

TzxFile parseTzxFile(const std::vector<uint8_t>& tzxData) {
    if (tzxData.size() < HEADER_SIZE) {
        throw ZXError(ErrorCodes::BAD_SIGNATURE, "Invalid TZX file: too short");
    }
    if (std::memcmp(tzxData.data(), SIGNATURE, std::strlen(SIGNATURE)) != 0 ||
        tzxData[7] != EOF_MARKER) {
        throw ZXError(ErrorCodes::BAD_SIGNATURE, "Invalid TZX file: bad signature");
    }

    TzxFile file;
    file.majorVersion = tzxData[8];
    file.minorVersion = tzxData[9];

    size_t offset = HEADER_SIZE;
    while (offset < tzxData.size()) {
        size_t blockStart = offset;
        uint8_t id = tzxData[offset++];
        size_t available = tzxData.size() - offset;
        const uint8_t* body = tzxData.data() + offset;
        size_t length = 0;

        const BlockRule* rule = findRule(id);
        if (rule) {
            if (available < rule->fixedSize) {
                throw ZXError(ErrorCodes::TRUNCATED_CONTAINER,
                              "Invalid TZX file: block " + hexId(id) + " at offset " +
                              std::to_string(blockStart) + " is truncated",
                              0, blockStart);
            }
            length = rule->fixedSize +
                     rule->multiplier * readLength(body + rule->lengthOffset, rule->lengthBytes);
        } else {
            // Extension rule: DWORD length after the ID
            if (available < 4 || 4 + static_cast<size_t>(readLE32(body)) > available) {
                throw ZXError(ErrorCodes::UNKNOWN_BLOCK,
                              "Invalid TZX file: unknown block " + hexId(id) + " at offset " +
                              std::to_string(blockStart),
                              0, blockStart);
            }
            length = 4 + static_cast<size_t>(readLE32(body));
            file.warnings.push_back("Unknown TZX block ID: " + hexId(id) + ", skipped " +
                                    std::to_string(length) + " bytes");
        }

        if (length > available) {
            throw ZXError(ErrorCodes::TRUNCATED_CONTAINER,
                          "Invalid TZX file: block " + hexId(id) + " at offset " +
                          std::to_string(blockStart) + " runs past the end of the file",
                          0, blockStart);
        }

        TzxBlock block;
        block.id = id;
        block.offset = blockStart;
        block.data.assign(body, body + length);
        file.blocks.push_back(block);

        offset += length;
    }

    return file;
}

std::vector<uint8_t> convertTzxToTap(const std::vector<uint8_t>& tzxData) {
    TzxFile file = parseTzxFile(tzxData);
    std::vector<uint8_t> tap;

    for (const auto& block : file.blocks) {
        if (block.id != BLOCK_STANDARD_SPEED) {
            continue;
        }
        uint16_t dataLength = readLE16(block.data.data() + 2);
        writeLE16(tap, dataLength);
        tap.insert(tap.end(), block.data.begin() + 4, block.data.begin() + 4 + dataLength);
    }

    return tap;
}

TzxMetadata getTzxMetadata(const std::vector<uint8_t>& tzxData) {
    TzxFile file = parseTzxFile(tzxData);

    TzxMetadata metadata;
    metadata.version = std::to_string(file.majorVersion) + "." + std::to_string(file.minorVersion);
    metadata.blockCount = file.blocks.size();

    for (const auto& block : file.blocks) {
        if (block.id == BLOCK_TEXT_DESCRIPTION && !block.data.empty()) {
            size_t textLength = block.data[0];
            metadata.description = std::string(block.data.begin() + 1, block.data.begin() + 1 + textLength);
            break;
        }
    }

    return metadata;
}

std::string getBlockName(uint8_t id) {
    const BlockRule* rule = findRule(id);
    return rule ? rule->name : "";
}

} // namespace TzxFormat
} // namespace zxbasic
