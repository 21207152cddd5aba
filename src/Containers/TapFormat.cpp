#include "TapFormat.hpp"
#include "ContainerUtils.hpp"
#include "Common/ZXError.hpp"

namespace zxbasic {
namespace TapFormat {

using namespace ContainerUtils;

std::vector<uint8_t> createHeaderBlock(const std::string& name, uint16_t programLength,
                                       std::optional<uint16_t> autostart) {
    std::vector<uint8_t> block;
    block.reserve(2 + HEADER_BLOCK_LENGTH);

    writeLE16(block, HEADER_BLOCK_LENGTH);
    block.push_back(FLAG_HEADER);
    block.push_back(FILE_TYPE_PROGRAM);

    std::string padded = padName(name);
    block.insert(block.end(), padded.begin(), padded.end());

    writeLE16(block, programLength);
    writeLE16(block, autostart ? *autostart : NO_AUTOSTART);
    writeLE16(block, programLength);    // Variables start right after the program

    block.push_back(xorChecksum(block, 2, block.size()));
    return block;
}

std::vector<uint8_t> createDataBlock(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> block;
    block.reserve(data.size() + 4);

    writeLE16(block, static_cast<uint16_t>(data.size() + 2));
    block.push_back(FLAG_DATA);
    block.insert(block.end(), data.begin(), data.end());
    block.push_back(xorChecksum(block, 2, block.size()));
    return block;
}

std::vector<uint8_t> createTapFile(const std::vector<uint8_t>& programImage, const std::string& name,
                                   std::optional<uint16_t> autostart) {
    std::vector<uint8_t> tap = createHeaderBlock(name, static_cast<uint16_t>(programImage.size()), autostart);
    std::vector<uint8_t> data = createDataBlock(programImage);
    tap.insert(tap.end(), data.begin(), data.end());
    return tap;
}

TapParseResult parseTapFile(const std::vector<uint8_t>& data, bool strict) {
    TapParseResult result;
    ParseState state = ParseState::AwaitingBlock;
    size_t offset = 0;
    size_t blockStart = 0;
    uint16_t length = 0;
    TapBlock block;

    auto fail = [&](uint16_t code, const std::string& message, size_t at) {
        result.errorCode = code;
        result.error = message;
        result.errorOffset = at;
        state = ParseState::Error;
    };

    while (state != ParseState::Error) {
        switch (state) {
            case ParseState::AwaitingBlock:
                if (offset == data.size()) {
                    result.success = true;
                    return result;
                }
                blockStart = offset;
                state = ParseState::ReadingLength;
                break;

            case ParseState::ReadingLength:
                if (offset + 2 > data.size()) {
                    fail(ErrorCodes::TRUNCATED_CONTAINER, "Truncated block length", offset);
                    break;
                }
                length = readLE16(&data[offset]);
                offset += 2;
                state = ParseState::ReadingPayload;
                break;

            case ParseState::ReadingPayload:
                if (offset + length > data.size()) {
                    fail(ErrorCodes::TRUNCATED_CONTAINER,
                         "Block " + std::to_string(result.blocks.size()) + " truncated: expected " +
                         std::to_string(length) + " bytes, " + std::to_string(data.size() - offset) +
                         " available", blockStart);
                    break;
                }
                block = TapBlock();
                block.data.assign(data.begin() + offset, data.begin() + offset + length);
                block.blockNumber = result.blocks.size();
                block.offset = blockStart;
                offset += length;
                state = ParseState::VerifyingChecksum;
                break;

            case ParseState::VerifyingChecksum:
                block.checksumValid = block.data.size() >= 2 &&
                    xorChecksum(block.data, 0, block.data.size() - 1) == block.data.back();
                if (!block.checksumValid && strict) {
                    fail(ErrorCodes::CHECKSUM_MISMATCH,
                         "Checksum mismatch in block " + std::to_string(block.blockNumber), blockStart);
                    break;
                }
                result.blocks.push_back(block);
                state = ParseState::AwaitingBlock;
                break;

            case ParseState::Error:
                break;
        }
    }

    return result;
}

std::optional<TapHeader> parseHeader(const TapBlock& block) {
    if (block.data.size() < HEADER_PAYLOAD_SIZE + 2 || block.flag() != FLAG_HEADER) {
        return std::nullopt;
    }

    const uint8_t* payload = block.data.data() + 1;
    TapHeader header;
    header.fileType = payload[0];
    header.programName = readName(payload + 1);
    header.programLength = readLE16(payload + 11);
    uint16_t autostart = readLE16(payload + 13);
    if (autostart < NO_AUTOSTART) {
        header.autostart = autostart;
    }
    header.variablesOffset = readLE16(payload + 15);
    return header;
}

std::optional<TapHeader> getTapMetadata(const std::vector<uint8_t>& data) {
    TapParseResult parsed = parseTapFile(data);
    if (!parsed.success || parsed.blocks.empty()) {
        return std::nullopt;
    }
    return parseHeader(parsed.blocks.front());
}

bool verifyTapChecksums(const std::vector<uint8_t>& data) {
    return parseTapFile(data, true).success;
}

TapProgram extractProgram(const std::vector<uint8_t>& data) {
    TapParseResult parsed = parseTapFile(data, true);
    if (!parsed.success) {
        throw ZXError(parsed.errorCode, "Invalid TAP file: " + parsed.error + " at offset " +
                      std::to_string(parsed.errorOffset), 0, parsed.errorOffset);
    }

    for (size_t i = 0; i + 1 < parsed.blocks.size(); i++) {
        auto header = parseHeader(parsed.blocks[i]);
        if (!header || header->fileType != FILE_TYPE_PROGRAM) {
            continue;
        }

        const TapBlock& dataBlock = parsed.blocks[i + 1];
        if (dataBlock.flag() != FLAG_DATA) {
            continue;
        }

        TapProgram program;
        program.header = *header;
        size_t available = dataBlock.data.size() - 2;
        size_t length = header->programLength < available ? header->programLength : available;
        program.image.assign(dataBlock.data.begin() + 1, dataBlock.data.begin() + 1 + length);
        return program;
    }

    throw ZXError(ErrorCodes::NO_PROGRAM, "TAP file contains no BASIC program");
}

} // namespace TapFormat
} // namespace zxbasic
