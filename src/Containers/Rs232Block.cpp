#include "Rs232Block.hpp"
#include "ContainerUtils.hpp"
#include "Common/ZXError.hpp"

namespace zxbasic {
namespace Rs232Block {

std::string normalizeFilename(const std::string& name) {
    std::string cleaned;
    for (char c : name) {
        unsigned char byte = static_cast<unsigned char>(c);
        if (byte >= 0x20 && byte <= 0x7E) {
            cleaned.push_back(c);
        }
    }
    return ContainerUtils::padName(cleaned);
}

std::vector<uint8_t> createProgramHeader(const std::string& filename, uint16_t dataLength,
                                         uint16_t autostartLine,
                                         std::optional<uint16_t> variablesOffset) {
    std::vector<uint8_t> header;
    header.reserve(HEADER_BLOCK_SIZE);

    header.push_back(ContainerUtils::FLAG_HEADER);
    header.push_back(ContainerUtils::FILE_TYPE_PROGRAM);

    std::string name = normalizeFilename(filename);
    header.insert(header.end(), name.begin(), name.end());

    ContainerUtils::writeLE16(header, dataLength);
    bool autostart = autostartLine > 0 && autostartLine <= MAX_AUTOSTART_LINE;
    ContainerUtils::writeLE16(header, autostart ? autostartLine : NO_AUTOSTART);
    ContainerUtils::writeLE16(header, variablesOffset ? *variablesOffset : dataLength);

    header.push_back(ContainerUtils::xorChecksum(header));
    return header;
}

std::vector<uint8_t> createDataBlock(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> block;
    block.reserve(data.size() + 2);

    block.push_back(ContainerUtils::FLAG_DATA);
    block.insert(block.end(), data.begin(), data.end());
    block.push_back(ContainerUtils::xorChecksum(block));
    return block;
}

std::vector<uint8_t> createProgramPackage(const std::string& filename,
                                          const std::vector<uint8_t>& basicData,
                                          uint16_t autostartLine) {
    std::vector<uint8_t> package = createProgramHeader(
        filename, static_cast<uint16_t>(basicData.size()), autostartLine);
    std::vector<uint8_t> dataBlock = createDataBlock(basicData);
    package.insert(package.end(), dataBlock.begin(), dataBlock.end());
    return package;
}

std::optional<HeaderBlock> parseHeaderBlock(const std::vector<uint8_t>& block) {
    if (block.size() < HEADER_BLOCK_SIZE || block[0] != ContainerUtils::FLAG_HEADER) {
        return std::nullopt;
    }
    if (block[HEADER_BLOCK_SIZE - 1] != ContainerUtils::xorChecksum(block, 0, HEADER_BLOCK_SIZE - 1)) {
        return std::nullopt;
    }

    HeaderBlock header;
    header.type = block[1];
    header.filename = ContainerUtils::readName(&block[2]);
    header.dataLength = ContainerUtils::readLE16(&block[12]);
    header.param1 = ContainerUtils::readLE16(&block[14]);
    header.param2 = ContainerUtils::readLE16(&block[16]);
    return header;
}

std::optional<std::vector<uint8_t>> parseDataBlock(const std::vector<uint8_t>& block) {
    if (block.size() < 2 || block[0] != ContainerUtils::FLAG_DATA) {
        return std::nullopt;
    }
    if (block.back() != ContainerUtils::xorChecksum(block, 0, block.size() - 1)) {
        return std::nullopt;
    }
    return std::vector<uint8_t>(block.begin() + 1, block.end() - 1);
}

PackageValidation validateProgramPackage(const std::vector<uint8_t>& data) {
    PackageValidation result;

    if (data.size() < MIN_PACKAGE_SIZE) {
        result.error = "Data too short";
        result.errorCode = ErrorCodes::TRUNCATED_CONTAINER;
        return result;
    }

    std::vector<uint8_t> headerBytes(data.begin(), data.begin() + HEADER_BLOCK_SIZE);
    result.header = parseHeaderBlock(headerBytes);
    if (!result.header) {
        result.error = "Invalid header block";
        result.errorCode = ErrorCodes::CHECKSUM_MISMATCH;
        return result;
    }

    // Flag + data + checksum
    size_t dataBlockLength = static_cast<size_t>(result.header->dataLength) + 2;
    if (data.size() < HEADER_BLOCK_SIZE + dataBlockLength) {
        result.error = "Data block incomplete";
        result.errorCode = ErrorCodes::TRUNCATED_CONTAINER;
        return result;
    }

    std::vector<uint8_t> dataBytes(data.begin() + HEADER_BLOCK_SIZE,
                                   data.begin() + HEADER_BLOCK_SIZE + dataBlockLength);
    auto programData = parseDataBlock(dataBytes);
    if (!programData) {
        result.error = "Invalid data block checksum";
        result.errorCode = ErrorCodes::CHECKSUM_MISMATCH;
        return result;
    }

    result.valid = true;
    result.programData = *programData;
    return result;
}

} // namespace Rs232Block
} // namespace zxbasic
