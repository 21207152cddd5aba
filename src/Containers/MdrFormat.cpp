#include "MdrFormat.hpp"
#include "ContainerUtils.hpp"
#include "Common/ZXError.hpp"
#include "ProgramStore/ProgramStore.hpp"
#include "Tokenizer/Detokenizer.hpp"
#include <algorithm>
#include <map>

namespace zxbasic {
namespace MdrFormat {

namespace {

constexpr size_t CARTRIDGE_NAME_OFFSET = 4;
constexpr size_t FILENAME_OFFSET = 19;

struct FileRecord {
    uint8_t sequence;
    size_t index;   // Position in the sector list
};

size_t sectorCount(const std::vector<uint8_t>& buffer) {
    return std::min(buffer.size() / SECTOR_SIZE, TOTAL_SECTORS);
}

void checkSize(const std::vector<uint8_t>& buffer, uint32_t policy) {
    if (buffer.size() == FILE_SIZE) {
        return;
    }
    if ((policy & ALLOW_NONSTANDARD) != 0 && buffer.size() >= SECTOR_SIZE &&
        buffer.size() <= FILE_SIZE && buffer.size() % SECTOR_SIZE <= 1) {
        return;
    }
    throw ZXError(ErrorCodes::BAD_CONTAINER_SIZE,
                  "Invalid MDR file size: " + std::to_string(buffer.size()) +
                  " bytes (expected " + std::to_string(FILE_SIZE) + ")");
}

bool isWriteProtected(const std::vector<uint8_t>& buffer) {
    return buffer.size() % SECTOR_SIZE == 1 && buffer.back() != 0;
}

MdrSector readSector(const std::vector<uint8_t>& buffer, size_t index) {
    return MdrSector(buffer.data() + index * SECTOR_SIZE);
}

void writeSector(std::vector<uint8_t>& buffer, size_t index, const MdrSector& sector) {
    std::copy(sector.bytes.begin(), sector.bytes.end(), buffer.begin() + index * SECTOR_SIZE);
}

MdrError makeError(const MdrSector& sector, MdrErrorType type, const std::string& message,
                   uint8_t expected = 0, uint8_t actual = 0) {
    MdrError error;
    error.sector = sector.sectorNumber();
    error.type = type;
    error.message = message;
    error.expected = expected;
    error.actual = actual;
    return error;
}

} // namespace

// MdrSector

MdrSector::MdrSector(const uint8_t* data) {
    std::copy(data, data + SECTOR_SIZE, bytes.begin());
}

std::string MdrSector::cartridgeName() const {
    return ContainerUtils::readName(bytes.data() + CARTRIDGE_NAME_OFFSET);
}

std::string MdrSector::filename() const {
    return ContainerUtils::readName(bytes.data() + FILENAME_OFFSET);
}

std::string MdrSector::rawFilename() const {
    return std::string(bytes.begin() + FILENAME_OFFSET,
                       bytes.begin() + FILENAME_OFFSET + ContainerUtils::NAME_LENGTH);
}

void MdrSector::setHeader(uint8_t number, const std::string& cartridge) {
    bytes[0] = HEADER_FLAG;
    bytes[1] = number;
    bytes[2] = 0;
    bytes[3] = 0;
    std::string name = ContainerUtils::padName(cartridge);
    std::copy(name.begin(), name.end(), bytes.begin() + CARTRIDGE_NAME_OFFSET);
    bytes[14] = ContainerUtils::mdrChecksum(bytes.data() + HEADER_OFFSET, HEADER_SIZE - 1);
}

void MdrSector::setRecord(uint8_t flags, uint8_t sequenceNumber, const std::vector<uint8_t>& chunk,
                          const std::string& name) {
    bytes[15] = flags;
    bytes[16] = sequenceNumber;
    ContainerUtils::writeLE16(bytes.data() + 17, static_cast<uint16_t>(chunk.size()));
    std::string padded = ContainerUtils::padName(name);
    std::copy(padded.begin(), padded.end(), bytes.begin() + FILENAME_OFFSET);

    std::fill(bytes.begin() + DATA_OFFSET, bytes.begin() + DATA_CHECKSUM_OFFSET, 0);
    std::copy(chunk.begin(), chunk.end(), bytes.begin() + DATA_OFFSET);
    updateChecksums();
}

void MdrSector::clearRecord() {
    setRecord(0, 0, std::vector<uint8_t>(), "");
}

void MdrSector::updateChecksums() {
    bytes[14] = ContainerUtils::mdrChecksum(bytes.data() + HEADER_OFFSET, HEADER_SIZE - 1);
    bytes[29] = ContainerUtils::mdrChecksum(bytes.data() + RECORD_OFFSET, RECORD_SIZE - 1);
    bytes[DATA_CHECKSUM_OFFSET] = ContainerUtils::mdrChecksum(bytes.data() + DATA_OFFSET, DATA_SIZE);
}

// Sector validation

std::vector<MdrError> validateMdrSector(const MdrSector& sector) {
    std::vector<MdrError> errors;

    uint8_t header = ContainerUtils::mdrChecksum(sector.bytes.data() + HEADER_OFFSET, HEADER_SIZE - 1);
    if (header != sector.headerChecksum()) {
        errors.push_back(makeError(sector, MdrErrorType::HeaderChecksum,
                                   "Header checksum mismatch", header, sector.headerChecksum()));
    }

    uint8_t record = ContainerUtils::mdrChecksum(sector.bytes.data() + RECORD_OFFSET, RECORD_SIZE - 1);
    if (record != sector.recordChecksum()) {
        errors.push_back(makeError(sector, MdrErrorType::RecordChecksum,
                                   "Record descriptor checksum mismatch", record, sector.recordChecksum()));
    }

    uint8_t data = ContainerUtils::mdrChecksum(sector.data(), DATA_SIZE);
    if (data != sector.dataChecksum()) {
        errors.push_back(makeError(sector, MdrErrorType::DataChecksum,
                                   "Data block checksum mismatch", data, sector.dataChecksum()));
    }

    return errors;
}

bool repairMdrSector(MdrSector& sector, uint32_t policy) {
    bool repaired = false;

    for (const auto& error : validateMdrSector(sector)) {
        if (error.type == MdrErrorType::HeaderChecksum && (policy & FIX_HEADER) != 0) {
            sector.bytes[14] = error.expected;
            repaired = true;
        } else if (error.type == MdrErrorType::RecordChecksum && (policy & FIX_RECORD) != 0) {
            sector.bytes[29] = error.expected;
            repaired = true;
        } else if (error.type == MdrErrorType::DataChecksum && (policy & FIX_DATA) != 0) {
            sector.bytes[DATA_CHECKSUM_OFFSET] = error.expected;
            repaired = true;
        }
    }

    return repaired;
}

// Writing

std::vector<uint8_t> createEmptyMdr(const std::string& cartridgeName) {
    std::vector<uint8_t> buffer(FILE_SIZE, 0);

    for (size_t index = 0; index < TOTAL_SECTORS; index++) {
        MdrSector sector;
        sector.setHeader(static_cast<uint8_t>(TOTAL_SECTORS - index), cartridgeName);
        sector.clearRecord();
        writeSector(buffer, index, sector);
    }

    // Last byte: write protection off
    buffer[FILE_SIZE - 1] = 0;
    return buffer;
}

void addProgram(std::vector<uint8_t>& cartridge, const std::vector<uint8_t>& programImage,
                const std::string& programName, std::optional<uint16_t> autostart,
                uint32_t policy) {
    checkSize(cartridge, policy);
    if (isWriteProtected(cartridge)) {
        throw ZXError(ErrorCodes::BAD_CONTAINER_SIZE, "Microdrive cartridge is write protected");
    }

    std::string name = ContainerUtils::padName(programName);
    size_t sectors = sectorCount(cartridge);

    // Existing file of the same name
    for (size_t index = 0; index < sectors; index++) {
        MdrSector sector = readSector(cartridge, index);
        if (!sector.isInUse() || sector.isPrintFile() || sector.rawFilename() != name) {
            continue;
        }
        if ((policy & OVERWRITE_SECTORS) == 0) {
            throw ZXError(ErrorCodes::BAD_CONTAINER_SIZE,
                          "File \"" + sector.filename() + "\" already exists on the cartridge");
        }
        sector.clearRecord();
        writeSector(cartridge, index, sector);
    }

    // File header + program
    std::vector<uint8_t> file;
    file.reserve(FILE_HEADER_SIZE + programImage.size());
    uint16_t length = static_cast<uint16_t>(programImage.size());
    file.push_back(ContainerUtils::FILE_TYPE_PROGRAM);
    ContainerUtils::writeLE16(file, length);
    ContainerUtils::writeLE16(file, PROGRAM_START);
    ContainerUtils::writeLE16(file, length);
    ContainerUtils::writeLE16(file, autostart ? *autostart : NO_AUTOSTART);
    file.insert(file.end(), programImage.begin(), programImage.end());

    size_t records = (file.size() + DATA_SIZE - 1) / DATA_SIZE;

    std::vector<size_t> freeSectors;
    for (size_t index = 0; index < sectors && freeSectors.size() < records; index++) {
        if (!readSector(cartridge, index).isInUse()) {
            freeSectors.push_back(index);
        }
    }
    if (freeSectors.size() < records) {
        throw ZXError(ErrorCodes::PROGRAM_TOO_LARGE,
                      "Microdrive cartridge full: " + std::to_string(records) + " sectors needed, " +
                      std::to_string(freeSectors.size()) + " free");
    }

    for (size_t record = 0; record < records; record++) {
        size_t begin = record * DATA_SIZE;
        size_t end = std::min(begin + DATA_SIZE, file.size());
        std::vector<uint8_t> chunk(file.begin() + begin, file.begin() + end);
        uint8_t flags = (record + 1 == records) ? RECORD_FLAG_EOF : 0;

        MdrSector sector = readSector(cartridge, freeSectors[record]);
        sector.setRecord(flags, static_cast<uint8_t>(record), chunk, programName);
        writeSector(cartridge, freeSectors[record], sector);
    }
}

std::vector<uint8_t> createMdrFile(const std::vector<uint8_t>& programImage, const std::string& programName,
                                   const std::string& cartridgeName, std::optional<uint16_t> autostart) {
    std::vector<uint8_t> cartridge = createEmptyMdr(cartridgeName);
    addProgram(cartridge, programImage, programName, autostart);
    return cartridge;
}

// Reading

MdrParseResult parseMdrFile(const std::vector<uint8_t>& buffer, uint32_t policy) {
    checkSize(buffer, policy);

    MdrParseResult result;
    result.metadata.writeProtected = isWriteProtected(buffer);

    // Records of every file, in order of first appearance
    std::vector<std::string> fileOrder;
    std::map<std::string, std::vector<FileRecord>> files;

    size_t sectors = sectorCount(buffer);
    for (size_t index = 0; index < sectors; index++) {
        MdrSector sector = readSector(buffer, index);

        auto errors = validateMdrSector(sector);
        result.errors.insert(result.errors.end(), errors.begin(), errors.end());
        if (!errors.empty() && repairMdrSector(sector, policy)) {
            errors = validateMdrSector(sector);
        }
        result.metadata.sectors.push_back(sector);

        bool usable = errors.empty() || (policy & ACCEPT_ERRORS) != 0;
        if ((sector.headerFlag() & HEADER_FLAG) == 0) {
            result.errors.push_back(makeError(sector, MdrErrorType::Structure, "Not a sector header"));
            usable = false;
        }

        if (result.metadata.cartridgeName.empty() && usable) {
            result.metadata.cartridgeName = sector.cartridgeName();
        }

        if (!usable || !sector.isInUse() || sector.isPrintFile()) {
            continue;
        }

        std::string name = sector.rawFilename();
        if (files.find(name) == files.end()) {
            fileOrder.push_back(name);
        }
        files[name].push_back(FileRecord{sector.sequence(), result.metadata.sectors.size() - 1});
    }

    Detokenizer detokenizer;

    for (const auto& name : fileOrder) {
        auto& records = files[name];
        std::sort(records.begin(), records.end(),
                  [](const FileRecord& a, const FileRecord& b) { return a.sequence < b.sequence; });

        const MdrSector& first = result.metadata.sectors[records.front().index];
        bool complete = result.metadata.sectors[records.back().index].isEof();
        for (size_t i = 0; i < records.size(); i++) {
            if (records[i].sequence != i) complete = false;
        }
        if (!complete) {
            result.errors.push_back(makeError(first, MdrErrorType::Structure,
                                              "File \"" + first.filename() + "\" has missing records"));
            continue;
        }

        std::vector<uint8_t> file;
        for (const auto& record : records) {
            const MdrSector& sector = result.metadata.sectors[record.index];
            size_t length = std::min<size_t>(sector.recordLength(), DATA_SIZE);
            file.insert(file.end(), sector.data(), sector.data() + length);
        }

        if (file.size() < FILE_HEADER_SIZE || file[0] != ContainerUtils::FILE_TYPE_PROGRAM) {
            continue;
        }

        MdrProgram program;
        program.name = first.filename();
        program.sector = first.sectorNumber();
        uint16_t programLength = ContainerUtils::readLE16(&file[5]);
        uint16_t autostart = ContainerUtils::readLE16(&file[7]);
        if (autostart < ContainerUtils::NO_AUTOSTART) {
            program.autostart = autostart;
        }

        size_t available = file.size() - FILE_HEADER_SIZE;
        size_t length = std::min<size_t>(programLength, available);
        program.image.assign(file.begin() + FILE_HEADER_SIZE, file.begin() + FILE_HEADER_SIZE + length);

        try {
            program.source = detokenizer.detokenize(program.image, ProgramStore::LineNumberOrder::Rom);
        } catch (const ZXError& e) {
            result.errors.push_back(makeError(first, MdrErrorType::Structure,
                                              "File \"" + program.name + "\": " + e.what()));
            continue;
        }

        result.programs.push_back(program);
    }

    if (result.metadata.cartridgeName.empty()) {
        result.metadata.cartridgeName = "UNKNOWN";
    }
    return result;
}

std::optional<MdrSector> getMdrSector(const std::vector<uint8_t>& buffer, uint8_t sectorNumber) {
    if (sectorNumber < 1 || sectorNumber > TOTAL_SECTORS) {
        return std::nullopt;
    }
    size_t index = TOTAL_SECTORS - sectorNumber;
    if ((index + 1) * SECTOR_SIZE > buffer.size()) {
        return std::nullopt;
    }
    return readSector(buffer, index);
}

bool isValidMdrFile(const std::vector<uint8_t>& buffer) {
    if (buffer.size() != FILE_SIZE) {
        return false;
    }
    for (size_t index = 0; index < TOTAL_SECTORS; index++) {
        MdrSector sector = readSector(buffer, index);
        if ((sector.headerFlag() & HEADER_FLAG) == 0) {
            return false;
        }
        uint8_t header = ContainerUtils::mdrChecksum(sector.bytes.data() + HEADER_OFFSET, HEADER_SIZE - 1);
        if (header != sector.headerChecksum()) {
            return false;
        }
    }
    return true;
}

MdrInfo getMdrInfo(const std::vector<uint8_t>& buffer) {
    checkSize(buffer, POLICY_NONE);

    MdrInfo info;
    info.totalSectors = TOTAL_SECTORS;
    info.writeProtected = isWriteProtected(buffer);

    for (size_t index = 0; index < TOTAL_SECTORS; index++) {
        MdrSector sector = readSector(buffer, index);
        if (info.cartridgeName.empty()) {
            info.cartridgeName = sector.cartridgeName();
        }
        if (!sector.isInUse()) {
            continue;
        }
        info.usedSectors++;
        if (sector.sequence() == 0) {
            info.files.push_back(sector.filename());
        }
    }

    info.freeSectors = info.totalSectors - info.usedSectors;
    return info;
}

} // namespace MdrFormat
} // namespace zxbasic
