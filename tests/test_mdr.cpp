#include <catch2/catch_all.hpp>
#include "../src/Containers/MdrFormat.hpp"
#include "../src/Containers/ContainerUtils.hpp"
#include "../src/Assembler/ProgramAssembler.hpp"
#include "../src/Common/ZXError.hpp"

using namespace zxbasic;

using Bytes = std::vector<uint8_t>;

static Bytes programImage(const std::string& source) {
    return ProgramAssembler().assemble(source).romImage();
}

static const std::string SOURCE = "10 PRINT \"HI\"\n20 GO TO 10\n";

TEST_CASE("MDR empty cartridge", "[mdr]") {
    Bytes mdr = MdrFormat::createEmptyMdr("BLANK");

    SECTION("Size and layout") {
        REQUIRE(mdr.size() == 137923);
        REQUIRE(mdr.back() == 0);
        REQUIRE(MdrFormat::isValidMdrFile(mdr));

        MdrFormat::MdrSector first(mdr.data());
        REQUIRE(first.headerFlag() == 0x01);
        REQUIRE(first.sectorNumber() == 254);
        REQUIRE(first.cartridgeName() == "BLANK");
        REQUIRE_FALSE(first.isInUse());

        MdrFormat::MdrSector last(mdr.data() + 253 * MdrFormat::SECTOR_SIZE);
        REQUIRE(last.sectorNumber() == 1);
    }

    SECTION("Info") {
        auto info = MdrFormat::getMdrInfo(mdr);
        REQUIRE(info.cartridgeName == "BLANK");
        REQUIRE(info.totalSectors == 254);
        REQUIRE(info.usedSectors == 0);
        REQUIRE(info.freeSectors == 254);
        REQUIRE(info.files.empty());
        REQUIRE_FALSE(info.writeProtected);
    }

    SECTION("Parsing finds nothing") {
        auto parsed = MdrFormat::parseMdrFile(mdr);
        REQUIRE(parsed.programs.empty());
        REQUIRE(parsed.errors.empty());
        REQUIRE(parsed.metadata.sectors.size() == 254);
    }
}

TEST_CASE("MDR program round trip", "[mdr]") {
    Bytes image = programImage(SOURCE);
    Bytes mdr = MdrFormat::createMdrFile(image, "HELLO", "CART", 10);

    SECTION("First record") {
        auto sector = MdrFormat::getMdrSector(mdr, 254);
        REQUIRE(sector);
        REQUIRE(sector->filename() == "HELLO");
        REQUIRE(sector->sequence() == 0);
        REQUIRE(sector->isEof());
        REQUIRE(sector->recordLength() == MdrFormat::FILE_HEADER_SIZE + image.size());

        const uint8_t* data = sector->data();
        REQUIRE(data[0] == ContainerUtils::FILE_TYPE_PROGRAM);
        REQUIRE(ContainerUtils::readLE16(data + 1) == image.size());
        REQUIRE(ContainerUtils::readLE16(data + 3) == MdrFormat::PROGRAM_START);
        REQUIRE(ContainerUtils::readLE16(data + 5) == image.size());
        REQUIRE(ContainerUtils::readLE16(data + 7) == 10);
        REQUIRE(Bytes(data + 9, data + 9 + image.size()) == image);
    }

    SECTION("Every checksum is the additive sum") {
        for (uint8_t number = 1; number != 0 && number <= 254; number++) {
            auto sector = MdrFormat::getMdrSector(mdr, number);
            REQUIRE(sector);
            REQUIRE(sector->sectorNumber() == number);
            REQUIRE(MdrFormat::validateMdrSector(*sector).empty());
            REQUIRE(sector->headerChecksum() == ContainerUtils::mdrChecksum(sector->bytes.data(), 14));
        }
    }

    SECTION("Parse") {
        auto parsed = MdrFormat::parseMdrFile(mdr);
        REQUIRE(parsed.errors.empty());
        REQUIRE(parsed.metadata.cartridgeName == "CART");
        REQUIRE_FALSE(parsed.metadata.writeProtected);
        REQUIRE(parsed.programs.size() == 1);

        const auto& program = parsed.programs[0];
        REQUIRE(program.name == "HELLO");
        REQUIRE(program.sector == 254);
        REQUIRE(program.autostart == std::optional<uint16_t>(10));
        REQUIRE(program.image == image);
        REQUIRE(program.source == SOURCE);
    }

    SECTION("Info") {
        auto info = MdrFormat::getMdrInfo(mdr);
        REQUIRE(info.usedSectors == 1);
        REQUIRE(info.freeSectors == 253);
        REQUIRE(info.files == std::vector<std::string>{"HELLO"});
    }

    SECTION("No autostart") {
        auto parsed = MdrFormat::parseMdrFile(MdrFormat::createMdrFile(image, "HELLO", "CART"));
        REQUIRE(parsed.programs.size() == 1);
        REQUIRE_FALSE(parsed.programs[0].autostart);
    }

    SECTION("Names are truncated") {
        Bytes named = MdrFormat::createMdrFile(image, "AVERYLONGNAME", "CARTRIDGE-NAME");
        auto parsed = MdrFormat::parseMdrFile(named);
        REQUIRE(parsed.programs[0].name == "AVERYLONGN");
        REQUIRE(parsed.metadata.cartridgeName == "CARTRIDGE-");
    }
}

TEST_CASE("MDR multi-record files", "[mdr]") {
    std::string source;
    for (int line = 1; line <= 40; line++) {
        source += std::to_string(line * 10) + " REM line number " + std::to_string(line) +
                  " of a program that needs more than one sector\n";
    }
    Bytes image = programImage(source);
    REQUIRE(image.size() > MdrFormat::DATA_SIZE * 2);

    Bytes mdr = MdrFormat::createMdrFile(image, "LONG", "CART");

    SECTION("Records fill sectors from 254 down") {
        size_t records = (image.size() + MdrFormat::FILE_HEADER_SIZE + 511) / 512;
        for (size_t i = 0; i < records; i++) {
            auto sector = MdrFormat::getMdrSector(mdr, static_cast<uint8_t>(254 - i));
            REQUIRE(sector->sequence() == i);
            REQUIRE(sector->isEof() == (i + 1 == records));
        }
        REQUIRE(MdrFormat::getMdrInfo(mdr).usedSectors == records);
    }

    SECTION("Parse joins the records") {
        auto parsed = MdrFormat::parseMdrFile(mdr);
        REQUIRE(parsed.programs.size() == 1);
        REQUIRE(parsed.programs[0].image == image);
        REQUIRE(parsed.programs[0].source == source);
    }

    SECTION("Missing record") {
        // Drop the second record by breaking its header checksum
        mdr[MdrFormat::SECTOR_SIZE + 14] ^= 0xFF;
        auto parsed = MdrFormat::parseMdrFile(mdr);
        REQUIRE(parsed.programs.empty());

        bool structure = false;
        for (const auto& error : parsed.errors) {
            if (error.type == MdrFormat::MdrErrorType::Structure) structure = true;
        }
        REQUIRE(structure);
    }
}

TEST_CASE("MDR checksum errors and repair", "[mdr]") {
    Bytes image = programImage(SOURCE);
    Bytes mdr = MdrFormat::createMdrFile(image, "HELLO", "CART");

    SECTION("Bad data checksum drops the sector") {
        mdr[MdrFormat::DATA_CHECKSUM_OFFSET] ^= 0xFF;
        auto parsed = MdrFormat::parseMdrFile(mdr);
        REQUIRE(parsed.programs.empty());
        REQUIRE(parsed.errors.size() == 1);
        REQUIRE(parsed.errors[0].type == MdrFormat::MdrErrorType::DataChecksum);
        REQUIRE(parsed.errors[0].sector == 254);
        REQUIRE(parsed.errors[0].message == "Data block checksum mismatch");
    }

    SECTION("FIX_DATA recomputes the checksum") {
        mdr[MdrFormat::DATA_CHECKSUM_OFFSET] ^= 0xFF;
        auto parsed = MdrFormat::parseMdrFile(mdr, MdrFormat::FIX_DATA);
        REQUIRE(parsed.programs.size() == 1);
        REQUIRE(parsed.programs[0].source == SOURCE);
        REQUIRE(MdrFormat::validateMdrSector(parsed.metadata.sectors[0]).empty());
    }

    SECTION("ACCEPT_ERRORS keeps the sector") {
        mdr[29] ^= 0xFF;
        auto parsed = MdrFormat::parseMdrFile(mdr, MdrFormat::ACCEPT_ERRORS);
        REQUIRE(parsed.programs.size() == 1);
        REQUIRE(parsed.errors.size() == 1);
        REQUIRE(parsed.errors[0].type == MdrFormat::MdrErrorType::RecordChecksum);
    }

    SECTION("Repair only what the policy allows") {
        MdrFormat::MdrSector sector(mdr.data());
        sector.bytes[14] ^= 0xFF;
        sector.bytes[29] ^= 0xFF;
        REQUIRE(MdrFormat::validateMdrSector(sector).size() == 2);

        REQUIRE(MdrFormat::repairMdrSector(sector, MdrFormat::FIX_HEADER));
        auto remaining = MdrFormat::validateMdrSector(sector);
        REQUIRE(remaining.size() == 1);
        REQUIRE(remaining[0].type == MdrFormat::MdrErrorType::RecordChecksum);

        REQUIRE_FALSE(MdrFormat::repairMdrSector(sector, MdrFormat::FIX_DATA));
        REQUIRE(MdrFormat::repairMdrSector(sector, MdrFormat::FIX_HEADER | MdrFormat::FIX_RECORD));
        REQUIRE(MdrFormat::validateMdrSector(sector).empty());
    }

    SECTION("Header checksum error makes the image invalid") {
        mdr[14] ^= 0xFF;
        REQUIRE_FALSE(MdrFormat::isValidMdrFile(mdr));
    }
}

TEST_CASE("MDR image size", "[mdr]") {
    Bytes mdr = MdrFormat::createMdrFile(programImage(SOURCE), "HELLO", "CART");

    SECTION("Wrong size is a structural error") {
        Bytes shorter(mdr.begin(), mdr.end() - 1);
        try {
            MdrFormat::parseMdrFile(shorter);
            FAIL("Expected an error");
        } catch (const ZXError& e) {
            REQUIRE(e.getErrorCode() == ErrorCodes::BAD_CONTAINER_SIZE);
        }
        REQUIRE_FALSE(MdrFormat::isValidMdrFile(shorter));
        REQUIRE_THROWS_AS(MdrFormat::getMdrInfo(shorter), ZXError);
    }

    SECTION("ALLOW_NONSTANDARD accepts a missing protection byte") {
        Bytes shorter(mdr.begin(), mdr.end() - 1);
        auto parsed = MdrFormat::parseMdrFile(shorter, MdrFormat::ALLOW_NONSTANDARD);
        REQUIRE(parsed.programs.size() == 1);
        REQUIRE_FALSE(parsed.metadata.writeProtected);
    }

    SECTION("Write protection") {
        mdr.back() = 0xFF;
        REQUIRE(MdrFormat::parseMdrFile(mdr).metadata.writeProtected);
        REQUIRE(MdrFormat::getMdrInfo(mdr).writeProtected);
        REQUIRE_THROWS_AS(MdrFormat::addProgram(mdr, Bytes{0x00, 0x0A, 0x02, 0x00, 0xFB, 0x0D}, "MORE", std::nullopt),
                          ZXError);
    }

    SECTION("Sector lookup") {
        REQUIRE_FALSE(MdrFormat::getMdrSector(mdr, 0));
        REQUIRE_FALSE(MdrFormat::getMdrSector(mdr, 255));
        REQUIRE(MdrFormat::getMdrSector(mdr, 1)->sectorNumber() == 1);
    }
}

TEST_CASE("MDR adding programs", "[mdr]") {
    Bytes first = programImage("10 CLS\n");
    Bytes second = programImage("10 PRINT 1\n20 STOP\n");
    Bytes mdr = MdrFormat::createEmptyMdr("CART");

    MdrFormat::addProgram(mdr, first, "ONE", std::nullopt);
    MdrFormat::addProgram(mdr, second, "TWO", 20);

    SECTION("Both programs are found") {
        auto parsed = MdrFormat::parseMdrFile(mdr);
        REQUIRE(parsed.programs.size() == 2);
        REQUIRE(parsed.programs[0].name == "ONE");
        REQUIRE(parsed.programs[0].source == "10 CLS\n");
        REQUIRE(parsed.programs[1].name == "TWO");
        REQUIRE(parsed.programs[1].sector == 253);
        REQUIRE(parsed.programs[1].autostart == std::optional<uint16_t>(20));
    }

    SECTION("Duplicate names need OVERWRITE_SECTORS") {
        REQUIRE_THROWS_AS(MdrFormat::addProgram(mdr, second, "ONE", std::nullopt), ZXError);

        MdrFormat::addProgram(mdr, second, "ONE", std::nullopt, MdrFormat::OVERWRITE_SECTORS);
        auto parsed = MdrFormat::parseMdrFile(mdr);
        REQUIRE(parsed.programs.size() == 2);
        REQUIRE(MdrFormat::getMdrInfo(mdr).usedSectors == 2);

        bool replaced = false;
        for (const auto& program : parsed.programs) {
            if (program.name == "ONE") replaced = program.image == second;
        }
        REQUIRE(replaced);
    }

    SECTION("Cartridge full") {
        Bytes big(60000, 0x20);
        MdrFormat::addProgram(mdr, big, "BIG1", std::nullopt);
        MdrFormat::addProgram(mdr, big, "BIG2", std::nullopt);
        try {
            MdrFormat::addProgram(mdr, big, "BIG3", std::nullopt);
            FAIL("Expected an error");
        } catch (const ZXError& e) {
            REQUIRE(e.getErrorCode() == ErrorCodes::PROGRAM_TOO_LARGE);
        }
    }
}
