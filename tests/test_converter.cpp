#include <catch2/catch_all.hpp>
#include "../src/Converter/Converter.hpp"
#include "../src/Containers/MdrFormat.hpp"
#include "../src/Containers/TapFormat.hpp"
#include "../src/Common/ZXError.hpp"

using namespace zxbasic;

using Bytes = std::vector<uint8_t>;

static const std::string SOURCE = "10 REM demo\n20 PRINT \"HI\"\n30 GO TO 20\n";

static ConvertOptions namedOptions() {
    ConvertOptions options;
    options.programName = "DEMO";
    options.autostart = 10;
    return options;
}

TEST_CASE("Converter writes every format", "[converter]") {
    ConvertOptions options = namedOptions();

    SECTION("Raw") {
        auto result = Converter::convert(SOURCE, options, OutputFormat::Raw);
        REQUIRE(result.success);
        REQUIRE(result.data[0] == 0x0A);
        REQUIRE(result.data[1] == 0x00);
        REQUIRE(result.objects.size() == 3);
    }

    SECTION("TAP") {
        auto result = Converter::convert(SOURCE, options, OutputFormat::Tap);
        REQUIRE(result.success);
        auto header = TapFormat::getTapMetadata(result.data);
        REQUIRE(header);
        REQUIRE(header->programName == "DEMO");
        REQUIRE(header->autostart == std::optional<uint16_t>(10));
    }

    SECTION("TZX with description") {
        options.description = "Demo tape";
        auto result = Converter::convert(SOURCE, options, OutputFormat::Tzx);
        REQUIRE(result.success);
        REQUIRE(result.data[10] == 0x30);
    }

    SECTION("MDR") {
        options.cartridgeName = "DEMOCART";
        auto result = Converter::convert(SOURCE, options, OutputFormat::Mdr);
        REQUIRE(result.success);
        REQUIRE(result.data.size() == MdrFormat::FILE_SIZE);
        REQUIRE(MdrFormat::getMdrInfo(result.data).cartridgeName == "DEMOCART");
    }

    SECTION("RS232") {
        auto result = Converter::convert(SOURCE, options, OutputFormat::Rs232);
        REQUIRE(result.success);
        REQUIRE(result.data[0] == 0x00);
        REQUIRE(result.data[19] == 0xFF);
    }

    SECTION("Warnings are passed on") {
        auto result = Converter::convert("10 CLS\n\n20 STOP", options, OutputFormat::Raw);
        REQUIRE(result.success);
        REQUIRE(result.warnings.size() == 1);
    }
}

TEST_CASE("Converter reports errors as results", "[converter]") {
    SECTION("Assembler error") {
        auto result = Converter::convert("10 CLS\nPRINT", ConvertOptions(), OutputFormat::Tap);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.data.empty());
        REQUIRE(result.errorCode == ErrorCodes::MISSING_LINE_NUMBER);
        REQUIRE(result.error == "ERROR - Missing line number in ASCII line 2");
    }

    SECTION("Decode error") {
        auto result = Converter::decode(Bytes{'n', 'o', 'p', 'e'}, InputFormat::Tzx);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorCode == ErrorCodes::BAD_SIGNATURE);
    }

    SECTION("Empty cartridge") {
        auto result = Converter::decode(MdrFormat::createEmptyMdr(), InputFormat::Mdr);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorCode == ErrorCodes::NO_PROGRAM);
    }

    SECTION("Damaged RS232 transfer") {
        auto package = Converter::convert(SOURCE, namedOptions(), OutputFormat::Rs232).data;
        package.back() ^= 0x01;
        auto result = Converter::decode(package, InputFormat::Rs232);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorCode == ErrorCodes::CHECKSUM_MISMATCH);

        package.resize(10);
        REQUIRE(Converter::decode(package, InputFormat::Rs232).errorCode == ErrorCodes::TRUNCATED_CONTAINER);
    }
}

TEST_CASE("Converter decodes every format", "[converter]") {
    const OutputFormat formats[] = {OutputFormat::Raw, OutputFormat::Tap, OutputFormat::Tzx,
                                    OutputFormat::Mdr, OutputFormat::Rs232};

    for (OutputFormat format : formats) {
        DYNAMIC_SECTION("Format " << Converter::getFormatName(format)) {
            auto converted = Converter::convert(SOURCE, namedOptions(), format);
            REQUIRE(converted.success);

            auto decoded = Converter::decode(converted.data, format);
            REQUIRE(decoded.success);
            REQUIRE(decoded.source == SOURCE);
            if (format != OutputFormat::Raw) {
                REQUIRE(decoded.programName == "DEMO");
                REQUIRE(decoded.autostart == std::optional<uint16_t>(10));
            }
        }
    }
}

TEST_CASE("Converter format names", "[converter]") {
    REQUIRE(Converter::parseFormatName("TAP") == std::optional<OutputFormat>(OutputFormat::Tap));
    REQUIRE(Converter::parseFormatName("rs232") == std::optional<OutputFormat>(OutputFormat::Rs232));
    REQUIRE_FALSE(Converter::parseFormatName("wav"));

    REQUIRE(Converter::getExtension(OutputFormat::Raw) == ".bin");
    REQUIRE(Converter::getExtension(OutputFormat::Mdr) == ".mdr");

    REQUIRE(Converter::formatFromPath("games/demo.tzx") == InputFormat::Tzx);
    REQUIRE(Converter::formatFromPath("demo.TAP") == InputFormat::Tap);
    REQUIRE(Converter::formatFromPath("demo.bas") == InputFormat::Raw);
    REQUIRE(Converter::formatFromPath("dir.v2/demo") == InputFormat::Raw);
}
