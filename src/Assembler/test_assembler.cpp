#include <catch2/catch_all.hpp>
#include "ProgramAssembler.hpp"
#include "Common/ZXError.hpp"
#include <algorithm>

using namespace zxbasic;

using Bytes = std::vector<uint8_t>;

// Error code of a failing assemble() call, 0 when it succeeds
static uint16_t assembleError(const std::string& source, const ConvertOptions& options = ConvertOptions()) {
    try {
        ProgramAssembler(options).assemble(source);
    } catch (const ZXError& e) {
        return e.getErrorCode();
    }
    return 0;
}

TEST_CASE("ProgramAssembler splits lines", "[assembler]") {
    SECTION("Any line ending") {
        auto lines = ProgramAssembler::splitLines("10 CLS\r\n20 STOP\r30 RUN\n40 NEW");
        REQUIRE(lines == std::vector<std::string>{"10 CLS", "20 STOP", "30 RUN", "40 NEW"});
    }

    SECTION("Final newline adds no line") {
        REQUIRE(ProgramAssembler::splitLines("10 CLS\n").size() == 1);
        REQUIRE(ProgramAssembler::splitLines("").empty());
    }

    SECTION("Blank lines are kept") {
        REQUIRE(ProgramAssembler::splitLines("10 CLS\n\n20 STOP").size() == 3);
    }
}

TEST_CASE("ProgramAssembler builds the flat buffer", "[assembler]") {
    ProgramAssembler assembler;

    SECTION("Single line") {
        auto result = assembler.assemble("10 LET a=5");
        REQUIRE(result.raw == Bytes{0x0A, 0x00, 0x0B, 0x00, 0xF1, 'a', '=', '5',
                                    0x0E, 0x00, 0x00, 0x05, 0x00, 0x00, 0x0D});
        REQUIRE(result.warnings.empty());
    }

    SECTION("ROM image swaps the line number bytes") {
        auto result = assembler.assemble("10 LET a=5");
        Bytes image = result.romImage();
        REQUIRE(image.size() == result.raw.size());
        REQUIRE(image[0] == 0x00);
        REQUIRE(image[1] == 0x0A);
        REQUIRE(std::equal(image.begin() + 2, image.end(), result.raw.begin() + 2));
    }

    SECTION("Object offsets") {
        auto result = assembler.assemble("10 CLS\n20 PRINT \"HI\"\n");
        REQUIRE(result.objects.size() == 2);
        REQUIRE(result.objects[0].lineNumber == 10);
        REQUIRE(result.objects[0].offset == 0);
        REQUIRE(result.objects[0].length == 6);
        REQUIRE(result.objects[1].lineNumber == 20);
        REQUIRE(result.objects[1].offset == 6);
        REQUIRE(result.objects[1].length == 10);
        REQUIRE(result.raw.size() == 16);
        REQUIRE(result.program.getLineCount() == 2);
    }

    SECTION("Leading spaces before the line number") {
        auto result = assembler.assemble("   10   CLS");
        REQUIRE(result.raw == Bytes{0x0A, 0x00, 0x02, 0x00, 0xFB, 0x0D});
    }

    SECTION("Tab before the line number") {
        auto result = assembler.assemble("\t10\tCLS");
        REQUIRE(result.raw == Bytes{0x0A, 0x00, 0x02, 0x00, 0xFB, 0x0D});
    }

    SECTION("Boundary line numbers") {
        REQUIRE_NOTHROW(assembler.assemble("1 CLS"));
        REQUIRE_NOTHROW(assembler.assemble("9999 CLS"));
    }
}

TEST_CASE("ProgramAssembler warnings", "[assembler]") {
    SECTION("Empty lines are skipped") {
        auto result = ProgramAssembler().assemble("10 CLS\n\n20 STOP");
        REQUIRE(result.program.getLineCount() == 2);
        REQUIRE(result.warnings == std::vector<std::string>{"WARNING - Skipping empty ASCII line 2"});
    }

    SECTION("Lines holding only tabs and spaces are empty") {
        auto result = ProgramAssembler().assemble("10 PRINT 1\n\t\n \t \n20 PRINT 2");
        REQUIRE(result.program.getLineCount() == 2);
        REQUIRE(result.warnings == std::vector<std::string>{"WARNING - Skipping empty ASCII line 2",
                                                            "WARNING - Skipping empty ASCII line 3"});
    }

    SECTION("Duplicate line numbers") {
        auto result = ProgramAssembler().assemble("10 CLS\n10 STOP");
        REQUIRE(result.program.getLineCount() == 2);
        REQUIRE(result.warnings == std::vector<std::string>{"WARNING - Duplicate use of line number 10"});
    }

    SECTION("Lenient mode skips unnumbered lines") {
        ConvertOptions options;
        options.strictLineNumbers = false;
        auto result = ProgramAssembler(options).assemble("10 CLS\nPRINT\n20 STOP");
        REQUIRE(result.program.getLineCount() == 2);
        REQUIRE(result.warnings.size() == 1);
    }

    SECTION("Suppressed warnings") {
        ConvertOptions options;
        options.suppressWarnings = true;
        auto result = ProgramAssembler(options).assemble("10 CLS\n\n10 STOP");
        REQUIRE(result.warnings.empty());
    }
}

TEST_CASE("ProgramAssembler errors", "[assembler]") {
    SECTION("Missing line number") {
        try {
            ProgramAssembler().assemble("10 CLS\n\nPRINT 1");
            FAIL("Expected an error");
        } catch (const ZXError& e) {
            REQUIRE(e.getErrorCode() == ErrorCodes::MISSING_LINE_NUMBER);
            REQUIRE(std::string(e.what()) == "ERROR - Missing line number in ASCII line 3");
            REQUIRE(e.getLineNumber() == 3);
        }
    }

    SECTION("Line numbers out of range") {
        REQUIRE(assembleError("0 CLS") == ErrorCodes::LINE_NUMBER_OUT_OF_RANGE);
        REQUIRE(assembleError("10000 CLS") == ErrorCodes::LINE_NUMBER_OUT_OF_RANGE);
        REQUIRE(assembleError("99999999999 CLS") == ErrorCodes::LINE_NUMBER_OUT_OF_RANGE);
    }

    SECTION("Descending line numbers") {
        try {
            ProgramAssembler().assemble("20 CLS\n10 STOP");
            FAIL("Expected an error");
        } catch (const ZXError& e) {
            REQUIRE(e.getErrorCode() == ErrorCodes::LINE_NUMBER_DESCENDING);
            REQUIRE(std::string(e.what()) == "ERROR - Line number 10 is smaller than previous line number 20");
        }
    }

    SECTION("Line without statements") {
        REQUIRE(assembleError("10   ") == ErrorCodes::NO_STATEMENTS);
    }

    SECTION("Tokenizer errors carry the source line") {
        try {
            ProgramAssembler().assemble("10 CLS\n20 x=1");
            FAIL("Expected an error");
        } catch (const ZXError& e) {
            REQUIRE(e.getErrorCode() == ErrorCodes::EXPECTED_KEYWORD);
            REQUIRE(e.getLineNumber() == 2);
        }
    }

    SECTION("Bad character") {
        REQUIRE(assembleError("10 PRINT \"\x01\"") == ErrorCodes::BAD_CHARACTER);
    }

    SECTION("Program too large") {
        std::string source;
        std::string text(200, 'x');
        for (int line = 1; line <= 250; line++) {
            source += std::to_string(line) + " REM " + text + "\n";
        }
        REQUIRE(assembleError(source) == ErrorCodes::PROGRAM_TOO_LARGE);
    }
}
