#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ProgramStore/ProgramStore.hpp"

namespace zxbasic {

/**
 * Conversion options shared by the assembler, the container writers and
 * the command line front end.
 */
struct ConvertOptions {
    std::string programName = "PROGRAM";    // Tape/cartridge file name, max 10 characters
    std::optional<uint16_t> autostart;      // LINE n, none when unset
    bool suppressWarnings = false;
    bool caseInsensitive = true;            // Match keywords regardless of case
    bool checkSyntax = false;               // Reject unbalanced brackets and strings
    bool strictLineNumbers = true;          // Missing line number is an error, not a warning
    std::string cartridgeName = "ZXBASIC";  // MDR cartridge label
    std::string description;                // TZX text description
};

// Where each line landed in the flat buffer
struct ObjectInfo {
    uint16_t lineNumber;
    size_t offset;
    size_t length;
};

struct AssembledProgram {
    ProgramStore program;
    std::vector<uint8_t> raw;               // Flat buffer, little-endian line numbers
    std::vector<std::string> warnings;
    std::vector<ObjectInfo> objects;

    // Program as the ROM keeps it in memory (big-endian line numbers)
    std::vector<uint8_t> romImage() const {
        return program.serialize(ProgramStore::LineNumberOrder::Rom);
    }
};

/**
 * Program Assembler
 *
 * Splits BASIC source text into physical lines, validates the line
 * numbers, tokenizes every line and concatenates the results into the flat
 * program buffer.
 */
class ProgramAssembler {
public:
    explicit ProgramAssembler(const ConvertOptions& options = ConvertOptions());

    /**
     * Assemble a whole program
     * @param source BASIC source text, one numbered line per physical line
     * @return Program store, flat buffer, warnings and per-line offsets
     * @throws ZXError on the first fatal error
     */
    AssembledProgram assemble(const std::string& source) const;

    /**
     * Split source text on CRLF, CR or LF
     */
    static std::vector<std::string> splitLines(const std::string& source);

    static constexpr size_t MAX_PROGRAM_SIZE = 41500;
    static constexpr uint32_t MAX_BASIC_LINE = 9999;

private:
    ConvertOptions options;

    void warn(AssembledProgram& result, const std::string& message) const;
};

} // namespace zxbasic
