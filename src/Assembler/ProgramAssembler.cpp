#include "ProgramAssembler.hpp"
#include "Common/ZXError.hpp"
#include "Tokenizer/Tokenizer.hpp"

namespace zxbasic {

namespace {

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

// Blanks around the line number, tabs already translated to 0x06
bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == static_cast<char>(Tokenizer::TAB_MARKER);
}

} // namespace

// Static member definitions (required for C++11/14)
constexpr size_t ProgramAssembler::MAX_PROGRAM_SIZE;
constexpr uint32_t ProgramAssembler::MAX_BASIC_LINE;

ProgramAssembler::ProgramAssembler(const ConvertOptions& options) : options(options) {
}

std::vector<std::string> ProgramAssembler::splitLines(const std::string& source) {
    std::vector<std::string> lines;
    std::string current;

    for (size_t i = 0; i < source.size(); i++) {
        char c = source[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(current);
            current.clear();
            if (c == '\r' && i + 1 < source.size() && source[i + 1] == '\n') {
                i++;
            }
            continue;
        }
        current.push_back(c);
    }

    // A final newline does not open another line
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

AssembledProgram ProgramAssembler::assemble(const std::string& source) const {
    AssembledProgram result;
    Tokenizer tokenizer(options.caseInsensitive, options.checkSyntax);

    auto lines = splitLines(source);
    long previousLineNumber = -1;

    for (size_t index = 0; index < lines.size(); index++) {
        uint32_t sourceLine = static_cast<uint32_t>(index + 1);
        std::string prepared = Tokenizer::translateLine(lines[index], sourceLine);

        // Leading line number
        size_t pos = 0;
        while (pos < prepared.size() && isSpace(prepared[pos])) pos++;
        size_t digitsStart = pos;
        while (pos < prepared.size() && isDigit(prepared[pos])) pos++;

        if (pos == digitsStart) {
            if (pos == prepared.size()) {
                warn(result, "WARNING - Skipping empty ASCII line " + std::to_string(sourceLine));
                continue;
            }
            if (!options.strictLineNumbers) {
                warn(result, "WARNING - Skipping ASCII line " + std::to_string(sourceLine) +
                             " without line number");
                continue;
            }
            throw ZXError(ErrorCodes::MISSING_LINE_NUMBER,
                          "ERROR - Missing line number in ASCII line " + std::to_string(sourceLine),
                          sourceLine);
        }

        // Saturate long digit runs so they still read as too large
        uint32_t lineNumber = 0;
        for (size_t i = digitsStart; i < pos; i++) {
            lineNumber = lineNumber * 10 + static_cast<uint32_t>(prepared[i] - '0');
            if (lineNumber > MAX_BASIC_LINE) {
                lineNumber = MAX_BASIC_LINE + 1;
            }
        }

        if (lineNumber > MAX_BASIC_LINE) {
            throw ZXError(ErrorCodes::LINE_NUMBER_OUT_OF_RANGE,
                          "ERROR - Line number " + prepared.substr(digitsStart, pos - digitsStart) +
                          " is larger than the maximum allowed",
                          sourceLine);
        }
        if (lineNumber < ProgramStore::MIN_LINE_NUMBER) {
            throw ZXError(ErrorCodes::LINE_NUMBER_OUT_OF_RANGE,
                          "ERROR - Line number 0 is out of range in ASCII line " +
                          std::to_string(sourceLine),
                          sourceLine);
        }

        if (previousLineNumber >= 0) {
            if (static_cast<long>(lineNumber) < previousLineNumber) {
                throw ZXError(ErrorCodes::LINE_NUMBER_DESCENDING,
                              "ERROR - Line number " + std::to_string(lineNumber) +
                              " is smaller than previous line number " +
                              std::to_string(previousLineNumber),
                              sourceLine);
            }
            if (static_cast<long>(lineNumber) == previousLineNumber) {
                warn(result, "WARNING - Duplicate use of line number " + std::to_string(lineNumber));
            }
        }
        previousLineNumber = static_cast<long>(lineNumber);

        while (pos < prepared.size() && isSpace(prepared[pos])) pos++;
        if (pos == prepared.size()) {
            throw ZXError(ErrorCodes::NO_STATEMENTS,
                          "ERROR - Line " + std::to_string(lineNumber) + " contains no statements!",
                          sourceLine);
        }

        auto tokens = tokenizer.tokenizeLine(prepared.substr(pos),
                                             static_cast<uint16_t>(lineNumber), sourceLine);
        tokens.push_back(Tokenizer::LINE_TERMINATOR);

        ObjectInfo object;
        object.lineNumber = static_cast<uint16_t>(lineNumber);
        object.offset = result.program.getTotalSize();
        object.length = ProgramStore::LINE_HEADER_SIZE + tokens.size();
        result.objects.push_back(object);

        if (!result.program.appendLine(static_cast<uint16_t>(lineNumber), tokens)) {
            throw ZXError(ErrorCodes::LINE_NUMBER_OUT_OF_RANGE,
                          "ERROR - Line number " + std::to_string(lineNumber) + " out of range",
                          sourceLine);
        }

        if (result.program.getTotalSize() > MAX_PROGRAM_SIZE) {
            throw ZXError(ErrorCodes::PROGRAM_TOO_LARGE,
                          "ERROR - Object file too large at line " + std::to_string(lineNumber) + "!",
                          sourceLine);
        }
    }

    result.raw = result.program.serialize(ProgramStore::LineNumberOrder::Flat);
    return result;
}

void ProgramAssembler::warn(AssembledProgram& result, const std::string& message) const {
    if (!options.suppressWarnings) {
        result.warnings.push_back(message);
    }
}

} // namespace zxbasic
