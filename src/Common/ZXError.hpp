#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace zxbasic {

/**
 * ZXError - conversion error
 *
 * Thrown by the tokenizer, assembler, detokenizer and container codecs.
 * Carries an error code, the 1-based source line (0 when not tied to a
 * source line) and a byte offset into the input being processed.
 */
class ZXError : public std::runtime_error {
public:
    ZXError(uint16_t errorCode, const std::string& message, uint32_t lineNumber = 0, size_t position = 0)
        : std::runtime_error(message), errorCode_(errorCode), lineNumber_(lineNumber), position_(position) {}

    uint16_t getErrorCode() const { return errorCode_; }
    uint32_t getLineNumber() const { return lineNumber_; }
    size_t getPosition() const { return position_; }

private:
    uint16_t errorCode_;
    uint32_t lineNumber_;
    size_t position_;
};

namespace ErrorCodes {
    // Source text
    constexpr uint16_t MISSING_LINE_NUMBER = 1;
    constexpr uint16_t LINE_NUMBER_OUT_OF_RANGE = 2;
    constexpr uint16_t LINE_NUMBER_DESCENDING = 3;
    constexpr uint16_t NO_STATEMENTS = 4;
    constexpr uint16_t BAD_CHARACTER = 5;
    constexpr uint16_t EXPECTED_KEYWORD = 6;
    constexpr uint16_t NUMBER_TOO_BIG = 7;
    constexpr uint16_t BAD_BINARY_LITERAL = 8;
    constexpr uint16_t SYNTAX_ERROR = 9;
    constexpr uint16_t PROGRAM_TOO_LARGE = 10;

    // Binary program and containers
    constexpr uint16_t BAD_PROGRAM_BUFFER = 20;
    constexpr uint16_t BAD_SIGNATURE = 21;
    constexpr uint16_t TRUNCATED_CONTAINER = 22;
    constexpr uint16_t CHECKSUM_MISMATCH = 23;
    constexpr uint16_t UNKNOWN_BLOCK = 24;
    constexpr uint16_t BAD_CONTAINER_SIZE = 25;
    constexpr uint16_t NO_PROGRAM = 26;
}

} // namespace zxbasic
