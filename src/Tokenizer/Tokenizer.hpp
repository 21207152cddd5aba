#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include "KeywordTable.hpp"

namespace zxbasic {

/**
 * ZX Spectrum BASIC line tokenizer
 *
 * Converts the statement part of one BASIC line into the byte form the
 * ROM keeps in memory: keywords become single-byte tokens, numeric
 * literals keep their ASCII spelling followed by 0x0E and the 5-byte
 * number, strings and REM text are copied verbatim.
 */
class Tokenizer {
public:
    // Scanner state
    enum class ScanState {
        StatementStart,     // Expecting a statement keyword
        Expression,         // Inside a statement
        DefFnHeader,        // After DEF FN, before the parameter list
        DefFnParams,        // Inside the DEF FN parameter list
        StringLiteral,      // Inside "..."
        Rem                 // Rest of the line is a comment
    };

    explicit Tokenizer(bool caseInsensitive = true, bool checkSyntax = false);

    /**
     * Translate one physical source line to ZX character bytes
     * Tabs become 0x06, CR/LF are dropped, UTF-8 symbols and the {(C)} and
     * {UDG:nn} escapes become their ZX bytes.
     * @param line Physical source line
     * @param sourceLine 1-based line in the source file (for messages)
     * @throws ZXError BAD_CHARACTER for anything else outside 0x20-0x7E
     */
    static std::string translateLine(const std::string& line, uint32_t sourceLine);

    /**
     * Tokenize the statements of one line
     * @param statements Translated line text after the line number
     * @param lineNumber BASIC line number (for messages)
     * @param sourceLine 1-based line in the source file
     * @return Token bytes without the 0x0D terminator
     * @throws ZXError on malformed input
     */
    std::vector<uint8_t> tokenizeLine(const std::string& statements, uint16_t lineNumber,
                                      uint32_t sourceLine = 0);

    static constexpr uint8_t TAB_MARKER = 0x06;
    static constexpr uint8_t LINE_TERMINATOR = 0x0D;
    static constexpr size_t DEF_FN_PLACEHOLDER_SIZE = 5;

private:
    // Per-line state
    bool caseInsensitive;
    bool checkSyntax;
    ScanState state;
    uint8_t statementToken;     // Keyword of the current statement
    int bracketCount;
    std::string source;
    size_t position;
    uint16_t lineNumber;
    uint32_t sourceLine;
    std::vector<uint8_t> output;

    const KeywordTable& keywords;

    // State handlers
    void scanStatementStart();
    void scanExpression();
    void scanStringLiteral();
    void scanRem();

    // Keyword allowed at the current position inside a statement
    std::optional<KeywordTable::Match> findExpressionToken() const;

    // Literals
    bool scanNumber();
    void scanBinaryLiteral();
    void scanIdentifier();

    void emit(uint8_t byte) { output.push_back(byte); }
    void skipSpaces();
    bool isAtEnd() const { return position >= source.size(); }
    char currentChar() const { return isAtEnd() ? '\0' : source[position]; }

    static bool isAlpha(char c);
    static bool isDigit(char c);
    static bool isAlphaNumeric(char c);

    // Error handling
    void error(uint16_t code, const std::string& message) const;
};

} // namespace zxbasic
