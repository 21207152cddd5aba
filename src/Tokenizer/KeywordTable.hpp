#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

namespace zxbasic {

/**
 * ZX Spectrum keyword table
 *
 * Bidirectional mapping between keyword spellings and the single-byte
 * tokens 0xA3 (SPECTRUM) to 0xFF (COPY) used by the 128K ROM. Built once
 * on first use and read-only afterwards.
 */
class KeywordTable {
public:
    // Where a keyword may legally appear
    enum class TokenClass {
        Expression,     // Functions and operators (RND .. STEP)
        Statement,      // Commands at statement start
        Both            // Colour items: statements and embedded PRINT items
    };

    // What the scanner is currently looking for
    enum class MatchContext {
        StatementStart,
        Expression
    };

    struct Keyword {
        std::string name;
        uint8_t code;
        TokenClass tokenClass;
    };

    struct Match {
        uint8_t code;       // Token byte, or ':' for the statement separator
        size_t nextIndex;   // Source position after the keyword and any spaces
    };

    static const KeywordTable& instance();

    /**
     * Find the keyword at a source position
     * Longest match wins. Words of multi-word keywords may be separated by
     * any number of spaces, including none ("GOTO" matches GO TO).
     * @param line Source text
     * @param start Position to match at
     * @param context Statement start or expression
     * @param caseInsensitive Match keywords regardless of case
     * @return Token and resume position, or nullopt if no keyword is allowed here
     */
    std::optional<Match> findToken(const std::string& line, size_t start,
                                   MatchContext context, bool caseInsensitive) const;

    std::string getTokenName(uint8_t code) const;
    uint8_t getTokenValue(const std::string& keyword) const;
    bool isReservedWord(const std::string& word) const;
    const Keyword* getKeyword(uint8_t code) const;
    const std::vector<Keyword>& getKeywords() const { return keywords; }

    static bool isKeywordToken(uint8_t code) { return code >= FIRST_TOKEN; }

    // MERGE, VERIFY, LOAD and SAVE take a DATA operand
    static bool isFileStatement(uint8_t code) {
        return code == TOKEN_MERGE || code == TOKEN_VERIFY || code == TOKEN_LOAD || code == TOKEN_SAVE;
    }

    // Characters that never start a keyword
    static bool isNeverToken(char c);

    static constexpr uint8_t FIRST_TOKEN = 0xA3;
    static constexpr uint8_t TOKEN_BIN = 0xC4;
    static constexpr uint8_t TOKEN_THEN = 0xCB;
    static constexpr uint8_t TOKEN_DEF_FN = 0xCE;
    static constexpr uint8_t TOKEN_MERGE = 0xD5;
    static constexpr uint8_t TOKEN_VERIFY = 0xD6;
    static constexpr uint8_t TOKEN_DATA = 0xE4;
    static constexpr uint8_t TOKEN_REM = 0xEA;
    static constexpr uint8_t TOKEN_LOAD = 0xEF;
    static constexpr uint8_t TOKEN_SAVE = 0xF8;
    static constexpr uint8_t STATEMENT_SEPARATOR = ':';

private:
    KeywordTable();

    KeywordTable(const KeywordTable&) = delete;
    KeywordTable& operator=(const KeywordTable&) = delete;

    void initializeTable();
    void addKeyword(const std::string& name, uint8_t code, TokenClass tokenClass);

    /**
     * Match one keyword spelling at a position
     * @return Position after the match, or nullopt
     */
    std::optional<size_t> matchAt(const std::string& line, size_t start,
                                  const std::string& keyword, bool caseInsensitive) const;

    std::vector<Keyword> keywords;                  // Indexed by code - FIRST_TOKEN
    std::unordered_map<std::string, uint8_t> codesByName;
};

} // namespace zxbasic
