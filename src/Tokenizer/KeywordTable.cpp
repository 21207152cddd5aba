#include "KeywordTable.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace zxbasic {

namespace {

std::string toUpperCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); });
    return result;
}

bool isAlpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

size_t skipSpaces(const std::string& line, size_t index) {
    while (index < line.size() && line[index] == ' ') index++;
    return index;
}

} // namespace

// Static member definitions (required for C++11/14)
constexpr uint8_t KeywordTable::FIRST_TOKEN;
constexpr uint8_t KeywordTable::TOKEN_BIN;
constexpr uint8_t KeywordTable::TOKEN_THEN;
constexpr uint8_t KeywordTable::TOKEN_DEF_FN;
constexpr uint8_t KeywordTable::TOKEN_MERGE;
constexpr uint8_t KeywordTable::TOKEN_VERIFY;
constexpr uint8_t KeywordTable::TOKEN_DATA;
constexpr uint8_t KeywordTable::TOKEN_REM;
constexpr uint8_t KeywordTable::TOKEN_LOAD;
constexpr uint8_t KeywordTable::TOKEN_SAVE;
constexpr uint8_t KeywordTable::STATEMENT_SEPARATOR;

const KeywordTable& KeywordTable::instance() {
    static const KeywordTable table;
    return table;
}

KeywordTable::KeywordTable() {
    initializeTable();
}

void KeywordTable::initializeTable() {
    using C = TokenClass;
    keywords.reserve(0x100 - FIRST_TOKEN);

    // 128K additions
    addKeyword("SPECTRUM", 0xA3, C::Statement);
    addKeyword("PLAY", 0xA4, C::Statement);

    // Functions
    addKeyword("RND", 0xA5, C::Expression);
    addKeyword("INKEY$", 0xA6, C::Expression);
    addKeyword("PI", 0xA7, C::Expression);
    addKeyword("FN", 0xA8, C::Expression);
    addKeyword("POINT", 0xA9, C::Expression);
    addKeyword("SCREEN$", 0xAA, C::Expression);
    addKeyword("ATTR", 0xAB, C::Expression);
    addKeyword("AT", 0xAC, C::Expression);
    addKeyword("TAB", 0xAD, C::Expression);
    addKeyword("VAL$", 0xAE, C::Expression);
    addKeyword("CODE", 0xAF, C::Expression);
    addKeyword("VAL", 0xB0, C::Expression);
    addKeyword("LEN", 0xB1, C::Expression);
    addKeyword("SIN", 0xB2, C::Expression);
    addKeyword("COS", 0xB3, C::Expression);
    addKeyword("TAN", 0xB4, C::Expression);
    addKeyword("ASN", 0xB5, C::Expression);
    addKeyword("ACS", 0xB6, C::Expression);
    addKeyword("ATN", 0xB7, C::Expression);
    addKeyword("LN", 0xB8, C::Expression);
    addKeyword("EXP", 0xB9, C::Expression);
    addKeyword("INT", 0xBA, C::Expression);
    addKeyword("SQR", 0xBB, C::Expression);
    addKeyword("SGN", 0xBC, C::Expression);
    addKeyword("ABS", 0xBD, C::Expression);
    addKeyword("PEEK", 0xBE, C::Expression);
    addKeyword("IN", 0xBF, C::Expression);
    addKeyword("USR", 0xC0, C::Expression);
    addKeyword("STR$", 0xC1, C::Expression);
    addKeyword("CHR$", 0xC2, C::Expression);
    addKeyword("NOT", 0xC3, C::Expression);
    addKeyword("BIN", 0xC4, C::Expression);

    // Operators and separators
    addKeyword("OR", 0xC5, C::Expression);
    addKeyword("AND", 0xC6, C::Expression);
    addKeyword("<=", 0xC7, C::Expression);
    addKeyword(">=", 0xC8, C::Expression);
    addKeyword("<>", 0xC9, C::Expression);
    addKeyword("LINE", 0xCA, C::Expression);
    addKeyword("THEN", 0xCB, C::Expression);
    addKeyword("TO", 0xCC, C::Expression);
    addKeyword("STEP", 0xCD, C::Expression);

    // Statements
    addKeyword("DEF FN", 0xCE, C::Statement);
    addKeyword("CAT", 0xCF, C::Statement);
    addKeyword("FORMAT", 0xD0, C::Statement);
    addKeyword("MOVE", 0xD1, C::Statement);
    addKeyword("ERASE", 0xD2, C::Statement);
    addKeyword("OPEN #", 0xD3, C::Statement);
    addKeyword("CLOSE #", 0xD4, C::Statement);
    addKeyword("MERGE", 0xD5, C::Statement);
    addKeyword("VERIFY", 0xD6, C::Statement);
    addKeyword("BEEP", 0xD7, C::Statement);
    addKeyword("CIRCLE", 0xD8, C::Statement);
    addKeyword("INK", 0xD9, C::Both);
    addKeyword("PAPER", 0xDA, C::Both);
    addKeyword("FLASH", 0xDB, C::Both);
    addKeyword("BRIGHT", 0xDC, C::Both);
    addKeyword("INVERSE", 0xDD, C::Both);
    addKeyword("OVER", 0xDE, C::Both);
    addKeyword("OUT", 0xDF, C::Statement);
    addKeyword("LPRINT", 0xE0, C::Statement);
    addKeyword("LLIST", 0xE1, C::Statement);
    addKeyword("STOP", 0xE2, C::Statement);
    addKeyword("READ", 0xE3, C::Statement);
    addKeyword("DATA", 0xE4, C::Statement);
    addKeyword("RESTORE", 0xE5, C::Statement);
    addKeyword("NEW", 0xE6, C::Statement);
    addKeyword("BORDER", 0xE7, C::Statement);
    addKeyword("CONTINUE", 0xE8, C::Statement);
    addKeyword("DIM", 0xE9, C::Statement);
    addKeyword("REM", 0xEA, C::Statement);
    addKeyword("FOR", 0xEB, C::Statement);
    addKeyword("GO TO", 0xEC, C::Statement);
    addKeyword("GO SUB", 0xED, C::Statement);
    addKeyword("INPUT", 0xEE, C::Statement);
    addKeyword("LOAD", 0xEF, C::Statement);
    addKeyword("LIST", 0xF0, C::Statement);
    addKeyword("LET", 0xF1, C::Statement);
    addKeyword("PAUSE", 0xF2, C::Statement);
    addKeyword("NEXT", 0xF3, C::Statement);
    addKeyword("POKE", 0xF4, C::Statement);
    addKeyword("PRINT", 0xF5, C::Statement);
    addKeyword("PLOT", 0xF6, C::Statement);
    addKeyword("RUN", 0xF7, C::Statement);
    addKeyword("SAVE", 0xF8, C::Statement);
    addKeyword("RANDOMIZE", 0xF9, C::Statement);
    addKeyword("IF", 0xFA, C::Statement);
    addKeyword("CLS", 0xFB, C::Statement);
    addKeyword("DRAW", 0xFC, C::Statement);
    addKeyword("CLEAR", 0xFD, C::Statement);
    addKeyword("RETURN", 0xFE, C::Statement);
    addKeyword("COPY", 0xFF, C::Statement);
}

void KeywordTable::addKeyword(const std::string& name, uint8_t code, TokenClass tokenClass) {
    Keyword keyword;
    keyword.name = name;
    keyword.code = code;
    keyword.tokenClass = tokenClass;

    keywords.push_back(keyword);
    codesByName[name] = code;
}

std::optional<KeywordTable::Match> KeywordTable::findToken(const std::string& line, size_t start,
                                                           MatchContext context, bool caseInsensitive) const {
    if (start >= line.size()) {
        return std::nullopt;
    }
    if (line[start] == STATEMENT_SEPARATOR) {
        return Match{STATEMENT_SEPARATOR, skipSpaces(line, start + 1)};
    }
    if (isNeverToken(line[start])) {
        return std::nullopt;
    }

    const Keyword* best = nullptr;
    size_t bestEnd = 0;

    for (const auto& keyword : keywords) {
        auto matchEnd = matchAt(line, start, keyword.name, caseInsensitive);
        if (!matchEnd) {
            continue;
        }

        // "OR" must not match inside "ORANGE"
        char lastChar = keyword.name.back();
        if (isAlpha(lastChar) && *matchEnd < line.size() && isAlpha(line[*matchEnd])) {
            continue;
        }

        if (!best || keyword.name.size() > best->name.size()) {
            best = &keyword;
            bestEnd = *matchEnd;
        }
    }

    if (!best) {
        return std::nullopt;
    }

    // Class filter applies to the longest match only
    if (context == MatchContext::StatementStart && best->tokenClass == TokenClass::Expression) {
        return std::nullopt;
    }
    if (context == MatchContext::Expression && best->tokenClass == TokenClass::Statement) {
        return std::nullopt;
    }

    return Match{best->code, skipSpaces(line, bestEnd)};
}

std::optional<size_t> KeywordTable::matchAt(const std::string& line, size_t start,
                                            const std::string& keyword, bool caseInsensitive) const {
    size_t lineIdx = start;
    size_t keyIdx = 0;

    while (keyIdx < keyword.size()) {
        if (keyword[keyIdx] == ' ') {
            while (keyIdx < keyword.size() && keyword[keyIdx] == ' ') keyIdx++;
            lineIdx = skipSpaces(line, lineIdx);
            continue;
        }

        if (lineIdx >= line.size()) {
            return std::nullopt;
        }

        char lineChar = line[lineIdx];
        char expected = keyword[keyIdx];
        if (caseInsensitive) {
            lineChar = static_cast<char>(std::toupper(static_cast<unsigned char>(lineChar)));
        }
        if (lineChar != expected) {
            return std::nullopt;
        }

        lineIdx++;
        keyIdx++;
    }

    return lineIdx;
}

std::string KeywordTable::getTokenName(uint8_t code) const {
    const Keyword* keyword = getKeyword(code);
    return keyword ? keyword->name : "";
}

uint8_t KeywordTable::getTokenValue(const std::string& keyword) const {
    auto it = codesByName.find(toUpperCase(keyword));
    return (it != codesByName.end()) ? it->second : 0;
}

bool KeywordTable::isReservedWord(const std::string& word) const {
    return codesByName.find(toUpperCase(word)) != codesByName.end();
}

const KeywordTable::Keyword* KeywordTable::getKeyword(uint8_t code) const {
    if (!isKeywordToken(code)) {
        return nullptr;
    }
    return &keywords[code - FIRST_TOKEN];
}

bool KeywordTable::isNeverToken(char c) {
    static const char* NEVER_TOKENS = " \"(),:.=;?+-*/";
    return c != '\0' && std::strchr(NEVER_TOKENS, c) != nullptr;
}

} // namespace zxbasic
