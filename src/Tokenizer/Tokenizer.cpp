#include "Tokenizer.hpp"
#include "Charset/ZXCharset.hpp"
#include "Common/ZXError.hpp"
#include "NumericEngine/ZXFloat.hpp"
#include <cstdio>

namespace zxbasic {

// Static member definitions (required for C++11/14)
constexpr uint8_t Tokenizer::TAB_MARKER;
constexpr uint8_t Tokenizer::LINE_TERMINATOR;
constexpr size_t Tokenizer::DEF_FN_PLACEHOLDER_SIZE;

Tokenizer::Tokenizer(bool caseInsensitive, bool checkSyntax)
    : caseInsensitive(caseInsensitive)
    , checkSyntax(checkSyntax)
    , state(ScanState::StatementStart)
    , statementToken(0)
    , bracketCount(0)
    , position(0)
    , lineNumber(0)
    , sourceLine(0)
    , keywords(KeywordTable::instance()) {
}

std::string Tokenizer::translateLine(const std::string& line, uint32_t sourceLine) {
    std::string result;
    result.reserve(line.size());

    size_t i = 0;
    while (i < line.size()) {
        unsigned char c = static_cast<unsigned char>(line[i]);

        if (c == '\t') {
            result.push_back(static_cast<char>(TAB_MARKER));
            i++;
            continue;
        }
        if (c == '\r' || c == '\n') {
            i++;
            continue;
        }

        uint8_t zxByte = 0;
        size_t consumed = ZXCharset::textToByte(line, i, zxByte);
        if (consumed > 0) {
            result.push_back(static_cast<char>(zxByte));
            i += consumed;
            continue;
        }

        if (c < 0x20 || c > 0x7E) {
            char code[8];
            std::snprintf(code, sizeof(code), "%xh", c);
            throw ZXError(ErrorCodes::BAD_CHARACTER,
                          "ERROR - ASCII line " + std::to_string(sourceLine) +
                          " contains a bad character (code " + code + ")",
                          sourceLine, i);
        }

        result.push_back(static_cast<char>(c));
        i++;
    }

    return result;
}

std::vector<uint8_t> Tokenizer::tokenizeLine(const std::string& statements, uint16_t lineNum,
                                             uint32_t srcLine) {
    source = statements;
    position = 0;
    lineNumber = lineNum;
    sourceLine = srcLine;
    state = ScanState::StatementStart;
    statementToken = 0;
    bracketCount = 0;
    output.clear();

    while (!isAtEnd()) {
        switch (state) {
            case ScanState::StatementStart:
                scanStatementStart();
                break;
            case ScanState::StringLiteral:
                scanStringLiteral();
                break;
            case ScanState::Rem:
                scanRem();
                break;
            case ScanState::Expression:
            case ScanState::DefFnHeader:
            case ScanState::DefFnParams:
                scanExpression();
                break;
        }
    }

    if (checkSyntax) {
        if (state == ScanState::StringLiteral) {
            error(ErrorCodes::SYNTAX_ERROR,
                  "ERROR in line " + std::to_string(lineNumber) + " - Unterminated string");
        }
        if (bracketCount != 0) {
            error(ErrorCodes::SYNTAX_ERROR,
                  "ERROR in line " + std::to_string(lineNumber) + " - Unbalanced brackets");
        }
    }

    return output;
}

void Tokenizer::scanStatementStart() {
    skipSpaces();
    if (isAtEnd()) {
        return;
    }

    char c = currentChar();
    if (c == '"') {
        error(ErrorCodes::EXPECTED_KEYWORD,
              "ERROR in line " + std::to_string(lineNumber) + " - Expected keyword but got quote");
    }

    auto match = keywords.findToken(source, position, KeywordTable::MatchContext::StatementStart,
                                    caseInsensitive);
    if (!match) {
        error(ErrorCodes::EXPECTED_KEYWORD,
              "ERROR in line " + std::to_string(lineNumber) +
              " - Expected keyword but got \"" + std::string(1, c) + "\"");
        return;
    }

    emit(match->code);
    position = match->nextIndex;

    if (match->code == KeywordTable::STATEMENT_SEPARATOR) {
        return;
    }
    statementToken = match->code;
    if (match->code == KeywordTable::TOKEN_REM) {
        state = ScanState::Rem;
    } else if (match->code == KeywordTable::TOKEN_DEF_FN) {
        state = ScanState::DefFnHeader;
    } else {
        state = ScanState::Expression;
    }
}

void Tokenizer::scanExpression() {
    char c = currentChar();

    if (c == '"') {
        emit(static_cast<uint8_t>(c));
        position++;
        state = ScanState::StringLiteral;
        return;
    }

    if (c == '(') {
        bracketCount++;
        emit(static_cast<uint8_t>(c));
        position++;
        if (state == ScanState::DefFnHeader) {
            state = ScanState::DefFnParams;
        }
        return;
    }

    if (c == ')') {
        bracketCount--;
        if (checkSyntax && bracketCount < 0) {
            error(ErrorCodes::SYNTAX_ERROR,
                  "ERROR in line " + std::to_string(lineNumber) + " - Unbalanced brackets");
        }
        emit(static_cast<uint8_t>(c));
        position++;
        if (state == ScanState::DefFnParams) {
            // Room for the ROM to store the argument when FN is called
            emit(ZXFloat::NUMBER_MARKER);
            for (size_t i = 0; i < DEF_FN_PLACEHOLDER_SIZE; i++) emit(0x00);
            state = ScanState::Expression;
        }
        return;
    }

    auto match = findExpressionToken();
    if (match) {
        emit(match->code);
        position = match->nextIndex;
        if (match->code == KeywordTable::TOKEN_THEN ||
            match->code == KeywordTable::STATEMENT_SEPARATOR) {
            state = ScanState::StatementStart;
        } else if (match->code == KeywordTable::TOKEN_BIN) {
            scanBinaryLiteral();
        }
        return;
    }

    if (scanNumber()) {
        return;
    }

    if (c == ' ') {
        // A run of spaces is kept as one. None is stored before a keyword or at the end
        skipSpaces();
        if (!isAtEnd() && !findExpressionToken()) {
            emit(' ');
        }
        return;
    }

    if (isAlpha(c)) {
        scanIdentifier();
        return;
    }

    emit(static_cast<uint8_t>(c));
    position++;
}

std::optional<KeywordTable::Match> Tokenizer::findExpressionToken() const {
    auto match = keywords.findToken(source, position, KeywordTable::MatchContext::Expression,
                                    caseInsensitive);
    if (match || !KeywordTable::isFileStatement(statementToken)) {
        return match;
    }

    // SAVE "name" DATA a(), LOAD "" DATA ...
    auto data = keywords.findToken(source, position, KeywordTable::MatchContext::StatementStart,
                                   caseInsensitive);
    if (data && data->code == KeywordTable::TOKEN_DATA) {
        return data;
    }
    return std::nullopt;
}

void Tokenizer::scanStringLiteral() {
    char c = currentChar();
    emit(static_cast<uint8_t>(c));
    position++;

    if (c == '"') {
        state = ScanState::Expression;
        skipSpaces();
    }
}

void Tokenizer::scanRem() {
    output.insert(output.end(), source.begin() + position, source.end());
    position = source.size();
}

bool Tokenizer::scanNumber() {
    size_t start = position;
    size_t idx = position;
    bool sawDigit = false;

    while (idx < source.size() && isDigit(source[idx])) {
        idx++;
        sawDigit = true;
    }

    if (idx < source.size() && source[idx] == '.') {
        size_t fraction = idx + 1;
        bool fractionDigits = false;
        while (fraction < source.size() && isDigit(source[fraction])) {
            fraction++;
            fractionDigits = true;
        }
        if (sawDigit || fractionDigits) {
            idx = fraction;
            sawDigit = true;
        }
    }

    if (!sawDigit) {
        return false;
    }

    // Exponent part, only when digits follow
    if (idx < source.size() && (source[idx] == 'E' || source[idx] == 'e')) {
        size_t exponent = idx + 1;
        if (exponent < source.size() && (source[exponent] == '+' || source[exponent] == '-')) {
            exponent++;
        }
        if (exponent < source.size() && isDigit(source[exponent])) {
            while (exponent < source.size() && isDigit(source[exponent])) exponent++;
            idx = exponent;
        }
    }

    std::string spelling = source.substr(start, idx - start);
    output.insert(output.end(), spelling.begin(), spelling.end());
    position = idx;

    ZXFloat::ZXNumber number;
    try {
        number = ZXFloat::encode(ZXFloat::parseLiteral(spelling));
    } catch (const ZXError&) {
        error(ErrorCodes::NUMBER_TOO_BIG,
              "ERROR - Number too big in line " + std::to_string(lineNumber));
    }
    ZXFloat::appendNumber(output, number);
    return true;
}

void Tokenizer::scanBinaryLiteral() {
    uint32_t value = 0;
    size_t digits = 0;

    while (!isAtEnd() && (currentChar() == '0' || currentChar() == '1')) {
        value = value * 2 + (currentChar() == '1' ? 1 : 0);
        if (value > 0xFFFF) {
            error(ErrorCodes::NUMBER_TOO_BIG,
                  "ERROR - Number too big in line " + std::to_string(lineNumber));
        }
        emit(static_cast<uint8_t>(currentChar()));
        position++;
        digits++;
    }

    if (digits == 0) {
        error(ErrorCodes::BAD_BINARY_LITERAL,
              "ERROR in line " + std::to_string(lineNumber) + " - Expected binary literal after BIN");
    }

    ZXFloat::appendNumber(output, ZXFloat::encodeSmallInteger(static_cast<uint16_t>(value)));
}

void Tokenizer::scanIdentifier() {
    while (!isAtEnd() && (isAlphaNumeric(currentChar()) || currentChar() == '$')) {
        emit(static_cast<uint8_t>(currentChar()));
        position++;
    }
}

void Tokenizer::skipSpaces() {
    while (!isAtEnd() && source[position] == ' ') {
        position++;
    }
}

bool Tokenizer::isAlpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool Tokenizer::isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool Tokenizer::isAlphaNumeric(char c) {
    return isAlpha(c) || isDigit(c);
}

void Tokenizer::error(uint16_t code, const std::string& message) const {
    throw ZXError(code, message, sourceLine, position);
}

} // namespace zxbasic
