#include "Detokenizer.hpp"
#include "Tokenizer.hpp"
#include "Charset/ZXCharset.hpp"
#include "Common/ZXError.hpp"
#include "NumericEngine/ZXFloat.hpp"
#include <sstream>

namespace zxbasic {

namespace {

bool isAlpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

// Characters after which a keyword is separated by a space
bool needsSpaceBefore(char last) {
    return isAlpha(last) || isDigit(last) || last == '$' || last == ')' ||
           last == '"' || last == ':';
}

bool needsSpaceAfter(const std::string& name) {
    char last = name.back();
    return isAlpha(last) || last == '$' || last == '#';
}

} // namespace

Detokenizer::Detokenizer() : Detokenizer(Options()) {
}

Detokenizer::Detokenizer(const Options& options)
    : options(options)
    , keywords(KeywordTable::instance()) {
}

std::string Detokenizer::detokenize(const std::vector<uint8_t>& buffer) const {
    return detokenize(buffer, ProgramStore::LineNumberOrder::Flat);
}

std::string Detokenizer::detokenize(const std::vector<uint8_t>& buffer,
                                    ProgramStore::LineNumberOrder order) const {
    ProgramStore program;
    if (!program.deserialize(buffer, order)) {
        size_t offset = program.getErrorOffset();
        throw ZXError(ErrorCodes::BAD_PROGRAM_BUFFER,
                      "ERROR - Truncated or unterminated program line at offset " +
                      std::to_string(offset),
                      0, offset);
    }
    return detokenize(program);
}

std::string Detokenizer::detokenize(const ProgramStore& program) const {
    std::ostringstream result;
    for (auto it = program.begin(); it != program.end(); ++it) {
        result << it->lineNumber << " " << detokenizeLine(it->tokens) << "\n";
    }
    return result.str();
}

std::string Detokenizer::detokenizeLine(const std::vector<uint8_t>& tokens) const {
    std::string out;
    bool pendingSpace = false;
    bool inString = false;
    bool inRem = false;
    bool inDefFn = false;

    size_t end = tokens.size();
    if (end > 0 && tokens[end - 1] == Tokenizer::LINE_TERMINATOR) {
        end--;
    }

    auto appendText = [&](const std::string& text) {
        if (pendingSpace && !text.empty() && text[0] != ' ') {
            out.push_back(' ');
        }
        pendingSpace = false;
        out += text;
    };

    size_t i = 0;
    while (i < end) {
        uint8_t byte = tokens[i];

        if (inRem || inString) {
            if (byte == Tokenizer::TAB_MARKER) {
                appendText("\t");
            } else {
                appendText(ZXCharset::byteToText(byte, options.unicodeCharset));
            }
            if (inString && byte == '"') {
                inString = false;
            }
            i++;
            continue;
        }

        if (byte == ZXFloat::NUMBER_MARKER) {
            if (i + ZXFloat::NUMBER_SIZE >= end) {
                throw ZXError(ErrorCodes::BAD_PROGRAM_BUFFER,
                              "ERROR - Truncated number at byte " + std::to_string(i), 0, i);
            }
            ZXFloat::ZXNumber number(&tokens[i + 1]);
            char previous = i > 0 ? static_cast<char>(tokens[i - 1]) : '\0';
            bool spelled = isDigit(previous) || previous == '.';
            // DEF FN parameters carry an empty number slot
            if (!spelled && !inDefFn) {
                appendText(ZXFloat::format(number));
            }
            i += 1 + ZXFloat::NUMBER_SIZE;
            continue;
        }

        if (KeywordTable::isKeywordToken(byte)) {
            appendKeyword(out, pendingSpace, byte);
            if (byte == KeywordTable::TOKEN_REM) {
                inRem = true;
            } else if (byte == KeywordTable::TOKEN_DEF_FN) {
                inDefFn = true;
            }
            i++;
            continue;
        }

        if (byte == ' ') {
            // The generated separator already covers a stored space
            if (!out.empty() && out.back() != ' ') {
                out.push_back(' ');
            }
            pendingSpace = false;
            i++;
            continue;
        }

        if (byte == '"') {
            inString = true;
        } else if (byte == '=' || byte == KeywordTable::STATEMENT_SEPARATOR) {
            inDefFn = false;
        }
        if (byte == Tokenizer::TAB_MARKER) {
            appendText("\t");
        } else {
            appendText(ZXCharset::byteToText(byte, options.unicodeCharset));
        }
        i++;
    }

    return out;
}

void Detokenizer::appendKeyword(std::string& out, bool& pendingSpace, uint8_t code) const {
    const std::string name = keywords.getTokenName(code);

    if (pendingSpace || (!out.empty() && isAlpha(name[0]) && needsSpaceBefore(out.back()))) {
        out.push_back(' ');
    }
    out += name;
    // RND, INKEY$ and PI take no argument and list without a trailing space
    pendingSpace = needsSpaceAfter(name) && (code < 0xA5 || code > 0xA7);
}

} // namespace zxbasic
