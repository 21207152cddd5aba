#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "KeywordTable.hpp"
#include "ProgramStore/ProgramStore.hpp"

namespace zxbasic {

/**
 * ZX Spectrum BASIC detokenizer
 *
 * Lists a tokenized program as source text, one "<number> <statements>"
 * line per program line. Keywords are expanded with the spacing the ROM
 * uses when listing, the hidden 5-byte numbers are dropped in favour of
 * their ASCII spelling.
 */
class Detokenizer {
public:
    struct Options {
        bool unicodeCharset = false;    // Render pound, up-arrow and copyright as UTF-8
    };

    Detokenizer();
    explicit Detokenizer(const Options& options);

    /**
     * List a flat program buffer (little-endian line numbers)
     * @throws ZXError BAD_PROGRAM_BUFFER on a truncated or unterminated line
     */
    std::string detokenize(const std::vector<uint8_t>& buffer) const;

    /**
     * List a program image with the given line number byte order
     */
    std::string detokenize(const std::vector<uint8_t>& buffer,
                           ProgramStore::LineNumberOrder order) const;

    /**
     * List every line of a program store
     */
    std::string detokenize(const ProgramStore& program) const;

    /**
     * Render the tokens of one line (terminator optional)
     */
    std::string detokenizeLine(const std::vector<uint8_t>& tokens) const;

private:
    Options options;
    const KeywordTable& keywords;

    void appendKeyword(std::string& out, bool& pendingSpace, uint8_t code) const;
};

} // namespace zxbasic
