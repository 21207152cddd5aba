#ifndef ZXBASIC_PROGRAMSTORE_H
#define ZXBASIC_PROGRAMSTORE_H

#include <cstdint>
#include <vector>
#include <memory>
#include <string>

namespace zxbasic {

/**
 * ZX Spectrum BASIC Program Store
 *
 * Holds the tokenized lines of one program in file order.
 * Line layout: lineNo(2) length(2) tokens... 0x0D
 *
 * The length field is always little-endian and counts the tokens including
 * the 0x0D terminator. The line number is little-endian in the flat buffer
 * the converter works with, and big-endian in the image the ROM keeps in
 * memory (and that TAP, TZX, MDR and RS232 containers carry).
 *
 * Lines are appended in source order. Equal line numbers may follow each
 * other, descending ones are rejected by validate().
 */
class ProgramStore {
public:
    // Byte order of the line number field
    enum class LineNumberOrder {
        Flat,   // Little-endian, converter buffer
        Rom     // Big-endian, memory image
    };

    // Forward declaration of line structure
    struct ProgramLine;

    // Shared pointer type for program lines
    using ProgramLinePtr = std::shared_ptr<ProgramLine>;

    /**
     * Program line structure
     * Layout: lineNo(2) length(2) tokens... 0x0D
     */
    struct ProgramLine {
        ProgramLinePtr next;            // Next line in file order
        uint16_t lineNumber;            // Line number (2 bytes)
        std::vector<uint8_t> tokens;    // Tokenized bytes terminated by 0x0D

        ProgramLine(uint16_t lineNum = 0)
            : next(nullptr), lineNumber(lineNum) {}

        // Get the total size of this line in bytes (as it would be stored in memory)
        size_t getSize() const {
            return LINE_HEADER_SIZE + tokens.size();
        }

        // Check if line is properly terminated
        bool isValid() const {
            return !tokens.empty() && tokens.back() == LINE_TERMINATOR;
        }
    };

    // Iterator class for traversing program lines
    class Iterator {
    public:
        Iterator(ProgramLinePtr line) : current(line) {}

        Iterator& operator++() {
            if (current) current = current->next;
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const Iterator& other) const {
            return current == other.current;
        }

        bool operator!=(const Iterator& other) const {
            return !(*this == other);
        }

        ProgramLine& operator*() const {
            return *current;
        }

        ProgramLinePtr operator->() const {
            return current;
        }

        bool isValid() const {
            return current != nullptr;
        }

    private:
        ProgramLinePtr current;
    };

public:
    ProgramStore();

    // Core operations

    /**
     * Append a line at the end of the program
     * @param lineNumber Line number (1-9999)
     * @param tokens Tokenized bytes (0x0D is appended when missing)
     * @return true if successful, false if the line number is out of range
     */
    bool appendLine(uint16_t lineNumber, const std::vector<uint8_t>& tokens);

    // Remove all lines
    void clear();

    Iterator begin() const;
    Iterator end() const;

    // Program analysis

    size_t getLineCount() const;

    /**
     * Get total bytes the program occupies (headers included)
     */
    size_t getTotalSize() const;

    uint16_t getFirstLineNumber() const;
    uint16_t getLastLineNumber() const;
    bool isEmpty() const;

    // Serialization and listing

    /**
     * Convert program to its binary form
     * @param order Byte order of the line number field
     * @return Concatenated lines
     */
    std::vector<uint8_t> serialize(LineNumberOrder order = LineNumberOrder::Flat) const;

    /**
     * Load program from its binary form
     * @param data Concatenated lines
     * @param order Byte order of the line number field
     * @return true if successful, false if corrupted data (see getErrorOffset())
     */
    bool deserialize(const std::vector<uint8_t>& data, LineNumberOrder order = LineNumberOrder::Flat);

    /**
     * Byte offset of the structure error found by the last deserialize()
     */
    size_t getErrorOffset() const { return errorOffset; }

    /**
     * Convert between the flat buffer and the memory image
     * @return Converted buffer, empty if the input is corrupted
     */
    static std::vector<uint8_t> convertLineOrder(const std::vector<uint8_t>& data,
                                                 LineNumberOrder from, LineNumberOrder to);

    /**
     * Get list of all line numbers in file order
     */
    std::vector<uint16_t> getLineNumbers() const;

    // Validation

    /**
     * Validate program structure integrity
     * @return true if line numbers are in range and never descend and every
     *         line is terminated
     */
    bool validate() const;

    static bool isValidLineNumber(uint16_t lineNumber);

    // Constants
    static constexpr uint16_t MIN_LINE_NUMBER = 1;
    static constexpr uint16_t MAX_LINE_NUMBER = 9999;
    static constexpr uint8_t LINE_TERMINATOR = 0x0D;
    static constexpr size_t LINE_NUMBER_SIZE = 2;
    static constexpr size_t LENGTH_SIZE = 2;
    static constexpr size_t LINE_HEADER_SIZE = LINE_NUMBER_SIZE + LENGTH_SIZE;

private:
    ProgramLinePtr firstLine;
    ProgramLinePtr lastLine;
    size_t lineCount;
    size_t totalSize;
    size_t errorOffset;
};

} // namespace zxbasic

#endif // ZXBASIC_PROGRAMSTORE_H
