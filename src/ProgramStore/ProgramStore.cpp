#include "ProgramStore.hpp"

namespace zxbasic {

// Static member definitions (required for C++11/14)
constexpr uint16_t ProgramStore::MIN_LINE_NUMBER;
constexpr uint16_t ProgramStore::MAX_LINE_NUMBER;
constexpr uint8_t ProgramStore::LINE_TERMINATOR;
constexpr size_t ProgramStore::LINE_NUMBER_SIZE;
constexpr size_t ProgramStore::LENGTH_SIZE;
constexpr size_t ProgramStore::LINE_HEADER_SIZE;

ProgramStore::ProgramStore()
    : firstLine(nullptr)
    , lastLine(nullptr)
    , lineCount(0)
    , totalSize(0)
    , errorOffset(0) {
}

// Core operations

bool ProgramStore::appendLine(uint16_t lineNumber, const std::vector<uint8_t>& tokens) {
    if (!isValidLineNumber(lineNumber)) {
        return false;
    }

    auto newLine = std::make_shared<ProgramLine>(lineNumber);
    newLine->tokens = tokens;
    if (!newLine->isValid()) {
        newLine->tokens.push_back(LINE_TERMINATOR);
    }

    if (lastLine) {
        lastLine->next = newLine;
    } else {
        firstLine = newLine;
    }
    lastLine = newLine;

    lineCount++;
    totalSize += newLine->getSize();
    return true;
}

void ProgramStore::clear() {
    firstLine = nullptr;
    lastLine = nullptr;
    lineCount = 0;
    totalSize = 0;
}

ProgramStore::Iterator ProgramStore::begin() const {
    return Iterator(firstLine);
}

ProgramStore::Iterator ProgramStore::end() const {
    return Iterator(nullptr);
}

// Program analysis

size_t ProgramStore::getLineCount() const {
    return lineCount;
}

size_t ProgramStore::getTotalSize() const {
    return totalSize;
}

uint16_t ProgramStore::getFirstLineNumber() const {
    return firstLine ? firstLine->lineNumber : 0;
}

uint16_t ProgramStore::getLastLineNumber() const {
    return lastLine ? lastLine->lineNumber : 0;
}

bool ProgramStore::isEmpty() const {
    return lineCount == 0;
}

// Serialization and listing

std::vector<uint8_t> ProgramStore::serialize(LineNumberOrder order) const {
    std::vector<uint8_t> result;
    result.reserve(totalSize);

    for (auto current = firstLine; current; current = current->next) {
        uint8_t low = static_cast<uint8_t>(current->lineNumber & 0xFF);
        uint8_t high = static_cast<uint8_t>((current->lineNumber >> 8) & 0xFF);
        if (order == LineNumberOrder::Rom) {
            result.push_back(high);
            result.push_back(low);
        } else {
            result.push_back(low);
            result.push_back(high);
        }

        // Length is little-endian in both forms
        uint16_t length = static_cast<uint16_t>(current->tokens.size());
        result.push_back(static_cast<uint8_t>(length & 0xFF));
        result.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));

        result.insert(result.end(), current->tokens.begin(), current->tokens.end());
    }

    return result;
}

bool ProgramStore::deserialize(const std::vector<uint8_t>& data, LineNumberOrder order) {
    clear();
    errorOffset = 0;

    size_t pos = 0;
    while (pos < data.size()) {
        if (pos + LINE_HEADER_SIZE > data.size()) {
            errorOffset = pos;
            clear();
            return false;
        }

        uint16_t lineNumber = (order == LineNumberOrder::Rom)
            ? static_cast<uint16_t>((data[pos] << 8) | data[pos + 1])
            : static_cast<uint16_t>(data[pos] | (data[pos + 1] << 8));
        uint16_t length = static_cast<uint16_t>(data[pos + 2] | (data[pos + 3] << 8));

        size_t tokensStart = pos + LINE_HEADER_SIZE;
        if (length == 0 || tokensStart + length > data.size() ||
            data[tokensStart + length - 1] != LINE_TERMINATOR) {
            errorOffset = pos;
            clear();
            return false;
        }

        // Stored programs may carry line numbers the editor would refuse
        auto line = std::make_shared<ProgramLine>(lineNumber);
        line->tokens.assign(data.begin() + tokensStart, data.begin() + tokensStart + length);
        if (lastLine) {
            lastLine->next = line;
        } else {
            firstLine = line;
        }
        lastLine = line;
        lineCount++;
        totalSize += line->getSize();

        pos = tokensStart + length;
    }

    return true;
}

std::vector<uint8_t> ProgramStore::convertLineOrder(const std::vector<uint8_t>& data,
                                                    LineNumberOrder from, LineNumberOrder to) {
    ProgramStore store;
    if (!store.deserialize(data, from)) {
        return {};
    }
    return store.serialize(to);
}

std::vector<uint16_t> ProgramStore::getLineNumbers() const {
    std::vector<uint16_t> result;
    result.reserve(lineCount);
    for (auto current = firstLine; current; current = current->next) {
        result.push_back(current->lineNumber);
    }
    return result;
}

// Validation and debugging

bool ProgramStore::validate() const {
    uint16_t lastLineNumber = 0;
    size_t actualLineCount = 0;
    size_t actualTotalSize = 0;

    for (auto current = firstLine; current; current = current->next) {
        if (current->lineNumber < lastLineNumber) {
            return false;
        }
        if (!current->isValid() || !isValidLineNumber(current->lineNumber)) {
            return false;
        }
        if (current->tokens.size() > 0xFFFF) {
            return false;
        }

        lastLineNumber = current->lineNumber;
        actualLineCount++;
        actualTotalSize += current->getSize();
    }

    return actualLineCount == lineCount && actualTotalSize == totalSize;
}

bool ProgramStore::isValidLineNumber(uint16_t lineNumber) {
    return lineNumber >= MIN_LINE_NUMBER && lineNumber <= MAX_LINE_NUMBER;
}

} // namespace zxbasic
