#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Assembler/ProgramAssembler.hpp"
#include "Tokenizer/Detokenizer.hpp"

namespace zxbasic {

enum class OutputFormat {
    Raw,        // Flat token buffer
    Tap,
    Tzx,
    Mdr,
    Rs232
};

// Containers are read in the same formats they are written
using InputFormat = OutputFormat;

struct ConversionResult {
    bool success = false;
    std::vector<uint8_t> data;
    std::vector<std::string> warnings;
    std::vector<ObjectInfo> objects;
    std::string error;
    uint16_t errorCode = 0;
};

struct DecodeResult {
    bool success = false;
    std::string source;
    std::string programName;
    std::optional<uint16_t> autostart;
    std::vector<std::string> warnings;
    std::string error;
    uint16_t errorCode = 0;
};

/**
 * Converter - source text to container and back
 *
 * Front door of the library: runs the assembler and wraps its output in
 * the requested container, or unwraps a container and lists the program.
 * Errors never escape as exceptions.
 */
class Converter {
public:
    /**
     * Tokenize source text and wrap it in a container
     */
    static ConversionResult convert(const std::string& source, const ConvertOptions& options,
                                    OutputFormat format);

    /**
     * Unwrap a container and list its BASIC program
     */
    static DecodeResult decode(const std::vector<uint8_t>& data, InputFormat format,
                               const Detokenizer::Options& detokenizerOptions = Detokenizer::Options());

    // Format names and file extensions
    static std::optional<OutputFormat> parseFormatName(const std::string& name);
    static std::string getFormatName(OutputFormat format);
    static std::string getExtension(OutputFormat format);
    static InputFormat formatFromPath(const std::string& path);

private:
    static std::vector<uint8_t> wrap(const AssembledProgram& program, const ConvertOptions& options,
                                     OutputFormat format);
};

} // namespace zxbasic
