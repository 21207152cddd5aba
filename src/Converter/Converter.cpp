#include "Converter.hpp"
#include "Common/ZXError.hpp"
#include "Containers/MdrFormat.hpp"
#include "Containers/Rs232Block.hpp"
#include "Containers/TapFormat.hpp"
#include "Containers/TzxFormat.hpp"
#include <algorithm>
#include <cctype>

namespace zxbasic {

ConversionResult Converter::convert(const std::string& source, const ConvertOptions& options,
                                    OutputFormat format) {
    ConversionResult result;

    try {
        ProgramAssembler assembler(options);
        AssembledProgram program = assembler.assemble(source);

        result.data = wrap(program, options, format);
        result.warnings = program.warnings;
        result.objects = program.objects;
        result.success = true;
    } catch (const ZXError& e) {
        result.error = e.what();
        result.errorCode = e.getErrorCode();
    }

    return result;
}

std::vector<uint8_t> Converter::wrap(const AssembledProgram& program, const ConvertOptions& options,
                                     OutputFormat format) {
    switch (format) {
        case OutputFormat::Raw:
            return program.raw;

        case OutputFormat::Tap:
            return TapFormat::createTapFile(program.romImage(), options.programName, options.autostart);

        case OutputFormat::Tzx: {
            auto tap = TapFormat::createTapFile(program.romImage(), options.programName, options.autostart);
            if (options.description.empty()) {
                return TzxFormat::convertTapToTzx(tap);
            }
            return TzxFormat::createTzxWithDescription(tap, options.description);
        }

        case OutputFormat::Mdr:
            return MdrFormat::createMdrFile(program.romImage(), options.programName,
                                            options.cartridgeName, options.autostart);

        case OutputFormat::Rs232:
            return Rs232Block::createProgramPackage(options.programName, program.romImage(),
                                                    options.autostart.value_or(0));
    }

    return program.raw;
}

DecodeResult Converter::decode(const std::vector<uint8_t>& data, InputFormat format,
                               const Detokenizer::Options& detokenizerOptions) {
    DecodeResult result;
    Detokenizer detokenizer(detokenizerOptions);

    try {
        switch (format) {
            case InputFormat::Raw:
                result.source = detokenizer.detokenize(data);
                break;

            case InputFormat::Tzx:
            case InputFormat::Tap: {
                std::vector<uint8_t> tap = data;
                if (format == InputFormat::Tzx) {
                    TzxFormat::TzxFile tzx = TzxFormat::parseTzxFile(data);
                    result.warnings = tzx.warnings;
                    tap = TzxFormat::convertTzxToTap(data);
                }
                TapFormat::TapProgram program = TapFormat::extractProgram(tap);
                result.programName = program.header.programName;
                result.autostart = program.header.autostart;
                result.source = detokenizer.detokenize(program.image, ProgramStore::LineNumberOrder::Rom);
                break;
            }

            case InputFormat::Mdr: {
                MdrFormat::MdrParseResult parsed = MdrFormat::parseMdrFile(data);
                for (const auto& error : parsed.errors) {
                    result.warnings.push_back("Sector " + std::to_string(error.sector) + ": " + error.message);
                }
                if (parsed.programs.empty()) {
                    throw ZXError(ErrorCodes::NO_PROGRAM, "Cartridge contains no BASIC program");
                }
                const MdrFormat::MdrProgram& program = parsed.programs.front();
                result.programName = program.name;
                result.autostart = program.autostart;
                result.source = detokenizer.detokenize(program.image, ProgramStore::LineNumberOrder::Rom);
                break;
            }

            case InputFormat::Rs232: {
                Rs232Block::PackageValidation package = Rs232Block::validateProgramPackage(data);
                if (!package.valid) {
                    throw ZXError(package.errorCode, "Invalid RS232 transfer: " + package.error);
                }
                result.programName = package.header->filename;
                if (package.header->param1 < Rs232Block::NO_AUTOSTART) {
                    result.autostart = package.header->param1;
                }
                result.source = detokenizer.detokenize(package.programData, ProgramStore::LineNumberOrder::Rom);
                break;
            }
        }
        result.success = true;
    } catch (const ZXError& e) {
        result.error = e.what();
        result.errorCode = e.getErrorCode();
    }

    return result;
}

std::optional<OutputFormat> Converter::parseFormatName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "raw" || lower == "bin") return OutputFormat::Raw;
    if (lower == "tap") return OutputFormat::Tap;
    if (lower == "tzx") return OutputFormat::Tzx;
    if (lower == "mdr") return OutputFormat::Mdr;
    if (lower == "rs232") return OutputFormat::Rs232;
    return std::nullopt;
}

std::string Converter::getFormatName(OutputFormat format) {
    switch (format) {
        case OutputFormat::Raw: return "raw";
        case OutputFormat::Tap: return "tap";
        case OutputFormat::Tzx: return "tzx";
        case OutputFormat::Mdr: return "mdr";
        case OutputFormat::Rs232: return "rs232";
    }
    return "raw";
}

std::string Converter::getExtension(OutputFormat format) {
    return format == OutputFormat::Raw ? ".bin" : "." + getFormatName(format);
}

InputFormat Converter::formatFromPath(const std::string& path) {
    size_t dot = path.find_last_of('.');
    size_t slash = path.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return InputFormat::Raw;
    }

    auto format = parseFormatName(path.substr(dot + 1));
    return format ? *format : InputFormat::Raw;
}

} // namespace zxbasic
