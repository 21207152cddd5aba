#include <iostream>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <optional>

#include "Assembler/ProgramAssembler.hpp"
#include "Converter/Converter.hpp"
#include "Common/ZXError.hpp"

using namespace zxbasic;

namespace {

struct CommandLine {
    std::string input;
    std::string output;
    OutputFormat format = OutputFormat::Tap;
    ConvertOptions options;
    bool list = false;
    bool verbose = false;
    bool unicode = false;
    bool help = false;
};

void printUsage(const char* program) {
    std::cout << "ZX Spectrum BASIC converter\n";
    std::cout << "Usage: " << program << " <input> [output] [options]\n";
    std::cout << "\n";
    std::cout << "Converts BASIC source text to a tokenized program, or lists a\n";
    std::cout << "tokenized program as source text with --list.\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --format FMT        Output format: raw, tap, tzx, mdr, rs232 (default tap)\n";
    std::cout << "  --name NAME         Program name, max 10 characters (default PROGRAM)\n";
    std::cout << "  --start LINE        Autostart line\n";
    std::cout << "  --cartridge NAME    Microdrive cartridge name (default ZXBASIC)\n";
    std::cout << "  --description TEXT  TZX text description\n";
    std::cout << "  --case-sensitive    Only match keywords written in upper case\n";
    std::cout << "  --check-syntax      Reject unterminated strings and unbalanced brackets\n";
    std::cout << "  --lenient           Skip lines without a line number instead of failing\n";
    std::cout << "  --quiet             Suppress warnings\n";
    std::cout << "  --verbose           Print line count, program size and line offsets\n";
    std::cout << "  --list              List a tokenized program (format from the input extension)\n";
    std::cout << "  --unicode           List pound, up-arrow and copyright as UTF-8\n";
    std::cout << "  --help              Show this help\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program << " game.bas --name GAME --start 10\n";
    std::cout << "  " << program << " game.bas game.mdr --format mdr\n";
    std::cout << "  " << program << " game.tap --list\n";
}

bool parseLineNumber(const std::string& text, uint16_t& value) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    unsigned long number = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        number = number * 10 + static_cast<unsigned long>(c - '0');
    }
    if (number > 0xFFFF) {
        return false;
    }
    value = static_cast<uint16_t>(number);
    return true;
}

// Returns an error message, empty on success
std::string parseArguments(int argc, char* argv[], CommandLine& cmd) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto nextValue = [&](std::string& value) {
            if (i + 1 >= argc) {
                return false;
            }
            value = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--format") {
            std::string name;
            if (!nextValue(name)) return "Missing value for --format";
            auto format = Converter::parseFormatName(name);
            if (!format) return "Unknown format '" + name + "'";
            cmd.format = *format;
        } else if (arg == "--name") {
            if (!nextValue(cmd.options.programName)) return "Missing value for --name";
        } else if (arg == "--start") {
            std::string text;
            uint16_t line = 0;
            if (!nextValue(text)) return "Missing value for --start";
            if (!parseLineNumber(text, line)) return "Invalid autostart line '" + text + "'";
            cmd.options.autostart = line;
        } else if (arg == "--cartridge") {
            if (!nextValue(cmd.options.cartridgeName)) return "Missing value for --cartridge";
        } else if (arg == "--description") {
            if (!nextValue(cmd.options.description)) return "Missing value for --description";
        } else if (arg == "--case-sensitive") {
            cmd.options.caseInsensitive = false;
        } else if (arg == "--check-syntax") {
            cmd.options.checkSyntax = true;
        } else if (arg == "--lenient") {
            cmd.options.strictLineNumbers = false;
        } else if (arg == "--quiet") {
            cmd.options.suppressWarnings = true;
        } else if (arg == "--verbose") {
            cmd.verbose = true;
        } else if (arg == "--list") {
            cmd.list = true;
        } else if (arg == "--unicode") {
            cmd.unicode = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "Unknown option '" + arg + "'";
        } else {
            positional.push_back(arg);
        }
    }

    if (cmd.help) {
        return "";
    }
    if (positional.empty()) {
        return "No input file given";
    }
    if (positional.size() > 2) {
        return "Too many file names";
    }

    cmd.input = positional[0];
    if (positional.size() == 2) {
        cmd.output = positional[1];
    }
    return "";
}

std::string replaceExtension(const std::string& path, const std::string& extension) {
    size_t dot = path.find_last_of('.');
    size_t slash = path.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return path + extension;
    }
    return path.substr(0, dot) + extension;
}

bool readFile(const std::string& filename, std::vector<uint8_t>& data) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        return false;
    }
    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

bool writeFile(const std::string& filename, const std::vector<uint8_t>& data) {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(file);
}

void printWarnings(const std::vector<std::string>& warnings, bool quiet) {
    if (quiet) {
        return;
    }
    for (const auto& warning : warnings) {
        std::cerr << warning << std::endl;
    }
}

int runList(const CommandLine& cmd, const std::vector<uint8_t>& data) {
    Detokenizer::Options options;
    options.unicodeCharset = cmd.unicode;

    DecodeResult result = Converter::decode(data, Converter::formatFromPath(cmd.input), options);
    printWarnings(result.warnings, cmd.options.suppressWarnings);
    if (!result.success) {
        std::cerr << result.error << std::endl;
        return 1;
    }

    if (cmd.verbose && !result.programName.empty()) {
        std::cerr << "Program: " << result.programName;
        if (result.autostart) {
            std::cerr << " (LINE " << *result.autostart << ")";
        }
        std::cerr << std::endl;
    }

    if (cmd.output.empty()) {
        std::cout << result.source;
        return 0;
    }

    std::vector<uint8_t> text(result.source.begin(), result.source.end());
    if (!writeFile(cmd.output, text)) {
        std::cerr << "Error: Cannot write file '" << cmd.output << "'" << std::endl;
        return 1;
    }
    return 0;
}

int runConvert(const CommandLine& cmd, const std::vector<uint8_t>& data) {
    std::string source(data.begin(), data.end());

    ConversionResult result = Converter::convert(source, cmd.options, cmd.format);
    printWarnings(result.warnings, cmd.options.suppressWarnings);
    if (!result.success) {
        std::cerr << result.error << std::endl;
        return 1;
    }

    std::string output = cmd.output.empty()
        ? replaceExtension(cmd.input, Converter::getExtension(cmd.format))
        : cmd.output;

    if (!writeFile(output, result.data)) {
        std::cerr << "Error: Cannot write file '" << output << "'" << std::endl;
        return 1;
    }

    if (cmd.verbose) {
        size_t programSize = 0;
        for (const auto& object : result.objects) {
            programSize += object.length;
        }
        std::cout << "Lines: " << result.objects.size() << "\n";
        std::cout << "Program size: " << programSize << " bytes\n";
        for (const auto& object : result.objects) {
            std::cout << "  Line " << object.lineNumber << " at offset " << object.offset
                      << ", " << object.length << " bytes\n";
        }
    }

    std::cout << "Wrote " << result.data.size() << " bytes to " << output
              << " (" << Converter::getFormatName(cmd.format) << ")" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    std::string error = parseArguments(argc, argv, cmd);

    if (cmd.help) {
        printUsage(argv[0]);
        return 0;
    }
    if (!error.empty()) {
        std::cerr << "Error: " << error << std::endl;
        std::cerr << "Try '" << argv[0] << " --help' for more information." << std::endl;
        return 1;
    }

    std::vector<uint8_t> data;
    if (!readFile(cmd.input, data)) {
        std::cerr << "Error: Cannot open file '" << cmd.input << "'" << std::endl;
        return 1;
    }

    return cmd.list ? runList(cmd, data) : runConvert(cmd, data);
}
