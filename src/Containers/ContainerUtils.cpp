#include "ContainerUtils.hpp"

namespace zxbasic {
namespace ContainerUtils {

uint8_t xorChecksum(const std::vector<uint8_t>& data, size_t begin, size_t end) {
    uint8_t checksum = 0;
    for (size_t i = begin; i < end && i < data.size(); i++) {
        checksum ^= data[i];
    }
    return checksum;
}

uint8_t xorChecksum(const std::vector<uint8_t>& data) {
    return xorChecksum(data, 0, data.size());
}

uint8_t mdrChecksum(const uint8_t* data, size_t length) {
    unsigned int sum = 0;
    for (size_t i = 0; i < length; i++) {
        sum = (sum + data[i]) % 255;
    }
    return static_cast<uint8_t>(sum);
}

uint8_t mdrChecksum(const std::vector<uint8_t>& data, size_t begin, size_t end) {
    if (end > data.size()) end = data.size();
    if (begin >= end) return 0;
    return mdrChecksum(data.data() + begin, end - begin);
}

std::string padName(const std::string& name, size_t length) {
    std::string result = name.substr(0, length);
    result.resize(length, ' ');
    return result;
}

std::string readName(const uint8_t* field, size_t length) {
    std::string result(reinterpret_cast<const char*>(field), length);
    size_t last = result.find_last_not_of(' ');
    return (last == std::string::npos) ? std::string() : result.substr(0, last + 1);
}

void writeLE16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void writeLE16(uint8_t* out, uint16_t value) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

uint16_t readLE16(const uint8_t* data) {
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

uint32_t readLE24(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16);
}

uint32_t readLE32(const uint8_t* data) {
    return readLE24(data) | (static_cast<uint32_t>(data[3]) << 24);
}

uint16_t autostartField(uint16_t lineNumber, bool enabled) {
    return enabled ? lineNumber : NO_AUTOSTART;
}

} // namespace ContainerUtils
} // namespace zxbasic
