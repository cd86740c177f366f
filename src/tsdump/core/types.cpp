#include "tsdump/core/types.h"
#include "tsdump/core/error.h"

#include <sstream>

namespace tsdump {
namespace core {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string bytes_to_string(const Bytes& bytes) {
    std::ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << static_cast<int>(static_cast<int8_t>(bytes[i]));
    }
    oss << ']';
    return oss.str();
}

std::string to_hex(const Bytes& bytes) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

Bytes from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw InvalidArgumentError("Odd-length hex string: " + hex);
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_digit(hex[i]);
        int lo = hex_digit(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw InvalidArgumentError("Invalid hex string: " + hex);
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace core
} // namespace tsdump
