#include "mcpserve/base64.hpp"
#include <cstdint>

namespace mcpserve {

std::string base64_encode(std::string_view bytes) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16)
                   | (static_cast<uint8_t>(bytes[i + 1]) << 8)
                   | static_cast<uint8_t>(bytes[i + 2]);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16)
                   | (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

} // namespace mcpserve
