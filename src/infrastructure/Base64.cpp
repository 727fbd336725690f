#include "infrastructure/Base64.hpp"

namespace dobdecoder::infrastructure {

// Base64 encoding table
static const char base64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string Base64Encode(const std::vector<std::uint8_t>& data) {
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i < data.size()) {
        const size_t remaining = data.size() - i;
        std::uint32_t octetA = data[i++];
        std::uint32_t octetB = remaining > 1 ? data[i++] : 0;
        std::uint32_t octetC = remaining > 2 ? data[i++] : 0;

        std::uint32_t triple = (octetA << 16) | (octetB << 8) | octetC;

        result += base64Chars[(triple >> 18) & 0x3F];
        result += base64Chars[(triple >> 12) & 0x3F];
        result += remaining > 1 ? base64Chars[(triple >> 6) & 0x3F] : '=';
        result += remaining > 2 ? base64Chars[triple & 0x3F] : '=';
    }

    return result;
}

} // namespace dobdecoder::infrastructure
