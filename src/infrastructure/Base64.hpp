#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dobdecoder::infrastructure {

/** @brief Standard (RFC 4648) base64 with '=' padding. */
std::string Base64Encode(const std::vector<std::uint8_t>& data);

} // namespace dobdecoder::infrastructure
