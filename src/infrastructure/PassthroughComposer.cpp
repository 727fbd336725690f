#include "infrastructure/PassthroughComposer.hpp"

#include <iostream>

#include "domain/ItemEncoder.hpp"

namespace dobdecoder::infrastructure {

std::optional<std::vector<std::uint8_t>> PassthroughComposer::compose(const std::vector<std::uint8_t>& itemBytes) {
    if (!domain::ItemEncoder::DecodeItemList(itemBytes)) {
        std::cerr << "[PassthroughComposer] Rejected malformed item list (" << itemBytes.size() << " bytes)" << std::endl;
        return std::nullopt;
    }
    return itemBytes;
}

} // namespace dobdecoder::infrastructure
