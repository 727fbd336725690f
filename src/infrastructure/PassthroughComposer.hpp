/**
 * @file PassthroughComposer.hpp
 * @brief Compose collaborator that returns the validated item list unchanged.
 */

#pragma once

#include "domain/ImageComposer.hpp"

namespace dobdecoder::infrastructure {

/**
 * @class PassthroughComposer
 * @brief Lets the decoder run end to end without a renderer attached.
 *
 * The item list is checked for well-formedness; the "rendered" payload is
 * the item list itself, so downstream consumers can composite it later.
 */
class PassthroughComposer : public domain::ImageComposer {
public:
    std::optional<std::vector<std::uint8_t>> compose(const std::vector<std::uint8_t>& itemBytes) override;
};

} // namespace dobdecoder::infrastructure
