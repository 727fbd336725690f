/**
 * @file LayerPipeline.hpp
 * @brief Groups schema entries by image and resolves each group into an item list.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "domain/ItemEncoder.hpp"
#include "domain/Parameters.hpp"
#include "domain/Result.hpp"

namespace dobdecoder::application {

/**
 * @struct ImageLayers
 * @brief Ordered layer items for one named image.
 */
struct ImageLayers {
    std::string name;
    domain::ItemList items;
};

/**
 * @class LayerPipeline
 * @brief Resolve, match and encode every schema group in declaration order.
 *
 * Groups are maximal runs of adjacent entries sharing an image name, so
 * non-adjacent duplicates yield separate images. Inside a group the first
 * unresolved or unmatched entry truncates the group; match errors abort
 * the whole run.
 */
class LayerPipeline {
public:
    static domain::Result<std::vector<ImageLayers>> BuildLayers(const domain::Parameters& parameters);

    /**
     * @brief Splits @p schema into runs of adjacent entries with the same image name.
     * @return Half-open [begin, end) index ranges, in order.
     */
    static std::vector<std::pair<size_t, size_t>> GroupByImage(const std::vector<domain::SchemaEntry>& schema);
};

} // namespace dobdecoder::application
