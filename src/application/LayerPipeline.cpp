/**
 * @file LayerPipeline.cpp
 * @brief Implementation of LayerPipeline.
 */

#include "application/LayerPipeline.hpp"

#include <utility>

#include "domain/LayerResolver.hpp"
#include "domain/ValueMatcher.hpp"

namespace dobdecoder::application {

using namespace dobdecoder::domain;

std::vector<std::pair<size_t, size_t>> LayerPipeline::GroupByImage(const std::vector<SchemaEntry>& schema) {
    std::vector<std::pair<size_t, size_t>> runs;
    size_t begin = 0;
    for (size_t i = 1; i <= schema.size(); ++i) {
        if (i == schema.size() || schema[i].imageName != schema[begin].imageName) {
            runs.emplace_back(begin, i);
            begin = i;
        }
    }
    return runs;
}

Result<std::vector<ImageLayers>> LayerPipeline::BuildLayers(const Parameters& parameters) {
    const auto& schema = parameters.schema;
    std::vector<ImageLayers> images;

    for (const auto& [begin, end] : GroupByImage(schema)) {
        ImageLayers image;
        image.name = schema[begin].imageName;

        for (size_t i = begin; i < end; ++i) {
            const SchemaEntry& entry = schema[i];

            auto resolved = LayerResolver::Resolve(entry.sourceTrait, parameters.traitOutput);
            if (!resolved) break;

            auto matched = ValueMatcher::Match(entry.pattern, entry.matchTable, *resolved);
            if (!matched) {
                return matched.error();
            }
            const auto& content = matched.value();
            if (!content) break;

            image.items.push_back(ItemEncoder::Wrap(entry.kind, *content));
        }

        images.push_back(std::move(image));
    }
    return images;
}

} // namespace dobdecoder::application
