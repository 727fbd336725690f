/**
 * @file RenderService.cpp
 * @brief Implementation of RenderService.
 */

#include "application/RenderService.hpp"

#include <iostream>
#include <utility>

#include "application/LayerPipeline.hpp"
#include "application/ParameterParser.hpp"
#include "domain/ItemEncoder.hpp"
#include "infrastructure/Base64.hpp"

namespace dobdecoder::application {

using json = nlohmann::json;
using namespace dobdecoder::domain;

RenderService::RenderService(std::shared_ptr<ImageComposer> composer,
                             std::string imageType,
                             bool verbose)
    : m_composer(std::move(composer)),
      m_imageType(std::move(imageType)),
      m_verbose(verbose) {}

RenderService::RenderReport RenderService::fail(DecodeError error) const {
    std::cerr << "[RenderService] " << DecodeErrorToString(error)
              << " (code " << ErrorCode(error) << ")" << std::endl;
    RenderReport report;
    report.code = ErrorCode(error);
    report.error = error;
    return report;
}

RenderService::RenderReport RenderService::render(const std::vector<std::string>& inputs) const {
    auto parameters = ParameterParser::ParseParameters(inputs);
    if (!parameters) {
        return fail(parameters.error());
    }

    auto layers = LayerPipeline::BuildLayers(parameters.value());
    if (!layers) {
        return fail(layers.error());
    }

    json images = json::array();
    for (const auto& image : layers.value()) {
        if (ItemEncoder::EncodedSize(image.items) > ItemEncoder::MaxListSize) {
            std::cerr << "[RenderService] Item list for image '" << image.name
                      << "' does not fit the u32 size header" << std::endl;
            return fail(DecodeError::ComposeFailed);
        }
        const auto itemBytes = ItemEncoder::EncodeItemList(image.items);
        if (m_verbose) {
            std::cerr << "[RenderService] Composing image '" << image.name << "' with "
                      << image.items.size() << " layer(s), " << itemBytes.size() << " bytes" << std::endl;
        }

        auto payload = m_composer ? m_composer->compose(itemBytes) : std::nullopt;
        if (!payload) {
            std::cerr << "[RenderService] Compose failed for image '" << image.name << "'" << std::endl;
            return fail(DecodeError::ComposeFailed);
        }

        images.push_back(json::object({
            {"name", image.name},
            {"type", m_imageType},
            {"content", infrastructure::Base64Encode(*payload)}
        }));
    }

    RenderReport report;
    report.document = json::object({
        {"traits", ParameterParser::EncodeTraitOutput(parameters.value().traitOutput)},
        {"images", std::move(images)}
    });
    return report;
}

} // namespace dobdecoder::application
