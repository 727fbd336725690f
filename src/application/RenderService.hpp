/**
 * @file RenderService.hpp
 * @brief Runs a full decoding pass and assembles the output document.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/DecodeError.hpp"
#include "domain/ImageComposer.hpp"

namespace dobdecoder::application {

/**
 * @class RenderService
 * @brief Parse -> build layers -> compose each image -> output document.
 */
class RenderService {
public:
    /**
     * @brief Outcome of one run.
     */
    struct RenderReport {
        std::uint64_t code = 0;                 ///< 0 on success, otherwise ErrorCode(*error).
        std::optional<domain::DecodeError> error;
        nlohmann::json document;                ///< {"traits": [...], "images": [...]} on success.
    };

    /**
     * @brief Constructs the service.
     * @param composer Compose collaborator invoked once per image, in order.
     * @param imageType MIME label written in each image entry.
     * @param verbose Emit per-image progress on stderr.
     */
    RenderService(std::shared_ptr<domain::ImageComposer> composer,
                  std::string imageType,
                  bool verbose = false);

    /**
     * @brief Decodes @p inputs ([trait output, trait schema]) and composes every image.
     */
    RenderReport render(const std::vector<std::string>& inputs) const;

private:
    std::shared_ptr<domain::ImageComposer> m_composer;
    std::string m_imageType;
    bool m_verbose;

    RenderReport fail(domain::DecodeError error) const;
};

} // namespace dobdecoder::application
