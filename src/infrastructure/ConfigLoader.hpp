/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving decoder settings (settings.json).
 *
 * Keeps JSON parsing of the settings file in one place; callers only see
 * the typed DecoderSettings.
 */

#pragma once

#include <string>

namespace dobdecoder::infrastructure {

/**
 * @struct DecoderSettings
 * @brief Runtime options of the decoder binary.
 */
struct DecoderSettings {
    std::string imageType = "image/png;base64"; ///< MIME label written for each composed image.
    bool verbose = false;                        ///< Per-image progress on stderr.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from @p configDir.
     * @param configDir Directory containing settings.json.
     * @return Settings; defaults for any missing or malformed key, or when the file is absent.
     */
    static DecoderSettings Load(const std::string& configDir);

    /**
     * @brief Writes @p settings to settings.json, preserving unrelated keys if possible.
     * @return False if the file could not be written.
     */
    static bool Save(const std::string& configDir, const DecoderSettings& settings);
};

} // namespace dobdecoder::infrastructure
