/**
 * @file PathUtils.hpp
 * @brief Locations of the decoder's settings and whole-file reads for "@path" buffers.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace dobdecoder::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_CONFIG_HOME, else ~/.config, else the working directory. */
    static std::filesystem::path GetConfigHome();

    /**
     * @brief Directory holding settings.json.
     * DOBDECODER_CONFIG_DIR wins, then <config home>/dobdecoder.
     */
    static std::filesystem::path GetDecoderConfigDir();

    /** @brief Reads a whole file into memory, nullopt if it cannot be opened. */
    static std::optional<std::string> ReadFile(const std::filesystem::path& path);
};

} // namespace dobdecoder::infrastructure
