/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace dobdecoder::infrastructure {

namespace {
const char* const kSettingsFile = "settings.json";
}

DecoderSettings ConfigLoader::Load(const std::string& configDir) {
    DecoderSettings settings;
    std::filesystem::path configPath = std::filesystem::path(configDir) / kSettingsFile;
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (j.contains("image_type") && j["image_type"].is_string()) {
            settings.imageType = j["image_type"].get<std::string>();
        }
        if (j.contains("verbose") && j["verbose"].is_boolean()) {
            settings.verbose = j["verbose"].get<bool>();
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }

    return settings;
}

bool ConfigLoader::Save(const std::string& configDir, const DecoderSettings& settings) {
    std::filesystem::path configPath = std::filesystem::path(configDir) / kSettingsFile;
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }
    if (!j.is_object()) {
        j = nlohmann::json::object();
    }

    j["image_type"] = settings.imageType;
    j["verbose"] = settings.verbose;

    try {
        std::filesystem::create_directories(configPath.parent_path());
        std::ofstream f(configPath);
        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Cannot open settings.json for writing: " << configPath << std::endl;
            return false;
        }
        f << j.dump(4);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace dobdecoder::infrastructure
