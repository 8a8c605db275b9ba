#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace roi_capture {

    struct CaptureConfig {
        // Output of the device's adapter to duplicate (0 = primary)
        std::uint32_t outputIndex = 0;

        // HDR processing
        bool        useACESFilmToneMapping = false;
        float       sdrBrightness = 250.0f;                // SDR target peak (nit)

        // Debug
        bool        debugMode = false;                     // file log + debug lines
        std::string logFile = "roi_capture.log";
    };

    // Loads an ini file; keeps defaults for missing keys. Returns false if the file cannot be opened.
    bool LoadConfig(CaptureConfig& cfg, const std::filesystem::path& path = "roi_capture.ini");

    bool SaveConfig(const CaptureConfig& cfg, const std::filesystem::path& path = "roi_capture.ini");

    // Writes defaults when the file is missing, otherwise rewrites it with every current key.
    bool EnsureConfigFile(const CaptureConfig& cfg, const std::filesystem::path& path = "roi_capture.ini");

} // namespace roi_capture
