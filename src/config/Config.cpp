#include "Config.hpp"
#include "../util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace roi_capture {

    static std::string trim_copy(std::string s) {
        auto isspace_ = [](unsigned char c) {return std::isspace(c) != 0; };
        s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), isspace_));
        s.erase(std::find_if_not(s.rbegin(), s.rend(), isspace_).base(), s.end());
        return s;
    }

    static bool parse_bool(const std::string& val) {
        return val == "true" || val == "1";
    }

    // Malformed numbers leave the current value untouched.
    template<class T, class Parse>
    static void parse_number(const std::string& key, const std::string& val, T& target, Parse parse) {
        try {
            target = parse(val);
        }
        catch (const std::exception&) {
            Logger::Warn(L"Config: ignoring malformed value for {}", std::wstring(key.begin(), key.end()));
        }
    }

    bool LoadConfig(CaptureConfig& cfg, const std::filesystem::path& path) {
        std::ifstream f(path);
        if (!f.is_open()) return false;
        std::string line;
        while (std::getline(f, line)) {
            if (line.empty() || line[0] == ';' || line[0] == '#') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;
            auto key = trim_copy(line.substr(0, pos));
            auto val = trim_copy(line.substr(pos + 1));
            if (key == "OutputIndex")
                parse_number(key, val, cfg.outputIndex, [](const std::string& v) { return static_cast<std::uint32_t>(std::clamp(std::stoi(v), 0, 15)); });
            else if (key == "UseACESFilmToneMapping") cfg.useACESFilmToneMapping = parse_bool(val);
            else if (key == "SDRBrightness")
                parse_number(key, val, cfg.sdrBrightness, [](const std::string& v) { return std::clamp(std::stof(v), 80.0f, 1000.0f); });
            else if (key == "DebugMode") cfg.debugMode = parse_bool(val);
            else if (key == "LogFile" && !val.empty()) cfg.logFile = val;
        }
        return true;
    }

    bool SaveConfig(const CaptureConfig& cfg, const std::filesystem::path& path) {
        std::ofstream f(path);
        if (!f.is_open()) return false;
        f << "; ROI Capture Configuration\n";
        f << "OutputIndex=" << cfg.outputIndex << '\n';
        f << "UseACESFilmToneMapping=" << (cfg.useACESFilmToneMapping ? "true" : "false") << '\n';
        f << "SDRBrightness=" << cfg.sdrBrightness << '\n';
        f << "DebugMode=" << (cfg.debugMode ? "true" : "false") << '\n';
        f << "LogFile=" << cfg.logFile << '\n';
        return static_cast<bool>(f);
    }

    bool EnsureConfigFile(const CaptureConfig& cfg, const std::filesystem::path& path) {
        std::ifstream testFile(path);
        bool fileExists = testFile.good();
        testFile.close();

        if (!fileExists) {
            return SaveConfig(cfg, path);
        }

        // Rewrite so the file carries every current key
        CaptureConfig tempCfg;
        if (LoadConfig(tempCfg, path)) {
            return SaveConfig(tempCfg, path);
        }

        return false;
    }

} // namespace roi_capture
