#include "Logger.hpp"
#include <cstdio>
#include <fstream>

#ifdef _WIN32
#include "../platform/WinHeaders.hpp"
#endif

namespace roi_capture {

    Logger& Logger::Get() {
        static Logger g; return g;
    }

    void Logger::EnableFileLogging(const std::filesystem::path& path) {
        std::scoped_lock lk(Get().mtx_);
        Get().filePath_ = path;
    }

    void Logger::DisableFileLogging() {
        std::scoped_lock lk(Get().mtx_);
        Get().filePath_.clear();
    }

    void Logger::writeLine(const std::wstring& line) {
        std::scoped_lock lk(mtx_);
#ifdef _WIN32
        OutputDebugStringW((line + L"\n").c_str());
#else
        std::fwprintf(stderr, L"%ls\n", line.c_str());
#endif
        if (!filePath_.empty()) {
            std::wofstream f(filePath_, std::ios::app);
            if (f.is_open()) f << line << L"\n";
        }
    }

} // namespace roi_capture
