#pragma once
#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <fmt/xchar.h>

namespace roi_capture {

    // Process-wide log: debugger (or stderr) output, plus an optional append-only file (config DebugMode)
    class Logger {
    public:
        static Logger& Get();
        static void EnableFileLogging(const std::filesystem::path& path);
        static void DisableFileLogging();
        static void EnableDebug(bool on) { Get().debug_.store(on); }
        static bool IsDebugEnabled() { return Get().debug_.load(); }

        template<class...Args>
        static void Info(std::wstring_view fmt, Args&&...args) { Get().logImpl(L"INFO", fmt, std::forward<Args>(args)...); }
        template<class...Args>
        static void Warn(std::wstring_view fmt, Args&&...args) { Get().logImpl(L"WARN", fmt, std::forward<Args>(args)...); }
        template<class...Args>
        static void Error(std::wstring_view fmt, Args&&...args) { Get().logImpl(L"ERR", fmt, std::forward<Args>(args)...); }
        template<class...Args>
        static void Debug(std::wstring_view fmt, Args&&...args) {
            if (!IsDebugEnabled()) return;
            Get().logImpl(L"DBG", fmt, std::forward<Args>(args)...);
        }

    private:
        Logger() = default;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;
        void writeLine(const std::wstring& line);

        template<class...Args>
        void logImpl(std::wstring_view lvl, std::wstring_view fmt, Args&&...args) {
            std::wstring msg = fmt::vformat(fmt::wstring_view(fmt.data(), fmt.size()), fmt::make_wformat_args(args...));
            writeLine(std::wstring(lvl) + L": " + msg);
        }

        std::mutex            mtx_;
        std::filesystem::path filePath_;
        std::atomic<bool>     debug_{ false };
    };

} // namespace roi_capture
