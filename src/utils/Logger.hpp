#pragma once
#include <string>
#include <mutex>
#include <ctime>
#include <filesystem>
#include <map>

namespace Cadenza {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    class Logger {
    public:
        static void Init(const std::string& base_dir, LogLevel min_level);
        static void SetMinLevel(LogLevel level);
        static LogLevel GetMinLevel();
        // Overrides the minimum level for one component tag, e.g. "resolver".
        static void SetComponentLevel(const std::string& component, LogLevel level);
        static void ClearComponentLevels();
        // The level a component logs at: its override, else the global minimum.
        static LogLevel EffectiveLevel(const std::string& component);
        static LogLevel FromString(const std::string& s);
        static const char* ToString(LogLevel level);

        static void Log(LogLevel level, const std::string& message);
        // Prefixes the line with "[component]" so resolver/queue/cache output can be grepped apart.
        static void Log(LogLevel level, const std::string& component, const std::string& message);

    private:
        static std::mutex log_mutex;
        static LogLevel min_level_;
        static std::map<std::string, LogLevel> component_levels_;
        static std::filesystem::path logs_dir_;
        static std::string current_date_;
        static LogLevel EffectiveLevelUnlocked(const std::string& component);
        static void WriteUnlocked(LogLevel level, const std::string& line);
        static void EnsureLogFileUnlocked(const std::tm& now_tm);
        static void OpenLogFileForDate(const std::string& date);
    };
}
