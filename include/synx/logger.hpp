#ifndef SYNX_LOGGER_HPP
#define SYNX_LOGGER_HPP

#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace synx {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

std::optional<LogLevel> parse_log_level(std::string_view name);

// =============================================================================
// Logger - process-wide leveled log plus JSON audit lines
//
// Messages are dropped until Initialize() is called.
// =============================================================================

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    // Empty path logs to stderr
    static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO,
                           bool audit_events = true);

    // Route formatted lines to a callback instead of a file
    static void InitializeWithSink(Sink sink, LogLevel min_level = LogLevel::INFO,
                                   bool audit_events = true);

    static void Shutdown();
    static bool IsInitialized();

    static void Log(LogLevel level, const std::string& message,
                    const char* file = __builtin_FILE(), int line = __builtin_LINE());
    static void Debug(const std::string& m, const char* f = __builtin_FILE(), int l = __builtin_LINE());
    static void Info(const std::string& m, const char* f = __builtin_FILE(), int l = __builtin_LINE());
    static void Warning(const std::string& m, const char* f = __builtin_FILE(), int l = __builtin_LINE());
    static void Error(const std::string& m, const char* f = __builtin_FILE(), int l = __builtin_LINE());
    static void Critical(const std::string& m, const char* f = __builtin_FILE(), int l = __builtin_LINE());

    // One-line JSON audit record, written at INFO regardless of min level
    static void Event(const nlohmann::json& event);

    ~Logger();

private:
    static std::unique_ptr<Logger> instance_;
    static std::mutex instance_mutex_;

    std::ofstream log_file_;
    Sink sink_;
    LogLevel min_level_ = LogLevel::INFO;
    bool audit_events_ = true;

    Logger() = default;
    void Write(LogLevel level, const std::string& line);
    static std::string FormatLine(LogLevel level, const std::string& message,
                                  const char* file, int line);
    static const char* LevelToString(LogLevel level);
};

} // namespace synx

#endif // SYNX_LOGGER_HPP
