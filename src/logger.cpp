// =============================================================================
// logger.cpp - Leveled Logging and Audit Events
// =============================================================================

#include "synx/logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>
#include <sstream>

namespace synx {

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

namespace {

std::string NowToString(const std::chrono::system_clock::time_point& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

const char* Basename(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void Logger::Initialize(const std::string& path, LogLevel min_level, bool audit_events) {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    instance_.reset(new Logger());
    instance_->min_level_ = min_level;
    instance_->audit_events_ = audit_events;
    if (!path.empty()) {
        instance_->log_file_.open(path, std::ios::out | std::ios::app);
    }
}

void Logger::InitializeWithSink(Sink sink, LogLevel min_level, bool audit_events) {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    instance_.reset(new Logger());
    instance_->min_level_ = min_level;
    instance_->audit_events_ = audit_events;
    instance_->sink_ = std::move(sink);
}

void Logger::Shutdown() {
    std::unique_ptr<Logger> inst;
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        inst = std::move(instance_);
    }
    if (inst && inst->log_file_.is_open()) inst->log_file_.close();
}

bool Logger::IsInitialized() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    return instance_ != nullptr;
}

Logger::~Logger() {
    if (log_file_.is_open()) log_file_.close();
}

const char* Logger::LevelToString(LogLevel l) {
    switch (l) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
    }
    return "UNK";
}

std::string Logger::FormatLine(LogLevel level, const std::string& message,
                               const char* file, int line) {
    std::ostringstream oss;
    oss << NowToString(std::chrono::system_clock::now()) << " [" << LevelToString(level) << "] "
        << Basename(file) << ":" << line << " - " << message;
    return oss.str();
}

void Logger::Write(LogLevel level, const std::string& line) {
    if (sink_) {
        sink_(level, line);
    } else if (log_file_.is_open()) {
        log_file_ << line << '\n';
        log_file_.flush();
    } else {
        std::cerr << line << '\n';
    }
}

void Logger::Log(LogLevel level, const std::string& message, const char* file, int line) {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) return;
    if (level < instance_->min_level_) return;
    instance_->Write(level, FormatLine(level, message, file, line));
}

void Logger::Debug(const std::string& m, const char* f, int l) { Log(LogLevel::DEBUG, m, f, l); }
void Logger::Info(const std::string& m, const char* f, int l) { Log(LogLevel::INFO, m, f, l); }
void Logger::Warning(const std::string& m, const char* f, int l) { Log(LogLevel::WARNING, m, f, l); }
void Logger::Error(const std::string& m, const char* f, int l) { Log(LogLevel::ERROR, m, f, l); }
void Logger::Critical(const std::string& m, const char* f, int l) { Log(LogLevel::CRITICAL, m, f, l); }

void Logger::Event(const nlohmann::json& event) {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_ || !instance_->audit_events_) return;
    instance_->Write(LogLevel::INFO, event.dump());
}

} // namespace synx
