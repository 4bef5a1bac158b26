#include <termpanel/logger.hpp>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace termpanel
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard lock(mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    if (!is_enabled(level))
        return;

    LogEntry entry{.timestamp = std::chrono::system_clock::now(),
                   .level     = level,
                   .category  = std::string(category),
                   .message   = std::string(message)};

    // Reader threads log concurrently; sinks run under the lock so lines never interleave.
    std::lock_guard lock(mutex_);
    for (const auto& sink : sinks_)
        sink(entry);
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard lock(mutex_);
    return level >= min_level_;
}

std::string Logger::level_to_string(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Critical:
            return "CRITICAL";
        default:
            return "UNKNOWN";
    }
}

std::optional<LogLevel> Logger::level_from_string(std::string_view name)
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "critical")
        return LogLevel::Critical;
    return std::nullopt;
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm local{};
    ::localtime_r(&time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::format_entry(const LogEntry& entry)
{
    std::string line = timestamp_to_string(entry.timestamp);
    line += ' ';
    line += level_to_string(entry.level);
    line += " [";
    line += entry.category;
    line += "] ";
    line += entry.message;
    return line;
}

namespace sinks
{

namespace
{

const char* level_color(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "\033[37m";
        case LogLevel::Debug:
            return "\033[36m";
        case LogLevel::Info:
            return "\033[32m";
        case LogLevel::Warning:
            return "\033[33m";
        case LogLevel::Error:
            return "\033[31m";
        case LogLevel::Critical:
            return "\033[35m";
    }
    return "";
}

}   // namespace

Logger::LogSink console_sink()
{
    // Colors only for an interactive terminal; journald and log files get plain text.
    const bool colored = ::isatty(STDERR_FILENO) != 0;
    return [colored](const Logger::LogEntry& entry)
    {
        if (colored)
            std::cerr << level_color(entry.level) << Logger::format_entry(entry) << "\033[0m\n";
        else
            std::cerr << Logger::format_entry(entry) << '\n';
        std::cerr.flush();
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    if (!file->is_open())
        std::cerr << "termpanel: cannot open log file " << filename << ", file logging disabled\n";
    return [file](const Logger::LogEntry& entry)
    {
        if (!file->is_open())
            return;
        *file << Logger::format_entry(entry) << '\n';
        file->flush();
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

}   // namespace sinks

}   // namespace termpanel
