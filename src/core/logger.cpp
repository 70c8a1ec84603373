#include <algorithm>
#include <cctype>
#include <ctime>
#include <fivenav/logger.hpp>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace fivenav
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_category_level(std::string_view category, LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_[std::string(category)] = level;
}

void Logger::clear_category_levels()
{
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_.clear();
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_unlocked(level, category))
    {
        return;
    }

    LogEntry entry{.timestamp = std::chrono::system_clock::now(),
                   .level     = level,
                   .category  = std::string(category),
                   .message   = std::string(message)};

    for (const auto& sink : sinks_)
    {
        sink(entry);
    }
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::Off && level >= min_level_;
}

bool Logger::is_enabled(LogLevel level, std::string_view category) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_unlocked(level, category);
}

bool Logger::enabled_unlocked(LogLevel level, std::string_view category) const
{
    if (level == LogLevel::Off || sinks_.empty())
        return false;

    if (!category_levels_.empty())
    {
        auto it = category_levels_.find(std::string(category));
        if (it != category_levels_.end())
            return level >= it->second;
    }
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
        case LogLevel::Off:
            return "OFF";
        default:
            return "UNKNOWN";
    }
}

std::optional<LogLevel> Logger::level_from_string(std::string_view name)
{
    std::string upper(name);
    std::transform(upper.begin(),
                   upper.end(),
                   upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE")
        return LogLevel::Trace;
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "INFO")
        return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    if (upper == "CRITICAL")
        return LogLevel::Critical;
    if (upper == "OFF")
        return LogLevel::Off;
    return std::nullopt;
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

namespace sinks
{

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        const char* color_code = "";
        const char* reset_code = "\033[0m";

        switch (entry.level)
        {
            case LogLevel::Trace:
                color_code = "\033[37m";
                break;
            case LogLevel::Debug:
                color_code = "\033[36m";
                break;
            case LogLevel::Info:
                color_code = "\033[32m";
                break;
            case LogLevel::Warning:
                color_code = "\033[33m";
                break;
            case LogLevel::Error:
                color_code = "\033[31m";
                break;
            case LogLevel::Critical:
                color_code = "\033[35m";
                break;
            case LogLevel::Off:
                break;
        }

        std::cerr << color_code << Logger::timestamp_to_string(entry.timestamp) << " "
                  << Logger::level_to_string(entry.level) << " "
                  << "[" << entry.category << "] " << entry.message << reset_code << std::endl;
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    return [file](const Logger::LogEntry& entry)
    {
        if (file->is_open())
        {
            *file << Logger::timestamp_to_string(entry.timestamp) << " "
                  << Logger::level_to_string(entry.level) << " "
                  << "[" << entry.category << "] " << entry.message << std::endl;
            file->flush();
        }
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

}  // namespace sinks

}  // namespace fivenav
