#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <cutline/logger.hpp>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace cutline
{

namespace
{

bool parse_level(std::string_view text, LogLevel& out)
{
    std::string lower;
    for (char c : text)
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "trace")
        out = LogLevel::Trace;
    else if (lower == "debug")
        out = LogLevel::Debug;
    else if (lower == "info")
        out = LogLevel::Info;
    else if (lower == "warn" || lower == "warning")
        out = LogLevel::Warning;
    else if (lower == "error")
        out = LogLevel::Error;
    else if (lower == "critical")
        out = LogLevel::Critical;
    else if (lower == "off")
        out = LogLevel::Off;
    else
        return false;
    return true;
}

}   // namespace

Logger::Logger()
{
    // CUTLINE_LOG_LEVEL overrides the default threshold for ad-hoc debugging.
    if (const char* env = std::getenv("CUTLINE_LOG_LEVEL"))
    {
        LogLevel level = LogLevel::Info;
        if (parse_level(env, level))
            min_level_ = level;
    }
}

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
    if (!is_enabled(level))
        return;

    LogEntry entry{.timestamp = std::chrono::system_clock::now(),
                   .level     = level,
                   .category  = std::string(category),
                   .message   = std::string(message)};

    // Copy the sink list so a sink may log (or add sinks) without deadlocking.
    std::vector<LogSink> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks)
    {
        if (sink)
            sink(entry);
    }
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::Off && level >= min_level_;
}

std::string Logger::format_double(double v)
{
    std::ostringstream ss;
    ss << std::setprecision(10) << v;
    return ss.str();
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

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms     = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%H:%M:%S");
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
            default:
                break;
        }

        // Warnings and above go to stderr so they survive stdout redirection.
        std::ostream& os = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
        os << color_code << Logger::timestamp_to_string(entry.timestamp) << " "
           << Logger::level_to_string(entry.level) << " "
           << "[" << entry.category << "] " << entry.message << reset_code << std::endl;
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    return [file](const Logger::LogEntry& entry)
    {
        if (!file->is_open())
            return;

        *file << Logger::timestamp_to_string(entry.timestamp) << " "
              << Logger::level_to_string(entry.level) << " "
              << "[" << entry.category << "] " << entry.message << std::endl;
        file->flush();
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&)
    {
        // Do nothing
    };
}

Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> out)
{
    auto guard = std::make_shared<std::mutex>();
    return [out = std::move(out), guard](const Logger::LogEntry& entry)
    {
        std::lock_guard<std::mutex> lock(*guard);
        out->push_back(entry);
    };
}

}   // namespace sinks

}   // namespace cutline
