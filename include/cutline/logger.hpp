#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cutline
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger();
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_floating_point_v<D>)
            return format_double(static_cast<double>(v));
        else
            return std::to_string(v);
    }

    static std::string format_double(double v);

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t cursor       = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", cursor);
                if (pos == std::string::npos)
                    return;
                std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                result.replace(pos, 2, text);
                cursor = pos + text.size();
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args)
{
    if (!is_enabled(level))
        return;

    try
    {
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("format error: ") + e.what());
    }
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();

// Appends every entry to `out`. Used by tests to assert on logged failures.
Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> out);
}   // namespace sinks

#define CUTLINE_LOG_AT(lvl, category, ...)                                                  \
    do                                                                                      \
    {                                                                                       \
        if (::cutline::Logger::instance().is_enabled(lvl))                                  \
        {                                                                                   \
            ::cutline::Logger::instance().log_formatted(lvl, category, __VA_ARGS__);        \
        }                                                                                   \
    } while (0)

#define CUTLINE_LOG_TRACE(category, ...) CUTLINE_LOG_AT(::cutline::LogLevel::Trace, category, __VA_ARGS__)
#define CUTLINE_LOG_DEBUG(category, ...) CUTLINE_LOG_AT(::cutline::LogLevel::Debug, category, __VA_ARGS__)
#define CUTLINE_LOG_INFO(category, ...)  CUTLINE_LOG_AT(::cutline::LogLevel::Info, category, __VA_ARGS__)
#define CUTLINE_LOG_WARN(category, ...)  CUTLINE_LOG_AT(::cutline::LogLevel::Warning, category, __VA_ARGS__)
#define CUTLINE_LOG_ERROR(category, ...) CUTLINE_LOG_AT(::cutline::LogLevel::Error, category, __VA_ARGS__)
#define CUTLINE_LOG_CRITICAL(category, ...) \
    CUTLINE_LOG_AT(::cutline::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace cutline
