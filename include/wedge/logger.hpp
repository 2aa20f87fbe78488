#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace wedge
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Process-wide logger. Messages below the minimum level are dropped before
// formatting; everything else is fanned out to the registered sinks.
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

    void   add_sink(LogSink sink);
    void   clear_sinks();
    size_t sink_count() const;

    void log(LogLevel level, std::string_view category, std::string_view message);

    // "{}" placeholders are substituted left to right; surplus arguments are ignored.
    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args)
    {
        std::string result(format);
        size_t      cursor = 0;
        auto        substitute = [&](auto&& arg)
        {
            auto pos = result.find("{}", cursor);
            if (pos == std::string::npos)
                return;
            std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (substitute(std::forward<Args>(args)), ...);
        return result;
    }

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
            return v ? std::string(v) : std::string("(null)");
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else
            return std::to_string(v);
    }

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
        return;

    try
    {
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
    }
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

}   // namespace wedge

#define WEDGE_LOG_AT(lvl, category, ...)                                        \
    do                                                                          \
    {                                                                           \
        if (::wedge::Logger::instance().is_enabled(lvl))                        \
            ::wedge::Logger::instance().log_formatted(lvl, category, __VA_ARGS__); \
    } while (0)

#define WEDGE_LOG_TRACE(category, ...) WEDGE_LOG_AT(::wedge::LogLevel::Trace, category, __VA_ARGS__)
#define WEDGE_LOG_DEBUG(category, ...) WEDGE_LOG_AT(::wedge::LogLevel::Debug, category, __VA_ARGS__)
#define WEDGE_LOG_INFO(category, ...) WEDGE_LOG_AT(::wedge::LogLevel::Info, category, __VA_ARGS__)
#define WEDGE_LOG_WARN(category, ...) WEDGE_LOG_AT(::wedge::LogLevel::Warning, category, __VA_ARGS__)
#define WEDGE_LOG_ERROR(category, ...) WEDGE_LOG_AT(::wedge::LogLevel::Error, category, __VA_ARGS__)
#define WEDGE_LOG_CRITICAL(category, ...) \
    WEDGE_LOG_AT(::wedge::LogLevel::Critical, category, __VA_ARGS__)
