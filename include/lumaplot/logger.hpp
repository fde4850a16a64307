#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace lumaplot
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

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
        std::string                           file;
        int                                   line;
        std::string                           function;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

   private:
    Logger()                         = default;
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
        else
            return std::to_string(v);
    }

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t search_from  = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", search_from);
                if (pos != std::string::npos)
                {
                    std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                    result.replace(pos, 2, text);
                    search_from = pos + text.size();
                }
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }

   public:
    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
    {
        return;
    }

    try
    {
        std::string formatted = format_message(format, std::forward<Args>(args)...);
        log(level, category, formatted);
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

// ─── Configuration ───────────────────────────────────────────────────────────

struct LogConfig
{
    LogLevel    level   = LogLevel::Info;
    bool        console = true;
    std::string file_path;   // empty → no file sink
};

// Parses "trace", "debug", "info", "warn"/"warning", "error", "critical".
std::optional<LogLevel> parse_log_level(std::string_view name);

// Reads LUMAPLOT_LOG_LEVEL; returns `fallback` if unset or unrecognized.
LogLevel log_level_from_env(LogLevel fallback = LogLevel::Info);

// Replaces the logger's sinks and level with the ones described by `config`.
void configure_logging(const LogConfig& config);

// Level is checked before the arguments are formatted.
#define LUMAPLOT_LOG(level, category, ...)                                \
    do                                                                    \
    {                                                                     \
        auto& lumaplot_logger_ = ::lumaplot::Logger::instance();          \
        if (lumaplot_logger_.is_enabled(level))                           \
            lumaplot_logger_.log_formatted(level, category, __VA_ARGS__); \
    } while (0)

#define LUMAPLOT_LOG_TRACE(category, ...) \
    LUMAPLOT_LOG(::lumaplot::LogLevel::Trace, category, __VA_ARGS__)
#define LUMAPLOT_LOG_DEBUG(category, ...) \
    LUMAPLOT_LOG(::lumaplot::LogLevel::Debug, category, __VA_ARGS__)
#define LUMAPLOT_LOG_INFO(category, ...) \
    LUMAPLOT_LOG(::lumaplot::LogLevel::Info, category, __VA_ARGS__)
#define LUMAPLOT_LOG_WARN(category, ...) \
    LUMAPLOT_LOG(::lumaplot::LogLevel::Warning, category, __VA_ARGS__)
#define LUMAPLOT_LOG_ERROR(category, ...) \
    LUMAPLOT_LOG(::lumaplot::LogLevel::Error, category, __VA_ARGS__)
#define LUMAPLOT_LOG_CRITICAL(category, ...) \
    LUMAPLOT_LOG(::lumaplot::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace lumaplot
