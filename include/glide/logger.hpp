#pragma once

#include <chrono>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace glide
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

// Process-wide logger used by every glide module.
//
// Categories in use: "anim", "driver", "settings", "highlight". Entries
// below the minimum level are dropped before the message is formatted.
// Accepted entries reach each sink in registration order. Thread-safe;
// sinks run under the logger's lock and must not log themselves.
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
        int                                   line = 0;
        std::string                           function;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;
    bool     is_enabled(LogLevel level) const;

    void   add_sink(LogSink sink);
    void   clear_sinks();
    size_t sink_count() const;

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

    // Replaces each "{}" in format with the next argument, left to right.
    // Surplus placeholders stay literal; surplus arguments are ignored.
    template <typename... Args>
    void logf(LogLevel level, std::string_view category, std::string_view format, Args&&... args)
    {
        if (!is_enabled(level))
            return;
        try
        {
            log(level, category, substitute(format, {to_text(std::forward<Args>(args))...}));
        }
        catch (const std::exception& e)
        {
            log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
        }
    }

    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string substitute(std::string_view format, std::initializer_list<std::string> args);

    // Floats go through a stream so that 2.5f prints as "2.5".
    template <typename T>
    static std::string to_text(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_convertible_v<D, std::string_view>)
        {
            if constexpr (std::is_pointer_v<D>)
            {
                if (v == nullptr)
                    return "(null)";
            }
            return std::string(std::string_view(v));
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_floating_point_v<D>)
        {
            std::ostringstream os;
            os << v;
            return os.str();
        }
        else if constexpr (std::is_enum_v<D>)
            return std::to_string(static_cast<std::underlying_type_t<D>>(v));
        else
            return std::to_string(v);
    }

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
};

namespace sinks
{
// Colored, one line per entry. Warnings and above go to stderr.
Logger::LogSink console_sink();
// Appends to filename; the file stays open for the sink's lifetime.
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

}   // namespace glide

#define GLIDE_LOG_AT(level, category, ...)                                    \
    do                                                                        \
    {                                                                         \
        if (::glide::Logger::instance().is_enabled(level))                    \
            ::glide::Logger::instance().logf(level, category, __VA_ARGS__);   \
    } while (0)

#define GLIDE_LOG_TRACE(category, ...) GLIDE_LOG_AT(::glide::LogLevel::Trace, category, __VA_ARGS__)
#define GLIDE_LOG_DEBUG(category, ...) GLIDE_LOG_AT(::glide::LogLevel::Debug, category, __VA_ARGS__)
#define GLIDE_LOG_INFO(category, ...) GLIDE_LOG_AT(::glide::LogLevel::Info, category, __VA_ARGS__)
#define GLIDE_LOG_WARN(category, ...) GLIDE_LOG_AT(::glide::LogLevel::Warning, category, __VA_ARGS__)
#define GLIDE_LOG_ERROR(category, ...) GLIDE_LOG_AT(::glide::LogLevel::Error, category, __VA_ARGS__)
#define GLIDE_LOG_CRITICAL(category, ...) \
    GLIDE_LOG_AT(::glide::LogLevel::Critical, category, __VA_ARGS__)

// Same as above, with " [file:line:function]" appended to the message.
#define GLIDE_LOG_DEBUG_HERE(category, fmt, ...) \
    GLIDE_LOG_DEBUG(category, fmt " [{}:{}:{}]" __VA_OPT__(, ) __VA_ARGS__, __FILE__, __LINE__, __func__)
#define GLIDE_LOG_WARN_HERE(category, fmt, ...) \
    GLIDE_LOG_WARN(category, fmt " [{}:{}:{}]" __VA_OPT__(, ) __VA_ARGS__, __FILE__, __LINE__, __func__)
#define GLIDE_LOG_ERROR_HERE(category, fmt, ...) \
    GLIDE_LOG_ERROR(category, fmt " [{}:{}:{}]" __VA_OPT__(, ) __VA_ARGS__, __FILE__, __LINE__, __func__)
