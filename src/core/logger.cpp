#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <fstream>
#include <glide/logger.hpp>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace glide
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

// ─── Configuration ──────────────────────────────────────────────────────────

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

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
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

size_t Logger::sink_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

// ─── Emission ───────────────────────────────────────────────────────────────

void Logger::log(LogLevel         level,
                 std::string_view category,
                 std::string_view message,
                 std::string_view file,
                 int              line,
                 std::string_view function)
{
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level     = level;
    entry.category  = std::string(category);
    entry.message   = std::string(message);
    entry.file      = std::string(file);
    entry.line      = line;
    entry.function  = std::string(function);

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_)
        return;
    for (const auto& sink : sinks_)
        sink(entry);
}

std::string Logger::substitute(std::string_view format, std::initializer_list<std::string> args)
{
    std::string out;
    out.reserve(format.size());

    auto   next = args.begin();
    size_t pos  = 0;
    while (pos < format.size())
    {
        size_t hole = format.find("{}", pos);
        if (hole == std::string_view::npos || next == args.end())
        {
            out.append(format.substr(pos));
            break;
        }
        out.append(format.substr(pos, hole - pos));
        out.append(*next++);
        pos = hole + 2;
    }
    return out;
}

// ─── Level names ────────────────────────────────────────────────────────────

namespace
{

struct LevelName
{
    LogLevel    level;
    const char* name;
};

constexpr std::array<LevelName, 6> LEVEL_NAMES = {{
    {LogLevel::Trace, "TRACE"},
    {LogLevel::Debug, "DEBUG"},
    {LogLevel::Info, "INFO"},
    {LogLevel::Warning, "WARN"},
    {LogLevel::Error, "ERROR"},
    {LogLevel::Critical, "CRITICAL"},
}};

}   // anonymous namespace

std::string Logger::level_to_string(LogLevel level)
{
    for (const auto& n : LEVEL_NAMES)
    {
        if (n.level == level)
            return n.name;
    }
    return "UNKNOWN";
}

std::optional<LogLevel> Logger::level_from_string(std::string_view name)
{
    std::string upper(name);
    std::transform(upper.begin(),
                   upper.end(),
                   upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING")
        return LogLevel::Warning;

    for (const auto& n : LEVEL_NAMES)
    {
        if (upper == n.name)
            return n.level;
    }
    return std::nullopt;
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream os;
    os << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << ms.count();
    return os.str();
}

// ─── Sinks ──────────────────────────────────────────────────────────────────

namespace
{

// HH:MM:SS.mmm LEVEL [category] message (file:line in function)
void write_entry(std::ostream& os, const Logger::LogEntry& entry)
{
    os << Logger::timestamp_to_string(entry.timestamp) << ' '
       << std::left << std::setw(5) << Logger::level_to_string(entry.level) << std::right
       << " [" << entry.category << "] " << entry.message;

    if (!entry.file.empty())
    {
        os << " (" << entry.file << ':' << entry.line;
        if (!entry.function.empty())
            os << " in " << entry.function;
        os << ')';
    }
}

const char* ansi_color(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "\033[90m";
        case LogLevel::Debug:
            return "\033[36m";
        case LogLevel::Info:
            return "\033[32m";
        case LogLevel::Warning:
            return "\033[33m";
        case LogLevel::Error:
            return "\033[31m";
        case LogLevel::Critical:
            return "\033[1;35m";
    }
    return "";
}

}   // anonymous namespace

namespace sinks
{

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        std::ostream& os = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
        os << ansi_color(entry.level);
        write_entry(os, entry);
        os << "\033[0m\n";
        os.flush();
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    if (!file->is_open())
        std::cerr << "glide: cannot open log file " << filename << '\n';

    return [file](const Logger::LogEntry& entry)
    {
        if (!file->is_open())
            return;
        write_entry(*file, entry);
        *file << '\n';
        file->flush();
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

}   // namespace sinks

}   // namespace glide
