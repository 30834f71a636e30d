#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <glide/settings.hpp>
#include <optional>
#include <sstream>
#include <system_error>

namespace glide
{

AnimationSettings& AnimationSettings::global()
{
    static AnimationSettings settings;
    return settings;
}

// ─── Accessors ──────────────────────────────────────────────────────────────

void AnimationSettings::set_animations_enabled(bool enabled)
{
    animations_enabled_ = enabled;
    notify_change();
}

void AnimationSettings::set_duration_scale(float scale)
{
    if (std::isnan(scale))
    {
        GLIDE_LOG_WARN("settings", "Ignoring NaN duration scale");
        return;
    }
    duration_scale_ = std::clamp(scale, 0.0f, MAX_DURATION_SCALE);
    notify_change();
}

void AnimationSettings::set_default_easing(const Easing& easing)
{
    default_easing_ = easing;
    notify_change();
}

void AnimationSettings::set_log_level(LogLevel level)
{
    log_level_ = level;
    notify_change();
}

void AnimationSettings::apply_log_level() const
{
    Logger::instance().set_level(log_level_);
}

Easing AnimationSettings::apply_to(const Easing& easing) const
{
    if (!animations_enabled_)
        return easing.with_duration(Duration::zero());

    auto scaled = std::chrono::duration_cast<Duration>(
        std::chrono::duration<double>(easing.duration) * static_cast<double>(duration_scale_));
    return easing.with_duration(scaled);
}

void AnimationSettings::reset()
{
    animations_enabled_ = true;
    duration_scale_     = 1.0f;
    default_easing_     = easings::ease;
    log_level_          = LogLevel::Info;
    notify_change();
}

// ─── JSON serialization ──────────────────────────────────────────────────────

namespace
{

std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

// Position just past the ':' following "key", or npos.
size_t find_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    return pos + 1;
}

std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find_first_not_of(" \t\r\n", pos);
    if (pos == std::string::npos || json[pos] != '"')
        return std::nullopt;

    std::string out;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (c == '"')
            return out;
        if (c == '\\' && i + 1 < json.size())
        {
            char e = json[++i];
            out += e == 'n' ? '\n' : e == 't' ? '\t' : e;
            continue;
        }
        out += c;
    }
    return std::nullopt;
}

std::optional<bool> read_json_bool(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find_first_not_of(" \t\r\n", pos);
    if (pos == std::string::npos)
        return std::nullopt;
    if (json.compare(pos, 4, "true") == 0)
        return true;
    if (json.compare(pos, 5, "false") == 0)
        return false;
    return std::nullopt;
}

std::optional<double> read_json_number(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    double      v     = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(v))
        return std::nullopt;
    return v;
}

}   // anonymous namespace

std::string AnimationSettings::serialize() const
{
    auto duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(default_easing_.duration).count();

    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << FORMAT_VERSION << ",\n";
    os << "  \"animations_enabled\": " << (animations_enabled_ ? "true" : "false") << ",\n";
    os << "  \"duration_scale\": " << duration_scale_ << ",\n";
    os << "  \"log_level\": \"" << Logger::level_to_string(log_level_) << "\",\n";
    os << "  \"default_easing\": {\n";
    os << "    \"curve\": \"" << escape_json(default_easing_.curve.name()) << "\",\n";
    os << "    \"duration_ms\": " << duration_ms << ",\n";
    os << "    \"reversible\": " << (default_easing_.reversible ? "true" : "false") << "\n";
    os << "  }\n";
    os << "}\n";
    return os.str();
}

bool AnimationSettings::deserialize(const std::string& json)
{
    if (json.find('{') == std::string::npos)
    {
        GLIDE_LOG_WARN("settings", "Animation settings are not a JSON object");
        return false;
    }

    if (auto version = read_json_number(json, "version"))
    {
        if (*version > FORMAT_VERSION)
        {
            GLIDE_LOG_WARN("settings",
                           "Animation settings version {} is newer than supported {}",
                           static_cast<int>(*version),
                           FORMAT_VERSION);
            return false;
        }
    }

    if (auto enabled = read_json_bool(json, "animations_enabled"))
        animations_enabled_ = *enabled;

    if (auto scale = read_json_number(json, "duration_scale"))
        duration_scale_ = std::clamp(static_cast<float>(*scale), 0.0f, MAX_DURATION_SCALE);

    if (auto level_name = read_json_string(json, "log_level"))
    {
        if (auto level = Logger::level_from_string(*level_name))
            log_level_ = *level;
        else
            GLIDE_LOG_WARN("settings", "Unknown log level '{}'", *level_name);
    }

    Easing easing = default_easing_;
    if (auto curve_name = read_json_string(json, "curve"))
    {
        if (auto curve = Curve::from_name(*curve_name))
            easing.curve = *curve;
        else
            GLIDE_LOG_WARN("settings", "Unknown curve '{}', keeping {}", *curve_name, easing.curve.name());
    }
    if (auto ms = read_json_number(json, "duration_ms"))
    {
        if (*ms >= 0.0)
            easing.duration = std::chrono::duration_cast<Duration>(
                std::chrono::duration<double, std::milli>(*ms));
        else
            GLIDE_LOG_WARN("settings", "Negative easing duration {} ms ignored", *ms);
    }
    if (auto reversible = read_json_bool(json, "reversible"))
        easing.reversible = *reversible;
    default_easing_ = easing;

    notify_change();
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool AnimationSettings::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            GLIDE_LOG_WARN("settings", "Cannot create '{}': {}", dir.string(), ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        GLIDE_LOG_WARN("settings", "Cannot open '{}' for writing", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool AnimationSettings::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        GLIDE_LOG_DEBUG("settings", "No animation settings at '{}'", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(json))
    {
        GLIDE_LOG_WARN("settings", "Rejected animation settings from '{}'", path);
        return false;
    }
    GLIDE_LOG_INFO("settings", "Loaded animation settings from '{}'", path);
    return true;
}

std::string AnimationSettings::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "animation.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "glide";
    return (dir / "animation.json").string();
}

void AnimationSettings::notify_change()
{
    if (on_change_)
        on_change_();
}

}   // namespace glide
