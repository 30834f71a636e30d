#pragma once

#include <functional>
#include <glide/easing.hpp>
#include <glide/logger.hpp>
#include <string>

namespace glide
{

// User-facing animation preferences, persisted as JSON.
//
// {
//   "version": 1,
//   "animations_enabled": true,
//   "duration_scale": 1.0,
//   "log_level": "INFO",
//   "default_easing": { "curve": "ease", "duration_ms": 500, "reversible": false }
// }
//
// Missing or malformed fields keep their current values.
class AnimationSettings
{
   public:
    static constexpr int   FORMAT_VERSION     = 1;
    static constexpr float MAX_DURATION_SCALE = 10.0f;

    AnimationSettings() = default;

    // Process-wide instance consulted by AnimationBuilder.
    static AnimationSettings& global();

    // Master toggle. When off, new targets are applied instantly.
    bool animations_enabled() const { return animations_enabled_; }
    void set_animations_enabled(bool enabled);

    // Multiplies every duration. Clamped to [0, MAX_DURATION_SCALE].
    float duration_scale() const { return duration_scale_; }
    void  set_duration_scale(float scale);

    const Easing& default_easing() const { return default_easing_; }
    void          set_default_easing(const Easing& easing);

    LogLevel log_level() const { return log_level_; }
    void     set_log_level(LogLevel level);

    // Pushes log_level() to the global Logger.
    void apply_log_level() const;

    // Returns easing with its duration scaled, or zeroed when animations
    // are disabled.
    Easing apply_to(const Easing& easing) const;

    // Restore defaults.
    void reset();

    std::string serialize() const;
    bool        deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // $HOME/.config/glide/animation.json
    static std::string default_path();

    using ChangeCallback = std::function<void()>;
    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

   private:
    bool     animations_enabled_ = true;
    float    duration_scale_     = 1.0f;
    Easing   default_easing_     = easings::ease;
    LogLevel log_level_          = LogLevel::Info;

    ChangeCallback on_change_;

    void notify_change();
};

}   // namespace glide
