#pragma once

#include <glide/animate.hpp>
#include <glide/curve.hpp>
#include <glide/easing.hpp>
#include <glide/logger.hpp>
#include <glide/progress.hpp>
#include <glide/time.hpp>
#include <optional>
#include <utility>

namespace glide
{

// Input delivered by the host event loop to Transition::update().
template <typename T>
struct Event
{
    enum class Kind
    {
        Tick,     // time passed; `now` is the frame timestamp
        Target,   // a new endpoint was requested; `now` is when it arrived
        Settle,   // jump to the logical end state
    };

    Kind             kind = Kind::Settle;
    Instant          now{};
    std::optional<T> value;

    static Event tick(Instant now) { return Event{Kind::Tick, now, std::nullopt}; }
    static Event target(T value, Instant now = Clock::now())
    {
        return Event{Kind::Target, now, std::move(value)};
    }
    static Event settle() { return Event{Kind::Settle, Instant{}, std::nullopt}; }
};

// Moves a value of type T from an initial point to a target point over
// wall-clock time.
//
// States: at rest (progress complete) or animating, each either forward or
// reversed. A new transition starts at rest on its starting value. Feeding
// the starting value back in while animating reverses the transition along
// the same curve instead of restarting it, unless reversal is disabled.
//
// Not thread-safe. Every mutation is bounded: one curve evaluation and one
// componentwise pass over T.
template <typename T>
class Transition
{
    static_assert(is_animatable_v<T>, "Transition<T> requires an Animate<T> specialization");

   public:
    explicit Transition(T value, Instant now = Clock::now())
        : initial_(value), value_(value), target_(std::move(value)), last_update_(now)
    {
    }

    // ─── Configuration ──────────────────────────────────────────────────

    Transition& with_curve(Curve curve) &
    {
        curve_ = curve;
        return *this;
    }
    Transition&& with_curve(Curve curve) &&
    {
        curve_ = curve;
        return std::move(*this);
    }

    Transition& with_duration(Duration duration) &
    {
        duration_ = duration;
        return *this;
    }
    Transition&& with_duration(Duration duration) &&
    {
        duration_ = duration;
        return std::move(*this);
    }

    // Copies curve, duration and the reversible flag.
    Transition& with_easing(const Easing& easing) &
    {
        set_easing(easing);
        return *this;
    }
    Transition&& with_easing(const Easing& easing) &&
    {
        set_easing(easing);
        return std::move(*this);
    }

    void set_curve(Curve curve) { curve_ = curve; }
    void set_duration(Duration duration) { duration_ = duration; }
    void set_reversible(bool reversible) { reversible_ = reversible; }
    void set_easing(const Easing& easing)
    {
        curve_      = easing.curve;
        duration_   = easing.duration;
        reversible_ = easing.reversible;
    }

    // ─── Accessors ──────────────────────────────────────────────────────

    const T& value() const { return value_; }
    const T& initial() const { return initial_; }

    // The value the transition is heading to: the target when moving
    // forward, the initial value when reversed.
    const T& target() const { return progress_.is_forward() ? target_ : initial_; }

    const Curve&    curve() const { return curve_; }
    Duration        duration() const { return duration_; }
    const Progress& progress() const { return progress_; }
    Instant         last_update() const { return last_update_; }
    bool            is_reversible() const { return reversible_; }

    bool is_animating() const { return !progress_.is_complete(); }

    // ─── State changes ──────────────────────────────────────────────────

    void update(Event<T> event)
    {
        switch (event.kind)
        {
            case Event<T>::Kind::Tick:
                tick(event.now);
                break;
            case Event<T>::Kind::Target:
                if (event.value)
                    interrupt(std::move(*event.value), event.now);
                break;
            case Event<T>::Kind::Settle:
                settle();
                break;
        }
    }

    // Advances by the time elapsed since the last update. No-op at rest.
    void tick(Instant now)
    {
        if (!is_animating())
            return;

        if (duration_ <= Duration::zero())
        {
            last_update_ = now;
            settle();
            return;
        }

        Duration elapsed = now > last_update_ ? now - last_update_ : Duration::zero();
        last_update_     = now;

        progress_.update(to_seconds(elapsed) / to_seconds(duration_));
        if (progress_.is_complete())
        {
            value_ = target();
        }
        else
        {
            glide::lerp(value_, initial_, target_, curve_.value(progress_.value()));
        }
    }

    void interrupt(T new_target, Instant now = Clock::now())
    {
        const T& other_end = progress_.is_forward() ? initial_ : target_;
        if (reversible_ && is_animating() && new_target == other_end)
        {
            GLIDE_LOG_TRACE("anim", "Transition reversed at progress {}", progress_.value());
            reverse();
        }
        else if (!(new_target == target()))
        {
            progress_ = Progress::forward(0.0f);
            initial_  = value_;
            target_   = std::move(new_target);
        }

        // The next tick measures from the retarget, so idle time is not
        // counted.
        last_update_ = now;

        if (duration_ <= Duration::zero() && is_animating())
        {
            GLIDE_LOG_DEBUG("anim", "Zero-length transition settled immediately");
            settle();
        }
    }

    // Flips the direction. The endpoints stay where they are.
    void reverse() { progress_.reverse(); }

    // Jumps to the logical end state.
    void settle()
    {
        progress_.settle();
        value_ = progress_.is_forward() ? target_ : initial_;
    }

   private:
    T        initial_;
    T        value_;
    T        target_;
    Curve    curve_    = Curve::linear();
    Duration duration_ = DEFAULT_DURATION;
    Progress progress_;
    Instant  last_update_;
    bool     reversible_ = true;
};

}   // namespace glide
