#pragma once

#include <cstdint>
#include <functional>
#include <glide/time.hpp>
#include <glide/transition.hpp>
#include <string>
#include <vector>

namespace glide
{

// Ticks a set of independently animated properties in a fixed order, once
// per frame, and tells the host whether another frame is needed.
//
// Entries run in attachment order so that a frame is reproducible. Attached
// transitions are referenced, not owned: detach() before destroying one.
class AnimationDriver
{
   public:
    using AnimId = uint32_t;

    using TickFn   = std::function<void(Instant now)>;
    using SettleFn = std::function<void()>;
    using ActiveFn = std::function<bool()>;

    AnimationDriver()  = default;
    ~AnimationDriver() = default;

    AnimationDriver(const AnimationDriver&)            = delete;
    AnimationDriver& operator=(const AnimationDriver&) = delete;

    // ─── Registration ───────────────────────────────────────────────────

    AnimId attach(std::string name, TickFn tick, SettleFn settle, ActiveFn active);

    template <typename T>
    AnimId attach(std::string name, Transition<T>& transition)
    {
        return attach(
            std::move(name),
            [&transition](Instant now) { transition.tick(now); },
            [&transition]() { transition.settle(); },
            [&transition]() { return transition.is_animating(); });
    }

    // Returns false if no entry has this id.
    bool detach(AnimId id);
    void clear();

    // ─── Per-frame ──────────────────────────────────────────────────────

    // Ticks every entry in attachment order. True if any is still animating.
    bool tick(Instant now);

    // Jumps every entry to its end state.
    void settle_all();

    // ─── Queries ────────────────────────────────────────────────────────

    bool   has_active_animations() const;
    size_t active_count() const;
    size_t size() const { return entries_.size(); }

    // Names in tick order.
    std::vector<std::string> names() const;

   private:
    struct Entry
    {
        AnimId      id;
        std::string name;
        TickFn      tick;
        SettleFn    settle;
        ActiveFn    active;
    };

    AnimId             next_id_ = 1;
    std::vector<Entry> entries_;
};

}   // namespace glide
