#include <algorithm>
#include <glide/animation_driver.hpp>
#include <glide/logger.hpp>

namespace glide
{

// ─── Registration ───────────────────────────────────────────────────────────

AnimationDriver::AnimId AnimationDriver::attach(std::string name,
                                                TickFn      tick,
                                                SettleFn    settle,
                                                ActiveFn    active)
{
    AnimId id = next_id_++;
    GLIDE_LOG_DEBUG("driver", "Attached '{}' as #{}", name, id);

    Entry entry;
    entry.id     = id;
    entry.name   = std::move(name);
    entry.tick   = std::move(tick);
    entry.settle = std::move(settle);
    entry.active = std::move(active);
    entries_.push_back(std::move(entry));
    return id;
}

bool AnimationDriver::detach(AnimId id)
{
    auto it = std::find_if(entries_.begin(),
                           entries_.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == entries_.end())
    {
        GLIDE_LOG_WARN("driver", "detach: no animation #{}", id);
        return false;
    }
    entries_.erase(it);
    return true;
}

void AnimationDriver::clear()
{
    entries_.clear();
}

// ─── Per-frame ──────────────────────────────────────────────────────────────

bool AnimationDriver::tick(Instant now)
{
    bool any_active = false;
    for (auto& e : entries_)
    {
        if (!e.active())
            continue;
        e.tick(now);
        if (e.active())
            any_active = true;
        else
            GLIDE_LOG_TRACE("driver", "'{}' settled", e.name);
    }
    return any_active;
}

void AnimationDriver::settle_all()
{
    for (auto& e : entries_)
        e.settle();
}

// ─── Queries ────────────────────────────────────────────────────────────────

bool AnimationDriver::has_active_animations() const
{
    return std::any_of(entries_.begin(), entries_.end(), [](const Entry& e) { return e.active(); });
}

size_t AnimationDriver::active_count() const
{
    return static_cast<size_t>(
        std::count_if(entries_.begin(), entries_.end(), [](const Entry& e) { return e.active(); }));
}

std::vector<std::string> AnimationDriver::names() const
{
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_)
        out.push_back(e.name);
    return out;
}

}   // namespace glide
