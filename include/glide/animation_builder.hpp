#pragma once

#include <functional>
#include <glide/easing.hpp>
#include <glide/settings.hpp>
#include <glide/transition.hpp>
#include <utility>

namespace glide
{

// Widget adapter: animates a value on behalf of the host framework and
// builds a visual element from the current value on demand.
//
//   AnimationBuilder<float, Widget> box(50.0f, [](float size) { return make_box(size); });
//   box.set_value(state.size);                 // on application state change
//   if (box.on_frame(now)) request_redraw();   // once per frame
//   Widget w = box.build();
//
// Durations are scaled by AnimationSettings::global(); when animations are
// disabled there, every new value is applied immediately.
template <typename T, typename Element>
class AnimationBuilder
{
   public:
    using BuildFn = std::function<Element(const T&)>;

    AnimationBuilder(T value, BuildFn build, Instant now = Clock::now())
        : AnimationBuilder(std::move(value),
                           std::move(build),
                           AnimationSettings::global().default_easing(),
                           now)
    {
    }

    AnimationBuilder(T value, BuildFn build, Easing easing, Instant now = Clock::now())
        : transition_(std::move(value), now), build_(std::move(build)), easing_(easing)
    {
        transition_.set_easing(effective_easing());
    }

    AnimationBuilder& with_easing(const Easing& easing)
    {
        easing_ = easing;
        transition_.set_easing(effective_easing());
        return *this;
    }

    // Whether intermediate values change the element's layout (size,
    // padding) rather than only its appearance. Hosts use this to decide
    // between a relayout and a repaint per frame.
    AnimationBuilder& animates_layout(bool animates)
    {
        animates_layout_ = animates;
        return *this;
    }
    bool is_layout_animated() const { return animates_layout_; }

    // New application value. Reverses or restarts according to the easing.
    void set_value(T value, Instant now = Clock::now())
    {
        transition_.set_easing(effective_easing());
        transition_.update(Event<T>::target(std::move(value), now));
    }

    // Advances the animation. Returns true while further frames are needed.
    bool on_frame(Instant now)
    {
        transition_.update(Event<T>::tick(now));
        return transition_.is_animating();
    }

    void settle() { transition_.update(Event<T>::settle()); }

    Element build() const { return build_(transition_.value()); }

    const T&             value() const { return transition_.value(); }
    bool                 is_animating() const { return transition_.is_animating(); }
    const Easing&        easing() const { return easing_; }
    const Transition<T>& transition() const { return transition_; }
    Transition<T>&       transition() { return transition_; }

   private:
    Easing effective_easing() const { return AnimationSettings::global().apply_to(easing_); }

    Transition<T> transition_;
    BuildFn       build_;
    Easing        easing_;
    bool          animates_layout_ = false;
};

}   // namespace glide
