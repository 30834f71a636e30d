#pragma once

namespace glide
{

// How far a transition has advanced, and in which direction.
//
// The fraction is always stored in the forward sense: 0 is the initial
// value and 1 is the target. A forward transition counts up to 1, a
// reversed one counts down to 0, so flipping the direction keeps the
// visual position where it is.
class Progress
{
   public:
    enum class Direction
    {
        Forward,
        Reverse,
    };

    // At rest, pointing forward.
    constexpr Progress() = default;

    static constexpr Progress forward(float p) { return Progress(Direction::Forward, clamp01(p)); }
    static constexpr Progress reverse(float p) { return Progress(Direction::Reverse, clamp01(p)); }

    // Advances by delta in the current direction. +/-inf settles, NaN is ignored.
    void update(float delta);

    // Flips the direction in place.
    void reverse();

    // Jumps to the terminal fraction of the current direction.
    void settle();

    bool is_complete() const;

    float     value() const { return value_; }
    Direction direction() const { return direction_; }
    bool      is_forward() const { return direction_ == Direction::Forward; }
    bool      is_reverse() const { return direction_ == Direction::Reverse; }

    constexpr bool operator==(const Progress& o) const
    {
        return direction_ == o.direction_ && value_ == o.value_;
    }
    constexpr bool operator!=(const Progress& o) const { return !(*this == o); }

   private:
    constexpr Progress(Direction direction, float value) : direction_(direction), value_(value) {}

    static constexpr float clamp01(float v)
    {
        if (!(v > 0.0f))
            return 0.0f;
        return v < 1.0f ? v : 1.0f;
    }

    Direction direction_ = Direction::Forward;
    float     value_     = 1.0f;
};

}   // namespace glide
