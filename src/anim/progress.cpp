#include <cmath>
#include <glide/progress.hpp>

namespace glide
{

void Progress::update(float delta)
{
    if (std::isnan(delta))
        return;

    // Either infinity means the step is unbounded: finish.
    if (std::isinf(delta))
    {
        settle();
        return;
    }

    if (is_forward())
        value_ = clamp01(value_ + delta);
    else
        value_ = clamp01(value_ - delta);
}

void Progress::reverse()
{
    direction_ = is_forward() ? Direction::Reverse : Direction::Forward;
}

void Progress::settle()
{
    value_ = is_forward() ? 1.0f : 0.0f;
}

bool Progress::is_complete() const
{
    return is_forward() ? value_ >= 1.0f : value_ <= 0.0f;
}

}   // namespace glide
