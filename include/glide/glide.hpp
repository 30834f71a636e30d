#pragma once

#include <glide/animate.hpp>
#include <glide/animation_builder.hpp>
#include <glide/animation_driver.hpp>
#include <glide/bezier.hpp>
#include <glide/color.hpp>
#include <glide/curve.hpp>
#include <glide/easing.hpp>
#include <glide/fwd.hpp>
#include <glide/geometry.hpp>
#include <glide/logger.hpp>
#include <glide/progress.hpp>
#include <glide/settings.hpp>
#include <glide/time.hpp>
#include <glide/transition.hpp>

// ─── Quick start ─────────────────────────────────────────────────────────────
//
//   auto width = glide::Transition<float>(50.0f).with_easing(glide::easings::ease_out.quick());
//   width.update(glide::Event<float>::target(300.0f));
//   while (width.is_animating()) {
//       width.update(glide::Event<float>::tick(glide::Clock::now()));
//       draw(width.value());
//   }
//
// Syntax highlighting lives in <glide/highlight/highlighter.hpp>.
