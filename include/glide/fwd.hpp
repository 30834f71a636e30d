#pragma once

#include <cstdint>

namespace glide
{

struct Color;
struct Color8;
struct Point;
struct Size;
struct Rect;

namespace ease
{
struct CubicBezier;
}

class Curve;
class Progress;
struct Easing;
class DeltaCursor;

template <typename T, typename Enable>
struct Animate;

template <typename T>
struct Event;
template <typename T>
class Transition;

template <typename T, typename Element>
class AnimationBuilder;
class AnimationDriver;
class AnimationSettings;

class Logger;
enum class LogLevel : int;

namespace highlight
{
enum class FontStyle : uint8_t;
class ScopeSelector;
struct StyleModifier;
struct ThemeItem;
struct ThemeSettings;
struct HighlightTheme;
class ThemeSet;
class Theme;
class Grammar;
class SyntaxSet;
class Highlight;
class Highlighter;
}   // namespace highlight

}   // namespace glide
