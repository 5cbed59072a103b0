#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace cradle {

enum class TransitionStyle {
    None = 0,
    CoverFromBottom,
    CoverFromTop,
    CoverFromLeft,
    CoverFromRight,
    CrossDissolve,
    PushFromBottom,
    PushFromTop,
    PushFromLeft,
    PushFromRight,
    EmergeFromCenter,
};

// Passing this duration selects the style's default duration.
constexpr double kDefaultTransitionDuration = -1.0;

const std::array<TransitionStyle, 11>& all_transition_styles();

const char* transition_style_name(TransitionStyle style);
std::optional<TransitionStyle> transition_style_from_name(std::string_view name);

double builtin_default_duration(TransitionStyle style);

// Built-in default unless "transitions.<name>.duration" is set to a finite,
// non-negative number in the settings file.
double default_duration(TransitionStyle style);

double resolve_duration(TransitionStyle style, double duration);

}
