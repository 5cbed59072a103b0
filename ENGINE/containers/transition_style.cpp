#include "containers/transition_style.hpp"

#include <cmath>
#include <string>

#include "utils/log.hpp"
#include "utils/settings.hpp"

namespace cradle {

namespace {
constexpr double kStandardDuration = 0.4;
}

const std::array<TransitionStyle, 11>& all_transition_styles() {
    static const std::array<TransitionStyle, 11> styles{
        TransitionStyle::None,
        TransitionStyle::CoverFromBottom,
        TransitionStyle::CoverFromTop,
        TransitionStyle::CoverFromLeft,
        TransitionStyle::CoverFromRight,
        TransitionStyle::CrossDissolve,
        TransitionStyle::PushFromBottom,
        TransitionStyle::PushFromTop,
        TransitionStyle::PushFromLeft,
        TransitionStyle::PushFromRight,
        TransitionStyle::EmergeFromCenter,
    };
    return styles;
}

const char* transition_style_name(TransitionStyle style) {
    switch (style) {
    case TransitionStyle::None:             return "none";
    case TransitionStyle::CoverFromBottom:  return "cover_from_bottom";
    case TransitionStyle::CoverFromTop:     return "cover_from_top";
    case TransitionStyle::CoverFromLeft:    return "cover_from_left";
    case TransitionStyle::CoverFromRight:   return "cover_from_right";
    case TransitionStyle::CrossDissolve:    return "cross_dissolve";
    case TransitionStyle::PushFromBottom:   return "push_from_bottom";
    case TransitionStyle::PushFromTop:      return "push_from_top";
    case TransitionStyle::PushFromLeft:     return "push_from_left";
    case TransitionStyle::PushFromRight:    return "push_from_right";
    case TransitionStyle::EmergeFromCenter: return "emerge_from_center";
    }
    return "none";
}

std::optional<TransitionStyle> transition_style_from_name(std::string_view name) {
    for (TransitionStyle style : all_transition_styles()) {
        if (name == transition_style_name(style)) {
            return style;
        }
    }
    return std::nullopt;
}

double builtin_default_duration(TransitionStyle style) {
    return style == TransitionStyle::None ? 0.0 : kStandardDuration;
}

double default_duration(TransitionStyle style) {
    const double fallback = builtin_default_duration(style);
    const std::string key = std::string("transitions.") + transition_style_name(style) + ".duration";
    const double configured = settings::load_number(key, fallback);
    if (!std::isfinite(configured) || configured < 0.0) {
        log::warn("[TransitionStyle] Ignoring invalid setting " + key + "=" + std::to_string(configured));
        return fallback;
    }
    return configured;
}

double resolve_duration(TransitionStyle style, double duration) {
    if (duration == kDefaultTransitionDuration) {
        return default_duration(style);
    }
    if (!std::isfinite(duration) || duration < 0.0) {
        log::warn("[TransitionStyle] Invalid duration " + std::to_string(duration) + " for " +
                  transition_style_name(style) + "; using the default");
        return default_duration(style);
    }
    return duration;
}

}
