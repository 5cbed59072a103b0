#include "containers/transition_builder.hpp"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "containers/container_content.hpp"
#include "utils/log.hpp"
#include "view/view_controller.hpp"

namespace cradle {

namespace {

class StateTracker {
public:
    ViewAnimationStep change(const std::shared_ptr<View>& view, const ViewState& to) {
        ViewState& current = state_of(view);
        ViewAnimationStep step{view, current, to};
        current = to;
        return step;
    }

    ViewState& state_of(const std::shared_ptr<View>& view) {
        auto it = states_.find(view.get());
        if (it == states_.end()) {
            it = states_.emplace(view.get(), ViewState::of(*view)).first;
        }
        return it->second;
    }

private:
    std::unordered_map<const View*, ViewState> states_;
};

ViewState translated(ViewState state, int dx, int dy) {
    state.frame.x += dx;
    state.frame.y += dy;
    return state;
}

ViewState with_opacity(ViewState state, float opacity) {
    state.opacity = opacity;
    return state;
}

ViewState collapsed_to_center(ViewState state) {
    state.frame = SDL_Rect{state.frame.x + state.frame.w / 2, state.frame.y + state.frame.h / 2, 0, 0};
    return state;
}

// Offset placing a view just outside `common_frame` on the side it enters from.
SDL_Point entry_offset(TransitionStyle style, const SDL_Rect& common_frame) {
    switch (style) {
    case TransitionStyle::CoverFromBottom:
    case TransitionStyle::PushFromBottom:
        return SDL_Point{0, common_frame.h};
    case TransitionStyle::CoverFromTop:
    case TransitionStyle::PushFromTop:
        return SDL_Point{0, -common_frame.h};
    case TransitionStyle::CoverFromLeft:
    case TransitionStyle::PushFromLeft:
        return SDL_Point{-common_frame.w, 0};
    case TransitionStyle::CoverFromRight:
    case TransitionStyle::PushFromRight:
        return SDL_Point{common_frame.w, 0};
    default:
        return SDL_Point{0, 0};
    }
}

AnimationStep make_step(double duration, std::string tag) {
    AnimationStep step;
    step.duration = duration;
    step.tag = std::move(tag);
    return step;
}

}

std::shared_ptr<Animation> TransitionAnimationBuilder::build(const ContainerContent& appearing,
                                                             const std::vector<const ContainerContent*>& disappearing,
                                                             const SDL_Rect& common_frame) const {
    const std::shared_ptr<View> appearing_view = appearing.view();
    if (!appearing_view) {
        throw std::logic_error("TransitionAnimationBuilder needs an attached view to animate");
    }

    std::vector<std::shared_ptr<View>> peers;
    peers.reserve(disappearing.size());
    for (const ContainerContent* content : disappearing) {
        if (!content || content == &appearing) {
            continue;
        }
        std::shared_ptr<View> peer_view = content->view();
        if (!peer_view) {
            const ViewController* vc = content->view_controller();
            log::debug("[TransitionAnimationBuilder] Skipping '" + (vc ? vc->title() : std::string("<empty>")) +
                       "': its view is not attached");
            continue;
        }
        peers.push_back(std::move(peer_view));
    }

    const TransitionStyle style = appearing.transition_style();
    const double duration = appearing.resolved_duration();
    StateTracker tracker;
    std::vector<AnimationStep> steps;

    auto conceal_peers = [&](AnimationStep& step) {
        for (const auto& peer : peers) {
            step.view_steps.push_back(tracker.change(peer, with_opacity(tracker.state_of(peer), 0.0f)));
        }
    };

    const ViewState appearing_final = tracker.state_of(appearing_view);

    switch (style) {
    case TransitionStyle::None: {
        AnimationStep step = make_step(0.0, "conceal");
        conceal_peers(step);
        steps.push_back(std::move(step));
        break;
    }
    case TransitionStyle::CoverFromBottom:
    case TransitionStyle::CoverFromTop:
    case TransitionStyle::CoverFromLeft:
    case TransitionStyle::CoverFromRight: {
        const SDL_Point offset = entry_offset(style, common_frame);
        AnimationStep setup = make_step(0.0, "setup");
        setup.view_steps.push_back(tracker.change(appearing_view, translated(appearing_final, offset.x, offset.y)));
        AnimationStep slide = make_step(duration, "transition");
        slide.view_steps.push_back(tracker.change(appearing_view, appearing_final));
        AnimationStep conceal = make_step(0.0, "conceal");
        conceal_peers(conceal);
        steps.push_back(std::move(setup));
        steps.push_back(std::move(slide));
        steps.push_back(std::move(conceal));
        break;
    }
    case TransitionStyle::CrossDissolve: {
        AnimationStep setup = make_step(0.0, "setup");
        setup.view_steps.push_back(tracker.change(appearing_view, with_opacity(appearing_final, 0.0f)));
        AnimationStep fade = make_step(duration, "transition");
        fade.view_steps.push_back(tracker.change(appearing_view, appearing_final));
        conceal_peers(fade);
        steps.push_back(std::move(setup));
        steps.push_back(std::move(fade));
        break;
    }
    case TransitionStyle::PushFromBottom:
    case TransitionStyle::PushFromTop:
    case TransitionStyle::PushFromLeft:
    case TransitionStyle::PushFromRight: {
        const SDL_Point offset = entry_offset(style, common_frame);
        AnimationStep setup = make_step(0.0, "setup");
        setup.view_steps.push_back(tracker.change(appearing_view, translated(appearing_final, offset.x, offset.y)));
        AnimationStep push = make_step(duration, "transition");
        push.view_steps.push_back(tracker.change(appearing_view, appearing_final));
        for (const auto& peer : peers) {
            push.view_steps.push_back(tracker.change(peer, translated(tracker.state_of(peer), -offset.x, -offset.y)));
        }
        steps.push_back(std::move(setup));
        steps.push_back(std::move(push));
        break;
    }
    case TransitionStyle::EmergeFromCenter: {
        AnimationStep setup = make_step(0.0, "setup");
        setup.view_steps.push_back(tracker.change(appearing_view, collapsed_to_center(appearing_final)));
        AnimationStep grow = make_step(duration, "transition");
        grow.view_steps.push_back(tracker.change(appearing_view, appearing_final));
        AnimationStep conceal = make_step(0.0, "conceal");
        conceal_peers(conceal);
        steps.push_back(std::move(setup));
        steps.push_back(std::move(grow));
        steps.push_back(std::move(conceal));
        break;
    }
    }

    auto animation = std::make_shared<Animation>(std::move(steps));
    animation->set_tag(transition_style_name(style));
    return animation;
}

}
