#include "animation/animation.hpp"

#include <algorithm>
#include <cmath>

namespace cradle {

namespace {

int lerp_int(int a, int b, double t) {
    return a + static_cast<int>(std::lround(static_cast<double>(b - a) * t));
}

}

ViewState ViewState::of(const View& view) {
    return ViewState{view.frame(), view.opacity()};
}

void ViewState::apply_to(View& view) const {
    view.set_frame(frame);
    view.set_opacity(opacity);
}

bool operator==(const ViewState& a, const ViewState& b) {
    return a.frame.x == b.frame.x && a.frame.y == b.frame.y &&
           a.frame.w == b.frame.w && a.frame.h == b.frame.h &&
           a.opacity == b.opacity;
}

bool operator!=(const ViewState& a, const ViewState& b) {
    return !(a == b);
}

ViewAnimationStep ViewAnimationStep::reversed() const {
    return ViewAnimationStep{view, to, from};
}

void ViewAnimationStep::apply(double progress) const {
    const std::shared_ptr<View> target = view.lock();
    if (!target) {
        return;
    }
    if (progress <= 0.0) {
        from.apply_to(*target);
        return;
    }
    if (progress >= 1.0) {
        to.apply_to(*target);
        return;
    }
    SDL_Rect frame{
        lerp_int(from.frame.x, to.frame.x, progress),
        lerp_int(from.frame.y, to.frame.y, progress),
        lerp_int(from.frame.w, to.frame.w, progress),
        lerp_int(from.frame.h, to.frame.h, progress)};
    target->set_frame(frame);
    target->set_opacity(from.opacity + static_cast<float>((to.opacity - from.opacity) * progress));
}

AnimationStep AnimationStep::reversed() const {
    AnimationStep step;
    step.duration = duration;
    step.tag = tag;
    step.view_steps.reserve(view_steps.size());
    for (const auto& vs : view_steps) {
        step.view_steps.push_back(vs.reversed());
    }
    return step;
}

void AnimationStep::apply_start_state() const {
    for (const auto& vs : view_steps) vs.apply(0.0);
}

void AnimationStep::apply_progress(double progress) const {
    for (const auto& vs : view_steps) vs.apply(progress);
}

void AnimationStep::apply_end_state() const {
    for (const auto& vs : view_steps) vs.apply(1.0);
}

Animation::Animation(std::vector<AnimationStep> steps)
: steps_(std::move(steps)) {}

double Animation::total_duration() const {
    double total = 0.0;
    for (const auto& step : steps_) {
        total += std::max(0.0, step.duration);
    }
    return total;
}

void Animation::notify_will_start(bool animated) const {
    if (on_will_start_) on_will_start_(*this, animated);
}

void Animation::notify_step_finished(const AnimationStep& step, bool animated) const {
    if (on_step_finished_) on_step_finished_(*this, step, animated);
}

void Animation::notify_did_stop(bool animated) const {
    if (on_did_stop_) on_did_stop_(*this, animated);
}

void Animation::apply_start_state() const {
    for (auto it = steps_.rbegin(); it != steps_.rend(); ++it) {
        it->apply_start_state();
    }
}

void Animation::apply_end_state() const {
    for (const auto& step : steps_) {
        step.apply_end_state();
    }
}

std::vector<std::shared_ptr<View>> Animation::live_views() const {
    std::vector<std::shared_ptr<View>> views;
    for (const auto& step : steps_) {
        for (const auto& vs : step.view_steps) {
            std::shared_ptr<View> v = vs.view.lock();
            if (v && std::find(views.begin(), views.end(), v) == views.end()) {
                views.push_back(std::move(v));
            }
        }
    }
    return views;
}

std::shared_ptr<Animation> Animation::reverse() const {
    std::vector<AnimationStep> reversed_steps;
    reversed_steps.reserve(steps_.size());
    for (auto it = steps_.rbegin(); it != steps_.rend(); ++it) {
        reversed_steps.push_back(it->reversed());
    }
    auto reversed = std::make_shared<Animation>(std::move(reversed_steps));
    reversed->tag_ = "reverse_" + tag_;
    reversed->lock_ui_ = lock_ui_;
    reversed->on_will_start_ = on_will_start_;
    reversed->on_step_finished_ = on_step_finished_;
    reversed->on_did_stop_ = on_did_stop_;
    return reversed;
}

}
