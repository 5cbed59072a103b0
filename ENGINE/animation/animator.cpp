#include "animation/animator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "utils/log.hpp"

namespace cradle {

void Animator::play(std::shared_ptr<Animation> animation, bool animated) {
    if (!animation) {
        log::warn("[Animator] play() called without an animation");
        return;
    }
    if (!animated) {
        animation->notify_will_start(false);
        for (const auto& step : animation->steps()) {
            step.apply_end_state();
            animation->notify_step_finished(step, false);
        }
        animation->notify_did_stop(false);
        return;
    }

    animation->notify_will_start(true);
    Run run;
    run.pinned_views = animation->live_views();
    run.animation = std::move(animation);
    if (advance(run, 0.0)) {
        run.animation->notify_did_stop(true);
        return;
    }
    running_.push_back(std::move(run));
}

bool Animator::advance(Run& run, double dt) {
    const auto& steps = run.animation->steps();
    double remaining = dt;
    while (run.step_index < steps.size()) {
        const AnimationStep& step = steps[run.step_index];
        if (run.elapsed == 0.0 && remaining == 0.0 && step.duration > 0.0) {
            step.apply_start_state();
            return false;
        }
        run.elapsed += remaining;
        remaining = 0.0;
        if (step.duration <= 0.0 || run.elapsed >= step.duration) {
            remaining = std::max(0.0, run.elapsed - std::max(0.0, step.duration));
            run.elapsed = 0.0;
            ++run.step_index;
            step.apply_end_state();
            run.animation->notify_step_finished(step, true);
            continue;
        }
        step.apply_progress(run.elapsed / step.duration);
        return false;
    }
    return true;
}

void Animator::tick(float dt) {
    if (running_.empty()) {
        return;
    }
    if (!std::isfinite(dt) || dt < 0.0f) {
        dt = 0.0f;
    }
    std::vector<Run> active;
    active.swap(running_);
    std::vector<Run> still_running;
    still_running.reserve(active.size());
    for (auto& run : active) {
        if (advance(run, dt)) {
            run.animation->notify_did_stop(true);
        } else {
            still_running.push_back(std::move(run));
        }
    }
    for (auto& started : running_) {
        still_running.push_back(std::move(started));
    }
    running_ = std::move(still_running);
}

void Animator::complete(Run& run) {
    const auto& steps = run.animation->steps();
    while (run.step_index < steps.size()) {
        const AnimationStep& step = steps[run.step_index++];
        step.apply_end_state();
        run.animation->notify_step_finished(step, true);
    }
    run.animation->notify_did_stop(true);
}

void Animator::finish_all() {
    while (!running_.empty()) {
        std::vector<Run> active;
        active.swap(running_);
        for (auto& run : active) {
            complete(run);
        }
    }
}

bool Animator::finish(const std::string& tag) {
    std::vector<Run> matching;
    for (auto it = running_.begin(); it != running_.end();) {
        if (it->animation->tag() == tag) {
            matching.push_back(std::move(*it));
            it = running_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& run : matching) {
        complete(run);
    }
    return !matching.empty();
}

bool Animator::cancel(const std::string& tag) {
    bool cancelled = false;
    for (auto it = running_.begin(); it != running_.end();) {
        if (it->animation->tag() != tag) {
            ++it;
            continue;
        }
        const auto& steps = it->animation->steps();
        for (std::size_t i = it->step_index; i < steps.size(); ++i) {
            steps[i].apply_end_state();
        }
        log::debug("[Animator] Cancelled animation '" + tag + "'");
        it = running_.erase(it);
        cancelled = true;
    }
    return cancelled;
}

bool Animator::is_running(const std::string& tag) const {
    return std::any_of(running_.begin(), running_.end(),
                       [&tag](const Run& run) { return run.animation->tag() == tag; });
}

bool Animator::is_locking_ui() const {
    return std::any_of(running_.begin(), running_.end(),
                       [](const Run& run) { return run.animation->lock_ui(); });
}

}
