#pragma once

#include <SDL.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "view/view.hpp"

namespace cradle {

struct ViewState {
    SDL_Rect frame{0, 0, 0, 0};
    float    opacity = 1.0f;

    static ViewState of(const View& view);
    void apply_to(View& view) const;
};

bool operator==(const ViewState& a, const ViewState& b);
bool operator!=(const ViewState& a, const ViewState& b);

// One view moving between two absolute states. The view is only observed: a
// step whose view has been destroyed does nothing. The Animator keeps the
// views of a running animation alive.
struct ViewAnimationStep {
    std::weak_ptr<View> view;
    ViewState from{};
    ViewState to{};

    ViewAnimationStep reversed() const;
    void apply(double progress) const;
};

// View changes that run concurrently over the same duration.
struct AnimationStep {
    double      duration = 0.0;
    std::string tag;
    std::vector<ViewAnimationStep> view_steps;

    AnimationStep reversed() const;
    void apply_start_state() const;
    void apply_progress(double progress) const;
    void apply_end_state() const;
};

class Animation {
public:
    using StartCallback = std::function<void(const Animation&, bool animated)>;
    using StepCallback  = std::function<void(const Animation&, const AnimationStep&, bool animated)>;
    using StopCallback  = std::function<void(const Animation&, bool animated)>;

    Animation() = default;
    explicit Animation(std::vector<AnimationStep> steps);

    const std::vector<AnimationStep>& steps() const { return steps_; }
    double total_duration() const;

    const std::string& tag() const { return tag_; }
    void set_tag(std::string tag) { tag_ = std::move(tag); }

    // While a UI-locking animation runs, hosts drop user input.
    bool lock_ui() const { return lock_ui_; }
    void set_lock_ui(bool lock) { lock_ui_ = lock; }

    void set_on_will_start(StartCallback cb) { on_will_start_ = std::move(cb); }
    void set_on_step_finished(StepCallback cb) { on_step_finished_ = std::move(cb); }
    void set_on_did_stop(StopCallback cb) { on_did_stop_ = std::move(cb); }

    void notify_will_start(bool animated) const;
    void notify_step_finished(const AnimationStep& step, bool animated) const;
    void notify_did_stop(bool animated) const;

    void apply_start_state() const;
    void apply_end_state() const;

    // Views of every step that are still alive, without duplicates.
    std::vector<std::shared_ptr<View>> live_views() const;

    // Steps in reverse order with start and end states exchanged. Tag is
    // prefixed with "reverse_"; callbacks and the UI lock carry over.
    std::shared_ptr<Animation> reverse() const;

private:
    std::vector<AnimationStep> steps_;
    std::string tag_;
    bool lock_ui_ = false;
    StartCallback on_will_start_{};
    StepCallback  on_step_finished_{};
    StopCallback  on_did_stop_{};
};

}
