#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "animation/animator.hpp"
#include "stubs/test_doubles.hpp"

using namespace cradle;
using test_doubles::same_rect;

namespace {

ViewAnimationStep shift_x(const std::shared_ptr<View>& view, int from_x, int to_x) {
    ViewState from = ViewState::of(*view);
    ViewState to = from;
    from.frame.x = from_x;
    to.frame.x = to_x;
    return ViewAnimationStep{view, from, to};
}

AnimationStep step(double duration, std::string tag, std::vector<ViewAnimationStep> view_steps) {
    AnimationStep s;
    s.duration = duration;
    s.tag = std::move(tag);
    s.view_steps = std::move(view_steps);
    return s;
}

// setup (instant) -> slide over one second -> instant fade out.
std::shared_ptr<Animation> slide_animation(const std::shared_ptr<View>& view, std::vector<std::string>* trace = nullptr) {
    ViewState faded = ViewState::of(*view);
    faded.frame.x = 100;
    ViewState visible = faded;
    visible.opacity = 1.0f;
    faded.opacity = 0.0f;

    auto animation = std::make_shared<Animation>(std::vector<AnimationStep>{
        step(0.0, "setup", {shift_x(view, 0, -50)}),
        step(1.0, "slide", {shift_x(view, -50, 100)}),
        step(0.0, "fade", {ViewAnimationStep{view, visible, faded}}),
    });
    animation->set_tag("slide");
    if (trace) {
        animation->set_on_will_start([trace](const Animation&, bool animated) {
            trace->push_back(animated ? "start" : "start(instant)");
        });
        animation->set_on_step_finished([trace](const Animation&, const AnimationStep& s, bool) {
            trace->push_back(s.tag);
        });
        animation->set_on_did_stop([trace](const Animation&, bool animated) {
            trace->push_back(animated ? "stop" : "stop(instant)");
        });
    }
    return animation;
}

}

TEST_CASE("Leading instant steps apply as soon as an animation is played") {
    auto view = View::create(SDL_Rect{0, 0, 10, 10}, "v");
    std::vector<std::string> events;
    Animator animator;

    animator.play(slide_animation(view, &events));

    CHECK(view->frame().x == -50);
    CHECK(animator.running_count() == 1);
    CHECK(animator.is_running("slide"));
    REQUIRE(events.size() == 2);
    CHECK(events[0] == "start");
    CHECK(events[1] == "setup");
}

TEST_CASE("Ticks interpolate and the final state is exact") {
    auto view = View::create(SDL_Rect{0, 0, 10, 10}, "v");
    std::vector<std::string> events;
    Animator animator;
    animator.play(slide_animation(view, &events));

    animator.tick(0.5f);
    CHECK(view->frame().x == 25);
    CHECK(view->opacity() == doctest::Approx(1.0f));

    // Overshooting the slide runs the trailing instant step in the same tick.
    animator.tick(0.75f);
    CHECK(view->frame().x == 100);
    CHECK(view->opacity() == doctest::Approx(0.0f));
    CHECK(animator.running_count() == 0);
    CHECK_FALSE(animator.is_running("slide"));
    REQUIRE(events.size() == 5);
    CHECK(events[2] == "slide");
    CHECK(events[3] == "fade");
    CHECK(events[4] == "stop");
}

TEST_CASE("Playing without animation applies the end state synchronously") {
    auto view = View::create(SDL_Rect{0, 0, 10, 10}, "v");
    std::vector<std::string> events;
    Animator animator;

    animator.play(slide_animation(view, &events), false);

    CHECK(view->frame().x == 100);
    CHECK(view->opacity() == doctest::Approx(0.0f));
    CHECK(animator.running_count() == 0);
    REQUIRE(events.size() == 5);
    CHECK(events.front() == "start(instant)");
    CHECK(events.back() == "stop(instant)");
}

TEST_CASE("Animations made of instant steps finish inside play") {
    auto view = View::create(SDL_Rect{0, 0, 10, 10}, "v");
    bool stopped = false;
    auto animation = std::make_shared<Animation>(std::vector<AnimationStep>{step(0.0, "jump", {shift_x(view, 0, 30)})});
    animation->set_on_did_stop([&](const Animation&, bool animated) { stopped = animated; });

    Animator animator;
    animator.play(animation);

    CHECK(stopped);
    CHECK(view->frame().x == 30);
    CHECK(animator.running_count() == 0);
}

TEST_CASE("The animator keeps animated views alive until the animation stops") {
    Animator animator;
    std::weak_ptr<View> weak;
    {
        auto parent = View::create(SDL_Rect{0, 0, 100, 100}, "parent");
        auto view = View::create(SDL_Rect{0, 0, 10, 10}, "v");
        parent->add_subview(view);
        weak = view;
        animator.play(slide_animation(view));
        view->remove_from_superview();
    }
    CHECK_FALSE(weak.expired());

    animator.tick(0.5f);
    REQUIRE_FALSE(weak.expired());
    CHECK(weak.lock()->frame().x == 25);

    animator.tick(1.0f);
    CHECK(weak.expired());
}

TEST_CASE("Animations do not keep their views alive while idle") {
    auto kept = View::create(SDL_Rect{0, 0, 10, 10}, "kept");
    auto dropped = View::create(SDL_Rect{0, 0, 10, 10}, "dropped");
    std::weak_ptr<View> weak = dropped;
    auto animation = std::make_shared<Animation>(std::vector<AnimationStep>{
        step(0.5, "both", {shift_x(kept, 0, 40), shift_x(dropped, 0, 40)}),
    });
    REQUIRE(animation->live_views().size() == 2);

    dropped.reset();
    CHECK(weak.expired());
    CHECK(animation->live_views().size() == 1);

    Animator animator;
    animator.play(animation);
    animator.tick(1.0f);
    CHECK(kept->frame().x == 40);
    CHECK(animator.running_count() == 0);
}

TEST_CASE("Cancelling skips callbacks while finishing fires them") {
    auto a = View::create(SDL_Rect{0, 0, 10, 10}, "a");
    auto b = View::create(SDL_Rect{0, 0, 10, 10}, "b");
    std::vector<std::string> a_events;
    std::vector<std::string> b_events;
    auto first = slide_animation(a, &a_events);
    auto second = slide_animation(b, &b_events);
    first->set_tag("first");
    second->set_tag("second");

    Animator animator;
    animator.play(first);
    animator.play(second);
    animator.tick(0.25f);

    CHECK(animator.cancel("first"));
    CHECK(a->frame().x == 100);
    CHECK(a->opacity() == doctest::Approx(0.0f));
    CHECK(a_events.back() == "setup");

    CHECK(animator.finish("second"));
    CHECK(b->frame().x == 100);
    CHECK(b_events.back() == "stop");

    CHECK(animator.running_count() == 0);
    CHECK_FALSE(animator.cancel("first"));
    CHECK_FALSE(animator.finish("missing"));
}

TEST_CASE("finish_all completes animations started from callbacks") {
    auto a = View::create(SDL_Rect{0, 0, 10, 10}, "a");
    auto b = View::create(SDL_Rect{0, 0, 10, 10}, "b");
    Animator animator;
    auto chained = slide_animation(b);
    auto first = slide_animation(a);
    first->set_on_did_stop([&](const Animation&, bool) { animator.play(chained); });

    animator.play(first);
    animator.finish_all();

    CHECK(a->frame().x == 100);
    CHECK(b->frame().x == 100);
    CHECK(animator.running_count() == 0);
}

TEST_CASE("UI-locking animations are reported while they run") {
    auto view = View::create(SDL_Rect{0, 0, 10, 10}, "v");
    Animator animator;
    auto free_running = slide_animation(view);
    animator.play(free_running);
    CHECK_FALSE(animator.is_locking_ui());

    auto locking = slide_animation(view);
    locking->set_tag("locking");
    locking->set_lock_ui(true);
    animator.play(locking);
    CHECK(animator.is_locking_ui());

    animator.finish("locking");
    CHECK_FALSE(animator.is_locking_ui());
}

TEST_CASE("Reversed animations swap states, order and tag") {
    auto view = View::create(SDL_Rect{0, 0, 10, 10}, "v");
    auto forward = slide_animation(view);
    forward->set_lock_ui(true);
    auto reverse = forward->reverse();

    CHECK(reverse->tag() == "reverse_slide");
    CHECK(reverse->lock_ui());
    REQUIRE(reverse->steps().size() == 3);
    CHECK(reverse->steps()[0].tag == "fade");
    CHECK(reverse->steps()[2].tag == "setup");
    CHECK(reverse->total_duration() == doctest::Approx(forward->total_duration()));

    forward->apply_end_state();
    reverse->apply_end_state();
    CHECK(same_rect(view->frame(), SDL_Rect{0, 0, 10, 10}));
    CHECK(view->opacity() == doctest::Approx(1.0f));
}
