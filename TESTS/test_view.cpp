#include "doctest/doctest.h"

#include <limits>
#include <memory>

#include "stubs/test_doubles.hpp"
#include "view/view.hpp"
#include "view/view_controller.hpp"

using cradle::View;
using test_doubles::mouse_button;
using test_doubles::same_rect;

TEST_CASE("Subviews keep back-to-front order and report their index") {
    auto root = View::create(SDL_Rect{0, 0, 200, 100}, "root");
    auto a = View::create(SDL_Rect{0, 0, 10, 10}, "a");
    auto b = View::create(SDL_Rect{0, 0, 10, 10}, "b");
    auto c = View::create(SDL_Rect{0, 0, 10, 10}, "c");

    root->add_subview(a);
    root->add_subview(c);
    root->insert_subview_below(b, *c);

    REQUIRE(root->subviews().size() == 3);
    CHECK(root->subviews()[0] == a);
    CHECK(root->subviews()[1] == b);
    CHECK(root->subviews()[2] == c);
    CHECK(b->index_in_superview() == 1);
    CHECK(b->superview() == root.get());

    root->bring_subview_to_front(*a);
    CHECK(a->index_in_superview() == 2);

    // Out-of-range indices clamp to the top.
    auto d = View::create(SDL_Rect{0, 0, 10, 10}, "d");
    root->insert_subview_at(d, 99);
    CHECK(d->index_in_superview() == 3);

    c->remove_from_superview();
    CHECK(c->superview() == nullptr);
    CHECK(c->index_in_superview() == -1);
    CHECK(root->subviews().size() == 3);
}

TEST_CASE("Adding a view to a new superview removes it from the old one") {
    auto first = View::create(SDL_Rect{0, 0, 50, 50}, "first");
    auto second = View::create(SDL_Rect{0, 0, 50, 50}, "second");
    auto child = View::create(SDL_Rect{0, 0, 10, 10}, "child");

    first->add_subview(child);
    second->add_subview(child);

    CHECK(first->subviews().empty());
    CHECK(child->superview() == second.get());
    CHECK(child->is_descendant_of(*second));
    CHECK_FALSE(child->is_descendant_of(*first));
}

TEST_CASE("A view cannot be inserted into its own descendant") {
    auto parent = View::create(SDL_Rect{0, 0, 50, 50}, "parent");
    auto child = View::create(SDL_Rect{0, 0, 10, 10}, "child");
    parent->add_subview(child);

    child->add_subview(parent);

    CHECK(parent->superview() == nullptr);
    CHECK(child->subviews().empty());
}

TEST_CASE("Removing a view from its superview keeps it alive until the call returns") {
    auto parent = View::create(SDL_Rect{0, 0, 50, 50}, "parent");
    parent->add_subview(View::create(SDL_Rect{0, 0, 10, 10}, "orphan"));
    std::weak_ptr<View> weak = parent->subviews().front();

    parent->subviews().front()->remove_from_superview();

    CHECK(parent->subviews().empty());
    CHECK(weak.expired());
}

TEST_CASE("Flexible subviews follow their superview and survive a collapse exactly") {
    auto root = View::create(SDL_Rect{0, 0, 400, 300}, "root");
    auto stretchy = View::create(SDL_Rect{0, 0, 400, 300}, "stretchy");
    stretchy->set_autoresizing_mask(cradle::kAutoresizingFlexibleWidth | cradle::kAutoresizingFlexibleHeight);
    auto fixed = View::create(SDL_Rect{5, 5, 20, 20}, "fixed");
    root->add_subview(stretchy);
    root->add_subview(fixed);

    root->set_frame(SDL_Rect{0, 0, 640, 480});
    CHECK(same_rect(stretchy->frame(), SDL_Rect{0, 0, 640, 480}));
    CHECK(same_rect(fixed->frame(), SDL_Rect{5, 5, 20, 20}));

    root->set_frame(SDL_Rect{320, 240, 0, 0});
    root->set_frame(SDL_Rect{0, 0, 400, 300});
    CHECK(same_rect(stretchy->frame(), SDL_Rect{0, 0, 400, 300}));
}

TEST_CASE("Opacity is clamped and non-finite values are ignored") {
    auto v = View::create(SDL_Rect{0, 0, 10, 10});
    v->set_opacity(2.0f);
    CHECK(v->opacity() == doctest::Approx(1.0f));
    v->set_opacity(-1.0f);
    CHECK(v->opacity() == doctest::Approx(0.0f));
    v->set_opacity(0.5f);
    v->set_opacity(std::numeric_limits<float>::quiet_NaN());
    CHECK(v->opacity() == doctest::Approx(0.5f));
}

TEST_CASE("Hit testing picks the topmost interactive view") {
    auto root = View::create(SDL_Rect{0, 0, 200, 200}, "root");
    auto below = View::create(SDL_Rect{0, 0, 100, 100}, "below");
    auto above = View::create(SDL_Rect{50, 50, 100, 100}, "above");
    root->add_subview(below);
    root->add_subview(above);

    CHECK(root->hit_test(SDL_Point{60, 60}) == above.get());
    CHECK(root->hit_test(SDL_Point{10, 10}) == below.get());
    CHECK(root->hit_test(SDL_Point{190, 10}) == root.get());
    CHECK(root->hit_test(SDL_Point{250, 10}) == nullptr);

    above->set_hidden(true);
    CHECK(root->hit_test(SDL_Point{60, 60}) == below.get());
    above->set_hidden(false);

    above->set_user_interaction_enabled(false);
    CHECK(root->hit_test(SDL_Point{60, 60}) == below.get());
    above->set_user_interaction_enabled(true);

    // Fully transparent views do not take input.
    above->set_opacity(0.0f);
    CHECK(root->hit_test(SDL_Point{60, 60}) == below.get());
}

TEST_CASE("Pointer events bubble up until a handler consumes them") {
    auto root = View::create(SDL_Rect{10, 10, 200, 200}, "root");
    auto panel = View::create(SDL_Rect{0, 0, 100, 100}, "panel");
    auto label = View::create(SDL_Rect{0, 0, 50, 50}, "label");
    root->add_subview(panel);
    panel->add_subview(label);

    int panel_hits = 0;
    int root_hits = 0;
    panel->set_event_function([&](const SDL_Event&) { ++panel_hits; return true; });
    root->set_event_function([&](const SDL_Event&) { ++root_hits; return true; });

    // Window coordinates: the root is offset by (10, 10).
    CHECK(root->dispatch_event(mouse_button(SDL_MOUSEBUTTONDOWN, 20, 20)));
    CHECK(panel_hits == 1);
    CHECK(root_hits == 0);

    CHECK(root->dispatch_event(mouse_button(SDL_MOUSEBUTTONDOWN, 150, 150)));
    CHECK(root_hits == 1);

    CHECK_FALSE(root->dispatch_event(mouse_button(SDL_MOUSEBUTTONDOWN, 5, 5)));

    SDL_Event key;
    SDL_zero(key);
    key.type = SDL_KEYDOWN;
    CHECK_FALSE(root->dispatch_event(key));
}

TEST_CASE("View controllers load their view lazily and only release it when undisplayed") {
    test_doubles::RecordingViewController vc("lazy", SDL_Rect{0, 0, 64, 32});
    CHECK_FALSE(vc.is_view_loaded());
    CHECK(vc.view_if_loaded() == nullptr);
    CHECK(vc.view_load_count() == 0);

    auto view = vc.view();
    REQUIRE(view);
    CHECK(same_rect(view->frame(), SDL_Rect{0, 0, 64, 32}));
    CHECK(vc.view() == view);
    CHECK(vc.view_load_count() == 1);

    auto host = View::create(SDL_Rect{0, 0, 100, 100}, "host");
    host->add_subview(view);
    CHECK_FALSE(vc.release_view());
    CHECK(vc.is_view_loaded());

    view->remove_from_superview();
    CHECK(vc.release_view());
    CHECK_FALSE(vc.is_view_loaded());

    vc.view();
    CHECK(vc.view_load_count() == 2);
    REQUIRE(vc.events.size() == 3);
    CHECK(vc.events[0] == "did_load");
    CHECK(vc.events[1] == "did_unload");
    CHECK(vc.events[2] == "did_load");
}
