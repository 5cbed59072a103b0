#include "view/view.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "utils/log.hpp"

namespace cradle {

namespace {
// Views fainter than this do not receive input.
constexpr float kHitTestMinOpacity = 0.01f;

bool pointer_position(const SDL_Event& e, SDL_Point& out) {
    switch (e.type) {
    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
        out = SDL_Point{e.button.x, e.button.y};
        return true;
    case SDL_MOUSEMOTION:
        out = SDL_Point{e.motion.x, e.motion.y};
        return true;
    default:
        return false;
    }
}
}

std::shared_ptr<View> View::create(const SDL_Rect& frame, std::string name) {
    return std::make_shared<View>(frame, std::move(name));
}

View::View(const SDL_Rect& frame, std::string name)
: name_(std::move(name)),
  frame_(frame) {}

View::~View() {
    for (auto& child : subviews_) {
        if (child) {
            child->superview_ = nullptr;
        }
    }
}

void View::set_frame(const SDL_Rect& frame) {
    const int dw = frame.w - frame_.w;
    const int dh = frame.h - frame_.h;
    frame_ = frame;
    if (dw != 0 || dh != 0) {
        resize_subviews(dw, dh);
    }
}

void View::set_opacity(float opacity) {
    if (!std::isfinite(opacity)) {
        return;
    }
    opacity_ = std::clamp(opacity, 0.0f, 1.0f);
}

// Deltas are applied unclamped so that shrinking then growing a view back
// restores its flexible subviews exactly.
void View::resize_subviews(int dw, int dh) {
    for (auto& child : subviews_) {
        const unsigned mask = child->autoresizing_mask_;
        if (mask == kAutoresizingNone) {
            continue;
        }
        SDL_Rect resized = child->frame_;
        if (mask & kAutoresizingFlexibleWidth) {
            resized.w += dw;
        }
        if (mask & kAutoresizingFlexibleHeight) {
            resized.h += dh;
        }
        child->set_frame(resized);
    }
}

void View::add_subview(std::shared_ptr<View> view) {
    insert_subview_at(std::move(view), subviews_.size());
}

void View::insert_subview_at(std::shared_ptr<View> view, std::size_t index) {
    if (!view || view.get() == this) {
        return;
    }
    if (is_descendant_of(*view)) {
        log::warn("[View] Refusing to insert '" + view->name() + "' into its own descendant '" + name_ + "'");
        return;
    }
    if (view->superview_) {
        view->superview_->detach_subview(*view);
    }
    index = std::min(index, subviews_.size());
    view->superview_ = this;
    subviews_.insert(subviews_.begin() + static_cast<std::ptrdiff_t>(index), std::move(view));
}

void View::insert_subview_below(std::shared_ptr<View> view, const View& sibling) {
    if (!view) {
        return;
    }
    if (view->superview_ == this) {
        detach_subview(*view);
    }
    auto it = std::find_if(subviews_.begin(), subviews_.end(),
                           [&sibling](const std::shared_ptr<View>& v) { return v.get() == &sibling; });
    if (it == subviews_.end()) {
        log::debug("[View] '" + sibling.name() + "' is not a subview of '" + name_ + "'; inserting on top");
        add_subview(std::move(view));
        return;
    }
    insert_subview_at(std::move(view), static_cast<std::size_t>(it - subviews_.begin()));
}

void View::bring_subview_to_front(const View& view) {
    auto it = std::find_if(subviews_.begin(), subviews_.end(),
                           [&view](const std::shared_ptr<View>& v) { return v.get() == &view; });
    if (it == subviews_.end() || it + 1 == subviews_.end()) {
        return;
    }
    std::shared_ptr<View> keep = std::move(*it);
    subviews_.erase(it);
    subviews_.push_back(std::move(keep));
}

void View::remove_from_superview() {
    if (!superview_) {
        return;
    }
    std::shared_ptr<View> keep_alive = weak_from_this().lock();
    superview_->detach_subview(*this);
}

void View::detach_subview(const View& view) {
    auto it = std::find_if(subviews_.begin(), subviews_.end(),
                           [&view](const std::shared_ptr<View>& v) { return v.get() == &view; });
    if (it == subviews_.end()) {
        return;
    }
    (*it)->superview_ = nullptr;
    subviews_.erase(it);
}

int View::index_in_superview() const {
    if (!superview_) {
        return -1;
    }
    const auto& siblings = superview_->subviews_;
    for (std::size_t i = 0; i < siblings.size(); ++i) {
        if (siblings[i].get() == this) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool View::is_descendant_of(const View& ancestor) const {
    for (const View* v = this; v; v = v->superview_) {
        if (v == &ancestor) {
            return true;
        }
    }
    return false;
}

View* View::hit_test(SDL_Point point) {
    if (hidden_ || !user_interaction_enabled_ || opacity_ < kHitTestMinOpacity) {
        return nullptr;
    }
    const SDL_Rect local = bounds();
    if (!SDL_PointInRect(&point, &local)) {
        return nullptr;
    }
    for (auto it = subviews_.rbegin(); it != subviews_.rend(); ++it) {
        View* child = it->get();
        const SDL_Point child_point{point.x - child->frame_.x, point.y - child->frame_.y};
        if (View* hit = child->hit_test(child_point)) {
            return hit;
        }
    }
    return this;
}

bool View::dispatch_event(const SDL_Event& e) {
    SDL_Point point{0, 0};
    if (!pointer_position(e, point)) {
        return false;
    }
    View* target = hit_test(SDL_Point{point.x - frame_.x, point.y - frame_.y});
    const View* stop = superview_;
    for (View* v = target; v && v != stop; v = v->superview_) {
        if (v->event_function_ && v->event_function_(e)) {
            return true;
        }
    }
    return false;
}

void View::render(SDL_Renderer* renderer, SDL_Point origin, float inherited_opacity) const {
    if (!renderer || hidden_) {
        return;
    }
    const float effective = opacity_ * inherited_opacity;
    if (effective <= 0.0f) {
        return;
    }
    const SDL_Rect dst{origin.x + frame_.x, origin.y + frame_.y, frame_.w, frame_.h};
    if (background_.a > 0 && dst.w > 0 && dst.h > 0) {
        const Uint8 alpha = static_cast<Uint8>(std::lround(background_.a * effective));
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, background_.r, background_.g, background_.b, alpha);
        SDL_RenderFillRect(renderer, &dst);
    }
    const SDL_Point child_origin{dst.x, dst.y};
    for (const auto& child : subviews_) {
        child->render(renderer, child_origin, effective);
    }
}

}
