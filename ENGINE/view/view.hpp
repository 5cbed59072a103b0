#pragma once

#include <SDL.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cradle {

enum AutoresizingMask : unsigned {
    kAutoresizingNone           = 0,
    kAutoresizingFlexibleWidth  = 1u << 0,
    kAutoresizingFlexibleHeight = 1u << 1,
};

// A rectangular surface in a tree of surfaces. Frames are expressed in the
// superview's coordinate space; subviews are ordered back to front.
class View : public std::enable_shared_from_this<View> {
public:
    using EventFunction = std::function<bool(const SDL_Event&)>;

    static std::shared_ptr<View> create(const SDL_Rect& frame, std::string name = {});

    explicit View(const SDL_Rect& frame, std::string name = {});
    ~View();

    View(const View&) = delete;
    View& operator=(const View&) = delete;

    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    const SDL_Rect& frame() const { return frame_; }
    void set_frame(const SDL_Rect& frame);
    SDL_Rect bounds() const { return SDL_Rect{0, 0, frame_.w, frame_.h}; }

    float opacity() const { return opacity_; }
    void set_opacity(float opacity);

    bool is_hidden() const { return hidden_; }
    void set_hidden(bool hidden) { hidden_ = hidden; }

    bool user_interaction_enabled() const { return user_interaction_enabled_; }
    void set_user_interaction_enabled(bool enabled) { user_interaction_enabled_ = enabled; }

    const SDL_Color& background() const { return background_; }
    void set_background(const SDL_Color& color) { background_ = color; }

    unsigned autoresizing_mask() const { return autoresizing_mask_; }
    void set_autoresizing_mask(unsigned mask) { autoresizing_mask_ = mask; }

    void set_event_function(EventFunction fn) { event_function_ = std::move(fn); }

    View* superview() const { return superview_; }
    const std::vector<std::shared_ptr<View>>& subviews() const { return subviews_; }

    void add_subview(std::shared_ptr<View> view);
    void insert_subview_at(std::shared_ptr<View> view, std::size_t index);
    void insert_subview_below(std::shared_ptr<View> view, const View& sibling);
    void bring_subview_to_front(const View& view);
    void remove_from_superview();

    // Position among the superview's subviews, or -1 when detached.
    int index_in_superview() const;
    bool is_descendant_of(const View& ancestor) const;

    // point is expressed in this view's bounds.
    View* hit_test(SDL_Point point);

    // Routes pointer events to the deepest hit view, bubbling up through its
    // ancestors until a handler consumes it. point coordinates are relative to
    // this view's superview (window coordinates for a root view).
    bool dispatch_event(const SDL_Event& e);

    void render(SDL_Renderer* renderer, SDL_Point origin = SDL_Point{0, 0}, float inherited_opacity = 1.0f) const;

private:
    void detach_subview(const View& view);
    void resize_subviews(int dw, int dh);

private:
    std::string  name_;
    SDL_Rect     frame_{0, 0, 0, 0};
    float        opacity_ = 1.0f;
    bool         hidden_ = false;
    bool         user_interaction_enabled_ = true;
    SDL_Color    background_{0, 0, 0, 0};
    unsigned     autoresizing_mask_ = kAutoresizingNone;
    EventFunction event_function_{};

    View* superview_ = nullptr;
    std::vector<std::shared_ptr<View>> subviews_;
};

}
