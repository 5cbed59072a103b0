#pragma once

#include <SDL.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "containers/container_registry.hpp"
#include "view/view.hpp"
#include "view/view_controller.hpp"

// Minimal doubles shared by the container tests. Nothing here needs an SDL window.
namespace test_doubles {

class TestContainer : public cradle::ContentContainer {
public:
    explicit TestContainer(std::string name) : name_(std::move(name)) {}
    std::string container_name() const override { return name_; }

private:
    std::string name_;
};

// Records lifecycle callbacks in order and counts mouse-down events its view consumed.
class RecordingViewController : public cradle::ViewController {
public:
    explicit RecordingViewController(std::string title, SDL_Rect frame = SDL_Rect{0, 0, 320, 480})
    : cradle::ViewController(std::move(title)), frame_(frame) {}
    ~RecordingViewController() override {
        if (destroyed) *destroyed = true;
    }

    void view_will_appear(bool) override { events.push_back("will_appear"); }
    void view_did_appear(bool) override { events.push_back("did_appear"); }
    void view_will_disappear(bool) override { events.push_back("will_disappear"); }
    void view_did_disappear(bool) override { events.push_back("did_disappear"); }

    std::vector<std::string> events;
    int   taps = 0;
    bool* destroyed = nullptr;

protected:
    std::shared_ptr<cradle::View> load_view() override {
        return cradle::View::create(frame_, title());
    }
    void view_did_load() override {
        events.push_back("did_load");
        view_if_loaded()->set_event_function([this](const SDL_Event& e) {
            if (e.type != SDL_MOUSEBUTTONDOWN) return false;
            ++taps;
            return true;
        });
    }
    void view_did_unload() override { events.push_back("did_unload"); }

private:
    SDL_Rect frame_;
};

inline SDL_Event mouse_button(Uint32 type, int x, int y, Uint8 button = SDL_BUTTON_LEFT) {
    SDL_Event e;
    SDL_zero(e);
    e.type = type;
    e.button.type = type;
    e.button.button = button;
    e.button.x = x;
    e.button.y = y;
    return e;
}

inline bool same_rect(const SDL_Rect& a, const SDL_Rect& b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

}
