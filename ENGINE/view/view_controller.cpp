#include "view/view_controller.hpp"

#include "utils/log.hpp"

namespace cradle {

namespace {
constexpr SDL_Rect kDefaultViewFrame{0, 0, 320, 480};
}

ViewController::ViewController(std::string title)
: title_(std::move(title)) {}

ViewController::~ViewController() {
    if (view_) {
        view_->remove_from_superview();
    }
}

const std::shared_ptr<View>& ViewController::view() {
    if (!view_) {
        view_ = load_view();
        if (!view_) {
            log::warn("[ViewController] '" + title_ + "' load_view() returned no view; using an empty one");
            view_ = View::create(kDefaultViewFrame, title_);
        }
        ++view_load_count_;
        log::debug("[ViewController] Loaded view for '" + title_ + "'");
        view_did_load();
    }
    return view_;
}

bool ViewController::release_view() {
    if (!view_) {
        return true;
    }
    if (view_->superview()) {
        log::warn("[ViewController] '" + title_ + "' view is still displayed; not releasing it");
        return false;
    }
    view_.reset();
    log::debug("[ViewController] Released view for '" + title_ + "'");
    view_did_unload();
    return true;
}

void ViewController::view_will_appear(bool) {}
void ViewController::view_did_appear(bool) {}
void ViewController::view_will_disappear(bool) {}
void ViewController::view_did_disappear(bool) {}

std::shared_ptr<View> ViewController::load_view() {
    return View::create(kDefaultViewFrame, title_);
}

}
