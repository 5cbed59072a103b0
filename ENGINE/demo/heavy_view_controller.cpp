#include "demo/heavy_view_controller.hpp"

#include <mutex>
#include <random>

#include "utils/log.hpp"
#include "utils/settings.hpp"

namespace cradle::demo {

namespace {

constexpr double kDefaultLoadDelayMs = 200.0;

std::mt19937& color_rng() {
    static std::mt19937 rng{ std::random_device{}() };
    return rng;
}

std::mutex& color_rng_mutex() {
    static std::mutex m;
    return m;
}

SDL_Color random_color() {
    std::uniform_int_distribution<int> dist(0, 255);
    std::lock_guard<std::mutex> lock(color_rng_mutex());
    return SDL_Color{
        static_cast<Uint8>(dist(color_rng())),
        static_cast<Uint8>(dist(color_rng())),
        static_cast<Uint8>(dist(color_rng())),
        255};
}

}

HeavyViewController::HeavyViewController(std::string title, TapHandler on_tap)
: ViewController(std::move(title)),
  on_tap_(std::move(on_tap)) {}

std::shared_ptr<View> HeavyViewController::load_view() {
    return View::create(SDL_Rect{0, 0, 320, 480}, title());
}

void HeavyViewController::view_did_load() {
    const double delay = settings::load_number("demo.heavy_view_load_delay_ms", kDefaultLoadDelayMs);
    if (delay > 0.0) {
        SDL_Delay(static_cast<Uint32>(delay));
    }

    const std::shared_ptr<View>& root = view_if_loaded();
    root->set_background(random_color());
    root->set_event_function([this](const SDL_Event& e) {
        if (e.type != SDL_MOUSEBUTTONUP || !on_tap_) {
            return false;
        }
        on_tap_(e.button.button);
        return true;
    });

    const SDL_Rect b = root->bounds();
    auto card = View::create(SDL_Rect{b.w / 4, b.h / 4, b.w / 2, b.h / 2}, title() + ".card");
    card->set_background(SDL_Color{255, 255, 255, 60});
    card->set_autoresizing_mask(kAutoresizingFlexibleWidth | kAutoresizingFlexibleHeight);
    card->set_user_interaction_enabled(false);
    root->add_subview(std::move(card));
    log::info("[HeavyViewController] Built view for '" + title() + "'");
}

void HeavyViewController::view_did_unload() {
    log::info("[HeavyViewController] Dropped view for '" + title() + "'");
}

void HeavyViewController::view_did_appear(bool animated) {
    log::debug("[HeavyViewController] '" + title() + "' appeared" + (animated ? " (animated)" : ""));
}

}
