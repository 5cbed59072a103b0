#include "main.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>
#include <utility>

#include "demo/heavy_view_controller.hpp"
#include "utils/log.hpp"
#include "utils/settings.hpp"

namespace cradle {

DemoApp::DemoApp(SDL_Renderer* renderer, int screen_w, int screen_h, bool animated)
: renderer_(renderer),
  screen_w_(screen_w),
  screen_h_(screen_h),
  animated_(animated) {
    const double configured_capacity =
        settings::load_number("demo.stack_capacity", static_cast<double>(StackController::kDefaultCapacity));
    const auto capacity = std::isfinite(configured_capacity)
        ? static_cast<std::size_t>(std::clamp(configured_capacity, 1.0, 64.0))
        : StackController::kDefaultCapacity;
    stack_ = std::make_unique<StackController>(registry_, animator_, make_controller(), capacity, "demo");
    stack_->set_frame(SDL_Rect{0, 0, screen_w_, screen_h_});
    stack_->set_pop_handler([](std::unique_ptr<ViewController> vc) {
        log::info("[DemoApp] Popped '" + vc->title() + "'");
    });
    stack_->view();
    stack_->view_will_appear(false);
    stack_->view_did_appear(false);
}

DemoApp::~DemoApp() {
    animator_.finish_all();
    stack_.reset();
}

std::unique_ptr<ViewController> DemoApp::make_controller() {
    const std::string title = "screen " + std::to_string(++created_);
    return std::make_unique<demo::HeavyViewController>(title, [this](Uint8 button) {
        if (button == SDL_BUTTON_LEFT) {
            commands_.push_back(Command::Push);
        } else if (button == SDL_BUTTON_RIGHT) {
            commands_.push_back(Command::Pop);
        }
    });
}

void DemoApp::push_next() {
    const auto& styles = all_transition_styles();
    const TransitionStyle style = styles[next_style_ % styles.size()];
    ++next_style_;
    stack_->push(make_controller(), style, kDefaultTransitionDuration, animated_);
    log::info(std::string("[DemoApp] Pushed with ") + transition_style_name(style) +
              " (" + std::to_string(stack_->count()) + " on stack)");
}

void DemoApp::handle_event(const SDL_Event& e) {
    switch (e.type) {
    case SDL_QUIT:
        running_ = false;
        break;
    case SDL_WINDOWEVENT:
        if (e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
            screen_w_ = e.window.data1;
            screen_h_ = e.window.data2;
            stack_->set_frame(SDL_Rect{0, 0, screen_w_, screen_h_});
        }
        break;
    case SDL_KEYDOWN:
        if (e.key.keysym.sym == SDLK_ESCAPE) {
            running_ = false;
        } else if (e.key.keysym.sym == SDLK_SPACE) {
            commands_.push_back(Command::Push);
        } else if (e.key.keysym.sym == SDLK_BACKSPACE) {
            commands_.push_back(Command::Pop);
        }
        break;
    default:
        stack_->handle_event(e);
        break;
    }
}

void DemoApp::process_commands() {
    std::vector<Command> pending;
    pending.swap(commands_);
    for (Command command : pending) {
        if (command == Command::Push) {
            push_next();
        } else {
            stack_->pop(animated_);
        }
    }
}

void DemoApp::render() {
    SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
    SDL_RenderClear(renderer_);
    if (const auto& view = stack_->view_if_loaded()) {
        view->render(renderer_);
    }
    SDL_RenderPresent(renderer_);
}

void DemoApp::run() {
    running_ = true;
    Uint32 last_ticks = SDL_GetTicks();
    while (running_) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
            handle_event(e);
        }
        process_commands();

        const Uint32 now = SDL_GetTicks();
        animator_.tick(static_cast<float>(now - last_ticks) / 1000.0f);
        last_ticks = now;

        render();
    }
}

}

int main(int argc, char* argv[]) {
    cradle::log::info("[Main] Starting cradle demo...");
    bool animated = true;
    for (int i = 1; i < argc; ++i) {
        if (argv[i] && std::string(argv[i]) == "--no-animation") {
            animated = false;
        }
    }

    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        cradle::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
        return 1;
    }

    const int width = static_cast<int>(cradle::settings::load_number("demo.window_width", 960));
    const int height = static_cast<int>(cradle::settings::load_number("demo.window_height", 640));
    SDL_Window* window = SDL_CreateWindow("Cradle", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                          width, height, SDL_WINDOW_RESIZABLE);
    if (!window) {
        cradle::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer =
        SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        cradle::log::warn(std::string("Accelerated renderer unavailable: ") + SDL_GetError());
        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
    }
    if (!renderer) {
        cradle::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    int exit_code = 0;
    try {
        cradle::DemoApp app(renderer, width, height, animated);
        app.run();
    } catch (const std::exception& ex) {
        cradle::log::error(std::string("[Main] Fatal: ") + ex.what());
        exit_code = 1;
    }

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    cradle::log::info("[Main] Shutdown complete.");
    return exit_code;
}
