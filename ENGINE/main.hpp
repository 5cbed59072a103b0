#pragma once

#include <SDL.h>

#include <cstddef>
#include <memory>
#include <vector>

#include "animation/animator.hpp"
#include "containers/container_registry.hpp"
#include "containers/stack_controller.hpp"

namespace cradle {

// Interactive stack demo: left click or space pushes a controller with the
// next transition style, right click or backspace pops, escape quits.
class DemoApp {
public:
    DemoApp(SDL_Renderer* renderer, int screen_w, int screen_h, bool animated);
    ~DemoApp();

    void run();

private:
    enum class Command { Push, Pop };

    void handle_event(const SDL_Event& e);
    void process_commands();
    void push_next();
    void render();
    std::unique_ptr<ViewController> make_controller();

    SDL_Renderer* renderer_ = nullptr;
    int  screen_w_ = 0;
    int  screen_h_ = 0;
    bool animated_ = true;
    bool running_ = false;
    std::size_t next_style_ = 1;
    unsigned    created_ = 0;
    std::vector<Command> commands_;

    ContainerRegistry registry_;
    Animator animator_;
    std::unique_ptr<StackController> stack_;
};

}
