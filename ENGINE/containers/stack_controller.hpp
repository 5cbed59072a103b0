#pragma once

#include <SDL.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "animation/animator.hpp"
#include "containers/container_content.hpp"
#include "containers/container_registry.hpp"
#include "containers/transition_style.hpp"
#include "view/view_controller.hpp"

namespace cradle {

// Navigation-stack container. Only the topmost child receives input; the
// `capacity` topmost children keep their views loaded, deeper ones are
// unloaded and reloaded when popping reveals them again.
class StackController : public ViewController, public ContentContainer {
public:
    using PopHandler = std::function<void(std::unique_ptr<ViewController>)>;

    static constexpr std::size_t kDefaultCapacity = 2;

    StackController(ContainerRegistry& registry,
                    Animator& animator,
                    std::unique_ptr<ViewController> root,
                    std::size_t capacity = kDefaultCapacity,
                    std::string title = "stack");
    ~StackController() override;

    std::string container_name() const override;

    void push(std::unique_ptr<ViewController> view_controller,
              TransitionStyle style,
              double duration = kDefaultTransitionDuration,
              bool animated = true);

    // The popped controller is handed to the pop handler once its transition
    // has finished, or deleted when no handler is set. The root cannot be popped.
    void pop(bool animated = true);
    void set_pop_handler(PopHandler handler) { pop_handler_ = std::move(handler); }

    ViewController* root_view_controller() const;
    ViewController* top_view_controller() const;
    std::vector<ViewController*> view_controllers() const;
    std::size_t count() const { return contents_.size(); }
    std::size_t capacity() const { return capacity_; }
    const ContainerContent& content_at(std::size_t index) const { return contents_.at(index); }

    void set_frame(const SDL_Rect& frame);
    bool handle_event(const SDL_Event& e);

    void view_will_appear(bool animated) override;
    void view_did_appear(bool animated) override;
    void view_will_disappear(bool animated) override;
    void view_did_disappear(bool animated) override;

protected:
    std::shared_ptr<View> load_view() override;
    void view_did_load() override;

private:
    std::size_t first_attached_index() const;
    void attach_content(std::size_t index, std::size_t z_index);
    void refresh_transitions(const SDL_Rect* new_bounds);
    void fill_capacity();
    void enforce_capacity();
    void finish_pending_transitions();
    void finish_dismissal(const ViewController* view_controller);
    std::string next_animation_tag(const char* action);
    void forget_tag(const std::string& tag);

    ContainerRegistry& registry_;
    Animator&          animator_;
    std::size_t        capacity_;
    SDL_Rect           initial_frame_{0, 0, 800, 600};
    std::vector<ContainerContent> contents_;
    std::vector<ContainerContent> dismissing_;
    PopHandler         pop_handler_{};
    std::vector<std::string> pending_tags_;
    unsigned           animation_counter_ = 0;
    std::shared_ptr<int> lifetime_token_ = std::make_shared<int>(0);
};

}
