#include "containers/container_content.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "containers/transition_builder.hpp"
#include "utils/log.hpp"

namespace cradle {

namespace {

std::string describe(const ViewController* vc) {
    return vc ? "'" + vc->title() + "'" : std::string("<empty>");
}

std::shared_ptr<View> make_blocking_view(const View& container_view) {
    auto blocking = View::create(container_view.bounds(), "blocking_view");
    blocking->set_background(SDL_Color{0, 0, 0, 0});
    blocking->set_autoresizing_mask(kAutoresizingFlexibleWidth | kAutoresizingFlexibleHeight);
    blocking->set_event_function([](const SDL_Event&) { return true; });
    return blocking;
}

}

ContentContainer* ContainerContent::container_of(const ContainerRegistry& registry, const ViewController* view_controller) {
    return registry.container_of(view_controller);
}

ContainerContent::ContainerContent(std::unique_ptr<ViewController> view_controller,
                                   ContentContainer& container,
                                   ContainerRegistry& registry,
                                   TransitionStyle transition_style,
                                   double duration)
: container_(&container),
  registry_(&registry),
  transition_style_(transition_style),
  duration_(duration) {
    if (!view_controller) {
        log::error("[ContainerContent] A view controller is mandatory (container " + container.container_name() + ")");
        throw std::invalid_argument("ContainerContent requires a view controller");
    }
    registry.register_child(*view_controller, container);
    view_controller_ = std::move(view_controller);
}

ContainerContent::~ContainerContent() {
    release();
}

ContainerContent::ContainerContent(ContainerContent&& other) noexcept
: view_controller_(std::move(other.view_controller_)),
  container_(std::exchange(other.container_, nullptr)),
  registry_(std::exchange(other.registry_, nullptr)),
  added_to_container_view_(std::exchange(other.added_to_container_view_, false)),
  blocking_view_(std::move(other.blocking_view_)),
  transition_style_(other.transition_style_),
  duration_(other.duration_),
  cached_animation_(std::move(other.cached_animation_)),
  original_view_frame_(other.original_view_frame_),
  original_view_opacity_(other.original_view_opacity_) {}

ContainerContent& ContainerContent::operator=(ContainerContent&& other) {
    if (this == &other) {
        return *this;
    }
    release();
    view_controller_ = std::move(other.view_controller_);
    container_ = std::exchange(other.container_, nullptr);
    registry_ = std::exchange(other.registry_, nullptr);
    added_to_container_view_ = std::exchange(other.added_to_container_view_, false);
    blocking_view_ = std::move(other.blocking_view_);
    transition_style_ = other.transition_style_;
    duration_ = other.duration_;
    cached_animation_ = std::move(other.cached_animation_);
    original_view_frame_ = other.original_view_frame_;
    original_view_opacity_ = other.original_view_opacity_;
    return *this;
}

void ContainerContent::release() {
    if (!view_controller_) {
        return;
    }
    remove_view_from_container_view();
    if (registry_ && container_) {
        registry_->unregister_child(*view_controller_, *container_);
    }
    cached_animation_.reset();
    view_controller_.reset();
}

void ContainerContent::add_view_to_container_view(View& container_view, bool block_interaction) {
    attach(container_view, std::numeric_limits<std::size_t>::max(), block_interaction);
}

void ContainerContent::insert_view_into_container_view(View& container_view, std::size_t index, bool block_interaction) {
    attach(container_view, index, block_interaction);
}

void ContainerContent::attach(View& container_view, std::size_t index, bool block_interaction) {
    if (!view_controller_) {
        log::warn("[ContainerContent] Cannot add the view of an empty handle");
        return;
    }
    if (added_to_container_view_) {
        log::debug("[ContainerContent] View of " + describe(view_controller_.get()) + " already added; ignoring");
        return;
    }

    const std::shared_ptr<View>& view = view_controller_->view();
    original_view_frame_ = view->frame();
    original_view_opacity_ = view->opacity();

    if (view->superview()) {
        log::warn("[ContainerContent] View of " + describe(view_controller_.get()) +
                  " was still displayed elsewhere; moving it");
        view->remove_from_superview();
    }

    index = std::min(index, container_view.subviews().size());
    if (block_interaction) {
        blocking_view_ = make_blocking_view(container_view);
        container_view.insert_subview_at(blocking_view_, index);
        ++index;
    }
    container_view.insert_subview_at(view, index);
    added_to_container_view_ = true;
    log::debug("[ContainerContent] Added view of " + describe(view_controller_.get()) + " to " +
               container_->container_name());
}

void ContainerContent::remove_view_from_container_view() {
    if (!added_to_container_view_) {
        return;
    }
    if (const std::shared_ptr<View>& view = view_controller_->view_if_loaded()) {
        view->remove_from_superview();
        view->set_frame(original_view_frame_);
        view->set_opacity(original_view_opacity_);
    }
    if (blocking_view_) {
        blocking_view_->remove_from_superview();
        blocking_view_.reset();
    }
    added_to_container_view_ = false;
    log::debug("[ContainerContent] Removed view of " + describe(view_controller_.get()));
}

std::shared_ptr<View> ContainerContent::view() const {
    if (!added_to_container_view_ || !view_controller_) {
        return nullptr;
    }
    return view_controller_->view_if_loaded();
}

void ContainerContent::release_view() {
    remove_view_from_container_view();
    cached_animation_.reset();
    if (view_controller_) {
        view_controller_->release_view();
    }
}

std::shared_ptr<Animation> ContainerContent::create_animation(const std::vector<const ContainerContent*>& disappearing_contents,
                                                              const SDL_Rect& common_frame) {
    if (!added_to_container_view_) {
        const std::string message = "Cannot create an animation for " + describe(view_controller_.get()) +
                                    " before its view has been added to a container view";
        log::error("[ContainerContent] " + message);
        throw std::logic_error(message);
    }
    cached_animation_ = TransitionAnimationBuilder{}.build(*this, disappearing_contents, common_frame);
    return cached_animation_;
}

std::shared_ptr<Animation> ContainerContent::reverse_animation() const {
    if (!cached_animation_) {
        return nullptr;
    }
    return cached_animation_->reverse();
}

std::unique_ptr<ViewController> ContainerContent::take_view_controller() {
    if (!view_controller_) {
        return nullptr;
    }
    remove_view_from_container_view();
    if (registry_ && container_) {
        registry_->unregister_child(*view_controller_, *container_);
    }
    cached_animation_.reset();
    return std::move(view_controller_);
}

double ContainerContent::resolved_duration() const {
    return resolve_duration(transition_style_, duration_);
}

}
