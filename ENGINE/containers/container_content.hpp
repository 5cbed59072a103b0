#pragma once

#include <SDL.h>

#include <cstddef>
#include <memory>
#include <vector>

#include "animation/animation.hpp"
#include "containers/container_registry.hpp"
#include "containers/transition_style.hpp"
#include "view/view.hpp"
#include "view/view_controller.hpp"

namespace cradle {

/**
 * Ownership and lifecycle proxy for a view controller inserted into a
 * container. A container creates one handle per child on insertion and
 * destroys it when the child leaves; the handle
 *   - registers the child with its container so it cannot be inserted into a
 *     second container at the same time,
 *   - creates the child's view only when add_view_to_container_view() is
 *     called, never earlier,
 *   - optionally puts a transparent input-absorbing view below the child so
 *     that only the most recently inserted child is interactive,
 *   - restores the view's frame and opacity when the view is removed, so a
 *     child cached by a client comes back pristine,
 *   - caches the last transition animation so the container can play its
 *     reverse when the child is removed.
 *
 * Handles are move-only. Destroying a handle detaches the view, unregisters
 * the child and deletes it.
 */
class ContainerContent {
public:
    static ContentContainer* container_of(const ContainerRegistry& registry, const ViewController* view_controller);

    // Throws std::invalid_argument for a null view controller and
    // std::logic_error if it already belongs to another container.
    ContainerContent(std::unique_ptr<ViewController> view_controller,
                     ContentContainer& container,
                     ContainerRegistry& registry,
                     TransitionStyle transition_style,
                     double duration = kDefaultTransitionDuration);
    ~ContainerContent();

    ContainerContent(const ContainerContent&) = delete;
    ContainerContent& operator=(const ContainerContent&) = delete;
    ContainerContent(ContainerContent&& other) noexcept;
    ContainerContent& operator=(ContainerContent&& other);

    /**
     * Loads the view controller's view and adds it on top of container_view.
     * With block_interaction, a transparent stretchable view covering
     * container_view is inserted right below it. Does nothing if the view is
     * already attached.
     */
    void add_view_to_container_view(View& container_view, bool block_interaction);

    // Same as above, placing the view (and the blocking view below it) at
    // `index` among container_view's subviews.
    void insert_view_into_container_view(View& container_view, std::size_t index, bool block_interaction);

    // Removes the view (and the blocking view) and restores the frame and
    // opacity captured when it was added. Does nothing if not attached.
    void remove_view_from_container_view();

    // The view controller's view if attached, nullptr otherwise. Never loads it.
    std::shared_ptr<View> view() const;

    // Removes the view, drops the cached animation, then lets the view
    // controller drop the view.
    void release_view();

    /**
     * Builds and caches the animation displaying the view controller with the
     * handle's transition style and duration, hiding the views of
     * `disappearing_contents`. common_frame is the area where the animation
     * takes place (usually the bounds of the container view).
     *
     * Build the animation right before playing it, once the frames of the
     * involved views are final, and again whenever they change (e.g. after
     * the container view is resized). The returned animation can be tweaked
     * (tag, callbacks) before it is played. The cached animation has no
     * getter; only its reverse is exposed.
     *
     * Throws std::logic_error if the view is not attached.
     */
    std::shared_ptr<Animation> create_animation(const std::vector<const ContainerContent*>& disappearing_contents,
                                                const SDL_Rect& common_frame);

    // Reverse of the cached animation, nullptr if none was created.
    std::shared_ptr<Animation> reverse_animation() const;

    // Detaches the view, unregisters the child and hands ownership back. The
    // handle is empty afterwards.
    std::unique_ptr<ViewController> take_view_controller();

    ViewController* view_controller() const { return view_controller_.get(); }
    ContentContainer* container() const { return container_; }
    TransitionStyle transition_style() const { return transition_style_; }
    double duration() const { return duration_; }
    double resolved_duration() const;
    bool is_view_attached() const { return added_to_container_view_; }
    const View* blocking_view() const { return blocking_view_.get(); }

private:
    void attach(View& container_view, std::size_t index, bool block_interaction);
    void release();

    std::unique_ptr<ViewController> view_controller_;
    ContentContainer*  container_ = nullptr;
    ContainerRegistry* registry_ = nullptr;
    bool               added_to_container_view_ = false;
    std::shared_ptr<View> blocking_view_;
    TransitionStyle    transition_style_ = TransitionStyle::None;
    double             duration_ = kDefaultTransitionDuration;
    std::shared_ptr<Animation> cached_animation_;
    SDL_Rect           original_view_frame_{0, 0, 0, 0};
    float              original_view_opacity_ = 1.0f;
};

}
