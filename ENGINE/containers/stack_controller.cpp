#include "containers/stack_controller.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include "utils/log.hpp"

namespace cradle {

namespace {
constexpr SDL_Color kStackBackground{24, 24, 28, 255};

bool is_pointer_event(const SDL_Event& e) {
    return e.type == SDL_MOUSEBUTTONDOWN || e.type == SDL_MOUSEBUTTONUP ||
           e.type == SDL_MOUSEMOTION || e.type == SDL_MOUSEWHEEL;
}
}

StackController::StackController(ContainerRegistry& registry,
                                 Animator& animator,
                                 std::unique_ptr<ViewController> root,
                                 std::size_t capacity,
                                 std::string title)
: ViewController(std::move(title)),
  registry_(registry),
  animator_(animator),
  capacity_(std::max<std::size_t>(1, capacity)) {
    if (capacity == 0) {
        log::warn("[StackController] Capacity must be at least 1; using 1");
    }
    contents_.emplace_back(std::move(root), *this, registry_, TransitionStyle::None, 0.0);
}

StackController::~StackController() {
    for (const auto& tag : pending_tags_) {
        animator_.cancel(tag);
    }
}

std::string StackController::container_name() const {
    return "StackController '" + title() + "'";
}

std::shared_ptr<View> StackController::load_view() {
    auto view = View::create(initial_frame_, title());
    view->set_background(kStackBackground);
    return view;
}

void StackController::view_did_load() {
    const std::size_t first = first_attached_index();
    for (std::size_t i = contents_.size(); i-- > first;) {
        attach_content(i, 0);
    }
    const SDL_Rect bounds = view_if_loaded()->bounds();
    refresh_transitions(&bounds);
}

std::size_t StackController::first_attached_index() const {
    return contents_.size() > capacity_ ? contents_.size() - capacity_ : 0;
}

void StackController::attach_content(std::size_t index, std::size_t z_index) {
    const std::shared_ptr<View>& host = view_if_loaded();
    ContainerContent& content = contents_[index];
    if (!host || content.is_view_attached()) {
        return;
    }
    content.insert_view_into_container_view(*host, z_index, index > 0);
    content.view()->set_frame(host->bounds());
}

// Every attached child above the lowest one conceals the child right below it.
// Concealments are undone top-down, then rebuilt bottom-up against the current
// bounds so that each animation starts from unconcealed views.
void StackController::refresh_transitions(const SDL_Rect* new_bounds) {
    const std::shared_ptr<View>& host = view_if_loaded();
    if (!host || contents_.empty()) {
        return;
    }
    const std::size_t first = first_attached_index();
    for (std::size_t i = contents_.size() - 1; i > first; --i) {
        if (!contents_[i].is_view_attached()) {
            continue;
        }
        if (auto undo = contents_[i].reverse_animation()) {
            undo->apply_end_state();
        }
    }
    if (new_bounds) {
        for (std::size_t i = first; i < contents_.size(); ++i) {
            if (auto view = contents_[i].view()) {
                view->set_frame(*new_bounds);
            }
        }
    }
    const SDL_Rect bounds = host->bounds();
    for (std::size_t i = first + 1; i < contents_.size(); ++i) {
        ContainerContent& content = contents_[i];
        const ContainerContent& below = contents_[i - 1];
        if (!content.is_view_attached() || !below.is_view_attached()) {
            continue;
        }
        content.create_animation({&below}, bounds)->apply_end_state();
    }
}

void StackController::fill_capacity() {
    const std::shared_ptr<View>& host = view_if_loaded();
    if (!host) {
        return;
    }
    bool attached_any = false;
    for (std::size_t i = contents_.size(); i-- > first_attached_index();) {
        if (contents_[i].is_view_attached()) {
            continue;
        }
        std::size_t z_index = host->subviews().size();
        if (i + 1 < contents_.size()) {
            const ContainerContent& above = contents_[i + 1];
            const View* lowest = above.blocking_view() ? above.blocking_view() : above.view().get();
            if (lowest && lowest->index_in_superview() >= 0) {
                z_index = static_cast<std::size_t>(lowest->index_in_superview());
            }
        }
        attach_content(i, z_index);
        attached_any = true;
    }
    if (attached_any) {
        refresh_transitions(nullptr);
    }
}

void StackController::enforce_capacity() {
    const std::size_t first = first_attached_index();
    for (std::size_t i = 0; i < first; ++i) {
        if (contents_[i].is_view_attached()) {
            contents_[i].release_view();
        }
    }
}

void StackController::push(std::unique_ptr<ViewController> view_controller,
                           TransitionStyle style,
                           double duration,
                           bool animated) {
    finish_pending_transitions();
    contents_.emplace_back(std::move(view_controller), *this, registry_, style, duration);

    const std::shared_ptr<View>& host = view_if_loaded();
    if (!host) {
        return;
    }

    const std::size_t index = contents_.size() - 1;
    attach_content(index, host->subviews().size());
    ContainerContent& appearing = contents_[index];
    const ContainerContent& disappearing = contents_[index - 1];

    std::vector<const ContainerContent*> peers;
    if (disappearing.is_view_attached()) {
        peers.push_back(&disappearing);
    }
    auto animation = appearing.create_animation(peers, host->bounds());
    animation->set_tag(next_animation_tag("push"));
    animation->set_lock_ui(true);

    ViewController* appearing_vc = appearing.view_controller();
    ViewController* disappearing_vc = disappearing.view_controller();
    std::weak_ptr<int> alive = lifetime_token_;
    animation->set_on_will_start([alive, appearing_vc, disappearing_vc](const Animation&, bool anim) {
        if (alive.expired()) return;
        disappearing_vc->view_will_disappear(anim);
        appearing_vc->view_will_appear(anim);
    });
    animation->set_on_did_stop([this, alive, appearing_vc, disappearing_vc](const Animation& a, bool anim) {
        if (alive.expired()) return;
        disappearing_vc->view_did_disappear(anim);
        appearing_vc->view_did_appear(anim);
        forget_tag(a.tag());
        enforce_capacity();
    });

    log::debug("[StackController] Pushing '" + appearing_vc->title() + "' with " +
               transition_style_name(style));
    animator_.play(std::move(animation), animated);
}

void StackController::pop(bool animated) {
    finish_pending_transitions();
    if (contents_.size() <= 1) {
        log::warn("[StackController] The root view controller of " + container_name() + " cannot be popped");
        return;
    }

    dismissing_.push_back(std::move(contents_.back()));
    contents_.pop_back();
    ContainerContent& dismissed = dismissing_.back();
    ViewController* dismissed_vc = dismissed.view_controller();

    const std::shared_ptr<View>& host = view_if_loaded();
    if (!host || !dismissed.is_view_attached()) {
        finish_dismissal(dismissed_vc);
        return;
    }

    ContainerContent& revealed = contents_.back();
    ViewController* revealed_vc = revealed.view_controller();
    const bool reattached = !revealed.is_view_attached();
    if (reattached) {
        const View* lowest = dismissed.blocking_view() ? dismissed.blocking_view() : dismissed.view().get();
        attach_content(contents_.size() - 1, static_cast<std::size_t>(std::max(0, lowest->index_in_superview())));
    }

    if (reattached || !dismissed.reverse_animation()) {
        if (auto stale = dismissed.reverse_animation()) {
            stale->apply_end_state();
        }
        dismissed.create_animation({&revealed}, host->bounds())->apply_end_state();
    }

    auto animation = dismissed.reverse_animation();
    animation->set_tag(next_animation_tag("pop"));
    animation->set_lock_ui(true);
    animation->set_on_step_finished(nullptr);

    std::weak_ptr<int> alive = lifetime_token_;
    animation->set_on_will_start([alive, dismissed_vc, revealed_vc](const Animation&, bool anim) {
        if (alive.expired()) return;
        dismissed_vc->view_will_disappear(anim);
        revealed_vc->view_will_appear(anim);
    });
    animation->set_on_did_stop([this, alive, dismissed_vc, revealed_vc](const Animation& a, bool anim) {
        if (alive.expired()) return;
        dismissed_vc->view_did_disappear(anim);
        revealed_vc->view_did_appear(anim);
        forget_tag(a.tag());
        finish_dismissal(dismissed_vc);
        fill_capacity();
    });

    log::debug("[StackController] Popping '" + dismissed_vc->title() + "'");
    animator_.play(std::move(animation), animated);
}

void StackController::finish_dismissal(const ViewController* view_controller) {
    auto it = std::find_if(dismissing_.begin(), dismissing_.end(),
                           [view_controller](const ContainerContent& c) { return c.view_controller() == view_controller; });
    if (it == dismissing_.end()) {
        return;
    }
    ContainerContent content = std::move(*it);
    dismissing_.erase(it);
    if (pop_handler_) {
        pop_handler_(content.take_view_controller());
    }
}

void StackController::finish_pending_transitions() {
    const std::vector<std::string> tags = pending_tags_;
    for (const auto& tag : tags) {
        animator_.finish(tag);
    }
}

std::string StackController::next_animation_tag(const char* action) {
    std::string tag = "stack:" + title() + ":" + action + ":" + std::to_string(++animation_counter_);
    pending_tags_.push_back(tag);
    return tag;
}

void StackController::forget_tag(const std::string& tag) {
    pending_tags_.erase(std::remove(pending_tags_.begin(), pending_tags_.end(), tag), pending_tags_.end());
}

ViewController* StackController::root_view_controller() const {
    return contents_.empty() ? nullptr : contents_.front().view_controller();
}

ViewController* StackController::top_view_controller() const {
    return contents_.empty() ? nullptr : contents_.back().view_controller();
}

std::vector<ViewController*> StackController::view_controllers() const {
    std::vector<ViewController*> result;
    result.reserve(contents_.size());
    for (const auto& content : contents_) {
        result.push_back(content.view_controller());
    }
    return result;
}

void StackController::set_frame(const SDL_Rect& frame) {
    const std::shared_ptr<View>& host = view_if_loaded();
    if (!host) {
        initial_frame_ = frame;
        return;
    }
    finish_pending_transitions();
    host->set_frame(frame);
    const SDL_Rect bounds = host->bounds();
    refresh_transitions(&bounds);
}

bool StackController::handle_event(const SDL_Event& e) {
    if (!is_pointer_event(e)) {
        return false;
    }
    if (animator_.is_locking_ui()) {
        return true;
    }
    const std::shared_ptr<View>& host = view_if_loaded();
    return host ? host->dispatch_event(e) : false;
}

void StackController::view_will_appear(bool animated) {
    if (ViewController* top = top_view_controller()) top->view_will_appear(animated);
}

void StackController::view_did_appear(bool animated) {
    if (ViewController* top = top_view_controller()) top->view_did_appear(animated);
}

void StackController::view_will_disappear(bool animated) {
    if (ViewController* top = top_view_controller()) top->view_will_disappear(animated);
}

void StackController::view_did_disappear(bool animated) {
    if (ViewController* top = top_view_controller()) top->view_did_disappear(animated);
}

}
