#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "animation/animation.hpp"

namespace cradle {

// Plays animations against a frame clock. The animator keeps every running
// animation and the views it animates alive until it stops.
class Animator {
public:
    void play(std::shared_ptr<Animation> animation, bool animated = true);
    void tick(float dt);

    // Jumps every running animation to its end, firing the remaining callbacks.
    void finish_all();

    // Jumps the animations tagged `tag` to their end, firing the remaining callbacks.
    bool finish(const std::string& tag);

    // Jumps the animations tagged `tag` to their end state without callbacks.
    bool cancel(const std::string& tag);

    bool is_running(const std::string& tag) const;
    std::size_t running_count() const { return running_.size(); }
    bool is_locking_ui() const;

private:
    struct Run {
        std::shared_ptr<Animation> animation;
        std::vector<std::shared_ptr<View>> pinned_views;
        std::size_t step_index = 0;
        double      elapsed = 0.0;
    };

    // Returns true once the run has finished every step.
    static bool advance(Run& run, double dt);
    static void complete(Run& run);

    std::vector<Run> running_;
};

}
