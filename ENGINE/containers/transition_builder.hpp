#pragma once

#include <SDL.h>

#include <memory>
#include <vector>

#include "animation/animation.hpp"

namespace cradle {

class ContainerContent;

// Produces the forward animation bringing `appearing` on screen while the
// views of `disappearing` are concealed. Offsets are measured against
// `common_frame`, the area shared by all involved views. Start states are
// read from the views when build() runs.
class TransitionAnimationBuilder {
public:
    std::shared_ptr<Animation> build(const ContainerContent& appearing,
                                     const std::vector<const ContainerContent*>& disappearing,
                                     const SDL_Rect& common_frame) const;
};

}
