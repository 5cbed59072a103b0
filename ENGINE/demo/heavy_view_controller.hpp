#pragma once

#include <SDL.h>

#include <functional>
#include <memory>
#include <string>

#include "view/view_controller.hpp"

namespace cradle::demo {

// Controller whose view is slow to build. Used to show that a stack only
// builds the views it is about to display.
class HeavyViewController : public ViewController {
public:
    using TapHandler = std::function<void(Uint8 button)>;

    explicit HeavyViewController(std::string title, TapHandler on_tap = {});

    void view_did_appear(bool animated) override;

protected:
    std::shared_ptr<View> load_view() override;
    void view_did_load() override;
    void view_did_unload() override;

private:
    TapHandler on_tap_{};
};

}
