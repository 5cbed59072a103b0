#pragma once

#include <SDL.h>

#include <memory>
#include <string>
#include <utility>

#include "view/view.hpp"

namespace cradle {

// A presentation unit owning a lazily created view. view() loads the view on
// first access; view_if_loaded() never does.
class ViewController {
public:
    explicit ViewController(std::string title = {});
    virtual ~ViewController();

    ViewController(const ViewController&) = delete;
    ViewController& operator=(const ViewController&) = delete;

    const std::shared_ptr<View>& view();
    const std::shared_ptr<View>& view_if_loaded() const { return view_; }
    bool is_view_loaded() const { return static_cast<bool>(view_); }

    // Drops the view when nothing displays it. Returns false if the view is
    // still inserted in a superview.
    bool release_view();

    const std::string& title() const { return title_; }
    void set_title(std::string title) { title_ = std::move(title); }

    int view_load_count() const { return view_load_count_; }

    virtual void view_will_appear(bool animated);
    virtual void view_did_appear(bool animated);
    virtual void view_will_disappear(bool animated);
    virtual void view_did_disappear(bool animated);

protected:
    virtual std::shared_ptr<View> load_view();
    virtual void view_did_load() {}
    virtual void view_did_unload() {}

private:
    std::string title_;
    std::shared_ptr<View> view_;
    int view_load_count_ = 0;
};

}
