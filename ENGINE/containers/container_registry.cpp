#include "containers/container_registry.hpp"

#include <stdexcept>

#include "utils/log.hpp"
#include "view/view_controller.hpp"

namespace cradle {

void ContainerRegistry::register_child(const ViewController& child, ContentContainer& container) {
    auto it = owners_.find(&child);
    if (it != owners_.end()) {
        if (it->second == &container) {
            log::debug("[ContainerRegistry] '" + child.title() + "' already registered with " + container.container_name());
            return;
        }
        const std::string message = "View controller '" + child.title() + "' already belongs to " +
                                    it->second->container_name() + "; cannot insert it into " +
                                    container.container_name();
        log::error("[ContainerRegistry] " + message);
        throw std::logic_error(message);
    }
    owners_.emplace(&child, &container);
}

bool ContainerRegistry::unregister_child(const ViewController& child, const ContentContainer& container) {
    auto it = owners_.find(&child);
    if (it == owners_.end() || it->second != &container) {
        return false;
    }
    owners_.erase(it);
    return true;
}

ContentContainer* ContainerRegistry::container_of(const ViewController* child) const {
    if (!child) {
        return nullptr;
    }
    auto it = owners_.find(child);
    return it == owners_.end() ? nullptr : it->second;
}

}
