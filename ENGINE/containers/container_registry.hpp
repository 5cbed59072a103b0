#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace cradle {

class ViewController;

// Anything that can host view controllers through ContainerContent handles.
class ContentContainer {
public:
    virtual ~ContentContainer() = default;
    virtual std::string container_name() const = 0;
};

// Single source of truth for which container owns which view controller.
// Not thread-safe: it is owned and mutated by the UI thread only.
class ContainerRegistry {
public:
    ContainerRegistry() = default;
    ContainerRegistry(const ContainerRegistry&) = delete;
    ContainerRegistry& operator=(const ContainerRegistry&) = delete;

    // Throws std::logic_error if `child` already belongs to another container.
    void register_child(const ViewController& child, ContentContainer& container);

    // Removes the association only when it still points at `container`.
    bool unregister_child(const ViewController& child, const ContentContainer& container);

    ContentContainer* container_of(const ViewController* child) const;

    std::size_t size() const { return owners_.size(); }
    bool empty() const { return owners_.empty(); }

private:
    std::unordered_map<const ViewController*, ContentContainer*> owners_;
};

}
