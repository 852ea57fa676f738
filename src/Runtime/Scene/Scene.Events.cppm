module;

#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>
#include <entt/entity/registry.hpp>

export module Scene:Events;
import :Properties;
import Core;

export namespace Scene
{
    enum class NodeEvent : uint8_t
    {
        Loaded,        // texture became resident
        Failed,        // texture decode or allocation failed, Error says why
        Freed,         // texture was unloaded while the node held it
        InViewport,
        OutOfViewport,
        InBounds,
        OutOfBounds
    };

    [[nodiscard]] constexpr std::string_view NodeEventToString(NodeEvent e)
    {
        switch (e)
        {
        case NodeEvent::Loaded:        return "loaded";
        case NodeEvent::Failed:        return "failed";
        case NodeEvent::Freed:         return "freed";
        case NodeEvent::InViewport:    return "inViewport";
        case NodeEvent::OutOfViewport: return "outOfViewport";
        case NodeEvent::InBounds:      return "inBounds";
        case NodeEvent::OutOfBounds:   return "outOfBounds";
        }
        return "unknown";
    }

    struct NodeEventArgs
    {
        NodeId Node = NullNode;
        NodeEvent Event = NodeEvent::Loaded;
        Core::ErrorCode Error = Core::ErrorCode::Success;
    };

    using NodeListener = std::function<void(const NodeEventArgs&)>;
    using ListenerId = uint32_t;
}

export namespace Scene::Components::Events
{
    struct Listeners
    {
        struct Entry
        {
            ListenerId Id;
            NodeEvent Event;
            NodeListener Callback;
        };
        std::vector<Entry> Entries;
    };
}
