module;
#include <cstdint>
#include <string_view>

export module Scene:Components.Visibility;

export namespace Scene::Components::Visibility
{
    // Unknown until the first classification, so the first real state is a
    // transition and fires its event.
    enum class ViewportState : uint8_t
    {
        Unknown,
        InViewport,
        OutOfViewport
    };

    enum class BoundsState : uint8_t
    {
        Unknown,
        InBounds,
        OutOfBounds
    };

    struct Component
    {
        ViewportState Viewport = ViewportState::Unknown;
        BoundsState Bounds = BoundsState::Unknown;
    };

    [[nodiscard]] constexpr std::string_view ToString(ViewportState s)
    {
        switch (s)
        {
        case ViewportState::Unknown:       return "Unknown";
        case ViewportState::InViewport:    return "InViewport";
        case ViewportState::OutOfViewport: return "OutOfViewport";
        }
        return "Unknown";
    }

    [[nodiscard]] constexpr std::string_view ToString(BoundsState s)
    {
        switch (s)
        {
        case BoundsState::Unknown:     return "Unknown";
        case BoundsState::InBounds:    return "InBounds";
        case BoundsState::OutOfBounds: return "OutOfBounds";
        }
        return "Unknown";
    }
}
