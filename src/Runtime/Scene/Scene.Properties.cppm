module;

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <entt/entity/registry.hpp>

export module Scene:Properties;
import Graphics;

export namespace Scene
{
    using NodeId = entt::entity;
    constexpr NodeId NullNode = entt::null;

    // Scalar node properties settable through SceneGraph::SetProperty.
    // Texture and shader are reference-valued and have their own setters.
    enum class Property : uint8_t
    {
        // Transform (float)
        X, Y, Width, Height,
        ScaleX, ScaleY, Scale,
        Rotation,            // radians
        PivotX, PivotY, Pivot,
        MountX, MountY, Mount,

        // Appearance
        Alpha,               // float, clamped to [0,1]
        Color,               // uint32_t 0xRRGGBBAA, all four corners
        ColorTop, ColorBottom, ColorLeft, ColorRight,
        ColorTl, ColorTr, ColorBr, ColorBl,
        FallbackColor,       // uint32_t, used when the texture failed
        Blend,               // Graphics::BlendMode

        // Ordering
        ZIndex,              // int32_t
        ZIndexLocked,        // bool

        // Flags (bool)
        Clipping,
        StrictBounds,
        Rtt
    };

    [[nodiscard]] constexpr std::string_view PropertyToString(Property p)
    {
        switch (p)
        {
        case Property::X:             return "x";
        case Property::Y:             return "y";
        case Property::Width:         return "width";
        case Property::Height:        return "height";
        case Property::ScaleX:        return "scaleX";
        case Property::ScaleY:        return "scaleY";
        case Property::Scale:         return "scale";
        case Property::Rotation:      return "rotation";
        case Property::PivotX:        return "pivotX";
        case Property::PivotY:        return "pivotY";
        case Property::Pivot:         return "pivot";
        case Property::MountX:        return "mountX";
        case Property::MountY:        return "mountY";
        case Property::Mount:         return "mount";
        case Property::Alpha:         return "alpha";
        case Property::Color:         return "color";
        case Property::ColorTop:      return "colorTop";
        case Property::ColorBottom:   return "colorBottom";
        case Property::ColorLeft:     return "colorLeft";
        case Property::ColorRight:    return "colorRight";
        case Property::ColorTl:       return "colorTl";
        case Property::ColorTr:       return "colorTr";
        case Property::ColorBr:       return "colorBr";
        case Property::ColorBl:       return "colorBl";
        case Property::FallbackColor: return "fallbackColor";
        case Property::Blend:         return "blend";
        case Property::ZIndex:        return "zIndex";
        case Property::ZIndexLocked:  return "zIndexLocked";
        case Property::Clipping:      return "clipping";
        case Property::StrictBounds:  return "strictBounds";
        case Property::Rtt:           return "rtt";
        }
        return "unknown";
    }

    using PropertyValue = std::variant<float, int32_t, uint32_t, bool, Graphics::BlendMode>;

    // Initial state of a node. Values go through the same validation as SetProperty.
    struct NodeProps
    {
        NodeId Parent = NullNode; // NullNode attaches to the root

        float X = 0.0f;
        float Y = 0.0f;
        float Width = 0.0f;
        float Height = 0.0f;
        float ScaleX = 1.0f;
        float ScaleY = 1.0f;
        float Rotation = 0.0f;
        float PivotX = 0.5f;
        float PivotY = 0.5f;
        float MountX = 0.0f;
        float MountY = 0.0f;

        float Alpha = 1.0f;
        uint32_t ColorTl = 0;
        uint32_t ColorTr = 0;
        uint32_t ColorBr = 0;
        uint32_t ColorBl = 0;
        std::optional<uint32_t> FallbackColor;
        Graphics::BlendMode Blend = Graphics::BlendMode::Normal;

        int32_t ZIndex = 0;
        bool ZIndexLocked = false;

        bool Clipping = false;
        bool StrictBounds = false;
        bool Rtt = false;

        std::optional<Graphics::TextureDescriptor> Texture;
        Graphics::ShaderProps Shader = Graphics::DefaultProps{};

        NodeProps& SetColor(uint32_t rgba)
        {
            ColorTl = ColorTr = ColorBr = ColorBl = rgba;
            return *this;
        }
    };
}
