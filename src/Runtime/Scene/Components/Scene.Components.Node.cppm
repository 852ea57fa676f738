module;

#include <array>
#include <cstdint>
#include <optional>

export module Scene:Components.Node;
import Graphics;

export namespace Scene::Components::Node
{
    // Local transform. Sizes in pixels, rotation in radians.
    // Pivot is the rotation/scale origin and Mount the anchor point, both as
    // fractions of the node's own box.
    struct Local
    {
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
    };

    struct Appearance
    {
        float Alpha = 1.0f;
        std::array<uint32_t, 4> Colors{}; // TL, TR, BR, BL
        std::optional<uint32_t> FallbackColor;
        Graphics::BlendMode Blend = Graphics::BlendMode::Normal;

        [[nodiscard]] bool HasColor() const
        {
            return Colors[0] != 0 || Colors[1] != 0 || Colors[2] != 0 || Colors[3] != 0;
        }
    };

    struct Flags
    {
        int32_t ZIndex = 0;
        bool ZIndexLocked = false;
        bool Clipping = false;
        bool StrictBounds = false;
        bool Rtt = false;
    };

    // Present only when the node uses a non-default shader.
    struct Shader
    {
        Graphics::ShaderProps Props;
    };

    // Present only while the node holds a texture reference.
    struct Texture
    {
        Graphics::TextureHandle Handle;
        Graphics::TextureDescriptor Descriptor;
    };
}
