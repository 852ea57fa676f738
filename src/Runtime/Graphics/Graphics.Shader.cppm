module;

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:Shader;

export namespace Graphics
{
    // Closed set of quad shaders. The alternative index of ShaderProps equals the kind.
    enum class ShaderKind : uint8_t
    {
        Default = 0,
        Rounded,
        Border,
        Shadow,
        LinearGradient,
        RadialGradient,
        HolePunch
    };

    [[nodiscard]] std::string_view ShaderKindToString(ShaderKind kind);

    struct DefaultProps
    {
        bool operator==(const DefaultProps&) const = default;
    };

    // Corner radii: top-left, top-right, bottom-right, bottom-left.
    struct RoundedProps
    {
        glm::vec4 Radius{0.0f};
        bool operator==(const RoundedProps&) const = default;
    };

    // Border widths: top, right, bottom, left.
    struct BorderProps
    {
        glm::vec4 Width{0.0f};
        uint32_t Color = 0xffffffffu;
        float Gap = 0.0f;
        bool operator==(const BorderProps&) const = default;
    };

    struct ShadowProps
    {
        uint32_t Color = 0x000000ffu;
        glm::vec2 Offset{0.0f};
        float Blur = 10.0f;
        float Spread = 0.0f;
        bool operator==(const ShadowProps&) const = default;
    };

    // Stops are normalized positions in [0,1]; empty means evenly spaced.
    struct LinearGradientProps
    {
        std::vector<uint32_t> Colors{0x000000ffu, 0xffffffffu};
        std::vector<float> Stops;
        float Angle = 0.0f;
        bool operator==(const LinearGradientProps&) const = default;
    };

    // Size of zero means "use the node size".
    struct RadialGradientProps
    {
        std::vector<uint32_t> Colors{0x000000ffu, 0xffffffffu};
        std::vector<float> Stops;
        glm::vec2 Pivot{0.5f, 0.5f};
        glm::vec2 Size{0.0f};
        bool operator==(const RadialGradientProps&) const = default;
    };

    struct HolePunchProps
    {
        glm::vec2 Position{0.0f};
        glm::vec2 Size{0.0f};
        glm::vec4 Radius{0.0f};
        bool operator==(const HolePunchProps&) const = default;
    };

    using ShaderProps = std::variant<DefaultProps, RoundedProps, BorderProps, ShadowProps,
                                     LinearGradientProps, RadialGradientProps, HolePunchProps>;

    [[nodiscard]] inline ShaderKind KindOf(const ShaderProps& props)
    {
        return static_cast<ShaderKind>(props.index());
    }

    // Identity of a resolved shader for batching: same kind and same uniforms.
    struct ShaderKey
    {
        ShaderKind Kind = ShaderKind::Default;
        uint64_t PropsHash = 0;

        bool operator==(const ShaderKey&) const = default;
    };

    // Fills defaults and clamps every field against the node size so that the
    // result is a valid uniform block. Non-finite inputs fall back to defaults.
    [[nodiscard]] ShaderProps ResolveShader(const ShaderProps& props, glm::vec2 nodeSize);

    // Expects resolved props.
    [[nodiscard]] ShaderKey MakeShaderKey(const ShaderProps& resolved);

    [[nodiscard]] ShaderProps DefaultShaderProps(ShaderKind kind);
}
