module;

#include <cstdint>
#include <glm/glm.hpp>

export module Graphics:Color;

// =============================================================================
// Color packing used across the scene graph and the batcher.
//
// Convention: 0xRRGGBBAA, straight (non-premultiplied) alpha.
//   0xff0000ff -> opaque red
//   0x00000000 -> transparent, which means "no color" for quad eligibility
// Quads carry premultiplied colors; the node's effective alpha is folded in.
// =============================================================================

export namespace Graphics::Color
{
    constexpr uint32_t Transparent = 0x00000000u;
    constexpr uint32_t White = 0xffffffffu;
    constexpr uint32_t Black = 0x000000ffu;

    [[nodiscard]] constexpr uint32_t Pack(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) noexcept
    {
        return (static_cast<uint32_t>(r) << 24)
             | (static_cast<uint32_t>(g) << 16)
             | (static_cast<uint32_t>(b) << 8)
             | static_cast<uint32_t>(a);
    }

    [[nodiscard]] constexpr uint32_t PackF(float r, float g, float b, float a = 1.0f) noexcept
    {
        auto clamp = [](float v) noexcept -> uint8_t {
            if (!(v > 0.0f)) return 0; // also catches NaN
            if (v >= 1.0f) return 255;
            return static_cast<uint8_t>(v * 255.0f + 0.5f);
        };
        return Pack(clamp(r), clamp(g), clamp(b), clamp(a));
    }

    [[nodiscard]] constexpr uint8_t AlphaOf(uint32_t rgba) noexcept
    {
        return static_cast<uint8_t>(rgba & 0xffu);
    }

    [[nodiscard]] inline glm::vec4 Unpack(uint32_t rgba) noexcept
    {
        return glm::vec4(static_cast<float>((rgba >> 24) & 0xffu),
                         static_cast<float>((rgba >> 16) & 0xffu),
                         static_cast<float>((rgba >> 8) & 0xffu),
                         static_cast<float>(rgba & 0xffu)) / 255.0f;
    }

    // rgb scaled by (a * alpha), a scaled by alpha, repacked.
    [[nodiscard]] inline uint32_t Premultiply(uint32_t rgba, float alpha) noexcept
    {
        const glm::vec4 c = Unpack(rgba);
        const float a = c.a * alpha;
        return PackF(c.r * a, c.g * a, c.b * a, a);
    }
}
