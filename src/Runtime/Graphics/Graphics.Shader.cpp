module;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

module Graphics:Shader.Impl;
import :Shader;
import Core;

namespace Graphics
{
    namespace
    {
        float Finite(float v, float fallback)
        {
            return std::isfinite(v) ? v : fallback;
        }

        float NonNegative(float v)
        {
            return std::max(0.0f, Finite(v, 0.0f));
        }

        glm::vec2 NonNegative(glm::vec2 v)
        {
            return {NonNegative(v.x), NonNegative(v.y)};
        }

        glm::vec4 NonNegative(glm::vec4 v)
        {
            return {NonNegative(v.x), NonNegative(v.y), NonNegative(v.z), NonNegative(v.w)};
        }

        glm::vec4 ClampRadius(glm::vec4 radius, glm::vec2 size)
        {
            const float maxRadius = std::min(size.x, size.y) * 0.5f;
            return glm::min(NonNegative(radius), glm::vec4(maxRadius));
        }

        // Gradient stops: evenly spaced when missing or mismatched, otherwise
        // clamped to [0,1] and forced monotonic.
        void ResolveStops(std::vector<uint32_t>& colors, std::vector<float>& stops)
        {
            if (colors.empty()) colors = {0x000000ffu, 0xffffffffu};
            if (colors.size() == 1) colors.push_back(colors.front());

            if (stops.size() != colors.size())
            {
                stops.resize(colors.size());
                const float step = 1.0f / static_cast<float>(colors.size() - 1);
                for (size_t i = 0; i < stops.size(); ++i)
                    stops[i] = step * static_cast<float>(i);
                return;
            }

            float previous = 0.0f;
            for (float& s : stops)
            {
                s = std::clamp(Finite(s, previous), 0.0f, 1.0f);
                s = std::max(s, previous);
                previous = s;
            }
        }

        // --- Per-kind resolve ------------------------------------------------

        DefaultProps Resolve(const DefaultProps& p, glm::vec2) { return p; }

        RoundedProps Resolve(RoundedProps p, glm::vec2 size)
        {
            p.Radius = ClampRadius(p.Radius, size);
            return p;
        }

        BorderProps Resolve(BorderProps p, glm::vec2 size)
        {
            p.Width = glm::min(NonNegative(p.Width), glm::vec4(size.y, size.x, size.y, size.x));
            p.Gap = NonNegative(p.Gap);
            return p;
        }

        ShadowProps Resolve(ShadowProps p, glm::vec2)
        {
            p.Offset = {Finite(p.Offset.x, 0.0f), Finite(p.Offset.y, 0.0f)};
            p.Blur = NonNegative(p.Blur);
            p.Spread = Finite(p.Spread, 0.0f);
            return p;
        }

        LinearGradientProps Resolve(LinearGradientProps p, glm::vec2)
        {
            ResolveStops(p.Colors, p.Stops);
            p.Angle = Finite(p.Angle, 0.0f);
            return p;
        }

        RadialGradientProps Resolve(RadialGradientProps p, glm::vec2 size)
        {
            ResolveStops(p.Colors, p.Stops);
            p.Pivot = {Finite(p.Pivot.x, 0.5f), Finite(p.Pivot.y, 0.5f)};
            p.Size = NonNegative(p.Size);
            if (p.Size.x == 0.0f) p.Size.x = size.x;
            if (p.Size.y == 0.0f) p.Size.y = size.y;
            return p;
        }

        HolePunchProps Resolve(HolePunchProps p, glm::vec2)
        {
            p.Position = {Finite(p.Position.x, 0.0f), Finite(p.Position.y, 0.0f)};
            p.Size = NonNegative(p.Size);
            p.Radius = ClampRadius(p.Radius, p.Size);
            return p;
        }

        // --- Per-kind hash ---------------------------------------------------

        uint64_t HashList(uint64_t seed, const std::vector<uint32_t>& colors, const std::vector<float>& stops)
        {
            for (uint32_t c : colors) seed = Core::Hash::Combine(seed, c);
            for (float s : stops) seed = Core::Hash::Combine(seed, Core::Hash::HashFloat(s));
            return seed;
        }

        uint64_t Hash(const DefaultProps&) { return 0; }

        uint64_t Hash(const RoundedProps& p)
        {
            return Core::Hash::HashValues(p.Radius.x, p.Radius.y, p.Radius.z, p.Radius.w);
        }

        uint64_t Hash(const BorderProps& p)
        {
            return Core::Hash::HashValues(p.Width.x, p.Width.y, p.Width.z, p.Width.w, p.Color, p.Gap);
        }

        uint64_t Hash(const ShadowProps& p)
        {
            return Core::Hash::HashValues(p.Color, p.Offset.x, p.Offset.y, p.Blur, p.Spread);
        }

        uint64_t Hash(const LinearGradientProps& p)
        {
            return HashList(Core::Hash::HashValues(p.Angle), p.Colors, p.Stops);
        }

        uint64_t Hash(const RadialGradientProps& p)
        {
            return HashList(Core::Hash::HashValues(p.Pivot.x, p.Pivot.y, p.Size.x, p.Size.y), p.Colors, p.Stops);
        }

        uint64_t Hash(const HolePunchProps& p)
        {
            return Core::Hash::HashValues(p.Position.x, p.Position.y, p.Size.x, p.Size.y,
                                          p.Radius.x, p.Radius.y, p.Radius.z, p.Radius.w);
        }
    }

    std::string_view ShaderKindToString(ShaderKind kind)
    {
        switch (kind)
        {
        case ShaderKind::Default:        return "Default";
        case ShaderKind::Rounded:        return "Rounded";
        case ShaderKind::Border:         return "Border";
        case ShaderKind::Shadow:         return "Shadow";
        case ShaderKind::LinearGradient: return "LinearGradient";
        case ShaderKind::RadialGradient: return "RadialGradient";
        case ShaderKind::HolePunch:      return "HolePunch";
        }
        return "Unknown";
    }

    ShaderProps ResolveShader(const ShaderProps& props, glm::vec2 nodeSize)
    {
        return std::visit([nodeSize](const auto& p) -> ShaderProps { return Resolve(p, nodeSize); }, props);
    }

    ShaderKey MakeShaderKey(const ShaderProps& resolved)
    {
        return {KindOf(resolved), std::visit([](const auto& p) { return Hash(p); }, resolved)};
    }

    ShaderProps DefaultShaderProps(ShaderKind kind)
    {
        switch (kind)
        {
        case ShaderKind::Default:        return DefaultProps{};
        case ShaderKind::Rounded:        return RoundedProps{};
        case ShaderKind::Border:         return BorderProps{};
        case ShaderKind::Shadow:         return ShadowProps{};
        case ShaderKind::LinearGradient: return LinearGradientProps{};
        case ShaderKind::RadialGradient: return RadialGradientProps{};
        case ShaderKind::HolePunch:      return HolePunchProps{};
        }
        return DefaultProps{};
    }
}
