module;
#include <bit>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <type_traits>

export module Core:Hash;

export namespace Core::Hash
{
    // FNV-1a, 32 bit
    constexpr uint32_t HashString(std::string_view str)
    {
        uint32_t hash = 2166136261u;
        for (char c : str)
        {
            hash ^= static_cast<uint8_t>(c);
            hash *= 16777619u;
        }
        return hash;
    }

    // FNV-1a, 64 bit. Used for content keys (texture descriptors, shader props).
    constexpr uint64_t HashString64(std::string_view str, uint64_t seed = 14695981039346656037ull)
    {
        uint64_t hash = seed;
        for (char c : str)
        {
            hash ^= static_cast<uint8_t>(c);
            hash *= 1099511628211ull;
        }
        return hash;
    }

    // boost-style combine, widened to 64 bit
    constexpr uint64_t Combine(uint64_t seed, uint64_t value)
    {
        return seed ^ (value + 0x9e3779b97f4a7c15ull + (seed << 12) + (seed >> 4));
    }

    // Floats hash by bit pattern; -0.0f is folded onto +0.0f so equal values hash equally.
    constexpr uint64_t HashFloat(float v)
    {
        if (v == 0.0f) v = 0.0f;
        return std::bit_cast<uint32_t>(v);
    }

    template <typename... Ts>
    constexpr uint64_t HashValues(const Ts&... values)
    {
        uint64_t seed = 14695981039346656037ull;
        auto mix = [&seed](const auto& v)
        {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_floating_point_v<V>)
                seed = Combine(seed, HashFloat(static_cast<float>(v)));
            else
                seed = Combine(seed, static_cast<uint64_t>(v));
        };
        (mix(values), ...);
        return seed;
    }
}
