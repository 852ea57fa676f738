module;
#include <cstddef>
#include <cstdint>
#include <limits>
#include <functional>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - generational handle, typed by a tag
    // -------------------------------------------------------------------------
    // Index addresses a pool slot, Generation detects reuse of that slot.
    // A handle whose generation no longer matches is "stale": lookups fail
    // instead of aliasing whatever now lives in the slot.
    //
    //   struct TextureTag {};
    //   using TextureHandle = Core::StrongHandle<TextureTag>;
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;
        constexpr StrongHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen) {}

        [[nodiscard]] constexpr bool IsValid() const noexcept { return Index != INVALID_INDEX; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return IsValid(); }

        // Stable 64-bit identity, used when a handle takes part in a batch key.
        [[nodiscard]] constexpr uint64_t Pack() const noexcept
        {
            return (static_cast<uint64_t>(Generation) << 32) | Index;
        }

        auto operator<=>(const StrongHandle&) const = default;
    };
}

namespace std
{
    template <typename Tag>
    struct hash<Core::StrongHandle<Tag>>
    {
        std::size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
        {
            // splitmix64 finalizer
            uint64_t val = h.Pack();
            val = (val ^ (val >> 30)) * 0xbf58476d1ce4e5b9ull;
            val = (val ^ (val >> 27)) * 0x94d049bb133111ebull;
            val ^= val >> 31;
            return static_cast<std::size_t>(val);
        }
    };
}
