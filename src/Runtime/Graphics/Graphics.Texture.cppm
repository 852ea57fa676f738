module;

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:Texture;
import Core;

export namespace Graphics
{
    struct TextureTag {};
    using TextureHandle = Core::StrongHandle<TextureTag>;

    enum class TextureKind : uint8_t
    {
        Image,      // decoded by the asset collaborator from Source
        Color,      // solid fill, synthesized
        Noise,      // grayscale noise seeded from Source, synthesized
        SubTexture  // region of Parent, samples the parent's pixels
    };

    // Pixel rectangle inside a parent texture. A zero extent runs to the
    // parent's right / bottom edge.
    struct TextureRegion
    {
        uint32_t X = 0;
        uint32_t Y = 0;
        uint32_t Width = 0;
        uint32_t Height = 0;

        bool operator==(const TextureRegion&) const = default;
    };

    // Freed is terminal for a texture instance. Re-requesting the descriptor
    // afterwards yields a new instance with a new handle.
    enum class TextureState : uint8_t
    {
        Pending,
        Loaded,
        Failed,
        Freed
    };

    [[nodiscard]] constexpr std::string_view TextureStateToString(TextureState state)
    {
        switch (state)
        {
        case TextureState::Pending: return "Pending";
        case TextureState::Loaded:  return "Loaded";
        case TextureState::Failed:  return "Failed";
        case TextureState::Freed:   return "Freed";
        }
        return "Unknown";
    }

    // Content address of a texture. Two descriptors that compare equal share one
    // resident texture. PreventCleanup is a residency hint, not part of the key.
    struct TextureDescriptor
    {
        TextureKind Kind = TextureKind::Image;
        std::string Source;
        uint32_t Color = 0xffffffffu;
        uint32_t Width = 0;  // 0 = natural size
        uint32_t Height = 0;
        bool Premultiply = true;
        bool PreventCleanup = false;

        // SubTexture only
        std::shared_ptr<const TextureDescriptor> Parent;
        TextureRegion Region;

        static TextureDescriptor Image(std::string source)
        {
            TextureDescriptor d;
            d.Kind = TextureKind::Image;
            d.Source = std::move(source);
            return d;
        }

        static TextureDescriptor SolidColor(uint32_t rgba, uint32_t width = 1, uint32_t height = 1)
        {
            TextureDescriptor d;
            d.Kind = TextureKind::Color;
            d.Color = rgba;
            d.Width = width;
            d.Height = height;
            return d;
        }

        static TextureDescriptor Noise(std::string seed, uint32_t width, uint32_t height)
        {
            TextureDescriptor d;
            d.Kind = TextureKind::Noise;
            d.Source = std::move(seed);
            d.Width = width;
            d.Height = height;
            return d;
        }

        // Sprite-sheet frame. Holds a reference on the parent texture while acquired.
        static TextureDescriptor Sub(TextureDescriptor parent, TextureRegion region)
        {
            TextureDescriptor d;
            d.Kind = TextureKind::SubTexture;
            d.Source = parent.Source;
            d.Parent = std::make_shared<const TextureDescriptor>(std::move(parent));
            d.Region = region;
            return d;
        }

        [[nodiscard]] bool operator==(const TextureDescriptor& o) const
        {
            const bool sameParent = Parent == o.Parent || (Parent && o.Parent && *Parent == *o.Parent);
            return Kind == o.Kind && Source == o.Source && Color == o.Color &&
                   Width == o.Width && Height == o.Height && Premultiply == o.Premultiply &&
                   Region == o.Region && sameParent;
        }
    };

    struct TextureDescriptorHash
    {
        size_t operator()(const TextureDescriptor& d) const noexcept
        {
            uint64_t h = Core::Hash::HashString64(d.Source);
            h = Core::Hash::Combine(h, Core::Hash::HashValues(d.Kind, d.Color, d.Width, d.Height, d.Premultiply));
            if (d.Parent)
            {
                h = Core::Hash::Combine(h, Core::Hash::HashValues(d.Region.X, d.Region.Y, d.Region.Width, d.Region.Height));
                h = Core::Hash::Combine(h, static_cast<uint64_t>((*this)(*d.Parent)));
            }
            return static_cast<size_t>(h);
        }
    };

    // Decoded RGBA8 pixels as delivered by a texture source.
    struct ImageData
    {
        uint32_t Width = 0;
        uint32_t Height = 0;
        std::shared_ptr<const std::vector<uint8_t>> Pixels;
        bool Premultiplied = false;

        // GPU footprint: RGBA8, no mips.
        [[nodiscard]] uint64_t ByteSize() const
        {
            return static_cast<uint64_t>(Width) * Height * 4u;
        }
    };

    // What a quad actually samples: the resident texture and the UV rectangle
    // (u0, v0, u1, v1) inside it. Sub-textures resolve to their root parent.
    struct TextureView
    {
        TextureHandle Texture;
        glm::vec4 UV{0.0f, 0.0f, 1.0f, 1.0f};
    };

    // Snapshot of one texture record, for queries and diagnostics.
    struct TextureInfo
    {
        TextureState State = TextureState::Freed;
        uint32_t Width = 0;
        uint32_t Height = 0;
        uint64_t ByteSize = 0;
        uint32_t RefCount = 0;
        uint64_t LastUsed = 0;
        bool PreventCleanup = false;
        Core::ErrorCode Error = Core::ErrorCode::Success;
    };
}
