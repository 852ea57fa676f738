module;

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:RenderOp;
import :Rect;
import :Shader;

export namespace Graphics
{
    enum class BlendMode : uint8_t
    {
        Normal,   // premultiplied source-over
        Additive,
        Multiply,
        Replace
    };

    // What a quad samples: nothing (solid/gradient), a managed texture, or the
    // offscreen target produced by an RTT node.
    struct TextureBinding
    {
        enum class Source : uint8_t { None, Texture, RenderTarget };

        Source Kind = Source::None;
        uint64_t Id = 0; // packed TextureHandle, or the owning node id

        bool operator==(const TextureBinding&) const = default;
    };

    // Everything that forces a new draw call when it changes.
    struct BatchKey
    {
        ShaderKey Shader;
        TextureBinding Texture;
        std::optional<Rect> Clip;
        BlendMode Blend = BlendMode::Normal;

        bool operator==(const BatchKey&) const = default;
    };

    struct Quad
    {
        std::array<glm::vec2, 4> Corners{}; // TL, TR, BR, BL in target space
        std::array<uint32_t, 4> Colors{};   // premultiplied RGBA, same order
        glm::vec4 UV{0.0f, 0.0f, 1.0f, 1.0f};
        glm::vec2 Size{0.0f};               // unscaled node size, for shader math
        uint64_t Owner = 0;                 // node id
    };

    // Unit of GPU submission. Immutable once published; the batcher shares
    // unchanged ops between frames by pointer.
    struct RenderOp
    {
        BatchKey Key;
        ShaderProps Shader; // resolved uniforms for Key.Shader
        std::vector<Quad> Quads;
    };

    using RenderOpPtr = std::shared_ptr<const RenderOp>;

    // Offscreen pass for an RTT node: render Ops into a Width x Height target
    // owned by node Owner. Must execute before any op that samples it.
    struct RenderTargetPass
    {
        uint64_t Owner = 0;
        uint32_t Width = 0;
        uint32_t Height = 0;
        std::vector<RenderOpPtr> Ops;
    };

    // Ordered description of one frame: every Offscreen pass in order, then Main.
    struct FrameBatches
    {
        std::vector<RenderTargetPass> Offscreen;
        std::vector<RenderOpPtr> Main;
        size_t QuadCount = 0;
        size_t RenderOpCount = 0;
    };

    [[nodiscard]] inline size_t CountQuads(const std::vector<RenderOpPtr>& ops)
    {
        size_t n = 0;
        for (const auto& op : ops) n += op->Quads.size();
        return n;
    }

    // GPU-submission collaborator. Executes the description, never mutates it.
    class IRenderSubmitter
    {
    public:
        virtual ~IRenderSubmitter() = default;
        virtual void Submit(const FrameBatches& frame) = 0;
    };
}
