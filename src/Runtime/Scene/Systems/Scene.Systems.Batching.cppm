module;
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>
#include <entt/entity/registry.hpp>

export module Scene:Systems.Batching;
import :Properties;
import :SceneGraph;
import :Components.BatchCache;
import Graphics;

export namespace Scene
{
    // What happens to an RTT node that also has StrictBounds and is OutOfBounds.
    enum class RttStrictBoundsPolicy : uint8_t
    {
        PruneTarget, // drop the offscreen pass together with the quad and the subtree
        KeepTarget   // keep rendering the offscreen pass, only cull the quad
    };

    [[nodiscard]] constexpr std::string_view RttStrictBoundsPolicyToString(RttStrictBoundsPolicy p)
    {
        switch (p)
        {
        case RttStrictBoundsPolicy::PruneTarget: return "PruneTarget";
        case RttStrictBoundsPolicy::KeepTarget:  return "KeepTarget";
        }
        return "Unknown";
    }

    struct BatcherConfig
    {
        RttStrictBoundsPolicy RttStrictBounds = RttStrictBoundsPolicy::PruneTarget;
    };

    // -------------------------------------------------------------------------
    // Batcher
    // -------------------------------------------------------------------------
    // Turns the classified scene into an ordered FrameBatches description.
    //
    // Every node caches the ops and offscreen passes its subtree produced.
    // Build() only descends into nodes carrying BatchDirtyTag and splices the
    // cached output of clean children by pointer, so a static scene costs one
    // tag check per frame and yields the very same RenderOp objects.
    //
    // Adjacent ops with equal BatchKey are merged. Merging never mutates a
    // cached op: a run is copied once into a new RenderOp and grown in place,
    // so rebuilding a node costs time linear in its subtree's quads.
    // -------------------------------------------------------------------------
    class Batcher
    {
    public:
        explicit Batcher(BatcherConfig config = {});

        const Graphics::FrameBatches& Build(SceneGraph& scene);

        [[nodiscard]] const Graphics::FrameBatches& GetFrame() const { return m_Frame; }
        [[nodiscard]] const BatcherConfig& GetConfig() const { return m_Config; }

        // Nodes whose cache was rebuilt by the last Build.
        [[nodiscard]] size_t GetRebuiltNodeCount() const { return m_RebuiltNodes; }

        // Quads copied into merged ops by the last Build.
        [[nodiscard]] size_t GetCopiedQuadCount() const { return m_CopiedQuads; }

    private:
        const Components::BatchCache::Component& Refresh(SceneGraph& scene, NodeId id);
        [[nodiscard]] Graphics::RenderOpPtr MakeOwnQuad(SceneGraph& scene, NodeId id) const;

        BatcherConfig m_Config;
        Graphics::FrameBatches m_Frame;
        bool m_HasFrame = false;
        size_t m_RebuiltNodes = 0;
        size_t m_CopiedQuads = 0;
    };
}
