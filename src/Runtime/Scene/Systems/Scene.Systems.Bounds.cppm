module;
#include <vector>
#include <entt/entity/registry.hpp>

export module Scene:Systems.Bounds;
import :Properties;
import :SceneGraph;
import Graphics;

export namespace Scene
{
    struct ViewportConfig
    {
        float Width = 1920.0f;
        float Height = 1080.0f;

        // Readiness margin: nodes this close to the screen already count as in the viewport.
        Graphics::Margin ViewportMargin;

        // Slack around the reference rect before a non-strict node is culled.
        Graphics::Margin BoundsMargin;
    };

    // -------------------------------------------------------------------------
    // BoundsClassifier
    // -------------------------------------------------------------------------
    // Runs after SceneGraph::Update on the nodes whose world transform changed.
    // Keeps two edge-triggered states per node and queues an event on every
    // transition:
    //   Viewport: world bounds vs. the screen rect grown by ViewportMargin.
    //             RTT descendants share their RTT root's state.
    //   Bounds:   world bounds vs. the nearest clip rect (or the screen, or the
    //             RTT target), grown by BoundsMargin unless StrictBounds or RTT.
    // A bounds transition invalidates the node's batch.
    // -------------------------------------------------------------------------
    class BoundsClassifier
    {
    public:
        explicit BoundsClassifier(ViewportConfig config = {});

        void Classify(SceneGraph& scene);

        // Takes effect on the next Classify, which then revisits every node.
        void SetViewport(const ViewportConfig& config);
        [[nodiscard]] const ViewportConfig& GetConfig() const { return m_Config; }

        [[nodiscard]] Graphics::Rect GetViewportRect() const;

    private:
        void ClassifyNode(SceneGraph& scene, NodeId id);
        void PropagateViewport(SceneGraph& scene, NodeId rttNode);

        ViewportConfig m_Config;
        bool m_FullPass = true;
        std::vector<NodeId> m_Scratch;
    };
}
