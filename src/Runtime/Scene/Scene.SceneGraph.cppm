module;

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <entt/entity/registry.hpp>

export module Scene:SceneGraph;
import :Properties;
import :Events;
import :Components.Node;
import :Components.Transform;
import :Components.Visibility;
import Core;
import Graphics;

export namespace Scene
{
    // -------------------------------------------------------------------------
    // SceneGraph
    // -------------------------------------------------------------------------
    // Owns the node tree. Every node is an entity of the internal registry with
    // Node, Hierarchy, Transform, Visibility and BatchCache components.
    //
    // The graph has an implicit root that is never destroyed; nodes created
    // without a parent hang off it.
    //
    // Mutations tag the affected nodes (IsDirtyTag for transforms, BatchDirtyTag
    // for draw data) plus the path to the root, so Update() and the batcher only
    // touch subtrees that changed. Node events are queued and delivered by
    // FlushEvents() once the frame is done, never from inside a system.
    // -------------------------------------------------------------------------
    class SceneGraph
    {
    public:
        explicit SceneGraph(Graphics::TextureMemoryManager& textures);
        ~SceneGraph();

        SceneGraph(const SceneGraph&) = delete;
        SceneGraph& operator=(const SceneGraph&) = delete;

        // --- Structure ---
        [[nodiscard]] Core::Expected<NodeId> CreateNode(const NodeProps& props = {});

        // Destroys the node and its subtree, releasing their textures.
        // StaleNode if `id` is already gone, InvalidArgument for the root.
        [[nodiscard]] Core::Result DestroyNode(NodeId id);

        // HierarchyCycle if `parent` is `child` or one of its descendants.
        [[nodiscard]] Core::Result SetParent(NodeId child, NodeId parent);

        // --- Properties ---
        // NaN/inf -> InvalidArgument (value kept), wrong alternative -> TypeMismatch.
        // Negative width/height clamp to 0, alpha clamps to [0,1].
        [[nodiscard]] Core::Result SetProperty(NodeId id, Property key, PropertyValue value);
        [[nodiscard]] Core::Result SetTexture(NodeId id, const Graphics::TextureDescriptor& desc);
        [[nodiscard]] Core::Result ClearTexture(NodeId id);
        [[nodiscard]] Core::Result SetShader(NodeId id, Graphics::ShaderProps props);

        // --- Frame ---
        void Update(double dtMs);
        [[nodiscard]] bool HasPendingUpdates() const;

        // Nodes whose world transform was recomputed by the last Update, parents first.
        [[nodiscard]] const std::vector<NodeId>& GetUpdatedNodes() const { return m_Updated; }

        // Tags the node and all its ancestors for a batch rebuild.
        void MarkBatchDirty(NodeId id);

        // --- Events ---
        [[nodiscard]] Core::Expected<ListenerId> On(NodeId id, NodeEvent event, NodeListener listener);
        [[nodiscard]] Core::Result Off(NodeId id, ListenerId listener);
        void QueueEvent(NodeId id, NodeEvent event, Core::ErrorCode error = Core::ErrorCode::Success);
        void FlushEvents();
        [[nodiscard]] size_t QueuedEventCount() const { return m_EventQueue.size(); }

        // --- Queries ---
        [[nodiscard]] NodeId GetRoot() const { return m_Root; }
        [[nodiscard]] bool IsAlive(NodeId id) const;
        [[nodiscard]] size_t NodeCount() const; // excludes the root
        [[nodiscard]] NodeId GetParent(NodeId id) const;
        [[nodiscard]] std::span<const NodeId> GetChildren(NodeId id) const;
        [[nodiscard]] std::span<const NodeId> GetRenderOrder(NodeId id) const;

        [[nodiscard]] const Components::Node::Local* GetLocal(NodeId id) const;
        [[nodiscard]] const Components::Node::Appearance* GetAppearance(NodeId id) const;
        [[nodiscard]] const Components::Node::Flags* GetFlags(NodeId id) const;
        [[nodiscard]] const Components::Transform::World* GetWorld(NodeId id) const;
        [[nodiscard]] std::optional<float> GetEffectiveAlpha(NodeId id) const;
        [[nodiscard]] std::optional<Components::Visibility::Component> GetVisibility(NodeId id) const;
        [[nodiscard]] std::optional<Graphics::TextureHandle> GetTexture(NodeId id) const;

        [[nodiscard]] entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }
        [[nodiscard]] Graphics::TextureMemoryManager& GetTextures() { return m_Textures; }
        [[nodiscard]] const Graphics::TextureMemoryManager& GetTextures() const { return m_Textures; }

    private:
        enum class Change
        {
            None,
            Transform,
            Visual,
            ZIndex,
            ZIndexLock
        };

        [[nodiscard]] Core::Result ValidateNode(NodeId id, std::string_view operation) const;
        [[nodiscard]] Core::Expected<Change> ApplyProperty(NodeId id, Property key, const PropertyValue& value);

        void MarkTransformDirty(NodeId id);
        void MarkPathDirty(NodeId id);
        void MarkOrderDirty(NodeId parent);

        void ReleaseTexture(NodeId id);
        void OnTextureEvent(const Graphics::TextureEvent& event);

        entt::registry m_Registry;
        Graphics::TextureMemoryManager& m_Textures;
        Graphics::TextureMemoryManager::ListenerId m_TextureListener = 0;
        NodeId m_Root = NullNode;

        std::vector<NodeId> m_Updated;
        std::unordered_map<Graphics::TextureHandle, std::vector<NodeId>> m_TextureHolders;

        std::vector<NodeEventArgs> m_EventQueue;
        ListenerId m_NextListenerId = 1;
    };
}
