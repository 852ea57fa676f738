module;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <entt/entity/registry.hpp>

module Scene:SceneGraph.Impl;
import :SceneGraph;
import :Properties;
import :Events;
import :Components.Node;
import :Components.Hierarchy;
import :Components.Transform;
import :Components.Visibility;
import :Components.BatchCache;
import :Systems.Transform;
import Core;
import Graphics;

namespace Scene
{
    using namespace Components;

    namespace
    {
        uint32_t ToId(NodeId id)
        {
            return static_cast<uint32_t>(id);
        }

        template <typename T>
        Core::Expected<T> Read(const PropertyValue& value)
        {
            if (const T* v = std::get_if<T>(&value)) return *v;
            return Core::Err<T>(Core::ErrorCode::TypeMismatch);
        }

        Core::Expected<float> ReadFinite(const PropertyValue& value)
        {
            auto f = Read<float>(value);
            if (f && !std::isfinite(*f)) return Core::Err<float>(Core::ErrorCode::InvalidArgument);
            return f;
        }

        // Assigns and reports whether the stored value changed.
        template <typename T>
        bool Assign(T& field, const T& value)
        {
            if (field == value) return false;
            field = value;
            return true;
        }
    }

    SceneGraph::SceneGraph(Graphics::TextureMemoryManager& textures)
        : m_Textures(textures)
    {
        m_Root = m_Registry.create();
        m_Registry.emplace<Node::Local>(m_Root);
        m_Registry.emplace<Node::Appearance>(m_Root);
        m_Registry.emplace<Node::Flags>(m_Root);
        m_Registry.emplace<Hierarchy::Component>(m_Root);
        m_Registry.emplace<Transform::World>(m_Root);
        m_Registry.emplace<Visibility::Component>(m_Root);
        m_Registry.emplace<BatchCache::Component>(m_Root);
        MarkTransformDirty(m_Root);

        m_TextureListener = m_Textures.AddListener([this](const Graphics::TextureEvent& e) { OnTextureEvent(e); });
    }

    SceneGraph::~SceneGraph()
    {
        m_Textures.RemoveListener(m_TextureListener);

        for (auto [entity, texture] : m_Registry.view<Node::Texture>().each())
            m_Textures.Release(texture.Handle);
    }

    // -------------------------------------------------------------------------
    // Structure
    // -------------------------------------------------------------------------

    Core::Expected<NodeId> SceneGraph::CreateNode(const NodeProps& props)
    {
        const NodeId parent = (props.Parent == NullNode) ? m_Root : props.Parent;
        if (!IsAlive(parent))
        {
            Core::Log::Error("SceneGraph::CreateNode -- parent {} is not alive", ToId(parent));
            return Core::Err<NodeId>(Core::ErrorCode::StaleNode);
        }

        const NodeId e = m_Registry.create();
        m_Registry.emplace<Node::Local>(e);
        m_Registry.emplace<Node::Appearance>(e);
        m_Registry.emplace<Node::Flags>(e);
        m_Registry.emplace<Hierarchy::Component>(e);
        m_Registry.emplace<Transform::World>(e);
        m_Registry.emplace<Visibility::Component>(e);
        m_Registry.emplace<BatchCache::Component>(e);

        // 1. Scalar properties, sanitized like SetProperty. Rejected values keep the default.
        const std::pair<Property, PropertyValue> initial[] = {
            {Property::X, props.X}, {Property::Y, props.Y},
            {Property::Width, props.Width}, {Property::Height, props.Height},
            {Property::ScaleX, props.ScaleX}, {Property::ScaleY, props.ScaleY},
            {Property::Rotation, props.Rotation},
            {Property::PivotX, props.PivotX}, {Property::PivotY, props.PivotY},
            {Property::MountX, props.MountX}, {Property::MountY, props.MountY},
            {Property::Alpha, props.Alpha},
            {Property::ColorTl, props.ColorTl}, {Property::ColorTr, props.ColorTr},
            {Property::ColorBr, props.ColorBr}, {Property::ColorBl, props.ColorBl},
            {Property::Blend, props.Blend},
            {Property::ZIndex, props.ZIndex}, {Property::ZIndexLocked, props.ZIndexLocked},
            {Property::Clipping, props.Clipping}, {Property::StrictBounds, props.StrictBounds},
            {Property::Rtt, props.Rtt},
        };
        for (const auto& [key, value] : initial)
        {
            if (auto r = ApplyProperty(e, key, value); !r)
            {
                Core::Log::Warn("SceneGraph::CreateNode -- node {}: rejected {} ({})", ToId(e),
                                PropertyToString(key), Core::ErrorCodeToString(r.error()));
            }
        }
        if (props.FallbackColor)
            m_Registry.get<Node::Appearance>(e).FallbackColor = *props.FallbackColor;

        // 2. Link into the tree
        Hierarchy::Attach(m_Registry, e, parent);

        // 3. Reference-valued properties
        if (Graphics::KindOf(props.Shader) != Graphics::ShaderKind::Default)
            m_Registry.emplace<Node::Shader>(e, props.Shader);

        MarkTransformDirty(e);

        if (props.Texture)
        {
            if (auto r = SetTexture(e, *props.Texture); !r) return std::unexpected(r.error());
        }
        return e;
    }

    Core::Result SceneGraph::DestroyNode(NodeId id)
    {
        if (id == m_Root)
        {
            Core::Log::Error("SceneGraph::DestroyNode -- the root node cannot be destroyed");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        if (auto r = ValidateNode(id, "DestroyNode"); !r) return r;

        const NodeId parent = GetParent(id);
        Hierarchy::Detach(m_Registry, id);
        if (parent != NullNode) MarkBatchDirty(parent);

        std::vector<NodeId> doomed;
        Hierarchy::CollectPostOrder(m_Registry, id, doomed);
        for (NodeId e : doomed)
        {
            ReleaseTexture(e);
            m_Registry.destroy(e);
        }
        return Core::Ok();
    }

    Core::Result SceneGraph::SetParent(NodeId child, NodeId parent)
    {
        if (auto r = ValidateNode(child, "SetParent"); !r) return r;
        if (auto r = ValidateNode(parent, "SetParent"); !r) return r;

        if (child == m_Root)
        {
            Core::Log::Error("SceneGraph::SetParent -- the root node cannot be re-parented");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        if (Hierarchy::IsInSubtree(m_Registry, child, parent))
        {
            Core::Log::Error("SceneGraph::SetParent -- cycle: node {} cannot become a child of its descendant {}",
                             ToId(child), ToId(parent));
            return Core::Err(Core::ErrorCode::HierarchyCycle);
        }

        const NodeId oldParent = GetParent(child);
        if (oldParent == parent) return Core::Ok();

        Hierarchy::Detach(m_Registry, child);
        if (oldParent != NullNode) MarkBatchDirty(oldParent);
        Hierarchy::Attach(m_Registry, child, parent);
        MarkTransformDirty(child);
        return Core::Ok();
    }

    // -------------------------------------------------------------------------
    // Properties
    // -------------------------------------------------------------------------

    Core::Result SceneGraph::SetProperty(NodeId id, Property key, PropertyValue value)
    {
        if (auto r = ValidateNode(id, "SetProperty"); !r) return r;

        auto change = ApplyProperty(id, key, value);
        if (!change)
        {
            Core::Log::Warn("SceneGraph::SetProperty -- node {}: rejected {} ({})", ToId(id),
                            PropertyToString(key), Core::ErrorCodeToString(change.error()));
            return Core::Err(change.error());
        }

        switch (*change)
        {
        case Change::None:
            break;
        case Change::Transform:
            MarkTransformDirty(id);
            break;
        case Change::Visual:
            MarkBatchDirty(id);
            break;
        case Change::ZIndex:
            if (const NodeId parent = GetParent(id); parent != NullNode)
            {
                // A locked parent pins its children's order.
                if (!m_Registry.get<Node::Flags>(parent).ZIndexLocked)
                    MarkOrderDirty(parent);
            }
            break;
        case Change::ZIndexLock:
            if (!m_Registry.get<Node::Flags>(id).ZIndexLocked)
                MarkOrderDirty(id);
            break;
        }
        return Core::Ok();
    }

    Core::Expected<SceneGraph::Change> SceneGraph::ApplyProperty(NodeId id, Property key, const PropertyValue& value)
    {
        auto& local = m_Registry.get<Node::Local>(id);
        auto& look = m_Registry.get<Node::Appearance>(id);
        auto& flags = m_Registry.get<Node::Flags>(id);

        auto setFloat = [&](std::initializer_list<float*> fields, auto sanitize) -> Core::Expected<Change>
        {
            auto f = ReadFinite(value);
            if (!f) return std::unexpected(f.error());
            const float v = sanitize(*f);
            bool changed = false;
            for (float* field : fields) changed |= Assign(*field, v);
            return changed ? Change::Transform : Change::None;
        };
        auto identity = [](float v) { return v; };
        auto nonNegative = [](float v) { return std::max(0.0f, v); };
        auto unit = [](float v) { return std::clamp(v, 0.0f, 1.0f); };

        auto setColor = [&](std::initializer_list<int> corners) -> Core::Expected<Change>
        {
            auto c = Read<uint32_t>(value);
            if (!c) return std::unexpected(c.error());
            bool changed = false;
            for (int i : corners) changed |= Assign(look.Colors[i], *c);
            return changed ? Change::Visual : Change::None;
        };

        auto setFlag = [&](bool& field) -> Core::Expected<Change>
        {
            auto b = Read<bool>(value);
            if (!b) return std::unexpected(b.error());
            return Assign(field, *b) ? Change::Transform : Change::None;
        };

        // Corner indices: 0 TL, 1 TR, 2 BR, 3 BL
        switch (key)
        {
        case Property::X:        return setFloat({&local.X}, identity);
        case Property::Y:        return setFloat({&local.Y}, identity);
        case Property::Width:    return setFloat({&local.Width}, nonNegative);
        case Property::Height:   return setFloat({&local.Height}, nonNegative);
        case Property::ScaleX:   return setFloat({&local.ScaleX}, identity);
        case Property::ScaleY:   return setFloat({&local.ScaleY}, identity);
        case Property::Scale:    return setFloat({&local.ScaleX, &local.ScaleY}, identity);
        case Property::Rotation: return setFloat({&local.Rotation}, identity);
        case Property::PivotX:   return setFloat({&local.PivotX}, identity);
        case Property::PivotY:   return setFloat({&local.PivotY}, identity);
        case Property::Pivot:    return setFloat({&local.PivotX, &local.PivotY}, identity);
        case Property::MountX:   return setFloat({&local.MountX}, identity);
        case Property::MountY:   return setFloat({&local.MountY}, identity);
        case Property::Mount:    return setFloat({&local.MountX, &local.MountY}, identity);
        case Property::Alpha:    return setFloat({&look.Alpha}, unit);

        case Property::Color:       return setColor({0, 1, 2, 3});
        case Property::ColorTop:    return setColor({0, 1});
        case Property::ColorBottom: return setColor({2, 3});
        case Property::ColorLeft:   return setColor({0, 3});
        case Property::ColorRight:  return setColor({1, 2});
        case Property::ColorTl:     return setColor({0});
        case Property::ColorTr:     return setColor({1});
        case Property::ColorBr:     return setColor({2});
        case Property::ColorBl:     return setColor({3});

        case Property::FallbackColor:
        {
            auto c = Read<uint32_t>(value);
            if (!c) return std::unexpected(c.error());
            if (look.FallbackColor == *c) return Change::None;
            look.FallbackColor = *c;
            return Change::Visual;
        }
        case Property::Blend:
        {
            auto b = Read<Graphics::BlendMode>(value);
            if (!b) return std::unexpected(b.error());
            return Assign(look.Blend, *b) ? Change::Visual : Change::None;
        }
        case Property::ZIndex:
        {
            auto z = Read<int32_t>(value);
            if (!z) return std::unexpected(z.error());
            return Assign(flags.ZIndex, *z) ? Change::ZIndex : Change::None;
        }
        case Property::ZIndexLocked:
        {
            auto b = Read<bool>(value);
            if (!b) return std::unexpected(b.error());
            return Assign(flags.ZIndexLocked, *b) ? Change::ZIndexLock : Change::None;
        }

        // Clip rects, RTT roots and bounds tests are produced by the transform pass.
        case Property::Clipping:     return setFlag(flags.Clipping);
        case Property::StrictBounds: return setFlag(flags.StrictBounds);
        case Property::Rtt:          return setFlag(flags.Rtt);
        }
        return Core::Err<Change>(Core::ErrorCode::InvalidArgument);
    }

    Core::Result SceneGraph::SetTexture(NodeId id, const Graphics::TextureDescriptor& desc)
    {
        if (auto r = ValidateNode(id, "SetTexture"); !r) return r;

        if (const auto* current = m_Registry.try_get<Node::Texture>(id);
            current && current->Descriptor == desc && m_Textures.GetState(current->Handle) != Graphics::TextureState::Freed)
        {
            return Core::Ok();
        }

        // Acquire before releasing so a shared instance is not dropped in between.
        const Graphics::TextureHandle handle = m_Textures.Acquire(desc);
        ReleaseTexture(id);
        m_Registry.emplace<Node::Texture>(id, handle, desc);
        m_TextureHolders[handle].push_back(id);
        MarkBatchDirty(id);

        // Loads that resolved inside Acquire happened before we were a holder.
        if (const auto info = m_Textures.GetInfo(handle))
        {
            if (info->State == Graphics::TextureState::Loaded)
                QueueEvent(id, NodeEvent::Loaded);
            else if (info->State == Graphics::TextureState::Failed)
                QueueEvent(id, NodeEvent::Failed, info->Error);
        }
        return Core::Ok();
    }

    Core::Result SceneGraph::ClearTexture(NodeId id)
    {
        if (auto r = ValidateNode(id, "ClearTexture"); !r) return r;
        if (!m_Registry.all_of<Node::Texture>(id)) return Core::Ok();

        ReleaseTexture(id);
        MarkBatchDirty(id);
        return Core::Ok();
    }

    Core::Result SceneGraph::SetShader(NodeId id, Graphics::ShaderProps props)
    {
        if (auto r = ValidateNode(id, "SetShader"); !r) return r;

        if (Graphics::KindOf(props) == Graphics::ShaderKind::Default)
            m_Registry.remove<Node::Shader>(id);
        else
            m_Registry.emplace_or_replace<Node::Shader>(id, std::move(props));

        MarkBatchDirty(id);
        return Core::Ok();
    }

    // -------------------------------------------------------------------------
    // Frame
    // -------------------------------------------------------------------------

    void SceneGraph::Update(double)
    {
        m_Updated.clear();
        m_Registry.clear<Transform::WorldUpdatedTag>();

        if (!m_Registry.any_of<Transform::IsDirtyTag, Transform::ChildrenDirtyTag,
                               Hierarchy::OrderDirtyTag>(m_Root))
            return;

        Systems::Transform::OnUpdate(m_Registry, m_Root, m_Updated);
    }

    bool SceneGraph::HasPendingUpdates() const
    {
        return m_Registry.any_of<Transform::IsDirtyTag, Transform::ChildrenDirtyTag,
                                 Hierarchy::OrderDirtyTag, BatchCache::BatchDirtyTag>(m_Root);
    }

    void SceneGraph::MarkTransformDirty(NodeId id)
    {
        m_Registry.emplace_or_replace<Transform::IsDirtyTag>(id);
        MarkPathDirty(id);
        MarkBatchDirty(id);
    }

    void SceneGraph::MarkPathDirty(NodeId id)
    {
        // A tagged ancestor implies its whole path to the root is tagged.
        NodeId current = GetParent(id);
        while (current != NullNode && !m_Registry.all_of<Transform::ChildrenDirtyTag>(current))
        {
            m_Registry.emplace<Transform::ChildrenDirtyTag>(current);
            current = GetParent(current);
        }
    }

    void SceneGraph::MarkOrderDirty(NodeId parent)
    {
        m_Registry.emplace_or_replace<Hierarchy::OrderDirtyTag>(parent);
        MarkPathDirty(parent);
        MarkBatchDirty(parent);
    }

    void SceneGraph::MarkBatchDirty(NodeId id)
    {
        // Full walk: pruned subtrees keep their tags, so a tagged node does not
        // imply tagged ancestors here.
        for (NodeId current = id; current != NullNode && m_Registry.valid(current); current = GetParent(current))
            m_Registry.emplace_or_replace<BatchCache::BatchDirtyTag>(current);
    }

    // -------------------------------------------------------------------------
    // Textures
    // -------------------------------------------------------------------------

    void SceneGraph::ReleaseTexture(NodeId id)
    {
        const auto* texture = m_Registry.try_get<Node::Texture>(id);
        if (!texture) return;

        const Graphics::TextureHandle handle = texture->Handle;
        if (auto it = m_TextureHolders.find(handle); it != m_TextureHolders.end())
        {
            std::erase(it->second, id);
            if (it->second.empty()) m_TextureHolders.erase(it);
        }
        m_Registry.remove<Node::Texture>(id);

        // May cancel a pending load; the holder entry is gone, so nothing reaches this node.
        m_Textures.Release(handle);
    }

    void SceneGraph::OnTextureEvent(const Graphics::TextureEvent& event)
    {
        auto it = m_TextureHolders.find(event.Handle);
        if (it == m_TextureHolders.end()) return;

        NodeEvent nodeEvent;
        switch (event.State)
        {
        case Graphics::TextureState::Loaded: nodeEvent = NodeEvent::Loaded; break;
        case Graphics::TextureState::Failed: nodeEvent = NodeEvent::Failed; break;
        case Graphics::TextureState::Freed:  nodeEvent = NodeEvent::Freed; break;
        default: return;
        }

        const std::vector<NodeId> holders = it->second;
        Core::Log::Debug("SceneGraph: texture {} {} for {} node(s)", event.Handle.Index,
                         NodeEventToString(nodeEvent), holders.size());
        if (event.State == Graphics::TextureState::Freed)
            m_TextureHolders.erase(it); // handle is stale from here on

        for (NodeId node : holders)
        {
            if (!m_Registry.valid(node)) continue;
            MarkBatchDirty(node);
            QueueEvent(node, nodeEvent, event.Error);
        }
    }

    // -------------------------------------------------------------------------
    // Events
    // -------------------------------------------------------------------------

    Core::Expected<ListenerId> SceneGraph::On(NodeId id, NodeEvent event, NodeListener listener)
    {
        if (auto r = ValidateNode(id, "On"); !r) return std::unexpected(r.error());

        auto& listeners = m_Registry.get_or_emplace<Events::Listeners>(id);
        const ListenerId lid = m_NextListenerId++;
        listeners.Entries.push_back({lid, event, std::move(listener)});
        return lid;
    }

    Core::Result SceneGraph::Off(NodeId id, ListenerId listener)
    {
        if (auto r = ValidateNode(id, "Off"); !r) return r;

        auto* listeners = m_Registry.try_get<Events::Listeners>(id);
        if (!listeners || std::erase_if(listeners->Entries, [listener](const auto& e) { return e.Id == listener; }) == 0)
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        return Core::Ok();
    }

    void SceneGraph::QueueEvent(NodeId id, NodeEvent event, Core::ErrorCode error)
    {
        m_EventQueue.push_back({id, event, error});
    }

    void SceneGraph::FlushEvents()
    {
        // Events queued by callbacks wait for the next flush.
        std::vector<NodeEventArgs> events;
        events.swap(m_EventQueue);

        std::vector<NodeListener> callbacks;
        for (const NodeEventArgs& args : events)
        {
            if (!m_Registry.valid(args.Node)) continue;
            const auto* listeners = m_Registry.try_get<Events::Listeners>(args.Node);
            if (!listeners) continue;

            callbacks.clear();
            for (const auto& entry : listeners->Entries)
            {
                if (entry.Event == args.Event) callbacks.push_back(entry.Callback);
            }

            for (const auto& callback : callbacks)
            {
                if (!m_Registry.valid(args.Node)) break; // destroyed by an earlier callback
                callback(args);
            }
        }
    }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    Core::Result SceneGraph::ValidateNode(NodeId id, std::string_view operation) const
    {
        if (IsAlive(id)) return Core::Ok();

        Core::Log::Error("SceneGraph::{} -- node {} does not exist or was destroyed", operation, ToId(id));
        return Core::Err(Core::ErrorCode::StaleNode);
    }

    bool SceneGraph::IsAlive(NodeId id) const
    {
        return id != NullNode && m_Registry.valid(id) && m_Registry.all_of<Node::Local>(id);
    }

    size_t SceneGraph::NodeCount() const
    {
        return m_Registry.view<Node::Local>().size() - 1;
    }

    NodeId SceneGraph::GetParent(NodeId id) const
    {
        const auto* h = m_Registry.try_get<Hierarchy::Component>(id);
        return h ? h->Parent : NullNode;
    }

    std::span<const NodeId> SceneGraph::GetChildren(NodeId id) const
    {
        const auto* h = IsAlive(id) ? m_Registry.try_get<Hierarchy::Component>(id) : nullptr;
        return h ? std::span<const NodeId>(h->Children) : std::span<const NodeId>{};
    }

    std::span<const NodeId> SceneGraph::GetRenderOrder(NodeId id) const
    {
        const auto* h = IsAlive(id) ? m_Registry.try_get<Hierarchy::Component>(id) : nullptr;
        return h ? std::span<const NodeId>(h->RenderOrder) : std::span<const NodeId>{};
    }

    const Node::Local* SceneGraph::GetLocal(NodeId id) const
    {
        return IsAlive(id) ? m_Registry.try_get<Node::Local>(id) : nullptr;
    }

    const Node::Appearance* SceneGraph::GetAppearance(NodeId id) const
    {
        return IsAlive(id) ? m_Registry.try_get<Node::Appearance>(id) : nullptr;
    }

    const Node::Flags* SceneGraph::GetFlags(NodeId id) const
    {
        return IsAlive(id) ? m_Registry.try_get<Node::Flags>(id) : nullptr;
    }

    const Transform::World* SceneGraph::GetWorld(NodeId id) const
    {
        return IsAlive(id) ? m_Registry.try_get<Transform::World>(id) : nullptr;
    }

    std::optional<float> SceneGraph::GetEffectiveAlpha(NodeId id) const
    {
        const auto* world = GetWorld(id);
        if (!world) return std::nullopt;
        return world->Alpha;
    }

    std::optional<Visibility::Component> SceneGraph::GetVisibility(NodeId id) const
    {
        const auto* vis = IsAlive(id) ? m_Registry.try_get<Visibility::Component>(id) : nullptr;
        if (!vis) return std::nullopt;
        return *vis;
    }

    std::optional<Graphics::TextureHandle> SceneGraph::GetTexture(NodeId id) const
    {
        const auto* tex = IsAlive(id) ? m_Registry.try_get<Node::Texture>(id) : nullptr;
        if (!tex) return std::nullopt;
        return tex->Handle;
    }
}
