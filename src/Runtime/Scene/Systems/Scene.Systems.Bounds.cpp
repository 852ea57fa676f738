module;
#include <cstdint>
#include <vector>
#include <entt/entity/registry.hpp>

module Scene:Systems.Bounds.Impl;
import :Systems.Bounds;
import :Properties;
import :Events;
import :SceneGraph;
import :Components.Node;
import :Components.Hierarchy;
import :Components.Transform;
import :Components.Visibility;
import Graphics;
import Core;

namespace Scene
{
    using namespace Components;

    namespace
    {
        // Parents before children, in render order. `root` itself is skipped.
        void CollectPreOrder(const entt::registry& reg, NodeId root, std::vector<NodeId>& out)
        {
            std::vector<NodeId> stack{root};
            while (!stack.empty())
            {
                const NodeId e = stack.back();
                stack.pop_back();
                if (e != root) out.push_back(e);

                const auto& order = reg.get<Hierarchy::Component>(e).RenderOrder;
                for (auto it = order.rbegin(); it != order.rend(); ++it)
                    stack.push_back(*it);
            }
        }

        bool SetViewportState(SceneGraph& scene, NodeId id, Visibility::Component& vis, Visibility::ViewportState state)
        {
            if (vis.Viewport == state) return false;
            vis.Viewport = state;
            scene.QueueEvent(id, state == Visibility::ViewportState::InViewport
                                     ? NodeEvent::InViewport
                                     : NodeEvent::OutOfViewport);
            return true;
        }
    }

    BoundsClassifier::BoundsClassifier(ViewportConfig config)
        : m_Config(config)
    {
    }

    void BoundsClassifier::SetViewport(const ViewportConfig& config)
    {
        m_Config = config;
        m_FullPass = true;
        Core::Log::Info("BoundsClassifier: viewport set to {}x{}", m_Config.Width, m_Config.Height);
    }

    Graphics::Rect BoundsClassifier::GetViewportRect() const
    {
        return Graphics::Rect::FromXYWH(0.0f, 0.0f, m_Config.Width, m_Config.Height);
    }

    void BoundsClassifier::Classify(SceneGraph& scene)
    {
        if (m_FullPass)
        {
            m_Scratch.clear();
            CollectPreOrder(scene.GetRegistry(), scene.GetRoot(), m_Scratch);
            for (NodeId id : m_Scratch) ClassifyNode(scene, id);
            m_FullPass = false;
            return;
        }

        for (NodeId id : scene.GetUpdatedNodes())
        {
            if (id != scene.GetRoot()) ClassifyNode(scene, id);
        }
    }

    void BoundsClassifier::ClassifyNode(SceneGraph& scene, NodeId id)
    {
        auto& reg = scene.GetRegistry();
        if (!reg.valid(id)) return;

        const auto& world = reg.get<Transform::World>(id);
        const auto& flags = reg.get<Node::Flags>(id);
        auto& vis = reg.get<Visibility::Component>(id);

        // 1. Viewport
        const bool inRtt = world.RttRoot != entt::null && reg.valid(world.RttRoot);
        Visibility::ViewportState viewport;
        if (inRtt)
        {
            viewport = reg.get<Visibility::Component>(world.RttRoot).Viewport;
        }
        else
        {
            const Graphics::Rect screen = GetViewportRect().Expanded(m_Config.ViewportMargin);
            viewport = world.Bounds.Overlaps(screen) ? Visibility::ViewportState::InViewport
                                                     : Visibility::ViewportState::OutOfViewport;
        }

        if (SetViewportState(scene, id, vis, viewport) && flags.Rtt)
            PropagateViewport(scene, id);

        // 2. Render bounds
        Graphics::Rect reference;
        if (inRtt)
        {
            const auto& target = reg.get<Node::Local>(world.RttRoot);
            reference = world.ParentClip ? *world.ParentClip
                                         : Graphics::Rect::FromXYWH(0.0f, 0.0f, target.Width, target.Height);
        }
        else
        {
            reference = world.ParentClip ? *world.ParentClip : GetViewportRect();
            if (!flags.StrictBounds) reference = reference.Expanded(m_Config.BoundsMargin);
        }

        const Visibility::BoundsState bounds = world.Bounds.Overlaps(reference)
                                                   ? Visibility::BoundsState::InBounds
                                                   : Visibility::BoundsState::OutOfBounds;
        if (vis.Bounds != bounds)
        {
            vis.Bounds = bounds;
            scene.QueueEvent(id, bounds == Visibility::BoundsState::InBounds ? NodeEvent::InBounds
                                                                             : NodeEvent::OutOfBounds);
            scene.MarkBatchDirty(id);
        }
    }

    void BoundsClassifier::PropagateViewport(SceneGraph& scene, NodeId rttNode)
    {
        // Descendants that did not move keep a stale copy of the RTT root's
        // state otherwise. Nested RTT roots inherit it as well, so the whole
        // subtree takes the same value.
        auto& reg = scene.GetRegistry();
        const Visibility::ViewportState state = reg.get<Visibility::Component>(rttNode).Viewport;

        std::vector<NodeId> subtree;
        CollectPreOrder(reg, rttNode, subtree);
        for (NodeId e : subtree)
            SetViewportState(scene, e, reg.get<Visibility::Component>(e), state);
    }
}
