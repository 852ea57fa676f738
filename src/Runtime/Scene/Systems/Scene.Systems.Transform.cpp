module;
#include <array>
#include <optional>
#include <vector>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module Scene:Systems.Transform.Impl;
import :Systems.Transform;
import :Components.Node;
import :Components.Transform;
import :Components.Hierarchy;
import :Components.BatchCache;
import Graphics;

namespace Scene::Systems::Transform::Detail
{
    using namespace Scene::Components;

    // What a child inherits from its parent.
    struct ParentContext
    {
        glm::mat3 Matrix{1.0f};
        float Alpha = 1.0f;
        float RenderAlpha = 1.0f;
        std::optional<Graphics::Rect> Clip;
        entt::entity RttRoot = entt::null;
    };

    void ComputeWorld(entt::registry& reg, entt::entity entity, const ParentContext& parent)
    {
        const auto& local = reg.get<Node::Local>(entity);
        const auto& look = reg.get<Node::Appearance>(entity);
        const auto& flags = reg.get<Node::Flags>(entity);
        auto& world = reg.get<Components::Transform::World>(entity);

        world.Matrix = parent.Matrix * Components::Transform::GetLocalMatrix(local);

        const std::array<glm::vec2, 4> box = {
            glm::vec2{0.0f, 0.0f}, glm::vec2{local.Width, 0.0f},
            glm::vec2{local.Width, local.Height}, glm::vec2{0.0f, local.Height}
        };
        for (size_t i = 0; i < box.size(); ++i)
            world.Corners[i] = glm::vec2(world.Matrix * glm::vec3(box[i], 1.0f));
        world.Bounds = Graphics::BoundsOf(world.Corners.begin(), world.Corners.end());

        world.Alpha = parent.Alpha * look.Alpha;
        world.RenderAlpha = parent.RenderAlpha * look.Alpha;

        world.ParentClip = parent.Clip;
        if (flags.Clipping && Components::Transform::IsAxisAligned(world.Matrix))
            world.Clip = parent.Clip ? parent.Clip->Intersect(world.Bounds) : world.Bounds;
        else
            world.Clip = parent.Clip;

        world.RttRoot = parent.RttRoot;
    }

    ParentContext ChildContext(entt::registry& reg, entt::entity entity)
    {
        const auto& world = reg.get<Components::Transform::World>(entity);

        // An RTT node draws its subtree into its own target: children start
        // over in target space, unclipped, with the RTT node as their root.
        if (reg.get<Node::Flags>(entity).Rtt)
            return {glm::mat3(1.0f), world.Alpha, 1.0f, std::nullopt, entity};

        return {world.Matrix, world.Alpha, world.RenderAlpha, world.Clip, world.RttRoot};
    }

    void UpdateHierarchy(entt::registry& reg, entt::entity entity, const ParentContext& parent,
                         bool parentDirty, std::vector<entt::entity>& updated)
    {
        // 1. Child order
        if (reg.all_of<Hierarchy::OrderDirtyTag>(entity))
        {
            if (!reg.get<Node::Flags>(entity).ZIndexLocked)
                Hierarchy::SortChildren(reg, entity);
            reg.remove<Hierarchy::OrderDirtyTag>(entity);
        }

        // 2. Own world state
        const bool isDirty = parentDirty || reg.all_of<Components::Transform::IsDirtyTag>(entity);
        if (isDirty)
        {
            ComputeWorld(reg, entity, parent);
            reg.emplace_or_replace<Components::Transform::WorldUpdatedTag>(entity);
            reg.emplace_or_replace<BatchCache::BatchDirtyTag>(entity);
            reg.remove<Components::Transform::IsDirtyTag>(entity);
            updated.push_back(entity);
        }

        // 3. Children, only where something below changed
        const bool childrenDirty = reg.all_of<Components::Transform::ChildrenDirtyTag>(entity);
        reg.remove<Components::Transform::ChildrenDirtyTag>(entity);
        if (!isDirty && !childrenDirty) return;

        const ParentContext context = ChildContext(reg, entity);

        // Copy: the recursion never restructures the tree, but it does touch
        // component pools, which may move the hierarchy storage.
        const std::vector<entt::entity> children = reg.get<Hierarchy::Component>(entity).RenderOrder;
        for (entt::entity child : children)
            UpdateHierarchy(reg, child, context, isDirty, updated);
    }
}

namespace Scene::Systems::Transform
{
    void OnUpdate(entt::registry& registry, entt::entity root, std::vector<entt::entity>& updated)
    {
        if (!registry.valid(root)) return;

        Detail::UpdateHierarchy(registry, root, Detail::ParentContext{}, false, updated);
    }
}
