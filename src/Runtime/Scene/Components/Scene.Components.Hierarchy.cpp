module;

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <vector>
#include <entt/entity/registry.hpp>

module Scene:Components.Hierarchy.Impl;
import :Components.Hierarchy;
import :Components.Node;

namespace Scene::Components::Hierarchy
{
    namespace
    {
        int32_t ZOf(const entt::registry& registry, entt::entity e)
        {
            const auto* flags = registry.try_get<Node::Flags>(e);
            return flags ? flags->ZIndex : 0;
        }
    }

    bool IsInSubtree(const entt::registry& registry, entt::entity ancestor, entt::entity node)
    {
        entt::entity current = node;
        while (current != entt::null && registry.valid(current))
        {
            if (current == ancestor) return true;

            const auto* comp = registry.try_get<Component>(current);
            if (!comp) break;
            current = comp->Parent;
        }
        return false;
    }

    void Attach(entt::registry& registry, entt::entity child, entt::entity newParent)
    {
        if (!registry.valid(child) || !registry.valid(newParent) || child == newParent) return;

        auto& childComp = registry.get_or_emplace<Component>(child);
        if (childComp.Parent == newParent) return;
        if (childComp.Parent != entt::null) Detach(registry, child);

        auto& parentComp = registry.get_or_emplace<Component>(newParent);
        childComp.Parent = newParent;
        parentComp.Children.push_back(child);

        // Insert behind every sibling with z <= ours. On a sorted list this is
        // exactly where a stable sort would put it; on a pinned (locked) list it
        // keeps the existing relative order intact.
        const int32_t z = ZOf(registry, child);
        auto pos = parentComp.RenderOrder.end();
        for (auto it = parentComp.RenderOrder.rbegin(); it != parentComp.RenderOrder.rend(); ++it)
        {
            if (ZOf(registry, *it) <= z)
            {
                pos = it.base();
                break;
            }
            pos = std::prev(it.base());
        }
        parentComp.RenderOrder.insert(pos, child);
    }

    void Detach(entt::registry& registry, entt::entity child)
    {
        auto* childComp = registry.try_get<Component>(child);
        if (!childComp || childComp->Parent == entt::null) return;

        if (auto* parentComp = registry.try_get<Component>(childComp->Parent))
        {
            std::erase(parentComp->Children, child);
            std::erase(parentComp->RenderOrder, child);
        }
        childComp->Parent = entt::null;
    }

    void SortChildren(entt::registry& registry, entt::entity parent)
    {
        auto* comp = registry.try_get<Component>(parent);
        if (!comp) return;

        comp->RenderOrder = comp->Children;
        std::stable_sort(comp->RenderOrder.begin(), comp->RenderOrder.end(),
                         [&registry](entt::entity a, entt::entity b)
                         {
                             return ZOf(registry, a) < ZOf(registry, b);
                         });
    }

    void CollectPostOrder(const entt::registry& registry, entt::entity root, std::vector<entt::entity>& out)
    {
        // Iterative: deep chains must not overflow the stack.
        struct Frame
        {
            entt::entity Entity;
            size_t NextChild;
        };
        std::vector<Frame> stack{{root, 0}};

        while (!stack.empty())
        {
            Frame& top = stack.back();
            const auto* comp = registry.try_get<Component>(top.Entity);
            if (comp && top.NextChild < comp->Children.size())
            {
                const entt::entity child = comp->Children[top.NextChild++];
                stack.push_back({child, 0});
                continue;
            }
            out.push_back(top.Entity);
            stack.pop_back();
        }
    }
}
