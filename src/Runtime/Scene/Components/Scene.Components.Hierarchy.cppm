module;
#include <vector>
#include <entt/entity/registry.hpp>

export module Scene:Components.Hierarchy;

export namespace Scene::Components::Hierarchy
{
    // Parent owns its children: destroying a node destroys the subtree.
    // Parent is a non-owning back-reference used for traversal only.
    struct Component
    {
        entt::entity Parent = entt::null;
        std::vector<entt::entity> Children;    // insertion order
        std::vector<entt::entity> RenderOrder; // Children, stable-sorted by z-index
    };

    // RenderOrder needs a re-sort before the next traversal.
    struct OrderDirtyTag
    {
    };

    // True if `node` is `ancestor` or lies in its subtree.
    [[nodiscard]] bool IsInSubtree(const entt::registry& registry, entt::entity ancestor, entt::entity node);

    // Appends to Children and inserts into RenderOrder after the last sibling
    // with a lower or equal z-index. Detaches from a previous parent first.
    // Callers reject cycles beforehand.
    void Attach(entt::registry& registry, entt::entity child, entt::entity newParent);
    void Detach(entt::registry& registry, entt::entity child);

    // Stable sort of RenderOrder by z-index. Ties keep insertion order.
    void SortChildren(entt::registry& registry, entt::entity parent);

    // Children before parents, `root` last.
    void CollectPostOrder(const entt::registry& registry, entt::entity root, std::vector<entt::entity>& out);
}
