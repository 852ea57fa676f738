module;
#include <vector>
#include <entt/fwd.hpp>

export module Scene:Systems.Transform;

export namespace Scene::Systems::Transform
{
    // Recomputes World for every dirty node and its subtree, walking from
    // `root` in render order and skipping subtrees with nothing dirty.
    // Also re-sorts children whose order is dirty and tags touched nodes with
    // WorldUpdatedTag and BatchDirtyTag. Recomputed nodes are appended to
    // `updated`, parents before children.
    void OnUpdate(entt::registry& registry, entt::entity root, std::vector<entt::entity>& updated);
}
