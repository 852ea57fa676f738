module;
#include <array>
#include <cmath>
#include <optional>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/matrix_transform_2d.hpp>

export module Scene:Components.Transform;
import :Components.Node;
import Graphics;

export namespace Scene::Components::Transform
{
    // Local transform, alpha, clipping or RTT flag changed: recompute this node
    // and its whole subtree on the next update.
    struct IsDirtyTag
    {
    };

    // Some descendant carries IsDirtyTag. Lets the update walk skip clean subtrees.
    struct ChildrenDirtyTag
    {
    };

    // Added when World was rewritten this tick. Consumed by the bounds classifier.
    struct WorldUpdatedTag
    {
    };

    // Result of the update pass. Coordinates are in the space of the enclosing
    // render target: the screen, or the nearest RTT ancestor's texture.
    struct World
    {
        glm::mat3 Matrix{1.0f};
        std::array<glm::vec2, 4> Corners{}; // TL, TR, BR, BL
        Graphics::Rect Bounds;              // AABB of Corners

        float Alpha = 1.0f;       // own alpha times every ancestor's alpha
        float RenderAlpha = 1.0f; // same product, stopping at the enclosing RTT node

        std::optional<Graphics::Rect> Clip;       // applied to this node's quad and inherited by children
        std::optional<Graphics::Rect> ParentClip; // nearest clipping ancestor's rect

        entt::entity RttRoot = entt::null; // nearest RTT ancestor, null on screen
    };

    // T(pivot*size - mount*size + pos) * R * S * T(-pivot*size)
    [[nodiscard]] inline glm::mat3 GetLocalMatrix(const Node::Local& l)
    {
        const glm::vec2 size{l.Width, l.Height};
        const glm::vec2 pivot = glm::vec2{l.PivotX, l.PivotY} * size;
        const glm::vec2 mount = glm::vec2{l.MountX, l.MountY} * size;

        glm::mat3 m = glm::translate(glm::mat3(1.0f), pivot - mount + glm::vec2{l.X, l.Y});
        if (l.Rotation != 0.0f) m = glm::rotate(m, l.Rotation);
        if (l.ScaleX != 1.0f || l.ScaleY != 1.0f) m = glm::scale(m, glm::vec2{l.ScaleX, l.ScaleY});
        return glm::translate(m, -pivot);
    }

    // Clipping is skipped for rotated nodes: a scissor rect cannot express it.
    [[nodiscard]] inline bool IsAxisAligned(const glm::mat3& m)
    {
        constexpr float eps = 1e-6f;
        return std::abs(m[0][1]) < eps && std::abs(m[1][0]) < eps;
    }
}
