module;
#include <vector>

export module Scene:Components.BatchCache;
import Graphics;

export namespace Scene::Components::BatchCache
{
    // The node or something in its subtree changed how it draws. Set on the
    // node and every ancestor up to the root, cleared by the batcher.
    struct BatchDirtyTag
    {
    };

    // What this node's subtree contributed last time it was built. Reused
    // verbatim while the node stays clean.
    struct Component
    {
        std::vector<Graphics::RenderOpPtr> Ops;
        std::vector<Graphics::RenderTargetPass> Targets; // nested targets first
    };
}
