module;
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module Scene:Systems.Batching.Impl;
import :Systems.Batching;
import :Properties;
import :SceneGraph;
import :Components.Node;
import :Components.Hierarchy;
import :Components.Transform;
import :Components.Visibility;
import :Components.BatchCache;
import Graphics;
import Core;

namespace Scene
{
    using namespace Components;

    namespace
    {
        uint64_t OwnerId(NodeId id)
        {
            return static_cast<uint64_t>(entt::to_integral(id));
        }

        // Appends ops to a list under construction, folding each one into the
        // previous op when the keys match. Published ops are shared, so the
        // first fold of a run copies the tail into an op owned by this builder;
        // the rest of the run is appended to that copy in place.
        class OpListBuilder
        {
        public:
            OpListBuilder(std::vector<Graphics::RenderOpPtr>& out, size_t& copiedQuads)
                : m_Out(out), m_CopiedQuads(copiedQuads)
            {
            }

            void Append(const Graphics::RenderOpPtr& op)
            {
                if (!op) return;
                if (m_Out.empty() || !(m_Out.back()->Key == op->Key))
                {
                    m_Out.push_back(op);
                    m_Tail.reset();
                    return;
                }

                if (!m_Tail)
                {
                    m_Tail = std::make_shared<Graphics::RenderOp>(*m_Out.back());
                    m_CopiedQuads += m_Tail->Quads.size();
                    m_Out.back() = m_Tail;
                }
                m_Tail->Quads.insert(m_Tail->Quads.end(), op->Quads.begin(), op->Quads.end());
                m_CopiedQuads += op->Quads.size();
            }

            void Append(const std::vector<Graphics::RenderOpPtr>& ops)
            {
                for (const auto& op : ops) Append(op);
            }

        private:
            std::vector<Graphics::RenderOpPtr>& m_Out;
            size_t& m_CopiedQuads;
            std::shared_ptr<Graphics::RenderOp> m_Tail; // m_Out.back() while it is ours to grow
        };

        void AppendTargets(std::vector<Graphics::RenderTargetPass>& out,
                           const std::vector<Graphics::RenderTargetPass>& passes)
        {
            out.insert(out.end(), passes.begin(), passes.end());
        }

        uint32_t TargetExtent(float v)
        {
            return static_cast<uint32_t>(std::ceil(std::max(0.0f, v)));
        }
    }

    Batcher::Batcher(BatcherConfig config)
        : m_Config(config)
    {
        Core::Log::Debug("Batcher: RTT strict-bounds policy {}", RttStrictBoundsPolicyToString(m_Config.RttStrictBounds));
    }

    const Graphics::FrameBatches& Batcher::Build(SceneGraph& scene)
    {
        m_RebuiltNodes = 0;
        m_CopiedQuads = 0;

        auto& reg = scene.GetRegistry();
        const NodeId root = scene.GetRoot();
        if (m_HasFrame && !reg.all_of<BatchCache::BatchDirtyTag>(root))
            return m_Frame;

        const auto& cache = Refresh(scene, root);

        m_Frame.Offscreen = cache.Targets;
        m_Frame.Main = cache.Ops;

        m_Frame.QuadCount = Graphics::CountQuads(m_Frame.Main);
        m_Frame.RenderOpCount = m_Frame.Main.size();
        for (const auto& pass : m_Frame.Offscreen)
        {
            m_Frame.QuadCount += Graphics::CountQuads(pass.Ops);
            m_Frame.RenderOpCount += pass.Ops.size();
        }

        m_HasFrame = true;
        return m_Frame;
    }

    const BatchCache::Component& Batcher::Refresh(SceneGraph& scene, NodeId id)
    {
        auto& reg = scene.GetRegistry();
        if (!reg.all_of<BatchCache::BatchDirtyTag>(id))
            return reg.get<BatchCache::Component>(id);

        reg.remove<BatchCache::BatchDirtyTag>(id);
        ++m_RebuiltNodes;

        const auto& flags = reg.get<Node::Flags>(id);
        const auto& vis = reg.get<Visibility::Component>(id);
        const bool outOfBounds = vis.Bounds != Visibility::BoundsState::InBounds && id != scene.GetRoot();

        BatchCache::Component cache;

        // 1. Strict culling: the subtree is skipped entirely. Children keep
        //    their dirty tags and are rebuilt once the node is back in bounds.
        const bool pruned = outOfBounds && flags.StrictBounds;
        const bool keepTarget = flags.Rtt && m_Config.RttStrictBounds == RttStrictBoundsPolicy::KeepTarget;

        if (!pruned || keepTarget)
        {
            const auto children = reg.get<Hierarchy::Component>(id).RenderOrder;

            if (flags.Rtt)
            {
                // 2a. Offscreen: nested targets first, then ours, then our quad sampling it.
                const auto& local = reg.get<Node::Local>(id);
                Graphics::RenderTargetPass pass;
                pass.Owner = OwnerId(id);
                pass.Width = TargetExtent(local.Width);
                pass.Height = TargetExtent(local.Height);

                OpListBuilder passOps(pass.Ops, m_CopiedQuads);
                for (NodeId child : children)
                {
                    const auto& childCache = Refresh(scene, child);
                    AppendTargets(cache.Targets, childCache.Targets);
                    passOps.Append(childCache.Ops);
                }
                cache.Targets.push_back(std::move(pass));

                if (!pruned)
                {
                    if (auto quad = MakeOwnQuad(scene, id)) cache.Ops.push_back(std::move(quad));
                }
            }
            else
            {
                // 2b. On-target: own quad below the children.
                OpListBuilder ops(cache.Ops, m_CopiedQuads);
                ops.Append(MakeOwnQuad(scene, id));
                for (NodeId child : children)
                {
                    const auto& childCache = Refresh(scene, child);
                    AppendTargets(cache.Targets, childCache.Targets);
                    ops.Append(childCache.Ops);
                }
            }
        }

        auto& stored = reg.get<BatchCache::Component>(id);
        stored = std::move(cache);
        return stored;
    }

    Graphics::RenderOpPtr Batcher::MakeOwnQuad(SceneGraph& scene, NodeId id) const
    {
        const auto& reg = scene.GetRegistry();
        if (id == scene.GetRoot()) return nullptr;

        const auto& vis = reg.get<Visibility::Component>(id);
        const auto& world = reg.get<Transform::World>(id);
        if (vis.Bounds != Visibility::BoundsState::InBounds || !(world.Alpha > 0.0f)) return nullptr;

        const auto& local = reg.get<Node::Local>(id);
        const auto& look = reg.get<Node::Appearance>(id);
        const auto& flags = reg.get<Node::Flags>(id);
        const auto* texture = reg.try_get<Node::Texture>(id);
        const auto* shader = reg.try_get<Node::Shader>(id);

        const bool hasSize = local.Width > 0.0f && local.Height > 0.0f;

        // 1. Texture binding and colors
        Graphics::TextureBinding binding;
        glm::vec4 uv{0.0f, 0.0f, 1.0f, 1.0f};
        std::array<uint32_t, 4> colors = look.Colors;

        if (flags.Rtt)
        {
            if (!hasSize) return nullptr;
            binding = {Graphics::TextureBinding::Source::RenderTarget, OwnerId(id)};
        }
        else if (texture)
        {
            switch (scene.GetTextures().GetState(texture->Handle))
            {
            case Graphics::TextureState::Loaded:
            {
                // Sub-textures bind their atlas, so frames of one sheet batch together.
                const auto view = scene.GetTextures().GetView(texture->Handle);
                if (!view) return nullptr;
                binding = {Graphics::TextureBinding::Source::Texture, view->Texture.Pack()};
                uv = view->UV;
                break;
            }
            case Graphics::TextureState::Failed:
                // Untextured stand-in. Transparent unless a fallback color is set.
                colors.fill(look.FallbackColor.value_or(Graphics::Color::Transparent));
                break;
            case Graphics::TextureState::Pending:
            case Graphics::TextureState::Freed:
                return nullptr;
            }
        }
        else
        {
            if (!hasSize || !(shader || look.HasColor())) return nullptr;
        }

        // Sampled quads without a tint show the texture as is.
        if (binding.Kind != Graphics::TextureBinding::Source::None && !look.HasColor())
            colors.fill(Graphics::Color::White);

        // 2. Shader
        const glm::vec2 size{local.Width, local.Height};
        Graphics::ShaderProps resolved = Graphics::ResolveShader(shader ? shader->Props : Graphics::ShaderProps{}, size);

        // 3. Quad
        Graphics::Quad quad;
        quad.Corners = world.Corners;
        quad.UV = uv;
        for (size_t i = 0; i < colors.size(); ++i)
            quad.Colors[i] = Graphics::Color::Premultiply(colors[i], world.RenderAlpha);
        quad.Size = size;
        quad.Owner = OwnerId(id);

        auto op = std::make_shared<Graphics::RenderOp>();
        op->Key.Shader = Graphics::MakeShaderKey(resolved);
        op->Key.Texture = binding;
        op->Key.Clip = world.ParentClip;
        op->Key.Blend = look.Blend;
        op->Shader = std::move(resolved);
        op->Quads.push_back(quad);

        return op;
    }
}
