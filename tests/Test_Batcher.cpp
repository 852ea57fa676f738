#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <glm/glm.hpp>

import Core;
import Graphics;
import Scene;

#include "TestSceneHelpers.h"

using namespace Scene;
using Graphics::TextureBinding;

namespace
{
    constexpr uint32_t kRed = 0xff0000ffu;
    constexpr uint32_t kGreen = 0x00ff00ffu;
    constexpr uint32_t kBlue = 0x0000ffffu;

    uint64_t Owner(NodeId id)
    {
        return static_cast<uint64_t>(id);
    }

    std::vector<uint64_t> Owners(const std::vector<Graphics::RenderOpPtr>& ops)
    {
        std::vector<uint64_t> out;
        for (const auto& op : ops)
            for (const auto& q : op->Quads) out.push_back(q.Owner);
        return out;
    }

    Graphics::ShaderProps Rounded(float r)
    {
        Graphics::RoundedProps p;
        p.Radius = glm::vec4(r);
        return p;
    }
}

// -----------------------------------------------------------------------------
// Batching
// -----------------------------------------------------------------------------

TEST(Batcher, AdjacentCompatibleQuadsShareOneOp)
{
    SceneHarness<ImmediateTextureSource> h;
    const NodeId a = h.Add(Box(0, 0, 10, 10, kRed));
    const NodeId b = h.Add(Box(20, 0, 10, 10, kGreen));
    const NodeId c = h.Add(Box(40, 0, 10, 10, kBlue));

    const auto& frame = h.Frame();

    ASSERT_EQ(frame.Main.size(), 1u);
    EXPECT_EQ(frame.QuadCount, 3u);
    EXPECT_EQ(frame.RenderOpCount, 1u);
    EXPECT_TRUE(frame.Offscreen.empty());
    EXPECT_EQ(Owners(frame.Main), (std::vector<uint64_t>{Owner(a), Owner(b), Owner(c)}));
    EXPECT_EQ(frame.Main[0]->Key.Texture.Kind, TextureBinding::Source::None);
}

TEST(Batcher, KeyChangeSplitsTheRun)
{
    SceneHarness<ImmediateTextureSource> h;
    h.Add(Box(0, 0, 10, 10, kRed));
    const NodeId b = h.Add(Box(20, 0, 10, 10, kRed));
    h.Add(Box(40, 0, 10, 10, kRed));
    ASSERT_EQ(h.Frame().Main.size(), 1u);

    ASSERT_TRUE(h.Graph.SetShader(b, Rounded(4.0f)).has_value());
    const auto& frame = h.Frame();
    ASSERT_EQ(frame.Main.size(), 3u);
    EXPECT_EQ(frame.Main[1]->Key.Shader.Kind, Graphics::ShaderKind::Rounded);
    EXPECT_EQ(frame.Main[0]->Key, frame.Main[2]->Key);

    ASSERT_TRUE(h.Graph.SetShader(b, Graphics::DefaultProps{}).has_value());
    ASSERT_TRUE(h.Graph.SetProperty(b, Property::Blend, Graphics::BlendMode::Additive).has_value());
    EXPECT_EQ(h.Frame().Main.size(), 3u);

    // Merged runs are fresh ops: the cached single-quad ops are untouched
    ASSERT_TRUE(h.Graph.SetProperty(b, Property::Blend, Graphics::BlendMode::Normal).has_value());
    const auto& merged = h.Frame();
    ASSERT_EQ(merged.Main.size(), 1u);
    EXPECT_EQ(merged.Main[0]->Quads.size(), 3u);
}

TEST(Batcher, ClipRectIsPartOfTheKey)
{
    SceneHarness<ImmediateTextureSource> h;
    NodeProps clipProps = Box(0, 0, 100, 100, kRed);
    clipProps.Clipping = true;
    const NodeId clip = h.Add(clipProps);
    h.Add(Box(clip, 10, 10, 10, 10, kRed));
    h.Add(Box(200, 0, 10, 10, kRed));

    const auto& frame = h.Frame();

    ASSERT_EQ(frame.Main.size(), 3u);
    EXPECT_FALSE(frame.Main[0]->Key.Clip.has_value()); // the clipping node itself is not clipped
    ASSERT_TRUE(frame.Main[1]->Key.Clip.has_value());
    EXPECT_EQ(*frame.Main[1]->Key.Clip, Graphics::Rect::FromXYWH(0, 0, 100, 100));
    EXPECT_FALSE(frame.Main[2]->Key.Clip.has_value());
}

TEST(Batcher, ChildrenDrawAboveParentInRenderOrder)
{
    SceneHarness<ImmediateTextureSource> h;
    const NodeId parent = h.Add(Box(0, 0, 100, 100, kRed));
    const NodeId a = h.Add(Box(parent, 0, 0, 10, 10, kRed));
    const NodeId b = h.Add(Box(parent, 0, 0, 10, 10, kRed));
    ASSERT_TRUE(h.Graph.SetProperty(a, Property::ZIndex, int32_t{1}).has_value());

    const auto& frame = h.Frame();
    EXPECT_EQ(Owners(frame.Main), (std::vector<uint64_t>{Owner(parent), Owner(b), Owner(a)}));
}

// -----------------------------------------------------------------------------
// Eligibility
// -----------------------------------------------------------------------------

TEST(Batcher, OnlyVisibleDrawableNodesEmitQuads)
{
    SceneHarness<ImmediateTextureSource> h;
    h.Add(Box(0, 0, 10, 10));          // no color, no shader
    h.Add(Box(0, 0, 0, 10, kRed));     // no size
    NodeProps hidden = Box(0, 0, 10, 10, kRed);
    hidden.Alpha = 0.0f;
    h.Add(hidden);
    h.Add(Box(5000, 0, 10, 10, kRed)); // out of bounds

    NodeProps shaded = Box(0, 0, 10, 10);
    shaded.Shader = Rounded(2.0f);
    const NodeId drawn = h.Add(shaded);

    const auto& frame = h.Frame();
    EXPECT_EQ(Owners(frame.Main), std::vector<uint64_t>{Owner(drawn)});
    EXPECT_EQ(frame.Main[0]->Quads[0].Colors[0], Graphics::Color::Transparent);
}

TEST(Batcher, QuadColorsArePremultipliedWithEffectiveAlpha)
{
    SceneHarness<ImmediateTextureSource> h;
    NodeProps parentProps = Box(0, 0, 100, 100);
    parentProps.Alpha = 0.5f;
    const NodeId parent = h.Add(parentProps);
    h.Add(Box(parent, 0, 0, 10, 10, kRed));

    const auto& frame = h.Frame();
    ASSERT_EQ(frame.QuadCount, 1u);
    for (uint32_t c : frame.Main[0]->Quads[0].Colors)
        EXPECT_EQ(c, 0x80000080u);
}

TEST(Batcher, StrictOutOfBoundsPrunesSubtree)
{
    SceneHarness<ImmediateTextureSource> h;
    NodeProps strict = Box(5000, 0, 10, 10, kRed);
    strict.StrictBounds = true;
    const NodeId parent = h.Add(strict);
    const NodeId child = h.Add(Box(parent, -4900, 0, 10, 10, kRed)); // on screen by itself

    const NodeId loose = h.Add(Box(5000, 0, 10, 10, kRed));
    const NodeId looseChild = h.Add(Box(loose, -4900, 0, 10, 10, kRed));

    const auto& frame = h.Frame();
    EXPECT_EQ(Owners(frame.Main), std::vector<uint64_t>{Owner(looseChild)});

    ASSERT_TRUE(h.Graph.SetProperty(parent, Property::X, 4950.0f).has_value()); // still out, child moves too
    ASSERT_TRUE(h.Graph.SetProperty(parent, Property::StrictBounds, false).has_value());
    const auto& after = h.Frame();
    EXPECT_EQ(Owners(after.Main), (std::vector<uint64_t>{Owner(child), Owner(looseChild)}));
}

// -----------------------------------------------------------------------------
// Textures
// -----------------------------------------------------------------------------

TEST(Batcher, PendingTextureIsOmittedUntilLoaded)
{
    SceneHarness<ManualTextureSource> h;
    NodeProps props = Box(0, 0, 10, 10);
    props.Texture = Graphics::TextureDescriptor::Image("a.png");
    const NodeId a = h.Add(props);

    EXPECT_EQ(h.Frame().QuadCount, 0u);

    h.TextureSource.Resolve("a.png");
    const auto& frame = h.Frame();
    ASSERT_EQ(frame.QuadCount, 1u);

    const auto& op = *frame.Main[0];
    EXPECT_EQ(op.Key.Texture.Kind, TextureBinding::Source::Texture);
    EXPECT_EQ(op.Key.Texture.Id, h.Graph.GetTexture(a)->Pack());
    EXPECT_EQ(op.Quads[0].Colors[0], Graphics::Color::White); // untinted
}

TEST(Batcher, FailedTextureFallsBackToColor)
{
    SceneHarness<ImmediateTextureSource> h;
    NodeProps withFallback = Box(0, 0, 10, 10);
    withFallback.Texture = Graphics::TextureDescriptor::Image("fail-a.png");
    withFallback.FallbackColor = kGreen;
    const NodeId a = h.Add(withFallback);

    NodeProps without = Box(20, 0, 10, 10);
    without.Texture = Graphics::TextureDescriptor::Image("fail-b.png");
    const NodeId b = h.Add(without);

    const auto& frame = h.Frame();
    ASSERT_EQ(frame.Main.size(), 1u);
    const auto& op = *frame.Main[0];
    EXPECT_EQ(op.Key.Texture.Kind, TextureBinding::Source::None);
    ASSERT_EQ(op.Quads.size(), 2u);
    EXPECT_EQ(op.Quads[0].Owner, Owner(a));
    EXPECT_EQ(op.Quads[0].Colors[2], kGreen);
    EXPECT_EQ(op.Quads[1].Owner, Owner(b));
    EXPECT_EQ(op.Quads[1].Colors[2], Graphics::Color::Transparent);
}

TEST(Batcher, EvictedTextureDropsTheQuad)
{
    SceneHarness<ImmediateTextureSource> h;
    NodeProps props = Box(0, 0, 10, 10, kRed);
    props.Texture = Graphics::TextureDescriptor::Image("a.png");
    const NodeId a = h.Add(props);
    ASSERT_EQ(h.Frame().QuadCount, 1u);

    ASSERT_TRUE(h.Textures.Unload(*h.Graph.GetTexture(a)).has_value());
    EXPECT_EQ(h.Frame().QuadCount, 0u);
}

TEST(Batcher, OutOfMemoryTextureRendersFallback)
{
    Graphics::TextureMemoryConfig memory;
    memory.CriticalThreshold = 1 * kMiB; // room for exactly one 512 x 512 texture
    SceneHarness<ImmediateTextureSource> h(memory);

    NodeProps first = Box(0, 0, 10, 10);
    first.Texture = Graphics::TextureDescriptor::Image("a.png");
    const NodeId a = h.Add(first);

    NodeProps second = Box(20, 0, 10, 10);
    second.Texture = Graphics::TextureDescriptor::Image("b.png");
    second.FallbackColor = kGreen;
    const NodeId b = h.Add(second);

    EventLog log;
    log.Listen(h.Graph, b, {NodeEvent::Loaded, NodeEvent::Failed});

    const auto& frame = h.Frame();
    h.Graph.FlushEvents();

    ASSERT_EQ(log.Events, std::vector<NodeEvent>{NodeEvent::Failed});
    EXPECT_EQ(log.Errors[0], Core::ErrorCode::OutOfMemory);
    EXPECT_EQ(h.Textures.GetState(*h.Graph.GetTexture(a)), Graphics::TextureState::Loaded);
    EXPECT_EQ(h.Textures.GetState(*h.Graph.GetTexture(b)), Graphics::TextureState::Failed);
    EXPECT_EQ(h.Textures.GetUsedBytes(), 1 * kMiB);

    ASSERT_EQ(frame.Main.size(), 2u);
    EXPECT_EQ(frame.Main[0]->Key.Texture.Kind, TextureBinding::Source::Texture);
    EXPECT_EQ(frame.Main[1]->Key.Texture.Kind, TextureBinding::Source::None);
    ASSERT_EQ(frame.Main[1]->Quads.size(), 1u);
    EXPECT_EQ(frame.Main[1]->Quads[0].Owner, Owner(b));
    EXPECT_EQ(frame.Main[1]->Quads[0].Colors[0], kGreen);
}

TEST(Batcher, SpriteSheetFramesShareTheAtlasBinding)
{
    SceneHarness<ImmediateTextureSource> h; // the sheet decodes to 512 x 512
    const auto sheet = Graphics::TextureDescriptor::Image("sheet.png");

    NodeProps left = Box(0, 0, 32, 32);
    left.Texture = Graphics::TextureDescriptor::Sub(sheet, {0, 0, 128, 128});
    const NodeId a = h.Add(left);

    NodeProps right = Box(40, 0, 32, 32);
    right.Texture = Graphics::TextureDescriptor::Sub(sheet, {256, 128, 256, 128});
    const NodeId b = h.Add(right);

    const auto& frame = h.Frame();
    EXPECT_EQ(h.TextureSource.LoadCount, 1u);
    ASSERT_EQ(frame.Main.size(), 1u);

    const auto& op = *frame.Main[0];
    const auto atlas = h.Textures.Find(sheet);
    ASSERT_TRUE(atlas.has_value());
    EXPECT_EQ(op.Key.Texture, (TextureBinding{TextureBinding::Source::Texture, atlas->Pack()}));

    ASSERT_EQ(op.Quads.size(), 2u);
    EXPECT_EQ(op.Quads[0].Owner, Owner(a));
    EXPECT_EQ(op.Quads[0].UV, glm::vec4(0.0f, 0.0f, 0.25f, 0.25f));
    EXPECT_EQ(op.Quads[1].Owner, Owner(b));
    EXPECT_EQ(op.Quads[1].UV, glm::vec4(0.5f, 0.25f, 1.0f, 0.5f));
}

TEST(Batcher, SpriteWaitsForItsSheet)
{
    SceneHarness<ManualTextureSource> h;
    NodeProps props = Box(0, 0, 32, 32);
    props.Texture = Graphics::TextureDescriptor::Sub(Graphics::TextureDescriptor::Image("sheet.png"), {0, 0, 64, 64});
    const NodeId a = h.Add(props);
    EventLog log;
    log.Listen(h.Graph, a, {NodeEvent::Loaded, NodeEvent::Failed});

    EXPECT_EQ(h.Frame().QuadCount, 0u);
    EXPECT_EQ(h.TextureSource.RequestCount("sheet.png"), 1u);

    h.TextureSource.Resolve("sheet.png", 256, 256);
    const auto& frame = h.Frame();
    h.Graph.FlushEvents();

    ASSERT_EQ(log.Events, std::vector<NodeEvent>{NodeEvent::Loaded});
    ASSERT_EQ(frame.QuadCount, 1u);
    EXPECT_EQ(frame.Main[0]->Quads[0].UV, glm::vec4(0.0f, 0.0f, 0.25f, 0.25f));
}

// -----------------------------------------------------------------------------
// Render to texture
// -----------------------------------------------------------------------------

TEST(Batcher, NestedTargetsRenderBeforeTheirSamplers)
{
    SceneHarness<ImmediateTextureSource> h;
    NodeProps outerProps = Box(100, 100, 200, 100.4f);
    outerProps.Rtt = true;
    outerProps.Alpha = 0.5f;
    const NodeId outer = h.Add(outerProps);
    const NodeId child = h.Add(Box(outer, 10, 10, 20, 20, kRed));

    NodeProps innerProps = Box(outer, 50, 0, 30, 30);
    innerProps.Rtt = true;
    const NodeId inner = h.Add(innerProps);
    const NodeId innerChild = h.Add(Box(inner, 0, 0, 5, 5, kBlue));

    const auto& frame = h.Frame();

    ASSERT_EQ(frame.Offscreen.size(), 2u);
    const auto& innerPass = frame.Offscreen[0];
    const auto& outerPass = frame.Offscreen[1];

    EXPECT_EQ(innerPass.Owner, Owner(inner));
    EXPECT_EQ(innerPass.Width, 30u);
    EXPECT_EQ(Owners(innerPass.Ops), std::vector<uint64_t>{Owner(innerChild)});

    EXPECT_EQ(outerPass.Owner, Owner(outer));
    EXPECT_EQ(outerPass.Width, 200u);
    EXPECT_EQ(outerPass.Height, 101u);
    EXPECT_EQ(Owners(outerPass.Ops), (std::vector<uint64_t>{Owner(child), Owner(inner)}));
    ASSERT_EQ(outerPass.Ops.size(), 2u);
    EXPECT_EQ(outerPass.Ops[1]->Key.Texture,
              (TextureBinding{TextureBinding::Source::RenderTarget, Owner(inner)}));

    // Target-space content ignores the outer node's alpha; its own quad carries it
    EXPECT_EQ(outerPass.Ops[0]->Quads[0].Colors[0], kRed);
    ASSERT_EQ(frame.Main.size(), 1u);
    EXPECT_EQ(frame.Main[0]->Key.Texture,
              (TextureBinding{TextureBinding::Source::RenderTarget, Owner(outer)}));
    EXPECT_EQ(frame.Main[0]->Quads[0].Colors[0], 0x80808080u);

    EXPECT_EQ(frame.QuadCount, 4u);
    EXPECT_EQ(frame.RenderOpCount, 4u);
}

namespace
{
    enum class FlagOrder { RttFirst, StrictFirst };

    Graphics::FrameBatches RunOffscreenRtt(RttStrictBoundsPolicy policy, FlagOrder order)
    {
        BatcherConfig batching;
        batching.RttStrictBounds = policy;
        SceneHarness<ImmediateTextureSource> h({}, {}, batching);

        const NodeId rtt = h.Add(Box(5000, 0, 100, 100));
        h.Add(Box(rtt, 0, 0, 10, 10, kRed));
        h.Frame();

        const Property first = order == FlagOrder::RttFirst ? Property::Rtt : Property::StrictBounds;
        const Property second = order == FlagOrder::RttFirst ? Property::StrictBounds : Property::Rtt;
        EXPECT_TRUE(h.Graph.SetProperty(rtt, first, true).has_value());
        h.Frame();
        EXPECT_TRUE(h.Graph.SetProperty(rtt, second, true).has_value());
        return h.Frame();
    }
}

TEST(Batcher, PruneTargetPolicyDropsOffscreenPass)
{
    for (FlagOrder order : {FlagOrder::RttFirst, FlagOrder::StrictFirst})
    {
        const auto frame = RunOffscreenRtt(RttStrictBoundsPolicy::PruneTarget, order);
        EXPECT_TRUE(frame.Offscreen.empty());
        EXPECT_TRUE(frame.Main.empty());
        EXPECT_EQ(frame.QuadCount, 0u);
    }
}

TEST(Batcher, KeepTargetPolicyRendersPassWithoutQuad)
{
    for (FlagOrder order : {FlagOrder::RttFirst, FlagOrder::StrictFirst})
    {
        const auto frame = RunOffscreenRtt(RttStrictBoundsPolicy::KeepTarget, order);
        ASSERT_EQ(frame.Offscreen.size(), 1u);
        EXPECT_EQ(frame.Offscreen[0].Ops.size(), 1u);
        EXPECT_TRUE(frame.Main.empty());
        EXPECT_EQ(frame.QuadCount, 1u);
    }
}

// -----------------------------------------------------------------------------
// Incremental rebuilds
// -----------------------------------------------------------------------------

TEST(Batcher, StaticSceneReturnsTheSameFrame)
{
    SceneHarness<ImmediateTextureSource> h;
    for (int i = 0; i < 10; ++i) h.Add(Box(i * 20.0f, 0, 10, 10, kRed));

    const Graphics::FrameBatches* first = &h.Frame();
    const Graphics::RenderOp* op = first->Main[0].get();

    const Graphics::FrameBatches* second = &h.Frame();
    EXPECT_EQ(first, second);
    EXPECT_EQ(second->Main[0].get(), op);
    EXPECT_EQ(h.Batches.GetRebuiltNodeCount(), 0u);
}

TEST(Batcher, OnlyDirtyPathIsRebuilt)
{
    SceneHarness<ImmediateTextureSource> h;
    NodeProps roundedProps = Box(0, 0, 10, 10, kRed);
    roundedProps.Shader = Rounded(2.0f);
    h.Add(roundedProps);
    const NodeId plain = h.Add(Box(20, 0, 10, 10, kRed));
    roundedProps.X = 40.0f;
    h.Add(roundedProps);
    roundedProps.X = 60.0f;
    roundedProps.Shader = Rounded(3.0f);
    h.Add(roundedProps);

    const auto& before = h.Frame();
    ASSERT_EQ(before.Main.size(), 4u);
    EXPECT_EQ(h.Batches.GetRebuiltNodeCount(), 5u); // four nodes and the root
    std::vector<const Graphics::RenderOp*> ops;
    for (const auto& op : before.Main) ops.push_back(op.get());

    ASSERT_TRUE(h.Graph.SetProperty(plain, Property::Color, kBlue).has_value());
    const auto& after = h.Frame();

    EXPECT_EQ(h.Batches.GetRebuiltNodeCount(), 2u);
    ASSERT_EQ(after.Main.size(), 4u);
    EXPECT_EQ(after.Main[0].get(), ops[0]);
    EXPECT_NE(after.Main[1].get(), ops[1]);
    EXPECT_EQ(after.Main[2].get(), ops[2]);
    EXPECT_EQ(after.Main[3].get(), ops[3]);
    EXPECT_EQ(after.Main[1]->Quads[0].Colors[0], kBlue);
}

TEST(Batcher, DestroyedNodeLeavesTheFrame)
{
    SceneHarness<ImmediateTextureSource> h;
    const NodeId a = h.Add(Box(0, 0, 10, 10, kRed));
    const NodeId b = h.Add(Box(20, 0, 10, 10, kRed));
    ASSERT_EQ(h.Frame().QuadCount, 2u);

    ASSERT_TRUE(h.Graph.DestroyNode(a).has_value());
    const auto& frame = h.Frame();
    EXPECT_EQ(Owners(frame.Main), std::vector<uint64_t>{Owner(b)});
}

TEST(Batcher, LongRunCopiesEachQuadOnce)
{
    constexpr size_t kCount = 4000;
    SceneHarness<ImmediateTextureSource> h;
    std::vector<NodeId> nodes;
    nodes.reserve(kCount);
    for (size_t i = 0; i < kCount; ++i)
        nodes.push_back(h.Add(Box(static_cast<float>(i % 100) * 10.0f, static_cast<float>(i / 100) * 10.0f, 8, 8, kRed)));

    const auto& frame = h.Frame();
    ASSERT_EQ(frame.Main.size(), 1u);
    EXPECT_EQ(frame.QuadCount, kCount);
    EXPECT_EQ(h.Batches.GetCopiedQuadCount(), kCount);

    // One dirty leaf rebuilds the root's whole run.
    ASSERT_TRUE(h.Graph.SetProperty(nodes[1234], Property::Color, kBlue).has_value());
    const auto& after = h.Frame();

    EXPECT_EQ(h.Batches.GetRebuiltNodeCount(), 2u);
    EXPECT_EQ(h.Batches.GetCopiedQuadCount(), kCount);
    ASSERT_EQ(after.Main.size(), 1u);
    ASSERT_EQ(after.Main[0]->Quads.size(), kCount);
    EXPECT_EQ(after.Main[0]->Quads[1234].Colors[0], kBlue);
}
