#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

import Core;
import Graphics;
import Scene;
import Runtime.FrameScheduler;

#include "TestSceneHelpers.h"

using namespace Scene;

namespace
{
    template <typename Source>
    struct Pipeline
    {
        explicit Pipeline(Graphics::TextureMemoryConfig memory = {}, Runtime::FrameSchedulerConfig config = {})
            : Textures(TextureSource, memory),
              Graph(Textures),
              Scheduler(Graph, Submitter, config)
        {
        }

        NodeId Add(const NodeProps& props)
        {
            auto id = Graph.CreateNode(props);
            return id ? *id : NullNode;
        }

        Source TextureSource;
        Graphics::TextureMemoryManager Textures;
        SceneGraph Graph;
        RecordingSubmitter Submitter;
        Runtime::FrameScheduler Scheduler;
    };
}

TEST(FrameScheduler, ScreenOfTexturedAndTextQuads)
{
    Pipeline<ImmediateTextureSource> p;
    const NodeId background = p.Add(Box(0, 0, 1920, 1080));

    // 190 cells on a 20 x 10 grid: an image and a text block that never share a key
    std::vector<NodeId> leaves;
    for (int i = 0; i < 190; ++i)
    {
        const float x = static_cast<float>(i % 20) * 96.0f;
        const float y = static_cast<float>(i / 20) * 108.0f;

        NodeProps image = Box(background, x, y, 90, 60);
        image.Texture = Graphics::TextureDescriptor::Image("poster" + std::to_string(i) + ".png");
        image.Texture->Width = 64;
        image.Texture->Height = 64;
        leaves.push_back(p.Add(image));

        NodeProps text = Box(background, x, y + 64, 90, 40);
        text.Texture = Graphics::TextureDescriptor::Noise("label" + std::to_string(i), 128, 32);
        leaves.push_back(p.Add(text));
    }
    ASSERT_EQ(leaves.size(), 380u);

    const Runtime::FrameStats first = p.Scheduler.Tick(16.0);
    EXPECT_EQ(first.QuadCount, 380u);
    EXPECT_EQ(first.RenderOpCount, 380u);
    EXPECT_EQ(p.Submitter.Last.QuadCount, 380u);
    EXPECT_FALSE(first.Idle);

    for (size_t i = 0; i < 120; ++i)
        ASSERT_TRUE(p.Graph.DestroyNode(leaves[i]).has_value());

    const Runtime::FrameStats shrunk = p.Scheduler.Tick(16.0);
    EXPECT_EQ(shrunk.QuadCount, 260u);

    const Runtime::FrameStats idle = p.Scheduler.Tick(16.0);
    EXPECT_TRUE(idle.Idle);
    EXPECT_EQ(idle.QuadCount, 260u);
    EXPECT_EQ(p.Submitter.SubmitCount, 3u);
}

TEST(FrameScheduler, FrameNumbersAndSubmission)
{
    Pipeline<ImmediateTextureSource> p;
    p.Add(Box(0, 0, 10, 10, 0xff0000ffu));

    const auto a = p.Scheduler.Tick(16.0);
    const auto b = p.Scheduler.Tick(16.0);

    EXPECT_EQ(a.FrameNumber, 1u);
    EXPECT_EQ(b.FrameNumber, 2u);
    EXPECT_EQ(p.Scheduler.GetFrameNumber(), 2u);
    EXPECT_EQ(p.Scheduler.GetLastStats().FrameNumber, 2u);
    EXPECT_EQ(p.Submitter.SubmitCount, 2u);
    EXPECT_EQ(p.Submitter.Last.QuadCount, 1u);
}

TEST(FrameScheduler, IdleOnlyWhenNothingIsDirtyOrLoading)
{
    Pipeline<ManualTextureSource> p;
    NodeProps props = Box(0, 0, 10, 10);
    props.Texture = Graphics::TextureDescriptor::Image("a.png");
    const NodeId a = p.Add(props);

    EXPECT_FALSE(p.Scheduler.Tick(16.0).Idle); // new node
    EXPECT_FALSE(p.Scheduler.Tick(16.0).Idle); // load in flight

    p.TextureSource.Resolve("a.png");
    const auto loaded = p.Scheduler.Tick(16.0);
    EXPECT_FALSE(loaded.Idle); // the holder was re-batched this frame
    EXPECT_EQ(loaded.QuadCount, 1u);

    EXPECT_TRUE(p.Scheduler.Tick(16.0).Idle);

    ASSERT_TRUE(p.Graph.SetProperty(a, Property::X, 5.0f).has_value());
    EXPECT_FALSE(p.Scheduler.Tick(16.0).Idle);
    EXPECT_TRUE(p.Scheduler.Tick(16.0).Idle);
}

TEST(FrameScheduler, IdleCleanupWaitsForQuietFrame)
{
    Graphics::TextureMemoryConfig memory;
    memory.CriticalThreshold = 10 * kMiB;
    memory.TargetThresholdLevel = 0.5f;
    Pipeline<ImmediateTextureSource> p(memory);

    for (int i = 0; i < 8; ++i)
        p.Textures.Release(p.Textures.Acquire(Graphics::TextureDescriptor::Image("t" + std::to_string(i))));
    ASSERT_EQ(p.Textures.GetUsedBytes(), 8 * kMiB);

    const auto busy = p.Scheduler.Tick(16.0); // the root still needs its first update
    EXPECT_FALSE(busy.Idle);
    EXPECT_EQ(p.Textures.GetUsedBytes(), 8 * kMiB);

    const auto quiet = p.Scheduler.Tick(16.0);
    EXPECT_TRUE(quiet.Idle);
    EXPECT_EQ(quiet.UsedBytes, 8 * kMiB); // reported before the cleanup ran
    EXPECT_EQ(p.Textures.GetUsedBytes(), 5 * kMiB);
}

TEST(FrameScheduler, FpsRefreshesOncePerInterval)
{
    Pipeline<ImmediateTextureSource> p;

    for (int i = 0; i < 49; ++i) EXPECT_DOUBLE_EQ(p.Scheduler.Tick(20.0).Fps, 0.0);
    EXPECT_DOUBLE_EQ(p.Scheduler.Tick(20.0).Fps, 50.0);

    // Holds the last measurement until the next window closes
    for (int i = 0; i < 24; ++i) EXPECT_DOUBLE_EQ(p.Scheduler.Tick(40.0).Fps, 50.0);
    EXPECT_DOUBLE_EQ(p.Scheduler.Tick(40.0).Fps, 25.0);
}

TEST(FrameScheduler, ZeroIntervalDisablesFps)
{
    Runtime::FrameSchedulerConfig config;
    config.FpsUpdateIntervalMs = 0.0;
    Pipeline<ImmediateTextureSource> p({}, config);

    for (int i = 0; i < 100; ++i) p.Scheduler.Tick(20.0);
    EXPECT_DOUBLE_EQ(p.Scheduler.GetLastStats().Fps, 0.0);
}

TEST(FrameScheduler, NonFiniteDeltaIsTreatedAsZero)
{
    Pipeline<ImmediateTextureSource> p;
    p.Add(Box(0, 0, 10, 10, 0xff0000ffu));

    const auto stats = p.Scheduler.Tick(std::numeric_limits<double>::quiet_NaN());
    EXPECT_EQ(stats.QuadCount, 1u);
    EXPECT_DOUBLE_EQ(p.Scheduler.Tick(-5.0).Fps, 0.0);
}

TEST(FrameScheduler, ListenerSeesStatsAndMayEditScene)
{
    Pipeline<ImmediateTextureSource> p;
    const NodeId a = p.Add(Box(0, 0, 10, 10, 0xff0000ffu));

    std::vector<Runtime::FrameStats> seen;
    p.Scheduler.SetFrameListener([&](const Runtime::FrameStats& s)
    {
        seen.push_back(s);
        if (s.FrameNumber == 1)
            EXPECT_TRUE(p.Graph.SetProperty(a, Property::Alpha, 0.0f).has_value());
    });

    EXPECT_EQ(p.Scheduler.Tick(16.0).QuadCount, 1u);
    EXPECT_EQ(p.Scheduler.Tick(16.0).QuadCount, 0u); // change landed on the next tick

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].QuadCount, 1u);
    EXPECT_EQ(seen[1].FrameNumber, 2u);
}

TEST(FrameScheduler, NodeEventsAreDeliveredWithinTheTick)
{
    Pipeline<ImmediateTextureSource> p;
    NodeProps props = Box(0, 0, 10, 10);
    props.Texture = Graphics::TextureDescriptor::Image("a.png");
    const NodeId a = p.Add(props);

    EventLog log;
    log.Listen(p.Graph, a, {NodeEvent::Loaded, NodeEvent::InViewport, NodeEvent::InBounds});

    p.Scheduler.Tick(16.0);

    EXPECT_EQ(log.Count(NodeEvent::Loaded), 1u);
    EXPECT_EQ(log.Count(NodeEvent::InViewport), 1u);
    EXPECT_EQ(log.Count(NodeEvent::InBounds), 1u);
    EXPECT_EQ(p.Graph.QueuedEventCount(), 0u);
}

TEST(FrameScheduler, ViewportChangeReclassifiesOnNextTick)
{
    Pipeline<ImmediateTextureSource> p;
    p.Add(Box(1000, 100, 10, 10, 0xff0000ffu));
    ASSERT_EQ(p.Scheduler.Tick(16.0).QuadCount, 1u);

    Scene::ViewportConfig small;
    small.Width = 800.0f;
    small.Height = 600.0f;
    p.Scheduler.SetViewport(small);

    EXPECT_EQ(p.Scheduler.Tick(16.0).QuadCount, 0u);
    EXPECT_EQ(p.Scheduler.GetClassifier().GetViewportRect(), Graphics::Rect::FromXYWH(0, 0, 800, 600));
}
