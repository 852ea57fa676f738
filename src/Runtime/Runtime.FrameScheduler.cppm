module;
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

export module Runtime.FrameScheduler;

import Core;
import Graphics;
import Scene;

export namespace Runtime
{
    struct FrameSchedulerConfig
    {
        Scene::ViewportConfig Viewport;
        Scene::BatcherConfig Batching;

        // Period of the Fps refresh in FrameStats. 0 disables the measurement.
        double FpsUpdateIntervalMs = 1000.0;
    };

    struct FrameStats
    {
        uint64_t FrameNumber = 0;
        size_t QuadCount = 0;
        size_t RenderOpCount = 0;
        size_t OffscreenPassCount = 0;
        uint64_t UsedBytes = 0;   // texture memory after the frame
        bool Idle = false;        // no dirty node and no pending load when the tick started
        double Fps = 0.0;         // last completed measurement window
    };

    // -------------------------------------------------------------------------
    // FrameScheduler
    // -------------------------------------------------------------------------
    // Drives one frame of the pipeline:
    //
    //   1. TextureMemoryManager::ProcessCompletions
    //   2. SceneGraph::Update
    //   3. BoundsClassifier::Classify
    //   4. Batcher::Build
    //   5. IRenderSubmitter::Submit
    //   6. TextureMemoryManager::ProcessDeletions
    //   7. frame listener
    //   8. TextureMemoryManager::IdleCleanup, only on idle frames
    //   9. SceneGraph::FlushEvents
    //
    // Node events raised anywhere in 1-8 reach their listeners in step 9, so
    // callbacks are free to mutate the scene; the changes land next tick.
    // -------------------------------------------------------------------------
    class FrameScheduler
    {
    public:
        using FrameListener = std::function<void(const FrameStats&)>;

        FrameScheduler(Scene::SceneGraph& scene, Graphics::IRenderSubmitter& submitter,
                       FrameSchedulerConfig config = {});

        FrameScheduler(const FrameScheduler&) = delete;
        FrameScheduler& operator=(const FrameScheduler&) = delete;

        FrameStats Tick(double dtMs);

        void SetFrameListener(FrameListener listener) { m_FrameListener = std::move(listener); }
        void SetViewport(const Scene::ViewportConfig& viewport);

        [[nodiscard]] uint64_t GetFrameNumber() const { return m_FrameNumber; }
        [[nodiscard]] const FrameStats& GetLastStats() const { return m_LastStats; }
        [[nodiscard]] const Scene::BoundsClassifier& GetClassifier() const { return m_Classifier; }
        [[nodiscard]] const Scene::Batcher& GetBatcher() const { return m_Batcher; }

    private:
        void UpdateFps(double dtMs);

        Scene::SceneGraph& m_Scene;
        Graphics::IRenderSubmitter& m_Submitter;
        FrameSchedulerConfig m_Config;

        Scene::BoundsClassifier m_Classifier;
        Scene::Batcher m_Batcher;

        FrameListener m_FrameListener;
        FrameStats m_LastStats;
        uint64_t m_FrameNumber = 0;

        uint32_t m_FpsFrames = 0;
        double m_FpsElapsedMs = 0.0;
        double m_Fps = 0.0;
    };
}
