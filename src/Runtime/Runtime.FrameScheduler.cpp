module;
#include <cmath>
#include <cstdint>
#include <utility>

module Runtime.FrameScheduler;

import Core;
import Graphics;
import Scene;

namespace Runtime
{
    FrameScheduler::FrameScheduler(Scene::SceneGraph& scene, Graphics::IRenderSubmitter& submitter,
                                   FrameSchedulerConfig config)
        : m_Scene(scene),
          m_Submitter(submitter),
          m_Config(std::move(config)),
          m_Classifier(m_Config.Viewport),
          m_Batcher(m_Config.Batching)
    {
        if (!std::isfinite(m_Config.FpsUpdateIntervalMs) || m_Config.FpsUpdateIntervalMs < 0.0)
        {
            Core::Log::Warn("FrameScheduler: invalid FPS update interval, FPS measurement disabled");
            m_Config.FpsUpdateIntervalMs = 0.0;
        }
    }

    void FrameScheduler::SetViewport(const Scene::ViewportConfig& viewport)
    {
        m_Config.Viewport = viewport;
        m_Classifier.SetViewport(viewport);
    }

    FrameStats FrameScheduler::Tick(double dtMs)
    {
        if (!std::isfinite(dtMs) || dtMs < 0.0) dtMs = 0.0;

        ++m_FrameNumber;
        auto& textures = m_Scene.GetTextures();

        // 1. Finished loads first, so their holders are dirty for this frame
        textures.ProcessCompletions();
        const bool idle = !m_Scene.HasPendingUpdates() && !textures.HasPendingLoads();

        // 2-4. Scene pipeline
        m_Scene.Update(dtMs);
        m_Classifier.Classify(m_Scene);
        const Graphics::FrameBatches& frame = m_Batcher.Build(m_Scene);

        // 5. Hand off
        m_Submitter.Submit(frame);
        textures.ProcessDeletions(m_FrameNumber);

        // 6. Metrics
        UpdateFps(dtMs);

        FrameStats stats;
        stats.FrameNumber = m_FrameNumber;
        stats.QuadCount = frame.QuadCount;
        stats.RenderOpCount = frame.RenderOpCount;
        stats.OffscreenPassCount = frame.Offscreen.size();
        stats.UsedBytes = textures.GetUsedBytes();
        stats.Idle = idle;
        stats.Fps = m_Fps;
        m_LastStats = stats;

        if (m_FrameListener) m_FrameListener(stats);

        // 7. Opportunistic eviction only once nothing is in flight
        if (idle)
        {
            if (const uint64_t freed = textures.IdleCleanup(); freed > 0)
                Core::Log::Debug("Frame {}: idle cleanup released {} bytes", m_FrameNumber, freed);
        }

        // 8. Node events, now that the frame is consistent
        m_Scene.FlushEvents();
        return stats;
    }

    void FrameScheduler::UpdateFps(double dtMs)
    {
        if (m_Config.FpsUpdateIntervalMs <= 0.0) return;

        ++m_FpsFrames;
        m_FpsElapsedMs += dtMs;
        if (m_FpsElapsedMs < m_Config.FpsUpdateIntervalMs) return;

        m_Fps = std::round(m_FpsFrames * 1000.0 / m_FpsElapsedMs);
        Core::Log::Debug("FPS: {}", m_Fps);
        m_FpsFrames = 0;
        m_FpsElapsedMs = 0.0;
    }
}
