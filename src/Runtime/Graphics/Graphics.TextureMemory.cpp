module;

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module Graphics:TextureMemory.Impl;
import :TextureMemory;
import :Texture;
import :TextureSource;
import Core;

namespace Graphics
{
    namespace
    {
        constexpr uint32_t kRetireFrames = 2;

        double ToMiB(uint64_t bytes)
        {
            return static_cast<double>(bytes) / (1024.0 * 1024.0);
        }

        template <typename T>
        bool IsReady(const std::future<T>& f)
        {
            return f.valid() && f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }

        // A source that drops its promise or stores an exception fails the load.
        Core::Expected<ImageData> TakeResult(std::future<Core::Expected<ImageData>>& f, const TextureDescriptor& desc)
        {
            try
            {
                return f.get();
            }
            catch (const std::exception& e)
            {
                Core::Log::Error("Texture '{}': load abandoned by its source: {}", desc.Source, e.what());
                return Core::Err<ImageData>(Core::ErrorCode::AssetLoadFailed);
            }
        }
    }

    TextureMemoryManager::TextureMemoryManager(ITextureSource& source, TextureMemoryConfig config)
        : m_Source(source), m_Config(config)
    {
        if (!std::isfinite(m_Config.TargetThresholdLevel))
        {
            Core::Log::Warn("TextureMemoryManager: non-finite target threshold level, using 0.5");
            m_Config.TargetThresholdLevel = 0.5f;
        }
        m_Config.TargetThresholdLevel = std::clamp(m_Config.TargetThresholdLevel, 0.0f, 1.0f);

        m_Textures.Initialize(kRetireFrames);
        m_UsedBytes = m_Config.BaselineMemory;

        if (m_Config.CriticalThreshold == 0)
            Core::Log::Info("TextureMemoryManager: critical threshold is 0, texture cleanup disabled");
    }

    TextureMemoryManager::~TextureMemoryManager()
    {
        if (!m_PendingLoads.empty())
            Core::Log::Debug("TextureMemoryManager: dropping {} in-flight loads", m_PendingLoads.size());
    }

    uint64_t TextureMemoryManager::GetTargetBytes() const
    {
        const auto level = static_cast<uint64_t>(
            std::llround(static_cast<double>(m_Config.CriticalThreshold) * m_Config.TargetThresholdLevel));
        return std::max(level, m_Config.BaselineMemory);
    }

    TextureHandle TextureMemoryManager::Acquire(const TextureDescriptor& desc)
    {
        // 1. Cache hit: share the existing instance
        if (auto it = m_Cache.find(desc); it != m_Cache.end())
        {
            if (Texture* tex = m_Textures.TryGet(it->second))
            {
                ++tex->RefCount;
                tex->LastUsed = ++m_Clock;
                tex->PreventCleanup |= desc.PreventCleanup;
                return it->second;
            }
            m_Cache.erase(it);
        }

        // 2. Miss: new Pending instance
        const TextureHandle handle = m_Textures.Create();
        Texture& tex = *m_Textures.TryGet(handle); // pointer stable across pool growth
        tex.Descriptor = desc;
        tex.RefCount = 1;
        tex.LastUsed = ++m_Clock;
        tex.PreventCleanup = desc.PreventCleanup;
        m_Cache.emplace(desc, handle);

        if (desc.Kind == TextureKind::SubTexture)
        {
            AttachSubTexture(handle, tex);
            return handle;
        }

        // 3. Start the load. Sources that resolve synchronously go through the
        //    allocation path right here.
        tex.Load = m_Source.Load(desc);
        if (!tex.Load.valid())
        {
            Complete(handle, tex, Core::Err<ImageData>(Core::ErrorCode::AssetLoadFailed));
        }
        else if (IsReady(tex.Load))
        {
            Complete(handle, tex, TakeResult(tex.Load, desc));
        }
        else
        {
            m_PendingLoads.push_back(handle);
        }
        return handle;
    }

    void TextureMemoryManager::Release(TextureHandle handle)
    {
        Texture* tex = m_Textures.TryGet(handle);
        if (!tex || tex->RefCount == 0) return;

        --tex->RefCount;
        tex->LastUsed = ++m_Clock;
        if (tex->RefCount > 0) return;

        if (tex->Descriptor.Kind == TextureKind::SubTexture)
        {
            // Nothing resident of its own: drop it together with its parent reference.
            Free(handle, *tex);
            return;
        }

        switch (tex->State)
        {
        case TextureState::Pending:
            // Cancel: the future is dropped unread, a late result has nowhere to land.
            std::erase(m_PendingLoads, handle);
            Free(handle, *tex);
            break;
        case TextureState::Failed:
            // Nothing resident; forget it so the next request retries the load.
            Retire(handle, *tex);
            break;
        case TextureState::Loaded:
        case TextureState::Freed:
            break; // stays resident until a cleanup policy picks it
        }
    }

    Core::Result TextureMemoryManager::Unload(TextureHandle handle)
    {
        Texture* tex = m_Textures.TryGet(handle);
        if (!tex) return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (tex->State != TextureState::Loaded)
        {
            Core::Log::Warn("TextureMemoryManager::Unload -- texture {} is {}, only loaded textures can be unloaded",
                            handle.Index, TextureStateToString(tex->State));
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        if (tex->RefCount > 0)
            Core::Log::Debug("TextureMemoryManager: unloading texture {} with {} holders", handle.Index, tex->RefCount);

        Free(handle, *tex);
        return Core::Ok();
    }

    uint32_t TextureMemoryManager::ProcessCompletions()
    {
        // Listeners may acquire or release while we resolve; work on a detached list.
        std::vector<TextureHandle> pending;
        pending.swap(m_PendingLoads);

        std::vector<TextureHandle> waiting;
        uint32_t resolved = 0;

        for (TextureHandle handle : pending)
        {
            Texture* tex = m_Textures.TryGet(handle);
            if (!tex || tex->State != TextureState::Pending) continue;

            if (!tex->Load.valid())
            {
                Complete(handle, *tex, Core::Err<ImageData>(Core::ErrorCode::AssetLoadFailed));
                ++resolved;
                continue;
            }
            if (!IsReady(tex->Load))
            {
                waiting.push_back(handle);
                continue;
            }

            Complete(handle, *tex, TakeResult(tex->Load, tex->Descriptor));
            ++resolved;
        }

        // Keep request order: older loads first, then anything acquired by listeners.
        waiting.insert(waiting.end(), m_PendingLoads.begin(), m_PendingLoads.end());
        std::erase_if(waiting, [this](TextureHandle h)
        {
            const Texture* tex = m_Textures.TryGet(h);
            return !tex || tex->State != TextureState::Pending;
        });
        m_PendingLoads.swap(waiting);

        MaybeLogUsage();
        return resolved;
    }

    void TextureMemoryManager::Complete(TextureHandle handle, Texture& tex, Core::Expected<ImageData> result)
    {
        tex.Load = {};

        // 1. Decode failure
        if (!result)
        {
            tex.State = TextureState::Failed;
            tex.Error = result.error();
            Core::Log::Warn("Texture '{}' failed to load: {}", tex.Descriptor.Source,
                            Core::ErrorCodeToString(tex.Error));
            Emit(handle, TextureState::Failed, tex.Error);
            ResolveSubTextures(tex);
            return;
        }

        // 2. Allocation (may evict synchronously)
        const uint64_t bytes = result->ByteSize();
        if (auto alloc = Allocate(handle, bytes); !alloc)
        {
            tex.State = TextureState::Failed;
            tex.Error = alloc.error();
            ++m_FailedAllocations;
            Core::Log::Error("Texture '{}' ({:.2f} MiB) rejected: {} ({:.2f} / {:.2f} MiB in use)",
                             tex.Descriptor.Source, ToMiB(bytes), Core::ErrorCodeToString(tex.Error),
                             ToMiB(m_UsedBytes), ToMiB(m_Config.CriticalThreshold));
            Emit(handle, TextureState::Failed, tex.Error);
            ResolveSubTextures(tex);
            return;
        }

        // 3. Resident
        tex.State = TextureState::Loaded;
        tex.Width = result->Width;
        tex.Height = result->Height;
        tex.ByteSize = bytes;
        tex.LastUsed = ++m_Clock;
        tex.Image = std::make_shared<const ImageData>(std::move(*result));
        Emit(handle, TextureState::Loaded);
        ResolveSubTextures(tex);
    }

    void TextureMemoryManager::AttachSubTexture(TextureHandle handle, Texture& tex)
    {
        if (!tex.Descriptor.Parent)
        {
            tex.State = TextureState::Failed;
            tex.Error = Core::ErrorCode::InvalidArgument;
            Core::Log::Error("Sub-texture of '{}' has no parent descriptor", tex.Descriptor.Source);
            Emit(handle, TextureState::Failed, tex.Error);
            return;
        }

        // The parent may resolve inside this call; the sub-texture catches up below.
        tex.Parent = Acquire(*tex.Descriptor.Parent);
        Texture* parent = m_Textures.TryGet(tex.Parent);
        if (!parent) return;

        parent->SubTextures.push_back(handle);
        ResolveSubTexture(handle, tex, *parent);
    }

    void TextureMemoryManager::ResolveSubTexture(TextureHandle handle, Texture& sub, const Texture& parent)
    {
        if (sub.State != TextureState::Pending) return;

        switch (parent.State)
        {
        case TextureState::Loaded:
        {
            const TextureRegion& r = sub.Descriptor.Region;
            const uint32_t w = r.Width ? r.Width : (r.X < parent.Width ? parent.Width - r.X : 0u);
            const uint32_t h = r.Height ? r.Height : (r.Y < parent.Height ? parent.Height - r.Y : 0u);
            if (w == 0 || h == 0 ||
                static_cast<uint64_t>(r.X) + w > parent.Width || static_cast<uint64_t>(r.Y) + h > parent.Height)
            {
                sub.State = TextureState::Failed;
                sub.Error = Core::ErrorCode::InvalidArgument;
                Core::Log::Warn("Sub-texture ({}, {}) {}x{} lies outside '{}' ({}x{})", r.X, r.Y, w, h,
                                parent.Descriptor.Source, parent.Width, parent.Height);
                Emit(handle, TextureState::Failed, sub.Error);
                break;
            }

            const float pw = static_cast<float>(parent.Width);
            const float ph = static_cast<float>(parent.Height);
            sub.State = TextureState::Loaded;
            sub.Width = w;
            sub.Height = h;
            sub.LastUsed = ++m_Clock;
            sub.UV = {r.X / pw, r.Y / ph, (r.X + w) / pw, (r.Y + h) / ph};
            Emit(handle, TextureState::Loaded);
            break;
        }
        case TextureState::Failed:
            sub.State = TextureState::Failed;
            sub.Error = parent.Error;
            Emit(handle, TextureState::Failed, sub.Error);
            break;
        case TextureState::Pending:
        case TextureState::Freed:
            return;
        }

        ResolveSubTextures(sub);
    }

    void TextureMemoryManager::ResolveSubTextures(const Texture& parent)
    {
        // Copy: listeners may attach further sub-textures.
        const std::vector<TextureHandle> subs = parent.SubTextures;
        for (TextureHandle h : subs)
        {
            if (Texture* sub = m_Textures.TryGet(h))
                ResolveSubTexture(h, *sub, parent);
        }
    }

    Core::Result TextureMemoryManager::Allocate(TextureHandle handle, uint64_t bytes)
    {
        const uint64_t critical = m_Config.CriticalThreshold;
        if (critical != 0 && m_UsedBytes + bytes > critical)
        {
            ++m_CriticalCleanups;
            const uint64_t freed = EvictDownTo(GetTargetBytes(), bytes);
            Core::Log::Warn("Critical texture cleanup for texture {}: freed {:.2f} MiB, {:.2f} MiB in use, {:.2f} MiB requested",
                            handle.Index, ToMiB(freed), ToMiB(m_UsedBytes), ToMiB(bytes));

            if (m_UsedBytes + bytes > critical)
                return Core::Err(Core::ErrorCode::OutOfMemory);
        }

        m_UsedBytes += bytes;
        return Core::Ok();
    }

    uint64_t TextureMemoryManager::EvictDownTo(uint64_t goal, uint64_t reserve)
    {
        struct Candidate
        {
            TextureHandle Handle;
            uint64_t LastUsed;
        };

        std::vector<Candidate> candidates;
        m_Textures.ForEach([&](TextureHandle h, const Texture& tex)
        {
            if (tex.State == TextureState::Loaded && tex.RefCount == 0 && !tex.PreventCleanup)
                candidates.push_back({h, tex.LastUsed});
        });

        // Strict LRU. The clock is unique per touch, ties cannot happen.
        std::sort(candidates.begin(), candidates.end(),
                  [](const Candidate& a, const Candidate& b) { return a.LastUsed < b.LastUsed; });

        uint64_t freed = 0;
        for (const Candidate& c : candidates)
        {
            if (m_UsedBytes + reserve <= goal) break;

            Texture* tex = m_Textures.TryGet(c.Handle);
            if (!tex || tex->State != TextureState::Loaded || tex->RefCount != 0) continue;

            freed += tex->ByteSize;
            Free(c.Handle, *tex);
        }
        return freed;
    }

    uint64_t TextureMemoryManager::IdleCleanup()
    {
        if (m_Config.CriticalThreshold == 0) return 0;

        const uint64_t target = GetTargetBytes();
        if (m_UsedBytes <= target) return 0;

        const uint64_t freed = EvictDownTo(target, 0);
        if (freed > 0)
        {
            Core::Log::Debug("Idle texture cleanup freed {:.2f} MiB, {:.2f} MiB in use",
                             ToMiB(freed), ToMiB(m_UsedBytes));
        }
        return freed;
    }

    void TextureMemoryManager::ProcessDeletions(uint64_t currentFrame)
    {
        m_CurrentFrame = currentFrame;
        m_Textures.ProcessDeletions(currentFrame);
    }

    void TextureMemoryManager::Free(TextureHandle handle, Texture& tex)
    {
        if (tex.State == TextureState::Loaded)
            m_UsedBytes -= tex.ByteSize;

        // Dependents sample our pixels, they go first.
        const std::vector<TextureHandle> subs = std::move(tex.SubTextures);
        tex.SubTextures.clear();
        for (TextureHandle h : subs)
        {
            if (Texture* sub = m_Textures.TryGet(h))
                Free(h, *sub);
        }

        tex.State = TextureState::Freed;
        tex.Image.reset();
        tex.Load = {};
        Retire(handle, tex);
        Emit(handle, TextureState::Freed);

        if (tex.Parent)
        {
            const TextureHandle parent = tex.Parent;
            tex.Parent = {};
            if (Texture* p = m_Textures.TryGet(parent))
                std::erase(p->SubTextures, handle);
            Release(parent);
        }
    }

    void TextureMemoryManager::Retire(TextureHandle handle, Texture& tex)
    {
        if (auto it = m_Cache.find(tex.Descriptor); it != m_Cache.end() && it->second == handle)
            m_Cache.erase(it);
        m_Textures.Remove(handle, m_CurrentFrame);
    }

    TextureState TextureMemoryManager::GetState(TextureHandle handle) const
    {
        const Texture* tex = m_Textures.TryGet(handle);
        return tex ? tex->State : TextureState::Freed;
    }

    std::optional<TextureInfo> TextureMemoryManager::GetInfo(TextureHandle handle) const
    {
        const Texture* tex = m_Textures.TryGet(handle);
        if (!tex) return std::nullopt;

        TextureInfo info;
        info.State = tex->State;
        info.Width = tex->Width;
        info.Height = tex->Height;
        info.ByteSize = tex->ByteSize;
        info.RefCount = tex->RefCount;
        info.LastUsed = tex->LastUsed;
        info.PreventCleanup = tex->PreventCleanup;
        info.Error = tex->Error;
        return info;
    }

    std::shared_ptr<const ImageData> TextureMemoryManager::GetImage(TextureHandle handle) const
    {
        const Texture* tex = m_Textures.TryGet(handle);
        return (tex && tex->State == TextureState::Loaded) ? tex->Image : nullptr;
    }

    std::optional<TextureView> TextureMemoryManager::GetView(TextureHandle handle) const
    {
        const Texture* tex = m_Textures.TryGet(handle);
        if (!tex || tex->State != TextureState::Loaded) return std::nullopt;
        if (tex->Descriptor.Kind != TextureKind::SubTexture) return TextureView{handle};

        const auto parent = GetView(tex->Parent);
        if (!parent) return std::nullopt;

        // Map the region into the parent's own UV rectangle.
        const glm::vec4& p = parent->UV;
        const glm::vec4& r = tex->UV;
        const float du = p.z - p.x;
        const float dv = p.w - p.y;
        return TextureView{parent->Texture, {p.x + r.x * du, p.y + r.y * dv, p.x + r.z * du, p.y + r.w * dv}};
    }

    std::optional<TextureHandle> TextureMemoryManager::Find(const TextureDescriptor& desc) const
    {
        auto it = m_Cache.find(desc);
        if (it == m_Cache.end() || !m_Textures.TryGet(it->second)) return std::nullopt;
        return it->second;
    }

    MemoryInfo TextureMemoryManager::GetMemoryInfo() const
    {
        MemoryInfo info;
        info.CriticalThreshold = m_Config.CriticalThreshold;
        info.TargetThreshold = GetTargetBytes();
        info.UsedBytes = m_UsedBytes;
        info.BaselineBytes = m_Config.BaselineMemory;
        info.PendingLoads = PendingLoadCount();
        info.CriticalCleanups = m_CriticalCleanups;
        info.FailedAllocations = m_FailedAllocations;

        m_Textures.ForEach([&info](TextureHandle, const Texture& tex)
        {
            if (tex.State != TextureState::Loaded || tex.Descriptor.Kind == TextureKind::SubTexture) return;
            ++info.LoadedTextures;
            if (tex.RefCount > 0)
            {
                ++info.ReferencedTextures;
                info.ReferencedBytes += tex.ByteSize;
            }
        });
        return info;
    }

    TextureMemoryManager::ListenerId TextureMemoryManager::AddListener(Listener listener)
    {
        const ListenerId id = m_NextListenerId++;
        m_Listeners.push_back({id, std::move(listener)});
        return id;
    }

    void TextureMemoryManager::RemoveListener(ListenerId id)
    {
        std::erase_if(m_Listeners, [id](const ListenerEntry& e) { return e.Id == id; });
    }

    void TextureMemoryManager::Emit(TextureHandle handle, TextureState state, Core::ErrorCode error)
    {
        if (m_Listeners.empty()) return;

        // Copy: callbacks may register or remove listeners.
        const auto listeners = m_Listeners;
        const TextureEvent event{handle, state, error};
        for (const auto& entry : listeners)
            entry.Callback(event);
    }

    void TextureMemoryManager::MaybeLogUsage()
    {
        if (!m_Config.DebugLogging) return;

        const auto now = std::chrono::steady_clock::now();
        if (now - m_LastUsageLog < std::chrono::milliseconds(m_Config.CheckIntervalMs)) return;
        m_LastUsageLog = now;

        const MemoryInfo info = GetMemoryInfo();
        Core::Log::Info("Texture memory: {:.2f} / {:.2f} MiB (target {:.2f}), {} loaded, {} referenced, {} pending",
                        ToMiB(info.UsedBytes), ToMiB(info.CriticalThreshold), ToMiB(info.TargetThreshold),
                        info.LoadedTextures, info.ReferencedTextures, info.PendingLoads);
    }
}
