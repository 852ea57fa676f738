module;

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:TextureMemory;
import :Texture;
import :TextureSource;
import Core;

export namespace Graphics
{
    struct TextureMemoryConfig
    {
        // Absolute ceiling in bytes. 0 disables both cleanup policies and the ceiling.
        uint64_t CriticalThreshold = 124ull * 1024 * 1024;

        // Fraction of CriticalThreshold that any cleanup reduces usage to.
        // The resulting target never drops below BaselineMemory.
        float TargetThresholdLevel = 0.5f;

        // Diagnostics only: period of the memory usage log line when DebugLogging is on.
        uint32_t CheckIntervalMs = 5000;
        bool DebugLogging = false;

        // Bytes accounted as permanently in use (render targets, driver overhead).
        uint64_t BaselineMemory = 0;
    };

    struct MemoryInfo
    {
        uint64_t CriticalThreshold = 0;
        uint64_t TargetThreshold = 0;
        uint64_t UsedBytes = 0;        // includes BaselineMemory
        uint64_t BaselineBytes = 0;
        uint64_t ReferencedBytes = 0;  // resident and held by at least one owner
        uint32_t LoadedTextures = 0;
        uint32_t ReferencedTextures = 0;
        uint32_t PendingLoads = 0;
        uint64_t CriticalCleanups = 0;
        uint64_t FailedAllocations = 0;
    };

    struct TextureEvent
    {
        TextureHandle Handle;
        TextureState State = TextureState::Pending;
        Core::ErrorCode Error = Core::ErrorCode::Success;
    };

    // -------------------------------------------------------------------------
    // TextureMemoryManager
    // -------------------------------------------------------------------------
    // Content-addressed, ref-counted texture cache with a hard GPU memory budget.
    //
    // Lifecycle of one texture instance:
    //   Acquire (miss)        -> Pending, load started through ITextureSource
    //   load resolved         -> allocation path -> Loaded | Failed
    //   refcount 0 + eviction -> Freed (also: Unload, or release while Pending)
    //
    // Allocation path: if the new footprint would push usage above the critical
    // threshold, unreferenced textures are evicted synchronously, least recently
    // used first, until usage including the new texture is at or below
    // CriticalThreshold * TargetThresholdLevel. If the ceiling still cannot be
    // honored the allocation fails with OutOfMemory.
    //
    // Sub-textures own no memory. Each holds one reference on its parent and
    // follows the parent's state: Loaded / Failed when the parent resolves,
    // Freed when the parent is unloaded or the sub-texture is released.
    //
    // Threading: all methods are frame-thread only. Only the source's futures
    // are fulfilled elsewhere.
    // -------------------------------------------------------------------------
    class TextureMemoryManager
    {
    public:
        using Listener = std::function<void(const TextureEvent&)>;
        using ListenerId = uint32_t;

        explicit TextureMemoryManager(ITextureSource& source, TextureMemoryConfig config = {});
        ~TextureMemoryManager();

        TextureMemoryManager(const TextureMemoryManager&) = delete;
        TextureMemoryManager& operator=(const TextureMemoryManager&) = delete;

        // Adds one reference. A resolved-on-arrival load (ready future) runs the
        // allocation path before Acquire returns.
        [[nodiscard]] TextureHandle Acquire(const TextureDescriptor& desc);

        // Drops one reference. Stale handles are ignored. Releasing the last
        // reference of a Pending texture cancels the load.
        void Release(TextureHandle handle);

        // Frees a resident texture now, regardless of holders. Fails with
        // InvalidState for Pending textures and ResourceNotFound for stale handles.
        [[nodiscard]] Core::Result Unload(TextureHandle handle);

        // Consumes finished loads. Returns the number of textures that left Pending.
        uint32_t ProcessCompletions();

        // Opportunistic LRU eviction down to the target level.
        // Returns the number of bytes released.
        uint64_t IdleCleanup();

        // Recycles slots of freed textures once no frame can still reference them.
        void ProcessDeletions(uint64_t currentFrame);

        [[nodiscard]] TextureState GetState(TextureHandle handle) const; // stale -> Freed
        [[nodiscard]] std::optional<TextureInfo> GetInfo(TextureHandle handle) const;
        [[nodiscard]] std::shared_ptr<const ImageData> GetImage(TextureHandle handle) const;

        // Resident texture and UV rectangle to sample. nullopt unless Loaded.
        [[nodiscard]] std::optional<TextureView> GetView(TextureHandle handle) const;
        [[nodiscard]] std::optional<TextureHandle> Find(const TextureDescriptor& desc) const;

        [[nodiscard]] uint64_t GetUsedBytes() const { return m_UsedBytes; }
        [[nodiscard]] uint64_t GetTargetBytes() const;
        [[nodiscard]] MemoryInfo GetMemoryInfo() const;
        [[nodiscard]] uint32_t PendingLoadCount() const { return static_cast<uint32_t>(m_PendingLoads.size()); }
        [[nodiscard]] bool HasPendingLoads() const { return !m_PendingLoads.empty(); }
        [[nodiscard]] const TextureMemoryConfig& GetConfig() const { return m_Config; }

        ListenerId AddListener(Listener listener);
        void RemoveListener(ListenerId id);

    private:
        struct Texture
        {
            TextureDescriptor Descriptor;
            TextureState State = TextureState::Pending;
            uint32_t RefCount = 0;
            uint64_t LastUsed = 0;
            uint64_t ByteSize = 0;
            uint32_t Width = 0;
            uint32_t Height = 0;
            bool PreventCleanup = false;
            Core::ErrorCode Error = Core::ErrorCode::Success;
            std::shared_ptr<const ImageData> Image;
            std::future<Core::Expected<ImageData>> Load;

            TextureHandle Parent;                   // SubTexture only
            glm::vec4 UV{0.0f, 0.0f, 1.0f, 1.0f};   // region inside Parent
            std::vector<TextureHandle> SubTextures; // dependents holding a reference on us
        };

        void AttachSubTexture(TextureHandle handle, Texture& tex);
        void ResolveSubTexture(TextureHandle handle, Texture& sub, const Texture& parent);
        void ResolveSubTextures(const Texture& parent);
        void Complete(TextureHandle handle, Texture& tex, Core::Expected<ImageData> result);
        [[nodiscard]] Core::Result Allocate(TextureHandle handle, uint64_t bytes);

        // Evicts unreferenced textures, LRU first, while usage + reserve > goal.
        uint64_t EvictDownTo(uint64_t goal, uint64_t reserve);

        void Free(TextureHandle handle, Texture& tex);
        void Retire(TextureHandle handle, Texture& tex);
        void Emit(TextureHandle handle, TextureState state, Core::ErrorCode error = Core::ErrorCode::Success);
        void MaybeLogUsage();

        ITextureSource& m_Source;
        TextureMemoryConfig m_Config;

        Core::ResourcePool<Texture, TextureHandle> m_Textures;
        std::unordered_map<TextureDescriptor, TextureHandle, TextureDescriptorHash> m_Cache;
        std::vector<TextureHandle> m_PendingLoads;

        uint64_t m_UsedBytes = 0;
        uint64_t m_Clock = 0; // logical LRU clock
        uint64_t m_CurrentFrame = 0;
        uint64_t m_CriticalCleanups = 0;
        uint64_t m_FailedAllocations = 0;

        struct ListenerEntry
        {
            ListenerId Id;
            Listener Callback;
        };
        std::vector<ListenerEntry> m_Listeners;
        ListenerId m_NextListenerId = 1;

        std::chrono::steady_clock::time_point m_LastUsageLog{};
    };
}
