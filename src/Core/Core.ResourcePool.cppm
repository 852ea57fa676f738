module;

#include <cstddef>
#include <cstdint>
#include <concepts>
#include <deque>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <utility>
#include <vector>

export module Core:ResourcePool;
import :Error;

export namespace Core
{
    template<typename H>
    concept GenerationalHandle = requires(H h) {
        { h.Index } -> std::convertible_to<uint32_t>;
        { h.Generation } -> std::convertible_to<uint32_t>;
    };

    // Slot storage addressed by generational handles.
    // Removal is two-phase: Remove() retires the handle at once (lookups fail),
    // ProcessDeletions() destroys the payload and recycles the slot after
    // `retireFrames` frames, so in-flight consumers never see a reused slot.
    template <typename T, GenerationalHandle Handle>
    class ResourcePool
    {
    public:
        ResourcePool() = default;

        ResourcePool(const ResourcePool&) = delete;
        ResourcePool& operator=(const ResourcePool&) = delete;

        void Initialize(uint32_t retireFrames)
        {
            m_RetireFrames = retireFrames;
        }

        Handle Add(std::unique_ptr<T> resource)
        {
            std::unique_lock lock(m_Mutex);

            uint32_t index;
            if (!m_FreeIndices.empty())
            {
                index = m_FreeIndices.front();
                m_FreeIndices.pop_front();
            }
            else
            {
                index = static_cast<uint32_t>(m_Slots.size());
                m_Slots.emplace_back();
            }

            Slot& slot = m_Slots[index];
            slot.Data = std::move(resource); // heap address stays put when m_Slots grows
            ++slot.Generation;
            slot.IsActive = true;
            ++m_ActiveCount;

            return {index, slot.Generation};
        }

        template<typename... Args>
        Handle Create(Args&&... args)
        {
            return Add(std::make_unique<T>(std::forward<Args>(args)...));
        }

        // Returns false for stale or already retired handles.
        bool Remove(Handle handle, uint64_t currentFrame)
        {
            std::unique_lock lock(m_Mutex);

            if (handle.Index >= m_Slots.size()) return false;

            Slot& slot = m_Slots[handle.Index];
            if (!slot.IsActive || slot.Generation != handle.Generation) return false;

            slot.IsActive = false;
            --m_ActiveCount;
            m_PendingKillList.push_back({handle.Index, handle.Generation, currentFrame});
            return true;
        }

        void ProcessDeletions(uint64_t currentFrame)
        {
            std::unique_lock lock(m_Mutex);
            if (m_PendingKillList.empty()) return;

            std::erase_if(m_PendingKillList, [&](const PendingKill& item)
            {
                if (currentFrame <= item.KillFrame + m_RetireFrames)
                    return false;

                Slot& slot = m_Slots[item.SlotIndex];
                if (!slot.IsActive && slot.Generation == item.Generation)
                {
                    slot.Data.reset();
                    m_FreeIndices.push_back(item.SlotIndex);
                }
                return true;
            });
        }

        [[nodiscard]] Expected<T*> Get(Handle handle) const
        {
            if (T* ptr = TryGet(handle)) return ptr;
            return std::unexpected(ErrorCode::ResourceNotFound);
        }

        // nullptr for stale handles
        [[nodiscard]] T* TryGet(Handle handle) const
        {
            std::shared_lock lock(m_Mutex);
            if (handle.Index >= m_Slots.size()) return nullptr;

            const Slot& slot = m_Slots[handle.Index];
            if (!slot.IsActive || slot.Generation != handle.Generation) return nullptr;
            return slot.Data.get();
        }

        // Visits every live resource. The callback must not add or remove entries.
        template <typename F>
        void ForEach(F&& fn) const
        {
            std::shared_lock lock(m_Mutex);
            for (uint32_t i = 0; i < m_Slots.size(); ++i)
            {
                const Slot& slot = m_Slots[i];
                if (slot.IsActive)
                    fn(Handle{i, slot.Generation}, *slot.Data);
            }
        }

        void Clear()
        {
            std::unique_lock lock(m_Mutex);
            m_PendingKillList.clear();
            m_Slots.clear();
            m_FreeIndices.clear();
            m_ActiveCount = 0;
        }

        [[nodiscard]] size_t Capacity() const
        {
            std::shared_lock lock(m_Mutex);
            return m_Slots.size();
        }

        [[nodiscard]] size_t ActiveCount() const
        {
            std::shared_lock lock(m_Mutex);
            return m_ActiveCount;
        }

        [[nodiscard]] size_t PendingDeletionCount() const
        {
            std::shared_lock lock(m_Mutex);
            return m_PendingKillList.size();
        }

    private:
        struct Slot
        {
            std::unique_ptr<T> Data;
            uint32_t Generation = 0;
            bool IsActive = false;
        };

        struct PendingKill
        {
            uint32_t SlotIndex;
            uint32_t Generation;
            uint64_t KillFrame;
        };

        std::vector<Slot> m_Slots;
        std::deque<uint32_t> m_FreeIndices;
        std::vector<PendingKill> m_PendingKillList;
        size_t m_ActiveCount = 0;

        mutable std::shared_mutex m_Mutex;
        uint32_t m_RetireFrames = 2;
    };
}
