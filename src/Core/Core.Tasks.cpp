module;
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

module Core:Tasks.Impl;
import :Tasks;
import :Logging;

namespace Core::Tasks
{
    LocalTask::~LocalTask()
    {
        if (m_Model) std::destroy_at(m_Model);
    }

    LocalTask::LocalTask(LocalTask&& other) noexcept
    {
        if (other.m_Model)
        {
            other.m_Model->MoveTo(m_Storage);
            m_Model = reinterpret_cast<Concept*>(m_Storage);
            std::destroy_at(other.m_Model);
            other.m_Model = nullptr;
        }
    }

    LocalTask& LocalTask::operator=(LocalTask&& other) noexcept
    {
        if (this == &other) return *this;

        if (m_Model) std::destroy_at(m_Model);
        m_Model = nullptr;

        if (other.m_Model)
        {
            other.m_Model->MoveTo(m_Storage);
            m_Model = reinterpret_cast<Concept*>(m_Storage);
            std::destroy_at(other.m_Model);
            other.m_Model = nullptr;
        }
        return *this;
    }

    void LocalTask::operator()()
    {
        if (m_Model) m_Model->Execute();
    }

    namespace
    {
        struct SchedulerContext
        {
            std::vector<std::thread> Workers;
            std::deque<LocalTask> Queue;

            std::mutex QueueMutex;
            std::condition_variable WakeCondition;

            bool IsRunning = false; // guarded by QueueMutex

            // Dispatched but not yet finished. WaitForAll blocks on it with atomic wait.
            std::atomic<int> ActiveTaskCount{0};
        };

        std::unique_ptr<SchedulerContext> s_Ctx;

        void FinishTask()
        {
            s_Ctx->ActiveTaskCount.fetch_sub(1, std::memory_order_release);
            s_Ctx->ActiveTaskCount.notify_all();
        }

        bool TryPop(LocalTask& out)
        {
            std::lock_guard lock(s_Ctx->QueueMutex);
            if (s_Ctx->Queue.empty()) return false;
            out = std::move(s_Ctx->Queue.front());
            s_Ctx->Queue.pop_front();
            return true;
        }
    }

    void Scheduler::Initialize(unsigned threadCount)
    {
        if (s_Ctx) return;
        s_Ctx = std::make_unique<SchedulerContext>();
        s_Ctx->IsRunning = true;

        if (threadCount == 0)
        {
            threadCount = std::max(1u, std::thread::hardware_concurrency());
            if (threadCount > 2) threadCount--; // leave a core for the frame loop
        }

        Log::Info("Initializing Scheduler with {} worker threads.", threadCount);

        for (unsigned i = 0; i < threadCount; ++i)
            s_Ctx->Workers.emplace_back([i] { WorkerEntry(i); });
    }

    void Scheduler::Shutdown()
    {
        if (!s_Ctx) return;

        {
            std::lock_guard lock(s_Ctx->QueueMutex);
            s_Ctx->IsRunning = false;
        }
        s_Ctx->WakeCondition.notify_all();

        for (auto& t : s_Ctx->Workers)
        {
            if (t.joinable()) t.join();
        }
        s_Ctx.reset();
    }

    bool Scheduler::IsInitialized()
    {
        return s_Ctx != nullptr;
    }

    unsigned Scheduler::WorkerCount()
    {
        return s_Ctx ? static_cast<unsigned>(s_Ctx->Workers.size()) : 0u;
    }

    bool Scheduler::DispatchInternal(LocalTask&& task)
    {
        if (!s_Ctx) return false;

        s_Ctx->ActiveTaskCount.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(s_Ctx->QueueMutex);
            s_Ctx->Queue.emplace_back(std::move(task));
        }
        s_Ctx->WakeCondition.notify_one();
        return true;
    }

    void Scheduler::WaitForAll()
    {
        if (!s_Ctx) return;

        // 1. Help drain the queue
        LocalTask task;
        while (TryPop(task))
        {
            task();
            task = LocalTask{};
            FinishTask();
        }

        // 2. Sleep until the workers are done with what they already picked up
        int active = s_Ctx->ActiveTaskCount.load(std::memory_order_acquire);
        while (active > 0)
        {
            s_Ctx->ActiveTaskCount.wait(active);
            active = s_Ctx->ActiveTaskCount.load(std::memory_order_acquire);
        }
    }

    void Scheduler::WorkerEntry(unsigned)
    {
        while (true)
        {
            LocalTask task;
            {
                std::unique_lock lock(s_Ctx->QueueMutex);
                s_Ctx->WakeCondition.wait(lock, []
                {
                    return !s_Ctx->Queue.empty() || !s_Ctx->IsRunning;
                });

                if (s_Ctx->Queue.empty()) return; // stopped and drained

                task = std::move(s_Ctx->Queue.front());
                s_Ctx->Queue.pop_front();
            }

            task();
            task = LocalTask{};
            FinishTask();
        }
    }
}
