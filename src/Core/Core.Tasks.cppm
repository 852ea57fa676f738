module;

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

export module Core:Tasks;

export namespace Core::Tasks
{
    // Move-only, non-allocating callable. Captures must fit the inline buffer;
    // hand large state over through a shared_ptr.
    class LocalTask
    {
        static constexpr size_t STORAGE_SIZE = 120;

        struct Concept
        {
            virtual ~Concept() = default;
            virtual void Execute() = 0;
            virtual void MoveTo(void* dest) = 0;
        };

        template <typename T>
        struct Model final : Concept
        {
            T Payload;

            explicit Model(T&& p) : Payload(std::move(p)) {}

            void Execute() override { Payload(); }

            void MoveTo(void* dest) override
            {
                std::construct_at(static_cast<Model<T>*>(dest), std::move(Payload));
            }
        };

        alignas(std::max_align_t) std::byte m_Storage[STORAGE_SIZE];
        Concept* m_Model = nullptr; // lives inside m_Storage

    public:
        LocalTask() = default;

        template <typename F>
            requires (!std::is_same_v<std::decay_t<F>, LocalTask>)
        LocalTask(F&& f)
        {
            using Type = std::decay_t<F>;
            static_assert(sizeof(Model<Type>) <= STORAGE_SIZE,
                          "Task capture is too big, move state behind a pointer.");
            static_assert(alignof(Model<Type>) <= alignof(std::max_align_t),
                          "Task alignment requirement too strict.");

            auto* ptr = reinterpret_cast<Model<Type>*>(m_Storage);
            std::construct_at(ptr, Type(std::forward<F>(f)));
            m_Model = ptr;
        }

        ~LocalTask();

        LocalTask(LocalTask&& other) noexcept;
        LocalTask& operator=(LocalTask&& other) noexcept;

        LocalTask(const LocalTask&) = delete;
        LocalTask& operator=(const LocalTask&) = delete;

        void operator()();

        [[nodiscard]] bool Valid() const { return m_Model != nullptr; }
    };

    // Process-wide worker pool. Initialize once at startup, Shutdown drains
    // the queue and joins the workers.
    class Scheduler
    {
    public:
        static void Initialize(unsigned threadCount = 0);
        static void Shutdown();

        [[nodiscard]] static bool IsInitialized();
        [[nodiscard]] static unsigned WorkerCount();

        // Returns false when the pool is not running; the task is dropped.
        template <typename F>
        static bool Dispatch(F&& task)
        {
            return DispatchInternal(LocalTask(std::forward<F>(task)));
        }

        // Blocks until every dispatched task finished. The caller helps drain the queue.
        static void WaitForAll();

    private:
        static bool DispatchInternal(LocalTask&& task);
        static void WorkerEntry(unsigned threadIndex);
    };
}
