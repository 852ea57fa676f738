module;

#include <functional>
#include <future>

export module Graphics:TextureSource;
import :Texture;
import Core;

export namespace Graphics
{
    // Asset-loading collaborator. Load() must not block: it returns a future that
    // resolves (on any thread) to decoded pixels or an error code. The future is
    // polled from the frame thread and may be dropped unread when the request is
    // cancelled, so implementations must not rely on it being consumed.
    class ITextureSource
    {
    public:
        virtual ~ITextureSource() = default;

        [[nodiscard]] virtual std::future<Core::Expected<ImageData>> Load(const TextureDescriptor& desc) = 0;
    };

    // Default source: synthesizes Color and Noise textures and hands Image
    // descriptors to a user decoder. Work runs on Core::Tasks::Scheduler when
    // the scheduler is up, inline otherwise. Each job carries its own copy of
    // the decoder, so the source may be destroyed while loads are in flight.
    //
    // Decoders report failures through the returned Expected. A decoder that
    // throws a std::exception fails the load with AssetLoadFailed.
    class TaskTextureSource final : public ITextureSource
    {
    public:
        using Decoder = std::function<Core::Expected<ImageData>(const TextureDescriptor&)>;

        TaskTextureSource() = default;
        explicit TaskTextureSource(Decoder decoder);

        [[nodiscard]] std::future<Core::Expected<ImageData>> Load(const TextureDescriptor& desc) override;

        // Synchronous generation, also used by Load().
        [[nodiscard]] static Core::Expected<ImageData> MakeColor(const TextureDescriptor& desc);
        [[nodiscard]] static Core::Expected<ImageData> MakeNoise(const TextureDescriptor& desc);

    private:
        [[nodiscard]] static Core::Expected<ImageData> Produce(const Decoder& decoder, const TextureDescriptor& desc);

        Decoder m_Decoder;
    };
}
