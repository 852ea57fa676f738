module;

#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <utility>
#include <vector>

module Graphics:TextureSource.Impl;
import :TextureSource;
import :Texture;
import :Color;
import Core;

namespace Graphics
{
    namespace
    {
        constexpr uint32_t kDefaultNoiseSize = 128;
        constexpr uint32_t kMaxDimension = 8192;

        struct LoadJob
        {
            std::promise<Core::Expected<ImageData>> Promise;
            TextureDescriptor Descriptor;
            TaskTextureSource::Decoder Decode; // copied, the job may outlive its source
        };

        Core::Expected<ImageData> Allocate(uint32_t width, uint32_t height, bool premultiplied,
                                           std::vector<uint8_t>&& pixels)
        {
            ImageData image;
            image.Width = width;
            image.Height = height;
            image.Premultiplied = premultiplied;
            image.Pixels = std::make_shared<const std::vector<uint8_t>>(std::move(pixels));
            return image;
        }

        bool ValidSize(uint32_t w, uint32_t h)
        {
            return w > 0 && h > 0 && w <= kMaxDimension && h <= kMaxDimension;
        }
    }

    TaskTextureSource::TaskTextureSource(Decoder decoder) : m_Decoder(std::move(decoder))
    {
    }

    Core::Expected<ImageData> TaskTextureSource::MakeColor(const TextureDescriptor& desc)
    {
        const uint32_t w = desc.Width ? desc.Width : 1u;
        const uint32_t h = desc.Height ? desc.Height : 1u;
        if (!ValidSize(w, h)) return Core::Err<ImageData>(Core::ErrorCode::InvalidArgument);

        const uint32_t rgba = desc.Premultiply ? Color::Premultiply(desc.Color, 1.0f) : desc.Color;
        const uint8_t texel[4] = {
            static_cast<uint8_t>(rgba >> 24), static_cast<uint8_t>(rgba >> 16),
            static_cast<uint8_t>(rgba >> 8), static_cast<uint8_t>(rgba)
        };

        std::vector<uint8_t> pixels(static_cast<size_t>(w) * h * 4u);
        for (size_t i = 0; i < pixels.size(); i += 4)
        {
            pixels[i + 0] = texel[0];
            pixels[i + 1] = texel[1];
            pixels[i + 2] = texel[2];
            pixels[i + 3] = texel[3];
        }
        return Allocate(w, h, desc.Premultiply, std::move(pixels));
    }

    Core::Expected<ImageData> TaskTextureSource::MakeNoise(const TextureDescriptor& desc)
    {
        const uint32_t w = desc.Width ? desc.Width : kDefaultNoiseSize;
        const uint32_t h = desc.Height ? desc.Height : kDefaultNoiseSize;
        if (!ValidSize(w, h)) return Core::Err<ImageData>(Core::ErrorCode::InvalidArgument);

        // xorshift64, seeded from the source string so equal descriptors produce equal pixels
        uint64_t state = Core::Hash::HashString64(desc.Source) | 1u;
        std::vector<uint8_t> pixels(static_cast<size_t>(w) * h * 4u);
        for (size_t i = 0; i < pixels.size(); i += 4)
        {
            state ^= state << 13;
            state ^= state >> 7;
            state ^= state << 17;
            const auto v = static_cast<uint8_t>(state >> 56);
            pixels[i + 0] = v;
            pixels[i + 1] = v;
            pixels[i + 2] = v;
            pixels[i + 3] = 255;
        }
        return Allocate(w, h, true, std::move(pixels));
    }

    Core::Expected<ImageData> TaskTextureSource::Produce(const Decoder& decoder, const TextureDescriptor& desc)
    {
        switch (desc.Kind)
        {
        case TextureKind::Color: return MakeColor(desc);
        case TextureKind::Noise: return MakeNoise(desc);
        case TextureKind::SubTexture:
            Core::Log::Error("TaskTextureSource: sub-texture '{}' has no pixels of its own", desc.Source);
            return Core::Err<ImageData>(Core::ErrorCode::InvalidArgument);
        case TextureKind::Image: break;
        }

        if (!decoder)
        {
            Core::Log::Error("TaskTextureSource: no decoder installed for image '{}'", desc.Source);
            return Core::Err<ImageData>(Core::ErrorCode::AssetLoadFailed);
        }

        Core::Expected<ImageData> result = Core::Err<ImageData>(Core::ErrorCode::AssetLoadFailed);
        try
        {
            result = decoder(desc);
        }
        catch (const std::exception& e)
        {
            Core::Log::Error("TaskTextureSource: decoder threw for image '{}': {}", desc.Source, e.what());
            return Core::Err<ImageData>(Core::ErrorCode::AssetLoadFailed);
        }

        if (result && !ValidSize(result->Width, result->Height))
            return Core::Err<ImageData>(Core::ErrorCode::InvalidFormat);
        return result;
    }

    std::future<Core::Expected<ImageData>> TaskTextureSource::Load(const TextureDescriptor& desc)
    {
        auto job = std::make_shared<LoadJob>();
        job->Descriptor = desc;
        job->Decode = m_Decoder;
        auto future = job->Promise.get_future();

        // Capture a single shared_ptr so the task fits LocalTask's inline storage.
        auto run = [job]()
        {
            job->Promise.set_value(Produce(job->Decode, job->Descriptor));
        };

        if (!Core::Tasks::Scheduler::IsInitialized() || !Core::Tasks::Scheduler::Dispatch(run))
            run();

        return future;
    }
}
