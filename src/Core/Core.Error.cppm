module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <type_traits>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. Expected<T> / Result - FALLIBLE operations whose failure the caller
    //                           must look at: node mutation with bad input,
    //                           texture allocation, decoding.
    //
    // 2. std::optional<T>     - Lookups where "absent" is a normal answer
    //                           (cached texture by descriptor, node state).
    //
    // 3. Raw pointers (T*)    - Non-owning observation only. nullptr means
    //                           "not attached" / "stale handle".
    //
    // Structural misuse of the scene graph (stale ids, cyclic parenting) is
    // reported through Expected as well, and logged at Error level by the
    // callee. It is never retried.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resources (100-199)
        OutOfMemory = 100,      // texture budget exhausted after critical cleanup
        ResourceNotFound = 101, // stale or unknown handle

        // Validation (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        InvalidFormat = 302,    // decoder could not make sense of the bytes
        TypeMismatch = 304,     // property value of the wrong alternative

        // Assets (500-599)
        AssetLoadFailed = 501,

        // Scene graph (700-799)
        StaleNode = 700,
        HierarchyCycle = 701,

        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:          return "Success";
            case ErrorCode::OutOfMemory:      return "OutOfMemory";
            case ErrorCode::ResourceNotFound: return "ResourceNotFound";
            case ErrorCode::InvalidArgument:  return "InvalidArgument";
            case ErrorCode::InvalidState:     return "InvalidState";
            case ErrorCode::InvalidFormat:    return "InvalidFormat";
            case ErrorCode::TypeMismatch:     return "TypeMismatch";
            case ErrorCode::AssetLoadFailed:  return "AssetLoadFailed";
            case ErrorCode::StaleNode:        return "StaleNode";
            case ErrorCode::HierarchyCycle:   return "HierarchyCycle";
            case ErrorCode::Unknown:          break;
        }
        return "Unknown";
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<std::decay_t<T>> Ok(T&& value)
    {
        return Expected<std::decay_t<T>>(std::forward<T>(value));
    }

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
