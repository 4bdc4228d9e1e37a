module;

#include <cstdint>
#include <string_view>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it (file I/O, parsing).
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome,
    //                          not an error (end of a line stream, cache lookups).
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects
    //                          (registry.try_get<...>).
    //
    // Subsystems with richer failure text (e.g. Persistence::ParseError) carry their
    // own error type; file-level glue reports an ErrorCode.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // I/O errors (200-299)
        FileNotFound = 200,
        FileReadError = 201,
        FileWriteError = 202,
        InvalidPath = 203,
        PermissionDenied = 204,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:          return "Success";
            case ErrorCode::FileNotFound:     return "FileNotFound";
            case ErrorCode::FileReadError:    return "FileReadError";
            case ErrorCode::FileWriteError:   return "FileWriteError";
            case ErrorCode::InvalidPath:      return "InvalidPath";
            case ErrorCode::PermissionDenied: return "PermissionDenied";
            default:                          return "Unknown";
        }
    }
}
