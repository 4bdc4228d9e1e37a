module;
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>

module Core;

namespace Core::Filesystem
{
    std::filesystem::path GetRoot()
    {
        // 1. Check if "assets" exists in current working directory (Production/Binary Release)
        if (std::filesystem::exists("assets"))
        {
            return std::filesystem::current_path();
        }

        // 2. Check if we are in "bin" and need to go up (Common dev scenario)
        if (std::filesystem::exists("../assets"))
        {
            return std::filesystem::current_path().parent_path();
        }

        // 3. Fallback: Use the hardcoded CMake source path
#ifdef WHEREABOUTS_ROOT_DIR
        return std::filesystem::path(WHEREABOUTS_ROOT_DIR);
#else
        return std::filesystem::current_path();
#endif
    }

    std::string GetAssetPath(const std::string& relativePath)
    {
        auto path = GetRoot() / "assets" / relativePath;
        return path.string();
    }

    std::expected<void, ErrorCode> EnsureDirectory(const std::filesystem::path& directory)
    {
        namespace fs = std::filesystem;

        if (directory.empty())
            return std::unexpected(ErrorCode::InvalidPath);

        std::error_code ec;
        if (fs::exists(directory, ec))
        {
            if (!fs::is_directory(directory, ec))
            {
                Log::Error("'{}' exists but is not a directory", directory.string());
                return std::unexpected(ErrorCode::InvalidPath);
            }
            return {};
        }

        fs::create_directories(directory, ec);
        if (ec)
        {
            Log::Error("Could not create directory '{}': {}", directory.string(), ec.message());
            if (ec == std::errc::permission_denied)
                return std::unexpected(ErrorCode::PermissionDenied);
            return std::unexpected(ErrorCode::FileWriteError);
        }

        Log::Debug("Created directory '{}'", directory.string());
        return {};
    }
}
