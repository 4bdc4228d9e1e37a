module;
#include <expected>
#include <filesystem>
#include <string>

export module Core:Filesystem;

import :Error;

export namespace Core::Filesystem
{
    // Resolve the project root: the working directory when it holds "assets", its
    // parent when running from a build directory, otherwise WHEREABOUTS_ROOT_DIR.
    [[nodiscard]] std::filesystem::path GetRoot();

    [[nodiscard]] std::string GetAssetPath(const std::string& relativePath);

    // Create `directory` (and missing parents) unless it already exists.
    // Fails with InvalidPath when the path names something that is not a directory.
    [[nodiscard]] std::expected<void, ErrorCode> EnsureDirectory(const std::filesystem::path& directory);
}
