module;
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string_view>
#include <entt/fwd.hpp>

export module Persistence:StateFiles;

import Core;
import :LineSource;

export namespace Persistence
{
    struct Config
    {
        // Where "<name>.state" files are written to and read from.
        std::filesystem::path Directory = "./assets/saves";
    };

    inline constexpr std::string_view StateFileExtension = ".state";

    // "<Directory>/<name>.state"
    [[nodiscard]] std::filesystem::path StatePath(const Config& config, std::string_view name);

    // FileNotFound when nothing is saved at `path` yet, FileReadError when it cannot be opened.
    [[nodiscard]] std::expected<FileLineSource, Core::ErrorCode> OpenStateFile(const std::filesystem::path& path);

    // Restores the Transform of every entity carrying a SavedTransform component.
    // Entities without a state file are skipped silently; a file that fails to decode is
    // logged and leaves the entity's current Transform in place. Restored entities are
    // marked with Transform::IsDirtyTag. Returns how many transforms were restored.
    size_t LoadState(entt::registry& registry, const Config& config);

    // Writes the Transform of every entity carrying a SavedTransform component, creating
    // config.Directory first when needed. Stops at the first file that cannot be written
    // and returns its error; files written before it are kept.
    [[nodiscard]] std::expected<size_t, Core::ErrorCode> SaveState(const entt::registry& registry, const Config& config);

    // Marks `entity` for persistence under `name`, giving it an identity Transform when
    // it has none.
    void Track(entt::registry& registry, entt::entity entity, std::string_view name);
}
