module;
#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <entt/entity/registry.hpp>

module Persistence:StateFiles.Impl;
import Core;
import ECS;
import :StateFiles;
import :LineSource;
import :ByteSink;
import :TransformCodec;

namespace Persistence
{
    using namespace ECS::Components;

    std::filesystem::path StatePath(const Config& config, std::string_view name)
    {
        std::string filename(name);
        filename += StateFileExtension;
        return config.Directory / filename;
    }

    std::expected<FileLineSource, Core::ErrorCode> OpenStateFile(const std::filesystem::path& path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) || ec)
            return std::unexpected(Core::ErrorCode::FileNotFound);

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
            return std::unexpected(Core::ErrorCode::FileReadError);

        return FileLineSource(std::move(file));
    }

    size_t LoadState(entt::registry& registry, const Config& config)
    {
        size_t initialized = 0;

        auto view = registry.view<SavedTransform::Component, Transform::Component>();
        for (auto [entity, saved, transform] : view.each())
        {
            const auto path = StatePath(config, saved.Name);

            auto lines = OpenStateFile(path);
            if (!lines)
            {
                Core::Log::Debug("No saved transform for '{}' ({})", saved.Name, Core::ErrorCodeToString(lines.error()));
                continue;
            }

            auto restored = DeserializeTransform(*lines);
            if (!restored)
            {
                Core::Log::Error("Could not deserialize transform: {}", restored.error().Message);
                continue;
            }

            transform = *restored;
            registry.emplace_or_replace<Transform::IsDirtyTag>(entity);
            ++initialized;
        }

        Core::Log::Info("Initialized {} transform(s)", initialized);
        return initialized;
    }

    std::expected<size_t, Core::ErrorCode> SaveState(const entt::registry& registry, const Config& config)
    {
        size_t saved = 0;

        auto fail = [&](Core::ErrorCode code, const std::filesystem::path& path) -> std::expected<size_t, Core::ErrorCode>
        {
            Core::Log::Error("Saved {} transform(s) to: {} before failing on '{}' ({})",
                       saved, config.Directory.string(), path.string(), Core::ErrorCodeToString(code));
            return std::unexpected(code);
        };

        auto view = registry.view<const SavedTransform::Component, const Transform::Component>();
        for (auto [entity, tag, transform] : view.each())
        {
            if (auto dir = Core::Filesystem::EnsureDirectory(config.Directory); !dir)
                return fail(dir.error(), config.Directory);

            const auto path = StatePath(config, tag.Name);

            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            if (!file.is_open())
                return fail(Core::ErrorCode::FileWriteError, path);

            StreamByteSink sink(file);
            if (auto written = SerializeTransform(sink, transform); !written)
            {
                Core::Log::Error("Could not write transform '{}': {}", tag.Name, written.error().message());
                return fail(Core::ErrorCode::FileWriteError, path);
            }

            file.flush();
            if (!file)
                return fail(Core::ErrorCode::FileWriteError, path);

            ++saved;
        }

        Core::Log::Info("Saved {} transform(s) to: {}", saved, config.Directory.string());
        return saved;
    }

    void Track(entt::registry& registry, entt::entity entity, std::string_view name)
    {
        registry.emplace_or_replace<SavedTransform::Component>(entity, SavedTransform::Component::FromName(name));
        registry.get_or_emplace<Transform::Component>(entity);
    }
}
