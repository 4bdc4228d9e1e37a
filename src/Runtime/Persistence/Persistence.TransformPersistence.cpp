module;
#include <algorithm>
#include <cstddef>
#include <expected>
#include <span>
#include <utility>
#include <variant>
#include <entt/entity/registry.hpp>

module Persistence:TransformPersistence.Impl;
import Core;
import :TransformPersistence;
import :StateFiles;

namespace Persistence
{
    TransformPersistence::TransformPersistence(Config config)
        : m_Config(std::move(config))
    {
    }

    size_t TransformPersistence::OnStart(entt::registry& registry)
    {
        if (m_Started)
            return 0;

        m_Started = true;
        return LoadState(registry, m_Config);
    }

    std::expected<size_t, Core::ErrorCode> TransformPersistence::OnUpdate(
        const entt::registry& registry,
        std::span<const Core::Windowing::Event> events)
    {
        const bool closing = std::ranges::any_of(events, [](const Core::Windowing::Event& event)
        {
            return std::holds_alternative<Core::Windowing::WindowCloseEvent>(event);
        });

        if (!closing)
            return 0;

        return SaveState(registry, m_Config);
    }
}
