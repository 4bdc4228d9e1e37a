module;
#include <cstddef>
#include <expected>
#include <span>
#include <entt/fwd.hpp>

export module Persistence:TransformPersistence;

import Core;
import :StateFiles;

export namespace Persistence
{
    // Hooks transform persistence into the application lifecycle: restore once after
    // the scene is populated, save whenever a window is about to close.
    //
    // Usage:
    //   Persistence::TransformPersistence persistence({.Directory = "./assets/saves"});
    //   persistence.OnStart(registry);                 // after OnStart() spawned entities
    //   persistence.OnUpdate(registry, frameEvents);   // every frame
    class TransformPersistence
    {
    public:
        explicit TransformPersistence(Config config = {});

        TransformPersistence(const TransformPersistence&) = delete;
        TransformPersistence& operator=(const TransformPersistence&) = delete;

        // Loads every tracked transform the first time it is called; later calls do
        // nothing and return 0.
        size_t OnStart(entt::registry& registry);

        // Saves every tracked transform if `events` contains a WindowCloseEvent.
        // Returns the number saved (0 when no close was requested).
        [[nodiscard]] std::expected<size_t, Core::ErrorCode> OnUpdate(
            const entt::registry& registry,
            std::span<const Core::Windowing::Event> events);

        [[nodiscard]] const Config& GetConfig() const { return m_Config; }
        [[nodiscard]] bool HasStarted() const { return m_Started; }

    private:
        Config m_Config;
        bool m_Started = false;
    };
}
