module;
#include <cstddef>
#include <string>
#include <entt/entity/registry.hpp>

export module ECS:Scene;

export namespace ECS
{
    class Scene
    {
    public:
        // Wires SavedTransform to require a Transform.
        Scene();
        ~Scene();

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        // New entities carry a NameTag and an identity Transform.
        entt::entity CreateEntity(const std::string& name);

        entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }

        [[nodiscard]] size_t Size() const { return m_Registry.storage<entt::entity>()->size(); }

    private:
        entt::registry m_Registry;
    };
}
