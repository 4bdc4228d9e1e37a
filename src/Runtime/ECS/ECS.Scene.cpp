module;
#include <string>
#include <entt/entity/registry.hpp>

module ECS:Scene.Impl;
import :Scene;
import :Components;

namespace ECS
{
    namespace
    {
        void EnsureTransform(entt::registry& registry, entt::entity entity)
        {
            registry.get_or_emplace<Components::Transform::Component>(entity);
        }
    }

    Scene::Scene()
    {
        m_Registry.on_construct<Components::SavedTransform::Component>().connect<&EnsureTransform>();
    }

    Scene::~Scene()
    {
        m_Registry.on_construct<Components::SavedTransform::Component>().disconnect<&EnsureTransform>();
    }

    entt::entity Scene::CreateEntity(const std::string& name)
    {
        entt::entity e = m_Registry.create();
        m_Registry.emplace<Components::NameTag::Component>(e, name);
        m_Registry.emplace<Components::Transform::Component>(e);
        return e;
    }
}
