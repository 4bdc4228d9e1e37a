#include <cstdlib>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <entt/entity/registry.hpp>

import Core;
import ECS;
import Persistence;

using namespace Core;

// Headless stand-in for a windowed app: spawns a camera, restores where it was left,
// moves it a little and then "closes the window" so the new pose is written back.
// Running it repeatedly keeps orbiting the camera from wherever the last run stopped.
int main(int argc, char** argv)
{
    Persistence::Config config;
    config.Directory = argc > 1 ? argv[1] : Filesystem::GetAssetPath("saves/basic");

    ECS::Scene scene;
    auto& registry = scene.GetRegistry();

    entt::entity camera = scene.CreateEntity("Main Camera");
    auto& transform = registry.get<ECS::Components::Transform::Component>(camera);
    transform.Position = glm::vec3(10.0f, 10.0f, 10.0f);
    transform.Rotation = glm::quatLookAt(glm::normalize(-transform.Position), glm::vec3(0.0f, 1.0f, 0.0f));
    registry.emplace<ECS::Components::SavedTransform::Component>(camera, ECS::Components::SavedTransform::Component::Camera());

    Persistence::TransformPersistence persistence(config);
    persistence.OnStart(registry);

    Log::Info("Camera at ({}, {}, {})", transform.Position.x, transform.Position.y, transform.Position.z);

    // Orbit 15 degrees around the Y axis.
    const glm::quat orbit = glm::angleAxis(glm::radians(15.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    transform.Position = orbit * transform.Position;
    transform.Rotation = glm::normalize(orbit * transform.Rotation);

    std::vector<Windowing::Event> frameEvents{Windowing::WindowCloseEvent{}};
    auto saved = persistence.OnUpdate(registry, frameEvents);
    if (!saved)
    {
        Log::Error("Could not save camera: {}", ErrorCodeToString(saved.error()));
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
