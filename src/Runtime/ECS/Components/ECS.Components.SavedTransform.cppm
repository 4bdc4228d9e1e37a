module;
#include <string>
#include <string_view>

export module ECS:Components.SavedTransform;

export namespace ECS::Components::SavedTransform
{
    // Marks an entity whose Transform::Component is written to "<Name>.state" when the
    // application closes and restored from it on the next start.
    // An entity carrying this component must also carry a Transform::Component;
    // Persistence::Track adds an identity transform when one is missing.
    struct Component
    {
        std::string Name;

        [[nodiscard]] static Component FromName(std::string_view name)
        {
            return Component{std::string(name)};
        }

        // Shorthand for the usual case of persisting the main camera.
        [[nodiscard]] static Component Camera()
        {
            return FromName("camera");
        }
    };
}
