module;
#include <cstdint>
#include <variant>

export module Core:Events;

export namespace Core::Windowing
{
    // Sent once per window when the user asks it to close, before teardown.
    struct WindowCloseEvent
    {
        uint32_t WindowId = 0;
    };

    struct WindowResizeEvent
    {
        int Width;
        int Height;
    };

    // Type-safe variant
    using Event = std::variant<
        WindowCloseEvent,
        WindowResizeEvent
    >;
}
