module;
#include <string>
#include <system_error>
#include <utility>

export module Persistence:ParseError;

export namespace Persistence
{
    // Failure to turn a .state line stream back into a transform. Carries text only;
    // callers log it and fall back to whatever transform the entity already has.
    struct ParseError
    {
        std::string Message;

        // The line stream ended before the layout was complete.
        [[nodiscard]] static ParseError ExpectedLine()
        {
            return ParseError{"Expected line to be there, but it wasn't there"};
        }

        [[nodiscard]] static ParseError FromMessage(std::string message)
        {
            return ParseError{std::move(message)};
        }

        // Wraps a read failure reported by the line source.
        [[nodiscard]] static ParseError FromIOError(const std::error_code& ec)
        {
            return ParseError{ec.message()};
        }
    };
}
