module;
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

export module Persistence:FloatText;

export namespace Persistence
{
    enum class ParseFloatError : std::uint32_t
    {
        Empty,
        Invalid
    };

    [[nodiscard]] constexpr std::string_view ParseFloatErrorToString(ParseFloatError e) noexcept
    {
        switch (e)
        {
            case ParseFloatError::Empty:   return "cannot parse float from empty string";
            case ParseFloatError::Invalid: return "invalid float literal";
            default:                       return "invalid float literal";
        }
    }

    // Parses the whole of `text` as a 32-bit float.
    // Accepts an optional sign, decimal or scientific notation, "inf", "infinity" and
    // "nan" (any case). Surrounding whitespace is rejected.
    [[nodiscard]] std::expected<float, ParseFloatError> ParseFloat(std::string_view text);

    // Shortest decimal text that parses back to exactly `value`, never in scientific
    // notation: 1.0f -> "1", 0.1f -> "0.1", 1e20f -> "100000000000000000000".
    // Non-finite values become "inf", "-inf" and "NaN".
    [[nodiscard]] std::string FormatFloat(float value);
}
