module;
#include <expected>
#include <string_view>
#include <system_error>

export module Persistence:TransformCodec;

import ECS;
import :ParseError;
import :LineSource;
import :ByteSink;

// -------------------------------------------------------------------------
// Persistence::TransformCodec - text layout of a .state file
// -------------------------------------------------------------------------
// One value per line, '\n' terminated:
//
//   v0
//   <blank>
//   translation:
//   x / y / z          (3 lines)
//   <blank>
//   rotation:
//   x / y / z / w      (4 lines)
//   <blank>
//   scale:
//   x / y / z          (3 lines)
//
// Decoding is positional. The blank and label lines must exist but their content is
// never inspected, so files with edited labels keep loading.
// -------------------------------------------------------------------------

export namespace Persistence
{
    inline constexpr std::string_view FormatVersion = "v0";

    // Number of lines in an encoded transform.
    inline constexpr int EncodedLineCount = 17;

    // Writes `transform` to `sink`. The first failing write aborts the call and is
    // returned as is; bytes written before it stay in the sink.
    [[nodiscard]] std::expected<void, std::error_code> SerializeTransform(
        IByteSink& sink,
        const ECS::Components::Transform::Component& transform);

    // All-or-nothing decode. Fails on the first missing line, unknown version or
    // field that is not a float.
    [[nodiscard]] std::expected<ECS::Components::Transform::Component, ParseError> DeserializeTransform(
        ILineSource& lines);
}
