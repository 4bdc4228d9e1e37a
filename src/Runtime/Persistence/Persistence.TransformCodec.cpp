module;
#include <array>
#include <cstddef>
#include <expected>
#include <format>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

module Persistence:TransformCodec.Impl;
import ECS;
import :TransformCodec;
import :ParseError;
import :FloatText;
import :LineSource;
import :ByteSink;

namespace Persistence
{
    namespace
    {
        using TransformComponent = ECS::Components::Transform::Component;

        // "<label>\n" followed by one value per line.
        std::expected<void, std::error_code> WriteBlock(IByteSink& sink,
                                                        std::string_view label,
                                                        std::initializer_list<float> values)
        {
            if (auto written = sink.WriteText(label); !written)
                return written;
            if (auto written = sink.WriteText("\n"); !written)
                return written;

            for (float value : values)
            {
                if (auto written = sink.WriteText(FormatFloat(value)); !written)
                    return written;
                if (auto written = sink.WriteText("\n"); !written)
                    return written;
            }
            return {};
        }

        std::expected<std::string, ParseError> NextLine(ILineSource& lines)
        {
            auto line = lines.Next();
            if (!line)
                return std::unexpected(ParseError::FromIOError(line.error()));
            if (!line->has_value())
                return std::unexpected(ParseError::ExpectedLine());

            return std::move(**line);
        }

        // Separator and label lines: required, content ignored.
        std::expected<void, ParseError> SkipLines(ILineSource& lines, int count)
        {
            for (int i = 0; i < count; ++i)
            {
                if (auto line = NextLine(lines); !line)
                    return std::unexpected(std::move(line.error()));
            }
            return {};
        }

        template<size_t N>
        std::expected<std::array<float, N>, ParseError> NextFloats(ILineSource& lines)
        {
            std::array<float, N> values{};
            for (float& value : values)
            {
                auto line = NextLine(lines);
                if (!line)
                    return std::unexpected(std::move(line.error()));

                auto parsed = ParseFloat(*line);
                if (!parsed)
                    return std::unexpected(ParseError::FromMessage(std::string(ParseFloatErrorToString(parsed.error()))));

                value = *parsed;
            }
            return values;
        }
    }

    std::expected<void, std::error_code> SerializeTransform(IByteSink& sink, const TransformComponent& transform)
    {
        if (auto written = sink.WriteText(FormatVersion); !written)
            return written;
        if (auto written = sink.WriteText("\n\n"); !written)
            return written;

        const glm::vec3& t = transform.Position;
        if (auto written = WriteBlock(sink, "translation:", {t.x, t.y, t.z}); !written)
            return written;
        if (auto written = sink.WriteText("\n"); !written)
            return written;

        const glm::quat& r = transform.Rotation;
        if (auto written = WriteBlock(sink, "rotation:", {r.x, r.y, r.z, r.w}); !written)
            return written;
        if (auto written = sink.WriteText("\n"); !written)
            return written;

        const glm::vec3& s = transform.Scale;
        return WriteBlock(sink, "scale:", {s.x, s.y, s.z});
    }

    std::expected<TransformComponent, ParseError> DeserializeTransform(ILineSource& lines)
    {
        auto version = NextLine(lines);
        if (!version)
            return std::unexpected(std::move(version.error()));
        if (*version != FormatVersion)
            return std::unexpected(ParseError::FromMessage(std::format("Wrong version: {}", *version)));

        if (auto skipped = SkipLines(lines, 2); !skipped)
            return std::unexpected(std::move(skipped.error()));
        auto translation = NextFloats<3>(lines);
        if (!translation)
            return std::unexpected(std::move(translation.error()));

        if (auto skipped = SkipLines(lines, 2); !skipped)
            return std::unexpected(std::move(skipped.error()));
        auto rotation = NextFloats<4>(lines);
        if (!rotation)
            return std::unexpected(std::move(rotation.error()));

        if (auto skipped = SkipLines(lines, 2); !skipped)
            return std::unexpected(std::move(skipped.error()));
        auto scale = NextFloats<3>(lines);
        if (!scale)
            return std::unexpected(std::move(scale.error()));

        TransformComponent transform;
        transform.Position = glm::vec3((*translation)[0], (*translation)[1], (*translation)[2]);

        // Taken as stored: no normalization, no unit-length check.
        transform.Rotation.x = (*rotation)[0];
        transform.Rotation.y = (*rotation)[1];
        transform.Rotation.z = (*rotation)[2];
        transform.Rotation.w = (*rotation)[3];

        transform.Scale = glm::vec3((*scale)[0], (*scale)[1], (*scale)[2]);
        return transform;
    }
}
