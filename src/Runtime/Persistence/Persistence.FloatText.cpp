module;
#include <array>
#include <cassert>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <expected>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

module Persistence:FloatText.Impl;
import :FloatText;

namespace Persistence
{
    namespace
    {
        // For a literal from_chars rejected as out of range: true when it overflows,
        // false when it underflows. Decided from the position of the first significant
        // digit plus the written exponent, so no locale-dependent parser is involved.
        bool OverflowsFloat(std::string_view body)
        {
            const size_t ePos = body.find_first_of("eE");
            const std::string_view mantissa = body.substr(0, ePos);

            long long exponent = 0;
            if (ePos != std::string_view::npos)
            {
                std::string_view digits = body.substr(ePos + 1);
                const bool negativeExponent = !digits.empty() && digits.front() == '-';
                if (!digits.empty() && (digits.front() == '+' || digits.front() == '-'))
                    digits.remove_prefix(1);

                auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), exponent);
                if (ec == std::errc::result_out_of_range)
                    return !negativeExponent;
                if (negativeExponent)
                    exponent = -exponent;
            }

            // Decimal magnitude of the leading significant digit, 10^magnitude.
            const size_t dot = mantissa.find('.');
            const size_t integerDigits = dot == std::string_view::npos ? mantissa.size() : dot;
            const size_t first = mantissa.find_first_of("123456789");
            if (first == std::string_view::npos)
                return false;

            const long long magnitude = first < integerDigits
                ? static_cast<long long>(integerDigits - first) - 1
                : -static_cast<long long>(first - integerDigits);

            return magnitude + exponent > 0;
        }
    }

    std::expected<float, ParseFloatError> ParseFloat(std::string_view text)
    {
        if (text.empty())
            return std::unexpected(ParseFloatError::Empty);

        // std::from_chars takes no leading '+', so the sign is handled here for both.
        std::string_view body = text;
        bool negative = false;
        if (body.front() == '+' || body.front() == '-')
        {
            negative = body.front() == '-';
            body.remove_prefix(1);
        }

        if (body.empty() || body.front() == '+' || body.front() == '-')
            return std::unexpected(ParseFloatError::Invalid);

        // "nan(chars)" is a from_chars extension, not a float literal.
        if (body.find('(') != std::string_view::npos)
            return std::unexpected(ParseFloatError::Invalid);

        const char* first = body.data();
        const char* last = body.data() + body.size();

        float value = 0.0f;
        auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);

        if (ec == std::errc::invalid_argument || ptr != last)
            return std::unexpected(ParseFloatError::Invalid);

        // from_chars leaves `value` untouched here; saturate like decimal parsing does.
        if (ec == std::errc::result_out_of_range)
            value = OverflowsFloat(body) ? std::numeric_limits<float>::infinity() : 0.0f;

        return negative ? -value : value;
    }

    std::string FormatFloat(float value)
    {
        if (std::isnan(value))
            return "NaN";
        if (std::isinf(value))
            return value < 0.0f ? "-inf" : "inf";

        // Shortest round-trip digits come from the scientific form ("-1.2345679e+08");
        // they are then laid out positionally.
        std::array<char, 32> buffer{};
        [[maybe_unused]] auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                                                        value, std::chars_format::scientific);
        assert(ec == std::errc{});

        const std::string_view scientific(buffer.data(), static_cast<size_t>(ptr - buffer.data()));
        const size_t ePos = scientific.find('e');

        std::string result;
        std::string digits;
        for (char c : scientific.substr(0, ePos))
        {
            if (c == '-')
                result += '-';
            else if (c != '.')
                digits += c;
        }

        std::string_view exponentText = scientific.substr(ePos + 1);
        if (!exponentText.empty() && exponentText.front() == '+')
            exponentText.remove_prefix(1);
        int exponent = 0;
        std::from_chars(exponentText.data(), exponentText.data() + exponentText.size(), exponent);

        // Number of digits in front of the decimal point.
        const int integerDigits = exponent + 1;
        const int digitCount = static_cast<int>(digits.size());

        if (integerDigits <= 0)
        {
            result += "0.";
            result.append(static_cast<size_t>(-integerDigits), '0');
            result += digits;
        }
        else if (integerDigits >= digitCount)
        {
            result += digits;
            result.append(static_cast<size_t>(integerDigits - digitCount), '0');
        }
        else
        {
            result.append(digits, 0, static_cast<size_t>(integerDigits));
            result += '.';
            result.append(digits, static_cast<size_t>(integerDigits));
        }

        return result;
    }
}
