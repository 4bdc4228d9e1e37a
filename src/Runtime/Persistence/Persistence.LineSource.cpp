module;
#include <cstddef>
#include <expected>
#include <fstream>
#include <istream>
#include <ios>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

module Persistence:LineSource.Impl;
import :LineSource;

namespace Persistence
{
    namespace
    {
        // Well-formed UTF-8: no overlongs, no surrogates, nothing above U+10FFFF.
        bool IsValidUtf8(std::string_view text)
        {
            size_t i = 0;
            while (i < text.size())
            {
                const auto lead = static_cast<unsigned char>(text[i]);
                if (lead < 0x80)
                {
                    ++i;
                    continue;
                }

                size_t length = 0;
                unsigned char low = 0x80;
                unsigned char high = 0xBF;
                if (lead >= 0xC2 && lead <= 0xDF)
                    length = 2;
                else if (lead >= 0xE0 && lead <= 0xEF)
                {
                    length = 3;
                    if (lead == 0xE0) low = 0xA0;
                    if (lead == 0xED) high = 0x9F;
                }
                else if (lead >= 0xF0 && lead <= 0xF4)
                {
                    length = 4;
                    if (lead == 0xF0) low = 0x90;
                    if (lead == 0xF4) high = 0x8F;
                }
                else
                    return false;

                if (text.size() - i < length)
                    return false;

                // Only the first continuation byte has a narrowed range.
                for (size_t k = 1; k < length; ++k)
                {
                    const auto c = static_cast<unsigned char>(text[i + k]);
                    const unsigned char min = k == 1 ? low : 0x80;
                    const unsigned char max = k == 1 ? high : 0xBF;
                    if (c < min || c > max)
                        return false;
                }

                i += length;
            }
            return true;
        }

        std::expected<std::optional<std::string>, std::error_code> ReadLine(std::istream& stream)
        {
            std::string line;
            if (!std::getline(stream, line))
            {
                if (stream.bad())
                    return std::unexpected(std::make_error_code(std::io_errc::stream));

                return std::optional<std::string>{};
            }

            // getline stops at '\n' without setting eof; only "\r\n" is a line ending.
            if (!stream.eof() && !line.empty() && line.back() == '\r')
                line.pop_back();

            if (!IsValidUtf8(line))
                return std::unexpected(std::make_error_code(std::errc::illegal_byte_sequence));

            return std::optional<std::string>(std::move(line));
        }
    }

    std::expected<std::optional<std::string>, std::error_code> StreamLineSource::Next()
    {
        return ReadLine(*m_Stream);
    }

    std::expected<std::optional<std::string>, std::error_code> FileLineSource::Next()
    {
        return ReadLine(m_File);
    }

    std::expected<std::optional<std::string>, std::error_code> MemoryLineSource::Next()
    {
        if (m_Cursor >= m_Lines.size())
            return std::optional<std::string>{};

        return std::optional<std::string>(m_Lines[m_Cursor++]);
    }
}
