module;
#include <cstddef>
#include <expected>
#include <ios>
#include <ostream>
#include <span>
#include <string>
#include <system_error>
#include <vector>

module Persistence:ByteSink.Impl;
import :ByteSink;

namespace Persistence
{
    std::expected<void, std::error_code> StreamByteSink::Write(std::span<const std::byte> bytes)
    {
        if (bytes.empty())
            return {};

        m_Stream->write(reinterpret_cast<const char*>(bytes.data()),
                        static_cast<std::streamsize>(bytes.size()));
        if (!*m_Stream)
            return std::unexpected(std::make_error_code(std::io_errc::stream));

        return {};
    }

    std::expected<void, std::error_code> BufferByteSink::Write(std::span<const std::byte> bytes)
    {
        m_Bytes.insert(m_Bytes.end(), bytes.begin(), bytes.end());
        return {};
    }

    std::string BufferByteSink::ToString() const
    {
        return std::string(reinterpret_cast<const char*>(m_Bytes.data()), m_Bytes.size());
    }
}
