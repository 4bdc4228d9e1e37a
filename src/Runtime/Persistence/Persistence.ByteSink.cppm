module;
#include <cstddef>
#include <expected>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

export module Persistence:ByteSink;

export namespace Persistence
{
    // Destination for encoded bytes. Sinks never flush or close what they write to;
    // that stays with whoever opened it.
    class IByteSink
    {
    public:
        virtual ~IByteSink() = default;

        [[nodiscard]] virtual std::expected<void, std::error_code> Write(std::span<const std::byte> bytes) = 0;

        [[nodiscard]] std::expected<void, std::error_code> WriteText(std::string_view text)
        {
            return Write(std::as_bytes(std::span<const char>(text.data(), text.size())));
        }

    protected:
        IByteSink() = default;
        IByteSink(const IByteSink&) = default;
        IByteSink& operator=(const IByteSink&) = default;
    };

    // Writes into a caller-owned std::ostream (typically a std::ofstream).
    class StreamByteSink final : public IByteSink
    {
    public:
        explicit StreamByteSink(std::ostream& stream) : m_Stream(&stream) {}

        [[nodiscard]] std::expected<void, std::error_code> Write(std::span<const std::byte> bytes) override;

    private:
        std::ostream* m_Stream;
    };

    // Accumulates everything written, like the asset exporters' byte buffers.
    class BufferByteSink final : public IByteSink
    {
    public:
        [[nodiscard]] std::expected<void, std::error_code> Write(std::span<const std::byte> bytes) override;

        [[nodiscard]] const std::vector<std::byte>& GetBytes() const { return m_Bytes; }
        [[nodiscard]] std::string ToString() const;

    private:
        std::vector<std::byte> m_Bytes;
    };
}
