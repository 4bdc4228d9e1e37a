module;
#include <cstddef>
#include <expected>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

export module Persistence:LineSource;

export namespace Persistence
{
    // Forward-only sequence of text lines with their terminators stripped.
    // Next() yields std::nullopt once the input is exhausted, which is distinct from an
    // empty line. A failing read is reported as an error code.
    class ILineSource
    {
    public:
        virtual ~ILineSource() = default;

        [[nodiscard]] virtual std::expected<std::optional<std::string>, std::error_code> Next() = 0;

    protected:
        ILineSource() = default;
        ILineSource(const ILineSource&) = default;
        ILineSource& operator=(const ILineSource&) = default;
        ILineSource(ILineSource&&) = default;
        ILineSource& operator=(ILineSource&&) = default;
    };

    // Splits any std::istream on '\n', also dropping a '\r' before it.
    // A line that is not valid UTF-8 fails with std::errc::illegal_byte_sequence.
    // The stream must outlive the source.
    class StreamLineSource final : public ILineSource
    {
    public:
        explicit StreamLineSource(std::istream& stream) : m_Stream(&stream) {}

        [[nodiscard]] std::expected<std::optional<std::string>, std::error_code> Next() override;

    private:
        std::istream* m_Stream;
    };

    // Owns the file it reads. Created through Persistence::OpenStateFile.
    class FileLineSource final : public ILineSource
    {
    public:
        explicit FileLineSource(std::ifstream file) : m_File(std::move(file)) {}

        [[nodiscard]] std::expected<std::optional<std::string>, std::error_code> Next() override;

    private:
        std::ifstream m_File;
    };

    // Lines already held in memory.
    class MemoryLineSource final : public ILineSource
    {
    public:
        explicit MemoryLineSource(std::vector<std::string> lines) : m_Lines(std::move(lines)) {}

        [[nodiscard]] std::expected<std::optional<std::string>, std::error_code> Next() override;

        [[nodiscard]] size_t Remaining() const { return m_Lines.size() - m_Cursor; }

    private:
        std::vector<std::string> m_Lines;
        size_t m_Cursor = 0;
    };
}
