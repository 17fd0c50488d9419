/**
 * ChunkVault - Big-endian field readers and writers for the binary wire format.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault::wire
{

    std::uint16_t read_u16_be(std::span<const std::uint8_t, 2> buffer) noexcept;
    std::uint32_t read_u32_be(std::span<const std::uint8_t, 4> buffer) noexcept;
    std::uint64_t read_u64_be(std::span<const std::uint8_t, 8> buffer) noexcept;

    void write_u32_be(std::uint32_t value, std::span<std::uint8_t, 4> buffer) noexcept;

    class ByteWriter
    {
    public:
        ByteWriter() = default;
        explicit ByteWriter(std::size_t reserve);

        ByteWriter &u8(std::uint8_t value);
        ByteWriter &u16(std::uint16_t value);
        ByteWriter &u32(std::uint32_t value);
        ByteWriter &u64(std::uint64_t value);
        ByteWriter &bytes(std::span<const std::uint8_t> data);

        // Length-prefixed strings; throw std::length_error when the text does not fit the prefix.
        ByteWriter &string8(std::string_view text);
        ByteWriter &string16(std::string_view text);

        std::size_t size() const noexcept { return buffer_.size(); }
        std::vector<std::uint8_t> take() { return std::move(buffer_); }

    private:
        std::vector<std::uint8_t> buffer_;
    };

    // Cursor over a received buffer. Every read past the end throws TruncatedInput naming `context`.
    class ByteReader
    {
    public:
        ByteReader(std::span<const std::uint8_t> buffer, std::string_view context);

        std::uint8_t u8();
        std::uint16_t u16();
        std::uint32_t u32();
        std::uint64_t u64();
        std::span<const std::uint8_t> bytes(std::size_t count);
        std::string string8();
        std::string string16();

        std::size_t consumed() const noexcept { return offset_; }
        std::size_t remaining() const noexcept { return buffer_.size() - offset_; }

    private:
        std::span<const std::uint8_t> take(std::size_t count, std::string_view field);

        std::span<const std::uint8_t> buffer_;
        std::string context_;
        std::size_t offset_{0};
    };

} // namespace chunkvault::wire
