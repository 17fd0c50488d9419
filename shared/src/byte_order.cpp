#include "chunkvault/byte_order.hpp"

#include <limits>
#include <stdexcept>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::wire
{

    std::uint16_t read_u16_be(std::span<const std::uint8_t, 2> buffer) noexcept
    {
        return static_cast<std::uint16_t>((static_cast<std::uint16_t>(buffer[0]) << 8) |
                                          static_cast<std::uint16_t>(buffer[1]));
    }

    std::uint32_t read_u32_be(std::span<const std::uint8_t, 4> buffer) noexcept
    {
        return (static_cast<std::uint32_t>(buffer[0]) << 24) |
               (static_cast<std::uint32_t>(buffer[1]) << 16) |
               (static_cast<std::uint32_t>(buffer[2]) << 8) |
               static_cast<std::uint32_t>(buffer[3]);
    }

    std::uint64_t read_u64_be(std::span<const std::uint8_t, 8> buffer) noexcept
    {
        std::uint64_t value = 0;
        for (const auto byte : buffer)
        {
            value = (value << 8) | static_cast<std::uint64_t>(byte);
        }
        return value;
    }

    void write_u32_be(std::uint32_t value, std::span<std::uint8_t, 4> buffer) noexcept
    {
        buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
        buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
        buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
        buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
    }

    ByteWriter::ByteWriter(std::size_t reserve)
    {
        buffer_.reserve(reserve);
    }

    ByteWriter &ByteWriter::u8(std::uint8_t value)
    {
        buffer_.push_back(value);
        return *this;
    }

    ByteWriter &ByteWriter::u16(std::uint16_t value)
    {
        buffer_.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
        buffer_.push_back(static_cast<std::uint8_t>(value & 0xFF));
        return *this;
    }

    ByteWriter &ByteWriter::u32(std::uint32_t value)
    {
        const auto offset = buffer_.size();
        buffer_.resize(offset + 4);
        write_u32_be(value, std::span<std::uint8_t, 4>(buffer_.data() + offset, 4));
        return *this;
    }

    ByteWriter &ByteWriter::u64(std::uint64_t value)
    {
        for (int shift = 56; shift >= 0; shift -= 8)
        {
            buffer_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
        }
        return *this;
    }

    ByteWriter &ByteWriter::bytes(std::span<const std::uint8_t> data)
    {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
        return *this;
    }

    ByteWriter &ByteWriter::string8(std::string_view text)
    {
        if (text.size() > std::numeric_limits<std::uint8_t>::max())
        {
            throw std::length_error("string too long for 1-byte length prefix");
        }
        u8(static_cast<std::uint8_t>(text.size()));
        buffer_.insert(buffer_.end(), text.begin(), text.end());
        return *this;
    }

    ByteWriter &ByteWriter::string16(std::string_view text)
    {
        if (text.size() > std::numeric_limits<std::uint16_t>::max())
        {
            throw std::length_error("string too long for 2-byte length prefix");
        }
        u16(static_cast<std::uint16_t>(text.size()));
        buffer_.insert(buffer_.end(), text.begin(), text.end());
        return *this;
    }

    ByteReader::ByteReader(std::span<const std::uint8_t> buffer, std::string_view context)
        : buffer_(buffer), context_(context) {}

    std::span<const std::uint8_t> ByteReader::take(std::size_t count, std::string_view field)
    {
        if (remaining() < count)
        {
            throw TruncatedInput("Invalid " + context_ + ": incomplete " + std::string(field));
        }
        auto view = buffer_.subspan(offset_, count);
        offset_ += count;
        return view;
    }

    std::uint8_t ByteReader::u8()
    {
        return take(1, "u8 field")[0];
    }

    std::uint16_t ByteReader::u16()
    {
        return read_u16_be(take(2, "u16 field").first<2>());
    }

    std::uint32_t ByteReader::u32()
    {
        return read_u32_be(take(4, "u32 field").first<4>());
    }

    std::uint64_t ByteReader::u64()
    {
        return read_u64_be(take(8, "u64 field").first<8>());
    }

    std::span<const std::uint8_t> ByteReader::bytes(std::size_t count)
    {
        return take(count, "data");
    }

    std::string ByteReader::string8()
    {
        const auto length = u8();
        const auto view = take(length, "string");
        return std::string(view.begin(), view.end());
    }

    std::string ByteReader::string16()
    {
        const auto length = u16();
        const auto view = take(length, "string");
        return std::string(view.begin(), view.end());
    }

} // namespace chunkvault::wire
