#include "chunkvault/framing.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include "chunkvault/byte_order.hpp"
#include "chunkvault/error_codes.hpp"

namespace chunkvault::protocol
{

    std::vector<std::uint8_t> encode_envelope(std::string_view auth_token, std::uint8_t command,
                                              std::span<const std::uint8_t> payload)
    {
        if (auth_token.size() > std::numeric_limits<std::uint32_t>::max() ||
            payload.size() + 1 > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("envelope too large to frame");
        }
        wire::ByteWriter writer(2 * kLengthFieldSize + auth_token.size() + 1 + payload.size());
        writer.u32(static_cast<std::uint32_t>(auth_token.size()));
        writer.bytes(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(auth_token.data()),
                                                   auth_token.size()));
        writer.u32(static_cast<std::uint32_t>(payload.size() + 1));
        writer.u8(command);
        writer.bytes(payload);
        return writer.take();
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, const FrameLimits &limits)
    {
        if (buffer.size() < kLengthFieldSize)
        {
            return std::nullopt;
        }
        const auto token_size = wire::read_u32_be(buffer.first<kLengthFieldSize>());
        if (token_size > limits.max_token_size)
        {
            throw ProtocolError(ErrorCode::MalformedEnvelope, "Invalid auth token size");
        }
        const std::size_t header_size = kLengthFieldSize + token_size + kLengthFieldSize;
        if (buffer.size() < header_size)
        {
            return std::nullopt;
        }
        const auto body_size =
            wire::read_u32_be(buffer.subspan(kLengthFieldSize + token_size).first<kLengthFieldSize>());
        if (body_size > limits.max_body_size)
        {
            throw ProtocolError(ErrorCode::MalformedEnvelope, "Invalid payload size");
        }
        if (buffer.size() < header_size + body_size)
        {
            return std::nullopt;
        }

        const auto token_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kLengthFieldSize);
        const auto body_begin = buffer.begin() + static_cast<std::ptrdiff_t>(header_size);
        DecodedFrame frame{
            .auth_token = std::string(token_begin, token_begin + token_size),
            .body = std::vector<std::uint8_t>(body_begin, body_begin + body_size),
            .bytes_consumed = header_size + body_size,
        };
        return frame;
    }

    Envelope make_envelope(std::string auth_token, std::span<const std::uint8_t> body)
    {
        if (body.empty())
        {
            throw ProtocolError(ErrorCode::MalformedEnvelope, "Empty payload");
        }
        Envelope envelope;
        envelope.auth_token = std::move(auth_token);
        envelope.command = body.front();
        envelope.payload.assign(body.begin() + 1, body.end());
        return envelope;
    }

} // namespace chunkvault::protocol
