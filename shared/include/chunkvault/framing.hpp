/**
 * ChunkVault - Request envelope framing.
 *
 * authTokenLen(4,BE) | authToken | payloadLen(4,BE) | command(1) | commandPayload
 *
 * payloadLen counts the command byte plus the command payload.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault::protocol
{

    inline constexpr std::size_t kLengthFieldSize = sizeof(std::uint32_t);

    struct FrameLimits
    {
        std::uint32_t max_token_size{1024};
        std::uint32_t max_body_size{100u * 1024u * 1024u + 64u * 1024u};
    };

    // A complete frame: the token and the body (command byte + command payload), not yet interpreted.
    struct DecodedFrame
    {
        std::string auth_token;
        std::vector<std::uint8_t> body;
        std::size_t bytes_consumed{};
    };

    struct Envelope
    {
        std::string auth_token;
        std::uint8_t command{};
        std::vector<std::uint8_t> payload;
    };

    std::vector<std::uint8_t> encode_envelope(std::string_view auth_token, std::uint8_t command,
                                              std::span<const std::uint8_t> payload);

    // Returns std::nullopt until the buffer holds a whole frame. Throws ProtocolError when a
    // declared length exceeds `limits`; the stream cannot be resynchronised after that.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer,
                                                 const FrameLimits &limits = {});

    // Splits a frame body into command and payload; an empty body is a malformed envelope.
    Envelope make_envelope(std::string auth_token, std::span<const std::uint8_t> body);

} // namespace chunkvault::protocol
