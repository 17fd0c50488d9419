/**
 * ChunkVault - Digests and random identifiers backed by libsodium.
 *
 * All digests are unkeyed BLAKE2b with libsodium's default output length,
 * rendered as lower-case hex.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <sodium.h>

namespace chunkvault::crypto
{

    // Initialises libsodium once per process; every helper below calls it.
    void ensure_sodium_init();

    // Incremental BLAKE2b over data that arrives in pieces, e.g. an object being streamed to disk.
    class Digest
    {
    public:
        Digest();

        Digest(const Digest &) = delete;
        Digest &operator=(const Digest &) = delete;

        Digest &update(std::span<const std::uint8_t> data);
        Digest &update(std::string_view data);

        // Finishes the digest; further updates throw std::logic_error.
        std::string hex();

    private:
        crypto_generichash_state state_{};
        bool finished_{false};
    };

    std::string hash_bytes(std::span<const std::uint8_t> data);
    std::string hash_text(std::string_view text);

    // `byte_count` bytes from the libsodium CSPRNG, hex encoded.
    std::string random_hex(std::size_t byte_count);

} // namespace chunkvault::crypto
