#include "chunkvault/crypto.hpp"

#include <array>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace chunkvault::crypto
{

    namespace
    {
        std::string hex_encode(const unsigned char *data, std::size_t size)
        {
            // sodium_bin2hex writes a terminating NUL.
            std::string hex(size * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), data, size);
            hex.resize(size * 2);
            return hex;
        }
    } // namespace

    void ensure_sodium_init()
    {
        static std::once_flag once;
        std::call_once(once, []
                       {
                           if (sodium_init() < 0)
                           {
                               throw std::runtime_error("libsodium initialization failed");
                           } });
    }

    Digest::Digest()
    {
        ensure_sodium_init();
        if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    Digest &Digest::update(std::span<const std::uint8_t> data)
    {
        if (finished_)
        {
            throw std::logic_error("digest already finished");
        }
        if (crypto_generichash_update(&state_, data.data(), data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
        return *this;
    }

    Digest &Digest::update(std::string_view data)
    {
        return update(std::span(reinterpret_cast<const std::uint8_t *>(data.data()), data.size()));
    }

    std::string Digest::hex()
    {
        if (finished_)
        {
            throw std::logic_error("digest already finished");
        }
        finished_ = true;
        std::array<unsigned char, crypto_generichash_BYTES> out{};
        if (crypto_generichash_final(&state_, out.data(), out.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return hex_encode(out.data(), out.size());
    }

    std::string hash_bytes(std::span<const std::uint8_t> data)
    {
        return Digest().update(data).hex();
    }

    std::string hash_text(std::string_view text)
    {
        return Digest().update(text).hex();
    }

    std::string random_hex(std::size_t byte_count)
    {
        ensure_sodium_init();
        std::vector<unsigned char> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        return hex_encode(bytes.data(), bytes.size());
    }

} // namespace chunkvault::crypto
