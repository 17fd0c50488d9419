#include "chunkvault/server/auth_gate.hpp"

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"

namespace chunkvault::server
{

    AuthGate::AuthGate(const Authenticator &authenticator) : authenticator_(authenticator) {}

    std::optional<Identity> AuthGate::check(std::string_view token, std::string_view peer) const
    {
        if (token.empty())
        {
            spdlog::warn("Empty auth token from {}", peer);
            return std::nullopt;
        }
        auto identity = authenticator_.resolve(token);
        if (!identity)
        {
            // Only a digest prefix is logged; the token itself is a credential.
            spdlog::warn("Authentication failed for {} (token {}...)", peer, crypto::hash_text(token).substr(0, 12));
        }
        return identity;
    }

} // namespace chunkvault::server
