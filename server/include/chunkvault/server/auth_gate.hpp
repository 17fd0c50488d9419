#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace chunkvault::server
{

    struct Identity
    {
        std::string user_id;
        std::string username;
    };

    // Credential collaborator: maps an opaque token to the identity it was issued for.
    class Authenticator
    {
    public:
        virtual ~Authenticator() = default;

        virtual std::optional<Identity> resolve(std::string_view token) const = 0;
    };

    // Runs before any command is dispatched, so unauthenticated peers learn nothing about sessions.
    class AuthGate
    {
    public:
        explicit AuthGate(const Authenticator &authenticator);

        std::optional<Identity> check(std::string_view token, std::string_view peer) const;

    private:
        const Authenticator &authenticator_;
    };

} // namespace chunkvault::server
