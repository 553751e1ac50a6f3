// SPDX-License-Identifier: Apache-2.0
#include "server/crypto/session_token.hpp"

#include <jwt-cpp/jwt.h>

#include <exception>

namespace eden::crypto {

namespace {
// mainId is written as a string; numeric values from other issuers are accepted too.
int64_t main_id_of(const jwt::decoded_jwt<jwt::traits::kazuho_picojson> &decoded)
{
    if (!decoded.has_payload_claim("mainId"))
        throw TokenError("jwt mainId missing");
    auto claim = decoded.get_payload_claim("mainId");
    if (claim.get_type() == jwt::json::type::integer)
        return claim.as_integer();
    if (claim.get_type() != jwt::json::type::string)
        throw TokenError("jwt mainId malformed");
    try {
        size_t used = 0;
        const std::string text = claim.as_string();
        int64_t id = std::stoll(text, &used);
        if (used != text.size())
            throw TokenError("jwt mainId malformed");
        return id;
    } catch (const std::logic_error &) {
        throw TokenError("jwt mainId malformed");
    }
}
} // namespace

SessionTokenIssuer::SessionTokenIssuer(std::string secret, std::string issuer)
    : m_secret(std::move(secret)), m_issuer(std::move(issuer))
{
    if (m_secret.empty())
        throw std::invalid_argument("session token secret must not be empty");
}

std::string SessionTokenIssuer::issue(
    std::string_view audience, std::string_view account_id, int64_t main_character_id) const
{
    return jwt::create()
        .set_type("JWT")
        .set_issuer(m_issuer)
        .set_subject(SUBJECT)
        .set_audience(std::string(audience))
        .set_payload_claim("accountId", jwt::claim(std::string(account_id)))
        .set_payload_claim("mainId", jwt::claim(std::to_string(main_character_id)))
        .sign(jwt::algorithm::hs256{m_secret});
}

ProfileClaims SessionTokenIssuer::verify(std::string_view token) const
{
    try {
        auto decoded = jwt::decode(std::string(token));
        jwt::verify()
            .allow_algorithm(jwt::algorithm::hs256{m_secret})
            .with_issuer(m_issuer)
            .with_subject(SUBJECT)
            .verify(decoded);

        ProfileClaims claims;
        claims.issuer = decoded.get_issuer();
        claims.subject = decoded.get_subject();
        auto audience = decoded.get_audience();
        if (audience.size() != 1)
            throw TokenError("jwt audience invalid");
        claims.audience = *audience.begin();
        if (!decoded.has_payload_claim("accountId"))
            throw TokenError("jwt accountId missing");
        claims.account_id = decoded.get_payload_claim("accountId").as_string();
        claims.main_character_id = main_id_of(decoded);
        return claims;
    } catch (const TokenError &) {
        throw;
    } catch (const std::exception &ex) {
        // Malformed input, signature and claim failures from jwt-cpp.
        throw TokenError(ex.what());
    }
}

} // namespace eden::crypto
