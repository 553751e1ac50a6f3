// SPDX-License-Identifier: Apache-2.0
#include "server/crypto/session_token.hpp"

#include <jwt-cpp/jwt.h>

#include <cassert>
#include <iostream>

using namespace eden::crypto;

static const std::string ISSUER = "https://api.new-eden.io";

static bool rejects(const SessionTokenIssuer &issuer, const std::string &token)
{
    try {
        issuer.verify(token);
    } catch (const TokenError &) {
        return true;
    }
    return false;
}

int main()
{
    SessionTokenIssuer issuer("jwt-secret", ISSUER);
    auto token = issuer.issue("app.new-eden.io", "-Nacc", 90000001);

    auto decoded = jwt::decode(token);
    assert(decoded.get_algorithm() == "HS256");
    assert(decoded.get_type() == "JWT");
    assert(decoded.get_payload_claim("accountId").as_string() == "-Nacc");
    assert(decoded.get_payload_claim("mainId").as_string() == "90000001");
    assert(decoded.get_subject() == "profile");
    assert(!decoded.has_expires_at());

    auto claims = issuer.verify(token);
    assert(claims.issuer == ISSUER);
    assert(claims.subject == "profile");
    assert(claims.audience == "app.new-eden.io");
    assert(claims.account_id == "-Nacc");
    assert(claims.main_character_id == 90000001);

    // Signature, issuer and structure.
    std::string flipped = token;
    flipped.back() = flipped.back() == 'A' ? 'B' : 'A';
    assert(rejects(issuer, flipped));
    assert(rejects(SessionTokenIssuer("other-secret", ISSUER), token));
    assert(rejects(SessionTokenIssuer("jwt-secret", "someone-else"), token));
    assert(rejects(issuer, "a.b"));
    assert(rejects(issuer, "a.b.c.d"));
    assert(rejects(issuer, ""));

    // Numeric mainId from another HS256 issuer sharing the secret is read as well.
    auto numeric = jwt::create()
                       .set_type("JWT")
                       .set_issuer(ISSUER)
                       .set_subject("profile")
                       .set_audience("app.new-eden.io")
                       .set_payload_claim("accountId", jwt::claim(std::string("-Nacc")))
                       .set_payload_claim("mainId", jwt::claim(picojson::value(int64_t{90000002})))
                       .sign(jwt::algorithm::hs256{"jwt-secret"});
    assert(issuer.verify(numeric).main_character_id == 90000002);

    // Wrong subject and missing account claim.
    auto other_subject = jwt::create()
                             .set_issuer(ISSUER)
                             .set_subject("service")
                             .set_audience("app.new-eden.io")
                             .set_payload_claim("accountId", jwt::claim(std::string("-Nacc")))
                             .set_payload_claim("mainId", jwt::claim(std::string("1")))
                             .sign(jwt::algorithm::hs256{"jwt-secret"});
    assert(rejects(issuer, other_subject));
    auto no_account = jwt::create()
                          .set_issuer(ISSUER)
                          .set_subject("profile")
                          .set_audience("app.new-eden.io")
                          .set_payload_claim("mainId", jwt::claim(std::string("1")))
                          .sign(jwt::algorithm::hs256{"jwt-secret"});
    assert(rejects(issuer, no_account));

    // alg=none with a valid payload is refused.
    auto unsigned_token = jwt::create()
                              .set_issuer(ISSUER)
                              .set_subject("profile")
                              .set_audience("app.new-eden.io")
                              .set_payload_claim("accountId", jwt::claim(std::string("-Nacc")))
                              .set_payload_claim("mainId", jwt::claim(std::string("90000001")))
                              .sign(jwt::algorithm::none{});
    assert(rejects(issuer, unsigned_token));

    std::cout << "unit_session_token OK" << std::endl;
    return 0;
}
