// SPDX-License-Identifier: Apache-2.0
#include "server/auth/flows.hpp"

#include "common/http_error.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "common/url.hpp"
#include "eden_auth.pb.h"
#include "server/auth/scopes.hpp"
#include "server/wire/proto_json.hpp"

#include <chrono>

namespace eden::auth {

namespace {
int64_t now_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string require(std::optional<std::string> value, const char *message)
{
    if (!value || value->empty())
        throw bad_request(message);
    return std::move(*value);
}

DeliveryMode require_delivery(const net::Request &req)
{
    auto mode = parse_delivery_mode(req.param("response_type").value_or(""));
    if (!mode)
        throw bad_request("Invalid Request, valid response_type parameter is required.");
    return *mode;
}

net::Response flow_block(const char *error, std::string redirect)
{
    wire::FlowBlockBody body;
    body.set_error(error);
    body.set_redirect(std::move(redirect));
    return net::Response::json(503, wire::to_json(body));
}
} // namespace

directory::SsoGrant make_grant(const IdentityAssertion &identity, int64_t now)
{
    directory::SsoGrant g;
    g.access_token = identity.access_token;
    g.refresh_token = identity.refresh_token;
    g.expires_at_ms = now + (identity.expires_in - 60) * 1000;
    g.scope = identity.granted_scopes;
    return g;
}

directory::CharacterRecord make_character(const IdentityAssertion &identity, std::string account_id, int64_t now)
{
    directory::CharacterRecord c;
    c.id = identity.character_id;
    c.account_id = std::move(account_id);
    c.name = identity.character_name;
    c.owner_hash = identity.owner_hash;
    c.sso = make_grant(identity, now);
    return c;
}

AuthFlows::AuthFlows(
    FlowSettings settings,
    crypto::StateCodec codec,
    crypto::SessionTokenIssuer issuer,
    sso::ISsoClient &sso,
    directory::IDirectory &directory,
    directory::IUserAccounts &users)
    : m_settings(std::move(settings)), m_codec(std::move(codec)), m_issuer(std::move(issuer)), m_sso(sso),
      m_directory(directory), m_users(users)
{}

FlowState AuthFlows::decode_state(const std::optional<std::string> &token) const
{
    std::string t = require(token, "Invalid Request, state parameter is required.");
    try {
        return m_codec.decode(t);
    } catch (const crypto::DecodeError &ex) {
        eden::log::warn("[flow] rejected state: {}", ex.what());
        throw bad_request("Invalid Request, state parameter is invalid.");
    }
}

std::string AuthFlows::authorize_url(
    const sso::ClientProfile &client, const FlowState &state, const ScopeList *scopes) const
{
    std::string u = m_settings.sso_base_url + client.authorize_path;
    u += "?response_type=code&redirect_uri=" + url::encode_component(client.redirect_uri);
    u += "&client_id=" + url::encode_component(client.id);
    if (scopes)
        u += "&scope=" + join_scopes(*scopes);
    u += "&state=" + m_codec.encode(state);
    return u;
}

std::string AuthFlows::character_not_found_url(const std::string &redirect, const ScopeList &scopes) const
{
    return m_settings.accounts_origin + "?type=character_not_found&redirect_to=" + url::encode_component(redirect)
        + "&scopes=" + join_scopes(scopes);
}

std::string AuthFlows::missing_scopes_url(
    const std::string &name, const std::string &redirect, const std::string &state) const
{
    return m_settings.accounts_origin + "?type=missing_scopes&name=" + url::encode_component(name)
        + "&redirect=" + url::encode_component(redirect) + "&state=" + state;
}

net::Response AuthFlows::start_login(const net::Request &req) const
{
    std::string redirect = require(req.param("redirect_to"), "Invalid Request, redirect_to parameter is required.");
    DeliveryMode delivery = require_delivery(req);
    LoginFlow state{req.host(), delivery, normalize_requested(req.param("scopes")), redirect};
    eden::metrics::bump(eden::metrics::flows().login_started);
    eden::log::info(
        "[flow] login start aud={} response_type={} scopes={}",
        state.audience,
        delivery_mode_name(delivery),
        state.scopes.size());
    return net::Response::redirect(authorize_url(m_settings.login_client, state, nullptr));
}

net::Response AuthFlows::start_register(const net::Request &req) const
{
    std::string redirect = require(req.param("redirect_to"), "Invalid Request, redirect_to parameter is required.");
    DeliveryMode delivery = require_delivery(req);
    ScopeList scopes = build_register_scopes(req.param("scopes"));
    RegisterFlow state{req.host(), delivery, redirect};
    eden::metrics::bump(eden::metrics::flows().register_started);
    eden::log::info("[flow] register start aud={} response_type={}", state.audience, delivery_mode_name(delivery));
    return net::Response::redirect(authorize_url(m_settings.register_client, state, &scopes));
}

net::Response AuthFlows::logout(const net::Request &req) const
{
    std::string redirect = require(req.param("redirect_to"), "Invalid Request, redirect_to parameter is required.");
    auto r = net::Response::redirect(redirect);
    r.set_cookies.push_back(clear_session_cookie(m_settings.cookie));
    return r;
}

coro::task<net::Response> AuthFlows::start_add_character(net::Request req, crypto::ProfileClaims bearer)
{
    std::string redirect = require(req.param("redirect_to"), "Invalid Request, redirect_to parameter is required.");
    if (bearer.audience != req.host())
        throw unauthorized("invalid_client: Token is for another client");
    auto profile = co_await m_directory.get_profile(bearer.account_id);
    if (!profile)
        throw unauthorized("Profile not found");

    ScopeList scopes = build_register_scopes(req.param("scopes"));
    AddCharacterFlow state{req.host(), bearer.account_id, redirect};
    eden::metrics::bump(eden::metrics::flows().add_character_started);
    eden::log::info("[flow] add-character start account={}", bearer.account_id);
    co_return net::Response::redirect(authorize_url(m_settings.register_client, state, &scopes));
}

coro::task<net::Response> AuthFlows::modify_scopes(net::Request req)
{
    std::string redirect = require(req.param("redirect_to"), "Invalid Request, redirect_to parameter is required.");
    FlowState decoded = decode_state(req.param("state"));
    auto *upgrade = std::get_if<ScopeUpgradeFlow>(&decoded);
    if (!upgrade) {
        eden::log::warn("[flow] modify-scopes got {} state", flow_variant_name(decoded));
        throw bad_request("Invalid Request, state does not describe a scope change.");
    }

    auto character = co_await m_directory.get_character(upgrade->character_id);
    if (!character)
        throw bad_request("Invalid Request, character not found.");

    ScopeList merged = merge_held_scopes(upgrade->scopes, character->sso);
    eden::metrics::bump(eden::metrics::flows().modify_scopes_started);
    eden::log::info("[flow] modify-scopes character={} scopes={}", character->id, merged.size());
    co_return net::Response::redirect(
        m_settings.register_path + "?redirect_to=" + url::encode_component(redirect)
        + "&response_type=none&scopes=" + join_scopes(merged));
}

coro::task<IdentityAssertion> AuthFlows::assert_identity(std::string code, sso::ClientProfile client)
{
    auto tokens = co_await m_sso.exchange_code(std::move(code), client);
    auto who = co_await m_sso.introspect(tokens.token_type, tokens.access_token);
    co_return IdentityAssertion{
        who.character_id,
        who.character_name,
        who.owner_hash,
        tokens.access_token,
        tokens.refresh_token,
        tokens.expires_in,
        who.scopes};
}

coro::task<net::Response> AuthFlows::login_callback(net::Request req)
{
    FlowState decoded = decode_state(req.param("state"));
    std::string code = require(req.param("code"), "Invalid Request, code parameter is required.");
    auto *state = std::get_if<LoginFlow>(&decoded);
    if (!state) {
        eden::log::warn("[flow] login callback got {} state", flow_variant_name(decoded));
        throw bad_request("Invalid Request, state does not belong to a login flow.");
    }

    auto identity = co_await assert_identity(code, m_settings.login_client);
    auto character = co_await m_directory.get_character(identity.character_id);
    if (!character) {
        eden::metrics::bump(eden::metrics::flows().blocked_character_not_found);
        eden::log::info("[flow] login character={} not linked", identity.character_id);
        co_return net::Response::redirect(character_not_found_url(state->redirect, state->scopes));
    }

    auto profile = co_await m_directory.get_profile(character->account_id);
    if (!profile)
        throw bad_request("Invalid request, profile doesn't exist!");
    std::string artifact = m_issuer.issue(state->audience, profile->id, profile->main_character_id);

    auto missing = compute_deficit(state->scopes, character->sso);
    if (missing && !missing->empty()) {
        // The freshly minted artifact is dropped: the client must first re-authorize.
        std::string upgrade = m_codec.encode(ScopeUpgradeFlow{character->account_id, character->id, *missing});
        eden::metrics::bump(eden::metrics::flows().blocked_missing_scopes);
        eden::log::info("[flow] login character={} missing {} scopes", character->id, missing->size());
        co_return net::Response::redirect(missing_scopes_url(character->name, state->redirect, upgrade));
    }

    eden::metrics::bump(eden::metrics::flows().sessions_delivered);
    eden::log::info("[flow] login ok account={} character={}", profile->id, character->id);
    co_return deliver(state->redirect, artifact, state->delivery, m_settings.cookie);
}

coro::task<net::Response> AuthFlows::link_new_character(FlowState state, IdentityAssertion identity)
{
    int64_t now = now_ms();
    auto user = directory::make_user_record(identity.character_id, identity.character_name);

    if (auto *reg = std::get_if<RegisterFlow>(&state)) {
        std::string account_id = m_directory.generate_key();
        directory::ProfileRecord profile{account_id, identity.character_id, identity.character_name, false};
        auto results = co_await coro::when_all(
            m_users.upsert_user(std::move(user)),
            m_directory.put_character(make_character(identity, account_id, now)),
            m_directory.put_profile(std::move(profile)));
        std::get<0>(results).return_value();
        std::get<1>(results).return_value();
        std::get<2>(results).return_value();

        eden::metrics::bump(eden::metrics::flows().profiles_created);
        eden::metrics::bump(eden::metrics::flows().sessions_delivered);
        eden::log::info("[flow] register new account={} character={}", account_id, identity.character_id);
        std::string artifact = m_issuer.issue(reg->audience, account_id, identity.character_id);
        co_return deliver(reg->redirect, artifact, reg->delivery, m_settings.cookie);
    }

    if (auto *add = std::get_if<AddCharacterFlow>(&state)) {
        auto results = co_await coro::when_all(
            m_users.upsert_user(std::move(user)),
            m_directory.put_character(make_character(identity, add->account_id, now)));
        std::get<0>(results).return_value();
        std::get<1>(results).return_value();

        eden::metrics::bump(eden::metrics::flows().characters_linked);
        eden::log::info("[flow] linked character={} to account={}", identity.character_id, add->account_id);
        co_return net::Response::redirect(add->redirect);
    }

    throw bad_request("Invalid Request, state does not belong to a register flow.");
}

coro::task<net::Response> AuthFlows::register_callback(net::Request req)
{
    FlowState decoded = decode_state(req.param("state"));
    std::string code = require(req.param("code"), "Invalid Request, code parameter is required.");
    auto *reg = std::get_if<RegisterFlow>(&decoded);
    auto *add = std::get_if<AddCharacterFlow>(&decoded);
    if (!reg && !add) {
        eden::log::warn("[flow] register callback got {} state", flow_variant_name(decoded));
        throw bad_request("Invalid Request, state does not belong to a register flow.");
    }

    auto identity = co_await assert_identity(code, m_settings.register_client);
    auto character = co_await m_directory.get_character(identity.character_id);
    if (!character)
        co_return co_await link_new_character(std::move(decoded), std::move(identity));

    if (character->sso) {
        co_await m_sso.revoke(character->sso->access_token, m_settings.register_client);
    }
    co_await m_directory.set_character_grant(identity.character_id, make_grant(identity, now_ms()));
    eden::metrics::bump(eden::metrics::flows().grants_replaced);

    const std::string &audience = reg ? reg->audience : add->audience;
    const std::string &redirect = reg ? reg->redirect : add->redirect;
    const std::string &account_id = add ? add->account_id : character->account_id;
    DeliveryMode delivery = reg ? reg->delivery : DeliveryMode::none;

    eden::log::info("[flow] re-authorized character={} account={}", identity.character_id, account_id);
    std::string artifact = m_issuer.issue(audience, account_id, identity.character_id);
    if (delivery != DeliveryMode::none)
        eden::metrics::bump(eden::metrics::flows().sessions_delivered);
    co_return deliver(redirect, artifact, delivery, m_settings.cookie);
}

coro::task<net::Response> AuthFlows::verify(
    net::Request req, crypto::ProfileClaims bearer, std::optional<int64_t> character_id)
{
    std::string raw = require(req.param("scopes"), "Invalid request, scopes parameter is required.");
    ScopeList scopes = split_scopes(url::decode(raw));
    int64_t target = character_id.value_or(bearer.main_character_id);

    auto profile = co_await m_directory.get_profile(bearer.account_id);
    if (!profile)
        throw bad_request("Invalid request, profile doesn't exist!");

    auto character = co_await m_directory.get_character(target);
    if (!character) {
        eden::metrics::bump(eden::metrics::flows().blocked_character_not_found);
        co_return flow_block("character_not_found", character_not_found_url(req.referrer(), scopes));
    }
    if (character->account_id != bearer.account_id)
        throw unauthorized("Character not part of provided profile!");

    auto missing = compute_deficit(scopes, character->sso);
    if (missing && !missing->empty()) {
        std::string upgrade = m_codec.encode(ScopeUpgradeFlow{character->account_id, character->id, *missing});
        eden::metrics::bump(eden::metrics::flows().blocked_missing_scopes);
        co_return flow_block("missing_scopes", missing_scopes_url(character->name, req.referrer(), upgrade));
    }

    wire::VerifyResultBody body;
    body.set_character_id(target);
    body.set_token(co_await m_users.create_custom_token(std::to_string(target)));
    eden::metrics::bump(eden::metrics::flows().verify_ok);
    co_return net::Response::json(200, wire::to_json(body));
}

} // namespace eden::auth
