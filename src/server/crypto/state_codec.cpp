// SPDX-License-Identifier: Apache-2.0
#include "server/crypto/state_codec.hpp"

#include "eden_auth.pb.h"
#include "server/crypto/base64url.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <memory>
#include <vector>

namespace eden::crypto {

namespace {
constexpr size_t NONCE_LEN = 12;
constexpr size_t TAG_LEN = 16;
constexpr std::string_view AAD = "edenauth/state/v1";

struct CtxDeleter
{
    void operator()(EVP_CIPHER_CTX *ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};
using CtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter>;

wire::DeliveryMode to_wire(auth::DeliveryMode m)
{
    switch (m) {
        case auth::DeliveryMode::token:
            return wire::DELIVERY_TOKEN;
        case auth::DeliveryMode::persistent_cookie:
            return wire::DELIVERY_PERSISTENT_COOKIE;
        case auth::DeliveryMode::session_cookie:
            return wire::DELIVERY_SESSION_COOKIE;
        case auth::DeliveryMode::none:
            break;
    }
    return wire::DELIVERY_NONE;
}

auth::DeliveryMode from_wire(wire::DeliveryMode m)
{
    switch (m) {
        case wire::DELIVERY_TOKEN:
            return auth::DeliveryMode::token;
        case wire::DELIVERY_PERSISTENT_COOKIE:
            return auth::DeliveryMode::persistent_cookie;
        case wire::DELIVERY_SESSION_COOKIE:
            return auth::DeliveryMode::session_cookie;
        default:
            return auth::DeliveryMode::none;
    }
}

wire::FlowState to_wire(const auth::FlowState &state)
{
    wire::FlowState msg;
    msg.set_version(StateCodec::VERSION);
    if (auto *s = std::get_if<auth::LoginFlow>(&state)) {
        auto *m = msg.mutable_login();
        m->set_audience(s->audience);
        m->set_delivery(to_wire(s->delivery));
        for (const auto &scope : s->scopes)
            m->add_scopes(scope);
        m->set_redirect(s->redirect);
    } else if (auto *s = std::get_if<auth::RegisterFlow>(&state)) {
        auto *m = msg.mutable_registration();
        m->set_audience(s->audience);
        m->set_delivery(to_wire(s->delivery));
        m->set_redirect(s->redirect);
    } else if (auto *s = std::get_if<auth::AddCharacterFlow>(&state)) {
        auto *m = msg.mutable_add_character();
        m->set_audience(s->audience);
        m->set_account_id(s->account_id);
        m->set_redirect(s->redirect);
    } else if (auto *s = std::get_if<auth::ScopeUpgradeFlow>(&state)) {
        auto *m = msg.mutable_scope_upgrade();
        m->set_account_id(s->account_id);
        m->set_character_id(s->character_id);
        for (const auto &scope : s->scopes)
            m->add_scopes(scope);
    }
    return msg;
}

auth::FlowState from_wire(const wire::FlowState &msg)
{
    switch (msg.variant_case()) {
        case wire::FlowState::kLogin: {
            const auto &m = msg.login();
            return auth::LoginFlow{
                m.audience(), from_wire(m.delivery()), auth::ScopeList(m.scopes().begin(), m.scopes().end()), m.redirect()};
        }
        case wire::FlowState::kRegistration: {
            const auto &m = msg.registration();
            return auth::RegisterFlow{m.audience(), from_wire(m.delivery()), m.redirect()};
        }
        case wire::FlowState::kAddCharacter: {
            const auto &m = msg.add_character();
            return auth::AddCharacterFlow{m.audience(), m.account_id(), m.redirect()};
        }
        case wire::FlowState::kScopeUpgrade: {
            const auto &m = msg.scope_upgrade();
            return auth::ScopeUpgradeFlow{
                m.account_id(), m.character_id(), auth::ScopeList(m.scopes().begin(), m.scopes().end())};
        }
        case wire::FlowState::VARIANT_NOT_SET:
            break;
    }
    throw DecodeError("state carries no flow variant");
}
} // namespace

StateCodec::StateCodec(std::string_view secret)
{
    if (secret.empty())
        throw std::invalid_argument("state codec secret must not be empty");
    SHA256(reinterpret_cast<const unsigned char *>(secret.data()), secret.size(), m_key.data());
}

std::string StateCodec::encode(const auth::FlowState &state) const
{
    std::string plain;
    if (!to_wire(state).SerializeToString(&plain))
        throw std::runtime_error("flow state serialization failed");
    return seal(plain);
}

auth::FlowState StateCodec::decode(std::string_view token) const
{
    wire::FlowState msg;
    if (!msg.ParseFromString(unseal(token)))
        throw DecodeError("state payload is not a flow state");
    if (msg.version() != VERSION)
        throw DecodeError("unsupported state version " + std::to_string(msg.version()));
    return from_wire(msg);
}

std::string StateCodec::seal(std::string_view plain) const
{
    std::string out(NONCE_LEN + plain.size() + TAG_LEN, '\0');
    auto *nonce = reinterpret_cast<unsigned char *>(out.data());
    if (RAND_bytes(nonce, NONCE_LEN) != 1)
        throw std::runtime_error("RAND_bytes failed");

    CtxPtr ctx{EVP_CIPHER_CTX_new()};
    int len = 0;
    int fin = 0;
    auto *ct = nonce + NONCE_LEN;
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_LEN, nullptr) != 1
        || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), nonce) != 1
        || EVP_EncryptUpdate(
               ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char *>(AAD.data()), static_cast<int>(AAD.size()))
            != 1
        || EVP_EncryptUpdate(
               ctx.get(), ct, &len, reinterpret_cast<const unsigned char *>(plain.data()), static_cast<int>(plain.size()))
            != 1
        || EVP_EncryptFinal_ex(ctx.get(), ct + len, &fin) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_LEN, ct + plain.size()) != 1) {
        throw std::runtime_error("state encryption failed");
    }
    return base64url_encode(out);
}

std::string StateCodec::unseal(std::string_view token) const
{
    auto raw = base64url_decode(token);
    if (!raw)
        throw DecodeError("state is not valid base64url");
    if (raw->size() < NONCE_LEN + TAG_LEN)
        throw DecodeError("state is too short");

    const auto *nonce = reinterpret_cast<const unsigned char *>(raw->data());
    const auto *ct = nonce + NONCE_LEN;
    size_t ct_len = raw->size() - NONCE_LEN - TAG_LEN;
    std::vector<unsigned char> tag(ct + ct_len, ct + ct_len + TAG_LEN);
    std::string plain(ct_len, '\0');

    CtxPtr ctx{EVP_CIPHER_CTX_new()};
    int len = 0;
    int fin = 0;
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_LEN, nullptr) != 1
        || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), nonce) != 1
        || EVP_DecryptUpdate(
               ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char *>(AAD.data()), static_cast<int>(AAD.size()))
            != 1
        || EVP_DecryptUpdate(
               ctx.get(), reinterpret_cast<unsigned char *>(plain.data()), &len, ct, static_cast<int>(ct_len))
            != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_LEN, tag.data()) != 1) {
        throw DecodeError("state decryption setup failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char *>(plain.data()) + len, &fin) != 1)
        throw DecodeError("state authentication failed");
    return plain;
}

} // namespace eden::crypto
