// SPDX-License-Identifier: Apache-2.0
// state_codec.hpp
// Encrypts a FlowState into the opaque, URL-safe `state` parameter handed to the identity
// provider and back. AES-256-GCM under SHA-256(secret); token = base64url(nonce | ciphertext | tag).
// The GCM tag is the only integrity check: whoever holds the secret can mint any state.
#pragma once

#include "server/auth/flow_state.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace eden::crypto {

class DecodeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class StateCodec
{
public:
    // Layout version of the serialized FlowState; other versions are rejected.
    static constexpr uint32_t VERSION = 1;

    // Throws std::invalid_argument for an empty secret.
    explicit StateCodec(std::string_view secret);

    std::string encode(const auth::FlowState &state) const;

    // Throws DecodeError when the token is malformed, was produced under another secret,
    // was modified, has an unknown version, or does not carry a flow variant.
    auth::FlowState decode(std::string_view token) const;

    // Raw AES-GCM layer under encode/decode. unseal throws DecodeError.
    std::string seal(std::string_view plain) const;
    std::string unseal(std::string_view token) const;

private:
    std::array<unsigned char, 32> m_key{};
};

} // namespace eden::crypto
