// SPDX-License-Identifier: Apache-2.0
// base64url.hpp
// URL-safe base64 without padding (RFC 4648 section 5), as used in JWT segments and state tokens.
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace eden::crypto {

std::string base64url_encode(std::string_view bytes);

// Returns nullopt for characters outside the alphabet, impossible lengths and
// non-canonical trailing bits.
std::optional<std::string> base64url_decode(std::string_view text);

} // namespace eden::crypto
