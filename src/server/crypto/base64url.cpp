// SPDX-License-Identifier: Apache-2.0
#include "server/crypto/base64url.hpp"

#include <openssl/evp.h>

#include <vector>

namespace eden::crypto {

std::string base64url_encode(std::string_view bytes)
{
    if (bytes.empty())
        return {};
    std::vector<unsigned char> buf(4 * ((bytes.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(
        buf.data(), reinterpret_cast<const unsigned char *>(bytes.data()), static_cast<int>(bytes.size()));
    std::string out;
    out.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        char c = static_cast<char>(buf[i]);
        if (c == '=')
            break;
        if (c == '+')
            c = '-';
        else if (c == '/')
            c = '_';
        out.push_back(c);
    }
    return out;
}

std::optional<std::string> base64url_decode(std::string_view text)
{
    if (text.empty())
        return std::string();
    if (text.size() % 4 == 1)
        return std::nullopt;
    std::string std_alpha;
    std_alpha.reserve(text.size() + 3);
    for (char c : text) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))
            std_alpha.push_back(c);
        else if (c == '-')
            std_alpha.push_back('+');
        else if (c == '_')
            std_alpha.push_back('/');
        else
            return std::nullopt;
    }
    size_t pad = (4 - std_alpha.size() % 4) % 4;
    std_alpha.append(pad, '=');
    std::vector<unsigned char> buf(std_alpha.size() / 4 * 3 + 1);
    int n = EVP_DecodeBlock(
        buf.data(), reinterpret_cast<const unsigned char *>(std_alpha.data()), static_cast<int>(std_alpha.size()));
    if (n < 0 || static_cast<size_t>(n) < pad)
        return std::nullopt;
    std::string out(reinterpret_cast<const char *>(buf.data()), static_cast<size_t>(n) - pad);
    // Reject encodings whose unused trailing bits are set: every token has exactly one spelling.
    if (base64url_encode(out) != text)
        return std::nullopt;
    return out;
}

} // namespace eden::crypto
