// SPDX-License-Identifier: Apache-2.0
// http.hpp
// Minimal HTTP/1.1 request/response model for the auth endpoints (GET only, no bodies in).
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace eden::net {

struct Request
{
    std::string method;
    std::string path; // without query string
    std::unordered_map<std::string, std::string> query; // percent-decoded
    std::unordered_map<std::string, std::string> headers; // lower-case names
    std::unordered_map<std::string, std::string> cookies;

    // Host header as sent (port included); the audience of issued artifacts.
    std::string host() const;
    std::string referrer() const;
    std::optional<std::string> param(const std::string &name) const;
    std::optional<std::string> header(const std::string &lower_name) const;
    std::optional<std::string> cookie(const std::string &name) const;
};

struct Response
{
    int status{200};
    std::string location;
    std::vector<std::string> set_cookies;
    std::string content_type;
    std::string body;

    static Response redirect(std::string location);
    static Response json(int status, std::string body);
};

// Parses "a=1&b=x%20y" into decoded pairs; later duplicates win.
std::unordered_map<std::string, std::string> parse_query(std::string_view qs);

// Returns nullopt for an incomplete or malformed head. `raw` must contain the full header block.
std::optional<Request> parse_request(std::string_view raw);

const char *status_text(int status);
std::string serialize(const Response &r);

} // namespace eden::net
