// SPDX-License-Identifier: Apache-2.0
#include "server/net/http.hpp"

#include "common/url.hpp"

#include <cctype>
#include <sstream>

namespace eden::net {

namespace {
std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
        s.remove_suffix(1);
    return s;
}

std::string lower(std::string_view s)
{
    std::string out(s);
    for (auto &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

void parse_cookies(std::string_view header, std::unordered_map<std::string, std::string> &out)
{
    while (!header.empty()) {
        auto semi = header.find(';');
        auto item = trim(header.substr(0, semi));
        auto eq = item.find('=');
        if (eq != std::string_view::npos && eq > 0)
            out[std::string(trim(item.substr(0, eq)))] = std::string(trim(item.substr(eq + 1)));
        if (semi == std::string_view::npos)
            break;
        header.remove_prefix(semi + 1);
    }
}
} // namespace

std::string Request::host() const
{
    return header("host").value_or("");
}

std::string Request::referrer() const
{
    return header("referer").value_or("");
}

std::optional<std::string> Request::param(const std::string &name) const
{
    auto it = query.find(name);
    if (it == query.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> Request::header(const std::string &lower_name) const
{
    auto it = headers.find(lower_name);
    if (it == headers.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> Request::cookie(const std::string &name) const
{
    auto it = cookies.find(name);
    if (it == cookies.end())
        return std::nullopt;
    return it->second;
}

Response Response::redirect(std::string location)
{
    Response r;
    r.status = 302;
    r.location = std::move(location);
    return r;
}

Response Response::json(int status, std::string body)
{
    Response r;
    r.status = status;
    r.content_type = "application/json; charset=utf-8";
    r.body = std::move(body);
    return r;
}

std::unordered_map<std::string, std::string> parse_query(std::string_view qs)
{
    std::unordered_map<std::string, std::string> out;
    while (!qs.empty()) {
        auto amp = qs.find('&');
        auto pair = qs.substr(0, amp);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string key = url::decode(pair.substr(0, eq), true);
            std::string value = eq == std::string_view::npos ? std::string() : url::decode(pair.substr(eq + 1), true);
            if (!key.empty())
                out[std::move(key)] = std::move(value);
        }
        if (amp == std::string_view::npos)
            break;
        qs.remove_prefix(amp + 1);
    }
    return out;
}

std::optional<Request> parse_request(std::string_view raw)
{
    auto head_end = raw.find("\r\n\r\n");
    if (head_end == std::string_view::npos)
        return std::nullopt;
    std::string_view head = raw.substr(0, head_end);

    auto line_end = head.find("\r\n");
    std::string_view request_line = head.substr(0, line_end);
    auto sp1 = request_line.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos)
        return std::nullopt;
    auto version = request_line.substr(sp2 + 1);
    if (version.rfind("HTTP/1.", 0) != 0)
        return std::nullopt;

    Request req;
    req.method = std::string(request_line.substr(0, sp1));
    std::string_view target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (target.empty() || target.front() != '/')
        return std::nullopt;
    auto qmark = target.find('?');
    req.path = url::decode(target.substr(0, qmark));
    if (qmark != std::string_view::npos)
        req.query = parse_query(target.substr(qmark + 1));

    std::string_view rest = line_end == std::string_view::npos ? std::string_view() : head.substr(line_end + 2);
    while (!rest.empty()) {
        auto eol = rest.find("\r\n");
        auto line = rest.substr(0, eol);
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0)
            return std::nullopt;
        std::string name = lower(trim(line.substr(0, colon)));
        std::string value(trim(line.substr(colon + 1)));
        if (name == "cookie")
            parse_cookies(value, req.cookies);
        req.headers[std::move(name)] = std::move(value);
        if (eol == std::string_view::npos)
            break;
        rest.remove_prefix(eol + 2);
    }
    return req;
}

const char *status_text(int status)
{
    switch (status) {
        case 200:
            return "OK";
        case 302:
            return "Found";
        case 400:
            return "Bad Request";
        case 401:
            return "Unauthorized";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
    }
    return "Unknown";
}

std::string serialize(const Response &r)
{
    std::ostringstream out;
    out << "HTTP/1.1 " << r.status << ' ' << status_text(r.status) << "\r\n";
    if (!r.location.empty())
        out << "Location: " << r.location << "\r\n";
    for (const auto &c : r.set_cookies)
        out << "Set-Cookie: " << c << "\r\n";
    if (!r.content_type.empty())
        out << "Content-Type: " << r.content_type << "\r\n";
    out << "Cache-Control: no-cache\r\n";
    out << "Content-Length: " << r.body.size() << "\r\n";
    out << "Connection: close\r\n\r\n";
    out << r.body;
    return out.str();
}

} // namespace eden::net
