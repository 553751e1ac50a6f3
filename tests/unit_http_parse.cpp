// SPDX-License-Identifier: Apache-2.0
#include "server/net/http.hpp"

#include <cassert>
#include <iostream>

using namespace eden::net;

int main()
{
    std::string raw = "GET /auth/login?redirect_to=https%3A%2F%2Fapp.test%2Fa%3Fb%3D1&response_type=token"
                      "&scopes=esi-skills.read_skills.v1+publicData HTTP/1.1\r\n"
                      "Host: app.test:8443\r\n"
                      "Referer: https://app.test/page\r\n"
                      "Cookie: a=1; profile_jwt=abc.def.ghi\r\n"
                      "Authorization: Bearer xyz\r\n\r\n";
    auto req = parse_request(raw);
    assert(req);
    assert(req->method == "GET");
    assert(req->path == "/auth/login");
    assert(req->param("redirect_to") == "https://app.test/a?b=1");
    assert(req->param("response_type") == "token");
    assert(req->param("scopes") == "esi-skills.read_skills.v1 publicData");
    assert(!req->param("state"));
    assert(req->host() == "app.test:8443");
    assert(req->referrer() == "https://app.test/page");
    assert(req->cookie("profile_jwt") == "abc.def.ghi");
    assert(req->cookie("a") == "1");
    assert(req->header("authorization") == "Bearer xyz");

    assert(!parse_request("GET / HTTP/1.1\r\nHost: x\r\n"));
    assert(!parse_request("GARBAGE\r\n\r\n"));
    assert(!parse_request("GET relative HTTP/1.1\r\n\r\n"));
    assert(!parse_request("GET / SPDY/3\r\n\r\n"));
    assert(!parse_request("GET / HTTP/1.1\r\nno-colon\r\n\r\n"));

    auto redirect = Response::redirect("https://app.test/#tok");
    redirect.set_cookies.push_back("profile_jwt=x; Path=/");
    auto wire = serialize(redirect);
    assert(wire.rfind("HTTP/1.1 302 Found\r\n", 0) == 0);
    assert(wire.find("Location: https://app.test/#tok\r\n") != std::string::npos);
    assert(wire.find("Set-Cookie: profile_jwt=x; Path=/\r\n") != std::string::npos);
    assert(wire.find("Content-Length: 0\r\n") != std::string::npos);

    auto json = serialize(Response::json(503, "{}"));
    assert(json.rfind("HTTP/1.1 503 Service Unavailable\r\n", 0) == 0);
    assert(json.size() > 2 && json.substr(json.size() - 2) == "{}");

    std::cout << "unit_http_parse OK" << std::endl;
    return 0;
}
