// SPDX-License-Identifier: Apache-2.0
#include "server/sso/http_sso_client.hpp"

#include "common/logger.hpp"
#include "common/url.hpp"
#include "eden_auth.pb.h"
#include "server/wire/proto_json.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <vector>

namespace eden::sso {

namespace {
struct HttpResponse
{
    long status{0};
    std::string body;
};

struct CurlDeleter
{
    void operator()(CURL *c) const noexcept { curl_easy_cleanup(c); }
};

struct SlistDeleter
{
    void operator()(curl_slist *l) const noexcept { curl_slist_free_all(l); }
};

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp)
{
    auto *out = static_cast<std::string *>(userp);
    out->append(static_cast<const char *>(contents), size * nmemb);
    return size * nmemb;
}

void global_init_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlRequest
{
    std::string url;
    std::string post_body; // empty -> GET
    std::vector<std::string> headers;
    const ClientProfile *basic_auth{nullptr};
};

HttpResponse perform(const CurlRequest &request)
{
    std::unique_ptr<CURL, CurlDeleter> curl{curl_easy_init()};
    if (!curl)
        throw UpstreamError("curl_easy_init failed");
    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    if (!request.post_body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.post_body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.post_body.size()));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }
    if (request.basic_auth) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl.get(), CURLOPT_USERNAME, request.basic_auth->id.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, request.basic_auth->secret.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto &h : request.headers)
        header_list.reset(curl_slist_append(header_list.release(), h.c_str()));
    if (header_list)
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK)
        throw UpstreamError(std::string("sso request failed: ") + curl_easy_strerror(res));
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

void expect_success(const HttpResponse &r, const char *what)
{
    if (r.status < 200 || r.status >= 300)
        throw UpstreamError(std::string(what) + " returned HTTP " + std::to_string(r.status));
}
} // namespace

HttpSsoClient::HttpSsoClient(std::string base_url, std::shared_ptr<coro::io_scheduler> scheduler)
    : m_base_url(std::move(base_url)), m_scheduler(std::move(scheduler))
{
    global_init_once();
    while (!m_base_url.empty() && m_base_url.back() == '/')
        m_base_url.pop_back();
}

coro::task<TokenSet> HttpSsoClient::exchange_code(std::string code, ClientProfile client)
{
    co_await m_scheduler->schedule();
    CurlRequest request;
    request.url = m_base_url + "/oauth/token";
    request.post_body = "grant_type=authorization_code&code=" + url::encode_component(code);
    request.headers = {"Content-Type: application/x-www-form-urlencoded", "Accept: application/json"};
    request.basic_auth = &client;
    auto r = perform(request);
    expect_success(r, "sso token exchange");

    wire::SsoTokenResponse msg;
    if (!wire::from_json(r.body, msg) || msg.access_token().empty())
        throw UpstreamError("sso token exchange returned an unreadable body");
    eden::log::debug("[sso] code exchanged client={} expires_in={}", client.id, msg.expires_in());
    co_return TokenSet{msg.token_type(), msg.access_token(), msg.refresh_token(), msg.expires_in()};
}

coro::task<Verification> HttpSsoClient::introspect(std::string token_type, std::string access_token)
{
    co_await m_scheduler->schedule();
    CurlRequest request;
    request.url = m_base_url + "/oauth/verify";
    request.headers = {"Authorization: " + token_type + " " + access_token, "Accept: application/json"};
    auto r = perform(request);
    expect_success(r, "sso verify");

    wire::SsoVerification msg;
    if (!wire::from_json(r.body, msg) || msg.character_id() == 0)
        throw UpstreamError("sso verify returned an unreadable body");
    co_return Verification{
        msg.character_id(), msg.character_name(), msg.character_owner_hash(), msg.scopes(), msg.expires_on()};
}

coro::task<void> HttpSsoClient::revoke(std::string access_token, ClientProfile client)
{
    co_await m_scheduler->schedule();
    CurlRequest request;
    request.url = m_base_url + "/oauth/revoke";
    request.post_body = "token_type_hint=access_token&token=" + url::encode_component(access_token);
    request.headers = {"Content-Type: application/x-www-form-urlencoded"};
    request.basic_auth = &client;
    auto r = perform(request);
    expect_success(r, "sso revoke");
    co_return;
}

} // namespace eden::sso
