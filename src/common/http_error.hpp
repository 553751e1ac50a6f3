// SPDX-License-Identifier: Apache-2.0
// http_error.hpp
// Client-facing failures carrying their HTTP status. Anything else escaping a handler is a 500.
#pragma once

#include <stdexcept>
#include <string>

namespace eden {

class HttpError : public std::runtime_error
{
public:
    HttpError(int status, std::string reason, const std::string &message)
        : std::runtime_error(message), m_status(status), m_reason(std::move(reason))
    {}

    int status() const noexcept { return m_status; }
    const std::string &reason() const noexcept { return m_reason; }

private:
    int m_status;
    std::string m_reason;
};

inline HttpError bad_request(const std::string &message)
{
    return HttpError(400, "Bad Request", message);
}

inline HttpError unauthorized(const std::string &message)
{
    return HttpError(401, "Unauthorized", message);
}

inline HttpError not_found(const std::string &message)
{
    return HttpError(404, "Not Found", message);
}

} // namespace eden
