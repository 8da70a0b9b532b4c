#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "MultipartForm.hpp"

namespace langcloud::http
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 45000;
};

enum class Method
{
    Get,
    Post,
    Put,
    Delete
};

const char* method_name(Method method);

struct BasicAuth
{
    std::string username;
    std::string password;
};

// Fully specified outbound request. Before it reaches a transport the service
// base rewrites `url` from a path into an absolute URL and fills in `auth`.
struct HttpRequest
{
    enum class BodyKind
    {
        None,
        Content, // raw bytes with `content_type` (text/plain, application/json)
        Multipart
    };

    Method method = Method::Get;
    std::string url;
    std::vector<std::pair<std::string, std::string>> query;
    std::vector<Header> headers;

    BodyKind body_kind = BodyKind::None;
    std::string body;
    std::string content_type;
    MultipartForm form;

    std::optional<BasicAuth> auth;

    // Returns the first value of the named query parameter, if any.
    std::optional<std::string> queryValue(const std::string& name) const;
    // Case-insensitive header lookup.
    std::optional<std::string> headerValue(const std::string& name) const;
    // url plus the percent-encoded query string.
    std::string fullUrl() const;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string content_type;
    std::string error; // non-empty on network/transport errors
    bool timed_out = false;

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// Executes one request. Implementations must be safe to call from several
// threads at once.
class ITransport
{
public:
    virtual ~ITransport() = default;
    virtual HttpResponse execute(const HttpRequest& request, const SessionConfig& cfg) = 0;
};

std::string url_escape(const std::string& s);
bool iequals(const std::string& a, const std::string& b);

} // namespace langcloud::http
