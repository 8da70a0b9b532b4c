#include "CprTransport.hpp"

#include <cpr/cpr.h>
#include <plog/Log.h>

#include <filesystem>
#include <string>
#include <utility>

namespace
{

inline void apply_common(cpr::Session& s, const langcloud::http::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
}

inline cpr::Header make_header(const langcloud::http::HttpRequest& request)
{
    cpr::Header h;
    for (const auto& kv : request.headers)
        h.emplace(kv.name, kv.value);
    if (request.body_kind == langcloud::http::HttpRequest::BodyKind::Content && !request.content_type.empty() &&
        !request.headerValue("Content-Type"))
    {
        h.emplace("Content-Type", request.content_type);
    }
    return h;
}

inline cpr::Multipart make_multipart(const langcloud::http::MultipartForm& form)
{
    cpr::Multipart multipart{};
    for (const auto& part : form.parts())
    {
        if (part.filename.empty())
        {
            multipart.parts.emplace_back(part.name, part.data, part.content_type);
        }
        else
        {
            cpr::Buffer buffer{ part.data.begin(), part.data.end(), std::filesystem::path{ part.filename } };
            multipart.parts.emplace_back(part.name, buffer, part.content_type);
        }
    }
    return multipart;
}

} // namespace

namespace langcloud::http
{

HttpResponse CprTransport::execute(const HttpRequest& request, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ request.fullUrl() });
    s.SetHeader(make_header(request));
    if (request.auth)
        s.SetAuth(cpr::Authentication{ request.auth->username, request.auth->password, cpr::AuthMode::BASIC });

    switch (request.body_kind)
    {
    case HttpRequest::BodyKind::Content:
        s.SetBody(cpr::Body{ request.body });
        break;
    case HttpRequest::BodyKind::Multipart:
        s.SetMultipart(make_multipart(request.form));
        break;
    case HttpRequest::BodyKind::None:
        break;
    }
    apply_common(s, cfg);

    cpr::Response r;
    switch (request.method)
    {
    case Method::Get:
        r = s.Get();
        break;
    case Method::Post:
        r = s.Post();
        break;
    case Method::Put:
        r = s.Put();
        break;
    case Method::Delete:
        r = s.Delete();
        break;
    }

    HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message.empty() ? std::string("transport error") : r.error.message;
        hr.timed_out = r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT;
        PLOG_DEBUG << method_name(request.method) << " " << request.url << " failed: " << hr.error;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    auto ct = r.header.find("Content-Type");
    if (ct != r.header.end())
        hr.content_type = ct->second;
    PLOG_DEBUG << method_name(request.method) << " " << request.url << " -> HTTP " << hr.status_code << " ("
               << hr.text.size() << " bytes)";
    return hr;
}

} // namespace langcloud::http
