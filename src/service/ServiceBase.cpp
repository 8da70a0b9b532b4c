#include "ServiceBase.hpp"

#include "../http/CprTransport.hpp"

#include <plog/Log.h>

#include <utility>

namespace langcloud::service
{

ServiceBase::ServiceBase(std::string name, std::shared_ptr<http::ITransport> transport)
    : name_(std::move(name))
    , transport_(transport ? std::move(transport) : std::make_shared<http::CprTransport>())
{
}

void ServiceBase::setEndPoint(const std::string& url)
{
    endpoint_ = url;
    while (!endpoint_.empty() && endpoint_.back() == '/')
        endpoint_.pop_back();
}

void ServiceBase::setUsernameAndPassword(const std::string& username, const std::string& password)
{
    credentials_ = http::BasicAuth{ username, password };
}

void ServiceBase::setApiKey(const std::string& api_key)
{
    credentials_ = http::BasicAuth{ "apikey", api_key };
}

void ServiceBase::setDefaultHeaders(std::vector<http::Header> headers)
{
    default_headers_ = std::move(headers);
}

http::HttpRequest ServiceBase::prepareRequest(http::HttpRequest request) const
{
    request.url = endpoint_ + request.url;

    for (const auto& h : default_headers_)
    {
        if (!request.headerValue(h.name))
            request.headers.push_back(h);
    }
    if (!request.headerValue("User-Agent"))
        request.headers.push_back({ "User-Agent", std::string("langcloud-cpp/") + kLibraryVersion });

    if (credentials_)
        request.auth = credentials_;
    else
        PLOG_DEBUG << name_ << ": no credentials configured for " << http::method_name(request.method) << " "
                   << request.url;

    return request;
}

} // namespace langcloud::service
