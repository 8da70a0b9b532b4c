#pragma once

#include "../http/HttpCommon.hpp"
#include "../http/ResponseConverter.hpp"
#include "../http/ServiceCall.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace langcloud::service
{

inline constexpr const char* kLibraryVersion = "0.1.0";

// Shared plumbing for every remote service: endpoint, credentials, default
// headers and timeouts. Configure before issuing calls; a ServiceCall keeps
// its own copy of the finished request.
class ServiceBase
{
public:
    // A null transport selects the cpr-backed one.
    explicit ServiceBase(std::string name, std::shared_ptr<http::ITransport> transport = nullptr);
    virtual ~ServiceBase() = default;

    const std::string& name() const { return name_; }

    void setEndPoint(const std::string& url);
    const std::string& endPoint() const { return endpoint_; }

    void setUsernameAndPassword(const std::string& username, const std::string& password);
    // API keys travel as basic auth with the fixed user name "apikey".
    void setApiKey(const std::string& api_key);
    bool hasCredentials() const { return credentials_.has_value(); }

    // Sent with every request unless the call sets the same header itself.
    void setDefaultHeaders(std::vector<http::Header> headers);
    const std::vector<http::Header>& defaultHeaders() const { return default_headers_; }

    void setSessionConfig(const http::SessionConfig& cfg) { session_ = cfg; }
    const http::SessionConfig& sessionConfig() const { return session_; }

protected:
    template <typename T>
    http::ServiceCall<T> createServiceCall(http::HttpRequest request, http::ResponseConverter<T> converter) const
    {
        return http::ServiceCall<T>(transport_, prepareRequest(std::move(request)), session_, std::move(converter));
    }

    http::HttpRequest prepareRequest(http::HttpRequest request) const;

private:
    std::string name_;
    std::string endpoint_;
    std::optional<http::BasicAuth> credentials_;
    std::vector<http::Header> default_headers_;
    http::SessionConfig session_{};
    std::shared_ptr<http::ITransport> transport_;
};

} // namespace langcloud::service
