#include "ServiceCall.hpp"

#include <plog/Log.h>

#include <exception>

namespace langcloud::http
{

void throw_if_failed(const HttpRequest& request, const HttpResponse& response)
{
    if (!response.error.empty())
    {
        PLOG_WARNING << method_name(request.method) << " " << request.url << " transport failure: " << response.error;
        throw TransportError(response.error, response.timed_out);
    }
    if (response.status_code < 200 || response.status_code >= 300)
    {
        auto message = extract_error_message(response.text);
        PLOG_WARNING << method_name(request.method) << " " << request.url << " returned HTTP "
                     << response.status_code << ": " << message;
        PLOG_DEBUG << "Response body: " << response.text;
        throw ServiceError(response.status_code, std::move(message), response.text);
    }
}

bool invoke_callback(const char* which, const std::function<void()>& callback)
{
    try
    {
        callback();
        return true;
    }
    catch (const std::exception& ex)
    {
        PLOG_ERROR << "enqueue " << which << " callback threw: " << ex.what();
    }
    catch (...)
    {
        PLOG_ERROR << "enqueue " << which << " callback threw a non-standard exception";
    }
    return false;
}

} // namespace langcloud::http
