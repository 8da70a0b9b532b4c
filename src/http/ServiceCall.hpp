#pragma once

#include "HttpCommon.hpp"
#include "ResponseConverter.hpp"

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

namespace langcloud::http
{

// Throws TransportError or ServiceError unless the response is a 2xx.
void throw_if_failed(const HttpRequest& request, const HttpResponse& response);

// Runs one enqueue() callback. An exception escaping it is logged and
// contained; returns false in that case.
bool invoke_callback(const char* which, const std::function<void()>& callback);

template <typename T>
using ResponseCallback = std::function<void(T result)>;
using FailureCallback = std::function<void(std::exception_ptr error)>;

// A request that has been built but not sent. Copies are cheap and
// independent; every execute() is a separate round trip.
template <typename T>
class ServiceCall
{
public:
    ServiceCall(std::shared_ptr<ITransport> transport, HttpRequest request, SessionConfig session,
                ResponseConverter<T> converter)
        : transport_(std::move(transport))
        , request_(std::move(request))
        , session_(session)
        , converter_(std::move(converter))
    {
    }

    // Blocking round trip. Throws TransportError, ServiceError or
    // DeserializationError.
    T execute() const
    {
        const auto response = transport_->execute(request_, session_);
        throw_if_failed(request_, response);
        return converter_.convert(response);
    }

    // Runs on a background thread and reports through exactly one of the
    // callbacks. Callbacks run on that thread and must not rely on throwing:
    // an exception from on_response is logged, never forwarded to on_failure.
    void enqueue(ResponseCallback<T> on_response, FailureCallback on_failure) const
    {
        if (!on_response || !on_failure)
            throw std::invalid_argument("enqueue requires both a response and a failure callback");

        std::thread(
            [call = *this, on_response = std::move(on_response), on_failure = std::move(on_failure)]()
            {
                std::optional<T> result;
                try
                {
                    result.emplace(call.execute());
                }
                catch (...)
                {
                    auto error = std::current_exception();
                    invoke_callback("failure", [&] { on_failure(error); });
                    return;
                }
                invoke_callback("response", [&] { on_response(std::move(*result)); });
            })
            .detach();
    }

    // Background execution; the future rethrows on get().
    std::future<T> submit() const
    {
        return std::async(std::launch::async, [call = *this]() { return call.execute(); });
    }

    const HttpRequest& request() const { return request_; }
    const ResponseConverter<T>& converter() const { return converter_; }

private:
    std::shared_ptr<ITransport> transport_;
    HttpRequest request_;
    SessionConfig session_;
    ResponseConverter<T> converter_;
};

} // namespace langcloud::http
