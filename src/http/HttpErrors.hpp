#pragma once

#include <stdexcept>
#include <string>

namespace langcloud::http
{

// Categorize HTTP errors
enum class HttpErrorType
{
    Success,
    Timeout,
    PayloadTooLarge,
    UriTooLong,
    NetworkError,
    ServerError,
    ClientError,
    Other
};

HttpErrorType categorize_http_error(int status_code, const std::string& error_msg);
std::string get_error_description(HttpErrorType type, int status_code, const std::string& text_snippet);

// Pulls a human readable message out of a JSON error body. Falls back to the
// raw text (truncated) when the body is not JSON or has no known key.
std::string extract_error_message(const std::string& body);

class LangCloudError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Connection failures and timeouts reported by the transport.
class TransportError : public LangCloudError
{
public:
    TransportError(const std::string& message, bool timeout);

    bool isTimeout() const { return timeout_; }

private:
    bool timeout_;
};

// Non-2xx response.
class ServiceError : public LangCloudError
{
public:
    ServiceError(int status_code, std::string server_message, std::string body);

    int statusCode() const { return status_code_; }
    HttpErrorType category() const { return category_; }
    const std::string& serverMessage() const { return server_message_; }
    const std::string& responseBody() const { return body_; }

private:
    int status_code_;
    HttpErrorType category_;
    std::string server_message_;
    std::string body_;
};

// Response body does not have the expected shape.
class DeserializationError : public LangCloudError
{
public:
    using LangCloudError::LangCloudError;
};

} // namespace langcloud::http
