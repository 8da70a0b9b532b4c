#include "HttpErrors.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace langcloud::http
{

namespace
{
constexpr std::size_t kMaxSnippet = 256;

std::string snippet(const std::string& text)
{
    if (text.size() <= kMaxSnippet)
        return text;
    // Never cut inside a UTF-8 sequence: back off over continuation bytes.
    std::size_t cut = kMaxSnippet;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return text.substr(0, cut) + "...";
}
} // namespace

HttpErrorType categorize_http_error(int status_code, const std::string& error_msg)
{
    if (!error_msg.empty())
    {
        // Network/transport errors
        if (error_msg.find("timeout") != std::string::npos || error_msg.find("Timeout") != std::string::npos ||
            error_msg.find("timed out") != std::string::npos)
        {
            return HttpErrorType::Timeout;
        }
        return HttpErrorType::NetworkError;
    }

    if (status_code >= 200 && status_code < 300)
        return HttpErrorType::Success;

    switch (status_code)
    {
    case 408: // Request Timeout
    case 504: // Gateway Timeout
        return HttpErrorType::Timeout;
    case 413: // Payload Too Large
        return HttpErrorType::PayloadTooLarge;
    case 414: // URI Too Long
        return HttpErrorType::UriTooLong;
    default:
        if (status_code >= 500)
            return HttpErrorType::ServerError;
        if (status_code >= 400)
            return HttpErrorType::ClientError;
        return HttpErrorType::Other;
    }
}

std::string get_error_description(HttpErrorType type, int status_code, const std::string& text_snippet)
{
    switch (type)
    {
    case HttpErrorType::Timeout:
        if (status_code == 0)
            return "Request timeout: " + text_snippet;
        return "Request timeout (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    case HttpErrorType::PayloadTooLarge:
        return "HTTP 413 Payload Too Large: " + text_snippet;
    case HttpErrorType::UriTooLong:
        return "HTTP 414 URI Too Long: " + text_snippet;
    case HttpErrorType::NetworkError:
        return "Network error: " + text_snippet;
    case HttpErrorType::ServerError:
        return "Server error (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    case HttpErrorType::ClientError:
        return "Client error (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    default:
        return "HTTP " + std::to_string(status_code) + ": " + text_snippet;
    }
}

std::string extract_error_message(const std::string& body)
{
    auto json = nlohmann::json::parse(body, nullptr, /*allow_exceptions*/ false);
    if (json.is_object())
    {
        if (json.contains("error"))
        {
            const auto& err = json["error"];
            if (err.is_string())
                return err.get<std::string>();
            if (err.is_object() && err.contains("message") && err["message"].is_string())
                return err["message"].get<std::string>();
        }
        for (const char* key : { "error_message", "message", "description", "msg" })
        {
            if (json.contains(key) && json[key].is_string())
                return json[key].get<std::string>();
        }
    }
    return snippet(body);
}

TransportError::TransportError(const std::string& message, bool timeout)
    : LangCloudError(get_error_description(timeout ? HttpErrorType::Timeout : HttpErrorType::NetworkError, 0, message))
    , timeout_(timeout)
{
}

ServiceError::ServiceError(int status_code, std::string server_message, std::string body)
    : LangCloudError(get_error_description(categorize_http_error(status_code, ""), status_code, server_message))
    , status_code_(status_code)
    , category_(categorize_http_error(status_code, ""))
    , server_message_(std::move(server_message))
    , body_(std::move(body))
{
}

} // namespace langcloud::http
