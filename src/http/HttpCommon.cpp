#include "HttpCommon.hpp"

#include <cctype>

namespace langcloud::http
{

const char* method_name(Method method)
{
    switch (method)
    {
    case Method::Get:
        return "GET";
    case Method::Post:
        return "POST";
    case Method::Put:
        return "PUT";
    case Method::Delete:
        return "DELETE";
    }
    return "GET";
}

std::optional<std::string> HttpRequest::queryValue(const std::string& name) const
{
    for (const auto& [key, value] : query)
    {
        if (key == name)
            return value;
    }
    return std::nullopt;
}

std::optional<std::string> HttpRequest::headerValue(const std::string& name) const
{
    for (const auto& h : headers)
    {
        if (iequals(h.name, name))
            return h.value;
    }
    return std::nullopt;
}

std::string HttpRequest::fullUrl() const
{
    if (query.empty())
        return url;

    std::string out = url;
    out.push_back(url.find('?') == std::string::npos ? '?' : '&');
    for (std::size_t i = 0; i < query.size(); ++i)
    {
        if (i)
            out.push_back('&');
        out += url_escape(query[i].first);
        out.push_back('=');
        out += url_escape(query[i].second);
    }
    return out;
}

std::string url_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() * 3);
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : s)
    {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
            c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

bool iequals(const std::string& a, const std::string& b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        char x = static_cast<char>(std::tolower(static_cast<unsigned char>(a[i])));
        char y = static_cast<char>(std::tolower(static_cast<unsigned char>(b[i])));
        if (x != y)
            return false;
    }
    return true;
}

} // namespace langcloud::http
