#include "RequestBuilder.hpp"
#include "MediaTypes.hpp"

#include <utility>

namespace langcloud::http
{

RequestBuilder::RequestBuilder(Method method, const std::string& path)
{
    request_.method = method;
    request_.url = path;
}

RequestBuilder RequestBuilder::get(const std::string& path) { return RequestBuilder(Method::Get, path); }

RequestBuilder RequestBuilder::post(const std::string& path) { return RequestBuilder(Method::Post, path); }

RequestBuilder RequestBuilder::put(const std::string& path) { return RequestBuilder(Method::Put, path); }

RequestBuilder RequestBuilder::del(const std::string& path) { return RequestBuilder(Method::Delete, path); }

RequestBuilder& RequestBuilder::withQuery(const std::string& name, const std::string& value)
{
    request_.query.emplace_back(name, value);
    return *this;
}

RequestBuilder& RequestBuilder::withQuery(const std::string& name, const char* value)
{
    return withQuery(name, std::string(value));
}

RequestBuilder& RequestBuilder::withQuery(const std::string& name, bool value)
{
    request_.query.emplace_back(name, value ? "true" : "false");
    return *this;
}

RequestBuilder& RequestBuilder::withHeader(const std::string& name, const std::string& value)
{
    for (auto& h : request_.headers)
    {
        if (iequals(h.name, name))
        {
            h.value = value;
            return *this;
        }
    }
    request_.headers.push_back({ name, value });
    return *this;
}

RequestBuilder& RequestBuilder::withBodyContent(std::string content, const std::string& content_type)
{
    request_.body_kind = HttpRequest::BodyKind::Content;
    request_.body = std::move(content);
    request_.content_type = content_type;
    return *this;
}

RequestBuilder& RequestBuilder::withBodyJson(const nlohmann::json& body)
{
    return withBodyContent(body.dump(), media_type::APPLICATION_JSON);
}

RequestBuilder& RequestBuilder::withForm(MultipartForm form)
{
    request_.body_kind = HttpRequest::BodyKind::Multipart;
    request_.form = std::move(form);
    request_.body.clear();
    request_.content_type = "multipart/form-data";
    return *this;
}

std::string format_path(const std::string& pattern, const std::string& segment)
{
    std::string out = pattern;
    const auto pos = out.find("{}");
    if (pos != std::string::npos)
        out.replace(pos, 2, url_escape(segment));
    return out;
}

} // namespace langcloud::http
