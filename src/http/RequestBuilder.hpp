#pragma once

#include "HttpCommon.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace langcloud::http
{

// Fluent builder for HttpRequest. Paths are relative to the service endpoint.
//
//   auto req = RequestBuilder::post("/v2/identify")
//                  .withHeader("Accept", media_type::APPLICATION_JSON)
//                  .withBodyContent(text, media_type::TEXT_PLAIN)
//                  .build();
class RequestBuilder
{
public:
    static RequestBuilder get(const std::string& path);
    static RequestBuilder post(const std::string& path);
    static RequestBuilder put(const std::string& path);
    static RequestBuilder del(const std::string& path);

    RequestBuilder& withQuery(const std::string& name, const std::string& value);
    RequestBuilder& withQuery(const std::string& name, const char* value);
    RequestBuilder& withQuery(const std::string& name, bool value);
    RequestBuilder& withHeader(const std::string& name, const std::string& value);
    RequestBuilder& withBodyContent(std::string content, const std::string& content_type);
    RequestBuilder& withBodyJson(const nlohmann::json& body);
    RequestBuilder& withForm(MultipartForm form);

    HttpRequest build() const { return request_; }

private:
    RequestBuilder(Method method, const std::string& path);

    HttpRequest request_;
};

// Percent-encodes one path segment and substitutes it for "{}" in the pattern.
std::string format_path(const std::string& pattern, const std::string& segment);

} // namespace langcloud::http
