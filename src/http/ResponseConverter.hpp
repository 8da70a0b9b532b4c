#pragma once

#include "HttpCommon.hpp"
#include "HttpErrors.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace langcloud::http
{

// Result of calls whose response body is discarded.
struct NoContent
{
};

struct BinaryContent
{
    std::string content_type;
    std::string data;
};

enum class ConversionKind
{
    WholeObject, // body -> T
    NamedField,  // body[field] -> T (an array of records)
    NoContent,   // body ignored
    Binary       // body bytes as-is
};

template <typename T>
class ResponseConverter
{
public:
    static ResponseConverter object()
    {
        static_assert(!std::is_same_v<T, NoContent> && !std::is_same_v<T, BinaryContent>,
                      "object() needs a JSON-deserializable result type");
        return ResponseConverter(ConversionKind::WholeObject, {});
    }

    static ResponseConverter field(std::string name)
    {
        static_assert(!std::is_same_v<T, NoContent> && !std::is_same_v<T, BinaryContent>,
                      "field() needs a JSON-deserializable result type");
        return ResponseConverter(ConversionKind::NamedField, std::move(name));
    }

    static ResponseConverter none()
    {
        static_assert(std::is_same_v<T, NoContent>, "none() produces NoContent");
        return ResponseConverter(ConversionKind::NoContent, {});
    }

    static ResponseConverter binary()
    {
        static_assert(std::is_same_v<T, BinaryContent>, "binary() produces BinaryContent");
        return ResponseConverter(ConversionKind::Binary, {});
    }

    ConversionKind kind() const { return kind_; }
    const std::string& fieldName() const { return field_; }

    // Only called for 2xx responses.
    T convert(const HttpResponse& resp) const
    {
        if constexpr (std::is_same_v<T, NoContent>)
        {
            (void)resp;
            return NoContent{};
        }
        else if constexpr (std::is_same_v<T, BinaryContent>)
        {
            return BinaryContent{ resp.content_type, resp.text };
        }
        else
        {
            try
            {
                auto json = nlohmann::json::parse(resp.text);
                if (kind_ == ConversionKind::NamedField)
                {
                    if (!json.is_object() || !json.contains(field_))
                        throw DeserializationError("response is missing the '" + field_ + "' field");
                    return json[field_].template get<T>();
                }
                return json.template get<T>();
            }
            catch (const nlohmann::json::exception& ex)
            {
                throw DeserializationError(std::string("JSON parse error: ") + ex.what());
            }
        }
    }

private:
    ResponseConverter(ConversionKind kind, std::string field)
        : kind_(kind)
        , field_(std::move(field))
    {
    }

    ConversionKind kind_;
    std::string field_;
};

} // namespace langcloud::http
