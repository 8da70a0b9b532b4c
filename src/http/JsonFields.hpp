#pragma once

#include "HttpErrors.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace langcloud::http
{

// Records are JSON objects; anything else (number, array, string, null) is
// a shape mismatch.
inline void require_object(const nlohmann::json& j, const char* record)
{
    if (!j.is_object())
        throw DeserializationError(std::string("expected ") + record + " object, got " + j.type_name());
}

// Reads an optional field; absent or null leaves `out` untouched. A value of
// the wrong type throws nlohmann::json::type_error.
template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;
    out = it->template get<T>();
}

} // namespace langcloud::http
