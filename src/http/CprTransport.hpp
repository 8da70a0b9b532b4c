#pragma once

#include "HttpCommon.hpp"

namespace langcloud::http
{

// libcurl-backed transport; one cpr::Session per request.
class CprTransport : public ITransport
{
public:
    HttpResponse execute(const HttpRequest& request, const SessionConfig& cfg) override;
};

} // namespace langcloud::http
