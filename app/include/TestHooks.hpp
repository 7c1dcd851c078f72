#pragma once

#include <functional>
#include <string>
#include <curl/curl.h>

namespace TestHooks {

#ifdef FILE_TAXONOMY_TEST_BUILD
struct HttpRequest {
    std::string method;
    std::string url;
    std::string body;
    long timeout_seconds = 0;
};

struct HttpResponse {
    CURLcode curl_code = CURLE_OK;
    long status = 200;
    std::string body;
};

using HttpTransportProbe = std::function<HttpResponse(const HttpRequest& request)>;
void set_http_transport_probe(HttpTransportProbe probe);
void reset_http_transport_probe();
const HttpTransportProbe& http_transport_probe();
#endif

} // namespace TestHooks
