#pragma once

#include <functional>
#include <string>

namespace infra::http {

struct JsonResponse {
    unsigned status = 0U;
    std::string body;
    std::string used_weight_header;
    std::string final_host;
    std::string final_target;
};

// Signature shared by the real client and test doubles.
using HttpGet = std::function<JsonResponse(const std::string& host, const std::string& target)>;

// Performs an HTTPS GET, following up to five redirects. Network and TLS
// failures throw domain::FeedError(TransientNetwork); any HTTP status is
// returned to the caller.
JsonResponse https_get_json_response(const std::string& host, const std::string& target, int timeout_sec = 20);

// Throws domain::FeedError classified by status when the response is >= 400.
void raise_for_status(const JsonResponse& response);

HttpGet default_http_get(int timeout_sec = 20);

}  // namespace infra::http
