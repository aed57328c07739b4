#pragma once
#include <functional>
#include <string>
#include <vector>

struct HttpRequest {
    std::string url;
    std::string body;
    std::vector<std::string> headers; // "Name: value"
    long timeout_ms{30000};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

// Throws std::runtime_error when the transfer itself fails; any HTTP status
// is returned to the caller.
HttpResponse http_post_json(const HttpRequest& req);

using HttpPostFn = std::function<HttpResponse(const HttpRequest&)>;
