#pragma once

#include "util/curlWrappers.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace mds::fetch {

struct HttpRequest {
    enum class Method { GET, HEAD };

    Method method = Method::GET;
    std::string url;
    std::vector<std::string> headers;    // "Name: value"
    std::chrono::seconds timeout{30};
};

// Transport seam; production uses CurlHttpClient, tests script responses
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual util::HttpResponse perform(const HttpRequest& request) = 0;
};

}
