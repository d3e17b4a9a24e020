#pragma once

#include "fetch/HttpClient.hpp"

#include <string>

namespace mds::fetch {

class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(std::string userAgent = "mdsync/1.0");

    util::HttpResponse perform(const HttpRequest& request) override;

private:
    std::string userAgent_;
};

}
