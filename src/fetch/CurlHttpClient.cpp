#include "fetch/CurlHttpClient.hpp"
#include "log/Registry.hpp"

using namespace mds::fetch;
using namespace mds::util;

CurlHttpClient::CurlHttpClient(std::string userAgent) : userAgent_(std::move(userAgent)) {
    ensureCurlGlobalInit();
}

HttpResponse CurlHttpClient::perform(const HttpRequest& request) {
    SList hdrs;
    hdrs.add("Accept: text/plain, */*");
    for (const auto& h : request.headers) hdrs.add(h);

    const long timeout = static_cast<long>(request.timeout.count());

    auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_USERAGENT, userAgent_.c_str());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, timeout);
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, timeout);
        curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
        if (request.method == HttpRequest::Method::HEAD) curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    });

    log::Registry::fetch()->trace("[CurlHttpClient] {} {} -> curl={} http={}{}",
                                  request.method == HttpRequest::Method::HEAD ? "HEAD" : "GET",
                                  request.url, static_cast<int>(res.curl), res.http,
                                  res.effective_url.empty() || res.effective_url == request.url
                                      ? std::string() : " via " + res.effective_url);
    return res;
}
