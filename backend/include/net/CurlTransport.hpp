#pragma once

#include "net/HttpTransport.hpp"

#include <string>

namespace capturelink::net {

// libcurl easy-handle transport; one handle per request, no redirects followed.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string user_agent = default_user_agent());
    ~CurlTransport() override = default;

    // "capturelink/<git commit>", the commit stamped in by the build.
    static std::string default_user_agent();

    HttpResponse perform(const HttpRequest& req) override;

private:
    std::string user_agent_;
};

} // namespace capturelink::net
