#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace capturelink::net {

struct HttpRequest {
    std::string method;               // "POST", "PUT"
    std::string url;
    std::vector<std::string> headers; // "Name: value"
    std::string body;
    long timeout_ms = 30000;
};

struct HttpResponse {
    long status = 0;                  // 0 when the transfer itself failed
    std::string body;
    std::unordered_map<std::string, std::string> headers; // lower-cased names
    std::string transport_error;      // set when status == 0

    bool transport_failed() const { return status == 0; }

    std::string header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? std::string{} : it->second;
    }
};

// Blocking request/response seam. perform() reports failures through the
// response (status 0 + transport_error) rather than by throwing.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& req) = 0;
};

} // namespace capturelink::net
