#include "net/CurlTransport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace capturelink::net {

namespace {

size_t write_cb(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* resp = static_cast<std::string*>(userdata);
    resp->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::unordered_map<std::string, std::string>*>(userdata);
    const size_t n = size * nitems;
    std::string line(buffer, n);

    // A new status line starts a new header block (e.g. after "100 Continue").
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return n;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return n;

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
    std::string value = line.substr(colon + 1);
    auto first = value.find_first_not_of(" \t");
    auto last = value.find_last_not_of(" \t\r\n");
    value = (first == std::string::npos) ? std::string{} : value.substr(first, last - first + 1);
    (*headers)[name] = value;
    return n;
}

void global_init_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

std::string CurlTransport::default_user_agent() {
#ifdef CAPTURELINK_GIT_COMMIT
    return std::string("capturelink/") + CAPTURELINK_GIT_COMMIT;
#else
    return "capturelink/unknown";
#endif
}

CurlTransport::CurlTransport(std::string user_agent) : user_agent_(std::move(user_agent)) {
    global_init_once();
}

HttpResponse CurlTransport::perform(const HttpRequest& req) {
    HttpResponse out;

    CURL* curl = curl_easy_init();
    if (!curl) {
        out.transport_error = "curl_easy_init failed";
        return out;
    }

    struct curl_slist* headers = nullptr;
    for (const auto& h : req.headers) headers = curl_slist_append(headers, h.c_str());
    // Large PUT bodies would otherwise wait on "Expect: 100-continue".
    headers = curl_slist_append(headers, "Expect:");

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &out.headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    if (!user_agent_.empty()) curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    } else {
        out.status = 0;
        out.transport_error = curl_easy_strerror(res);
        out.headers.clear();
    }

    // clear the header option on the easy handle before freeing the list
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    return out;
}

} // namespace capturelink::net
