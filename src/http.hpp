#pragma once
#include <string>
#include <vector>
#include <utility>

namespace lookbook {

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;  // 0 = transport failure
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;
};

// POSIX sockets + OpenSSL
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
};

// HTTP POST, blocking until the response is complete or the timeout expires
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 120);

} // namespace lookbook
