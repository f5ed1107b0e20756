#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace rplayer {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HeaderList headers;
    std::string body;
    std::chrono::milliseconds timeout{5000};
};

struct HttpResponse {
    long status = 0;             // 0 when the transfer itself failed
    std::string body;
    std::string effective_url;   // after redirects
    std::string error;           // transport error text, empty on success
    std::map<std::string, std::string> headers;  // keys lowercased

    bool ok() const { return status == 200; }

    // Case-insensitive header lookup, empty if absent
    std::string header(const std::string& name) const;
};

// Blocking HTTP transport used by every upstream client
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Never throws for HTTP or network errors; inspect status/error instead
    virtual HttpResponse perform(const HttpRequest& request) = 0;

    HttpResponse get(const std::string& url, const HeaderList& headers = {},
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));
    HttpResponse post(const std::string& url, const std::string& body, const HeaderList& headers = {},
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));
};

// libcurl implementation. One easy handle per request so it is safe to
// share a single instance between the resolver and poller threads.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent = "Mozilla/5.0");
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse perform(const HttpRequest& request) override;

private:
    std::string user_agent_;
};

} // namespace rplayer

#endif // HTTP_CLIENT_HPP
