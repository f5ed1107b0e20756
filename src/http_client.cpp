#include "http_client.hpp"
#include "text_util.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace rplayer {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, std::map<std::string, std::string>* headers) {
    std::string line(buffer, size * nitems);
    // A new status line starts a fresh header block (redirect chains)
    if (starts_with(line, "HTTP/")) {
        headers->clear();
        return size * nitems;
    }
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = to_lower(trim(line.substr(0, colon)));
        (*headers)[key] = trim(line.substr(colon + 1));
    }
    return size * nitems;
}

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

HttpResponse HttpClient::get(const std::string& url, const HeaderList& headers,
                             std::chrono::milliseconds timeout) {
    HttpRequest request;
    request.url = url;
    request.headers = headers;
    request.timeout = timeout;
    return perform(request);
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body, const HeaderList& headers,
                              std::chrono::milliseconds timeout) {
    HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.body = body;
    request.headers = headers;
    request.timeout = timeout;
    return perform(request);
}

CurlHttpClient::CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::perform(const HttpRequest& request) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string line = key + ": " + value;
        header_list = curl_slist_append(header_list, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }
    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        char* effective = nullptr;
        curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective);
        response.effective_url = effective ? effective : request.url;
    } else {
        response.error = curl_easy_strerror(res);
        response.effective_url = request.url;
        spdlog::debug("http: {} {} failed: {}", request.method, request.url, response.error);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

} // namespace rplayer
