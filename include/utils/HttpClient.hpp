#pragma once
#include <string>
#include <map>
#include <vector>

namespace TableScrape {

class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    struct Response {
        int statusCode;
        std::string body;
        std::map<std::string, std::string> headers;
        bool success;
        std::string error;
    };

    // Extra request headers as "Name: value" lines.
    using HeaderList = std::vector<std::string>;

    Response get(const std::string& url, const HeaderList& headers = {});
    Response post(const std::string& url, const std::string& body, const HeaderList& headers = {});

    void setUserAgent(const std::string& userAgent);
    void setTimeout(long timeoutSeconds);
    void setVerifyPeer(bool verify);
    void setProxy(const std::string& proxy);

private:
    Response perform(const std::string& url, const std::string* body, const HeaderList& headers);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
    std::string userAgent_;
    long timeout_;
    bool verifyPeer_;
    std::string proxy_;
};

}
