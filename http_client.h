#pragma once

#include <string>
#include <map>
#include <memory>

#include <curl/curl.h>

/// @brief HTTP response structure
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error_message;
    bool timed_out = false;

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    bool is_error() const {
        return status_code >= 400 || status_code == 0;
    }
};

/// @brief Blocking HTTP client used by the model provider clients
/// One instance owns one curl easy handle and must not be shared between
/// threads; provider clients create one per call.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// @brief Perform HTTP GET request
    /// @param url Full URL to request
    /// @param headers Optional custom headers
    /// @return Response object (status_code 0 and error_message on transport failure)
    HttpResponse get(const std::string& url,
                     const std::map<std::string, std::string>& headers = {});

    /// @brief Perform HTTP POST request
    /// @param url Full URL to request
    /// @param body Request body (typically JSON)
    /// @param headers Optional custom headers
    /// @return Response object
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers = {});

    /// @brief Set request timeout in seconds (0 = no timeout)
    void set_timeout(long timeout_seconds);

    /// @brief Set whether to verify SSL certificates
    void set_ssl_verify(bool verify);

    /// @brief Set custom CA bundle path for SSL verification
    void set_ca_bundle(const std::string& ca_bundle_path);

private:
    CURL* curl_ = nullptr;
    long timeout_seconds_ = 0;
    bool ssl_verify_ = true;
    std::string ca_bundle_path_;

    void configure_curl();
    HttpResponse perform(const std::string& method, const std::string& url,
                         const std::map<std::string, std::string>& headers);

    /// @brief Build the curl header list; caller frees it
    struct curl_slist* set_headers(const std::map<std::string, std::string>& headers);

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
};
