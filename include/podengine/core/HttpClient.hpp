#pragma once

#include <chrono>
#include <fstream>
#include <map>
#include <optional>
#include <string>

namespace podengine {
namespace core {

// Sent with every request.
extern const char* const kUserAgent;

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string contentType;
    // Url after redirects.
    std::string finalUrl;
    // Transport error message; empty when a response was received.
    std::string error;

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

struct RequestOptions {
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds timeout{30000};
    // Basic auth, used when username is set.
    std::optional<std::string> username;
    std::string password;
    std::map<std::string, std::string> params;
    std::string contentType;
};

/// Blocking HTTP seam. The production implementation is CprHttpClient;
/// tests substitute a scripted fake. Implementations must be safe to call
/// from several pool workers at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, const RequestOptions& options) = 0;
    virtual HttpResponse head(const std::string& url, const RequestOptions& options) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const RequestOptions& options) = 0;
    // Streams the body into `out`; the returned response has an empty body.
    virtual HttpResponse download(const std::string& url, std::ofstream& out,
                                  const RequestOptions& options) = 0;
};

class CprHttpClient : public HttpClient {
public:
    explicit CprHttpClient(std::string userAgent);

    HttpResponse get(const std::string& url, const RequestOptions& options) override;
    HttpResponse head(const std::string& url, const RequestOptions& options) override;
    HttpResponse post(const std::string& url, const std::string& body,
                      const RequestOptions& options) override;
    HttpResponse download(const std::string& url, std::ofstream& out,
                          const RequestOptions& options) override;

private:
    std::string userAgent_;
};

/// Follows redirects for `url` and returns where it ends up. Tries a HEAD
/// first, then a GET; falls back to the url itself when neither succeeds.
std::string resolveRedirection(HttpClient& client, const std::string& url);

} // namespace core
} // namespace podengine
