#include "podengine/core/HttpClient.hpp"

#include <iostream>

#include <cpr/cpr.h>

namespace podengine {
namespace core {

const char* const kUserAgent = "podengine/1.0";

namespace {

void configure(cpr::Session& session, const std::string& url, const std::string& userAgent,
               const RequestOptions& options) {
    session.SetUrl(cpr::Url{url});

    cpr::Header header{{"User-Agent", userAgent}};
    if (!options.contentType.empty()) {
        header["Content-Type"] = options.contentType;
    }
    session.SetHeader(header);

    session.SetConnectTimeout(cpr::ConnectTimeout{options.connectTimeout});
    session.SetTimeout(cpr::Timeout{options.timeout});
    session.SetRedirect(cpr::Redirect{50L, true, false, cpr::PostRedirectFlags::POST_ALL});

    if (options.username) {
        session.SetAuth(
            cpr::Authentication{*options.username, options.password, cpr::AuthMode::BASIC});
    }
    if (!options.params.empty()) {
        cpr::Parameters parameters;
        for (const auto& param : options.params) {
            parameters.Add({param.first, param.second});
        }
        session.SetParameters(parameters);
    }
}

HttpResponse toResponse(const cpr::Response& response) {
    HttpResponse result;
    result.status = response.status_code;
    result.body = response.text;
    result.finalUrl = response.url.str();
    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = response.error.message.empty() ? "transport error"
                                                      : response.error.message;
    }
    auto contentType = response.header.find("content-type");
    if (contentType != response.header.end()) {
        result.contentType = contentType->second;
    }
    return result;
}

} // namespace

CprHttpClient::CprHttpClient(std::string userAgent) : userAgent_(std::move(userAgent)) {}

HttpResponse CprHttpClient::get(const std::string& url, const RequestOptions& options) {
    cpr::Session session;
    configure(session, url, userAgent_, options);
    return toResponse(session.Get());
}

HttpResponse CprHttpClient::head(const std::string& url, const RequestOptions& options) {
    cpr::Session session;
    configure(session, url, userAgent_, options);
    return toResponse(session.Head());
}

HttpResponse CprHttpClient::post(const std::string& url, const std::string& body,
                                 const RequestOptions& options) {
    cpr::Session session;
    configure(session, url, userAgent_, options);
    session.SetBody(cpr::Body{body});
    return toResponse(session.Post());
}

HttpResponse CprHttpClient::download(const std::string& url, std::ofstream& out,
                                     const RequestOptions& options) {
    cpr::Session session;
    configure(session, url, userAgent_, options);
    return toResponse(session.Download(out));
}

std::string resolveRedirection(HttpClient& client, const std::string& url) {
    RequestOptions options;
    options.connectTimeout = std::chrono::seconds(5);
    options.timeout = std::chrono::seconds(20);

    // HEAD avoids pulling the body; some hosts refuse it, so fall back to GET.
    HttpResponse head = client.head(url, options);
    if (head.ok() && !head.finalUrl.empty()) {
        return head.finalUrl;
    }

    HttpResponse get = client.get(url, options);
    if (get.ok() && !get.finalUrl.empty()) {
        return get.finalUrl;
    }

    std::cerr << "Could not resolve redirection for " << url << ", using it as is" << std::endl;
    return url;
}

} // namespace core
} // namespace podengine
