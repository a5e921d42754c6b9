#ifndef CAMSYNC_TRANSPORT_H
#define CAMSYNC_TRANSPORT_H

#include <string>
#include <map>
#include <atomic>
#include <ostream>

#include "core/Error.h"

namespace CamSync {

using HttpHeaders = std::map<std::string, std::string>;

/**
 * HTTP request description
 */
struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HttpHeaders headers;
    std::string body;
    int timeoutSeconds = 10;

    // Optional caller-owned abort flag; the transfer stops once it is set
    const std::atomic<bool>* abortFlag = nullptr;

    static HttpRequest get(const std::string& url) {
        HttpRequest request;
        request.url = url;
        return request;
    }

    static HttpRequest postJson(const std::string& url, const std::string& body) {
        HttpRequest request;
        request.method = "POST";
        request.url = url;
        request.body = body;
        request.headers["Content-Type"] = "application/json";
        return request;
    }
};

/**
 * HTTP response. Non-2xx statuses are reported here, not as errors.
 */
struct HttpResponse {
    int statusCode = 0;
    std::string body;
    HttpHeaders headers;   // names lowercased; final response only

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
};

/**
 * Transport - performs HTTP requests for the rest of the library
 *
 * Errors returned by a transport always describe a failure below HTTP
 * (connection, TLS, timeout, abort, sink write) with two exceptions:
 * download() reports a non-2xx status as NETWORK_BAD_STATUS because the
 * body has nowhere sensible to go.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Perform a request and buffer the whole response body
     */
    virtual Result<HttpResponse> request(const HttpRequest& request) = 0;

    /**
     * Perform a request and stream the response body into sink
     * @return Response with empty body on success
     */
    virtual Result<HttpResponse> download(const HttpRequest& request, std::ostream& sink) = 0;
};

} // namespace CamSync

#endif // CAMSYNC_TRANSPORT_H
