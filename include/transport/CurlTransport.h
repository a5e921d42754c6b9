#ifndef CAMSYNC_CURL_TRANSPORT_H
#define CAMSYNC_CURL_TRANSPORT_H

#include "transport/Transport.h"

namespace CamSync {

/**
 * Transport backed by libcurl easy handles
 *
 * Every call uses its own handle, so one instance can be shared by
 * several threads.
 */
class CurlTransport : public Transport {
public:
    CurlTransport();
    ~CurlTransport() override = default;

    Result<HttpResponse> request(const HttpRequest& request) override;
    Result<HttpResponse> download(const HttpRequest& request, std::ostream& sink) override;

    /**
     * Verify TLS peers (on by default)
     */
    void setVerifyPeer(bool verify) { m_verifyPeer = verify; }

    void setUserAgent(const std::string& userAgent) { m_userAgent = userAgent; }

    /**
     * Fold one raw header line into headers. A status line ("HTTP/...")
     * starts a new response, so headers of redirects are dropped.
     */
    static void parseHeaderLine(const std::string& line, HttpHeaders& headers);

private:
    bool m_verifyPeer = true;
    std::string m_userAgent = "camsync/1.0";

    Result<HttpResponse> perform(const HttpRequest& request, std::ostream* sink);
};

} // namespace CamSync

#endif // CAMSYNC_CURL_TRANSPORT_H
