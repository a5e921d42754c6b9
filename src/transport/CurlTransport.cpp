#include "transport/CurlTransport.h"
#include "core/LogManager.h"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace CamSync {

// ==================== CURL Callbacks ====================

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

static size_t StreamCallback(void* contents, size_t size, size_t nmemb, std::ostream* sink) {
    sink->write(static_cast<char*>(contents), static_cast<std::streamsize>(size * nmemb));
    if (!*sink) {
        return 0;  // makes curl fail with CURLE_WRITE_ERROR
    }
    return size * nmemb;
}

static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, HttpHeaders* headers) {
    CurlTransport::parseHeaderLine(std::string(buffer, size * nitems), *headers);
    return size * nitems;
}

static int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* abortFlag = static_cast<const std::atomic<bool>*>(clientp);
    return (abortFlag && abortFlag->load()) ? 1 : 0;
}

static Error errorFromCurlCode(CURLcode code, const std::string& url) {
    std::string reason = curl_easy_strerror(code);

    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return Error(ErrorCode::NETWORK_TIMEOUT, "Request timed out", url);

        case CURLE_ABORTED_BY_CALLBACK:
            return Error::cancelled().withDetails(url);

        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return Error(ErrorCode::NETWORK_SSL_ERROR, reason, url);

        case CURLE_WRITE_ERROR:
            return Error(ErrorCode::FS_WRITE_ERROR, "Failed to write response body", url);

        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        default:
            return Error(ErrorCode::NETWORK_CONNECTION_FAILED, reason, url);
    }
}

// ==================== CurlTransport ====================

void CurlTransport::parseHeaderLine(const std::string& line, HttpHeaders& headers) {
    if (line.compare(0, 5, "HTTP/") == 0) {
        headers.clear();
        return;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return;
    }

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    size_t start = line.find_first_not_of(" \t", colon + 1);
    size_t end = line.find_last_not_of(" \t\r\n");
    headers[name] = (start == std::string::npos || end < start)
        ? std::string()
        : line.substr(start, end - start + 1);
}

CurlTransport::CurlTransport() {
    static std::once_flag initFlag;
    static CURLcode initResult = CURLE_OK;
    std::call_once(initFlag, [] {
        initResult = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    if (initResult != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") +
                                 curl_easy_strerror(initResult));
    }
}

Result<HttpResponse> CurlTransport::request(const HttpRequest& request) {
    return perform(request, nullptr);
}

Result<HttpResponse> CurlTransport::download(const HttpRequest& request, std::ostream& sink) {
    return perform(request, &sink);
}

Result<HttpResponse> CurlTransport::perform(const HttpRequest& request, std::ostream* sink) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Error(ErrorCode::NETWORK_CONNECTION_FAILED, "Failed to initialize CURL", request.url);
    }

    std::string responseBody;
    HttpHeaders responseHeaders;
    struct curl_slist* headers = nullptr;
    for (const auto& header : request.headers) {
        std::string line = header.first + ": " + header.second;
        headers = curl_slist_append(headers, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, m_verifyPeer ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    if (sink) {
        // Error statuses must not end up in the caller's file
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, StreamCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, sink);
    } else {
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &responseHeaders);

    if (request.abortFlag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(request.abortFlag));
    }

    CURLcode res = curl_easy_perform(curl);

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_HTTP_RETURNED_ERROR) {
        return Error::fromHttpStatus(static_cast<int>(httpCode), request.url);
    }

    if (res != CURLE_OK) {
        Error error = errorFromCurlCode(res, request.url);
        LogManager::instance().log(LogLevel::Debug, LogCategory::Network,
            "http_failed", request.method + " " + request.url + " failed", error.toString());
        return error;
    }

    HttpResponse response;
    response.statusCode = static_cast<int>(httpCode);
    response.body = std::move(responseBody);
    response.headers = std::move(responseHeaders);

    if (sink && !response.isSuccess()) {
        return Error::fromHttpStatus(response.statusCode, request.url);
    }

    return response;
}

} // namespace CamSync
