// modules/protocol/http_transport.h
#ifndef COMFYFLOW_MODULES_PROTOCOL_HTTP_TRANSPORT_H
#define COMFYFLOW_MODULES_PROTOCOL_HTTP_TRANSPORT_H

#include <string>
#include <vector>

namespace comfyflow {

using HttpHeaders = std::vector<std::string>; // "Name: value"

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Request/response seam of the protocol client. Implementations throw
// TransportError on connection failures and on HTTP status >= 400.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body, const HttpHeaders& headers) = 0;
};

class CurlHttpTransport : public HttpTransport {
public:
    struct Config {
        long timeout_sec = 300;
        std::string user_agent = "comfyflow/1.0";
    };

    CurlHttpTransport();
    explicit CurlHttpTransport(Config config);

    HttpResponse get(const std::string& url, const HttpHeaders& headers) override;
    HttpResponse post(const std::string& url, const std::string& body, const HttpHeaders& headers) override;

private:
    Config config_;

    HttpResponse perform(const std::string& url, const HttpHeaders& headers, const std::string* post_body);
};

// curl_global_init exactly once per process
void ensure_curl_initialized();

} // namespace comfyflow

#endif // COMFYFLOW_MODULES_PROTOCOL_HTTP_TRANSPORT_H
