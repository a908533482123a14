#ifndef LETTERS_HTTP_HPP
#define LETTERS_HTTP_HPP

#include <map>
#include <string>

namespace letters {

typedef std::map<std::string, std::string> HttpHeaders;

/**
 * Outcome of one HTTP exchange.
 *
 * Transport failures are reported through the flags, never thrown:
 * status is 0 whenever timeout or network_error is set.
 */
struct HttpResponse {
    long status;
    std::string reason;
    std::string body;
    bool timeout;
    bool network_error;
    std::string network_error_message;

    HttpResponse()
        : status(0)
        , timeout(false)
        , network_error(false)
    {}
};

/**
 * Minimal blocking HTTP transport used by Client.
 */
class HttpClient {
public:
    virtual ~HttpClient() {}

    virtual HttpResponse get(const std::string& url,
                             const HttpHeaders& headers,
                             int timeout_ms) = 0;

    virtual HttpResponse post_json(const std::string& url,
                                   const HttpHeaders& headers,
                                   const std::string& body,
                                   int timeout_ms) = 0;
};

/**
 * libcurl transport. Every call uses a fresh easy handle.
 */
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const HttpHeaders& headers,
                     int timeout_ms);

    HttpResponse post_json(const std::string& url,
                           const HttpHeaders& headers,
                           const std::string& body,
                           int timeout_ms);

private:
    HttpResponse perform(const std::string& method,
                         const std::string& url,
                         const HttpHeaders& headers,
                         const std::string& body,
                         int timeout_ms);
};

/**
 * Standard reason phrase for a status code ("" if unknown).
 */
const char* default_reason_phrase(long status);

} // namespace letters

#endif // LETTERS_HTTP_HPP
