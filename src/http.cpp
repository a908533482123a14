#include "letters/http.hpp"

#include <curl/curl.h>

#include <cctype>

namespace letters {

// =============================================================================
// CURL callbacks
// =============================================================================

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* buf = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buf->append(ptr, total);
    return total;
}

/**
 * Picks the reason phrase out of the status line ("HTTP/1.1 422 Unprocessable Entity").
 * Called for every header line; a new status line (redirect, 100-continue)
 * replaces the previous phrase.
 */
static size_t curl_header_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* reason = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    std::string line(ptr, total);

    if (line.compare(0, 5, "HTTP/") == 0) {
        reason->clear();
        size_t sp1 = line.find(' ');
        size_t sp2 = (sp1 == std::string::npos) ? sp1 : line.find(' ', sp1 + 1);
        if (sp2 != std::string::npos) {
            std::string phrase = line.substr(sp2 + 1);
            while (!phrase.empty() && std::isspace(static_cast<unsigned char>(phrase[phrase.size() - 1]))) {
                phrase.erase(phrase.size() - 1);
            }
            *reason = phrase;
        }
    }
    return total;
}

// =============================================================================
// CurlHttpClient
// =============================================================================

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const HttpHeaders& headers,
                                 int timeout_ms) {
    return perform("GET", url, headers, "", timeout_ms);
}

HttpResponse CurlHttpClient::post_json(const std::string& url,
                                       const HttpHeaders& headers,
                                       const std::string& body,
                                       int timeout_ms) {
    return perform("POST", url, headers, body, timeout_ms);
}

HttpResponse CurlHttpClient::perform(const std::string& method,
                                     const std::string& url,
                                     const HttpHeaders& headers,
                                     const std::string& body,
                                     int timeout_ms) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.network_error = true;
        response.network_error_message = "Failed to initialize CURL";
        return response;
    }

    char error_buf[CURL_ERROR_SIZE] = {0};

    struct curl_slist* header_list = NULL;
    for (HttpHeaders::const_iterator it = headers.begin(); it != headers.end(); ++it) {
        std::string line = it->first + ": " + it->second;
        header_list = curl_slist_append(header_list, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, curl_header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.reason);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        response.timeout = true;
        response.network_error_message = error_buf[0] ? error_buf : curl_easy_strerror(res);
        response.body.clear();
        response.reason.clear();
        return response;
    }
    if (res != CURLE_OK) {
        response.network_error = true;
        response.network_error_message = error_buf[0] ? error_buf : curl_easy_strerror(res);
        response.body.clear();
        response.reason.clear();
        return response;
    }

    response.status = http_code;
    if (response.reason.empty()) {
        response.reason = default_reason_phrase(http_code);
    }
    return response;
}

// =============================================================================
// Reason phrases
// =============================================================================

const char* default_reason_phrase(long status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "";
    }
}

} // namespace letters
