#include "letters/client.hpp"
#include "letters/credentials.hpp"

#include "logger.hpp"

#include <picojson/picojson.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

#include <sys/stat.h>

namespace letters {

/* Convenience typedefs for picojson */
typedef picojson::value  JsonVal;
typedef picojson::object JsonObj;

// =============================================================================
// Helpers
// =============================================================================

/**
 * Monotonic milliseconds, for request timing only.
 */
static long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

/**
 * Get environment variable or fallback.
 */
static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    if (val && val[0] != '\0') {
        return std::string(val);
    }
    return fallback;
}

static std::string encode_base64(const std::string& data) {
    static const char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);
    unsigned int val = 0;
    int valb = -6;

    for (size_t i = 0; i < data.size(); ++i) {
        val = (val << 8) + static_cast<unsigned char>(data[i]);
        valb += 8;
        while (valb >= 0) {
            result.push_back(base64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }

    if (valb > -6) result.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    while (result.size() % 4) result.push_back('=');

    return result;
}

/**
 * Percent-encode text as a single URL path segment. Everything outside the
 * unreserved set is escaped, '/' included; "." and ".." are escaped whole so
 * they cannot be taken as dot segments.
 */
static std::string encode_path_segment(const std::string& text) {
    static const char hex[] = "0123456789ABCDEF";

    bool dots_only = text == "." || text == "..";
    std::string out;
    out.reserve(text.size() * 3);
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '~' ||
                          (c == '.' && !dots_only);
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

// =============================================================================
// picojson helpers
// =============================================================================

/** Create a JSON string value. */
static JsonVal jstr(const std::string& s) {
    return JsonVal(s);
}

/**
 * Parse a complete JSON document. Unlike picojson::parse(value, string),
 * trailing non-whitespace is an error. Returns "" on success.
 *
 * picojson throws std::overflow_error for numbers outside double range;
 * that is reported like any other parse error.
 */
static std::string parse_json(const std::string& text, JsonVal& out) {
    std::string err;
    std::string::const_iterator end;
    try {
        end = picojson::parse(out, text.begin(), text.end(), &err);
    } catch (const std::exception& e) {
        out = JsonVal();
        return e.what()[0] != '\0' ? e.what() : "number out of range";
    }
    if (!err.empty()) {
        return err;
    }
    for (; end != text.end(); ++end) {
        if (!std::isspace(static_cast<unsigned char>(*end))) {
            return "unexpected trailing data";
        }
    }
    return "";
}

/**
 * Read a field of an error body as text. Strings are taken as is, other
 * values as compact JSON; missing and null fields give "".
 */
static std::string json_text(const JsonObj& obj, const char* key) {
    JsonObj::const_iterator it = obj.find(key);
    if (it == obj.end() || it->second.is<picojson::null>()) {
        return "";
    }
    if (it->second.is<std::string>()) {
        return it->second.get<std::string>();
    }
    return it->second.serialize();
}

static bool blank(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (!std::isspace(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// =============================================================================
// Document loading
// =============================================================================

/**
 * Read the PDF to upload. Every failure is a LocalError; nothing is sent.
 */
static std::string read_document(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR || err == ELOOP || err == ENAMETOOLONG) {
            throw LocalError("File not found: " + path);
        }
        if (err == EACCES) {
            throw LocalError("Permission denied: " + path);
        }
        throw LocalError("Cannot read file: " + path, std::strerror(err));
    }
    if (!S_ISREG(st.st_mode)) {
        throw LocalError("Not a file: " + path);
    }

    errno = 0;
    std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        int err = errno;
        if (err == EACCES || err == EPERM) {
            throw LocalError("Permission denied: " + path);
        }
        throw LocalError("Cannot read file: " + path,
                         err != 0 ? std::strerror(err) : "open failed");
    }

    std::string data((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw LocalError("Cannot read file: " + path, std::strerror(errno));
    }
    return data;
}

// =============================================================================
// Client::Impl (PIMPL)
// =============================================================================

struct Client::Impl {
    std::string api_key;
    std::string base_url;
    int timeout_ms;
    std::shared_ptr<HttpClient> http;

    Impl(const Config& config, std::shared_ptr<HttpClient> transport)
        : http(transport)
    {
        init_logger();

        /* Resolve API key */
        api_key = config.api_key;
        if (api_key.empty()) {
            api_key = load_api_key();
        }

        /* Resolve base URL */
        base_url = config.base_url;
        if (base_url.empty()) {
            base_url = env_or(BASE_URL_ENV_VAR, DEFAULT_BASE_URL);
        }
        while (!base_url.empty() && base_url[base_url.size() - 1] == '/') {
            base_url.erase(base_url.size() - 1);
        }

        timeout_ms = config.timeout_ms > 0 ? config.timeout_ms : DEFAULT_TIMEOUT_MS;

        if (!http) {
            http = std::make_shared<CurlHttpClient>();
        }
    }

    HttpHeaders headers() const {
        HttpHeaders h;
        h["Authorization"] = "Bearer " + api_key;
        h["Content-Type"] = "application/json";
        h["User-Agent"] = USER_AGENT;
        return h;
    }

    /**
     * Make one HTTP request and classify the outcome.
     * Returns the parsed body of a 2xx response.
     */
    ApiResult request(const std::string& method, const std::string& path, const std::string& body) {
        std::string url = base_url + path;
        LETTERS_LOG(method + " " + path);

        long long start = now_ms();
        HttpResponse resp;
        if (method == "POST") {
            resp = http->post_json(url, headers(), body, timeout_ms);
        } else {
            resp = http->get(url, headers(), timeout_ms);
        }
        long long elapsed = now_ms() - start;

        if (resp.timeout) {
            LETTERS_LOG(method + " " + path + " timed out: " + resp.network_error_message);
            throw TimeoutError(timeout_ms);
        }
        if (resp.network_error) {
            LETTERS_LOG(method + " " + path + " failed: " + resp.network_error_message);
            throw NetworkError("Could not reach the API", resp.network_error_message);
        }

        std::ostringstream status_line;
        status_line << method << " " << path << " -> " << resp.status
                    << " (" << elapsed << "ms, " << resp.body.size() << " bytes)";
        LETTERS_LOG(status_line.str());

        int status = static_cast<int>(resp.status);

        if (resp.status < 200 || resp.status >= 300) {
            throw server_error(status, resp);
        }

        if (blank(resp.body)) {
            return JsonVal(JsonObj());
        }

        JsonVal parsed;
        std::string parse_err = parse_json(resp.body, parsed);
        if (!parse_err.empty()) {
            LETTERS_LOG("unparsable success body: " + parse_err);
            throw ServerError("Invalid JSON in API response", status, "", parse_err);
        }
        return parsed;
    }

    static ServerError server_error(int status, const HttpResponse& resp) {
        JsonVal parsed;
        std::string parse_err = parse_json(resp.body, parsed);

        if (!parse_err.empty() || !parsed.is<JsonObj>()) {
            std::ostringstream msg;
            msg << "HTTP " << status << " with non-JSON response";
            return ServerError(msg.str(), status, "", resp.reason);
        }

        const JsonObj& data = parsed.get<JsonObj>();
        std::string msg = json_text(data, "error");
        if (msg.empty()) {
            std::ostringstream oss;
            oss << "HTTP " << status;
            msg = oss.str();
        }
        return ServerError(
            msg,
            status,
            json_text(data, "code"),
            json_text(data, "detail"),
            json_text(data, "field")
        );
    }

    ApiResult get(const std::string& path) {
        return request("GET", path, "");
    }

    ApiResult post(const std::string& path, const JsonObj& body) {
        return request("POST", path, JsonVal(body).serialize());
    }
};

// =============================================================================
// Client construction / destruction
// =============================================================================

Client::Client(const Config& config)
    : impl_(new Impl(config, std::shared_ptr<HttpClient>()))
{}

Client::Client(const Config& config, std::shared_ptr<HttpClient> http)
    : impl_(new Impl(config, http))
{}

Client::~Client() {}

Client::Client(Client&& other)
    : impl_(std::move(other.impl_))
{}

Client& Client::operator=(Client&& other) {
    impl_ = std::move(other.impl_);
    return *this;
}

const std::string& Client::base_url() const {
    return impl_->base_url;
}

int Client::timeout_ms() const {
    return impl_->timeout_ms;
}

// =============================================================================
// sendLetter()
// =============================================================================

ApiResult Client::sendLetter(const LetterRequest& request) {
    std::string pdf = read_document(request.pdf_path);

    std::ostringstream info;
    info << "sending " << pdf.size() << " byte document, type=" << request.letter_type
         << ", country=" << request.country;
    LETTERS_LOG(info.str());

    JsonObj recipient;
    recipient["name"] = jstr(request.name);
    recipient["street"] = jstr(request.street);
    recipient["zip"] = jstr(request.zip);
    recipient["city"] = jstr(request.city);
    recipient["country"] = jstr(request.country);

    JsonObj body;
    body["pdf"] = jstr(encode_base64(pdf));
    body["recipient"] = JsonVal(recipient);
    body["type"] = jstr(request.letter_type);
    if (!request.label.empty()) body["label"] = jstr(request.label);

    return impl_->post("/letters", body);
}

// =============================================================================
// getLetter() / listLetters() / getCredits()
// =============================================================================

ApiResult Client::getLetter(const std::string& letter_id) {
    return impl_->get("/letters/" + encode_path_segment(letter_id));
}

ApiResult Client::listLetters() {
    return impl_->get("/letters");
}

ApiResult Client::getCredits() {
    return impl_->get("/credits");
}

} /* namespace letters */
