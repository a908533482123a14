#ifndef LETTERS_ERRORS_HPP
#define LETTERS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace letters {

/**
 * Which layer detected a failure.
 */
enum ErrorOrigin {
    ORIGIN_LOCAL,    // filesystem, configuration, validation; nothing sent
    ORIGIN_NETWORK,  // transport failure or timeout
    ORIGIN_SERVER    // the API answered with a non-success status
};

/**
 * Convert ErrorOrigin to its display name ("local", "network", "server").
 */
const char* error_origin_to_string(ErrorOrigin origin);

/**
 * Base exception for all letters errors.
 *
 * Optional fields are empty (or 0 for http_status) when absent.
 */
class LetterError : public std::runtime_error {
public:
    LetterError(ErrorOrigin origin,
                const std::string& message,
                const std::string& code = "",
                int http_status = 0,
                const std::string& detail = "",
                const std::string& field = "")
        : std::runtime_error(message)
        , origin_(origin)
        , code_(code)
        , http_status_(http_status)
        , detail_(detail)
        , field_(field)
    {}

    ErrorOrigin origin() const { return origin_; }

    /** Machine error code from the API (e.g. "INVALID_ZIP"). */
    const std::string& code() const { return code_; }

    /** HTTP status code (0 for local/network errors). */
    int http_status() const { return http_status_; }

    /** Free-text detail: OS error, curl error, or server detail. */
    const std::string& detail() const { return detail_; }

    /** Name of the offending request field, if the server named one. */
    const std::string& field() const { return field_; }

    /**
     * Multi-line rendering for stderr:
     *
     *   [server] invalid zip
     *     http_status: 422
     *     field: zip
     */
    std::string format() const;

private:
    ErrorOrigin origin_;
    std::string code_;
    int http_status_;
    std::string detail_;
    std::string field_;
};

/**
 * Thrown for failures detected before any network call.
 */
class LocalError : public LetterError {
public:
    explicit LocalError(const std::string& message, const std::string& detail = "")
        : LetterError(ORIGIN_LOCAL, message, "", 0, detail)
    {}
};

/**
 * Thrown when the API cannot be reached.
 */
class NetworkError : public LetterError {
public:
    explicit NetworkError(const std::string& message = "Could not reach the API",
                          const std::string& detail = "")
        : LetterError(ORIGIN_NETWORK, message, "", 0, detail)
    {}
};

/**
 * Thrown when a request does not complete within the timeout.
 */
class TimeoutError : public NetworkError {
public:
    explicit TimeoutError(int timeout_ms);
};

/**
 * Thrown when the API responds with a non-success status.
 */
class ServerError : public LetterError {
public:
    ServerError(const std::string& message,
                int http_status,
                const std::string& code = "",
                const std::string& detail = "",
                const std::string& field = "")
        : LetterError(ORIGIN_SERVER, message, code, http_status, detail, field)
    {}
};

} // namespace letters

#endif // LETTERS_ERRORS_HPP
