#ifndef LETTERS_TYPES_HPP
#define LETTERS_TYPES_HPP

#include <picojson/picojson.h>

#include <string>

namespace letters {

// =============================================================================
// Constants
// =============================================================================

/** Production API endpoint. */
extern const char* const DEFAULT_BASE_URL;

/** Client identifier sent as User-Agent on every request. */
extern const char* const USER_AGENT;

/** Environment variable holding the bearer token. */
extern const char* const API_KEY_ENV_VAR;

/** Environment variable overriding the API base URL. */
extern const char* const BASE_URL_ENV_VAR;

/** Environment variable naming the diagnostic log file. */
extern const char* const LOG_FILE_ENV_VAR;

/** Where to buy an API key. */
extern const char* const SIGNUP_URL;

/** Default request timeout (milliseconds). */
const int DEFAULT_TIMEOUT_MS = 60000;

// =============================================================================
// Configuration
// =============================================================================

/**
 * Configuration for the letters client.
 *
 * api_key:    Bearer token. If empty, resolved with load_api_key()
 *             (AGENTIC_LETTERS_API_KEY env var, then the secrets file).
 * base_url:   API base URL. Falls back to AGENTIC_LETTERS_BASE_URL,
 *             then to DEFAULT_BASE_URL.
 * timeout_ms: Request timeout in milliseconds. Default: 60000.
 */
struct Config {
    std::string api_key;
    std::string base_url;
    int timeout_ms;

    Config()
        : api_key("")
        , base_url("")
        , timeout_ms(DEFAULT_TIMEOUT_MS)
    {}
};

// =============================================================================
// Letters
// =============================================================================

/**
 * One physical letter to send.
 *
 * pdf_path must name an existing, readable regular file; its bytes are
 * uploaded base64-encoded. label is only sent when non-empty.
 */
struct LetterRequest {
    std::string pdf_path;      // Required
    std::string name;          // Required: recipient full name
    std::string street;        // Required: street + number
    std::string zip;           // Required: postal code
    std::string city;          // Required
    std::string country;       // Optional, default "DE"
    std::string letter_type;   // Optional, default "standard"
    std::string label;         // Optional

    LetterRequest()
        : country("DE")
        , letter_type("standard")
    {}
};

// =============================================================================
// Results
// =============================================================================

/**
 * Parsed JSON body of a successful API call, passed through unmodified.
 */
typedef picojson::value ApiResult;

/**
 * Render a result as JSON text indented by two spaces.
 */
std::string format_result(const ApiResult& result);

} // namespace letters

#endif // LETTERS_TYPES_HPP
