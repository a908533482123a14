#ifndef LETTERS_CLIENT_HPP
#define LETTERS_CLIENT_HPP

#include "types.hpp"
#include "errors.hpp"
#include "http.hpp"

#include <string>
#include <memory>

namespace letters {

/**
 * AgenticLetters client - C++ interface for the letter-delivery REST API.
 *
 * Core methods:
 *   - sendLetter()  - Upload a PDF and mail it to a recipient
 *   - getLetter()   - Status of one letter
 *   - listLetters() - All letters of the account
 *   - getCredits()  - Remaining credit balance
 *
 * Every call makes exactly one attempt. Failures are thrown as
 * LocalError, NetworkError (TimeoutError) or ServerError.
 *
 * Example:
 *   letters::Config cfg;
 *   cfg.api_key = "al_live_abc123";
 *   letters::Client client(cfg);
 *
 *   letters::LetterRequest letter;
 *   letter.pdf_path = "invoice.pdf";
 *   letter.name = "Erika Mustermann";
 *   letter.street = "Heidestrasse 17";
 *   letter.zip = "51147";
 *   letter.city = "Koeln";
 *   letters::ApiResult sent = client.sendLetter(letter);
 */
class Client {
public:
    /**
     * Construct a client.
     *
     * If config.api_key is empty, the key is resolved with load_api_key().
     * If config.base_url is empty, reads AGENTIC_LETTERS_BASE_URL,
     * then falls back to DEFAULT_BASE_URL.
     *
     * @throws LocalError if no API key is available.
     */
    explicit Client(const Config& config = Config());

    /**
     * Construct a client on top of a custom transport.
     */
    Client(const Config& config, std::shared_ptr<HttpClient> http);

    ~Client();

    // Non-copyable, movable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&& other);
    Client& operator=(Client&& other);

    /** Effective base URL (no trailing slash). */
    const std::string& base_url() const;

    /** Effective timeout in milliseconds. */
    int timeout_ms() const;

    /**
     * Send a letter: POST /letters.
     *
     * The PDF is checked and read before anything goes over the wire.
     *
     * @throws LocalError if the file is missing, not a regular file,
     *         or unreadable.
     */
    ApiResult sendLetter(const LetterRequest& request);

    /**
     * Status of one letter: GET /letters/{id}.
     * The id is not validated locally.
     */
    ApiResult getLetter(const std::string& letter_id);

    /** All letters: GET /letters. */
    ApiResult listLetters();

    /** Credit balance: GET /credits. */
    ApiResult getCredits();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace letters

#endif // LETTERS_CLIENT_HPP
