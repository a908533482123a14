#ifndef LETTERS_CREDENTIALS_HPP
#define LETTERS_CREDENTIALS_HPP

#include <string>

namespace letters {

/**
 * Per-user secrets file: ~/.openclaw/secrets/agentic_letters.env
 */
std::string default_secrets_path();

/**
 * Scan a secrets file for a line AGENTIC_LETTERS_API_KEY=value.
 *
 * Lines are trimmed; the value may be wrapped in single or double quotes.
 * Returns "" if the file does not exist or has no non-empty value.
 *
 * @throws LocalError if the file exists but cannot be read.
 */
std::string find_key_in_env_file(const std::string& path);

/**
 * Resolve the API key: AGENTIC_LETTERS_API_KEY wins, then the secrets file.
 *
 * @throws LocalError naming both locations if neither holds a key.
 */
std::string load_api_key();

/** Same as load_api_key(), with an explicit secrets file. */
std::string load_api_key(const std::string& secrets_path);

} // namespace letters

#endif // LETTERS_CREDENTIALS_HPP
