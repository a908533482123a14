#include "letters/types.hpp"

namespace letters {

const char* const DEFAULT_BASE_URL = "https://agentic-letters.com/api";
const char* const USER_AGENT = "agentic-letters-skill/1.0";
const char* const API_KEY_ENV_VAR = "AGENTIC_LETTERS_API_KEY";
const char* const BASE_URL_ENV_VAR = "AGENTIC_LETTERS_BASE_URL";
const char* const LOG_FILE_ENV_VAR = "AGENTIC_LETTERS_LOG_FILE";
const char* const SIGNUP_URL = "https://agentic-letters.com/buy";

/*
 * Integers are printed exactly (the library is built with PICOJSON_USE_INT64).
 * Other numbers go through picojson's "%.17g", so 4.99 prints as
 * 4.9900000000000002.
 */
std::string format_result(const ApiResult& result) {
    std::string pretty = result.serialize(true);

    /* picojson writes '/' as "\/"; both are valid JSON, keep the plain one */
    std::string text;
    text.reserve(pretty.size());
    for (size_t i = 0; i < pretty.size(); ++i) {
        if (pretty[i] == '\\' && i + 1 < pretty.size()) {
            if (pretty[i + 1] != '/') text.push_back('\\');
            text.push_back(pretty[++i]);
        } else {
            text.push_back(pretty[i]);
        }
    }

    /* picojson ends prettified output with a newline */
    while (!text.empty() && text[text.size() - 1] == '\n') {
        text.erase(text.size() - 1);
    }
    return text;
}

} // namespace letters
