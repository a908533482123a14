#ifndef LETTERS_HPP
#define LETTERS_HPP

/**
 * AgenticLetters C++ client - send physical letters through the
 * AgenticLetters API and query their status, history and credits.
 *
 * Include this single header to get the full library:
 *
 *   #include <letters/letters.hpp>
 *
 *   int main() {
 *       try {
 *           letters::Client client;  // key from env or secrets file
 *
 *           letters::ApiResult credits = client.getCredits();
 *           std::cout << letters::format_result(credits) << std::endl;
 *       } catch (const letters::LetterError& e) {
 *           std::cerr << e.format() << std::endl;
 *           return 1;
 *       }
 *   }
 *
 * Dependencies:
 *   - libcurl (linked at build time)
 *   - picojson (header-only)
 *
 * Minimum C++ standard: C++11
 */

#include "types.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "credentials.hpp"
#include "client.hpp"

/**
 * Version information
 */
#define LETTERS_VERSION_MAJOR 0
#define LETTERS_VERSION_MINOR 1
#define LETTERS_VERSION_PATCH 0
#define LETTERS_VERSION "0.1.0"

#endif // LETTERS_HPP
