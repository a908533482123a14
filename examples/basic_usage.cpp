/**
 * AgenticLetters C++ client - Basic Usage
 *
 * Checks the credit balance, mails one PDF and polls its status.
 *
 * Run:
 *   export AGENTIC_LETTERS_API_KEY="..."
 *   ./basic_usage letter.pdf "Erika Mustermann" "Heidestrasse 17" 51147 Koeln
 */

#include <letters/letters.hpp>

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 6) {
        std::cerr << "usage: " << argv[0] << " PDF NAME STREET ZIP CITY [LABEL]" << std::endl;
        return 2;
    }

    std::cout << "AgenticLetters C++ client v" << LETTERS_VERSION << std::endl;
    std::cout << "==========================================" << std::endl;

    try {
        letters::Client client;

        // 1. How many letters can we still send?
        letters::ApiResult credits = client.getCredits();
        std::cout << "[1/3] Credits:\n" << letters::format_result(credits) << std::endl;

        // 2. Send the letter
        letters::LetterRequest letter;
        letter.pdf_path = argv[1];
        letter.name = argv[2];
        letter.street = argv[3];
        letter.zip = argv[4];
        letter.city = argv[5];
        if (argc > 6) letter.label = argv[6];

        letters::ApiResult sent = client.sendLetter(letter);
        std::cout << "[2/3] Sent:\n" << letters::format_result(sent) << std::endl;

        // 3. Look it up again by id
        if (sent.is<picojson::object>() && sent.contains("id") && sent.get("id").is<std::string>()) {
            letters::ApiResult status = client.getLetter(sent.get("id").get<std::string>());
            std::cout << "[3/3] Status:\n" << letters::format_result(status) << std::endl;
        } else {
            std::cout << "[3/3] No letter id in response, skipping status check" << std::endl;
        }
        return 0;

    } catch (const letters::LocalError& e) {
        std::cerr << "Fix your input:\n" << e.format() << std::endl;
        return 1;
    } catch (const letters::NetworkError& e) {
        std::cerr << "Retry later:\n" << e.format() << std::endl;
        return 1;
    } catch (const letters::ServerError& e) {
        std::cerr << "Rejected by the API:\n" << e.format() << std::endl;
        return 1;
    }
}
