#include <letters/letters.hpp>
#include <letters/cli.hpp>

#include <curl/curl.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    letters::Command command;
    try {
        command = letters::parse_command_line(args);
    } catch (const letters::UsageError& e) {
        std::cerr << letters::usage_text() << std::endl;
        std::cerr << "agentic_letters: error: " << e.what() << std::endl;
        return 2;
    }

    if (command.kind == letters::CMD_HELP) {
        std::cout << letters::usage_text();
        return 0;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    int status = 0;
    try {
        letters::Client client;
        letters::ApiResult result = letters::run_command(client, command);
        std::cout << letters::format_result(result) << std::endl;
    } catch (const letters::LetterError& e) {
        std::cerr << e.format() << std::endl;
        status = 1;
    } catch (const std::exception& e) {
        std::cerr << letters::LocalError("Unexpected error", e.what()).format() << std::endl;
        status = 1;
    }

    curl_global_cleanup();
    return status;
}
