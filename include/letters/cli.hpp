#ifndef LETTERS_CLI_HPP
#define LETTERS_CLI_HPP

#include "types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace letters {

class Client;

enum CommandKind {
    CMD_HELP,
    CMD_SEND,
    CMD_STATUS,
    CMD_LIST,
    CMD_CREDITS
};

/**
 * A validated command line.
 *
 * letter is filled for CMD_SEND, letter_id for CMD_STATUS.
 */
struct Command {
    CommandKind kind;
    LetterRequest letter;
    std::string letter_id;

    Command() : kind(CMD_HELP) {}
};

/**
 * Thrown for malformed command lines. The CLI prints usage and exits 2.
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/** Usage text for the agentic_letters program. */
std::string usage_text();

/**
 * Parse the arguments after the program name.
 *
 * @throws UsageError on unknown commands/options, missing values or
 *         missing required options.
 */
Command parse_command_line(const std::vector<std::string>& args);

/**
 * Run a parsed command against the API. CMD_HELP is not dispatchable.
 *
 * @throws LetterError from the client.
 */
ApiResult run_command(Client& client, const Command& command);

} // namespace letters

#endif // LETTERS_CLI_HPP
