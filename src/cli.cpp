#include "letters/cli.hpp"
#include "letters/client.hpp"

#include <map>

namespace letters {

std::string usage_text() {
    return
        "usage: agentic_letters <command> [options]\n"
        "\n"
        "Send physical letters via the AgenticLetters API.\n"
        "\n"
        "commands:\n"
        "  send      Send a letter\n"
        "              --pdf PATH        Path to the PDF file (required)\n"
        "              --name NAME       Recipient full name (required)\n"
        "              --street STREET   Recipient street + number (required)\n"
        "              --zip ZIP         Recipient postal code (required)\n"
        "              --city CITY       Recipient city (required)\n"
        "              --country CC      Recipient country code (default: DE)\n"
        "              --type TYPE       Letter type (default: standard)\n"
        "              --label LABEL     Optional label for your reference\n"
        "  status ID Check letter status\n"
        "  list      List all letters\n"
        "  credits   Check remaining credits\n"
        "\n"
        "The API key is read from AGENTIC_LETTERS_API_KEY or from\n"
        "~/.openclaw/secrets/agentic_letters.env.\n";
}

static bool is_help(const std::string& arg) {
    return arg == "-h" || arg == "--help";
}

/**
 * Split argv into --options and positionals. Options take exactly one
 * value, either "--opt value" or "--opt=value". In the first form a value
 * starting with "--" is the next option, not a value; "--opt=--x" is
 * the way to pass one.
 */
static void split_args(const std::vector<std::string>& args,
                       size_t first,
                       std::map<std::string, std::string>& options,
                       std::vector<std::string>& positionals) {
    for (size_t i = first; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            std::string name = arg.substr(2);
            std::string value;
            size_t eq = name.find('=');
            if (eq != std::string::npos) {
                value = name.substr(eq + 1);
                name = name.substr(0, eq);
            } else {
                if (i + 1 >= args.size() || args[i + 1].compare(0, 2, "--") == 0) {
                    throw UsageError("argument --" + name + ": expected one argument");
                }
                value = args[++i];
            }
            options["--" + name] = value;
        } else if (arg == "--") {
            for (++i; i < args.size(); ++i) positionals.push_back(args[i]);
        } else {
            positionals.push_back(arg);
        }
    }
}

static void reject_unknown(const std::map<std::string, std::string>& options,
                           const char* const* allowed,
                           size_t allowed_count) {
    for (std::map<std::string, std::string>::const_iterator it = options.begin();
         it != options.end(); ++it) {
        bool known = false;
        for (size_t i = 0; i < allowed_count; ++i) {
            if (it->first == allowed[i]) known = true;
        }
        if (!known) {
            throw UsageError("unrecognized arguments: " + it->first);
        }
    }
}

static void reject_positionals(const std::vector<std::string>& positionals, size_t expected) {
    if (positionals.size() > expected) {
        std::string extra;
        for (size_t i = expected; i < positionals.size(); ++i) {
            if (!extra.empty()) extra += " ";
            extra += positionals[i];
        }
        throw UsageError("unrecognized arguments: " + extra);
    }
}

static Command parse_send(const std::map<std::string, std::string>& options) {
    static const char* const allowed[] = {
        "--pdf", "--name", "--street", "--zip", "--city", "--country", "--type", "--label"
    };
    static const char* const required[] = { "--pdf", "--name", "--street", "--zip", "--city" };

    reject_unknown(options, allowed, sizeof(allowed) / sizeof(allowed[0]));

    std::string missing;
    for (size_t i = 0; i < sizeof(required) / sizeof(required[0]); ++i) {
        if (options.find(required[i]) == options.end()) {
            if (!missing.empty()) missing += ", ";
            missing += required[i];
        }
    }
    if (!missing.empty()) {
        throw UsageError("the following arguments are required: " + missing);
    }

    Command cmd;
    cmd.kind = CMD_SEND;
    cmd.letter.pdf_path = options.find("--pdf")->second;
    cmd.letter.name = options.find("--name")->second;
    cmd.letter.street = options.find("--street")->second;
    cmd.letter.zip = options.find("--zip")->second;
    cmd.letter.city = options.find("--city")->second;

    std::map<std::string, std::string>::const_iterator it;
    if ((it = options.find("--country")) != options.end()) cmd.letter.country = it->second;
    if ((it = options.find("--type")) != options.end()) cmd.letter.letter_type = it->second;
    if ((it = options.find("--label")) != options.end()) cmd.letter.label = it->second;
    return cmd;
}

Command parse_command_line(const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--") break;
        if (is_help(args[i])) return Command();
    }

    if (args.empty()) {
        throw UsageError("the following arguments are required: command");
    }

    const std::string& name = args[0];
    std::map<std::string, std::string> options;
    std::vector<std::string> positionals;

    if (name == "send") {
        split_args(args, 1, options, positionals);
        reject_positionals(positionals, 0);
        return parse_send(options);
    }

    if (name == "status") {
        split_args(args, 1, options, positionals);
        reject_unknown(options, NULL, 0);
        if (positionals.empty()) {
            throw UsageError("the following arguments are required: id");
        }
        reject_positionals(positionals, 1);
        Command cmd;
        cmd.kind = CMD_STATUS;
        cmd.letter_id = positionals[0];
        return cmd;
    }

    if (name == "list" || name == "credits") {
        split_args(args, 1, options, positionals);
        reject_unknown(options, NULL, 0);
        reject_positionals(positionals, 0);
        Command cmd;
        cmd.kind = (name == "list") ? CMD_LIST : CMD_CREDITS;
        return cmd;
    }

    throw UsageError("invalid choice: '" + name + "' (choose from 'send', 'status', 'list', 'credits')");
}

ApiResult run_command(Client& client, const Command& command) {
    switch (command.kind) {
        case CMD_SEND:    return client.sendLetter(command.letter);
        case CMD_STATUS:  return client.getLetter(command.letter_id);
        case CMD_LIST:    return client.listLetters();
        case CMD_CREDITS: return client.getCredits();
        case CMD_HELP:    break;
    }
    throw UsageError("no command to run");
}

} // namespace letters
