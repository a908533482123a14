#include "letters/credentials.hpp"
#include "letters/errors.hpp"
#include "letters/types.hpp"

#include "logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>

#include <sys/stat.h>

namespace letters {

static const char* const SECRETS_RELATIVE_PATH = "/.openclaw/secrets/agentic_letters.env";

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

/** Strip every leading and trailing occurrence of ch. */
static std::string strip_char(const std::string& s, char ch) {
    size_t begin = s.find_first_not_of(ch);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ch);
    return s.substr(begin, end - begin + 1);
}

std::string default_secrets_path() {
    const char* home = std::getenv("HOME");
    std::string base = (home && home[0] != '\0') ? home : "~";
    return base + SECRETS_RELATIVE_PATH;
}

std::string find_key_in_env_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return "";
    }

    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        throw LocalError("Cannot read file: " + path, std::strerror(errno));
    }

    std::string prefix = std::string(API_KEY_ENV_VAR) + "=";
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.compare(0, prefix.size(), prefix) != 0) continue;

        std::string val = trim(line.substr(prefix.size()));
        val = strip_char(strip_char(val, '"'), '\'');
        if (!val.empty()) {
            return val;
        }
    }
    if (file.bad()) {
        throw LocalError("Cannot read file: " + path, std::strerror(errno));
    }
    return "";
}

std::string load_api_key(const std::string& secrets_path) {
    const char* env = std::getenv(API_KEY_ENV_VAR);
    if (env) {
        std::string key = trim(env);
        if (!key.empty()) {
            LETTERS_LOG(std::string("API key taken from ") + API_KEY_ENV_VAR);
            return key;
        }
    }

    std::string key = find_key_in_env_file(secrets_path);
    if (!key.empty()) {
        LETTERS_LOG("API key taken from " + secrets_path);
        return key;
    }

    throw LocalError(
        "No API key found",
        std::string("Set ") + API_KEY_ENV_VAR + " in environment or in " + secrets_path +
            ". Get a key at " + SIGNUP_URL
    );
}

std::string load_api_key() {
    return load_api_key(default_secrets_path());
}

} // namespace letters
