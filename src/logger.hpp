#ifndef LETTERS_LOGGER_HPP
#define LETTERS_LOGGER_HPP

#include <fstream>
#include <string>

namespace letters {

/**
 * Appends timestamped diagnostic lines to a file.
 *
 * Disabled unless AGENTIC_LETTERS_LOG_FILE names a writable file;
 * stdout and stderr are reserved for results and error reports.
 */
class Logger {
public:
    Logger() : enabled_(false) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void init(const std::string& log_file_path);
    void log(const std::string& msg);

    bool is_enabled() const { return enabled_; }

private:
    std::ofstream file_;
    bool enabled_;
};

extern Logger g_logger;

/** Enable g_logger from AGENTIC_LETTERS_LOG_FILE. Safe to call repeatedly. */
void init_logger();

} // namespace letters

#define LETTERS_LOG(msg)                                \
    do {                                                \
        if (::letters::g_logger.is_enabled()) {         \
            ::letters::g_logger.log(msg);               \
        }                                               \
    } while (false)

#endif // LETTERS_LOGGER_HPP
