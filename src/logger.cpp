#include "logger.hpp"

#include "letters/types.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>

namespace letters {

Logger g_logger;

void init_logger() {
    if (g_logger.is_enabled()) {
        return;
    }
    const char* log_file = std::getenv(LOG_FILE_ENV_VAR);
    if (log_file) {
        g_logger.init(log_file);
    }
}

void Logger::init(const std::string& log_file_path) {
    if (log_file_path.empty()) {
        enabled_ = false;
        return;
    }

    file_.open(log_file_path.c_str(), std::ios::app);
    if (file_.is_open()) {
        enabled_ = true;
    }
}

void Logger::log(const std::string& msg) {
    if (!enabled_ || !file_.is_open()) {
        return;
    }

    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    struct tm tm;
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);

    file_ << "[" << stamp << '.' << std::setfill('0') << std::setw(3) << ms << "] "
          << msg << std::endl;
}

} // namespace letters
