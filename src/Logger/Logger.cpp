#include "Logger.hpp"
#include <cstring>
#include <ctime>
#include <iostream>
#include <mutex>
#include <fcntl.h>
#include <unistd.h>

static std::mutex g_log_mu;
static std::string g_log_path = LOG_PATH_DEFAULT;

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mu);
    if (!path.empty()) g_log_path = path;
}

std::string Logger::path() {
    std::lock_guard<std::mutex> lk(g_log_mu);
    return g_log_path;
}

// Desc: append one line to the log file, silently skipped if it cannot be opened
// In: const std::string& line
// Out: void
void Logger::append(const std::string& line) {
    std::lock_guard<std::mutex> lk(g_log_mu);
    int fd = ::open(g_log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) return;
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
    ::close(fd);
}

// Desc: timestamped "[time] [component] msg" line
// In: const std::string& component, const std::string& msg
// Out: void
void Logger::log(const std::string& component, const std::string& msg) {
    time_t now = ::time(nullptr);
    char buf[64];
    ctime_r(&now, buf);
    buf[std::strlen(buf) - 1] = '\0';
    append("[" + std::string(buf) + "] [" + component + "] " + msg + "\n");
#ifdef DEBUG
    std::cout << "[" << component << "] " << msg << std::endl;
#endif
}

void Logger::error(const std::string& component, const std::string& msg) {
    std::cerr << "[" << component << "] " << msg << "\n";
    log(component, msg);
}
