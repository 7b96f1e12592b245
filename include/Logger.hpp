#pragma once
#include <string>

#define LOG_PATH_DEFAULT "logs/tiercache.log"

class Logger {
public:
    // Path of the append-only log file; stays at LOG_PATH_DEFAULT if never called
    static void init(const std::string& path);
    static std::string path();

    static void log(const std::string& component, const std::string& msg);
    // Same as log, echoed to stderr
    static void error(const std::string& component, const std::string& msg);

private:
    static void append(const std::string& line);
};
