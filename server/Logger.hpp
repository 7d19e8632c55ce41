#pragma once
#include <fstream>
#include <mutex>
#include <string>
#include <chrono>
#include <iomanip>

using namespace std;

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

const char *log_level_str(LogLevel lvl);
bool parse_log_level(const string &s, LogLevel &out);

class Logger {
public:
    explicit Logger(const string &filename, LogLevel level = LogLevel::Info);

    // tag: tên client hoặc địa chỉ peer
    void log(LogLevel lvl, const string &tag, const string &msg);

    void debug(const string &tag, const string &msg) { log(LogLevel::Debug, tag, msg); }
    void info(const string &tag, const string &msg)  { log(LogLevel::Info, tag, msg); }
    void warn(const string &tag, const string &msg)  { log(LogLevel::Warn, tag, msg); }
    void error(const string &tag, const string &msg) { log(LogLevel::Error, tag, msg); }

    void set_level(LogLevel lvl);
    bool is_open() const { return static_cast<bool>(out_); }

private:
    ofstream out_;
    LogLevel level_;
    mutex mtx_;
};
