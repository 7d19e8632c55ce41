#include "Logger.hpp"
#include <iostream>

const char *log_level_str(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

bool parse_log_level(const string &s, LogLevel &out) {
    if (s == "debug") out = LogLevel::Debug;
    else if (s == "info") out = LogLevel::Info;
    else if (s == "warn" || s == "warning") out = LogLevel::Warn;
    else if (s == "error") out = LogLevel::Error;
    else return false;
    return true;
}

Logger::Logger(const string &filename, LogLevel level) : level_(level) {
    out_.open(filename, ios::app);
}

void Logger::set_level(LogLevel lvl) {
    lock_guard<mutex> lock(mtx_);
    level_ = lvl;
}

void Logger::log(LogLevel lvl, const string &tag, const string &msg) {
    auto now = chrono::system_clock::now();
    auto tt  = chrono::system_clock::to_time_t(now);
    tm tmv{};
    localtime_r(&tt, &tmv);

    lock_guard<mutex> lock(mtx_);
    if (lvl < level_) return;

    if (out_) {
        out_ << put_time(&tmv, "%Y-%m-%d %H:%M:%S")
             << " [" << log_level_str(lvl) << "] [" << tag << "] " << msg << "\n";
        out_.flush();
    }
    // WARN/ERROR luôn hiện ra stderr
    if (lvl >= LogLevel::Warn) {
        cerr << put_time(&tmv, "%Y-%m-%d %H:%M:%S")
             << " [" << log_level_str(lvl) << "] [" << tag << "] " << msg << "\n";
    }
}
