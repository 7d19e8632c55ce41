#include "ServerConfig.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace {

bool parse_u64(const string &s, uint64_t &out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    try {
        out = stoull(s);
    } catch (const exception &) {
        return false;
    }
    return true;
}

bool parse_int(const string &s, int &out) {
    uint64_t v = 0;
    if (!parse_u64(s, v) || v > 0x7fffffffULL) return false;
    out = (int)v;
    return true;
}

string default_path(const string &name) {
    namespace fs = std::filesystem;
    return (fs::current_path() / name).string();
}

} // namespace

bool ServerConfig::load(int argc, char *argv[], ServerConfig &cfg, string &err) {
    if (!cfg.apply_env(err)) return false;
    if (!cfg.apply_args(argc, argv, err)) return false;
    if (cfg.show_help) return true;
    if (cfg.log_path.empty()) cfg.log_path = default_path("upload_server.log");
    if (cfg.db_path.empty())  cfg.db_path  = default_path("uploads.db");
    return cfg.validate(err);
}

bool ServerConfig::apply_env(string &err) {
    if (const char *p = ::getenv("GL_ROOT_DIR")) root_dir = p;
    if (const char *p = ::getenv("GL_LOG_PATH")) log_path = p;
    if (const char *p = ::getenv("GL_DB_PATH"))  db_path = p;
    if (const char *p = ::getenv("GL_LOG_LEVEL")) {
        if (!parse_log_level(p, log_level)) {
            err = string("GL_LOG_LEVEL: invalid level '") + p + "'";
            return false;
        }
    }
    if (const char *p = ::getenv("GL_CHUNK_SIZE")) {
        uint64_t v = 0;
        if (!parse_u64(p, v)) {
            err = string("GL_CHUNK_SIZE: not a number '") + p + "'";
            return false;
        }
        chunk_size = (size_t)v;
    }
    if (const char *p = ::getenv("GL_SOCKET_BUF")) {
        if (!parse_int(p, socket_buf)) {
            err = string("GL_SOCKET_BUF: not a number '") + p + "'";
            return false;
        }
    }
    if (const char *p = ::getenv("GL_IDLE_TIMEOUT_MS")) {
        if (!parse_int(p, idle_timeout_ms)) {
            err = string("GL_IDLE_TIMEOUT_MS: not a number '") + p + "'";
            return false;
        }
    }
    return true;
}

bool ServerConfig::apply_args(int argc, char *argv[], string &err) {
    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            show_help = true;
            return true;
        }

        // "server <port>" như bản cũ
        if (arg.empty() || arg[0] != '-') {
            if (!parse_int(arg, port)) {
                err = "Invalid port: " + arg;
                return false;
            }
            continue;
        }

        if (i + 1 >= argc) {
            err = "Missing value for " + arg;
            return false;
        }
        string val = argv[++i];

        if (arg == "--ip") {
            ip = val;
        } else if (arg == "--port") {
            if (!parse_int(val, port)) {
                err = "Invalid port: " + val;
                return false;
            }
        } else if (arg == "--root") {
            root_dir = val;
        } else if (arg == "--log") {
            log_path = val;
        } else if (arg == "--db") {
            db_path = val;
        } else if (arg == "--log-level") {
            if (!parse_log_level(val, log_level)) {
                err = "Invalid log level: " + val;
                return false;
            }
        } else if (arg == "--chunk-size") {
            uint64_t v = 0;
            if (!parse_u64(val, v)) {
                err = "Invalid chunk size: " + val;
                return false;
            }
            chunk_size = (size_t)v;
        } else if (arg == "--socket-buf") {
            if (!parse_int(val, socket_buf)) {
                err = "Invalid socket buffer size: " + val;
                return false;
            }
        } else if (arg == "--idle-timeout-ms") {
            if (!parse_int(val, idle_timeout_ms)) {
                err = "Invalid idle timeout: " + val;
                return false;
            }
        } else {
            err = "Unknown option: " + arg;
            return false;
        }
    }
    return true;
}

bool ServerConfig::validate(string &err) const {
    if (port < 0 || port > 65535) {
        err = "Port out of range: " + to_string(port);
        return false;
    }
    if (chunk_size == 0) {
        err = "chunk_size must be > 0";
        return false;
    }
    if (idle_timeout_ms <= 0) {
        err = "idle_timeout_ms must be > 0";
        return false;
    }
    if (root_dir.empty()) {
        err = "root_dir must not be empty";
        return false;
    }
    return true;
}

string ServerConfig::usage(const string &prog) {
    ostringstream ss;
    ss << "Usage: " << prog << " [port] [options]\n"
       << "  --ip <addr>              bind address (default 0.0.0.0)\n"
       << "  --port <n>               listen port (default 8888, 0 = ephemeral)\n"
       << "  --root <dir>             upload store root (GL_ROOT_DIR)\n"
       << "  --log <file>             log file (GL_LOG_PATH)\n"
       << "  --db <file>              upload ledger database (GL_DB_PATH)\n"
       << "  --log-level <lvl>        debug|info|warn|error (GL_LOG_LEVEL)\n"
       << "  --chunk-size <bytes>     receive chunk size (GL_CHUNK_SIZE)\n"
       << "  --socket-buf <bytes>     SO_RCVBUF/SO_SNDBUF (GL_SOCKET_BUF)\n"
       << "  --idle-timeout-ms <ms>   idle timeout per chunk (GL_IDLE_TIMEOUT_MS)\n";
    return ss.str();
}
