#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include "Logger.hpp"

using namespace std;

struct ServerConfig {
    string ip = "0.0.0.0";
    int port = 8888;
    string root_dir = "./received_images";
    string log_path;   // rỗng = <cwd>/upload_server.log
    string db_path;    // rỗng = <cwd>/uploads.db
    LogLevel log_level = LogLevel::Info;

    size_t chunk_size = 4 * 1024 * 1024;
    int socket_buf = 8 * 1024 * 1024;
    // Thời gian "im lặng" tối đa khi nhận body, giải phóng lock khi kênh bị treo
    int idle_timeout_ms = 60000;
    int backlog = 0;   // 0 = SOMAXCONN

    bool show_help = false;

    // defaults -> biến môi trường GL_* -> tham số dòng lệnh
    static bool load(int argc, char *argv[], ServerConfig &cfg, string &err);
    bool apply_env(string &err);
    bool apply_args(int argc, char *argv[], string &err);
    bool validate(string &err) const;

    static string usage(const string &prog);
};
