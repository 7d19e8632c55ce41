#pragma once
#include <string>
#include <atomic>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <unordered_set>
#include "Logger.hpp"
#include "ServerConfig.hpp"
#include "UploadCoordinator.hpp"
#include "Db.hpp"

using namespace std;

class UploadServer {
public:
    explicit UploadServer(const ServerConfig &cfg);
    ~UploadServer();

    // socket/bind/listen; err mô tả lỗi
    bool start(string &err);

    // Vòng accept, mỗi kết nối một thread. Trả về sau stop().
    void run();

    // Dừng accept, đóng các kết nối đang chạy và chờ chúng kết thúc
    void stop();

    int bound_port() const { return bound_port_; }

    const ServerConfig& config() const { return cfg_; }
    Logger& logger() { return logger_; }
    UploadCoordinator& uploads() { return uploads_; }
    Db& db() { return *db_; }

    void add_bytes_in(uint64_t n)  { bytes_in_ += n; }
    void upload_completed()        { uploads_completed_++; }
    void upload_failed()           { uploads_failed_++; }

    uint64_t bytes_in() const            { return bytes_in_.load(); }
    uint64_t connections_accepted() const { return connections_accepted_.load(); }
    uint64_t uploads_completed() const   { return uploads_completed_.load(); }
    uint64_t uploads_failed() const      { return uploads_failed_.load(); }
    int active_connections() const       { return active_.load(); }

private:
    void tune_socket(int fd, const string &peer);
    void serve_connection(int connfd, const string &peer);
    void close_listener();
    void log_stats();

    ServerConfig cfg_;
    Logger logger_;
    UploadCoordinator uploads_;
    unique_ptr<Db> db_;

    int listenfd_ = -1;
    int bound_port_ = 0;
    atomic<bool> running_{false};

    atomic<uint64_t> bytes_in_{0};
    atomic<uint64_t> connections_accepted_{0};
    atomic<uint64_t> uploads_completed_{0};
    atomic<uint64_t> uploads_failed_{0};
    atomic<int> active_{0};

    // fd của các kết nối đang phục vụ, để stop() có thể shutdown chúng
    mutex conn_mtx_;
    condition_variable conn_cv_;
    unordered_set<int> conn_fds_;
};
