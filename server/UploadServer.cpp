#include "UploadServer.hpp"
#include "ConnectionHandler.hpp"
#include "DbSqlite.hpp"
#include "../common/Utils.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <thread>
#include <iostream>

using namespace std;

namespace {
string peer_to_string(const sockaddr_in &addr) {
    char buf[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    return string(buf) + ":" + to_string(ntohs(addr.sin_port));
}
} // namespace

UploadServer::UploadServer(const ServerConfig &cfg)
    : cfg_(cfg),
      logger_(cfg.log_path, cfg.log_level) {

    db_ = make_unique<DbSqlite>(cfg_.db_path);
    string err;
    if (!db_->init_schema(err)) {
        logger_.warn("server", "DB init failed: " + err);
    }
}

UploadServer::~UploadServer() {
    stop();
    close_listener();
}

bool UploadServer::start(string &err) {
    if (!utils::ensure_dir(cfg_.root_dir)) {
        err = "cannot create root dir " + cfg_.root_dir;
        return false;
    }

    listenfd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listenfd_ < 0) {
        err = "socket: " + utils::errno_str(errno);
        return false;
    }
    int opt = 1;
    setsockopt(listenfd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    // buffer của listening socket được kế thừa bởi socket accept
    if (cfg_.socket_buf > 0) {
        setsockopt(listenfd_, SOL_SOCKET, SO_RCVBUF, &cfg_.socket_buf, sizeof(cfg_.socket_buf));
        setsockopt(listenfd_, SOL_SOCKET, SO_SNDBUF, &cfg_.socket_buf, sizeof(cfg_.socket_buf));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(cfg_.port);
    if (::inet_pton(AF_INET, cfg_.ip.c_str(), &addr.sin_addr) != 1) {
        err = "invalid bind address: " + cfg_.ip;
        close_listener();
        return false;
    }
    if (::bind(listenfd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        err = "bind: " + utils::errno_str(errno);
        close_listener();
        return false;
    }
    int backlog = cfg_.backlog > 0 ? cfg_.backlog : SOMAXCONN;
    if (::listen(listenfd_, backlog) < 0) {
        err = "listen: " + utils::errno_str(errno);
        close_listener();
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(listenfd_, (sockaddr*)&bound, &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = cfg_.port;
    }

    running_ = true;
    logger_.info("server", "Listening on " + cfg_.ip + ":" + to_string(bound_port_) +
                 " root=" + cfg_.root_dir);
    return true;
}

void UploadServer::run() {
    while (running_) {
        sockaddr_in cli{};
        socklen_t len = sizeof(cli);
        int connfd = ::accept(listenfd_, (sockaddr*)&cli, &len);
        if (connfd < 0) {
            int saved = errno;
            if (!running_) break;
            if (saved == EINTR || saved == ECONNABORTED) continue;
            logger_.error("server", "accept: " + utils::errno_str(saved));
            if (saved == EBADF || saved == EINVAL) break;
            continue;
        }

        string peer = peer_to_string(cli);
        connections_accepted_++;
        tune_socket(connfd, peer);

        {
            lock_guard<mutex> lock(conn_mtx_);
            if (!running_) {
                ::close(connfd);
                break;
            }
            conn_fds_.insert(connfd);
            active_++;
        }

        thread([this, connfd, peer]() {
            serve_connection(connfd, peer);
        }).detach();
    }

    // chờ các kết nối còn lại kết thúc trước khi trả về
    unique_lock<mutex> lock(conn_mtx_);
    conn_cv_.wait(lock, [this]() { return conn_fds_.empty(); });
    lock.unlock();

    log_stats();
}

void UploadServer::serve_connection(int connfd, const string &peer) {
    {
        ConnectionHandler handler(connfd, peer, *this);
        handler.run();
    }
    lock_guard<mutex> lock(conn_mtx_);
    conn_fds_.erase(connfd);
    ::close(connfd);
    active_--;
    conn_cv_.notify_all();
}

void UploadServer::stop() {
    bool was_running = running_.exchange(false);
    if (was_running && listenfd_ >= 0) {
        // đánh thức accept()
        ::shutdown(listenfd_, SHUT_RDWR);
    }
    lock_guard<mutex> lock(conn_mtx_);
    for (int fd : conn_fds_) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void UploadServer::close_listener() {
    if (listenfd_ >= 0) {
        ::close(listenfd_);
        listenfd_ = -1;
    }
}

void UploadServer::tune_socket(int fd, const string &peer) {
    int one = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0) {
        logger_.debug(peer, "TCP_NODELAY: " + utils::errno_str(errno));
    }
    // header và ack cũng bị giới hạn bởi idle timeout, không chỉ body
    timeval tv{};
    tv.tv_sec  = cfg_.idle_timeout_ms / 1000;
    tv.tv_usec = (cfg_.idle_timeout_ms % 1000) * 1000;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        logger_.debug(peer, "SO_RCVTIMEO/SO_SNDTIMEO: " + utils::errno_str(errno));
    }
    if (cfg_.socket_buf > 0) {
        if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &cfg_.socket_buf, sizeof(cfg_.socket_buf)) < 0) {
            logger_.debug(peer, "SO_RCVBUF: " + utils::errno_str(errno));
        }
        if (setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &cfg_.socket_buf, sizeof(cfg_.socket_buf)) < 0) {
            logger_.debug(peer, "SO_SNDBUF: " + utils::errno_str(errno));
        }
    }
}

void UploadServer::log_stats() {
    logger_.info("server", "Stopped. connections=" + to_string(connections_accepted()) +
                 " completed=" + to_string(uploads_completed()) +
                 " failed=" + to_string(uploads_failed()) +
                 " bytes_in=" + to_string(bytes_in()));
}
