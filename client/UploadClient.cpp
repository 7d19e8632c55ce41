#include "UploadClient.hpp"
#include "../common/Protocol.hpp"
#include "../common/Utils.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fstream>
#include <vector>
#include <thread>
#include <chrono>

using namespace std;
using namespace proto;

UploadClient::UploadClient() {}

UploadClient::~UploadClient() {
    close();
}

bool UploadClient::connect_to(const string &host, int port) {
    close();
    sockfd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sockfd_ < 0) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        ::close(sockfd_);
        sockfd_ = -1;
        return false;
    }

    if (::connect(sockfd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        ::close(sockfd_);
        sockfd_ = -1;
        return false;
    }

    int one = 1;
    setsockopt(sockfd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return true;
}

void UploadClient::close() {
    if (sockfd_ >= 0) {
        ::close(sockfd_);
        sockfd_ = -1;
    }
}

string UploadClient::default_upload_id(const string &client_name, const string &local_path) {
    return client_name + "_" + to_string(utils::file_size(local_path)) + "_" +
           utils::base_name(local_path);
}

bool UploadClient::upload(const string &host, int port,
                          const string &client_name,
                          const string &local_path,
                          const string &upload_id,
                          UploadOutcome &out,
                          string &err) {
    out.ok = false;
    out.bytes_sent = 0;

    if (!utils::file_exists(local_path)) {
        err = "No such file: " + local_path;
        return false;
    }
    ifstream ifs(local_path, ios::binary);
    if (!ifs) {
        err = "Cannot open " + local_path;
        return false;
    }

    if (!connect_to(host, port)) {
        err = "Cannot connect to " + host + ":" + to_string(port);
        return false;
    }

    UploadHeader h;
    h.client_name   = client_name;
    h.declared_size = utils::file_size(local_path);
    h.filename      = utils::base_name(local_path);
    h.upload_id     = upload_id;

    if (!write_header(sockfd_, h)) {
        err = "Send header error";
        close();
        return false;
    }

    uint64_t offset = 0;
    FrameStatus st = read_u64(sockfd_, offset);
    if (st != FrameStatus::Ok) {
        err = string("No resume offset: ") + frame_status_str(st);
        close();
        return false;
    }
    out.resume_offset = offset;
    if (offset > h.declared_size) {
        err = "Server offset " + to_string(offset) + " beyond file size";
        close();
        return false;
    }

    ifs.seekg((streamoff)offset);
    vector<char> buf(chunk_size_);
    uint64_t remaining = h.declared_size - offset;
    while (remaining > 0) {
        size_t n = remaining > buf.size() ? buf.size() : (size_t)remaining;
        ifs.read(buf.data(), (streamsize)n);
        if ((size_t)ifs.gcount() != n) {
            err = "Read error on " + local_path;
            close();
            return false;
        }
        if (!send_all(sockfd_, buf.data(), n)) {
            err = "Connection lost after " + to_string(out.bytes_sent) + " bytes";
            close();
            return false;
        }
        out.bytes_sent += n;
        remaining -= n;
    }

    char ack[ACK_LEN];
    st = recv_exact(sockfd_, ack, ACK_LEN);
    close();
    if (st != FrameStatus::Ok) {
        err = string("No ack: ") + frame_status_str(st);
        return false;
    }
    if (string(ack, ACK_LEN) != ACK_OK) {
        err = "Server replied " + string(ack, ACK_LEN);
        return false;
    }
    out.ok = true;
    return true;
}

bool UploadClient::upload_with_retry(const string &host, int port,
                                     const string &client_name,
                                     const string &local_path,
                                     const string &upload_id,
                                     int max_attempts,
                                     int retry_delay_ms,
                                     UploadOutcome &out,
                                     string &err) {
    out.attempts = 0;
    for (int i = 0; i < max_attempts; ++i) {
        out.attempts++;
        if (upload(host, port, client_name, local_path, upload_id, out, err)) {
            return true;
        }
        if (i + 1 < max_attempts && retry_delay_ms > 0) {
            this_thread::sleep_for(chrono::milliseconds(retry_delay_ms));
        }
    }
    return false;
}
