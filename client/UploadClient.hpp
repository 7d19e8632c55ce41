#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

using namespace std;

struct UploadOutcome {
    bool ok = false;
    uint64_t resume_offset = 0;
    uint64_t bytes_sent = 0;
    int attempts = 0;
};

class UploadClient {
public:
    UploadClient();
    ~UploadClient();

    bool connect_to(const string &host, int port);
    void close();

    // Một lần trao đổi: header -> offset -> phần còn lại -> ack.
    // false + err nếu kết nối đứt hoặc server trả "ER".
    bool upload(const string &host, int port,
                const string &client_name,
                const string &local_path,
                const string &upload_id,
                UploadOutcome &out,
                string &err);

    // Kết nối lại với cùng upload_id cho tới khi "OK" hoặc hết lượt
    bool upload_with_retry(const string &host, int port,
                           const string &client_name,
                           const string &local_path,
                           const string &upload_id,
                           int max_attempts,
                           int retry_delay_ms,
                           UploadOutcome &out,
                           string &err);

    // <client_name>_<size>_<base name>, ổn định giữa các lần thử lại
    static string default_upload_id(const string &client_name, const string &local_path);

    void set_chunk_size(size_t n) { chunk_size_ = n > 0 ? n : chunk_size_; }

private:
    int sockfd_ = -1;
    size_t chunk_size_ = 1024 * 1024;
};
