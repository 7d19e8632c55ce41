#pragma once
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

using namespace std;

enum class ReceiveStatus {
    Complete,
    Stalled,      // quá idle timeout mà không có dữ liệu
    Incomplete,   // peer đóng kết nối giữa chừng
    WriteFailed   // lỗi ghi file
};

const char *receive_status_str(ReceiveStatus st);

struct ReceiveResult {
    ReceiveStatus status = ReceiveStatus::Complete;
    uint64_t bytes_written = 0;
    string detail;

    bool ok() const { return status == ReceiveStatus::Complete; }
};

class StreamReceiver {
public:
    StreamReceiver(size_t chunk_size, int idle_timeout_ms);

    // Chép đúng byte_count byte từ socket vào file, bắt đầu tại vị trí ghi hiện tại.
    // Khi lỗi, các byte đã nhận của chunk dở dang vẫn được ghi xuống file trước
    // khi trả về, nên kích thước file part luôn bằng số byte đã nhận thật.
    ReceiveResult receive_into(int sockfd, ostream &file, uint64_t byte_count);

    size_t chunk_size() const { return chunk_size_; }
    int idle_timeout_ms() const { return idle_timeout_ms_; }

private:
    bool flush_chunk(ostream &file, const char *data, size_t len, ReceiveResult &res);

    size_t chunk_size_;
    int idle_timeout_ms_;
    vector<char> buf_;
};
