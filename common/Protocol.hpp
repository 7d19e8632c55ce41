#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <sys/socket.h>
#include <unistd.h>

using namespace std;

namespace proto {

// Mã phản hồi cuối cùng (2 byte ASCII)
constexpr const char *ACK_OK = "OK";
constexpr const char *ACK_ER = "ER";
constexpr size_t ACK_LEN = 2;

// Giới hạn độ dài chuỗi trong header, tránh cấp phát vô hạn
constexpr uint32_t MAX_STRING_LEN = 4096;

enum class FrameStatus {
    Ok,
    Closed,   // peer đóng kết nối trước khi đủ byte
    Error     // lỗi socket hoặc dữ liệu không hợp lệ
};

const char *frame_status_str(FrameStatus st);

// Gửi đủ len bytes
bool send_all(int sockfd, const void *buf, size_t len);

// Nhận chính xác len bytes
FrameStatus recv_exact(int sockfd, void *buf, size_t len);

// Số nguyên big-endian độ rộng cố định
FrameStatus read_u32(int sockfd, uint32_t &out);
FrameStatus read_u64(int sockfd, uint64_t &out);

// u32 length + N bytes UTF-8
FrameStatus read_string(int sockfd, string &out);

bool write_u32(int sockfd, uint32_t value);
bool write_u64(int sockfd, uint64_t value);
bool write_string(int sockfd, const string &s);

// Header của một lần upload (client -> server)
struct UploadHeader {
    string client_name;
    uint64_t declared_size = 0;
    string filename;
    string upload_id;
};

// Đọc header theo đúng thứ tự: client_name, declared_size, filename, upload_id.
// err mô tả trường bị lỗi.
bool read_header(int sockfd, UploadHeader &out, string &err);
bool write_header(int sockfd, const UploadHeader &h);

// Mã hoá / giải mã big-endian trên buffer
void put_be64(unsigned char *dst, uint64_t v);
uint64_t get_be64(const unsigned char *src);

bool is_valid_utf8(const string &s);

} // namespace proto
