#pragma once
#include <string>
#include <vector>
#include <cstdint>

using namespace std;

namespace utils {

// Nối 2 path, đảm bảo chỉ có 1 dấu '/'
string join_path(const string &a, const string &b);

// Tạo thư mục kiểu "mkdir -p" (tạo từng cấp)
// Trả về true nếu tồn tại hoặc tạo thành công.
bool ensure_dir(const string &path);

// File có tồn tại không
bool file_exists(const string &path);

// Kích thước file (bytes), 0 nếu không tồn tại / lỗi
uint64_t file_size(const string &path);

// Tách path thành các thành phần (theo '/'), bỏ empty component
vector<string> split_path(const string &path);

// Phần cuối của path, chấp nhận cả '/' và '\\'
string base_name(const string &path);

// Một thành phần path an toàn: không chứa '/' hay '\\'.
// "" , "." và ".." được thay bằng "_".
string safe_component(const string &name);

// Thời điểm hiện tại dạng YYYYmmdd_HHMMSS (giờ địa phương)
string timestamp_now();

bool read_text_file(const string &path, string &out);

// Ghi qua file tạm + rename để người đọc không bao giờ thấy nội dung dở dang
bool write_text_file_atomic(const string &path, const string &content, string &err);

// Tạo mới / cắt về 0 byte
bool truncate_file(const string &path, string &err);

bool sync_file(const string &path, string &err);

string errno_str(int err_no);

} // namespace utils
