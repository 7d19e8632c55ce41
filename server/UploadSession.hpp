#pragma once
#include <string>
#include <cstdint>

using namespace std;

// Giá trị bất biến, dựng lại cho mỗi lần kết nối từ header + thư mục gốc.
// Mọi path là hàm xác định của (root, client_name, upload_id, filename).
struct UploadSession {
    string client_name;
    string filename;      // đã làm sạch
    string upload_id;
    uint64_t file_size = 0;
    string client_dir;
    string part_path;     // <client_dir>/<upload_id>_<filename>.part
    string done_path;     // <client_dir>/<upload_id>.done

    // Chỉ giữ base name, thay '/' và '\\' bằng '_'
    static string safe_filename(const string &name);

    static UploadSession from_header(const string &root_dir,
                                     const string &client_name,
                                     const string &filename,
                                     const string &upload_id,
                                     uint64_t file_size);
};
