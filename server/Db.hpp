#pragma once
#include <string>
#include <vector>
#include <cstdint>

using namespace std;

struct UploadRecord {
    int id = 0;
    string client_name;
    string upload_id;
    string filename;
    string final_path;
    uint64_t size_bytes = 0;
    string completed_at;
};

// Sổ ghi các lần upload. Filesystem (part/done/artifact) mới là nguồn sự thật,
// sổ này chỉ để thống kê và cho các bước xử lý phía sau đọc path artifact.
class Db {
public:
    virtual ~Db() = default;

    virtual bool init_schema(string &err) = 0;

    // Upsert theo (client_name, upload_id), gọi lại nhiều lần không tạo bản ghi mới
    virtual bool record_completed_upload(const UploadRecord &rec, string &err) = 0;

    virtual bool get_completed_upload(const string &client_name,
                                      const string &upload_id,
                                      UploadRecord &out,
                                      string &err) = 0;

    virtual bool list_completed_uploads(const string &client_name,
                                        vector<UploadRecord> &out,
                                        string &err) = 0;

    // outcome: "completed", "already_done", "stalled", "incomplete", ...
    virtual bool record_attempt(const string &client_name,
                                const string &upload_id,
                                uint64_t start_offset,
                                uint64_t bytes_received,
                                const string &outcome,
                                string &err) = 0;

    virtual bool count_attempts(const string &client_name,
                                const string &upload_id,
                                int &count,
                                string &err) = 0;

    virtual bool insert_log(const string &client_name,
                            const string &action,
                            const string &detail,
                            const string &remote_ip,
                            string &err) = 0;
};
