#pragma once
#include "Db.hpp"
#include <sqlite3.h>
#include <mutex>

using namespace std;

class DbSqlite : public Db {
public:
    explicit DbSqlite(const string &db_path);
    ~DbSqlite() override;

    bool is_open() const { return db_ != nullptr; }

    bool init_schema(string &err) override;

    bool record_completed_upload(const UploadRecord &rec, string &err) override;

    bool get_completed_upload(const string &client_name,
                              const string &upload_id,
                              UploadRecord &out,
                              string &err) override;

    bool list_completed_uploads(const string &client_name,
                                vector<UploadRecord> &out,
                                string &err) override;

    bool record_attempt(const string &client_name,
                        const string &upload_id,
                        uint64_t start_offset,
                        uint64_t bytes_received,
                        const string &outcome,
                        string &err) override;

    bool count_attempts(const string &client_name,
                        const string &upload_id,
                        int &count,
                        string &err) override;

    bool insert_log(const string &client_name,
                    const string &action,
                    const string &detail,
                    const string &remote_ip,
                    string &err) override;

private:
    string db_path_;
    sqlite3 *db_ = nullptr;
    // một connection dùng chung cho mọi thread kết nối
    mutex mtx_;
};
