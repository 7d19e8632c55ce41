#include "DbSqlite.hpp"
#include <iostream>

namespace {

string column_text(sqlite3_stmt *stmt, int col) {
    const unsigned char *txt = sqlite3_column_text(stmt, col);
    return txt ? string(reinterpret_cast<const char*>(txt)) : string();
}

void read_upload_row(sqlite3_stmt *stmt, UploadRecord &rec) {
    rec.id           = sqlite3_column_int(stmt, 0);
    rec.client_name  = column_text(stmt, 1);
    rec.upload_id    = column_text(stmt, 2);
    rec.filename     = column_text(stmt, 3);
    rec.final_path   = column_text(stmt, 4);
    rec.size_bytes   = (uint64_t)sqlite3_column_int64(stmt, 5);
    rec.completed_at = column_text(stmt, 6);
}

} // namespace

DbSqlite::DbSqlite(const string &db_path) : db_path_(db_path) {
    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        cerr << "Cannot open SQLite: " << sqlite3_errmsg(db_) << "\n";
        sqlite3_close(db_);
        db_ = nullptr;
    } else {
        sqlite3_busy_timeout(db_, 5000);
    }
}

DbSqlite::~DbSqlite() {
    if (db_) sqlite3_close(db_);
}

bool DbSqlite::init_schema(string &err) {
    if (!db_) {
        err = "database not open: " + db_path_;
        return false;
    }

    const char *sql_tables = R"SQL(
CREATE TABLE IF NOT EXISTS upload_entry (
    id           INTEGER PRIMARY KEY AUTOINCREMENT,
    client_name  TEXT NOT NULL,
    upload_id    TEXT NOT NULL,
    filename     TEXT NOT NULL,
    final_path   TEXT NOT NULL,
    size_bytes   INTEGER NOT NULL,
    completed_at DATETIME DEFAULT CURRENT_TIMESTAMP,
    UNIQUE(client_name, upload_id)
);

CREATE TABLE IF NOT EXISTS transfer_attempt (
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    client_name    TEXT NOT NULL,
    upload_id      TEXT NOT NULL,
    start_offset   INTEGER NOT NULL DEFAULT 0,
    bytes_received INTEGER NOT NULL DEFAULT 0,
    outcome        TEXT NOT NULL,
    created_at     DATETIME DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS audit_log (
    id          INTEGER PRIMARY KEY AUTOINCREMENT,
    client_name TEXT,
    action      TEXT NOT NULL,
    detail      TEXT,
    remote_ip   TEXT,
    created_at  DATETIME DEFAULT CURRENT_TIMESTAMP
);

CREATE INDEX IF NOT EXISTS idx_transfer_attempt_upload
    ON transfer_attempt(client_name, upload_id);
)SQL";

    lock_guard<mutex> lock(mtx_);
    char *errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql_tables, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        err = errmsg ? errmsg : "Unknown SQLite error";
        if (errmsg) sqlite3_free(errmsg);
        return false;
    }
    return true;
}

bool DbSqlite::record_completed_upload(const UploadRecord &rec, string &err) {
    const char *sql =
        "INSERT INTO upload_entry (client_name, upload_id, filename, final_path, size_bytes) "
        "VALUES (?, ?, ?, ?, ?) "
        "ON CONFLICT(client_name, upload_id) DO UPDATE SET "
        "filename = excluded.filename, final_path = excluded.final_path, "
        "size_bytes = excluded.size_bytes;";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "database not open";
        return false;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, rec.client_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, rec.upload_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, rec.filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, rec.final_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, (sqlite3_int64)rec.size_bytes);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::get_completed_upload(const string &client_name,
                                    const string &upload_id,
                                    UploadRecord &out,
                                    string &err) {
    const char *sql =
        "SELECT id, client_name, upload_id, filename, final_path, size_bytes, completed_at "
        "FROM upload_entry WHERE client_name = ? AND upload_id = ?;";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "database not open";
        return false;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, client_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, upload_id.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        read_upload_row(stmt, out);
        sqlite3_finalize(stmt);
        return true;
    }
    if (rc != SQLITE_DONE) err = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return false;
}

bool DbSqlite::list_completed_uploads(const string &client_name,
                                      vector<UploadRecord> &out,
                                      string &err) {
    const char *sql =
        "SELECT id, client_name, upload_id, filename, final_path, size_bytes, completed_at "
        "FROM upload_entry WHERE client_name = ? ORDER BY id;";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "database not open";
        return false;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, client_name.c_str(), -1, SQLITE_TRANSIENT);

    out.clear();
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        UploadRecord rec;
        read_upload_row(stmt, rec);
        out.push_back(rec);
    }
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::record_attempt(const string &client_name,
                              const string &upload_id,
                              uint64_t start_offset,
                              uint64_t bytes_received,
                              const string &outcome,
                              string &err) {
    const char *sql =
        "INSERT INTO transfer_attempt (client_name, upload_id, start_offset, bytes_received, outcome) "
        "VALUES (?, ?, ?, ?, ?);";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "database not open";
        return false;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, client_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, upload_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, (sqlite3_int64)start_offset);
    sqlite3_bind_int64(stmt, 4, (sqlite3_int64)bytes_received);
    sqlite3_bind_text(stmt, 5, outcome.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::count_attempts(const string &client_name,
                              const string &upload_id,
                              int &count,
                              string &err) {
    const char *sql =
        "SELECT COUNT(*) FROM transfer_attempt WHERE client_name = ? AND upload_id = ?;";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "database not open";
        return false;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    sqlite3_bind_text(stmt, 1, client_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, upload_id.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    count = sqlite3_column_int(stmt, 0);
    sqlite3_finalize(stmt);
    return true;
}

bool DbSqlite::insert_log(const string &client_name,
                          const string &action,
                          const string &detail,
                          const string &remote_ip,
                          string &err) {
    const char *sql =
        "INSERT INTO audit_log (client_name, action, detail, remote_ip) "
        "VALUES (?, ?, ?, ?);";

    lock_guard<mutex> lock(mtx_);
    if (!db_) {
        err = "database not open";
        return false;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = sqlite3_errmsg(db_);
        return false;
    }

    if (!client_name.empty())
        sqlite3_bind_text(stmt, 1, client_name.c_str(), -1, SQLITE_TRANSIENT);
    else
        sqlite3_bind_null(stmt, 1);

    sqlite3_bind_text(stmt, 2, action.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, detail.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, remote_ip.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        err = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}
