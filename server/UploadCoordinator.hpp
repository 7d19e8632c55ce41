#pragma once
#include <unordered_map>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <string>
#include <cstdint>
#include <cstddef>
#include "UploadSession.hpp"

using namespace std;

class UploadCoordinator;

// Khoá theo upload_id. Đối tượng giữ một tham chiếu tới entry trong registry
// suốt vòng đời của nó (kể cả khi đang chờ), nên entry không bị xoá khi còn
// người dùng. Huỷ đối tượng = unlock (nếu đang giữ) + nhả tham chiếu.
class UploadLock {
public:
    UploadLock() = default;
    UploadLock(UploadLock &&other) noexcept;
    UploadLock &operator=(UploadLock &&other) noexcept;
    UploadLock(const UploadLock &) = delete;
    UploadLock &operator=(const UploadLock &) = delete;
    ~UploadLock();

    void lock();
    bool try_lock();
    void unlock();
    bool owns_lock() const { return owns_; }
    const string &upload_id() const { return upload_id_; }

private:
    friend class UploadCoordinator;
    // ticket lock: người đến trước được phục vụ trước
    struct Entry {
        mutex mtx;
        condition_variable cv;
        uint64_t next_ticket = 0;
        uint64_t now_serving = 0;
        size_t users = 0;   // được bảo vệ bởi mutex của UploadCoordinator
    };
    UploadLock(UploadCoordinator *owner, const string &upload_id, shared_ptr<Entry> entry);
    void release();

    UploadCoordinator *owner_ = nullptr;
    string upload_id_;
    shared_ptr<Entry> entry_;
    bool owns_ = false;
};

// Quản lý lock theo upload_id và các thao tác trên file part/done.
// Mọi thao tác đọc/ghi file của một upload_id phải chạy khi đang giữ lock của nó.
class UploadCoordinator {
public:
    // Trả về (tạo nếu chưa có) lock dùng chung cho upload_id
    UploadLock lock_for(const string &upload_id);

    // Số entry đang có trong registry
    size_t tracked_locks();

    // declared size nếu đã có done-marker, ngược lại kích thước file part (0 nếu chưa có)
    static uint64_t existing_offset(const UploadSession &session);

    static bool is_done(const UploadSession &session);

    // Cắt file part về 0 byte (dữ liệu cũ lớn hơn declared size)
    static bool reset(const UploadSession &session, string &err);

    // rename part -> <timestamp>_<filename> rồi ghi done-marker.
    static bool finalize(const UploadSession &session, string &final_path, string &err);

    // Đọc path cuối cùng từ done-marker, không đụng tới file part
    static bool resolve_final_path(const UploadSession &session, string &final_path);

private:
    friend class UploadLock;
    void release_entry(const string &upload_id);

    mutex mtx_;
    unordered_map<string, shared_ptr<UploadLock::Entry>> locks_;
};
