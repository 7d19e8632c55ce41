#include "UploadCoordinator.hpp"
#include "../common/Utils.hpp"
#include <cstdio>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

using namespace std;

// ===== UploadLock =====

UploadLock::UploadLock(UploadCoordinator *owner, const string &upload_id, shared_ptr<Entry> entry)
    : owner_(owner), upload_id_(upload_id), entry_(std::move(entry)) {}

UploadLock::UploadLock(UploadLock &&other) noexcept
    : owner_(other.owner_),
      upload_id_(std::move(other.upload_id_)),
      entry_(std::move(other.entry_)),
      owns_(other.owns_) {
    other.owner_ = nullptr;
    other.owns_ = false;
}

UploadLock &UploadLock::operator=(UploadLock &&other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        upload_id_ = std::move(other.upload_id_);
        entry_ = std::move(other.entry_);
        owns_ = other.owns_;
        other.owner_ = nullptr;
        other.owns_ = false;
    }
    return *this;
}

UploadLock::~UploadLock() {
    release();
}

void UploadLock::lock() {
    if (!entry_ || owns_) return;
    unique_lock<mutex> lk(entry_->mtx);
    uint64_t ticket = entry_->next_ticket++;
    entry_->cv.wait(lk, [&]() { return entry_->now_serving == ticket; });
    owns_ = true;
}

bool UploadLock::try_lock() {
    if (!entry_ || owns_) return owns_;
    lock_guard<mutex> lk(entry_->mtx);
    if (entry_->next_ticket != entry_->now_serving) return false;
    entry_->next_ticket++;
    owns_ = true;
    return true;
}

void UploadLock::unlock() {
    if (!entry_ || !owns_) return;
    {
        lock_guard<mutex> lk(entry_->mtx);
        entry_->now_serving++;
    }
    entry_->cv.notify_all();
    owns_ = false;
}

void UploadLock::release() {
    unlock();
    if (owner_ && entry_) {
        entry_.reset();
        owner_->release_entry(upload_id_);
    }
    owner_ = nullptr;
}

// ===== UploadCoordinator =====

UploadLock UploadCoordinator::lock_for(const string &upload_id) {
    lock_guard<mutex> lock(mtx_);
    auto &entry = locks_[upload_id];
    if (!entry) entry = make_shared<UploadLock::Entry>();
    entry->users++;
    return UploadLock(this, upload_id, entry);
}

void UploadCoordinator::release_entry(const string &upload_id) {
    lock_guard<mutex> lock(mtx_);
    auto it = locks_.find(upload_id);
    if (it == locks_.end()) return;
    if (--it->second->users == 0) locks_.erase(it);
}

size_t UploadCoordinator::tracked_locks() {
    lock_guard<mutex> lock(mtx_);
    return locks_.size();
}

bool UploadCoordinator::is_done(const UploadSession &session) {
    return utils::file_exists(session.done_path);
}

uint64_t UploadCoordinator::existing_offset(const UploadSession &session) {
    if (is_done(session)) return session.file_size;
    return utils::file_size(session.part_path);
}

bool UploadCoordinator::reset(const UploadSession &session, string &err) {
    if (!utils::ensure_dir(session.client_dir)) {
        err = "cannot create " + session.client_dir;
        return false;
    }
    return utils::truncate_file(session.part_path, err);
}

bool UploadCoordinator::finalize(const UploadSession &session, string &final_path, string &err) {
    if (!utils::ensure_dir(session.client_dir)) {
        err = "cannot create " + session.client_dir;
        return false;
    }
    // declared size == 0: không có body nên có thể chưa có file part
    if (!utils::file_exists(session.part_path)) {
        if (!utils::truncate_file(session.part_path, err)) return false;
    }
    if (!utils::sync_file(session.part_path, err)) return false;

    const string stamp = utils::timestamp_now();
    string final_name = stamp + "_" + session.filename;

    // Không bao giờ ghi đè một artifact đã có
    for (int attempt = 1;; ++attempt) {
        final_path = utils::join_path(session.client_dir, final_name);
        if (::renameat2(AT_FDCWD, session.part_path.c_str(),
                        AT_FDCWD, final_path.c_str(), RENAME_NOREPLACE) == 0) {
            break;
        }
        if (errno == EEXIST) {
            final_name = stamp + "_" + to_string(attempt) + "_" + session.filename;
            continue;
        }
        if (errno == EINVAL || errno == ENOSYS) {
            // filesystem không hỗ trợ RENAME_NOREPLACE
            if (utils::file_exists(final_path)) {
                final_name = stamp + "_" + to_string(attempt) + "_" + session.filename;
                continue;
            }
            if (::rename(session.part_path.c_str(), final_path.c_str()) == 0) break;
        }
        err = "rename " + session.part_path + ": " + utils::errno_str(errno);
        return false;
    }

    return utils::write_text_file_atomic(session.done_path, final_name, err);
}

bool UploadCoordinator::resolve_final_path(const UploadSession &session, string &final_path) {
    string name;
    if (!utils::read_text_file(session.done_path, name)) return false;
    while (!name.empty() && (name.back() == '\n' || name.back() == '\r' || name.back() == ' ')) {
        name.pop_back();
    }
    if (name.empty()) return false;
    final_path = utils::join_path(session.client_dir, name);
    return true;
}
