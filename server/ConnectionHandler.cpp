#include "ConnectionHandler.hpp"
#include "UploadServer.hpp"
#include "StreamReceiver.hpp"
#include "../common/Utils.hpp"
#include <fstream>

using namespace std;
using namespace proto;

ConnectionHandler::ConnectionHandler(int sockfd, const string &peer, UploadServer &server)
    : sockfd_(sockfd),
      peer_(peer),
      server_(server) {}

ConnectionHandler::~ConnectionHandler() {
    // lock_ tự unlock khi huỷ, nhưng nhả sớm để kết nối khác không phải chờ
    lock_.unlock();
}

const char *ConnectionHandler::state_str(State st) {
    switch (st) {
    case State::AwaitHeader:    return "AwaitHeader";
    case State::ResolveSession: return "ResolveSession";
    case State::AwaitLock:      return "AwaitLock";
    case State::ComputeOffset:  return "ComputeOffset";
    case State::SendOffset:     return "SendOffset";
    case State::ReceiveBody:    return "ReceiveBody";
    case State::Finalize:       return "Finalize";
    case State::SendAck:        return "SendAck";
    case State::Closed:         return "Closed";
    case State::Failed:         return "Failed";
    }
    return "Unknown";
}

const char *ConnectionHandler::cause_str(FailureCause c) {
    switch (c) {
    case FailureCause::None:       return "none";
    case FailureCause::Protocol:   return "protocol error";
    case FailureCause::Stalled:    return "transfer stalled";
    case FailureCause::Incomplete: return "incomplete transfer";
    case FailureCause::Filesystem: return "filesystem error";
    case FailureCause::Io:         return "socket error";
    }
    return "unknown";
}

const string& ConnectionHandler::tag() const {
    return has_session_ ? session_.client_name : peer_;
}

void ConnectionHandler::run() {
    server_.logger().info(peer_, "Client connected");

    if (!await_header()) return;
    if (!resolve_session()) return;
    await_lock();
    if (!compute_offset()) return;
    if (!send_offset()) return;
    if (!receive_body()) return;
    if (!finalize()) return;
    send_ack();
}

bool ConnectionHandler::await_header() {
    state_ = State::AwaitHeader;
    string err;
    if (!read_header(sockfd_, header_, err)) {
        fail(FailureCause::Protocol, "bad header: " + err);
        return false;
    }
    if (header_.client_name.empty() || header_.upload_id.empty()) {
        fail(FailureCause::Protocol, "empty client_name or upload_id");
        return false;
    }
    return true;
}

bool ConnectionHandler::resolve_session() {
    state_ = State::ResolveSession;
    session_ = UploadSession::from_header(server_.config().root_dir,
                                          header_.client_name,
                                          header_.filename,
                                          header_.upload_id,
                                          header_.declared_size);
    has_session_ = true;

    server_.logger().info(tag(), "Peer " + peer_ + " sends " + session_.filename +
                          " size=" + to_string(session_.file_size) +
                          " upload_id=" + session_.upload_id);

    if (!utils::ensure_dir(session_.client_dir)) {
        fail(FailureCause::Filesystem, "cannot create " + session_.client_dir);
        return false;
    }
    return true;
}

void ConnectionHandler::await_lock() {
    state_ = State::AwaitLock;
    lock_ = server_.uploads().lock_for(session_.upload_id);
    if (!lock_.try_lock()) {
        server_.logger().debug(tag(), "Waiting for upload_id=" + session_.upload_id);
        lock_.lock();
    }
}

bool ConnectionHandler::compute_offset() {
    state_ = State::ComputeOffset;
    offset_ = UploadCoordinator::existing_offset(session_);
    already_done_ = UploadCoordinator::is_done(session_);

    if (offset_ > session_.file_size) {
        // dữ liệu cũ của một lần upload khác kích thước dùng lại upload_id
        server_.logger().warn(tag(), "Stale part for upload_id=" + session_.upload_id +
                              ": " + to_string(offset_) + " > " + to_string(session_.file_size) +
                              ", resetting");
        string err;
        if (!UploadCoordinator::reset(session_, err)) {
            fail(FailureCause::Filesystem, "reset failed: " + err);
            return false;
        }
        offset_ = 0;
    }
    return true;
}

bool ConnectionHandler::send_offset() {
    state_ = State::SendOffset;
    server_.logger().info(tag(), "Resume: upload_id=" + session_.upload_id + " offset=" +
                          to_string(offset_) + "/" + to_string(session_.file_size));
    if (!write_u64(sockfd_, offset_)) {
        fail(FailureCause::Io, "cannot send resume offset");
        return false;
    }
    return true;
}

bool ConnectionHandler::receive_body() {
    uint64_t remaining = session_.file_size - offset_;
    if (remaining == 0) return true;

    state_ = State::ReceiveBody;

    if (!utils::file_exists(session_.part_path)) {
        string err;
        if (!utils::truncate_file(session_.part_path, err)) {
            fail(FailureCause::Filesystem, err);
            return false;
        }
    }

    fstream part(session_.part_path, ios::in | ios::out | ios::binary);
    if (!part) {
        fail(FailureCause::Filesystem, "cannot open " + session_.part_path);
        return false;
    }
    part.seekp((streamoff)offset_);
    if (!part) {
        fail(FailureCause::Filesystem, "cannot seek " + session_.part_path);
        return false;
    }

    StreamReceiver receiver(server_.config().chunk_size, server_.config().idle_timeout_ms);
    ReceiveResult res = receiver.receive_into(sockfd_, part, remaining);
    bytes_received_ = res.bytes_written;
    server_.add_bytes_in(res.bytes_written);
    part.close();

    switch (res.status) {
    case ReceiveStatus::Complete:
        return true;
    case ReceiveStatus::Stalled:
        fail(FailureCause::Stalled, res.detail);
        return false;
    case ReceiveStatus::Incomplete:
        fail(FailureCause::Incomplete, res.detail);
        return false;
    case ReceiveStatus::WriteFailed:
        fail(FailureCause::Filesystem, res.detail);
        return false;
    }
    return false;
}

bool ConnectionHandler::finalize() {
    state_ = State::Finalize;
    string err;

    if (!UploadCoordinator::is_done(session_)) {
        if (!UploadCoordinator::finalize(session_, final_path_, err)) {
            fail(FailureCause::Filesystem, "finalize failed: " + err);
            return false;
        }
    } else if (!UploadCoordinator::resolve_final_path(session_, final_path_)) {
        server_.logger().warn(tag(), "Done marker unreadable: " + session_.done_path);
        final_path_ = "unknown";
    }

    lock_.unlock();

    server_.logger().info(tag(), "File saved: " + final_path_ + " (" +
                          to_string(session_.file_size) + " bytes)");

    UploadRecord rec;
    rec.client_name = session_.client_name;
    rec.upload_id   = session_.upload_id;
    rec.filename    = session_.filename;
    rec.final_path  = final_path_;
    rec.size_bytes  = session_.file_size;
    if (!already_done_ && !server_.db().record_completed_upload(rec, err)) {
        server_.logger().warn(tag(), "DB record_completed_upload: " + err);
    }
    record_attempt(already_done_ ? "already_done" : "completed");
    if (!already_done_) server_.upload_completed();
    return true;
}

void ConnectionHandler::send_ack() {
    state_ = State::SendAck;
    if (!send_all(sockfd_, ACK_OK, ACK_LEN)) {
        // client sẽ kết nối lại, thấy done-marker và nhận OK ngay
        server_.logger().warn(tag(), "Ack lost for upload_id=" + session_.upload_id);
    }
    state_ = State::Closed;
}

void ConnectionHandler::fail(FailureCause cause, const string &detail) {
    State at = state_;
    state_ = State::Failed;
    failure_ = cause;
    lock_.unlock();

    server_.logger().error(tag(), string(cause_str(cause)) + " in " + state_str(at) + ": " +
                           detail + " (received " + to_string(bytes_received_) + " bytes)");

    // header hỏng: không trả lời, không tạo trạng thái
    if (at == State::AwaitHeader) return;

    if (!send_all(sockfd_, ACK_ER, ACK_LEN)) {
        server_.logger().debug(tag(), "Cannot send ER, peer gone");
    }
    server_.upload_failed();
    record_attempt(cause_str(cause));
}

void ConnectionHandler::record_attempt(const string &outcome) {
    string err;
    if (!server_.db().record_attempt(session_.client_name, session_.upload_id,
                                     offset_, bytes_received_, outcome, err)) {
        server_.logger().warn(tag(), "DB record_attempt: " + err);
    }
    if (!server_.db().insert_log(session_.client_name, "upload",
                                 outcome + " upload_id=" + session_.upload_id,
                                 peer_, err)) {
        server_.logger().warn(tag(), "DB insert_log: " + err);
    }
}
