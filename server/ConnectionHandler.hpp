#pragma once
#include <cstdint>
#include <string>
#include "UploadSession.hpp"
#include "UploadCoordinator.hpp"
#include "../common/Protocol.hpp"

using namespace std;

class UploadServer;

// Một kết nối = một lần trao đổi:
// header -> resume offset -> body (phần còn thiếu) -> "OK" / "ER"
class ConnectionHandler {
public:
    enum class State {
        AwaitHeader,
        ResolveSession,
        AwaitLock,
        ComputeOffset,
        SendOffset,
        ReceiveBody,
        Finalize,
        SendAck,
        Closed,
        Failed
    };

    enum class FailureCause {
        None,
        Protocol,     // header sai / thiếu
        Stalled,      // idle timeout khi nhận body
        Incomplete,   // peer đóng kết nối giữa body
        Filesystem,   // lỗi quyền, hết chỗ, rename...
        Io            // lỗi gửi trên socket
    };

    ConnectionHandler(int sockfd, const string &peer, UploadServer &server);
    ~ConnectionHandler();

    void run();

    State state() const { return state_; }
    FailureCause failure() const { return failure_; }
    uint64_t resume_offset() const { return offset_; }
    uint64_t bytes_received() const { return bytes_received_; }
    const string& final_path() const { return final_path_; }

    static const char *state_str(State st);
    static const char *cause_str(FailureCause c);

private:
    bool await_header();
    bool resolve_session();
    void await_lock();
    bool compute_offset();
    bool send_offset();
    bool receive_body();
    bool finalize();
    void send_ack();

    void fail(FailureCause cause, const string &detail);
    void record_attempt(const string &outcome);
    const string& tag() const;

    int sockfd_;
    string peer_;
    UploadServer &server_;

    State state_ = State::AwaitHeader;
    FailureCause failure_ = FailureCause::None;

    proto::UploadHeader header_;
    UploadSession session_;
    bool has_session_ = false;
    UploadLock lock_;

    uint64_t offset_ = 0;
    uint64_t bytes_received_ = 0;
    bool already_done_ = false;
    string final_path_;
};
