#include "StreamReceiver.hpp"
#include "../common/Utils.hpp"
#include <sys/socket.h>
#include <poll.h>
#include <cerrno>

using namespace std;

const char *receive_status_str(ReceiveStatus st) {
    switch (st) {
    case ReceiveStatus::Complete:    return "complete";
    case ReceiveStatus::Stalled:     return "transfer stalled";
    case ReceiveStatus::Incomplete:  return "incomplete transfer";
    case ReceiveStatus::WriteFailed: return "write failed";
    }
    return "unknown";
}

StreamReceiver::StreamReceiver(size_t chunk_size, int idle_timeout_ms)
    : chunk_size_(chunk_size > 0 ? chunk_size : 64 * 1024),
      idle_timeout_ms_(idle_timeout_ms) {}

bool StreamReceiver::flush_chunk(ostream &file, const char *data, size_t len, ReceiveResult &res) {
    if (len == 0) return true;
    file.write(data, (streamsize)len);
    file.flush();
    if (!file) {
        res.status = ReceiveStatus::WriteFailed;
        res.detail = "write error: " + utils::errno_str(errno);
        return false;
    }
    res.bytes_written += len;
    return true;
}

ReceiveResult StreamReceiver::receive_into(int sockfd, ostream &file, uint64_t byte_count) {
    ReceiveResult res;
    if (buf_.size() != chunk_size_) buf_.resize(chunk_size_);

    uint64_t remaining = byte_count;
    while (remaining > 0) {
        size_t want = remaining > chunk_size_ ? chunk_size_ : (size_t)remaining;
        size_t got = 0;

        while (got < want) {
            pollfd pfd{};
            pfd.fd = sockfd;
            pfd.events = POLLIN;
            int pr = ::poll(&pfd, 1, idle_timeout_ms_);
            if (pr < 0 && errno == EINTR) continue;
            if (pr == 0) {
                if (!flush_chunk(file, buf_.data(), got, res)) return res;
                res.status = ReceiveStatus::Stalled;
                res.detail = "no data for " + to_string(idle_timeout_ms_) + " ms";
                return res;
            }
            if (pr < 0) {
                int saved = errno;
                if (!flush_chunk(file, buf_.data(), got, res)) return res;
                res.status = ReceiveStatus::Incomplete;
                res.detail = "poll: " + utils::errno_str(saved);
                return res;
            }

            ssize_t n = ::recv(sockfd, buf_.data() + got, want - got, 0);
            if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) continue;
            if (n <= 0) {
                string why = (n == 0) ? string("peer closed connection")
                                      : "recv: " + utils::errno_str(errno);
                if (!flush_chunk(file, buf_.data(), got, res)) return res;
                res.status = ReceiveStatus::Incomplete;
                res.detail = why + " after " + to_string(res.bytes_written) + " of " +
                             to_string(byte_count) + " bytes";
                return res;
            }
            got += (size_t)n;
        }

        if (!flush_chunk(file, buf_.data(), got, res)) return res;
        remaining -= got;
    }
    return res;
}
