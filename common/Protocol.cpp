#include "Protocol.hpp"
#include <cerrno>

using namespace std;

namespace proto {

const char *frame_status_str(FrameStatus st) {
    switch (st) {
    case FrameStatus::Ok:     return "ok";
    case FrameStatus::Closed: return "peer closed";
    case FrameStatus::Error:  return "error";
    }
    return "unknown";
}

bool send_all(int sockfd, const void *buf, size_t len) {
    const char *p = static_cast<const char*>(buf);
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::send(sockfd, p + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += (size_t)n;
    }
    return true;
}

FrameStatus recv_exact(int sockfd, void *buf, size_t len) {
    char *p = static_cast<char*>(buf);
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::recv(sockfd, p + total, len - total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) return FrameStatus::Closed;
        if (n < 0) return FrameStatus::Error;
        total += (size_t)n;
    }
    return FrameStatus::Ok;
}

void put_be64(unsigned char *dst, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        dst[i] = (unsigned char)(v & 0xff);
        v >>= 8;
    }
}

uint64_t get_be64(const unsigned char *src) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | src[i];
    }
    return v;
}

FrameStatus read_u32(int sockfd, uint32_t &out) {
    unsigned char b[4];
    FrameStatus st = recv_exact(sockfd, b, sizeof(b));
    if (st != FrameStatus::Ok) return st;
    out = ((uint32_t)b[0] << 24) | ((uint32_t)b[1] << 16) |
          ((uint32_t)b[2] << 8)  |  (uint32_t)b[3];
    return FrameStatus::Ok;
}

FrameStatus read_u64(int sockfd, uint64_t &out) {
    unsigned char b[8];
    FrameStatus st = recv_exact(sockfd, b, sizeof(b));
    if (st != FrameStatus::Ok) return st;
    out = get_be64(b);
    return FrameStatus::Ok;
}

FrameStatus read_string(int sockfd, string &out) {
    uint32_t n = 0;
    FrameStatus st = read_u32(sockfd, n);
    if (st != FrameStatus::Ok) return st;
    if (n > MAX_STRING_LEN) return FrameStatus::Error;

    out.assign(n, '\0');
    if (n > 0) {
        st = recv_exact(sockfd, &out[0], n);
        if (st != FrameStatus::Ok) return st;
    }
    if (!is_valid_utf8(out)) return FrameStatus::Error;
    return FrameStatus::Ok;
}

bool write_u32(int sockfd, uint32_t value) {
    unsigned char b[4] = {
        (unsigned char)(value >> 24), (unsigned char)(value >> 16),
        (unsigned char)(value >> 8),  (unsigned char)value
    };
    return send_all(sockfd, b, sizeof(b));
}

bool write_u64(int sockfd, uint64_t value) {
    unsigned char b[8];
    put_be64(b, value);
    return send_all(sockfd, b, sizeof(b));
}

bool write_string(int sockfd, const string &s) {
    if (s.size() > MAX_STRING_LEN) return false;
    if (!write_u32(sockfd, (uint32_t)s.size())) return false;
    return s.empty() || send_all(sockfd, s.data(), s.size());
}

bool read_header(int sockfd, UploadHeader &out, string &err) {
    FrameStatus st = read_string(sockfd, out.client_name);
    if (st != FrameStatus::Ok) {
        err = string("client_name: ") + frame_status_str(st);
        return false;
    }
    st = read_u64(sockfd, out.declared_size);
    if (st != FrameStatus::Ok) {
        err = string("declared_size: ") + frame_status_str(st);
        return false;
    }
    st = read_string(sockfd, out.filename);
    if (st != FrameStatus::Ok) {
        err = string("filename: ") + frame_status_str(st);
        return false;
    }
    st = read_string(sockfd, out.upload_id);
    if (st != FrameStatus::Ok) {
        err = string("upload_id: ") + frame_status_str(st);
        return false;
    }
    return true;
}

bool write_header(int sockfd, const UploadHeader &h) {
    return write_string(sockfd, h.client_name) &&
           write_u64(sockfd, h.declared_size) &&
           write_string(sockfd, h.filename) &&
           write_string(sockfd, h.upload_id);
}

bool is_valid_utf8(const string &s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        unsigned char c = (unsigned char)s[i];
        size_t extra;
        uint32_t cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;

        if (i + extra >= n) return false;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = (unsigned char)s[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong, surrogate, ngoài phạm vi Unicode
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

} // namespace proto
