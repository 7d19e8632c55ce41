#include "Utils.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>

using namespace std;

namespace utils {

string join_path(const string &a, const string &b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_slash_end = (!a.empty() && a.back() == '/');
    bool b_slash_start = (!b.empty() && b.front() == '/');

    if (a_slash_end && b_slash_start) {
        return a + b.substr(1);
    } else if (!a_slash_end && !b_slash_start) {
        return a + "/" + b;
    } else {
        return a + b;
    }
}

static bool mkdir_single(const string &path) {
    if (path.empty()) return true;
    int rc = ::mkdir(path.c_str(), 0755);
    if (rc == 0) return true;
    if (errno != EEXIST) return false;
    // đã tồn tại: phải là thư mục, không phải file thường
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

vector<string> split_path(const string &path) {
    vector<string> parts;
    string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty()) {
                parts.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

bool ensure_dir(const string &path) {
    if (path.empty()) return true;

    // Nếu path không bắt đầu bằng '/', coi như relative:
    // build dần từ trước ra sau.
    vector<string> parts = split_path(path);
    string cur;
    if (!path.empty() && path.front() == '/') {
        cur = "/";
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        if (cur == "/" || cur.empty())
            cur += parts[i];
        else
            cur = join_path(cur, parts[i]);

        if (!mkdir_single(cur)) {
            // nếu mkdir lỗi mà không phải EEXIST thì fail
            struct stat st{};
            if (::stat(cur.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
                return false;
            }
        }
    }
    return true;
}

bool file_exists(const string &path) {
    struct stat st{};
    return (::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode));
}

uint64_t file_size(const string &path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
        return (uint64_t)st.st_size;
    }
    return 0;
}

string base_name(const string &path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == string::npos) return path;
    return path.substr(pos + 1);
}

string safe_component(const string &name) {
    string out = name;
    for (char &c : out) {
        if (c == '/' || c == '\\' || c == '\0') c = '_';
    }
    if (out.empty() || out == "." || out == "..") return "_";
    return out;
}

string timestamp_now() {
    time_t tt = ::time(nullptr);
    tm tmv{};
    localtime_r(&tt, &tmv);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tmv);
    return buf;
}

bool read_text_file(const string &path, string &out) {
    ifstream ifs(path, ios::binary);
    if (!ifs) return false;
    stringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

bool write_text_file_atomic(const string &path, const string &content, string &err) {
    string tmp = path + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        err = "open " + tmp + ": " + errno_str(errno);
        return false;
    }
    size_t total = 0;
    while (total < content.size()) {
        ssize_t n = ::write(fd, content.data() + total, content.size() - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            err = "write " + tmp + ": " + errno_str(errno);
            ::close(fd);
            ::unlink(tmp.c_str());
            return false;
        }
        total += (size_t)n;
    }
    if (::fsync(fd) != 0) {
        err = "fsync " + tmp + ": " + errno_str(errno);
        ::close(fd);
        ::unlink(tmp.c_str());
        return false;
    }
    ::close(fd);
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        err = "rename " + tmp + ": " + errno_str(errno);
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}

bool truncate_file(const string &path, string &err) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        err = "truncate " + path + ": " + errno_str(errno);
        return false;
    }
    ::close(fd);
    return true;
}

bool sync_file(const string &path, string &err) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        err = "open " + path + ": " + errno_str(errno);
        return false;
    }
    bool ok = (::fsync(fd) == 0);
    if (!ok) err = "fsync " + path + ": " + errno_str(errno);
    ::close(fd);
    return ok;
}

string errno_str(int err_no) {
    char buf[256];
    // GNU strerror_r trả về char*
    const char *msg = strerror_r(err_no, buf, sizeof(buf));
    return msg ? string(msg) : string("errno ") + to_string(err_no);
}

} // namespace utils
