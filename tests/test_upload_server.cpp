#include <gtest/gtest.h>
#include "UploadServer.hpp"
#include "UploadClient.hpp"
#include "DbSqlite.hpp"
#include "common/Protocol.hpp"
#include "common/Utils.hpp"
#include "TestHelpers.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

using namespace proto;
using testutil::TempDir;

namespace {

bool wait_until(const std::function<bool()> &pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// Client thô để điều khiển từng bước của giao thức
class RawConn {
public:
    explicit RawConn(int port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }
    ~RawConn() { close(); }

    bool connected() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool send_header(const std::string &client, uint64_t size,
                     const std::string &filename, const std::string &id) {
        UploadHeader h;
        h.client_name = client;
        h.declared_size = size;
        h.filename = filename;
        h.upload_id = id;
        return write_header(fd_, h);
    }

    bool read_offset(uint64_t &offset) {
        return read_u64(fd_, offset) == FrameStatus::Ok;
    }

    bool send(const std::string &data) {
        return send_all(fd_, data.data(), data.size());
    }

    // "OK", "ER", hoặc "" nếu kết nối bị đóng không có ack
    std::string read_ack() {
        char ack[ACK_LEN];
        if (recv_exact(fd_, ack, ACK_LEN) != FrameStatus::Ok) return "";
        return std::string(ack, ACK_LEN);
    }

    bool readable_within(int ms) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        return ::poll(&pfd, 1, ms) > 0;
    }

private:
    int fd_ = -1;
};

std::vector<std::string> artifacts(const std::string &dir) {
    std::vector<std::string> out;
    std::error_code ec;
    for (auto &e : std::filesystem::directory_iterator(dir, ec)) {
        std::string name = e.path().filename().string();
        auto ends_with = [&](const std::string &suf) {
            return name.size() >= suf.size() &&
                   name.compare(name.size() - suf.size(), suf.size(), suf) == 0;
        };
        if (ends_with(".part") || ends_with(".done") || ends_with(".tmp")) continue;
        out.push_back(e.path().string());
    }
    return out;
}

} // namespace

class UploadServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::signal(SIGPIPE, SIG_IGN);

        cfg_.ip = "127.0.0.1";
        cfg_.port = 0;
        cfg_.root_dir = tmp_.file("images");
        cfg_.log_path = tmp_.file("server.log");
        cfg_.db_path = tmp_.file("uploads.db");
        cfg_.log_level = LogLevel::Debug;
        cfg_.chunk_size = 4096;
        cfg_.socket_buf = 64 * 1024;
        cfg_.idle_timeout_ms = idle_timeout_ms_;

        server_ = std::make_unique<UploadServer>(cfg_);
        std::string err;
        ASSERT_TRUE(server_->start(err)) << err;
        port_ = server_->bound_port();
        ASSERT_GT(port_, 0);
        runner_ = std::thread([this]() { server_->run(); });
    }

    void TearDown() override {
        if (server_) server_->stop();
        if (runner_.joinable()) runner_.join();
        server_.reset();
    }

    // Chờ tới khi không còn kết nối nào được phục vụ và không ai giữ lock
    bool wait_quiet() {
        return wait_until([this]() {
            return server_->active_connections() == 0 && server_->uploads().tracked_locks() == 0;
        });
    }

    std::string client_dir(const std::string &client) const {
        return utils::join_path(cfg_.root_dir, client);
    }

    TempDir tmp_;
    ServerConfig cfg_;
    std::unique_ptr<UploadServer> server_;
    std::thread runner_;
    int port_ = 0;
    int idle_timeout_ms_ = 300;
};

TEST_F(UploadServerTest, ConcreteScenarioAndIdempotentReconnect) {
    {
        RawConn c(port_);
        ASSERT_TRUE(c.connected());
        ASSERT_TRUE(c.send_header("stationA", 10, "img.jpg", "u1"));
        uint64_t offset = 99;
        ASSERT_TRUE(c.read_offset(offset));
        EXPECT_EQ(offset, 0u);
        ASSERT_TRUE(c.send("0123456789"));
        EXPECT_EQ(c.read_ack(), "OK");
    }

    UploadSession s = UploadSession::from_header(cfg_.root_dir, "stationA", "img.jpg", "u1", 10);
    std::string final_path;
    ASSERT_TRUE(UploadCoordinator::resolve_final_path(s, final_path));
    EXPECT_EQ(testutil::read_file(final_path), "0123456789");
    EXPECT_FALSE(utils::file_exists(s.part_path));

    {
        RawConn c(port_);
        ASSERT_TRUE(c.send_header("stationA", 10, "img.jpg", "u1"));
        uint64_t offset = 0;
        ASSERT_TRUE(c.read_offset(offset));
        EXPECT_EQ(offset, 10u);
        EXPECT_EQ(c.read_ack(), "OK");
    }

    EXPECT_EQ(artifacts(client_dir("stationA")).size(), 1u);
    ASSERT_TRUE(wait_quiet());
    EXPECT_EQ(server_->uploads_completed(), 1u);
}

TEST_F(UploadServerTest, ClientUploadIsByteIdenticalAndRecorded) {
    std::string src = tmp_.file("pass_20260101.log");
    std::string data = testutil::pattern(300 * 1024 + 17);
    testutil::write_file(src, data);

    UploadClient client;
    client.set_chunk_size(8192);
    UploadOutcome out;
    std::string err;
    ASSERT_TRUE(client.upload("127.0.0.1", port_, "stationB", src, "p1", out, err)) << err;
    EXPECT_TRUE(out.ok);
    EXPECT_EQ(out.resume_offset, 0u);
    EXPECT_EQ(out.bytes_sent, data.size());

    auto files = artifacts(client_dir("stationB"));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(testutil::read_file(files[0]), data);

    UploadSession s = UploadSession::from_header(cfg_.root_dir, "stationB",
                                                 "pass_20260101.log", "p1", data.size());
    EXPECT_EQ(testutil::read_file(s.done_path), utils::base_name(files[0]));

    ASSERT_TRUE(wait_quiet());
    DbSqlite db(cfg_.db_path);
    UploadRecord rec;
    ASSERT_TRUE(db.get_completed_upload("stationB", "p1", rec, err)) << err;
    EXPECT_EQ(rec.final_path, files[0]);
    EXPECT_EQ(rec.size_bytes, data.size());
}

TEST_F(UploadServerTest, ResumesFromDurablyReceivedBytes) {
    std::string data = testutil::pattern(20000);
    const size_t k = 7777;
    {
        RawConn c(port_);
        ASSERT_TRUE(c.send_header("stationA", data.size(), "big.bin", "r1"));
        uint64_t offset = 1;
        ASSERT_TRUE(c.read_offset(offset));
        ASSERT_EQ(offset, 0u);
        ASSERT_TRUE(c.send(data.substr(0, k)));
    }
    ASSERT_TRUE(wait_quiet());

    UploadSession s = UploadSession::from_header(cfg_.root_dir, "stationA", "big.bin", "r1", data.size());
    EXPECT_EQ(utils::file_size(s.part_path), k);
    EXPECT_EQ(server_->uploads_failed(), 1u);

    {
        RawConn c(port_);
        ASSERT_TRUE(c.send_header("stationA", data.size(), "big.bin", "r1"));
        uint64_t offset = 0;
        ASSERT_TRUE(c.read_offset(offset));
        ASSERT_EQ(offset, k);
        ASSERT_TRUE(c.send(data.substr(offset)));
        EXPECT_EQ(c.read_ack(), "OK");
    }

    auto files = artifacts(client_dir("stationA"));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(testutil::read_file(files[0]), data);
}

TEST_F(UploadServerTest, UploadClientResumesPartialUpload) {
    std::string src = tmp_.file("img.jpg");
    std::string data = testutil::pattern(50000);
    testutil::write_file(src, data);
    std::string id = UploadClient::default_upload_id("stationC", src);
    EXPECT_EQ(id, "stationC_50000_img.jpg");

    {
        RawConn c(port_);
        ASSERT_TRUE(c.send_header("stationC", data.size(), "img.jpg", id));
        uint64_t offset = 0;
        ASSERT_TRUE(c.read_offset(offset));
        ASSERT_TRUE(c.send(data.substr(0, 12345)));
    }
    ASSERT_TRUE(wait_quiet());

    UploadClient client;
    UploadOutcome out;
    std::string err;
    ASSERT_TRUE(client.upload_with_retry("127.0.0.1", port_, "stationC", src, id, 3, 50, out, err)) << err;
    EXPECT_EQ(out.attempts, 1);
    EXPECT_EQ(out.resume_offset, 12345u);
    EXPECT_EQ(out.bytes_sent, data.size() - 12345);

    auto files = artifacts(client_dir("stationC"));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(testutil::read_file(files[0]), data);
}

TEST_F(UploadServerTest, SameUploadIdSerializesAndFinalizesOnce) {
    std::string data = testutil::pattern(8000);

    RawConn first(port_);
    ASSERT_TRUE(first.send_header("stationA", data.size(), "img.jpg", "m1"));
    uint64_t offset = 1;
    ASSERT_TRUE(first.read_offset(offset));
    ASSERT_EQ(offset, 0u);
    ASSERT_TRUE(first.send(data.substr(0, 3000)));

    RawConn second(port_);
    ASSERT_TRUE(second.send_header("stationA", data.size(), "img.jpg", "m1"));
    // second chờ lock nên chưa nhận được offset
    EXPECT_FALSE(second.readable_within(150));

    ASSERT_TRUE(first.send(data.substr(3000)));
    EXPECT_EQ(first.read_ack(), "OK");

    uint64_t second_offset = 0;
    ASSERT_TRUE(second.read_offset(second_offset));
    EXPECT_EQ(second_offset, data.size());
    EXPECT_EQ(second.read_ack(), "OK");

    auto files = artifacts(client_dir("stationA"));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(testutil::read_file(files[0]), data);

    ASSERT_TRUE(wait_quiet());
    DbSqlite db(cfg_.db_path);
    std::string err;
    int attempts = 0;
    ASSERT_TRUE(db.count_attempts("stationA", "m1", attempts, err)) << err;
    EXPECT_EQ(attempts, 2);
}

TEST_F(UploadServerTest, DistinctUploadIdsDoNotBlockEachOther) {
    RawConn slow(port_);
    ASSERT_TRUE(slow.send_header("stationA", 100, "a.bin", "d1"));
    uint64_t offset = 1;
    ASSERT_TRUE(slow.read_offset(offset));
    ASSERT_TRUE(slow.send("partial"));

    RawConn fast(port_);
    ASSERT_TRUE(fast.send_header("stationA", 5, "b.bin", "d2"));
    ASSERT_TRUE(fast.readable_within(1000));
    ASSERT_TRUE(fast.read_offset(offset));
    EXPECT_EQ(offset, 0u);
    ASSERT_TRUE(fast.send("hello"));
    EXPECT_EQ(fast.read_ack(), "OK");
}

TEST_F(UploadServerTest, StalePartLargerThanDeclaredIsReset) {
    UploadSession s = UploadSession::from_header(cfg_.root_dir, "stationA", "img.jpg", "s1", 10);
    ASSERT_TRUE(utils::ensure_dir(s.client_dir));
    testutil::write_file(s.part_path, testutil::pattern(64));

    RawConn c(port_);
    ASSERT_TRUE(c.send_header("stationA", 10, "img.jpg", "s1"));
    uint64_t offset = 1;
    ASSERT_TRUE(c.read_offset(offset));
    EXPECT_EQ(offset, 0u);
    ASSERT_TRUE(c.send("abcdefghij"));
    EXPECT_EQ(c.read_ack(), "OK");

    std::string final_path;
    ASSERT_TRUE(UploadCoordinator::resolve_final_path(s, final_path));
    EXPECT_EQ(testutil::read_file(final_path), "abcdefghij");
}

TEST_F(UploadServerTest, StalledBodyTimesOutAndReleasesLock) {
    RawConn stalled(port_);
    ASSERT_TRUE(stalled.send_header("stationA", 100, "img.jpg", "t1"));
    uint64_t offset = 1;
    ASSERT_TRUE(stalled.read_offset(offset));
    ASSERT_TRUE(stalled.send("abc"));

    auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(stalled.read_ack(), "ER");
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(3));

    ASSERT_TRUE(wait_until([this]() { return server_->uploads().tracked_locks() == 0; }));

    RawConn next(port_);
    ASSERT_TRUE(next.send_header("stationA", 100, "img.jpg", "t1"));
    ASSERT_TRUE(next.readable_within(1000));
    ASSERT_TRUE(next.read_offset(offset));
    EXPECT_EQ(offset, 3u);
}

TEST_F(UploadServerTest, MalformedHeaderGetsNoAckAndCreatesNothing) {
    {
        RawConn c(port_);
        ASSERT_TRUE(write_string(c.fd(), "stationZ"));
        ASSERT_TRUE(write_u32(c.fd(), 3));  // declared_size cụt
        c.close();
    }
    {
        RawConn c(port_);
        ASSERT_TRUE(write_u32(c.fd(), MAX_STRING_LEN + 1));
        EXPECT_EQ(c.read_ack(), "");
    }
    {
        RawConn c(port_);
        ASSERT_TRUE(c.send_header("stationZ", 1, "x", ""));
        EXPECT_EQ(c.read_ack(), "");
    }
    ASSERT_TRUE(wait_quiet());
    EXPECT_FALSE(std::filesystem::exists(client_dir("stationZ")));

    // server vẫn phục vụ bình thường
    RawConn c(port_);
    ASSERT_TRUE(c.send_header("stationZ", 2, "ok.txt", "z1"));
    uint64_t offset = 1;
    ASSERT_TRUE(c.read_offset(offset));
    EXPECT_EQ(offset, 0u);
    ASSERT_TRUE(c.send("ok"));
    EXPECT_EQ(c.read_ack(), "OK");
}

TEST_F(UploadServerTest, EmptyFileUpload) {
    RawConn c(port_);
    ASSERT_TRUE(c.send_header("stationA", 0, "empty.log", "e1"));
    uint64_t offset = 1;
    ASSERT_TRUE(c.read_offset(offset));
    EXPECT_EQ(offset, 0u);
    EXPECT_EQ(c.read_ack(), "OK");

    auto files = artifacts(client_dir("stationA"));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(utils::file_size(files[0]), 0u);
}

TEST_F(UploadServerTest, TraversalInHeaderStaysUnderRoot) {
    RawConn c(port_);
    ASSERT_TRUE(c.send_header("../escape", 3, "../../evil.sh", "../id"));
    uint64_t offset = 1;
    ASSERT_TRUE(c.read_offset(offset));
    ASSERT_TRUE(c.send("abc"));
    EXPECT_EQ(c.read_ack(), "OK");

    EXPECT_FALSE(std::filesystem::exists(tmp_.file("escape")));
    auto files = artifacts(client_dir(".._escape"));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].substr(files[0].size() - 8), "_evil.sh");
}

TEST_F(UploadServerTest, StopInterruptsStalledConnection) {
    idle_timeout_ms_ = 60000;
    TearDown();
    SetUp();

    RawConn c(port_);
    ASSERT_TRUE(c.send_header("stationA", 100, "img.jpg", "x1"));
    uint64_t offset = 1;
    ASSERT_TRUE(c.read_offset(offset));

    auto t0 = std::chrono::steady_clock::now();
    server_->stop();
    runner_.join();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(5));
    EXPECT_EQ(server_->active_connections(), 0);
}

TEST_F(UploadServerTest, StalledHeaderIsDroppedWithoutAck) {
    RawConn c(port_);
    ASSERT_TRUE(write_u32(c.fd(), 8));
    ASSERT_TRUE(c.send("stat"));

    auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(c.read_ack(), "");
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(3));
    ASSERT_TRUE(wait_quiet());
    EXPECT_EQ(server_->uploads_failed(), 0u);
}

TEST_F(UploadServerTest, BlockedClientDirGetsErrorBeforeOffset) {
    ASSERT_TRUE(utils::ensure_dir(cfg_.root_dir));
    testutil::write_file(client_dir("stA"), "occupied");

    {
        RawConn c(port_);
        ASSERT_TRUE(c.send_header("stA", 0, "img.jpg", "b1"));
        // lỗi filesystem trong ResolveSession: ER thay cho offset
        EXPECT_EQ(c.read_ack(), "ER");
    }
    ASSERT_TRUE(wait_quiet());
    EXPECT_EQ(server_->uploads_failed(), 1u);
    EXPECT_EQ(testutil::read_file(client_dir("stA")), "occupied");

    // các client khác không bị ảnh hưởng
    RawConn c(port_);
    ASSERT_TRUE(c.send_header("stB", 3, "img.jpg", "b1"));
    uint64_t offset = 1;
    ASSERT_TRUE(c.read_offset(offset));
    EXPECT_EQ(offset, 0u);
    ASSERT_TRUE(c.send("abc"));
    EXPECT_EQ(c.read_ack(), "OK");
    EXPECT_EQ(artifacts(client_dir("stB")).size(), 1u);
}

TEST_F(UploadServerTest, UnwritablePartFileFailsOnlyThatUpload) {
    // thư mục chiếm chỗ file part: không thể ghi hay finalize
    UploadSession empty = UploadSession::from_header(cfg_.root_dir, "stationA", "e.log", "f0", 0);
    UploadSession body = UploadSession::from_header(cfg_.root_dir, "stationA", "b.log", "f1", 4);
    ASSERT_TRUE(utils::ensure_dir(empty.part_path));
    ASSERT_TRUE(utils::ensure_dir(body.part_path));

    {
        RawConn c(port_);
        ASSERT_TRUE(c.send_header("stationA", 0, "e.log", "f0"));
        uint64_t offset = 1;
        ASSERT_TRUE(c.read_offset(offset));
        EXPECT_EQ(offset, 0u);
        EXPECT_EQ(c.read_ack(), "ER");
    }
    {
        RawConn c(port_);
        ASSERT_TRUE(c.send_header("stationA", 4, "b.log", "f1"));
        uint64_t offset = 1;
        ASSERT_TRUE(c.read_offset(offset));
        EXPECT_EQ(offset, 0u);
        // server từ chối trước khi đọc body
        EXPECT_EQ(c.read_ack(), "ER");
    }
    ASSERT_TRUE(wait_quiet());
    EXPECT_EQ(server_->uploads_failed(), 2u);
    EXPECT_FALSE(utils::file_exists(empty.done_path));
    EXPECT_FALSE(utils::file_exists(body.done_path));
    EXPECT_TRUE(artifacts(client_dir("stationA")).empty());

    RawConn c(port_);
    ASSERT_TRUE(c.send_header("stationA", 2, "ok.log", "f2"));
    uint64_t offset = 1;
    ASSERT_TRUE(c.read_offset(offset));
    ASSERT_TRUE(c.send("ok"));
    EXPECT_EQ(c.read_ack(), "OK");
    EXPECT_EQ(server_->uploads_completed(), 1u);
}
