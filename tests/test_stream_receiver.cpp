#include <gtest/gtest.h>
#include "StreamReceiver.hpp"
#include "common/Protocol.hpp"
#include "TestHelpers.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <thread>

using testutil::SocketPair;
using testutil::TempDir;

TEST(StreamReceiver, CopiesExactByteCountAcrossChunks) {
    SocketPair sp;
    std::string data = testutil::pattern(10000);
    ASSERT_TRUE(proto::send_all(sp.a, data.data(), data.size()));
    // byte thừa phía sau không được đọc
    ASSERT_TRUE(proto::send_all(sp.a, "XYZ", 3));

    std::ostringstream out;
    StreamReceiver rx(1000, 1000);
    ReceiveResult res = rx.receive_into(sp.b, out, data.size());

    EXPECT_EQ(res.status, ReceiveStatus::Complete);
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.bytes_written, data.size());
    EXPECT_EQ(out.str(), data);

    char rest[3];
    ASSERT_EQ(proto::recv_exact(sp.b, rest, 3), proto::FrameStatus::Ok);
    EXPECT_EQ(std::string(rest, 3), "XYZ");
}

TEST(StreamReceiver, ZeroBytesIsImmediateSuccess) {
    SocketPair sp;
    std::ostringstream out;
    StreamReceiver rx(1024, 50);
    ReceiveResult res = rx.receive_into(sp.b, out, 0);
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.bytes_written, 0u);
}

TEST(StreamReceiver, PeerCloseMidChunkFlushesPartialBytes) {
    SocketPair sp;
    std::string data = testutil::pattern(1500);
    ASSERT_TRUE(proto::send_all(sp.a, data.data(), data.size()));
    sp.close_a();

    std::ostringstream out;
    StreamReceiver rx(1000, 1000);
    ReceiveResult res = rx.receive_into(sp.b, out, 4000);

    EXPECT_EQ(res.status, ReceiveStatus::Incomplete);
    EXPECT_EQ(res.bytes_written, 1500u);
    EXPECT_EQ(out.str(), data);
    EXPECT_FALSE(res.detail.empty());
}

TEST(StreamReceiver, IdleTimeoutReportsStalledAndKeepsProgress) {
    SocketPair sp;
    std::string data = testutil::pattern(300);
    ASSERT_TRUE(proto::send_all(sp.a, data.data(), data.size()));

    std::ostringstream out;
    StreamReceiver rx(1000, 100);
    auto t0 = std::chrono::steady_clock::now();
    ReceiveResult res = rx.receive_into(sp.b, out, 1000);
    auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_EQ(res.status, ReceiveStatus::Stalled);
    EXPECT_EQ(res.bytes_written, 300u);
    EXPECT_EQ(out.str(), data);
    EXPECT_GE(elapsed, std::chrono::milliseconds(90));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(StreamReceiver, SlowButSteadySenderIsNotStalled) {
    SocketPair sp;
    std::string data = testutil::pattern(500);
    std::thread sender([&]() {
        for (size_t i = 0; i < data.size(); i += 100) {
            if (!proto::send_all(sp.a, data.data() + i, 100)) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(60));
        }
    });

    std::ostringstream out;
    StreamReceiver rx(1000, 200);
    ReceiveResult res = rx.receive_into(sp.b, out, data.size());
    sender.join();

    EXPECT_TRUE(res.ok()) << res.detail;
    EXPECT_EQ(out.str(), data);
}

TEST(StreamReceiver, WritesAtCurrentFilePosition) {
    TempDir tmp;
    std::string path = tmp.file("u1_img.jpg.part");
    testutil::write_file(path, "01234");

    SocketPair sp;
    ASSERT_TRUE(proto::send_all(sp.a, "56789", 5));

    std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
    f.seekp(5);
    StreamReceiver rx(2, 1000);
    ReceiveResult res = rx.receive_into(sp.b, f, 5);
    f.close();

    EXPECT_TRUE(res.ok());
    EXPECT_EQ(testutil::read_file(path), "0123456789");
}

TEST(StreamReceiver, WriteFailureIsReported) {
    SocketPair sp;
    ASSERT_TRUE(proto::send_all(sp.a, "abc", 3));

    std::ofstream bad;  // chưa mở file, mọi lần ghi đều lỗi
    StreamReceiver rx(16, 1000);
    ReceiveResult res = rx.receive_into(sp.b, bad, 3);
    EXPECT_EQ(res.status, ReceiveStatus::WriteFailed);
    EXPECT_EQ(res.bytes_written, 0u);
}
