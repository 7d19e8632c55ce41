#include "UploadServer.hpp"
#include "ServerConfig.hpp"
#include <csignal>
#include <pthread.h>
#include <iostream>
#include <string>
#include <thread>

using namespace std;

int main(int argc, char *argv[]) {
    ServerConfig cfg;
    string err;
    if (!ServerConfig::load(argc, argv, cfg, err)) {
        cerr << err << "\n" << ServerConfig::usage(argv[0]);
        return 2;
    }
    if (cfg.show_help) {
        cout << ServerConfig::usage(argv[0]);
        return 0;
    }

    // SIGINT/SIGTERM được xử lý bởi một thread riêng qua sigwait;
    // mọi thread tạo sau đây kế thừa mask này.
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);
    signal(SIGPIPE, SIG_IGN);

    UploadServer server(cfg);
    if (!server.start(err)) {
        cerr << "Cannot start server: " << err << "\n";
        return 1;
    }
    cout << "Server listening on " << cfg.ip << ":" << server.bound_port() << "\n";

    thread signal_thread([&server, sigs]() {
        int sig = 0;
        if (sigwait(&sigs, &sig) == 0) {
            server.logger().info("server", "Signal " + to_string(sig) + ", shutting down");
            server.stop();
        }
    });

    server.run();

    // run() cũng có thể kết thúc vì lỗi listener; đánh thức thread tín hiệu
    pthread_kill(signal_thread.native_handle(), SIGTERM);
    signal_thread.join();
    return 0;
}
