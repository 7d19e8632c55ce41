#include "UploadClient.hpp"
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

using namespace std;

static void usage() {
    cout << "Usage: ./groundlink_upload <ip> <port> <client_name> <file> [upload_id] [--retries N]\n";
}

int main(int argc, char *argv[]) {
    signal(SIGPIPE, SIG_IGN);

    vector<string> pos;
    int retries = 5;
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--retries" && i + 1 < argc) {
            try {
                retries = stoi(argv[++i]);
            } catch (const exception &) {
                cerr << "Invalid retries: " << argv[i] << "\n";
                return 2;
            }
        } else if (a == "-h" || a == "--help") {
            usage();
            return 0;
        } else {
            pos.push_back(a);
        }
    }
    if (pos.size() < 4 || retries < 1) {
        usage();
        return 2;
    }

    int port = 0;
    try {
        port = stoi(pos[1]);
    } catch (const exception &) {
        cerr << "Invalid port: " << pos[1] << "\n";
        return 2;
    }
    string upload_id = pos.size() > 4 ? pos[4]
                                      : UploadClient::default_upload_id(pos[2], pos[3]);

    UploadClient client;
    UploadOutcome out;
    string err;
    if (!client.upload_with_retry(pos[0], port, pos[2], pos[3], upload_id,
                                  retries, 2000, out, err)) {
        cerr << "Upload failed after " << out.attempts << " attempt(s): " << err << "\n";
        return 1;
    }
    cout << "Uploaded " << pos[3] << " (upload_id=" << upload_id
         << ", resumed at " << out.resume_offset << ", sent " << out.bytes_sent << " bytes)\n";
    return 0;
}
