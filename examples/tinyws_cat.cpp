// examples/tinyws_cat.cpp
// Interactive WebSocket client: stdin lines out, messages to stdout
//
// Usage: tinyws_cat [-H "Name: value"]... [--verify] [--timeout ms] <ws://...|wss://...>
#include "../src/ws_configs.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

using namespace tinyws;

namespace {

std::atomic<bool> running{true};
std::atomic<bool> stdin_done{false};

void signal_handler(int) {
    running = false;
}

void usage(const char* prog) {
    fprintf(stderr, "Usage: %s [-H \"Name: value\"]... [--verify] [--timeout ms] <url>\n", prog);
}

} // namespace

int main(int argc, char** argv) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    ConnectionConfig config;
    const char* url = nullptr;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-H") == 0 && i + 1 < argc) {
            std::string header = argv[++i];
            size_t colon = header.find(':');
            if (colon == std::string::npos) {
                fprintf(stderr, "Bad header '%s' (expected 'Name: value')\n", header.c_str());
                return 2;
            }
            size_t value_start = header.find_first_not_of(' ', colon + 1);
            config.custom_headers.emplace_back(
                header.substr(0, colon),
                value_start == std::string::npos ? std::string() : header.substr(value_start));
        } else if (strcmp(argv[i], "--verify") == 0) {
            config.verify_peer = true;
        } else if (strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            config.handshake_timeout_ms = atoi(argv[++i]);
        } else if (argv[i][0] == '-') {
            usage(argv[0]);
            return 2;
        } else {
            url = argv[i];
        }
    }

    if (!url) {
        usage(argv[0]);
        return 2;
    }

    SecureWebSocket ws(config);
    int exit_code = 0;

    ws.set_on_open([&] {
        fprintf(stderr, "* connected to %s\n", url);
    });
    ws.set_on_message([](const std::string& message) {
        fwrite(message.data(), 1, message.size(), stdout);
        fputc('\n', stdout);
        fflush(stdout);
    });
    ws.set_on_close([](uint16_t code, const std::string& reason) {
        fprintf(stderr, "* closed (%u%s%s)\n", code, reason.empty() ? "" : ": ", reason.c_str());
    });
    ws.set_on_error([&](const WebSocketError& e) {
        fprintf(stderr, "* error: %s\n", e.what());
        exit_code = 1;
    });

    if (!ws.connect(url)) {
        return 1;
    }

    // Reader thread: send() is safe from any thread
    std::thread reader([&ws] {
        std::string line;
        while (running && std::getline(std::cin, line)) {
            try {
                ws.send(line);
            } catch (const WebSocketError& e) {
                fprintf(stderr, "* send failed: %s\n", e.what());
                break;
            }
        }
        stdin_done = true;
    });

    while (running && !stdin_done && ws.poll_once(100)) {
    }
    ws.close();

    if (stdin_done) {
        reader.join();
    } else {
        // Still blocked in getline; the process exit ends it
        reader.detach();
    }
    return exit_code;
}
