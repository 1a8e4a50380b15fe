// test/unittest/test_event.cpp
// Unit tests for the epoll event policy

#include "../../src/policy/event.hpp"
#include <cassert>
#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

using tinyws::event_policies::EpollPolicy;

// Simple test framework
#define TEST(name) \
    void test_##name(); \
    struct TestRegistrar_##name { \
        TestRegistrar_##name() { register_test(#name, test_##name); } \
    } registrar_##name; \
    void test_##name()

#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #a << " == " << #b \
                  << " (got " << (a) << " vs " << (b) << ")" << std::endl; \
        throw std::runtime_error("assertion failed"); \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #cond << " to be true" << std::endl; \
        throw std::runtime_error("assertion failed"); \
    } \
} while(0)

#define ASSERT_GT(a, b) do { \
    if ((a) <= (b)) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #a << " > " << #b \
                  << " (got " << (a) << " vs " << (b) << ")" << std::endl; \
        throw std::runtime_error("assertion failed"); \
    } \
} while(0)

// Test registry
struct Test {
    const char* name;
    void (*func)();
};
std::vector<Test> tests;

void register_test(const char* name, void (*func)()) {
    tests.push_back({name, func});
}

// Non-blocking read end, blocking write end
struct PipeHelper {
    int read_fd;
    int write_fd;

    PipeHelper() {
        int pipefd[2];
        if (pipe(pipefd) < 0) {
            throw std::runtime_error("pipe() failed");
        }
        read_fd = pipefd[0];
        write_fd = pipefd[1];

        int flags = fcntl(read_fd, F_GETFL, 0);
        fcntl(read_fd, F_SETFL, flags | O_NONBLOCK);
    }

    ~PipeHelper() {
        if (read_fd >= 0) close(read_fd);
        if (write_fd >= 0) close(write_fd);
    }

    void write_data(const char* data, size_t len) {
        ssize_t written = write(write_fd, data, len);
        if (written != static_cast<ssize_t>(len)) {
            throw std::runtime_error("pipe write failed");
        }
    }

    // Read until EAGAIN
    size_t drain() {
        char buf[256];
        size_t total = 0;
        ssize_t n;
        while ((n = read(read_fd, buf, sizeof(buf))) > 0) {
            total += static_cast<size_t>(n);
        }
        return total;
    }
};

static long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

// ============================================================================
// EpollPolicy Tests
// ============================================================================

TEST(policy_name) {
    ASSERT_EQ(strcmp(EpollPolicy::name(), "epoll"), 0);
}

TEST(init_is_idempotent) {
    EpollPolicy event;
    event.init();
    event.init();

    PipeHelper pipe;
    event.add_read(pipe.read_fd);
}

TEST(add_read_requires_init) {
    EpollPolicy event;
    PipeHelper pipe;

    bool threw = false;
    try {
        event.add_read(pipe.read_fd);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(readable_after_write) {
    EpollPolicy event;
    event.init();

    PipeHelper pipe;
    event.add_read(pipe.read_fd);
    event.set_wait_timeout(1000);

    pipe.write_data("test", 4);

    int n = event.wait_with_timeout();
    ASSERT_GT(n, 0);
    ASSERT_EQ(event.get_ready_fd(), pipe.read_fd);
    ASSERT_TRUE(event.is_readable());
    ASSERT_EQ(pipe.drain(), 4u);
}

TEST(timeout_expires) {
    EpollPolicy event;
    event.init();

    PipeHelper pipe;
    event.add_read(pipe.read_fd);
    event.set_wait_timeout(50);

    auto start = std::chrono::steady_clock::now();
    int n = event.wait_with_timeout();

    ASSERT_EQ(n, 0);
    ASSERT_GT(elapsed_ms(start), 40);
}

TEST(zero_timeout_polls) {
    EpollPolicy event;
    event.init();

    PipeHelper pipe;
    event.add_read(pipe.read_fd);
    event.set_wait_timeout(0);

    ASSERT_EQ(event.wait_with_timeout(), 0);

    pipe.write_data("x", 1);
    ASSERT_GT(event.wait_with_timeout(), 0);
    pipe.drain();
}

TEST(edge_triggered_reports_once) {
    EpollPolicy event;
    event.init();

    PipeHelper pipe;
    event.add_read(pipe.read_fd);
    event.set_wait_timeout(0);

    pipe.write_data("abc", 3);
    ASSERT_GT(event.wait_with_timeout(), 0);

    // Bytes still pending but the edge is consumed
    ASSERT_EQ(event.wait_with_timeout(), 0);

    // New data is a new edge
    pipe.write_data("d", 1);
    ASSERT_GT(event.wait_with_timeout(), 0);
    ASSERT_EQ(pipe.drain(), 4u);
}

TEST(hangup_reported) {
    EpollPolicy event;
    event.init();

    PipeHelper pipe;
    event.add_read(pipe.read_fd);
    event.set_wait_timeout(1000);

    close(pipe.write_fd);
    pipe.write_fd = -1;

    ASSERT_GT(event.wait_with_timeout(), 0);
    ASSERT_TRUE(event.has_error());
}

TEST(remove_stops_events) {
    EpollPolicy event;
    event.init();

    PipeHelper pipe;
    event.add_read(pipe.read_fd);
    event.remove(pipe.read_fd);
    event.set_wait_timeout(20);

    pipe.write_data("test", 4);
    ASSERT_EQ(event.wait_with_timeout(), 0);

    // Removing twice or an invalid fd is harmless
    event.remove(pipe.read_fd);
    event.remove(-1);
    pipe.drain();
}

TEST(move_constructor) {
    EpollPolicy event1;
    event1.init();

    PipeHelper pipe;
    event1.add_read(pipe.read_fd);

    EpollPolicy event2(std::move(event1));
    event2.set_wait_timeout(1000);

    pipe.write_data("test", 4);
    ASSERT_GT(event2.wait_with_timeout(), 0);
    ASSERT_EQ(event2.get_ready_fd(), pipe.read_fd);
    pipe.drain();
}

TEST(move_assignment) {
    EpollPolicy event1;
    event1.init();

    PipeHelper pipe;
    event1.add_read(pipe.read_fd);

    EpollPolicy event2;
    event2.init();
    event2 = std::move(event1);
    event2.set_wait_timeout(1000);

    pipe.write_data("test", 4);
    ASSERT_GT(event2.wait_with_timeout(), 0);
    pipe.drain();
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "Running EpollPolicy unit tests..." << std::endl;
    std::cout << "==================================" << std::endl;

    int passed = 0;
    int failed = 0;

    for (const auto& test : tests) {
        std::cout << "Running: " << test.name << "... ";
        std::cout.flush();

        try {
            test.func();
            std::cout << "PASS" << std::endl;
            passed++;
        } catch (const std::exception& e) {
            std::cout << "EXCEPTION: " << e.what() << std::endl;
            failed++;
        }
    }

    std::cout << "==================================" << std::endl;
    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;

    return failed > 0 ? 1 : 0;
}
