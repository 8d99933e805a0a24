/*
 * Unit tests for the socket readiness wait
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "SocketWait.hpp"

#include <sys/resource.h>
#include <sys/select.h>
#include <unistd.h>

#include <system_error>
#include <vector>

using namespace std::chrono_literals;

namespace {

struct Pipe {
    int read_fd{-1};
    int write_fd{-1};

    Pipe()
    {
        int fds[2];
        if (::pipe(fds) == 0) {
            read_fd = fds[0];
            write_fd = fds[1];
        }
    }

    ~Pipe()
    {
        if (read_fd >= 0) {
            ::close(read_fd);
        }
        if (write_fd >= 0) {
            ::close(write_fd);
        }
    }

    bool write_byte() const { return ::write(write_fd, "x", 1) == 1; }
};

// Raise the soft descriptor limit so a descriptor above FD_SETSIZE can exist
bool allow_descriptor(int fd)
{
    rlimit limit{};
    if (::getrlimit(RLIMIT_NOFILE, &limit) != 0) {
        return false;
    }
    const rlim_t wanted = static_cast<rlim_t>(fd) + 1;
    if (limit.rlim_cur >= wanted) {
        return true;
    }
    if (limit.rlim_max != RLIM_INFINITY && limit.rlim_max < wanted) {
        return false;
    }
    limit.rlim_cur = wanted;
    return ::setrlimit(RLIMIT_NOFILE, &limit) == 0;
}

} // namespace

TEST_CASE("wait_for_readable reports which descriptors have data") {
    Pipe quiet;
    Pipe busy;
    REQUIRE(quiet.read_fd >= 0);
    REQUIRE(busy.read_fd >= 0);
    REQUIRE(busy.write_byte());

    const auto readable = wait_for_readable({quiet.read_fd, busy.read_fd}, 100ms);

    REQUIRE(readable.size() == 2);
    REQUIRE_FALSE(readable[0]);
    REQUIRE(readable[1]);
}

TEST_CASE("wait_for_readable times out with nothing ready") {
    Pipe quiet;
    REQUIRE(quiet.read_fd >= 0);

    const auto readable = wait_for_readable({quiet.read_fd}, 20ms);
    REQUIRE(readable == std::vector<bool>{false});
}

TEST_CASE("wait_for_readable treats a closed peer as readable") {
    Pipe pipe;
    REQUIRE(pipe.read_fd >= 0);
    ::close(pipe.write_fd);
    pipe.write_fd = -1;

    REQUIRE(wait_for_readable({pipe.read_fd}, 100ms)[0]);
}

TEST_CASE("wait_for_readable accepts descriptors above FD_SETSIZE") {
    const int high_fd = FD_SETSIZE + 100;
    if (!allow_descriptor(high_fd)) {
        SKIP("RLIMIT_NOFILE does not allow descriptor " << high_fd);
    }

    Pipe pipe;
    REQUIRE(pipe.read_fd >= 0);
    REQUIRE(::dup2(pipe.read_fd, high_fd) == high_fd);

    Pipe quiet;
    REQUIRE(quiet.read_fd >= 0);
    REQUIRE(pipe.write_byte());

    const auto readable = wait_for_readable({quiet.read_fd, high_fd}, 100ms);
    ::close(high_fd);

    REQUIRE_FALSE(readable[0]);
    REQUIRE(readable[1]);
}

TEST_CASE("wait_for_readable rejects a closed descriptor") {
    Pipe pipe;
    REQUIRE(pipe.read_fd >= 0);
    const int fd = pipe.read_fd;
    ::close(pipe.read_fd);
    pipe.read_fd = -1;

    REQUIRE_THROWS_AS(wait_for_readable({fd}, 10ms), std::system_error);
}
