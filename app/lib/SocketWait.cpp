/*
 * Readiness wait over a set of sockets
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "SocketWait.hpp"

#include <poll.h>

#include <cerrno>
#include <string>
#include <system_error>

std::vector<bool> wait_for_readable(const std::vector<int>& fds, std::chrono::milliseconds timeout)
{
    std::vector<pollfd> poll_fds;
    poll_fds.reserve(fds.size());
    for (int fd : fds) {
        pollfd entry{};
        entry.fd = fd;
        entry.events = POLLIN;
        poll_fds.push_back(entry);
    }

    std::vector<bool> readable(fds.size(), false);

    const int ready = ::poll(poll_fds.data(), static_cast<nfds_t>(poll_fds.size()),
                             static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return readable;
        }
        throw std::system_error(errno, std::generic_category(), "poll() failed");
    }

    for (std::size_t i = 0; i < poll_fds.size(); ++i) {
        if (poll_fds[i].revents & POLLNVAL) {
            throw std::system_error(EBADF, std::generic_category(),
                                    "poll() reported descriptor " + std::to_string(poll_fds[i].fd) + " as invalid");
        }
        readable[i] = (poll_fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0;
    }
    return readable;
}
