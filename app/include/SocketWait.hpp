/*
 * Readiness wait over a set of sockets
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef SOCKET_WAIT_HPP
#define SOCKET_WAIT_HPP

#include <chrono>
#include <vector>

/**
 * Block until at least one descriptor is readable or the timeout passes.
 *
 * Built on poll(), so descriptors of any value are accepted. Hangup and
 * error conditions count as readable: the owner's read call reports them.
 *
 * @return One flag per entry of fds; all false on timeout or EINTR
 * @throws std::system_error if poll() fails or a descriptor is not open
 */
std::vector<bool> wait_for_readable(const std::vector<int>& fds, std::chrono::milliseconds timeout);

#endif // SOCKET_WAIT_HPP
