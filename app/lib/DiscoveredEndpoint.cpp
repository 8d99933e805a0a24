/*
 * Endpoint helpers
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "DiscoveredEndpoint.hpp"

std::string DiscoveredEndpoint::base_url() const
{
    std::string host_part = host;
    // DNS-SD host targets end with the root label
    if (!host_part.empty() && host_part.back() == '.') {
        host_part.pop_back();
    }
    if (host_part.find(':') != std::string::npos) {
        host_part = "[" + host_part + "]";
    }
    return "http://" + host_part + ":" + std::to_string(port);
}
