/*
 * Endpoint records produced by discovery
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef DISCOVERED_ENDPOINT_HPP
#define DISCOVERED_ENDPOINT_HPP

#include <cstdint>
#include <string>
#include <vector>

/**
 * A host/port believed to run an inference server
 */
struct DiscoveredEndpoint {
    std::string name;           // Advertised service instance name
    std::string host;
    uint16_t port{0};
    bool validated{false};

    /**
     * Stable identity, "host:port"
     */
    std::string key() const { return make_key(host, port); }

    /**
     * http://host:port (IPv6 literals are bracketed)
     */
    std::string base_url() const;

    /**
     * base_url() + "/api"
     */
    std::string api_url() const { return base_url() + "/api"; }

    static std::string make_key(const std::string& host, uint16_t port)
    {
        return host + ":" + std::to_string(port);
    }
};

inline bool operator==(const DiscoveredEndpoint& a, const DiscoveredEndpoint& b)
{
    return a.key() == b.key() && a.name == b.name && a.validated == b.validated;
}

using EndpointSnapshot = std::vector<DiscoveredEndpoint>;

#endif // DISCOVERED_ENDPOINT_HPP
