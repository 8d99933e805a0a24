/*
 * Multicast service discovery primitive
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef I_SERVICE_BROWSER_HPP
#define I_SERVICE_BROWSER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

/**
 * A raw add/remove notification for an advertised service
 */
struct BrowseEvent {
    enum class Kind {
        Added,
        Removed,
    };

    Kind kind{Kind::Added};
    std::string service_name;
    std::string host;           // Resolved host name or address
    uint16_t port{0};
};

/**
 * Callbacks a browser reports through. They may be invoked from any
 * thread; receivers must hand the work over to their own context.
 */
struct BrowseCallbacks {
    std::function<void(const BrowseEvent&)> on_event;
    std::function<void(const std::string& error)> on_failure;
};

/**
 * Wraps the platform's mDNS / DNS-SD browse primitive
 *
 * One browse at a time. start() while a browse is active restarts it.
 * After stop() returns no further callbacks are delivered.
 */
class IServiceBrowser {
public:
    virtual ~IServiceBrowser() = default;

    /**
     * Begin browsing for a service type, e.g. "_http._tcp"
     * @return false if the browse could not be started (on_failure is not called)
     */
    virtual bool start(const std::string& service_type,
                       const std::string& domain,
                       BrowseCallbacks callbacks) = 0;

    virtual void stop() = 0;

    virtual bool is_browsing() const = 0;
};

using ServiceBrowserPtr = std::shared_ptr<IServiceBrowser>;

#endif // I_SERVICE_BROWSER_HPP
