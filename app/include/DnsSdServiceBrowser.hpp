/*
 * DNS-SD (Bonjour / Avahi compat) service browser
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef DNS_SD_SERVICE_BROWSER_HPP
#define DNS_SD_SERVICE_BROWSER_HPP

#include "IServiceBrowser.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct _DNSServiceRef_t;

/**
 * Browses with DNSServiceBrowse and resolves each instance with
 * DNSServiceResolve to a host/port pair.
 *
 * All DNS-SD references are serviced from one event thread that
 * polls their sockets. Removal events report the host/port that
 * was resolved for the instance; instances that never resolved are not
 * reported.
 */
class DnsSdServiceBrowser : public IServiceBrowser {
public:
    DnsSdServiceBrowser();
    ~DnsSdServiceBrowser() override;

    bool start(const std::string& service_type,
               const std::string& domain,
               BrowseCallbacks callbacks) override;
    void stop() override;
    bool is_browsing() const override { return running_.load(); }

private:
    struct Resolve;
    struct ResolvedService {
        std::string host;
        uint16_t port{0};
    };

    void event_loop();
    void on_browse_result(uint32_t flags, uint32_t interface_index, int error,
                          const char* service_name, const char* regtype, const char* domain);
    void on_resolve_result(Resolve* resolve, int error, const char* host_target, uint16_t port);
    void fail(const std::string& error);
    void release_finished_resolves();

    friend struct DnsSdCallbacks;

    _DNSServiceRef_t* browse_ref_{nullptr};
    std::vector<std::unique_ptr<Resolve>> resolves_;
    std::map<std::string, ResolvedService> resolved_;   // instance name -> address
    BrowseCallbacks callbacks_;
    std::atomic<bool> running_{false};
    std::thread event_thread_;
    std::mutex lifecycle_mutex_;
};

#endif // DNS_SD_SERVICE_BROWSER_HPP
