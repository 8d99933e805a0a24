/*
 * DNS-SD service browser implementation
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "DnsSdServiceBrowser.hpp"
#include "Logger.hpp"
#include "SocketWait.hpp"

#include <dns_sd.h>

#include <arpa/inet.h>

#include <algorithm>
#include <system_error>
#include <vector>

namespace {

constexpr std::chrono::milliseconds kWaitTimeout{250};

} // namespace

struct DnsSdServiceBrowser::Resolve {
    DNSServiceRef ref{nullptr};
    std::string service_name;
    DnsSdServiceBrowser* owner{nullptr};
    bool finished{false};
};

struct DnsSdCallbacks {
    static void DNSSD_API browse(DNSServiceRef,
                                 DNSServiceFlags flags,
                                 uint32_t interface_index,
                                 DNSServiceErrorType error,
                                 const char* service_name,
                                 const char* regtype,
                                 const char* reply_domain,
                                 void* context)
    {
        auto* browser = static_cast<DnsSdServiceBrowser*>(context);
        browser->on_browse_result(flags, interface_index, error, service_name, regtype, reply_domain);
    }

    static void DNSSD_API resolve(DNSServiceRef,
                                  DNSServiceFlags,
                                  uint32_t,
                                  DNSServiceErrorType error,
                                  const char*,
                                  const char* host_target,
                                  uint16_t port,
                                  uint16_t,
                                  const unsigned char*,
                                  void* context)
    {
        auto* resolve = static_cast<DnsSdServiceBrowser::Resolve*>(context);
        resolve->owner->on_resolve_result(resolve, error, host_target, ntohs(port));
    }
};

DnsSdServiceBrowser::DnsSdServiceBrowser() = default;

DnsSdServiceBrowser::~DnsSdServiceBrowser()
{
    stop();
}

bool DnsSdServiceBrowser::start(const std::string& service_type,
                                const std::string& domain,
                                BrowseCallbacks callbacks)
{
    stop();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    DNSServiceRef ref = nullptr;
    const DNSServiceErrorType err = DNSServiceBrowse(
        &ref,
        0,                              // flags
        kDNSServiceInterfaceIndexAny,
        service_type.c_str(),
        domain.empty() ? nullptr : domain.c_str(),
        &DnsSdCallbacks::browse,
        this);

    if (err != kDNSServiceErr_NoError) {
        if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
            logger->error("DNSServiceBrowse for {} failed with error {}", service_type, err);
        }
        return false;
    }

    browse_ref_ = ref;
    callbacks_ = std::move(callbacks);
    resolved_.clear();
    running_ = true;
    event_thread_ = std::thread([this] { event_loop(); });

    if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->debug("Browsing for {} in {}", service_type, domain.empty() ? "default domain" : domain);
    }
    return true;
}

void DnsSdServiceBrowser::stop()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    running_ = false;
    if (event_thread_.joinable()) {
        event_thread_.join();
    }

    for (auto& resolve : resolves_) {
        if (resolve->ref) {
            DNSServiceRefDeallocate(resolve->ref);
        }
    }
    resolves_.clear();

    if (browse_ref_) {
        DNSServiceRefDeallocate(browse_ref_);
        browse_ref_ = nullptr;
    }
    callbacks_ = BrowseCallbacks{};
}

void DnsSdServiceBrowser::event_loop()
{
    while (running_) {
        // Entry 0 is the browse socket, the rest follow resolves_
        std::vector<int> fds;
        fds.reserve(resolves_.size() + 1);
        fds.push_back(DNSServiceRefSockFD(browse_ref_));
        for (const auto& resolve : resolves_) {
            fds.push_back(DNSServiceRefSockFD(resolve->ref));
        }

        std::vector<bool> readable;
        try {
            readable = wait_for_readable(fds, kWaitTimeout);
        } catch (const std::system_error& ex) {
            fail(std::string("Waiting on the DNS-SD sockets failed: ") + ex.what());
            return;
        }

        if (readable[0]) {
            const DNSServiceErrorType err = DNSServiceProcessResult(browse_ref_);
            if (err != kDNSServiceErr_NoError) {
                fail("DNS-SD browse failed with error " + std::to_string(err));
                return;
            }
        }

        // Resolves may be added by the browse callback above; only service
        // the ones that were part of this wait.
        const std::size_t count = fds.size() - 1;
        for (std::size_t i = 0; i < count && running_; ++i) {
            if (!readable[i + 1]) {
                continue;
            }
            Resolve* resolve = resolves_[i].get();
            const DNSServiceErrorType err = DNSServiceProcessResult(resolve->ref);
            if (err != kDNSServiceErr_NoError) {
                resolve->finished = true;
            }
        }
        release_finished_resolves();
    }
}

void DnsSdServiceBrowser::on_browse_result(uint32_t flags,
                                           uint32_t interface_index,
                                           int error,
                                           const char* service_name,
                                           const char* regtype,
                                           const char* domain)
{
    if (error != kDNSServiceErr_NoError) {
        fail("DNS-SD browse reported error " + std::to_string(error));
        return;
    }

    const std::string name = service_name ? service_name : "";

    if (flags & kDNSServiceFlagsAdd) {
        auto resolve = std::make_unique<Resolve>();
        resolve->service_name = name;
        resolve->owner = this;

        const DNSServiceErrorType err = DNSServiceResolve(
            &resolve->ref, 0, interface_index, service_name, regtype, domain,
            &DnsSdCallbacks::resolve, resolve.get());
        if (err != kDNSServiceErr_NoError) {
            if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
                logger->warn("Cannot resolve service '{}': error {}", name, err);
            }
            return;
        }
        resolves_.push_back(std::move(resolve));
        return;
    }

    auto it = resolved_.find(name);
    if (it == resolved_.end()) {
        return;
    }
    BrowseEvent event;
    event.kind = BrowseEvent::Kind::Removed;
    event.service_name = name;
    event.host = it->second.host;
    event.port = it->second.port;
    resolved_.erase(it);

    if (callbacks_.on_event) {
        callbacks_.on_event(event);
    }
}

void DnsSdServiceBrowser::on_resolve_result(Resolve* resolve, int error,
                                            const char* host_target, uint16_t port)
{
    resolve->finished = true;
    if (error != kDNSServiceErr_NoError || !host_target) {
        return;
    }

    BrowseEvent event;
    event.kind = BrowseEvent::Kind::Added;
    event.service_name = resolve->service_name;
    event.host = host_target;
    event.port = port;
    resolved_[resolve->service_name] = ResolvedService{event.host, event.port};

    if (callbacks_.on_event) {
        callbacks_.on_event(event);
    }
}

void DnsSdServiceBrowser::fail(const std::string& error)
{
    running_ = false;
    if (callbacks_.on_failure) {
        callbacks_.on_failure(error);
    }
}

void DnsSdServiceBrowser::release_finished_resolves()
{
    auto it = std::remove_if(resolves_.begin(), resolves_.end(),
                             [](const std::unique_ptr<Resolve>& resolve) {
                                 if (!resolve->finished) {
                                     return false;
                                 }
                                 DNSServiceRefDeallocate(resolve->ref);
                                 resolve->ref = nullptr;
                                 return true;
                             });
    resolves_.erase(it, resolves_.end());
}
